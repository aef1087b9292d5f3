//
// TextSearch.hh
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "Base.hh"
#include <map>
#include <optional>
#include <vector>

namespace versastore {
    class DataFile;
    class RevisionStore;
    class NameDictionary;

    enum class SearchScope {
        Text,  ///< Match lines of the documents' embedded store form
        Name,  ///< Match document names
        All,   ///< Both
    };

    struct SearchOptions {
        bool        regex{false};              ///< Pattern is a regular expression, not literal text
        bool        caseSensitive{false};
        bool        wordBoundaries{false};     ///< Only match whole words
        bool        filesWithoutMatch{false};  ///< Only report document names, not matching lines
        SearchScope scope{SearchScope::Text};
    };

    /// Matching documents of a container, by name, each with its matching lines in order.
    using SearchResults = std::map<std::string, std::vector<std::string>>;

    /** Searches the latest revisions of a container's documents.
        The backend narrows the candidate lines with a case-insensitive `REGEXP` predicate;
        exact matching (case, word boundaries) is then done here, line by line.
        A pattern starting with `!` inverts the search: the result is the candidate documents
        that do *not* match, without lines. */
    class TextSearch {
      public:
        TextSearch(DataFile&, NameDictionary&, RevisionStore&);

        /** Searches `container`. If `candidates` is given, only those documents are considered. */
        SearchResults search(std::string pattern, const std::string& container, const SearchOptions&,
                             const std::optional<std::vector<std::string>>& candidates = std::nullopt);

        /** The pattern handed to the backend for a search: the quoted literal, or the regex
            itself if it's valid, else "." which matches any line. */
        static std::string backendPattern(const std::string& pattern, const SearchOptions&);

      private:
        std::vector<std::string> documentsOf(fobid_t container);
        SearchResults            matchLines(fobid_t container, const std::string& pattern, const SearchOptions&);

        DataFile&       _db;
        NameDictionary& _names;
        RevisionStore&  _revisions;
    };

}  // namespace versastore
