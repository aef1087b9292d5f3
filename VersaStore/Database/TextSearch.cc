//
// TextSearch.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "TextSearch.hh"
#include "RevisionStore.hh"
#include "NameDictionary.hh"
#include "DataFile.hh"
#include "SQLite_Internal.hh"
#include "StringUtil.hh"
#include "Logging.hh"
#include "SQLiteCpp/SQLiteCpp.h"
#include <algorithm>
#include <regex>
#include <set>

using namespace std;

namespace versastore {

    TextSearch::TextSearch(DataFile& db, NameDictionary& names, RevisionStore& revisions)
        : _db(db), _names(names), _revisions(revisions) {}

    string TextSearch::backendPattern(const string& pattern, const SearchOptions& options) {
        if ( !options.regex ) return quoteRegex(pattern);
        try {
            regex check(pattern, regex_constants::ECMAScript);
            return pattern;
        } catch ( const regex_error& x ) {
            LogVerbose(SearchLog, "Pattern '%s' is not a valid regex (%s); backend matches every line",
                       pattern.c_str(), x.what());
            return ".";
        }
    }

    // The exact matcher applied to each candidate line or name.
    static regex callerRegex(const string& pattern, const SearchOptions& options) {
        auto flags = regex_constants::ECMAScript;
        if ( !options.caseSensitive ) flags |= regex_constants::icase;
        string source = options.regex ? pattern : quoteRegex(pattern);
        if ( options.wordBoundaries ) source = "\\b(?:" + source + ")\\b";
        try {
            return regex(source, flags);
        } catch ( const regex_error& ) {
            LogWarn(SearchLog, "Invalid regex '%s'; matching it as literal text", pattern.c_str());
            source = quoteRegex(pattern);
            if ( options.wordBoundaries ) source = "\\b(?:" + source + ")\\b";
            return regex(source, flags);
        }
    }

    vector<string> TextSearch::documentsOf(fobid_t container) {
        vector<string> docs;
        for ( auto& [nid, name] : _names.namesOf(_revisions.latestNames(container)) ) docs.push_back(name);
        sort(docs.begin(), docs.end());
        return docs;
    }

    SearchResults TextSearch::matchLines(fobid_t container, const string& pattern, const SearchOptions& options) {
        regex             matcher = callerRegex(pattern, options);
        SQLite::Statement stmt(_db.sqlDb(), "SELECT n.name, m.value FROM metaText m "
                                            "JOIN revisions r ON r.fobid = m.fobId AND r.namespace = 0 "
                                            "JOIN names n ON n.NID = r.NID "
                                            "WHERE m.ducktype = 0 AND m.webId = ? AND r.webId = ? "
                                            "AND m.value REGEXP ? "
                                            "ORDER BY n.name, m.lnum");
        stmt.bind(1, (int64_t)container);
        stmt.bind(2, (int64_t)container);
        stmt.bind(3, backendPattern(pattern, options));
        LogStatement(stmt);

        SearchResults results;
        unsigned      candidateLines = 0;
        while ( stmt.executeStep() ) {
            ++candidateLines;
            string line = stmt.getColumn(1).getString();
            if ( !regex_search(line, matcher) ) continue;
            auto& lines = results[getColumnAsName(stmt, 0)];
            if ( !options.filesWithoutMatch ) lines.push_back(std::move(line));
        }
        LogVerbose(SearchLog, "'%s': %u candidate lines, %zu matching documents", pattern.c_str(), candidateLines,
                   results.size());
        return results;
    }

    SearchResults TextSearch::search(string pattern, const string& containerName, const SearchOptions& options,
                                     const optional<vector<string>>& candidates) {
        bool invert = hasPrefix(pattern, "!");
        if ( invert ) pattern.erase(0, 1);

        SearchResults results;
        auto          containerNID = _names.lookup(containerName);
        auto          container    = containerNID ? _revisions.findContainer(*containerNID) : nullopt;
        if ( !container ) {
            LogVerbose(SearchLog, "No container '%s'", containerName.c_str());
            return results;
        }

        vector<string> docs = candidates ? *candidates : documentsOf(*container);
        set<string>    docSet(docs.begin(), docs.end());

        SearchResults matches;
        if ( options.scope != SearchScope::Text ) {
            regex matcher = callerRegex(pattern, options);
            for ( auto& doc : docs )
                if ( regex_search(doc, matcher) ) matches[doc];
        }
        if ( options.scope != SearchScope::Name ) {
            for ( auto& [doc, lines] : matchLines(*container, pattern, options) ) {
                if ( docSet.count(doc) ) matches[doc] = std::move(lines);
            }
        }

        if ( invert ) {
            for ( auto& doc : docSet )
                if ( !matches.count(doc) ) results[doc];
        } else {
            results = std::move(matches);
        }
        LogTo(SearchLog, "Search %s'%s' in %s: %zu documents", (invert ? "!" : ""), pattern.c_str(),
              containerName.c_str(), results.size());
        return results;
    }

}  // namespace versastore
