//
// EmbeddedForm.hh
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
#include "StructuredDocument.hh"
#include <vector>

namespace versastore {

    /** Converts documents to and from their embedded store form: one
        `%META:TYPE{key="value" ...}%` line per record, around the body text.
        Line order is TOPICINFO, TOPICPARENT, the text lines, then the remaining types
        alphabetically (FORM ahead of FIELD). Types starting with `_` are internal and
        not rendered. */
    class EmbeddedForm {
      public:
        /** Renders `doc` as lines (without newlines). `topicInfo`, if given, is rendered as
            the TOPICINFO record in place of any the document has. */
        static std::vector<std::string> render(const StructuredDocument& doc, const Record* topicInfo = nullptr);

        /** Parses lines produced by render(); other lines become the text. */
        static StructuredDocument parse(string_view text);

        /** Escapes `%`, `"`, CR, LF, `{` and `}` as `%xx`. */
        static std::string encodeValue(string_view);

        static std::string decodeValue(string_view);

        /** Renders one record as a META line. */
        static std::string renderRecord(const std::string& type, const Record&);
    };

}  // namespace versastore
