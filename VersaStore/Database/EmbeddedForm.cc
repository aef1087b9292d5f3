//
// EmbeddedForm.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "EmbeddedForm.hh"
#include "Catalog.hh"
#include "StringUtil.hh"
#include <algorithm>
#include <regex>

using namespace std;

namespace versastore {

    string EmbeddedForm::encodeValue(string_view value) {
        string result;
        result.reserve(value.size());
        for ( char c : value ) {
            switch ( c ) {
                case '%':
                case '"':
                case '\r':
                case '\n':
                case '{':
                case '}':
                    result += format("%%%02x", (unsigned char)c);
                    break;
                default:
                    result += c;
            }
        }
        return result;
    }

    static int hexDigit(char c) {
        if ( c >= '0' && c <= '9' ) return c - '0';
        c = char(tolower((unsigned char)c));
        if ( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
        return -1;
    }

    string EmbeddedForm::decodeValue(string_view value) {
        string result;
        result.reserve(value.size());
        for ( size_t i = 0; i < value.size(); ++i ) {
            if ( value[i] == '%' && i + 2 < value.size() ) {
                int hi = hexDigit(value[i + 1]), lo = hexDigit(value[i + 2]);
                if ( hi >= 0 && lo >= 0 ) {
                    result += char(hi * 16 + lo);
                    i += 2;
                    continue;
                }
            }
            result += value[i];
        }
        return result;
    }

    string EmbeddedForm::renderRecord(const string& type, const Record& record) {
        string line = "%META:" + type + "{";
        bool   first = true;
        auto   add   = [&](const string& key, const string& value) {
            if ( !first ) line += ' ';
            first = false;
            line += key + "=\"" + encodeValue(value) + "\"";
        };
        if ( record.isNamed() ) add(catalog::kName, record.name());
        for ( auto& [key, value] : record.attributes )
            if ( key != catalog::kName ) add(key, value);
        line += "}%";
        return line;
    }

    vector<string> EmbeddedForm::render(const StructuredDocument& doc, const Record* topicInfo) {
        vector<string> lines;
        auto           renderType = [&](const string& type) {
            for ( auto& record : doc.recordsOfType(type) ) lines.push_back(renderRecord(type, record));
        };

        if ( topicInfo ) lines.push_back(renderRecord(catalog::kTopicInfo, *topicInfo));
        else
            renderType(catalog::kTopicInfo);
        renderType("TOPICPARENT");

        if ( !doc.text().empty() ) {
            string_view text = doc.text();
            if ( text.back() == '\n' ) text.remove_suffix(1);
            split(text, "\n", [&](string_view line) { lines.emplace_back(line); });
        }

        vector<string> types;
        for ( auto& entry : doc.records() ) {
            auto& type = entry.first;
            if ( type.empty() || type[0] == '_' || type == catalog::kTopicInfo || type == "TOPICPARENT" ) continue;
            types.push_back(type);
        }
        // FORM must precede its FIELDs:
        auto form = find(types.begin(), types.end(), "FORM");
        if ( form != types.end() ) {
            types.erase(form);
            auto field = find(types.begin(), types.end(), "FIELD");
            types.insert(field, "FORM");
        }
        for ( auto& type : types ) renderType(type);
        return lines;
    }

    StructuredDocument EmbeddedForm::parse(string_view text) {
        static const regex kMetaLine(R"(^%META:([A-Za-z0-9_]+)\{(.*)\}%$)");
        static const regex kAttribute(R"re(([A-Za-z0-9_]+)="([^"]*)")re");

        StructuredDocument doc;
        string             body;
        bool               firstLine = true;
        split(text, "\n", [&](string_view line) {
            cmatch match;
            if ( regex_match(line.data(), line.data() + line.size(), match, kMetaLine) ) {
                Record record;
                string attrs = match[2].str();
                for ( sregex_iterator i(attrs.begin(), attrs.end(), kAttribute), end; i != end; ++i )
                    record.attributes[(*i)[1].str()] = decodeValue((*i)[2].str());
                doc.append(match[1].str(), std::move(record));
            } else {
                if ( !firstLine ) body += '\n';
                firstLine = false;
                body += line;
            }
        });
        doc.setText(std::move(body));
        return doc;
    }

}  // namespace versastore
