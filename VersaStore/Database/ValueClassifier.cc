//
// ValueClassifier.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ValueClassifier.hh"
#include "DateTime.hh"
#include <cmath>
#include <cstdlib>
#include <regex>

using namespace std;

namespace versastore {

    DuckType DuckTypeOf(const Classification& c) noexcept {
        static constexpr DuckType kTypes[] = {DuckType::Opaque, DuckType::Numeric, DuckType::Date,
                                              DuckType::NumericAndDate};
        return kTypes[c.index()];
    }

    ValueClassifier::ValueClassifier(DateParser parser)
        : _parseDate(parser ? std::move(parser) : DateParser(ParseDateTime)) {}

    optional<double> ValueClassifier::parseNumber(string_view str) {
        static const regex kNumber(R"(^\s*[-+]?[0-9]*\.?[0-9]+([eE][-+]?[0-9]+)?\s*$)");
        if ( str.empty() || !regex_match(str.begin(), str.end(), kNumber) ) return nullopt;
        string copy(str);
        double n = strtod(copy.c_str(), nullptr);
        if ( !isfinite(n) ) return nullopt;
        return n;
    }

    // 2^63: epoch seconds at or beyond this (either sign) don't fit a timestamp_t.
    static constexpr double kTimestampLimit = 9223372036854775808.0;

    Classification ValueClassifier::classify(string_view value, FieldType fieldType, bool parseDates) const {
        if ( auto number = parseNumber(value) ) {
            if ( fieldType == FieldType::EpochDate && *number > -kTimestampLimit && *number < kTimestampLimit )
                return NumericAndDateValue{*number, timestamp_t(*number)};
            return NumericValue{*number};
        }
        if ( parseDates && !value.empty() ) {
            if ( auto date = _parseDate(value.substr(0, kMaxDateLength)) ) return DateValue{*date};
        }
        return OpaqueValue{};
    }

}  // namespace versastore
