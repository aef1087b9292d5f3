//
// ValueClassifier.hh
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
#include "Catalog.hh"
#include <functional>
#include <optional>
#include <variant>

namespace versastore {

    /** The `ducktype` tag of a stored value: which projections it appears in.
        Bit 1 = string, 2 = numeric, 4 = date; 0 marks a sequence row. */
    enum class DuckType : int {
        Sequence       = 0,
        Opaque         = 1,
        Numeric        = 3,
        Date           = 5,
        NumericAndDate = 7,
    };

    /** Added to the ducktype of every row belonging to a superseded (`other`) revision. */
    constexpr int kOtherRevisionDuckType = 0x20;
    constexpr int kDuckTypeMask          = 0x1f;

    /** The result of classifying a value. Alternatives correspond to DuckTypes. */
    struct OpaqueValue {};

    struct NumericValue {
        double number;
    };

    struct DateValue {
        timestamp_t date;
    };

    struct NumericAndDateValue {
        double      number;
        timestamp_t date;
    };

    using Classification = std::variant<OpaqueValue, NumericValue, DateValue, NumericAndDateValue>;

    DuckType DuckTypeOf(const Classification&) noexcept;

    /** Decides which typed projections a string value is stored in. The policy, in order:
        1. A value that parses as a number is Numeric; if its field is an EpochDate field, the
           number is also a date (seconds since the epoch) and the value is NumericAndDate.
           A number is never passed to the date parser.
        2. Otherwise, if date parsing is enabled, a value the date parser accepts is a Date.
        3. Otherwise it's Opaque (string only). */
    class ValueClassifier {
      public:
        using DateParser = std::function<std::optional<timestamp_t>(string_view)>;

        /** Only this many leading characters of a value are offered to the date parser. */
        static constexpr size_t kMaxDateLength = 70;

        /** Creates a classifier; by default dates are parsed with ParseDateTime. */
        explicit ValueClassifier(DateParser = nullptr);

        [[nodiscard]] Classification classify(string_view value, FieldType fieldType,
                                              bool parseDates = true) const;

        /** Parses a decimal number with optional sign, fraction and exponent, allowing
            surrounding whitespace. Returns nullopt if `str` is anything else. */
        static std::optional<double> parseNumber(string_view str);

      private:
        DateParser _parseDate;
    };

}  // namespace versastore
