//
// DateTime.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "DateTime.hh"
#include "StringUtil.hh"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <regex>

namespace versastore {
    using namespace std;

    static const char* const kMonthNames[12] = {"jan", "feb", "mar", "apr", "may", "jun",
                                                "jul", "aug", "sep", "oct", "nov", "dec"};

    // Days since 1970-01-01 of a proleptic Gregorian date.
    // <http://howardhinnant.github.io/date_algorithms.html#days_from_civil>
    static int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) noexcept {
        y -= m <= 2;
        const int64_t  era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    static bool isLeapYear(int y) noexcept { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

    static unsigned daysInMonth(int y, unsigned m) noexcept {
        static const unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return (m == 2 && isLeapYear(y)) ? 29 : kDays[m - 1];
    }

    static optional<timestamp_t> makeTime(int y, unsigned mon, unsigned d, unsigned h, unsigned min, unsigned s,
                                          int offsetSecs) {
        if ( y < 1 || y > 9999 || mon < 1 || mon > 12 || d < 1 || d > daysInMonth(y, mon) || h > 23 || min > 59
             || s > 60 )
            return nullopt;
        int64_t days = daysFromCivil(y, mon, d);
        return days * 86400 + h * 3600 + min * 60 + s - offsetSecs;
    }

    static int monthFromName(string name) {
        toLowercase(name);
        if ( name.size() < 3 ) return 0;
        name.resize(3);
        for ( int i = 0; i < 12; ++i )
            if ( name == kMonthNames[i] ) return i + 1;
        return 0;
    }

    static unsigned toUnsigned(const ssub_match& m, unsigned dflt = 0) {
        return m.matched ? unsigned(stoul(m.str())) : dflt;
    }

    static int parseOffset(const ssub_match& m) {
        if ( !m.matched ) return 0;
        string z = m.str();
        if ( z == "Z" || z == "z" ) return 0;
        int      sign = (z[0] == '-') ? -1 : 1;
        unsigned hh = 0, mm = 0;
        string   digits;
        for ( char c : z )
            if ( isdigit((unsigned char)c) ) digits += c;
        if ( digits.size() >= 2 ) hh = unsigned(stoul(digits.substr(0, 2)));
        if ( digits.size() >= 4 ) mm = unsigned(stoul(digits.substr(2, 2)));
        return sign * int(hh * 3600 + mm * 60);
    }

    optional<timestamp_t> ParseDateTime(string_view input) {
        string str(trimWhitespace(input));
        if ( str.empty() ) return nullopt;

        static const regex kISO(R"(^(\d{4})-(\d{1,2})-(\d{1,2})(?:[T ](\d{1,2}):(\d{2})(?::(\d{2})(?:\.\d+)?)?)?)"
                                R"(\s*(Z|z|[+-]\d{2}:?\d{2})?$)");
        static const regex kSlashes(R"(^(\d{4})/(\d{1,2})/(\d{1,2})(?:\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)?$)");
        static const regex kDots(R"(^(\d{4})\.(\d{1,2})\.(\d{1,2})(?:\.(\d{1,2})\.(\d{2})(?:\.(\d{2}))?)?$)");
        static const regex kNamedMonth(R"(^(\d{1,2})[\s-]+([A-Za-z]{3,9})[\s-]+(\d{4}))"
                                       R"((?:\s*-?\s*(\d{1,2}):(\d{2})(?::(\d{2}))?)?$)");

        smatch m;
        if ( regex_match(str, m, kISO) ) {
            return makeTime(stoi(m[1].str()), toUnsigned(m[2]), toUnsigned(m[3]), toUnsigned(m[4]),
                            toUnsigned(m[5]), toUnsigned(m[6]), parseOffset(m[7]));
        } else if ( regex_match(str, m, kSlashes) || regex_match(str, m, kDots) ) {
            return makeTime(stoi(m[1].str()), toUnsigned(m[2]), toUnsigned(m[3]), toUnsigned(m[4]),
                            toUnsigned(m[5]), toUnsigned(m[6]), 0);
        } else if ( regex_match(str, m, kNamedMonth) ) {
            int month = monthFromName(m[2].str());
            if ( month == 0 ) return nullopt;
            return makeTime(stoi(m[3].str()), unsigned(month), toUnsigned(m[1]), toUnsigned(m[4]),
                            toUnsigned(m[5]), toUnsigned(m[6]), 0);
        }
        return nullopt;
    }

    string FormatDateTime(timestamp_t t) {
        time_t    secs = time_t(t);
        struct tm tm {};
        gmtime_r(&secs, &tm);
        char buf[32];
        strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return buf;
    }

    timestamp_t Now() noexcept {
        using namespace std::chrono;
        return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
    }

}  // namespace versastore
