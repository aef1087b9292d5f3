//
// SupportTest.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "VersaStoreTest.hh"
#include "DateTime.hh"
#include "StringUtil.hh"
#include <regex>

using namespace std;

TEST_CASE("ParseDateTime ISO-8601", "[DateTime]") {
    CHECK(ParseDateTime("2001-12-31") == 1009756800);
    CHECK(ParseDateTime("2001-12-31T01:02:03") == 1009756800 + 3723);
    CHECK(ParseDateTime("2001-12-31 01:02") == 1009756800 + 3720);
    CHECK(ParseDateTime("2001-12-31T01:02:03Z") == 1009756800 + 3723);
    CHECK(ParseDateTime("2001-12-31T01:02:03+01:00") == 1009756800 + 3723 - 3600);
    CHECK(ParseDateTime("  2001-12-31  ") == 1009756800);
    CHECK(ParseDateTime("1970-01-01") == 0);
}

TEST_CASE("ParseDateTime other forms", "[DateTime]") {
    CHECK(ParseDateTime("2001/12/31") == 1009756800);
    CHECK(ParseDateTime("2001/12/31 23:59") == 1009756800 + 86340);
    CHECK(ParseDateTime("2001.12.31") == 1009756800);
    CHECK(ParseDateTime("2001.12.31.23.59.59") == 1009756800 + 86399);
    CHECK(ParseDateTime("31 Dec 2001") == 1009756800);
    CHECK(ParseDateTime("31 Dec 2001 - 23:59") == 1009756800 + 86340);
    CHECK(ParseDateTime("31-Dec-2001 23:59:59") == 1009756800 + 86399);
}

TEST_CASE("ParseDateTime rejects non-dates", "[DateTime]") {
    CHECK_FALSE(ParseDateTime(""));
    CHECK_FALSE(ParseDateTime("hello"));
    CHECK_FALSE(ParseDateTime("2001-13-01"));
    CHECK_FALSE(ParseDateTime("2001-02-29"));
    CHECK_FALSE(ParseDateTime("31 Foo 2001"));
    CHECK(ParseDateTime("2000-02-29") == 951782400);
}

TEST_CASE("FormatDateTime", "[DateTime]") {
    CHECK(FormatDateTime(0) == "1970-01-01 00:00:00");
    CHECK(FormatDateTime(1009756800 + 86399) == "2001-12-31 23:59:59");
    CHECK(Now() > 1600000000);
}

TEST_CASE("quoteRegex", "[StringUtil]") {
    CHECK(quoteRegex("abc_123") == "abc_123");
    string quoted = quoteRegex("a.b*c(d)[e]$^");
    CHECK(regex_search("xa.b*c(d)[e]$^y", regex(quoted)));
    CHECK_FALSE(regex_search("aXb*c(d)[e]$^", regex(quoted)));
}

TEST_CASE("split and join", "[StringUtil]") {
    vector<string> pieces;
    split("a\nb\n\nc\n", "\n", [&](string_view piece) { pieces.emplace_back(piece); });
    CHECK(pieces == (vector<string>{"a", "b", "", "c", ""}));
    CHECK(join({"x", "y", "z"}, ", ") == "x, y, z");
    CHECK(join({}, ", ").empty());
}

TEST_CASE("String checks", "[StringUtil]") {
    CHECK(hasPrefix("WebPreferences", "Web"));
    CHECK_FALSE(hasPrefix("Web", "WebPreferences"));
    string s = "name\n";
    chomp(s, '\n');
    CHECK(s == "name");
    chomp(s, '\n');
    CHECK(s == "name");
    CHECK(isValidUTF8(string("caf\xc3\xa9")));
    CHECK_FALSE(isValidUTF8(string("caf\xc3")));
    CHECK(hasNoControlCharacters(string("tab-free")));
    CHECK_FALSE(hasNoControlCharacters(string("tab\there")));
    CHECK(format("%s-%03d", "v", 7) == "v-007");
}

TEST_CASE("Error conversion", "[Error]") {
    ExpectException(error::VersaStore, error::NotFound, "nope", [] { error::_throw(error::NotFound, "nope"); });
    ExpectException(error::VersaStore, error::AssertionFailed, [] { Assert(1 + 1 == 3); });

    error e(error::SQLite, 5 /*SQLITE_BUSY*/);
    CHECK(e.standardized() == error::Busy);
    error invalid = error::convertException(std::invalid_argument("bad"));
    CHECK(invalid == error::InvalidParameter);
}

TEST_CASE("Log domain levels", "[Logging]") {
    CHECK(LogDomain::named("DB") == &DBLog);
    CHECK(LogDomain::named("Search") == &SearchLog);
    CHECK(LogDomain::named("NoSuchDomain") == nullptr);

    LogLevel saved = AccessLog.level();
    AccessLog.setLevel(LogLevel::Error);
    CHECK(AccessLog.effectiveLevel() >= LogDomain::callbackLogLevel());
    CHECK(AccessLog.willLog(LogLevel::Error));
    CHECK_FALSE(AccessLog.willLog(LogLevel::Verbose));
    AccessLog.setLevel(saved);

    LogLevel savedCallback = LogDomain::callbackLogLevel();
    LogDomain::setCallbackLogLevel(LogLevel::Warning);
    CHECK(LogDomain::callbackLogLevel() <= LogLevel::Warning);
    CHECK(SearchLog.effectiveLevel() >= SearchLog.level());
    LogDomain::setCallbackLogLevel(savedCallback);
}
