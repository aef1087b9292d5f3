//
// SearchTest.cc
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
#include "Store.hh"
#include "TextSearch.hh"

using namespace std;

using Lines = vector<string>;

class SearchTestFixture : public StoreTestFixture {
  public:
    SearchTestFixture() {
        store->save({"Web", "Alpha"}, StructuredDocument("The quick brown fox\nJumps over the lazy dog"), "admin");
        store->save({"Web", "Beta"}, StructuredDocument("A foxhound sleeps\nnothing else"), "admin");
        store->save({"Web", "Gamma"}, StructuredDocument("costs 3.50 or 3x50"), "admin");
        store->save({"Elsewhere", "Delta"}, StructuredDocument("another fox"), "admin");
    }

    SearchResults search(const string& pattern, SearchOptions options = {}) {
        return store->textSearch(pattern, "Web", options);
    }
};

TEST_CASE_METHOD(SearchTestFixture, "Literal search", "[Search]") {
    CHECK(search("fox") == SearchResults{{"Alpha", Lines{"The quick brown fox"}}, {"Beta", Lines{"A foxhound sleeps"}}});
    CHECK(search("FOX").size() == 2);
    CHECK(search("3.50") == SearchResults{{"Gamma", Lines{"costs 3.50 or 3x50"}}});
    CHECK(search("3.5x").empty());
    CHECK(search("nowhere to be found").empty());
    CHECK(store->textSearch("fox", "NoSuchContainer").empty());
}

TEST_CASE_METHOD(SearchTestFixture, "Search options", "[Search]") {
    SearchOptions options;
    options.caseSensitive = true;
    CHECK(search("FOX", options).empty());
    CHECK(search("Jumps", options).count("Alpha") == 1);

    options = {};
    options.wordBoundaries = true;
    CHECK(search("fox", options) == SearchResults{{"Alpha", Lines{"The quick brown fox"}}});

    options = {};
    options.regex = true;
    CHECK(search("qu?ick|sleeps$", options)
          == SearchResults{{"Alpha", Lines{"The quick brown fox"}}, {"Beta", Lines{"A foxhound sleeps"}}});
    CHECK(search("^nothing", options) == SearchResults{{"Beta", Lines{"nothing else"}}});

    options = {};
    options.filesWithoutMatch = true;
    CHECK(search("fox", options) == SearchResults{{"Alpha", {}}, {"Beta", {}}});
}

TEST_CASE_METHOD(SearchTestFixture, "Inverted search", "[Search]") {
    CHECK(search("!fox") == SearchResults{{"Gamma", {}}});
    CHECK(store->textSearch("fox", "Web", {}, vector<string>{"Alpha", "Gamma"})
          == SearchResults{{"Alpha", Lines{"The quick brown fox"}}});
    CHECK(store->textSearch("!fox", "Web", {}, vector<string>{"Beta", "Gamma"}) == SearchResults{{"Gamma", {}}});
}

TEST_CASE_METHOD(SearchTestFixture, "Searching names", "[Search]") {
    SearchOptions options;
    options.regex = true;
    options.scope = SearchScope::Name;
    CHECK(search("^al", options) == SearchResults{{"Alpha", {}}});

    options.scope = SearchScope::All;
    CHECK(search("amm|lazy", options)
          == SearchResults{{"Alpha", Lines{"Jumps over the lazy dog"}}, {"Gamma", {}}});
}

TEST_CASE_METHOD(SearchTestFixture, "Invalid regex is matched literally", "[Search]") {
    SearchOptions options;
    options.regex = true;
    CHECK(TextSearch::backendPattern("fox(", options) == ".");
    CHECK(TextSearch::backendPattern("fo+x", options) == "fo+x");

    unsigned warnings = warningsLogged();
    CHECK(search("fox(", options).empty());
    CHECK(warningsLogged() > warnings);

    store->save({"Web", "Epsilon"}, StructuredDocument("call fox( now"), "admin");
    CHECK(search("fox(", options) == SearchResults{{"Epsilon", Lines{"call fox( now"}}});
}

TEST_CASE_METHOD(SearchTestFixture, "Only latest revisions are searched", "[Search]") {
    store->save({"Web", "Alpha"}, StructuredDocument("The slow turtle"), "admin");
    CHECK(search("quick").empty());
    CHECK(search("turtle") == SearchResults{{"Alpha", Lines{"The slow turtle"}}});
    store->rollback({"Web", "Alpha"}, "admin");
    CHECK(search("quick").count("Alpha") == 1);
    CHECK(search("turtle").empty());
}
