//
// AccessTest.cc
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
#include "AccessRules.hh"
#include "PrincipalDirectory.hh"
#include "Store.hh"

using namespace std;

static StructuredDocument prefsDoc(const string& text) { return StructuredDocument(text); }

TEST_CASE("Principal lists", "[Access]") {
    CHECK(ParsePrincipalList("Main.Alice, Bob  %USERSWEB%.Carol,,%SOMEVAR% Bob\tDan")
          == vector<string>{"Alice", "Bob", "Carol", "Dan"});
    CHECK(ParsePrincipalList("%MAINWEB%.Eve") == vector<string>{"Eve"});
    CHECK(ParsePrincipalList("").empty());
    CHECK(ParsePrincipalList("  ,  ").empty());
}

TEST_CASE("Collecting preferences", "[Access]") {
    StructuredDocument doc("Intro\n   * Set SKIN = pattern\n\t* Set ALLOWWEBVIEW = A, B\n * Set NOTME = x\n"
                           "      * Set EMPTY =\n");
    doc.append("PREFERENCE", {{"name", "SKIN"}, {"type", "Set"}, {"value", "plain"}});
    doc.append("PREFERENCE", {{"name", "LOCALONLY"}, {"type", "Local"}, {"value", "y"}});
    doc.append("_PREF_SET", {{"name", "EXTRA"}, {"value", "z"}});

    auto prefs = CollectPreferences(doc);
    CHECK(prefs == map<string, string>{{"ALLOWWEBVIEW", "A, B"}, {"EMPTY", ""}, {"EXTRA", "z"}, {"SKIN", "plain"}});
}

TEST_CASE("Extracting access rules", "[Access]") {
    using P = Permission;
    using S = AccessScope;

    auto rules = ExtractAccessRules(map<string, string>{
            {"ALLOWTOPICCHANGE", "Alice"},
            {"DENYTOPICVIEW", ""},
            {"ALLOWTOPICVIEW", "Bob"},
            {"DENYWEBVIEW", "Main.Mallory"},
            {"ALLOWWEBVIEW", ""},
            {"ALLOWROOTRENAME", "Admins"},
            {"SKIN", "plain"},
            {"ALLOWTOPICview", "x"},
    });
    CHECK(rules == AccessRuleSet{
                           {S::Document, "CHANGE", P::Allow, "Alice"},
                           {S::Document, "CHANGE", P::SynthesizedDeny, ""},
                           {S::Root, "RENAME", P::Allow, "Admins"},
                           {S::Root, "RENAME", P::SynthesizedDeny, ""},
                           {S::Container, "VIEW", P::Deny, "Mallory"},
                           {S::Document, "VIEW", P::Allow, ""},
                   });
    CHECK(ContextOf(S::Root) == 'R');
    CHECK(ContextOf(S::Container) == 'W');
    CHECK(ContextOf(S::Document) == 'T');
}

#pragma mark - RESOLVER:

TEST_CASE_METHOD(StoreTestFixture, "Container allow-list", "[Access]") {
    store->save({"C", "WebPreferences"}, prefsDoc("   * Set ALLOWWEBVIEW = A\n"), "admin");
    store->save({"C", "D"}, prefsDoc("Open to all\n   * Set DENYTOPICVIEW = \n"), "admin");
    store->save({"C", "Plain"}, prefsDoc("Nothing special\n"), "admin");

    CHECK(store->checkAccess("A", "VIEW", AccessScope::Container, {"C", ""}));
    CHECK(store->accessFailure().empty());
    CHECK_FALSE(store->checkAccess("B", "view", AccessScope::Container, {"C", ""}));
    CHECK(store->accessFailure() == "access not allowed on container");

    // The document's empty deny list overrides the container:
    CHECK(store->checkAccess("B", "VIEW", AccessScope::Document, {"C", "D"}));
    // A document without rules inherits the container's decision:
    CHECK_FALSE(store->checkAccess("B", "VIEW", AccessScope::Document, {"C", "Plain"}));
    CHECK(store->accessFailure() == "access not allowed on container");
    CHECK(store->checkAccess("A", "VIEW", AccessScope::Document, {"C", "Plain"}));

    // Other modes and containers are unrestricted:
    CHECK(store->checkAccess("B", "CHANGE", AccessScope::Document, {"C", "Plain"}));
    CHECK(store->checkAccess("B", "VIEW", AccessScope::Container, {"Elsewhere", ""}));
}

TEST_CASE_METHOD(StoreTestFixture, "Deny beats allow, through groups", "[Access]") {
    directory->addToGroup("Editors", {"B", "C"});
    directory->addToGroup("Staff", {"Editors", "E"});
    store->save({"W", "WebPreferences"},
                prefsDoc("   * Set ALLOWWEBCHANGE = Staff\n   * Set DENYWEBCHANGE = C\n"), "admin");

    CHECK(store->checkAccess("B", "CHANGE", AccessScope::Container, {"W", ""}));
    CHECK(store->checkAccess("E", "CHANGE", AccessScope::Container, {"W", ""}));
    CHECK_FALSE(store->checkAccess("C", "CHANGE", AccessScope::Container, {"W", ""}));
    CHECK(store->accessFailure() == "access denied on container");
    CHECK_FALSE(store->checkAccess("Z", "CHANGE", AccessScope::Container, {"W", ""}));
    CHECK(store->accessFailure() == "access not allowed on container");

    directory->addAdmin("Z");
    CHECK(store->checkAccess("Z", "CHANGE", AccessScope::Container, {"W", ""}));
    CHECK(store->checkAccess("Z", "CHANGE", AccessScope::Root));
}

TEST_CASE_METHOD(StoreTestFixture, "Document rules from preference records", "[Access]") {
    StructuredDocument doc("Secret");
    doc.append("PREFERENCE", {{"name", "DENYTOPICVIEW"}, {"type", "Set"}, {"value", "Mallory"}});
    store->save({"C", "Secret"}, doc, "admin");

    CHECK_FALSE(store->checkAccess("Mallory", "VIEW", AccessScope::Document, {"C", "Secret"}));
    CHECK(store->accessFailure() == "access denied on document");
    CHECK(store->checkAccess("Alice", "VIEW", AccessScope::Document, {"C", "Secret"}));
    CHECK(store->checkAccess("Mallory", "VIEW", AccessScope::Document, {"C", "Other"}));
}

TEST_CASE_METHOD(StoreTestFixture, "Root rules", "[Access]") {
    CHECK(store->checkAccess("Mallory", "CHANGE", AccessScope::Root));
    store->save({"System", "DefaultPreferences"}, prefsDoc("   * Set DENYROOTCHANGE = Mallory\n"), "admin");
    CHECK_FALSE(store->checkAccess("Mallory", "CHANGE", AccessScope::Root));
    CHECK(store->accessFailure() == "access denied on root");
    CHECK(store->checkAccess("Alice", "CHANGE", AccessScope::Root));
    CHECK(store->checkAccess("Mallory", "VIEW", AccessScope::Root));
}

TEST_CASE_METHOD(StoreTestFixture, "Only the latest revision's rules apply", "[Access]") {
    DocumentIdentity prefs{"C", "WebPreferences"};
    store->save(prefs, prefsDoc("   * Set ALLOWWEBVIEW = A\n"), "admin");
    CHECK_FALSE(store->checkAccess("B", "VIEW", AccessScope::Container, {"C", ""}));

    store->save(prefs, prefsDoc("No restrictions now\n"), "admin");
    // Decisions are memoized until the cache is cleared:
    CHECK_FALSE(store->checkAccess("B", "VIEW", AccessScope::Container, {"C", ""}));
    store->clearAccessCache();
    CHECK(store->checkAccess("B", "VIEW", AccessScope::Container, {"C", ""}));

    store->rollback(prefs, "admin");
    store->clearAccessCache();
    CHECK_FALSE(store->checkAccess("B", "VIEW", AccessScope::Container, {"C", ""}));

    // A fresh Store sees the current rules:
    auto other = openAnotherStore();
    CHECK_FALSE(other->checkAccess("B", "VIEW", AccessScope::Container, {"C", ""}));
    CHECK(other->checkAccess("A", "VIEW", AccessScope::Container, {"C", ""}));
}

TEST_CASE_METHOD(StoreTestFixture, "Rules with long mode names", "[Access]") {
    const string mode = "PUBLISHTOEXTERNALARCHIVE";
    store->save({"W", "WebPreferences"}, prefsDoc("   * Set DENYWEB" + mode + " = Mallory\n"), "admin");
    store->save({"System", "DefaultPreferences"}, prefsDoc("   * Set ALLOWROOT" + mode + " = Alice, Mallory\n"),
                "admin");

    CHECK_FALSE(store->checkAccess("Mallory", "publishToExternalArchive", AccessScope::Container, {"W", ""}));
    CHECK(store->accessFailure() == "access denied on container");
    CHECK(store->checkAccess("Alice", mode, AccessScope::Container, {"W", ""}));

    CHECK(store->checkAccess("Mallory", mode, AccessScope::Root));
    CHECK_FALSE(store->checkAccess("Bob", mode, AccessScope::Root));
    CHECK(store->accessFailure() == "access not allowed on root");
}
