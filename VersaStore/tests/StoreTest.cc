//
// StoreTest.cc
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
#include "PrincipalDirectory.hh"
#include "StringUtil.hh"
#include "fleece/Fleece.hh"

using namespace std;

static const DocumentIdentity kDoc{"C", "D"};

static StructuredDocument makeDoc(const string& text, const string& color = "") {
    StructuredDocument doc(text);
    if ( !color.empty() ) doc.append("FIELD", {{"name", "Color"}, {"value", color}});
    return doc;
}

static string authorOf(const ReadResult& r) { return *r.doc.find("TOPICINFO")->get("author"); }

TEST_CASE_METHOD(StoreTestFixture, "Save, read and roll back", "[Store]") {
    CHECK(store->save(kDoc, makeDoc("First", "red"), "U1") == 1);
    auto r = store->read(kDoc);
    CHECK(r.version == 1);
    CHECK(r.isLatest);
    CHECK(authorOf(r) == "U1");
    CHECK(r.doc.text() == "First");

    CHECK(store->save(kDoc, makeDoc("Second", "blue"), "U2") == 2);
    r = store->read(kDoc);
    CHECK(r.version == 2);
    CHECK(authorOf(r) == "U2");
    CHECK(*r.doc.find("FIELD", "Color")->get("value") == "blue");
    CHECK(*r.doc.find("CREATEINFO")->get("author") == "U1");

    auto old = store->read(kDoc, 1);
    CHECK(old.version == 1);
    CHECK_FALSE(old.isLatest);
    CHECK(old.doc.text() == "First");
    CHECK(*old.doc.find("FIELD", "Color")->get("value") == "red");
    CHECK(authorOf(old) == "U1");

    CHECK(store->rollback(kDoc, "U1") == 1);
    r = store->read(kDoc);
    CHECK(r.version == 1);
    CHECK(r.isLatest);
    CHECK(authorOf(r) == "U1");
    CHECK(r.doc.text() == "First");
    CHECK(store->revisionHistory(kDoc) == vector<version_t>{1});
}

TEST_CASE_METHOD(StoreTestFixture, "Versions are consecutive with one latest", "[Store]") {
    for ( version_t v = 1; v <= 5; ++v )
        CHECK(store->save(kDoc, makeDoc(format("Rev %d", int(v))), "U1", {v * 100}) == v);
    CHECK(store->revisionHistory(kDoc) == vector<version_t>{5, 4, 3, 2, 1});
    CHECK(store->revisionCount(kDoc) == 5);
    CHECK(store->nextRevision(kDoc) == 6);
    CHECK(store->read(kDoc, 3).doc.text() == "Rev 3");
    CHECK(store->read(kDoc, 3).isLatest == false);
    CHECK(store->read(kDoc, 5).isLatest);
    ExpectException(error::VersaStore, error::NotFound, [&] { store->read(kDoc, 6); });

    CHECK(store->revisionAtTime(kDoc, 50) == nullopt);
    CHECK(store->revisionAtTime(kDoc, 100) == 1);
    CHECK(store->revisionAtTime(kDoc, 350) == 3);
    CHECK(store->revisionAtTime(kDoc, 9999) == 5);

    auto info = store->versionInfo(kDoc, 2);
    REQUIRE(info);
    CHECK(info->version == 2);
    CHECK(info->date == 200);
    CHECK(info->author == "U1");
    CHECK(store->versionInfo(kDoc, 99)->version == 5);
    CHECK(store->versionInfo(kDoc)->version == 5);
    CHECK_FALSE(store->versionInfo({"C", "Nope"}));
}

TEST_CASE_METHOD(StoreTestFixture, "Amend in place", "[Store]") {
    store->save(kDoc, makeDoc("One"), "U1");
    store->save(kDoc, makeDoc("Two"), "U1");
    SaveOptions amend;
    amend.amendInPlace = true;
    amend.comment      = "typo";
    CHECK(store->save(kDoc, makeDoc("Two, fixed", "green"), "U2", amend) == 2);

    auto r = store->read(kDoc);
    CHECK(r.version == 2);
    CHECK(r.doc.text() == "Two, fixed");
    CHECK(*r.doc.find("FIELD", "Color")->get("value") == "green");
    CHECK(*r.doc.find("TOPICINFO")->get("reprev") == "2");
    auto info = store->versionInfo(kDoc);
    CHECK(info->reprev == 2);
    CHECK(info->author == "U2");
    CHECK(info->comment == "typo");
    CHECK(store->revisionCount(kDoc) == 2);
}

TEST_CASE_METHOD(StoreTestFixture, "Rollback errors", "[Store]") {
    ExpectException(error::VersaStore, error::NotFound, [&] { store->rollback(kDoc, "U1"); });
    store->save(kDoc, makeDoc("One"), "U1");
    ExpectException(error::VersaStore, error::CantRollBackFirstRevision, [&] { store->rollback(kDoc, "U1"); });

    // Version 3 imported as latest, with no history behind it:
    DocumentIdentity imported{"C", "Imported"};
    SaveOptions      opts;
    opts.explicitVersion = 3;
    CHECK(store->save(imported, makeDoc("Three"), "U1", opts) == 3);
    ExpectException(error::VersaStore, error::NoPriorRevision, [&] { store->rollback(imported, "U1"); });
}

TEST_CASE_METHOD(StoreTestFixture, "Importing history with explicit versions", "[Store]") {
    SaveOptions opts;
    opts.explicitVersion = 2;
    CHECK(store->save(kDoc, makeDoc("Two"), "U1", opts) == 2);

    opts.explicitVersion        = 1;
    opts.explicitNamespaceOther = true;
    CHECK(store->save(kDoc, makeDoc("One"), "U1", opts) == 1);
    CHECK(store->revisionHistory(kDoc) == vector<version_t>{2, 1});
    CHECK(store->read(kDoc).version == 2);
    CHECK(store->read(kDoc, 1).doc.text() == "One");

    ExpectException(error::VersaStore, error::Conflict, [&] { store->save(kDoc, makeDoc("Again"), "U1", opts); });
    opts.explicitVersion        = 1;
    opts.explicitNamespaceOther = false;
    ExpectException(error::VersaStore, error::Conflict, [&] { store->save(kDoc, makeDoc("Older"), "U1", opts); });
    opts.explicitVersion = 0;
    ExpectException(error::VersaStore, error::InvalidParameter,
                    [&] { store->save(kDoc, makeDoc("Zero"), "U1", opts); });

    // Rolling back the imported latest promotes the imported history:
    CHECK(store->rollback(kDoc, "U1") == 1);
    CHECK(store->read(kDoc).doc.text() == "One");
}

TEST_CASE_METHOD(StoreTestFixture, "Content round-trips exactly", "[Store]") {
    StructuredDocument doc("  leading and trailing  \n\nline three\t\n");
    doc.append("FIELD", {{"name", "Zeta"}, {"value", "last "}});
    doc.append("FIELD", {{"name", "Alpha"}, {"value", " 42  "}});
    doc.append("FIELD", {{"name", "Mid"}, {"value", "31 Dec 2001"}});
    doc.append("FORM", {{"name", "ThingForm"}});
    doc.append("FILEATTACHMENT", {{"name", "a.png"}, {"size", "1024"}, {"comment", "100% \"quoted\""}});
    doc.append("PREFERENCE", {{"name", "SKIN"}, {"type", "Set"}, {"value", "plain"}});
    store->save(kDoc, doc, "U1");

    auto r = store->read(kDoc).doc;
    CHECK(r.text() == doc.text());
    for ( auto& [type, records] : doc.records() ) CHECK(r.recordsOfType(type) == records);
    // Record order is kept even though it isn't alphabetical:
    CHECK(r.recordsOfType("FIELD")[0].name() == "Zeta");
    CHECK(r.recordsOfType("FIELD")[2].name() == "Mid");

    // Reading through another Store (with cold caches) gives the same result:
    auto other = openAnotherStore();
    auto r2    = other->read(kDoc).doc;
    CHECK(r2.text() == doc.text());
    CHECK(r2.recordsOfType("FIELD") == doc.recordsOfType("FIELD"));
}

TEST_CASE_METHOD(StoreTestFixture, "Documents saved through another Store become visible", "[Store]") {
    auto other = openAnotherStore();
    CHECK_FALSE(store->exists(kDoc));
    ExpectException(error::VersaStore, error::NotFound, [&] { store->read(kDoc); });
    CHECK_FALSE(store->getLease(kDoc));

    other->save(kDoc, makeDoc("From elsewhere"), "U2");
    other->takeLease(kDoc, "U2");

    CHECK(store->exists(kDoc));
    CHECK(store->read(kDoc).doc.text() == "From elsewhere");
    REQUIRE(store->getLease(kDoc));
    CHECK(store->getLease(kDoc)->holder == "U2");
    CHECK(store->readLatestMany("C", {"D"}).count("D") == 1);
}

TEST_CASE_METHOD(StoreTestFixture, "Out-of-range attachment dates", "[Store]") {
    StructuredDocument doc("Attachments");
    doc.append("FILEATTACHMENT", {{"name", "far.txt"}, {"date", "1e300"}});
    doc.append("FILEATTACHMENT", {{"name", "past.txt"}, {"date", "-1e30"}});
    doc.append("FILEATTACHMENT", {{"name", "now.txt"}, {"date", "1009756800"}});
    store->save(kDoc, doc, "U1");
    CHECK(store->read(kDoc).doc.recordsOfType("FILEATTACHMENT") == doc.recordsOfType("FILEATTACHMENT"));
}

TEST_CASE_METHOD(StoreTestFixture, "Invalid documents are rejected", "[Store]") {
    StructuredDocument dup("x");
    dup.append("FIELD", {{"name", "A"}, {"value", "1"}});
    dup.append("FIELD", {{"name", "A"}, {"value", "2"}});
    ExpectException(error::VersaStore, error::InvalidParameter, [&] { store->save(kDoc, dup, "U1"); });

    StructuredDocument mixed("x");
    mixed.append("FIELD", {{"name", "A"}, {"value", "1"}});
    mixed.append("FIELD", {{"value", "2"}});
    ExpectException(error::VersaStore, error::InvalidParameter, [&] { store->save(kDoc, mixed, "U1"); });

    StructuredDocument twoUnnamed("x");
    twoUnnamed.append("TOPICPARENT", {{"title", "A"}});
    twoUnnamed.append("TOPICPARENT", {{"title", "B"}});
    ExpectException(error::VersaStore, error::InvalidParameter, [&] { store->save(kDoc, twoUnnamed, "U1"); });

    CHECK_FALSE(store->exists(kDoc));
}

TEST_CASE_METHOD(StoreTestFixture, "Invalid identity is ignored", "[Store]") {
    unsigned warnings = warningsLogged();
    CHECK(store->save({"", "D"}, makeDoc("x"), "U1") == 0);
    CHECK(store->save({"C", "Bad\nName"}, makeDoc("x"), "U1") == 0);
    CHECK(warningsLogged() == warnings + 2);
    CHECK(store->enumerateDocuments("C").empty());
}

TEST_CASE_METHOD(StoreTestFixture, "Reserve and remove", "[Store]") {
    store->reserve(kDoc);
    CHECK_FALSE(store->exists(kDoc));
    CHECK(store->revisionHistory(kDoc).empty());
    CHECK(store->enumerateDocuments("C").empty());

    CHECK(store->save(kDoc, makeDoc("Real"), "U1") == 1);
    CHECK(store->exists(kDoc));
    store->reserve(kDoc);
    CHECK(store->read(kDoc).version == 1);

    store->save(kDoc, makeDoc("More"), "U1");
    CHECK(store->remove(kDoc));
    CHECK_FALSE(store->exists(kDoc));
    CHECK(store->revisionHistory(kDoc).empty());
    CHECK_FALSE(store->remove(kDoc));
    CHECK_FALSE(store->remove({"Nowhere", "Nothing"}));
    ExpectException(error::VersaStore, error::BadDocumentIdentity, [&] { store->reserve({"C", ""}); });
}

TEST_CASE_METHOD(StoreTestFixture, "Read several documents", "[Store]") {
    store->save({"C", "A"}, makeDoc("a"), "U1");
    store->save({"C", "B"}, makeDoc("b"), "U1");
    store->save({"C", "B"}, makeDoc("b2"), "U1");
    auto docs = store->readLatestMany("C", {"A", "B", "Missing"});
    REQUIRE(docs.size() == 2);
    CHECK(docs["A"].text() == "a");
    CHECK(docs["B"].text() == "b2");
    CHECK(store->readLatestMany("Nowhere", {"A"}).empty());
}

#pragma mark - RENAME:

TEST_CASE_METHOD(StoreTestFixture, "Rename a document", "[Store][Rename]") {
    store->save(kDoc, makeDoc("One", "red"), "U1");
    store->save(kDoc, makeDoc("Two", "blue"), "U1");

    DocumentIdentity moved{"Other", "E"};
    auto             result = store->rename(kDoc, moved, {"U1"});
    CHECK(result.renamed);
    CHECK_FALSE(result.conflictingLease);

    CHECK_FALSE(store->exists(kDoc));
    auto r = store->read(moved);
    CHECK(r.version == 2);
    CHECK(r.doc.text() == "Two");
    CHECK(*r.doc.find("FIELD", "Color")->get("value") == "blue");
    // History stays behind:
    CHECK(store->revisionHistory(kDoc) == vector<version_t>{1});
    CHECK(store->enumerateDocuments("Other") == vector<string>{"E"});
    CHECK(store->enumerateDocuments("C").empty());

    // The moved revision is searchable in its new container:
    CHECK(store->textSearch("Two", "Other").count("E") == 1);
    CHECK(store->textSearch("Two", "C").empty());
}

TEST_CASE_METHOD(StoreTestFixture, "Saving again at a renamed document's old name", "[Store][Rename]") {
    store->save(kDoc, makeDoc("One"), "U1");
    store->save(kDoc, makeDoc("Two"), "U1");
    store->save(kDoc, makeDoc("Three"), "U1");
    REQUIRE(store->rename(kDoc, {"C", "Moved"}, {"U1"}).renamed);
    CHECK(store->revisionHistory(kDoc) == vector<version_t>{2, 1});

    // The new document continues after the history left behind:
    CHECK(store->save(kDoc, makeDoc("Fresh"), "U2") == 3);
    CHECK(store->save(kDoc, makeDoc("Fresher"), "U2") == 4);
    CHECK(store->revisionHistory(kDoc) == vector<version_t>{4, 3, 2, 1});
    CHECK(store->read(kDoc).doc.text() == "Fresher");
    CHECK(store->read(kDoc, 3).doc.text() == "Fresh");
    CHECK(store->read(kDoc, 2).doc.text() == "Two");

    // The renamed document is unaffected:
    CHECK(store->read({"C", "Moved"}).version == 3);
    CHECK(store->read({"C", "Moved"}).doc.text() == "Three");
    CHECK(store->save({"C", "Moved"}, makeDoc("Four"), "U1") == 4);
}

TEST_CASE_METHOD(StoreTestFixture, "Rename errors", "[Store][Rename]") {
    store->save(kDoc, makeDoc("One"), "U1");
    store->save({"C", "Taken"}, makeDoc("Other"), "U1");
    ExpectException(error::VersaStore, error::NotFound, [&] { store->rename({"C", "Missing"}, {"C", "New"}); });
    ExpectException(error::VersaStore, error::BadDocumentIdentity, [&] { store->rename(kDoc, {"C", ""}); });
    ExpectException(error::VersaStore, error::Conflict, [&] { store->rename(kDoc, {"C", "Taken"}); });
    CHECK(store->exists(kDoc));
}

TEST_CASE_METHOD(StoreTestFixture, "Rename respects leases", "[Store][Rename]") {
    store->save(kDoc, makeDoc("One"), "U1");
    Lease lease = store->takeLease(kDoc, "U2");
    CHECK(lease.expires == lease.taken + 3600);

    auto result = store->rename(kDoc, {"C", "E"}, {"U1"});
    CHECK_FALSE(result.renamed);
    REQUIRE(result.conflictingLease);
    CHECK(result.conflictingLease->holder == "U2");
    CHECK(store->exists(kDoc));

    // The lease holder may rename, and the lease moves with the document:
    result = store->rename(kDoc, {"C", "E"}, {"U2"});
    CHECK(result.renamed);
    CHECK_FALSE(store->getLease(kDoc));
    REQUIRE(store->getLease({"C", "E"}));
    CHECK(store->getLease({"C", "E"})->holder == "U2");

    RenameOptions force;
    force.requester    = "U3";
    force.ignoreLeases = true;
    CHECK(store->rename({"C", "E"}, {"C", "F"}, force).renamed);
}

#pragma mark - CONTAINERS:

TEST_CASE_METHOD(StoreTestFixture, "Enumerate containers", "[Store][Containers]") {
    for ( auto name : {"Main", "Main/Sub", "Main/Sub/Deep", "Sandbox", "Mainly"} )
        store->save({name, "WebPreferences"}, makeDoc("prefs"), "admin");
    store->save({"NoPrefs", "Home"}, makeDoc("x"), "admin");

    CHECK(store->enumerateContainers() == vector<string>{"Main", "Mainly", "Sandbox"});
    CHECK(store->enumerateContainers("", true)
          == vector<string>{"Main", "Main/Sub", "Main/Sub/Deep", "Mainly", "Sandbox"});
    CHECK(store->enumerateContainers("Main") == vector<string>{"Main/Sub"});
    CHECK(store->enumerateContainers("Main", true) == vector<string>{"Main/Sub", "Main/Sub/Deep"});
    CHECK(store->containerExists("Main/Sub"));
    CHECK_FALSE(store->containerExists("NoPrefs"));

    store->renameContainer("Sandbox", "Playground");
    CHECK(store->containerExists("Playground"));
    CHECK_FALSE(store->containerExists("Sandbox"));
    ExpectException(error::VersaStore, error::NotFound, [&] { store->renameContainer("Sandbox", "X"); });

    store->removeContainer("Playground");
    CHECK_FALSE(store->containerExists("Playground"));
    CHECK(store->enumerateDocuments("Playground").empty());
}

TEST_CASE_METHOD(StoreTestFixture, "Enumerate documents", "[Store][Containers]") {
    store->save({"C", "Zed"}, makeDoc("z"), "U1");
    store->save({"C", "Alpha"}, makeDoc("a"), "U1");
    store->save({"C", "Alpha"}, makeDoc("a2"), "U1");
    store->reserve({"C", "Placeholder"});
    store->save({"Elsewhere", "Beta"}, makeDoc("b"), "U1");
    CHECK(store->enumerateDocuments("C") == vector<string>{"Alpha", "Zed"});
    CHECK(store->enumerateDocuments("Nowhere").empty());
}

TEST_CASE_METHOD(StoreTestFixture, "Maintenance", "[Store]") {
    store->save(kDoc, makeDoc("One"), "U1");
    store->optimize();
    store->vacuum(true);
    CHECK_NOTHROW(store->integrityCheck());
}

TEST_CASE_METHOD(StoreTestFixture, "Raw query", "[Store]") {
    store->save(kDoc, makeDoc("One"), "U1");

    fleece::Doc   doc(store->rawQuery("SELECT 7, 'seven', NULL"));
    fleece::Array rows = doc.root().asArray();
    REQUIRE(rows.count() == 1);
    fleece::Array row = rows[0].asArray();
    REQUIRE(row.count() == 3);
    CHECK(row[0].asInt() == 7);
    CHECK(string(row[1].asString()) == "seven");
    CHECK(row[2].type() == kFLNull);

    fleece::Doc counted(store->rawQuery("SELECT count(*) FROM revisions"));
    CHECK(counted.root().asArray()[0].asArray()[0].asInt() >= 1);

    ExpectException(error::SQLite, 1, [&] { (void)store->rawQuery("SELECT * FROM no_such_table"); });
}
