//
// LockLeaseTest.cc
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
#include "LockLeaseManager.hh"
#include "NameDictionary.hh"
#include "Store.hh"

using namespace std;

static const DocumentIdentity kDoc{"C", "D"};

TEST_CASE_METHOD(DataFileTestFixture, "Locks", "[Locks]") {
    NameDictionary   names(*db);
    LockLeaseManager locks(*db, names);

    CHECK_FALSE(locks.lockInfo(kDoc));
    auto result = locks.acquireLock(kDoc, "U1", 1000);
    CHECK(result.acquired);
    CHECK(result.holder == "U1");
    CHECK(result.since == 1000);

    result = locks.acquireLock(kDoc, "U2", 1010);
    CHECK_FALSE(result.acquired);
    CHECK(result.holder == "U1");
    CHECK(result.since == 1000);

    // Re-acquiring refreshes the time:
    result = locks.acquireLock(kDoc, "U1", 1020);
    CHECK(result.acquired);
    CHECK(result.since == 1020);

    auto info = locks.lockInfo(kDoc);
    REQUIRE(info);
    CHECK(info->holder == "U1");
    CHECK(info->since == 1020);

    CHECK_FALSE(locks.releaseLock(kDoc, "U2"));
    CHECK_FALSE(locks.releaseLock(kDoc, "Nobody"));
    CHECK(locks.lockInfo(kDoc));
    CHECK(locks.releaseLock(kDoc, "U1"));
    CHECK_FALSE(locks.lockInfo(kDoc));
    CHECK_FALSE(locks.releaseLock(kDoc, "U1"));

    CHECK(locks.acquireLock(kDoc, "U2", 1030).acquired);
    locks.breakLock(kDoc);
    CHECK_FALSE(locks.lockInfo(kDoc));
    CHECK(locks.acquireLock(kDoc, "U3", 1040).acquired);

    ExpectException(error::VersaStore, error::BadDocumentIdentity, [&] { locks.acquireLock({"", "D"}, "U1"); });
}

TEST_CASE_METHOD(DataFileTestFixture, "Leases", "[Leases]") {
    NameDictionary   names(*db);
    LockLeaseManager locks(*db, names);

    CHECK_FALSE(locks.getLease(kDoc));
    Lease lease{"U1", 100, 200};
    locks.setLease(kDoc, lease);
    CHECK(locks.getLease(kDoc) == lease);

    Lease replacement{"U2", 150, 300};
    locks.setLease(kDoc, replacement);
    CHECK(locks.getLease(kDoc) == replacement);

    locks.setLease(kDoc, nullopt);
    CHECK_FALSE(locks.getLease(kDoc));
    locks.setLease({"Never", "Seen"}, nullopt);
    CHECK_FALSE(locks.getLease({"Never", "Seen"}));
}

TEST_CASE_METHOD(DataFileTestFixture, "Expired leases are swept", "[Leases]") {
    NameDictionary   names(*db);
    LockLeaseManager locks(*db, names);
    const timestamp_t T = 5000;
    locks.setLease(kDoc, Lease{"U1", T - 100, T});
    locks.setLease({"C", "Later"}, Lease{"U2", T - 100, T + 10});

    // A lease is still valid at its expiry time:
    CHECK(locks.removeExpiredLeases(T) == 0);
    CHECK(locks.getLease(kDoc));

    CHECK(locks.removeExpiredLeases(T + 1) == 1);
    CHECK_FALSE(locks.getLease(kDoc));
    CHECK(locks.getLease({"C", "Later"}));
    CHECK(locks.getLease({"C", "Later"})->isExpired(T + 11));
}

TEST_CASE_METHOD(StoreTestFixture, "Store locks and leases", "[Locks][Leases]") {
    CHECK(store->acquireLock(kDoc, "U1").acquired);
    // Another Store on the same file sees the lock:
    auto other  = openAnotherStore();
    auto result = other->acquireLock(kDoc, "U2");
    CHECK_FALSE(result.acquired);
    CHECK(result.holder == "U1");
    CHECK(other->releaseLock(kDoc, "U1"));
    CHECK_FALSE(store->lockInfo(kDoc));

    Lease lease = store->takeLease(kDoc, "U1");
    CHECK(other->getLease(kDoc) == lease);
    CHECK(store->removeExpiredLeases(lease.expires + 1) == 1);
    CHECK_FALSE(store->getLease(kDoc));
}
