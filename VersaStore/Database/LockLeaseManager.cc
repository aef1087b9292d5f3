//
// LockLeaseManager.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "LockLeaseManager.hh"
#include "NameDictionary.hh"
#include "DataFile.hh"
#include "SQLite_Internal.hh"
#include "Error.hh"
#include "Logging.hh"
#include "SQLiteCpp/SQLiteCpp.h"

using namespace std;

namespace versastore {

    LockLeaseManager::LockLeaseManager(DataFile& db, NameDictionary& names) : _db(db), _names(names) {}

    LockLeaseManager::~LockLeaseManager() = default;

    // Locks and leases of documents whose names were never interned can't exist.
    optional<LockLeaseManager::NIDPair> LockLeaseManager::lookupNIDs(const DocumentIdentity& id) {
        auto nids = _names.lookup(vector<string>{id.container, id.document});
        auto web = nids.find(id.container), topic = nids.find(id.document);
        if ( web == nids.end() || topic == nids.end() ) return nullopt;
        return NIDPair{web->second, topic->second};
    }

    LockLeaseManager::NIDPair LockLeaseManager::resolveNIDs(const DocumentIdentity& id) {
        if ( !id.isValid() ) error::_throw(error::BadDocumentIdentity, "Invalid document '%s'", id.description().c_str());
        auto nids = _names.resolve(vector<string>{id.container, id.document});
        return {nids.at(id.container), nids.at(id.document)};
    }

#pragma mark - LOCKS:

    LockResult LockLeaseManager::acquireLock(const DocumentIdentity& id, const string& holder, timestamp_t now) {
        NIDPair  nids      = resolveNIDs(id);
        nameid_t holderNID = _names.resolve(holder);

        ExclusiveTransaction t(_db);
        SQLite::Statement    upsert(_db.sqlDb(), "INSERT INTO locks (webNID, topicNID, holderNID, time) "
                                                 "VALUES (?, ?, ?, ?) "
                                                 "ON CONFLICT (webNID, topicNID) DO UPDATE SET time = excluded.time "
                                                 "WHERE holderNID = excluded.holderNID");
        upsert.bind(1, (int64_t)nids.first);
        upsert.bind(2, (int64_t)nids.second);
        upsert.bind(3, (int64_t)holderNID);
        upsert.bind(4, (int64_t)now);
        LogStatement(upsert);
        upsert.exec();

        SQLite::Statement read(_db.sqlDb(), "SELECT holderNID, time FROM locks WHERE webNID = ? AND topicNID = ?");
        read.bind(1, (int64_t)nids.first);
        read.bind(2, (int64_t)nids.second);
        LogStatement(read);
        if ( !read.executeStep() ) error::_throw(error::UnexpectedError, "Lock row vanished");
        nameid_t   lockedBy = read.getColumn(0).getInt64();
        LockResult result;
        result.acquired = (lockedBy == holderNID);
        result.since    = read.getColumn(1).getInt64();
        t.commit();

        result.holder = result.acquired ? holder : _names.nameOf(lockedBy);
        if ( !result.acquired )
            LogTo(DBLog, "Lock on %s is held by %s", id.description().c_str(), result.holder.c_str());
        return result;
    }

    bool LockLeaseManager::deleteLock(const NIDPair& nids, optional<nameid_t> holder) {
        ExclusiveTransaction t(_db);
        string               sql = "DELETE FROM locks WHERE webNID = ? AND topicNID = ?";
        if ( holder ) sql += " AND holderNID = ?";
        SQLite::Statement stmt(_db.sqlDb(), sql);
        stmt.bind(1, (int64_t)nids.first);
        stmt.bind(2, (int64_t)nids.second);
        if ( holder ) stmt.bind(3, (int64_t)*holder);
        LogStatement(stmt);
        bool deleted = stmt.exec() > 0;
        t.commit();
        return deleted;
    }

    bool LockLeaseManager::releaseLock(const DocumentIdentity& id, const string& holder) {
        auto nids      = lookupNIDs(id);
        auto holderNID = _names.lookup(holder);
        if ( !nids || !holderNID ) return false;
        return deleteLock(*nids, holderNID);
    }

    void LockLeaseManager::breakLock(const DocumentIdentity& id) {
        if ( auto nids = lookupNIDs(id); nids ) {
            if ( deleteLock(*nids, nullopt) ) LogTo(DBLog, "Broke lock on %s", id.description().c_str());
        }
    }

    optional<LockResult> LockLeaseManager::lockInfo(const DocumentIdentity& id) {
        auto nids = lookupNIDs(id);
        if ( !nids ) return nullopt;
        SQLite::Statement stmt(_db.sqlDb(), "SELECT holderNID, time FROM locks WHERE webNID = ? AND topicNID = ?");
        stmt.bind(1, (int64_t)nids->first);
        stmt.bind(2, (int64_t)nids->second);
        LogStatement(stmt);
        if ( !stmt.executeStep() ) return nullopt;
        LockResult info;
        info.acquired    = true;
        nameid_t holder  = stmt.getColumn(0).getInt64();
        info.since       = stmt.getColumn(1).getInt64();
        info.holder      = _names.nameOf(holder);
        return info;
    }

#pragma mark - LEASES:

    optional<Lease> LockLeaseManager::leaseAt(nameid_t webNID, nameid_t topicNID) {
        _db.compileCached(_leaseStmt, "SELECT userNID, taken, expires FROM lease WHERE webNID = ? AND topicNID = ?");
        UsingStatement u(_leaseStmt);
        _leaseStmt->bind(1, (int64_t)webNID);
        _leaseStmt->bind(2, (int64_t)topicNID);
        if ( !_leaseStmt->executeStep() ) return nullopt;
        nameid_t user = _leaseStmt->getColumn(0).getInt64();
        Lease    lease;
        lease.taken   = _leaseStmt->getColumn(1).getInt64();
        lease.expires = _leaseStmt->getColumn(2).getInt64();
        lease.holder  = _names.nameOf(user);
        return lease;
    }

    void LockLeaseManager::deleteLease(nameid_t webNID, nameid_t topicNID) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        SQLite::Statement stmt(_db.sqlDb(), "DELETE FROM lease WHERE webNID = ? AND topicNID = ?");
        stmt.bind(1, (int64_t)webNID);
        stmt.bind(2, (int64_t)topicNID);
        LogStatement(stmt);
        stmt.exec();
    }

    void LockLeaseManager::moveLease(nameid_t fromWeb, nameid_t fromTopic, nameid_t toWeb, nameid_t toTopic) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        SQLite::Statement stmt(_db.sqlDb(), "UPDATE OR REPLACE lease SET webNID = ?, topicNID = ? "
                                            "WHERE webNID = ? AND topicNID = ?");
        stmt.bind(1, (int64_t)toWeb);
        stmt.bind(2, (int64_t)toTopic);
        stmt.bind(3, (int64_t)fromWeb);
        stmt.bind(4, (int64_t)fromTopic);
        LogStatement(stmt);
        stmt.exec();
    }

    optional<Lease> LockLeaseManager::getLease(const DocumentIdentity& id) {
        auto nids = lookupNIDs(id);
        if ( !nids ) return nullopt;
        return leaseAt(nids->first, nids->second);
    }

    void LockLeaseManager::setLease(const DocumentIdentity& id, const optional<Lease>& lease) {
        if ( !lease ) {
            auto nids = lookupNIDs(id);
            if ( !nids ) return;
            ExclusiveTransaction t(_db);
            deleteLease(nids->first, nids->second);
            t.commit();
            return;
        }

        NIDPair  nids    = resolveNIDs(id);
        nameid_t userNID = _names.resolve(lease->holder);

        ExclusiveTransaction t(_db);
        SQLite::Statement    stmt(_db.sqlDb(), "INSERT OR REPLACE INTO lease (webNID, topicNID, userNID, taken, expires) "
                                               "VALUES (?, ?, ?, ?, ?)");
        stmt.bind(1, (int64_t)nids.first);
        stmt.bind(2, (int64_t)nids.second);
        stmt.bind(3, (int64_t)userNID);
        stmt.bind(4, (int64_t)lease->taken);
        stmt.bind(5, (int64_t)lease->expires);
        LogStatement(stmt);
        stmt.exec();
        t.commit();
    }

    int LockLeaseManager::removeExpiredLeases(timestamp_t now) {
        ExclusiveTransaction t(_db);
        SQLite::Statement    stmt(_db.sqlDb(), "DELETE FROM lease WHERE expires < ?");
        stmt.bind(1, (int64_t)now);
        LogStatement(stmt);
        int deleted = stmt.exec();
        t.commit();
        if ( deleted > 0 ) LogVerbose(DBLog, "Removed %d expired leases", deleted);
        return deleted;
    }

}  // namespace versastore
