//
// RevisionStore.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "RevisionStore.hh"
#include "DataFile.hh"
#include "SQLite_Internal.hh"
#include "StatementBuilder.hh"
#include "Error.hh"
#include "SQLiteCpp/SQLiteCpp.h"
#include <algorithm>

using namespace std;

namespace versastore {

#define REVISION_COLUMNS "fobid, namespace, webId, NID, version, date, author, comment, reprev"

    RevisionStore::RevisionStore(DataFile& db) : _db(db) {}

    RevisionStore::~RevisionStore() = default;

    static RevisionRow readRow(SQLite::Statement& stmt) {
        RevisionRow row;
        row.fobid   = stmt.getColumn(0).getInt64();
        row.ns      = Namespace(stmt.getColumn(1).getInt());
        row.webId   = stmt.getColumn(2).getInt64();
        row.nid     = stmt.getColumn(3).getInt64();
        row.version = stmt.getColumn(4).getInt64();
        row.date    = stmt.getColumn(5).getInt64();
        row.author  = stmt.getColumn(6).getInt64();
        row.comment = stmt.getColumn(7).getInt64();
        row.reprev  = stmt.getColumn(8).getInt64();
        return row;
    }

    optional<RevisionRow> RevisionStore::readOne(SQLite::Statement& stmt) {
        UsingStatement u(stmt);
        if ( stmt.executeStep() ) return readRow(stmt);
        return nullopt;
    }

    vector<RevisionRow> RevisionStore::readAll(SQLite::Statement& stmt) {
        UsingStatement      u(stmt);
        vector<RevisionRow> rows;
        while ( stmt.executeStep() ) rows.push_back(readRow(stmt));
        return rows;
    }

#pragma mark - CONTAINERS:

    optional<fobid_t> RevisionStore::findContainer(nameid_t containerNID) {
        _db.compileCached(_findContainerStmt, "SELECT fobid FROM revisions "
                                              "WHERE namespace = 3 AND webId = 1 AND NID = ?");
        UsingStatement u(_findContainerStmt);
        _findContainerStmt->bind(1, (int64_t)containerNID);
        if ( _findContainerStmt->executeStep() ) return _findContainerStmt->getColumn(0).getInt64();
        return nullopt;
    }

    fobid_t RevisionStore::ensureContainer(nameid_t containerNID) {
        if ( auto fobid = findContainer(containerNID) ) return *fobid;
        RevisionRow row;
        row.ns      = Namespace::Container;
        row.webId   = kRootFobid;
        row.nid     = containerNID;
        row.version = 1;
        fobid_t fobid = insert(row);
        LogVerbose(DBLog, "Created container row %lld", (long long)fobid);
        return fobid;
    }

    void RevisionStore::renameContainer(fobid_t container, nameid_t newNID) {
        if ( findContainer(newNID) ) error::_throw(error::Conflict, "A container with that name already exists");
        SQLite::Statement stmt(_db.sqlDb(), "UPDATE revisions SET NID = ? WHERE fobid = ? AND namespace = 3");
        stmt.bind(1, (int64_t)newNID);
        stmt.bind(2, (int64_t)container);
        LogStatement(stmt);
        if ( stmt.exec() == 0 ) error::_throw(error::NotFound, "No such container");
    }

    void RevisionStore::removeContainer(fobid_t container) {
        SQLite::Statement stmt(_db.sqlDb(), "DELETE FROM revisions WHERE fobid = ? AND namespace = 3");
        stmt.bind(1, (int64_t)container);
        LogStatement(stmt);
        stmt.exec();
    }

    vector<nameid_t> RevisionStore::containerNames() {
        SQLite::Statement stmt(_db.sqlDb(), "SELECT NID FROM revisions WHERE namespace = 3");
        LogStatement(stmt);
        vector<nameid_t> nids;
        while ( stmt.executeStep() ) nids.push_back(stmt.getColumn(0).getInt64());
        return nids;
    }

#pragma mark - QUERIES:

    optional<RevisionRow> RevisionStore::latest(fobid_t webId, nameid_t nid) {
        _db.compileCached(_latestStmt, "SELECT " REVISION_COLUMNS " FROM revisions "
                                       "WHERE namespace = 0 AND webId = ? AND NID = ?");
        _latestStmt->bind(1, (int64_t)webId);
        _latestStmt->bind(2, (int64_t)nid);
        return readOne(*_latestStmt);
    }

    optional<RevisionRow> RevisionStore::atVersion(fobid_t webId, nameid_t nid, version_t version) {
        SQLite::Statement stmt(_db.sqlDb(), "SELECT " REVISION_COLUMNS " FROM revisions "
                                            "WHERE namespace IN (0, 1) AND webId = ? AND NID = ? AND version >= ? "
                                            "ORDER BY version LIMIT 1");
        stmt.bind(1, (int64_t)webId);
        stmt.bind(2, (int64_t)nid);
        stmt.bind(3, (int64_t)version);
        return readOne(stmt);
    }

    version_t RevisionStore::newestVersion(fobid_t webId, nameid_t nid) {
        SQLite::Statement stmt(_db.sqlDb(), "SELECT ifnull(max(version), 0) FROM revisions "
                                            "WHERE namespace IN (0, 1) AND webId = ? AND NID = ?");
        stmt.bind(1, (int64_t)webId);
        stmt.bind(2, (int64_t)nid);
        LogStatement(stmt);
        stmt.executeStep();
        return stmt.getColumn(0).getInt64();
    }

    optional<RevisionRow> RevisionStore::newestOther(fobid_t webId, nameid_t nid) {
        SQLite::Statement stmt(_db.sqlDb(), "SELECT " REVISION_COLUMNS " FROM revisions "
                                            "WHERE namespace = 1 AND webId = ? AND NID = ? "
                                            "ORDER BY version DESC LIMIT 1");
        stmt.bind(1, (int64_t)webId);
        stmt.bind(2, (int64_t)nid);
        return readOne(stmt);
    }

    optional<RevisionRow> RevisionStore::dangling(fobid_t webId, nameid_t nid) {
        SQLite::Statement stmt(_db.sqlDb(), "SELECT " REVISION_COLUMNS " FROM revisions "
                                            "WHERE namespace = 2 AND webId = ? AND NID = ? LIMIT 1");
        stmt.bind(1, (int64_t)webId);
        stmt.bind(2, (int64_t)nid);
        return readOne(stmt);
    }

    optional<RevisionRow> RevisionStore::byFobid(fobid_t fobid) {
        SQLite::Statement stmt(_db.sqlDb(), "SELECT " REVISION_COLUMNS " FROM revisions WHERE fobid = ?");
        stmt.bind(1, (int64_t)fobid);
        return readOne(stmt);
    }

    optional<RevisionRow> RevisionStore::atTime(fobid_t webId, nameid_t nid, timestamp_t time) {
        SQLite::Statement stmt(_db.sqlDb(), "SELECT " REVISION_COLUMNS " FROM revisions "
                                            "WHERE namespace IN (0, 1) AND webId = ? AND NID = ? AND date <= ? "
                                            "ORDER BY version DESC LIMIT 1");
        stmt.bind(1, (int64_t)webId);
        stmt.bind(2, (int64_t)nid);
        stmt.bind(3, (int64_t)time);
        return readOne(stmt);
    }

    vector<RevisionRow> RevisionStore::history(fobid_t webId, nameid_t nid) {
        SQLite::Statement stmt(_db.sqlDb(), "SELECT " REVISION_COLUMNS " FROM revisions "
                                            "WHERE namespace IN (0, 1) AND webId = ? AND NID = ? "
                                            "ORDER BY version DESC");
        stmt.bind(1, (int64_t)webId);
        stmt.bind(2, (int64_t)nid);
        return readAll(stmt);
    }

    vector<fobid_t> RevisionStore::allRevisions(fobid_t webId, nameid_t nid) {
        SQLite::Statement stmt(_db.sqlDb(), "SELECT fobid FROM revisions "
                                            "WHERE namespace IN (0, 1, 2) AND webId = ? AND NID = ?");
        stmt.bind(1, (int64_t)webId);
        stmt.bind(2, (int64_t)nid);
        LogStatement(stmt);
        vector<fobid_t> fobids;
        while ( stmt.executeStep() ) fobids.push_back(stmt.getColumn(0).getInt64());
        return fobids;
    }

    vector<nameid_t> RevisionStore::latestNames(fobid_t webId) {
        SQLite::Statement stmt(_db.sqlDb(), "SELECT NID FROM revisions WHERE namespace = 0 AND webId = ?");
        stmt.bind(1, (int64_t)webId);
        LogStatement(stmt);
        vector<nameid_t> nids;
        while ( stmt.executeStep() ) nids.push_back(stmt.getColumn(0).getInt64());
        return nids;
    }

    vector<RevisionRow> RevisionStore::latestOf(fobid_t webId, const vector<nameid_t>& nids) {
        vector<RevisionRow> rows;
        static constexpr size_t kChunk = 500;
        for ( size_t start = 0; start < nids.size(); start += kChunk ) {
            size_t            n = min(kChunk, nids.size() - start);
            SQLite::Statement stmt(_db.sqlDb(), "SELECT " REVISION_COLUMNS " FROM revisions "
                                                "WHERE namespace = 0 AND webId = ? AND NID IN ("
                                                        + placeholders(n) + ")");
            stmt.bind(1, (int64_t)webId);
            for ( size_t i = 0; i < n; ++i ) stmt.bind(int(i + 2), (int64_t)nids[start + i]);
            auto chunk = readAll(stmt);
            rows.insert(rows.end(), chunk.begin(), chunk.end());
        }
        return rows;
    }

#pragma mark - MUTATIONS:

    fobid_t RevisionStore::insert(const RevisionRow& row) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        _db.compileCached(_insertStmt, "INSERT INTO revisions "
                                       "(namespace, webId, NID, version, date, author, comment, reprev) "
                                       "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
        UsingStatement u(_insertStmt);
        bindAll(*_insertStmt, {int64_t(row.ns), row.webId, row.nid, row.version, row.date, row.author, row.comment,
                               row.reprev});
        _insertStmt->exec();
        return _db.sqlDb().getLastInsertRowid();
    }

    void RevisionStore::retag(fobid_t fobid, Namespace ns) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        _db.compileCached(_retagStmt, "UPDATE revisions SET namespace = ? WHERE fobid = ?");
        UsingStatement u(_retagStmt);
        _retagStmt->bind(1, int(ns));
        _retagStmt->bind(2, (int64_t)fobid);
        _retagStmt->exec();
    }

    void RevisionStore::amend(fobid_t fobid, nameid_t author, nameid_t comment, timestamp_t date, version_t reprev) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        SQLite::Statement stmt(_db.sqlDb(), "UPDATE revisions SET author = ?, comment = ?, date = ?, reprev = ? "
                                            "WHERE fobid = ?");
        bindAll(stmt, {author, comment, date, reprev, fobid});
        LogStatement(stmt);
        stmt.exec();
    }

    void RevisionStore::setIdentity(fobid_t fobid, fobid_t webId, nameid_t nid) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        SQLite::Statement stmt(_db.sqlDb(), "UPDATE revisions SET webId = ?, NID = ? WHERE fobid = ?");
        bindAll(stmt, {webId, nid, fobid});
        LogStatement(stmt);
        stmt.exec();
    }

    void RevisionStore::remove(fobid_t fobid) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        SQLite::Statement stmt(_db.sqlDb(), "DELETE FROM revisions WHERE fobid = ?");
        stmt.bind(1, (int64_t)fobid);
        LogStatement(stmt);
        stmt.exec();
    }

    void RevisionStore::removeAllIn(fobid_t webId) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        SQLite::Statement stmt(_db.sqlDb(), "DELETE FROM revisions WHERE webId = ? AND namespace IN (0, 1, 2)");
        stmt.bind(1, (int64_t)webId);
        LogStatement(stmt);
        stmt.exec();
    }

}  // namespace versastore
