//
// DataFile.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

/*
 * Schema version history
 * 1: Initial Version
 */

#include "DataFile.hh"
#include "Catalog.hh"
#include "SQLite_Internal.hh"
#include "SQLiteCpp/SQLiteCpp.h"
#include "Error.hh"
#include "StringUtil.hh"
#include "fleece/Fleece.hh"
#include <sqlite3.h>
#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <sstream>
#include <thread>
#include <unordered_map>

using namespace std;

namespace versastore {

    static const int64_t MB = 1024 * 1024;

    // SQLite page size
    static const int64_t kPageSize = 4096;

    // SQLite cache size (per connection)
    static const size_t kCacheSize = 10 * MB;

    // Maximum size WAL journal will be left at after a commit
    static const int64_t kJournalSize = 5 * MB;

    // If this fraction of the database is composed of free pages, vacuum it on close
    static const float kVacuumFractionThreshold = 0.25;
    // If the database has many bytes of free space, vacuum it on close
    static const int64_t kVacuumSizeThreshold = 10 * MB;

    // Database busy timeout; another process may hold the write lock for a while.
    static const unsigned kBusyTimeoutSecs = 10;

    const DataFile::Options DataFile::Options::defaults = DataFile::Options{true, true, true};

    LogDomain SQL("SQL", LogLevel::Warning);

    void LogStatement(const SQLite::Statement& st) { LogTo(SQL, "... %s", st.getQuery().c_str()); }

    static void sqlite3_log_callback(void* /*pArg*/, int errCode, const char* msg) {
        switch ( errCode & 0xFF ) {
            case SQLITE_OK:
            case SQLITE_NOTICE:
            case SQLITE_READONLY:
            case SQLITE_CONSTRAINT:
                if ( errCode == SQLITE_NOTICE_RECOVER_WAL )
                    break;  // harmless "recovered __ frames from WAL file" message
                LogTo(DBLog, "SQLite message: %s", msg);
                break;
            case SQLITE_SCHEMA:
                break;  // ignore harmless "statement aborts ... database schema has changed" warning
            case SQLITE_WARNING:
                LogWarn(DBLog, "SQLite warning: %s", msg);
                break;
            default:
                LogError(DBLog, "SQLite error (code %d): %s", errCode, msg);
                break;
        }
    }

    // One-time initialization, before the first connection is opened:
    static void initializeSQLite() {
        static once_flag sOnce;
        call_once(sOnce, [] {
            Assert(sqlite3_libversion_number() >= 3026000, "VersaStore requires SQLite 3.26+");
            if ( int rc = sqlite3_config(SQLITE_CONFIG_LOG, sqlite3_log_callback, nullptr); rc != SQLITE_OK )
                LogVerbose(DBLog, "Couldn't install SQLite log callback: err %d", rc);
        });
    }

    UsingStatement::UsingStatement(SQLite::Statement& stmt) noexcept : _stmt(stmt) { LogStatement(stmt); }

    UsingStatement::~UsingStatement() noexcept {
        try {
            _stmt.reset();
            _stmt.clearBindings();
        } catch ( const std::exception& x ) { LogWarn(SQL, "Exception resetting statement: %s", x.what()); }
    }

    string getColumnAsName(SQLite::Statement& stmt, int colIndex) {
        string name = stmt.getColumn(colIndex).getString();
        chomp(name, kEndOfValue);
        return name;
    }

#pragma mark - DATAFILE:

    shared_ptr<DataFile::Shared> DataFile::sharedForPath(const string& path) {
        static mutex                                         sMutex;
        static unordered_map<string, weak_ptr<Shared>> sShared;
        lock_guard<mutex>                                    lock(sMutex);
        auto&                                                entry  = sShared[path];
        auto                                                 shared = entry.lock();
        if ( !shared ) {
            shared = make_shared<Shared>();
            entry  = shared;
        }
        return shared;
    }

    DataFile::DataFile(const string& path, const Options* options)
        : Logging(DBLog), _path(path), _options(options ? *options : Options::defaults), _shared(sharedForPath(path)) {
        initializeSQLite();
        reopen();
    }

    DataFile::~DataFile() {
        try {
            close();
        } catch ( const std::exception& x ) { warn("Exception closing database: %s", x.what()); }
    }

    void DataFile::reopen() {
        logInfo("Opening database %s", _path.c_str());
        int sqlFlags = _options.writeable ? SQLite::OPEN_READWRITE : SQLite::OPEN_READONLY;
        if ( _options.create ) sqlFlags |= SQLite::OPEN_CREATE;
        try {
            _sqlDb = make_unique<SQLite::Database>(_path, sqlFlags, int(kBusyTimeoutSecs * 1000));
        } catch ( const SQLite::Exception& x ) {
            error::_throw(error::CantOpenFile, "Can't open database %s: %s", _path.c_str(), x.what());
        }

        {
            // http://www.sqlite.org/pragma.html
            lock_guard<mutex> lock(_shared->transactionMutex);
            _schemaVersion = SchemaVersion((int)intQuery("PRAGMA user_version"));
            if ( _schemaVersion == SchemaVersion::None ) {
                if ( !_options.writeable ) error::_throw(error::NotWriteable, "Can't create schema in read-only db");
                createSchema();
            } else if ( _schemaVersion < SchemaVersion::MinReadable ) {
                error::_throw(error::DatabaseTooOld);
            } else if ( _schemaVersion > SchemaVersion::MaxReadable ) {
                error::_throw(error::DatabaseTooNew);
            }
        }

        _exec(format("PRAGMA cache_size=%d; "            // Memory cache
                     "PRAGMA synchronous=normal; "       // Speeds up commits
                     "PRAGMA journal_size_limit=%lld; "  // Limit WAL disk usage
                     "PRAGMA foreign_keys=off",
                     -(int)kCacheSize / 1024, (long long)kJournalSize));

        // Configure number of extra threads to be used by SQLite:
        auto sqlite = _sqlDb->getHandle();
        if ( thread::hardware_concurrency() > 2 ) sqlite3_limit(sqlite, SQLITE_LIMIT_WORKER_THREADS, 2);

        RegisterSQLiteFunctions(sqlite);

        // Enable some security features:
        sqlite3_db_config(sqlite, SQLITE_DBCONFIG_DEFENSIVE, 1, NULL);
    }

    void DataFile::createSchema() {
        // `auto_vacuum` has to be enabled ASAP, before anything's written to the db!
        _exec("PRAGMA auto_vacuum=incremental; "
              "PRAGMA journal_mode=WAL; "
              "BEGIN IMMEDIATE");
        _inTransaction = true;
        if ( auto version = intQuery("PRAGMA user_version"); version != 0 ) {
            // Another connection created the schema first:
            _inTransaction = false;
            _exec("COMMIT");
            _schemaVersion = SchemaVersion(int(version));
            return;
        }
        try {
            _exec("CREATE TABLE names ("
                  "  NID INTEGER PRIMARY KEY, name TEXT NOT NULL UNIQUE); "
                  "CREATE TABLE fields ("
                  "  FID INTEGER PRIMARY KEY AUTOINCREMENT, hasName INTEGER NOT NULL, typeNID INTEGER NOT NULL, "
                  "  nameNID INTEGER NOT NULL, keyNID INTEGER NOT NULL, fieldType INTEGER NOT NULL DEFAULT 1, "
                  "  UNIQUE (hasName, typeNID, nameNID, keyNID)); "
                  "CREATE TABLE revisions ("
                  "  fobid INTEGER PRIMARY KEY, namespace INTEGER NOT NULL, webId INTEGER NOT NULL, "
                  "  NID INTEGER NOT NULL, version INTEGER NOT NULL, date INTEGER NOT NULL DEFAULT 0, "
                  "  author INTEGER NOT NULL, comment INTEGER NOT NULL, reprev INTEGER NOT NULL DEFAULT 0); "
                  "CREATE UNIQUE INDEX revisions_identity ON revisions (namespace, webId, NID, version); "
                  "CREATE INDEX revisions_lineage ON revisions (webId, NID, version);");
            static constexpr const char* kValueTables[3][2] = {
                    {"values_text", "TEXT"}, {"values_double", "REAL"}, {"values_datetime", "TEXT"}};
            for ( auto [table, type] : kValueTables ) {
                _exec(format("CREATE TABLE %s ("
                             "  webId INTEGER NOT NULL, fobId INTEGER NOT NULL, ducktype INTEGER NOT NULL, "
                             "  FID INTEGER NOT NULL, value %s); "
                             "CREATE INDEX %s_fob ON %s (fobId, ducktype); "
                             "CREATE INDEX %s_fid ON %s (FID, value);",
                             table, type, table, table, table, table));
            }
            _exec("CREATE TABLE metaText ("
                  "  webId INTEGER NOT NULL, fobId INTEGER NOT NULL, ducktype INTEGER NOT NULL, "
                  "  lnum INTEGER NOT NULL, value TEXT NOT NULL); "
                  "CREATE INDEX metaText_fob ON metaText (fobId, ducktype, lnum); "
                  "CREATE TABLE access ("
                  "  webId INTEGER NOT NULL, fobId INTEGER NOT NULL, permission INTEGER NOT NULL, "
                  "  context TEXT NOT NULL, mode TEXT NOT NULL, topicNID INTEGER NOT NULL, "
                  "  accessNID INTEGER NOT NULL); "
                  "CREATE INDEX access_lookup ON access (webId, context, mode, accessNID); "
                  "CREATE INDEX access_fob ON access (fobId); "
                  "CREATE TABLE locks ("
                  "  webNID INTEGER NOT NULL, topicNID INTEGER NOT NULL, holderNID INTEGER NOT NULL, "
                  "  time INTEGER NOT NULL, PRIMARY KEY (webNID, topicNID)); "
                  "CREATE TABLE lease ("
                  "  webNID INTEGER NOT NULL, topicNID INTEGER NOT NULL, userNID INTEGER NOT NULL, "
                  "  taken INTEGER NOT NULL, expires INTEGER NOT NULL, PRIMARY KEY (webNID, topicNID));");

            SeedCatalog(*this);

            // The root sentinel anchors the container hierarchy:
            _exec(format("INSERT INTO revisions (fobid, namespace, webId, NID, version, date, author, comment) "
                         "VALUES (1, 99, 1, %lld, 1, 0, %lld, %lld)",
                         (long long)kFirstCatalogNID, (long long)kFirstCatalogNID, (long long)kFirstCatalogNID));

            _exec(format("PRAGMA user_version=%d; END", (int)SchemaVersion::Current));
        } catch ( ... ) {
            _inTransaction = false;
            _exec("ROLLBACK");
            throw;
        }
        _inTransaction = false;
        Assert(intQuery("PRAGMA auto_vacuum") == 2, "Incremental vacuum was not enabled!");
        _schemaVersion = SchemaVersion::Current;
        logInfo("Created schema version %d", (int)_schemaVersion);
    }

    bool DataFile::isOpen() const noexcept { return _sqlDb != nullptr; }

    void DataFile::checkOpen() const {
        if ( _usuallyFalse(!isOpen()) ) error::_throw(error::NotOpen);
    }

    void DataFile::close() {
        if ( _inTransaction ) error::_throw(error::TransactionNotClosed);
        if ( _sqlDb ) {
            if ( _options.writeable ) {
                lock_guard<mutex> lock(_shared->transactionMutex);
                optimize();
                vacuum(false);
            }
            _sqlDb.reset();
            logVerbose("Closed SQLite database");
        }
    }

    SQLite::Database& DataFile::sqlDb() const {
        checkOpen();
        return *_sqlDb;
    }

    bool DataFile::deleteDataFile(const string& path) {
        LogTo(DBLog, "Deleting database file %s (with -wal and -shm)", path.c_str());
        // Note the non-short-circuiting 'or'! All 3 paths will be deleted.
        return (::remove(path.c_str()) == 0) | (::remove((path + "-shm").c_str()) == 0)
               | (::remove((path + "-wal").c_str()) == 0);
    }

#pragma mark - TRANSACTIONS:

    void DataFile::_beginTransaction() {
        checkOpen();
        Assert(!_inTransaction, "DataFile already in a transaction");
        // IMMEDIATE takes the write lock now, so a concurrent writer in another process waits
        // in the busy handler instead of failing when the transaction first writes.
        _exec("BEGIN IMMEDIATE");
        _inTransaction = true;
    }

    void DataFile::_endTransaction(bool commit) {
        Assert(_inTransaction, "DataFile not in a transaction");
        _inTransaction = false;
        _exec(commit ? "COMMIT" : "ROLLBACK");
    }

    void DataFile::beginReadOnlyTransaction() {
        checkOpen();
        _exec("SAVEPOINT roTransaction");
    }

    void DataFile::endReadOnlyTransaction() { _exec("RELEASE SAVEPOINT roTransaction"); }

    ExclusiveTransaction::ExclusiveTransaction(DataFile* db)
        : _db(*db), _lock(db->_shared->transactionMutex), _active(false) {
        _db._logVerbose("begin transaction");
        _db._beginTransaction();
        _active = true;
    }

    void ExclusiveTransaction::commit() {
        Assert(_active, "Transaction is not active");
        _active = false;
        _db._logVerbose("commit transaction");
        auto start = chrono::steady_clock::now();
        _db._endTransaction(true);
        chrono::duration<double> elapsed = chrono::steady_clock::now() - start;
        if ( elapsed.count() >= 0.1 ) _db._logInfo("Committing transaction took %.3f sec", elapsed.count());
    }

    void ExclusiveTransaction::abort() {
        Assert(_active, "Transaction is not active");
        _active = false;
        _db._logVerbose("abort transaction");
        _db._endTransaction(false);
    }

    ExclusiveTransaction::~ExclusiveTransaction() {
        if ( _active ) {
            _db._logInfo("Transaction exiting scope without explicit commit; aborting");
            try {
                abort();
            } catch ( const std::exception& x ) { _db.warn("Exception aborting transaction: %s", x.what()); }
        }
    }

    ReadOnlyTransaction::ReadOnlyTransaction(DataFile* db) {
        db->beginReadOnlyTransaction();
        _db = db;
    }

    ReadOnlyTransaction::~ReadOnlyTransaction() {
        if ( _db ) {
            try {
                _db->endReadOnlyTransaction();
            } catch ( const std::exception& x ) {
                _db->warn("~ReadOnlyTransaction caught C++ exception in endReadOnlyTransaction: %s", x.what());
            }
        }
    }

#pragma mark - SQL:

    int DataFile::_exec(const string& sql) {
        LogTo(SQL, "%s", sql.c_str());
        try {
            return _sqlDb->exec(sql);
        } catch ( const SQLite::Exception& x ) {
            if ( x.getErrorCode() == SQLITE_ERROR ) {
                throw SQLite::Exception(string(x.what()) + " -- " + sql, x.getErrorCode());
            } else {
                throw;
            }
        }
    }

    int DataFile::exec(const string& sql) {
        if ( !inTransaction() ) error::_throw(error::NotInTransaction);
        return _exec(sql);
    }

    int64_t DataFile::intQuery(const char* query) {
        SQLite::Statement st(*_sqlDb, query);
        LogStatement(st);
        return st.executeStep() ? st.getColumn(0).getInt64() : 0;
    }

    unique_ptr<SQLite::Statement> DataFile::compile(const char* sql) const {
        checkOpen();
        try {
            LogTo(SQL, "Compiling SQL \"%s\"", sql);
            return make_unique<SQLite::Statement>(*_sqlDb, sql);
        } catch ( const SQLite::Exception& x ) {
            warn("SQLite error compiling statement \"%s\": %s", sql, x.what());
            throw;
        }
    }

    void DataFile::compileCached(unique_ptr<SQLite::Statement>& ref, const char* sql) const {
        if ( ref == nullptr ) ref = compile(sql);
        else
            checkOpen();
    }

#pragma mark - MAINTENANCE:

    void DataFile::_optimize() {
        /* "The analysis_limit pragma limits the scope of any ANALYZE command that the optimize
            pragma runs so that it does not consume too many CPU cycles."
            -- <https://sqlite.org/lang_analyze.html> */
        LogVerbose(SQL, "PRAGMA analysis_limit=400; PRAGMA optimize");
        _sqlDb->exec("PRAGMA analysis_limit=400; PRAGMA optimize");
    }

    void DataFile::optimize() noexcept {
        try {
            _optimize();
        } catch ( const SQLite::Exception& x ) { warn("Caught SQLite exception while optimizing: %s", x.what()); }
    }

    void DataFile::_vacuum(bool always) {
        // <https://blogs.gnome.org/jnelson/2015/01/06/sqlite-vacuum-and-auto_vacuum/>
        int64_t pageCount = intQuery("PRAGMA page_count");
        int64_t freePages = intQuery("PRAGMA freelist_count");
        logVerbose("Housekeeping: %lld of %lld pages free (%.0f%%)", (long long)freePages, (long long)pageCount,
                   pageCount ? 100.0 * static_cast<double>(freePages) / static_cast<double>(pageCount) : 0.0);

        if ( !always && (pageCount == 0 || (float)freePages / static_cast<float>(pageCount) < kVacuumFractionThreshold)
             && (freePages * kPageSize < kVacuumSizeThreshold) )
            return;

        logInfo("Incremental-vacuuming database...");
        string sql = "PRAGMA incremental_vacuum";
        // On explicit compact, truncate the WAL file to save disk space:
        if ( always ) sql += "; PRAGMA wal_checkpoint(TRUNCATE)";
        _exec(sql);

        int64_t shrunk = pageCount - intQuery("PRAGMA page_count");
        logInfo("    ...removed %" PRIi64 " pages (%" PRIi64 "KB)", shrunk, shrunk * kPageSize / 1024);
    }

    void DataFile::vacuum(bool always) noexcept {
        try {
            _vacuum(always);
        } catch ( const SQLite::Exception& x ) { warn("Caught SQLite exception while vacuuming: %s", x.what()); }
    }

    void DataFile::integrityCheck() {
        SQLite::Statement stmt(sqlDb(), "PRAGMA integrity_check");
        stringstream      errors;
        while ( stmt.executeStep() ) {
            if ( string row = stmt.getColumn(0).getString(); row != "ok" ) {
                errors << "\n" << row;
                warn("Integrity check: %s", row.c_str());
            }
        }
        if ( string error = errors.str(); !error.empty() )
            error::_throw(error::CorruptData, "Database integrity check failed (details below)%s", error.c_str());
    }

    alloc_slice DataFile::rawQuery(const string& query) {
        SQLite::Statement stmt(sqlDb(), query);
        LogStatement(stmt);
        int             nCols = stmt.getColumnCount();
        fleece::Encoder enc;
        enc.beginArray();
        while ( stmt.executeStep() ) {
            enc.beginArray();
            for ( int i = 0; i < nCols; ++i ) {
                SQLite::Column col = stmt.getColumn(i);
                switch ( col.getType() ) {
                    case SQLITE_NULL:
                        enc.writeNull();
                        break;
                    case SQLITE_INTEGER:
                        enc.writeInt(col.getInt64());
                        break;
                    case SQLITE_FLOAT:
                        enc.writeDouble(col.getDouble());
                        break;
                    case SQLITE_TEXT:
                        enc.writeString(col.getString());
                        break;
                    case SQLITE_BLOB:
                        enc.writeData(slice(col.getBlob(), col.getBytes()));
                        break;
                }
            }
            enc.endArray();
        }
        enc.endArray();
        return enc.finish();
    }

}  // namespace versastore
