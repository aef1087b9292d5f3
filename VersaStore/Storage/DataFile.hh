//
// DataFile.hh
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
#include "Logging.hh"
#include <memory>
#include <mutex>
#include <string>

namespace SQLite {
    class Database;
    class Statement;
}  // namespace SQLite

namespace versastore {

    class ExclusiveTransaction;

    /** A SQLite database file holding a VersaStore schema: the name and field dictionaries,
        revisions, attribute values, access rules, locks and leases.
        Several DataFile instances may be open on the same file (e.g. one per thread); write
        transactions on the same file are serialized between them. */
    class DataFile : public Logging {
      public:
        struct Options {
            bool create : 1;       ///< Should the db be created if it doesn't exist?
            bool writeable : 1;    ///< If false, db is opened read-only
            bool upgradeable : 1;  ///< DB schema can be upgraded

            static const Options defaults;
        };

        DataFile(const string& path, const Options* = nullptr);
        ~DataFile() override;

        [[nodiscard]] const string& path() const noexcept { return _path; }

        [[nodiscard]] const Options& options() const noexcept { return _options; }

        [[nodiscard]] bool isOpen() const noexcept;

        /** Closes the database. Do not call any methods on this object afterwards,
            except isOpen() or close(), until reopen() is called. */
        void close();

        /** Reopens database after it's been closed. */
        void reopen();

        /** Throws NotOpen if the database has been closed. */
        void checkOpen() const;

        [[nodiscard]] bool inTransaction() const noexcept { return _inTransaction; }

        /** The underlying SQLiteCpp connection. */
        [[nodiscard]] SQLite::Database& sqlDb() const;

        /** Runs SQL; throws NotInTransaction unless a transaction is open. */
        int exec(const string& sql);

        /** Runs a query returning a single integer (0 if there are no rows). */
        int64_t intQuery(const char* query);

        [[nodiscard]] std::unique_ptr<SQLite::Statement> compile(const char* sql) const;

        [[nodiscard]] std::unique_ptr<SQLite::Statement> compile(const string& sql) const {
            return compile(sql.c_str());
        }

        /** Compiles `sql` into `ref` unless it's already been compiled. */
        void compileCached(std::unique_ptr<SQLite::Statement>& ref, const char* sql) const;

        //////// MAINTENANCE:

        /** Lets SQLite update its query-planner statistics. Never throws. */
        void optimize() noexcept;

        /** Reclaims free pages. If `always` is false, only does so when enough space is free. */
        void vacuum(bool always) noexcept;

        /** Runs SQLite's integrity check; throws CorruptData describing any problems. */
        void integrityCheck();

        /** Runs an arbitrary SQL query, returning the rows as a Fleece array of arrays. */
        alloc_slice rawQuery(const string& query);

        /** Deletes a database file and its -wal and -shm companions. */
        static bool deleteDataFile(const string& path);

      protected:
        std::string loggingClassName() const override { return "DB"; }

      private:
        friend class ExclusiveTransaction;
        friend class ReadOnlyTransaction;

        /** The shared state of all DataFiles open on the same path. */
        struct Shared {
            std::mutex transactionMutex;  // Held by the ExclusiveTransaction in progress
        };

        static std::shared_ptr<Shared> sharedForPath(const string& path);

        enum class SchemaVersion : int {
            None        = 0,
            MinReadable = 1,
            Initial     = 1,
            Current     = Initial,
            MaxReadable = 1,
        };

        void     createSchema();
        int      _exec(const string& sql);
        void     _beginTransaction();
        void     _endTransaction(bool commit);
        void     beginReadOnlyTransaction();
        void     endReadOnlyTransaction();
        void     _optimize();
        void     _vacuum(bool always);

        string const                      _path;
        Options                           _options;
        std::shared_ptr<Shared>           _shared;
        std::unique_ptr<SQLite::Database> _sqlDb;
        SchemaVersion                     _schemaVersion{SchemaVersion::None};
        bool                              _inTransaction{false};
    };

    /** Grants exclusive write access to a DataFile while in scope.
        The transaction is aborted when the object exits scope, unless commit() was called.
        Only one ExclusiveTransaction can be active on a database file at a time, across all
        DataFile objects open on it in this process. THESE DO NOT NEST. */
    class ExclusiveTransaction {
      public:
        explicit ExclusiveTransaction(DataFile*);

        explicit ExclusiveTransaction(DataFile& db) : ExclusiveTransaction(&db) {}

        explicit ExclusiveTransaction(const std::unique_ptr<DataFile>& db) : ExclusiveTransaction(db.get()) {}

        ~ExclusiveTransaction();

        [[nodiscard]] DataFile& dataFile() const { return _db; }

        void commit();
        void abort();

        ExclusiveTransaction(const ExclusiveTransaction&) = delete;

      private:
        DataFile&                    _db;      // The DataFile
        std::unique_lock<std::mutex> _lock;    // Holds the file's transaction mutex
        bool                         _active;  // Is there an open transaction at the db level?
    };

    /** A read-only transaction. Does not grant access to writes, but ensures that all database
        reads are consistent with each other. */
    class ReadOnlyTransaction {
      public:
        explicit ReadOnlyTransaction(DataFile* db);

        explicit ReadOnlyTransaction(DataFile& db) : ReadOnlyTransaction(&db) {}

        ~ReadOnlyTransaction();

        ReadOnlyTransaction(const ReadOnlyTransaction&) = delete;

      private:
        DataFile* _db{nullptr};
    };

}  // namespace versastore
