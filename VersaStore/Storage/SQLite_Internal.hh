//
// SQLite_Internal.hh
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
#include "DataFile.hh"
#include "Logging.hh"
#include <memory>

struct sqlite3;

namespace SQLite {
    class Database;
    class Statement;
}  // namespace SQLite

namespace versastore {

    /// Logger for SQL related activity.
    extern LogDomain SQL;

    /// Logs the statement to the `SQL` logger at Info level.
    void LogStatement(const SQLite::Statement& st);

    /** Little helper class that resets a long-lived Statement and unbinds its parameters on exit.
        Otherwise, if the statement hasn't reached its last row it remains active,
        and using it again would cause an error. Clearing parameters may free up memory,
        and eliminates dangling pointers if `bindNoCopy` was used.

        This class is not needed with temporary Statement objects.

        As a bonus, the constructor calls `LogStatement()`. */
    class UsingStatement {
      public:
        explicit UsingStatement(SQLite::Statement& stmt) noexcept;

        explicit UsingStatement(const std::unique_ptr<SQLite::Statement>& stmt) noexcept : UsingStatement(*stmt) {}

        /// Destructor calls reset() and clearBindings(), logging any exception.
        ~UsingStatement() noexcept;

      private:
        SQLite::Statement& _stmt;
    };

    /// Returns a text column as a string, minus the end-of-value terminator if present.
    std::string getColumnAsName(SQLite::Statement&, int col);

    /// Registers our SQL functions (`regexp`). Called when opening a database.
    void RegisterSQLiteFunctions(sqlite3* db);

}  // namespace versastore
