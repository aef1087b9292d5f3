//
// StatementBuilder.hh
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
#include <initializer_list>
#include <memory>
#include <variant>
#include <vector>

namespace SQLite {
    class Statement;
}

namespace versastore {
    class DataFile;

    /** A value to bind to a statement parameter. */
    using SQLValue = std::variant<std::monostate, int64_t, double, std::string>;

    /** Binds `value` to the 1-based parameter `index`. Strings are copied, so `value` need not
        outlive the statement's execution. */
    void bindValue(SQLite::Statement&, int index, const SQLValue& value);

    /** Binds `values` to consecutive parameters starting at `firstIndex`; returns the next index. */
    int bindAll(SQLite::Statement&, const std::vector<SQLValue>& values, int firstIndex = 1);

    /** Returns `n` comma-separated `?` placeholders, for an `IN (...)` list. */
    std::string placeholders(size_t n);

    /** Returns `rows` parenthesized groups of `columns` placeholders, for a multi-row VALUES. */
    std::string rowPlaceholders(size_t rows, size_t columns);

    /** Builds and runs multi-row `INSERT` statements. Rows are buffered by add() and written by
        flush(), in as few statements as SQLite's parameter limit allows. The placeholder count of
        each statement is derived from the column list, never counted by hand.
        Must be used inside a transaction. */
    class BulkInsert {
      public:
        BulkInsert(DataFile&, std::string table, std::vector<std::string> columns, std::string verb = "INSERT");
        ~BulkInsert();

        /** Adds a row; it must have one value per column. */
        void add(std::vector<SQLValue> row);

        void add(std::initializer_list<SQLValue> row) { add(std::vector<SQLValue>(row)); }

        [[nodiscard]] size_t pendingRows() const noexcept { return _rows.size(); }

        /** Writes all pending rows; returns the number of rows changed. */
        size_t flush();

        BulkInsert(const BulkInsert&) = delete;

      private:
        std::string sqlForRows(size_t rows) const;

        DataFile&                          _db;
        std::string const                  _table;
        std::vector<std::string> const     _columns;
        std::string const                  _verb;
        size_t                             _maxRows;
        std::vector<std::vector<SQLValue>> _rows;
        std::unique_ptr<SQLite::Statement> _fullStatement;  // Cached statement for _maxRows rows
    };

}  // namespace versastore
