//
// StatementBuilder.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "StatementBuilder.hh"
#include "DataFile.hh"
#include "SQLite_Internal.hh"
#include "Error.hh"
#include "StringUtil.hh"
#include "SQLiteCpp/SQLiteCpp.h"

using namespace std;

namespace versastore {

    // Lowest SQLITE_MAX_VARIABLE_NUMBER of any SQLite build we might be linked with.
    static constexpr size_t kMaxParameters = 999;

    void bindValue(SQLite::Statement& stmt, int index, const SQLValue& value) {
        switch ( value.index() ) {
            case 0:
                stmt.bind(index);
                break;
            case 1:
                stmt.bind(index, (int64_t)get<int64_t>(value));
                break;
            case 2:
                stmt.bind(index, get<double>(value));
                break;
            case 3:
                // Callers commonly pass a temporary vector, so SQLite must own a copy.
                stmt.bind(index, get<string>(value));
                break;
        }
    }

    int bindAll(SQLite::Statement& stmt, const vector<SQLValue>& values, int firstIndex) {
        for ( auto& value : values ) bindValue(stmt, firstIndex++, value);
        return firstIndex;
    }

    string placeholders(size_t n) {
        string result;
        result.reserve(2 * n);
        for ( size_t i = 0; i < n; ++i ) {
            if ( i > 0 ) result += ',';
            result += '?';
        }
        return result;
    }

    string rowPlaceholders(size_t rows, size_t columns) {
        string row = "(" + placeholders(columns) + ")";
        string result;
        result.reserve(rows * (row.size() + 1));
        for ( size_t i = 0; i < rows; ++i ) {
            if ( i > 0 ) result += ',';
            result += row;
        }
        return result;
    }

    BulkInsert::BulkInsert(DataFile& db, string table, vector<string> columns, string verb)
        : _db(db)
        , _table(std::move(table))
        , _columns(std::move(columns))
        , _verb(std::move(verb))
        , _maxRows(kMaxParameters / _columns.size()) {
        Assert(!_columns.empty() && _maxRows > 0);
    }

    BulkInsert::~BulkInsert() {
        if ( !_rows.empty() )
            LogWarn(SQL, "BulkInsert into %s destroyed with %zu unwritten rows", _table.c_str(), _rows.size());
    }

    void BulkInsert::add(vector<SQLValue> row) {
        Assert(row.size() == _columns.size(), "BulkInsert row has %zu values, expected %zu", row.size(),
               _columns.size());
        _rows.push_back(std::move(row));
    }

    string BulkInsert::sqlForRows(size_t rows) const {
        return _verb + " INTO " + _table + " (" + join(_columns, ",") + ") VALUES "
               + rowPlaceholders(rows, _columns.size());
    }

    size_t BulkInsert::flush() {
        if ( _rows.empty() ) return 0;
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        size_t changed = 0;
        for ( size_t start = 0; start < _rows.size(); start += _maxRows ) {
            size_t                        n = min(_maxRows, _rows.size() - start);
            unique_ptr<SQLite::Statement> partial;
            SQLite::Statement*            stmt;
            if ( n == _maxRows ) {
                _db.compileCached(_fullStatement, sqlForRows(n).c_str());
                stmt = _fullStatement.get();
            } else {
                partial = _db.compile(sqlForRows(n));
                stmt    = partial.get();
            }
            UsingStatement u(*stmt);
            int            index = 1;
            for ( size_t i = start; i < start + n; ++i ) index = bindAll(*stmt, _rows[i], index);
            changed += (size_t)stmt->exec();
        }
        _rows.clear();
        return changed;
    }

}  // namespace versastore
