//
// SQLiteFunctions.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "SQLite_Internal.hh"
#include "SQLiteCpp/Exception.h"
#include <sqlite3.h>
#include <regex>

using namespace std;

namespace versastore {

    // Implements `value REGEXP pattern`, which SQLite calls as regexp(pattern, value).
    // Matching is case-insensitive and unanchored; callers refine results themselves.
    // The compiled pattern is cached as auxdata, so it's only compiled once per statement.
    static void regexp(sqlite3_context* ctx, int argc, sqlite3_value** argv) noexcept {
        if ( sqlite3_value_type(argv[0]) == SQLITE_NULL || sqlite3_value_type(argv[1]) == SQLITE_NULL ) {
            sqlite3_result_null(ctx);
            return;
        }
        auto r = (regex*)sqlite3_get_auxdata(ctx, 0);
        if ( !r ) {
            auto pattern = (const char*)sqlite3_value_text(argv[0]);
            auto size    = (size_t)sqlite3_value_bytes(argv[0]);
            try {
                r = new regex(pattern, size, regex_constants::ECMAScript | regex_constants::icase);
            } catch ( const regex_error& x ) {
                LogTo(SQL, "regexp: invalid pattern \"%s\": %s", pattern, x.what());
                sqlite3_result_error(ctx, "invalid regular expression", -1);
                return;
            } catch ( const bad_alloc& ) {
                sqlite3_result_error_nomem(ctx);
                return;
            }
            sqlite3_set_auxdata(ctx, 0, r, [](void* aux) { delete (regex*)aux; });
            // SQLite may have deleted it already, if it couldn't keep it:
            r = (regex*)sqlite3_get_auxdata(ctx, 0);
            if ( !r ) {
                sqlite3_result_error_nomem(ctx);
                return;
            }
        }
        auto str  = (const char*)sqlite3_value_text(argv[1]);
        auto size = (size_t)sqlite3_value_bytes(argv[1]);
        try {
            sqlite3_result_int(ctx, regex_search(str, str + size, *r));
        } catch ( const regex_error& x ) {
            // e.g. error_complexity on pathological patterns
            sqlite3_result_error(ctx, x.what(), -1);
        }
    }

    struct SQLiteFunctionSpec {
        const char* const name;
        int const         argCount;
        void (*const function)(sqlite3_context*, int, sqlite3_value**);
    };

    static const SQLiteFunctionSpec kFunctionsSpec[] = {
            {"regexp", 2, regexp},
            {},
    };

    void RegisterSQLiteFunctions(sqlite3* db) {
        for ( auto fn = kFunctionsSpec; fn->name; ++fn ) {
            int rc = sqlite3_create_function_v2(db, fn->name, fn->argCount, SQLITE_UTF8 | SQLITE_DETERMINISTIC,
                                                nullptr, fn->function, nullptr, nullptr, nullptr);
            if ( rc != SQLITE_OK ) throw SQLite::Exception(db, rc);
        }
    }

}  // namespace versastore
