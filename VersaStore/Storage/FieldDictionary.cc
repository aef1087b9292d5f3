//
// FieldDictionary.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "FieldDictionary.hh"
#include "NameDictionary.hh"
#include "DataFile.hh"
#include "SQLite_Internal.hh"
#include "StatementBuilder.hh"
#include "Error.hh"
#include "SQLiteCpp/SQLiteCpp.h"
#include <algorithm>

using namespace std;

namespace versastore {

    // Coordinates per row-value `IN (VALUES ...)` query (4 parameters each).
    static constexpr size_t kMaxFieldsPerQuery = 200;

    static FieldInfo readField(SQLite::Statement& stmt) {
        return FieldInfo{stmt.getColumn(0).getInt64(), FieldType(stmt.getColumn(1).getInt()),
                         FieldKey{HasName(stmt.getColumn(2).getInt()), stmt.getColumn(3).getInt64(),
                                  stmt.getColumn(4).getInt64(), stmt.getColumn(5).getInt64()}};
    }

    FieldDictionary::FieldDictionary(DataFile& db, NameDictionary& names, shared_ptr<Cache> cache)
        : _db(db), _names(names), _cache(cache ? std::move(cache) : make_shared<Cache>()) {}

    void FieldDictionary::fetch(const vector<FieldKey>& keys, FieldMap& found) {
        vector<FieldKey> missing;
        for ( auto& key : keys ) {
            if ( found.count(key) ) continue;
            if ( auto ref = _cache->idOf(key); ref ) found.emplace(key, *ref);
            else
                missing.push_back(key);
        }
        sort(missing.begin(), missing.end());
        missing.erase(unique(missing.begin(), missing.end()), missing.end());

        for ( size_t start = 0; start < missing.size(); start += kMaxFieldsPerQuery ) {
            size_t            n = min(kMaxFieldsPerQuery, missing.size() - start);
            SQLite::Statement stmt(_db.sqlDb(), "SELECT FID, fieldType, hasName, typeNID, nameNID, keyNID FROM fields "
                                                "WHERE (hasName, typeNID, nameNID, keyNID) IN (VALUES "
                                                        + rowPlaceholders(n, 4) + ")");
            int index = 1;
            for ( size_t i = start; i < start + n; ++i ) {
                auto& key = missing[i];
                index = bindAll(stmt, {int64_t(key.hasName), key.typeNID, key.nameNID, key.keyNID}, index);
            }
            LogStatement(stmt);
            while ( stmt.executeStep() ) {
                FieldInfo info = readField(stmt);
                FieldRef  ref{info.fid, info.fieldType};
                _cache->add(info.key, ref);
                found.emplace(info.key, ref);
            }
        }
    }

    void FieldDictionary::insert(const vector<pair<FieldKey, FieldType>>& fields) {
        Assert(!_db.inTransaction(), "Fields must be resolved before opening a transaction");
        ExclusiveTransaction t(_db);
        BulkInsert           insert(_db, "fields", {"hasName", "typeNID", "nameNID", "keyNID", "fieldType"},
                                    "INSERT OR IGNORE");
        for ( auto& [key, type] : fields )
            insert.add({int64_t(key.hasName), key.typeNID, key.nameNID, key.keyNID, int64_t(type)});
        insert.flush();
        t.commit();
        LogVerbose(DBLog, "Inserted up to %zu new fields", fields.size());
    }

    map<FieldKey, FieldRef> FieldDictionary::resolve(const map<FieldKey, FieldType>& fields) {
        vector<FieldKey> keys;
        keys.reserve(fields.size());
        for ( auto& entry : fields ) keys.push_back(entry.first);

        FieldMap found;
        fetch(keys, found);

        vector<pair<FieldKey, FieldType>> missing;
        vector<FieldKey>                  missingKeys;
        for ( auto& [key, type] : fields ) {
            if ( !found.count(key) ) {
                missing.emplace_back(key, type);
                missingKeys.push_back(key);
            }
        }
        if ( missing.empty() ) return found;

        insert(missing);
        fetch(missingKeys, found);
        if ( found.size() != fields.size() )
            error::_throw(error::UnexpectedError, "%zu fields missing after insertion", fields.size() - found.size());
        return found;
    }

    FieldRef FieldDictionary::resolve(const FieldCoordinate& coord, FieldType typeIfNew) {
        auto     nids = _names.resolve(vector<string>{coord.type, coord.name, coord.key});
        FieldKey key{coord.hasName, nids.at(coord.type), nids.at(coord.name), nids.at(coord.key)};
        return resolve(map<FieldKey, FieldType>{{key, typeIfNew}}).at(key);
    }

    optional<FieldRef> FieldDictionary::lookup(const FieldKey& key) {
        FieldMap found;
        fetch({key}, found);
        if ( auto i = found.find(key); i != found.end() ) return i->second;
        return nullopt;
    }

    map<fieldid_t, FieldInfo> FieldDictionary::fieldsWithIds(const vector<fieldid_t>& fids) {
        map<fieldid_t, FieldInfo> result;
        vector<fieldid_t>         missing;
        for ( fieldid_t fid : fids ) {
            if ( result.count(fid) ) continue;
            if ( auto key = _cache->keyOf(FieldRef{fid, FieldType::NotValue}); key ) {
                auto ref = _cache->idOf(*key);
                result.emplace(fid, FieldInfo{fid, ref->fieldType, *key});
            } else {
                missing.push_back(fid);
            }
        }
        sort(missing.begin(), missing.end());
        missing.erase(unique(missing.begin(), missing.end()), missing.end());

        for ( size_t start = 0; start < missing.size(); start += kMaxFieldsPerQuery ) {
            size_t            n = min(kMaxFieldsPerQuery, missing.size() - start);
            SQLite::Statement stmt(_db.sqlDb(), "SELECT FID, fieldType, hasName, typeNID, nameNID, keyNID FROM fields "
                                                "WHERE FID IN ("
                                                        + placeholders(n) + ")");
            for ( size_t i = 0; i < n; ++i ) stmt.bind(int(i + 1), (int64_t)missing[start + i]);
            LogStatement(stmt);
            while ( stmt.executeStep() ) {
                FieldInfo info = readField(stmt);
                _cache->add(info.key, FieldRef{info.fid, info.fieldType});
                result.emplace(info.fid, info);
            }
        }
        return result;
    }

}  // namespace versastore
