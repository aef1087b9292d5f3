//
// NameDictionary.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "NameDictionary.hh"
#include "Catalog.hh"
#include "DataFile.hh"
#include "SQLite_Internal.hh"
#include "StatementBuilder.hh"
#include "Error.hh"
#include "StringUtil.hh"
#include "SQLiteCpp/SQLiteCpp.h"
#include <algorithm>

using namespace std;

namespace versastore {

    // Names per `IN (...)` query, well under SQLite's parameter limit.
    static constexpr size_t kMaxNamesPerQuery = 500;

    NameDictionary::NameDictionary(DataFile& db, shared_ptr<Cache> cache)
        : _db(db), _cache(cache ? std::move(cache) : make_shared<Cache>()) {}

    // "99999999" would map onto kFirstCatalogNID, so it is an ordinary name.
    bool NameDictionary::isSequenceName(string_view name) noexcept {
        if ( name.size() != 8 || !all_of(name.begin(), name.end(), [](char c) { return isdigit((unsigned char)c); }) )
            return false;
        return nameid_t(stoll(string(name))) + 1 < kFirstCatalogNID;
    }

    string NameDictionary::sequenceName(unsigned seq) { return format(catalog::kSequenceFormat, seq); }

    // Pass 1: looks up names in the cache, then the rest in the `names` table.
    void NameDictionary::fetch(const vector<string>& names, NameMap& found) {
        vector<string> missing;
        for ( auto& name : names ) {
            if ( found.count(name) ) continue;
            if ( auto nid = _cache->idOf(name); nid ) found.emplace(name, *nid);
            else
                missing.push_back(name);
        }
        sort(missing.begin(), missing.end());
        missing.erase(unique(missing.begin(), missing.end()), missing.end());

        for ( size_t start = 0; start < missing.size(); start += kMaxNamesPerQuery ) {
            size_t            n = min(kMaxNamesPerQuery, missing.size() - start);
            vector<string>    stored;
            SQLite::Statement stmt(_db.sqlDb(), "SELECT NID, name FROM names WHERE name IN (" + placeholders(n) + ")");
            stored.reserve(n);
            for ( size_t i = 0; i < n; ++i ) {
                stored.push_back(storedName(missing[start + i]));
                stmt.bindNoCopy(int(i + 1), stored.back());
            }
            LogStatement(stmt);
            while ( stmt.executeStep() ) {
                nameid_t nid  = stmt.getColumn(0).getInt64();
                string   name = getColumnAsName(stmt, 1);
                _cache->add(name, nid);
                found.emplace(std::move(name), nid);
            }
        }
    }

    // Pass 2: inserts names, ignoring any that another connection has just inserted.
    void NameDictionary::insert(const vector<string>& names) {
        Assert(!_db.inTransaction(), "Names must be resolved before opening a transaction");
        ExclusiveTransaction t(_db);
        SQLite::Statement    insertSequence(_db.sqlDb(), "INSERT OR IGNORE INTO names (NID, name) VALUES (?, ?)");
        SQLite::Statement    insertName(_db.sqlDb(),
                                        format("INSERT OR IGNORE INTO names (NID, name) "
                                                  "SELECT max(ifnull(max(NID), 0) + 1, %lld), ? FROM names",
                                                  (long long)kFirstDynamicNID));
        for ( auto& name : names ) {
            string stored = storedName(name);
            if ( isSequenceName(name) ) {
                insertSequence.bind(1, (int64_t)stoll(name) + 1);
                insertSequence.bindNoCopy(2, stored);
                insertSequence.exec();
                insertSequence.reset();
            } else {
                insertName.bindNoCopy(1, stored);
                insertName.exec();
                insertName.reset();
            }
        }
        t.commit();
        LogVerbose(DBLog, "Inserted up to %zu new names", names.size());
    }

    map<string, nameid_t> NameDictionary::resolve(const vector<string>& names) {
        NameMap found;
        fetch(names, found);

        vector<string> missing;
        for ( auto& name : names )
            if ( !found.count(name) ) missing.push_back(name);
        if ( missing.empty() ) return found;

        sort(missing.begin(), missing.end());
        missing.erase(unique(missing.begin(), missing.end()), missing.end());
        insert(missing);

        // Pass 3: whoever inserted them, the ids are in the table now.
        fetch(missing, found);
        for ( auto& name : missing ) {
            if ( !found.count(name) )
                error::_throw(error::UnexpectedError, "Name \"%s\" missing after insertion", name.c_str());
        }
        return found;
    }

    nameid_t NameDictionary::resolve(const string& name) { return resolve(vector<string>{name}).at(name); }

    map<string, nameid_t> NameDictionary::lookup(const vector<string>& names) {
        NameMap found;
        fetch(names, found);
        return found;
    }

    optional<nameid_t> NameDictionary::lookup(const string& name) {
        auto found = lookup(vector<string>{name});
        if ( auto i = found.find(name); i != found.end() ) return i->second;
        return nullopt;
    }

    map<nameid_t, string> NameDictionary::namesOf(const vector<nameid_t>& ids) {
        map<nameid_t, string> result;
        vector<nameid_t>      missing;
        for ( nameid_t nid : ids ) {
            if ( result.count(nid) ) continue;
            if ( auto name = _cache->keyOf(nid); name ) result.emplace(nid, *name);
            else
                missing.push_back(nid);
        }
        sort(missing.begin(), missing.end());
        missing.erase(unique(missing.begin(), missing.end()), missing.end());

        for ( size_t start = 0; start < missing.size(); start += kMaxNamesPerQuery ) {
            size_t            n = min(kMaxNamesPerQuery, missing.size() - start);
            SQLite::Statement stmt(_db.sqlDb(), "SELECT NID, name FROM names WHERE NID IN (" + placeholders(n) + ")");
            for ( size_t i = 0; i < n; ++i ) stmt.bind(int(i + 1), (int64_t)missing[start + i]);
            LogStatement(stmt);
            while ( stmt.executeStep() ) {
                nameid_t nid  = stmt.getColumn(0).getInt64();
                string   name = getColumnAsName(stmt, 1);
                _cache->add(name, nid);
                result.emplace(nid, std::move(name));
            }
        }
        return result;
    }

    string NameDictionary::nameOf(nameid_t nid) {
        auto names = namesOf({nid});
        if ( names.empty() ) error::_throw(error::NotFound, "No name with id %lld", (long long)nid);
        return names.begin()->second;
    }

}  // namespace versastore
