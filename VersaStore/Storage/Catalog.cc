//
// Catalog.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Catalog.hh"
#include "DataFile.hh"
#include "SQLite_Internal.hh"
#include "StringUtil.hh"
#include "SQLiteCpp/SQLiteCpp.h"
#include <tuple>
#include <unordered_map>

using namespace std;

namespace versastore {

    // Released ids never change: append new names at the end only.
    const vector<const char*> kCatalogNames = {
            "",           "_acl",         "_local",         "_PREF_SET",     "_PREF_LOCAL",    "_set",
            "_text",      "_web",         "attachment",     "attr",          "attributes",     "author",
            "autoattached", "by",         "comment",        "CREATEINFO",    "date",           "definingTopic",
            "encoding",   "FIELD",        "FILEATTACHMENT", "FORM",          "format",         "from",
            "mandatory",  "moveby",       "movedto",        "movedwhen",     "movefrom",       "name",
            "path",       "PREFERENCE",   "reprev",         "rev",           "size",           "stream",
            "title",      "tmpFilename",  "to",             "tooltip",       "TOPICINFO",      "TOPICMOVED",
            "TOPICPARENT", "type",        "user",           "value",         "version",        "WORKFLOW",
            "WORKFLOWHISTORY", "DENYWEBVIEW", "ALLOWWEBVIEW", "DENYTOPICVIEW", "ALLOWTOPICVIEW",
            "DENYWEBCHANGE", "ALLOWWEBCHANGE", "DENYTOPICCHANGE", "ALLOWTOPICCHANGE",
    };

    namespace {
        using HN = HasName;
        using FT = FieldType;

        // Expands (hasName, types, name, keys, fieldType) groups, types outermost.
        vector<CatalogField> expand(
                initializer_list<tuple<HN, vector<const char*>, const char*, vector<const char*>, FT>> groups) {
            vector<CatalogField> fields;
            for ( auto& [hasName, types, name, keys, fieldType] : groups ) {
                for ( auto type : types )
                    for ( auto key : keys ) fields.push_back({hasName, type, name, key, fieldType});
            }
            return fields;
        }
    }  // namespace

    // Released ids never change: append new fields at the end only.
    const vector<CatalogField> kCatalogFields = expand({
            {HN::Unnamed, {"_text"}, "", {""}, FT::Value},
            // Derived from the revision row:
            {HN::Unnamed, {"TOPICINFO", "CREATEINFO"}, "", {"author", "version", "date", "comment", "reprev"},
             FT::NotValue},
            // Not kept at all:
            {HN::Unnamed, {"TOPICINFO", "CREATEINFO"}, "", {"format", "rev", "encoding"}, FT::NotValue},
            {HN::Unnamed, {"TOPICMOVED"}, "", {"from", "to", "by"}, FT::Value},
            {HN::Unnamed, {"TOPICMOVED"}, "", {"date"}, FT::EpochDate},
            {HN::Sequence, {"TOPICPARENT"}, "00000000", {"name"}, FT::Value},
            {HN::Sequence, {"FILEATTACHMENT"}, "00000000", {"name"}, FT::Value},
            {HN::Unnamed, {"FILEATTACHMENT"}, "", {"version", "path", "size", "user", "comment", "attr"}, FT::Value},
            {HN::Unnamed, {"FILEATTACHMENT"}, "", {"date"}, FT::EpochDate},
            {HN::Sequence, {"FORM", "FIELD", "PREFERENCE", "_PREF_SET", "_PREF_LOCAL"}, "00000000", {"name"},
             FT::Value},
    });

    void SeedCatalog(DataFile& db) {
        auto& sqlDb = db.sqlDb();

        SQLite::Statement insName(sqlDb, "INSERT INTO names (NID, name) VALUES (?, ?)");
        unordered_map<string, nameid_t> nids;
        auto addName = [&](nameid_t nid, const string& name) {
            insName.bind(1, (int64_t)nid);
            insName.bind(2, storedName(name));
            insName.exec();
            insName.reset();
            nids[name] = nid;
        };

        nameid_t nid = kFirstCatalogNID;
        for ( const char* name : kCatalogNames ) addName(nid++, name);
        for ( unsigned seq = 0; seq < kPreseededSequences; ++seq )
            addName(nameid_t(seq) + 1, format(catalog::kSequenceFormat, seq));

        SQLite::Statement insField(sqlDb, "INSERT INTO fields (FID, hasName, typeNID, nameNID, keyNID, fieldType) "
                                          "VALUES (?, ?, ?, ?, ?, ?)");
        fieldid_t fid = 1;
        for ( auto& field : kCatalogFields ) {
            insField.bind(1, (int64_t)fid++);
            insField.bind(2, int(field.hasName));
            insField.bind(3, (int64_t)nids.at(field.type));
            insField.bind(4, (int64_t)nids.at(field.name));
            insField.bind(5, (int64_t)nids.at(field.key));
            insField.bind(6, int(field.fieldType));
            insField.exec();
            insField.reset();
        }
        LogVerbose(DBLog, "Seeded catalog: %zu names, %u sequence names, %zu fields", kCatalogNames.size(),
                   kPreseededSequences, kCatalogFields.size());
    }

}  // namespace versastore
