//
// AttributeStore.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "AttributeStore.hh"
#include "NameDictionary.hh"
#include "Catalog.hh"
#include "DataFile.hh"
#include "DateTime.hh"
#include "SQLite_Internal.hh"
#include "StatementBuilder.hh"
#include "Error.hh"
#include "StringUtil.hh"
#include "SQLiteCpp/SQLiteCpp.h"
#include <algorithm>
#include <set>

using namespace std;

namespace versastore {

    static constexpr const char* kValueTables[] = {"values_text", "values_double", "values_datetime"};

    AttributeStore::AttributeStore(DataFile& db, NameDictionary& names, FieldDictionary& fields,
                                   ValueClassifier classifier)
        : _db(db), _names(names), _fields(fields), _classifier(std::move(classifier)) {}

#pragma mark - DECOMPOSITION:

    namespace {
        struct Attribute {
            FieldCoordinate coord;
            string          value;
        };

        bool isDerivedType(const string& type) { return type == catalog::kTopicInfo || type == catalog::kCreateInfo; }

        void decompose(const StructuredDocument& doc, vector<Attribute>& out) {
            if ( !doc.text().empty() ) out.push_back({{HasName::Unnamed, catalog::kText, "", ""}, doc.text()});

            for ( auto& [type, records] : doc.records() ) {
                if ( isDerivedType(type) || records.empty() ) continue;
                if ( type.empty() ) error::_throw(error::InvalidParameter, "Record type can't be empty");
                bool named = records.front().isNamed();
                if ( !named ) {
                    if ( records.size() > 1 )
                        error::_throw(error::InvalidParameter, "%s has %zu unnamed records", type.c_str(),
                                      records.size());
                    for ( auto& [key, value] : records.front().attributes )
                        out.push_back({{HasName::Unnamed, type, "", key}, value});
                    continue;
                }
                set<string> seen;
                for ( size_t i = 0; i < records.size(); ++i ) {
                    auto& record = records[i];
                    if ( !record.isNamed() )
                        error::_throw(error::InvalidParameter, "%s mixes named and unnamed records", type.c_str());
                    if ( !seen.insert(record.name()).second )
                        error::_throw(error::InvalidParameter, "%s has two records named \"%s\"", type.c_str(),
                                      record.name().c_str());
                    out.push_back({{HasName::Sequence, type, NameDictionary::sequenceName(unsigned(i)),
                                    catalog::kName},
                                   record.name()});
                    for ( auto& [key, value] : record.attributes ) {
                        if ( key != catalog::kName )
                            out.push_back({{HasName::Named, type, record.name(), key}, value});
                    }
                }
            }
        }
    }  // namespace

    AttributeStore::Prepared AttributeStore::prepare(const StructuredDocument& doc) {
        vector<Attribute> attrs;
        decompose(doc, attrs);

        vector<string> nameList;
        nameList.reserve(3 * attrs.size());
        for ( auto& attr : attrs ) {
            nameList.push_back(attr.coord.type);
            nameList.push_back(attr.coord.name);
            nameList.push_back(attr.coord.key);
        }
        auto nids = _names.resolve(nameList);

        vector<FieldKey>          keys;
        map<FieldKey, FieldType> wanted;
        keys.reserve(attrs.size());
        for ( auto& attr : attrs ) {
            FieldKey key{attr.coord.hasName, nids.at(attr.coord.type), nids.at(attr.coord.name),
                         nids.at(attr.coord.key)};
            keys.push_back(key);
            wanted.emplace(key, FieldType::Value);
        }
        auto fields = _fields.resolve(wanted);

        Prepared prepared;
        prepared.rows.reserve(attrs.size());
        for ( size_t i = 0; i < attrs.size(); ++i ) {
            auto&    attr = attrs[i];
            FieldRef ref  = fields.at(keys[i]);
            if ( ref.fieldType == FieldType::NotValue ) continue;
            if ( attr.coord.hasName == HasName::Sequence ) {
                prepared.rows.push_back({ref.fid, DuckType::Sequence, OpaqueValue{}, attr.value});
            } else {
                bool parseDates = (attr.coord.type != catalog::kText);
                auto c          = _classifier.classify(attr.value, ref.fieldType, parseDates);
                prepared.rows.push_back({ref.fid, DuckTypeOf(c), c, attr.value});
            }
        }
        sort(prepared.rows.begin(), prepared.rows.end(), [](const Prepared::Row& a, const Prepared::Row& b) {
            return std::tie(a.duckType, a.fid) < std::tie(b.duckType, b.fid);
        });
        return prepared;
    }

    void AttributeStore::write(fobid_t webId, fobid_t fobid, const Prepared& prepared, bool other) {
        static const vector<string> kColumns = {"webId", "fobId", "ducktype", "FID", "value"};
        BulkInsert                  text(_db, "values_text", kColumns);
        BulkInsert                  numbers(_db, "values_double", kColumns);
        BulkInsert                  dates(_db, "values_datetime", kColumns);
        int                         offset = other ? kOtherRevisionDuckType : 0;

        for ( auto& row : prepared.rows ) {
            int64_t ducktype = int(row.duckType) + offset;
            text.add({webId, fobid, ducktype, row.fid, storedName(row.value)});
            if ( auto n = get_if<NumericValue>(&row.classification) ) {
                numbers.add({webId, fobid, ducktype, row.fid, n->number});
            } else if ( auto d = get_if<DateValue>(&row.classification) ) {
                dates.add({webId, fobid, ducktype, row.fid, FormatDateTime(d->date)});
            } else if ( auto nd = get_if<NumericAndDateValue>(&row.classification) ) {
                numbers.add({webId, fobid, ducktype, row.fid, nd->number});
                dates.add({webId, fobid, ducktype, row.fid, FormatDateTime(nd->date)});
            }
        }
        size_t n = text.flush();
        numbers.flush();
        dates.flush();
        LogVerbose(DBLog, "Wrote %zu attribute rows for revision %lld", n, (long long)fobid);
    }

    void AttributeStore::writeText(fobid_t webId, fobid_t fobid, const vector<string>& lines, bool other) {
        BulkInsert insert(_db, "metaText", {"webId", "fobId", "ducktype", "lnum", "value"});
        int64_t    ducktype = other ? kOtherRevisionDuckType : 0;
        int64_t    lnum     = 0;
        for ( auto& line : lines ) insert.add({webId, fobid, ducktype, lnum++, line});
        insert.flush();
    }

#pragma mark - RECONSTRUCTION:

    StructuredDocument AttributeStore::read(fobid_t fobid) {
        struct ValueRow {
            fieldid_t fid;
            int       ducktype;
            string    value;
        };

        vector<ValueRow>  rows;
        vector<fieldid_t> fids;
        {
            SQLite::Statement stmt(_db.sqlDb(), "SELECT FID, ducktype & 31, value FROM values_text "
                                                "WHERE fobId = ? ORDER BY ducktype & 31, FID");
            stmt.bind(1, (int64_t)fobid);
            LogStatement(stmt);
            while ( stmt.executeStep() ) {
                rows.push_back({stmt.getColumn(0).getInt64(), stmt.getColumn(1).getInt(), getColumnAsName(stmt, 2)});
                fids.push_back(rows.back().fid);
            }
        }

        // One batch for any fields not cached yet, then one for their names:
        auto             fields = _fields.fieldsWithIds(fids);
        vector<nameid_t> nids;
        for ( auto& [fid, info] : fields ) {
            nids.push_back(info.key.typeNID);
            nids.push_back(info.key.nameNID);
            nids.push_back(info.key.keyNID);
        }
        auto names = _names.namesOf(nids);
        auto nameOf = [&](nameid_t nid) -> const string& {
            auto i = names.find(nid);
            if ( i == names.end() ) error::_throw(error::CorruptData, "Unknown name id %lld", (long long)nid);
            return i->second;
        };

        StructuredDocument doc;
        // Sequence rows sort first; they establish each collection's length and names.
        for ( auto& row : rows ) {
            auto f = fields.find(row.fid);
            if ( f == fields.end() ) error::_throw(error::CorruptData, "Unknown field id %lld", (long long)row.fid);
            const FieldKey& key  = f->second.key;
            const string&   type = nameOf(key.typeNID);
            switch ( key.hasName ) {
                case HasName::Sequence:
                    {
                        auto& records = doc.mutableRecordsOfType(type);
                        auto  index   = size_t(key.nameNID - 1);
                        if ( records.size() <= index ) records.resize(index + 1);
                        records[index].set(catalog::kName, row.value);
                        break;
                    }
                case HasName::Named:
                    {
                        const string& instance = nameOf(key.nameNID);
                        auto&         records  = doc.mutableRecordsOfType(type);
                        auto          i        = find_if(records.begin(), records.end(),
                                                         [&](const Record& r) { return r.name() == instance; });
                        if ( i == records.end() ) {
                            records.emplace_back();
                            records.back().set(catalog::kName, instance);
                            i = records.end() - 1;
                        }
                        i->set(nameOf(key.keyNID), row.value);
                        break;
                    }
                case HasName::Unnamed:
                    if ( type == catalog::kText ) {
                        doc.setText(row.value);
                    } else {
                        auto& records = doc.mutableRecordsOfType(type);
                        if ( records.empty() ) records.emplace_back();
                        records.front().set(nameOf(key.keyNID), row.value);
                    }
                    break;
            }
        }
        return doc;
    }

#pragma mark - HOUSEKEEPING:

    void AttributeStore::setOther(fobid_t fobid, bool other) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        const char* update = other ? "UPDATE %s SET ducktype = ducktype + 32 WHERE fobId = ? AND ducktype < 32"
                                   : "UPDATE %s SET ducktype = ducktype - 32 WHERE fobId = ? AND ducktype >= 32";
        for ( const char* table : kValueTables ) {
            SQLite::Statement stmt(_db.sqlDb(), format(update, table));
            stmt.bind(1, (int64_t)fobid);
            LogStatement(stmt);
            stmt.exec();
        }
        SQLite::Statement stmt(_db.sqlDb(), format(update, "metaText"));
        stmt.bind(1, (int64_t)fobid);
        LogStatement(stmt);
        stmt.exec();
    }

    void AttributeStore::remove(fobid_t fobid) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        for ( const char* table : {"values_text", "values_double", "values_datetime", "metaText"} ) {
            SQLite::Statement stmt(_db.sqlDb(), format("DELETE FROM %s WHERE fobId = ?", table));
            stmt.bind(1, (int64_t)fobid);
            LogStatement(stmt);
            stmt.exec();
        }
    }

    void AttributeStore::moveTo(fobid_t fobid, fobid_t webId) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        for ( const char* table : {"values_text", "values_double", "values_datetime", "metaText"} ) {
            SQLite::Statement stmt(_db.sqlDb(), format("UPDATE %s SET webId = ? WHERE fobId = ?", table));
            stmt.bind(1, (int64_t)webId);
            stmt.bind(2, (int64_t)fobid);
            LogStatement(stmt);
            stmt.exec();
        }
    }

    void AttributeStore::removeContainer(fobid_t webId) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        for ( const char* table : {"values_text", "values_double", "values_datetime", "metaText"} ) {
            SQLite::Statement stmt(_db.sqlDb(), format("DELETE FROM %s WHERE webId = ?", table));
            stmt.bind(1, (int64_t)webId);
            LogStatement(stmt);
            stmt.exec();
        }
    }

}  // namespace versastore
