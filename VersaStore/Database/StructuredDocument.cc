//
// StructuredDocument.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "StructuredDocument.hh"
#include "Catalog.hh"
#include "Error.hh"
#include "fleece/Fleece.hh"
#include <algorithm>

using namespace std;
using namespace fleece;

namespace versastore {

    static const string            kEmptyName;
    static const StructuredDocument::RecordList kNoRecords;

    const string& Record::name() const {
        auto i = attributes.find(catalog::kName);
        return i != attributes.end() ? i->second : kEmptyName;
    }

    const string* Record::get(const string& key) const {
        auto i = attributes.find(key);
        return i != attributes.end() ? &i->second : nullptr;
    }

    const StructuredDocument::RecordList& StructuredDocument::recordsOfType(const string& type) const {
        auto i = _records.find(type);
        return i != _records.end() ? i->second : kNoRecords;
    }

    const Record* StructuredDocument::find(const string& type, const string& name) const {
        auto& records = recordsOfType(type);
        auto  i = find_if(records.begin(), records.end(), [&](const Record& r) { return r.name() == name; });
        return i != records.end() ? &*i : nullptr;
    }

    void StructuredDocument::put(const string& type, Record record) {
        auto& records = _records[type];
        auto  i       = find_if(records.begin(), records.end(),
                                [&](const Record& r) { return r.name() == record.name(); });
        if ( i != records.end() ) *i = std::move(record);
        else
            records.push_back(std::move(record));
    }

    bool StructuredDocument::remove(const string& type, const string& name) {
        auto t = _records.find(type);
        if ( t == _records.end() ) return false;
        auto& records = t->second;
        auto  i = find_if(records.begin(), records.end(), [&](const Record& r) { return r.name() == name; });
        if ( i == records.end() ) return false;
        records.erase(i);
        if ( records.empty() ) _records.erase(t);
        return true;
    }

#pragma mark - JSON:

    static string scalarString(Value value) {
        if ( value.type() == kFLString ) return string(value.asString());
        return value.toJSONString();
    }

    StructuredDocument StructuredDocument::fromJSON(slice json) {
        FLError err = kFLNoError;
        Doc     doc = Doc::fromJSON(json, &err);
        if ( !doc ) error::_throw(error::Fleece, err ? err : kFLJSONError);
        Dict root = doc.root().asDict();
        if ( !root ) error::_throw(error::InvalidParameter, "Document JSON must be an object");

        StructuredDocument result;
        if ( Value text = root["text"]; text ) result._text = scalarString(text);
        if ( Value metaValue = root["meta"]; metaValue ) {
            Dict meta = metaValue.asDict();
            if ( !meta ) error::_throw(error::InvalidParameter, "Document \"meta\" must be an object");
            for ( Dict::iterator i(meta); i; ++i ) {
                Array records = i.value().asArray();
                if ( !records ) error::_throw(error::InvalidParameter, "Records must be arrays");
                string type(i.keyString());
                auto&  list = result._records[type];
                for ( Array::iterator j(records); j; ++j ) {
                    Dict attrs = j.value().asDict();
                    if ( !attrs ) error::_throw(error::InvalidParameter, "Records must be objects");
                    Record record;
                    for ( Dict::iterator k(attrs); k; ++k )
                        record.attributes.emplace(string(k.keyString()), scalarString(k.value()));
                    list.push_back(std::move(record));
                }
            }
        }
        return result;
    }

    alloc_slice StructuredDocument::toJSON() const {
        Encoder enc(kFLEncodeJSON);
        enc.beginDict();
        enc.writeKey("text");
        enc.writeString(_text);
        enc.writeKey("meta");
        enc.beginDict();
        for ( auto& [type, records] : _records ) {
            enc.writeKey(type);
            enc.beginArray();
            for ( auto& record : records ) {
                enc.beginDict();
                for ( auto& [key, value] : record.attributes ) {
                    enc.writeKey(key);
                    enc.writeString(value);
                }
                enc.endDict();
            }
            enc.endArray();
        }
        enc.endDict();
        enc.endDict();
        FLError     err    = kFLNoError;
        alloc_slice result = enc.finish(&err);
        if ( !result ) error::_throw(error::Fleece, err);
        return result;
    }

}  // namespace versastore
