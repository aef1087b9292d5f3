//
// FieldDictionary.hh
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
#include "Catalog.hh"
#include "DictionaryCache.hh"
#include <map>
#include <memory>
#include <tuple>
#include <vector>

namespace versastore {
    class DataFile;
    class NameDictionary;

    /** The coordinate of an attribute, as name ids: the record type, whether the record is
        addressed by name (or is a sequence field), the instance name (or "") and the key. */
    struct FieldKey {
        HasName  hasName;
        nameid_t typeNID;
        nameid_t nameNID;
        nameid_t keyNID;

        bool operator<(const FieldKey& other) const noexcept {
            return std::tie(hasName, typeNID, nameNID, keyNID)
                   < std::tie(other.hasName, other.typeNID, other.nameNID, other.keyNID);
        }

        bool operator==(const FieldKey& other) const noexcept {
            return hasName == other.hasName && typeNID == other.typeNID && nameNID == other.nameNID
                   && keyNID == other.keyNID;
        }
    };

    /** The same coordinate, as strings. */
    struct FieldCoordinate {
        HasName     hasName;
        std::string type;
        std::string name;
        std::string key;
    };

    /** A field's id and its permanent value kind. Ordered by id alone. */
    struct FieldRef {
        fieldid_t fid;
        FieldType fieldType;

        bool operator<(const FieldRef& other) const noexcept { return fid < other.fid; }
    };

    /** A field as read back: its id, kind and coordinate. */
    struct FieldInfo {
        fieldid_t fid;
        FieldType fieldType;
        FieldKey  key;
    };

    /** Interns attribute coordinates as field ids (FIDs) in the `fields` table, using the same
        look-up / insert-if-absent / look-up-again protocol as NameDictionary. A field's
        FieldType is fixed by whoever creates it; later callers asking for a different type
        get the stored one. */
    class FieldDictionary {
      public:
        using Cache = DictionaryCache<FieldKey, FieldRef>;

        FieldDictionary(DataFile& db, NameDictionary& names, std::shared_ptr<Cache> cache = nullptr);

        /** Returns the fields with the given coordinates, creating missing ones with the
            associated FieldType. Must not be called while the DataFile is in a transaction. */
        std::map<FieldKey, FieldRef> resolve(const std::map<FieldKey, FieldType>& fields);

        /** Resolves string coordinates, interning their names first. New fields get `Value`. */
        FieldRef resolve(const FieldCoordinate&, FieldType typeIfNew = FieldType::Value);

        /** Returns the existing fields with the given ids; unknown ids are omitted. */
        std::map<fieldid_t, FieldInfo> fieldsWithIds(const std::vector<fieldid_t>& fids);

        /** Looks up an existing field without creating it. */
        std::optional<FieldRef> lookup(const FieldKey&);

        [[nodiscard]] const std::shared_ptr<Cache>& cache() const noexcept { return _cache; }

      private:
        using FieldMap = std::map<FieldKey, FieldRef>;

        void fetch(const std::vector<FieldKey>& keys, FieldMap& found);
        void insert(const std::vector<std::pair<FieldKey, FieldType>>& fields);

        DataFile&              _db;
        NameDictionary&        _names;
        std::shared_ptr<Cache> _cache;
    };

}  // namespace versastore
