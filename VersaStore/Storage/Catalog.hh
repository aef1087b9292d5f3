//
// Catalog.hh
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
#include <vector>

namespace versastore {
    class DataFile;

    /** Terminator appended to every string stored in the `names` table and the text
        projection, so that comparisons are exact up to and including trailing whitespace. */
    constexpr char kEndOfValue = '\0';

    /** First id given to the well-known names; they are numbered consecutively from here in
        the order of `kCatalogNames`. This table is append-only: released ids never change. */
    constexpr nameid_t kFirstCatalogNID = 100000000;

    /** First id given to names interned at runtime. */
    constexpr nameid_t kFirstDynamicNID = 100010000;

    /** Sequence names ("00000000", "00000001", ...) below this are created with the schema. */
    constexpr unsigned kPreseededSequences = 300;

    /** The well-known names, in id order. */
    extern const std::vector<const char*> kCatalogNames;

    /** Kind of value a field holds; fixed when the field is first created. */
    enum class FieldType : int {
        NotValue  = 0,  ///< Not stored as an attribute (derived from the revision row)
        Value     = 1,  ///< Ordinary scalar; classified as string/number/date
        EpochDate = 2,  ///< A number here is a date, in seconds since the epoch
    };

    /** The third coordinate of a field: how the record owning it is addressed. */
    enum class HasName : int {
        Unnamed  = 0,  ///< Only record of its type (index 0)
        Named    = 1,  ///< Attribute of a record addressed by its instance name
        Sequence = 2,  ///< Position of a named record; the value is the instance name
    };

    /** A well-known field, as names. */
    struct CatalogField {
        HasName     hasName;
        const char* type;
        const char* name;
        const char* key;
        FieldType   fieldType;
    };

    /** The well-known fields, in id order (ids start at 1). */
    extern const std::vector<CatalogField> kCatalogFields;

    /** Well-known names used by the store itself. */
    namespace catalog {
        constexpr const char* kText           = "_text";
        constexpr const char* kPrefSet        = "_PREF_SET";
        constexpr const char* kPreference     = "PREFERENCE";
        constexpr const char* kTopicInfo      = "TOPICINFO";
        constexpr const char* kCreateInfo     = "CREATEINFO";
        constexpr const char* kName           = "name";
        constexpr const char* kSequenceFormat = "%08u";
    }  // namespace catalog

    /** Returns the stored form of a name (the name plus the terminator). */
    static inline std::string storedName(std::string_view name) {
        std::string result(name);
        result += kEndOfValue;
        return result;
    }

    /** Populates the `names` and `fields` tables of a newly created database.
        Must be called inside the schema-creation transaction. */
    void SeedCatalog(DataFile&);

}  // namespace versastore
