//
// AttributeStore.hh
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
#include "FieldDictionary.hh"
#include "StructuredDocument.hh"
#include "ValueClassifier.hh"
#include <vector>

namespace versastore {
    class DataFile;
    class NameDictionary;

    /** Stores a revision's content as typed attribute rows in `values_text`, `values_double`
        and `values_datetime`, and its embedded form as lines in `metaText`.

        Every record collection is given explicit sequence numbers: a named record at index i
        is stored as a sequence field (type, "0000000i", "name") whose value is its name,
        so record order is recovered from data, not from row order. */
    class AttributeStore {
      public:
        /** A document decomposed into rows, with names and fields already resolved.
            Produced by prepare() outside of a transaction, then written by write(). */
        struct Prepared {
            struct Row {
                fieldid_t      fid;
                DuckType       duckType;
                Classification classification;
                std::string    value;
            };

            std::vector<Row> rows;  // Sorted by (duckType, fid)
        };

        AttributeStore(DataFile&, NameDictionary&, FieldDictionary&, ValueClassifier = ValueClassifier());

        /** Decomposes `doc`, interning any new names and fields (committed immediately), and
            classifies every value. TOPICINFO and CREATEINFO records are not stored.
            Throws InvalidParameter if a record type mixes named and unnamed records, has more
            than one unnamed record, or repeats a name. */
        Prepared prepare(const StructuredDocument& doc);

        /** Writes prepared rows for revision `fobid`. `other` marks them as history. */
        void write(fobid_t webId, fobid_t fobid, const Prepared&, bool other = false);

        /** Writes the embedded-form lines of revision `fobid`. */
        void writeText(fobid_t webId, fobid_t fobid, const std::vector<std::string>& lines, bool other = false);

        /** Reconstructs the content of revision `fobid`. */
        StructuredDocument read(fobid_t fobid);

        /** Retags all rows of `fobid` as belonging to a superseded or current revision. */
        void setOther(fobid_t fobid, bool other);

        /** Deletes all rows of `fobid`. */
        void remove(fobid_t fobid);

        /** Moves all rows of `fobid` to another container, after a rename. */
        void moveTo(fobid_t fobid, fobid_t webId);

        /** Deletes all rows of every revision in a container. */
        void removeContainer(fobid_t webId);

        [[nodiscard]] const ValueClassifier& classifier() const noexcept { return _classifier; }

      private:
        DataFile&       _db;
        NameDictionary& _names;
        FieldDictionary& _fields;
        ValueClassifier  _classifier;
    };

}  // namespace versastore
