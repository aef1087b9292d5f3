//
// StructuredDocument.hh
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
#include <map>
#include <vector>

namespace versastore {

    /** One record of a document's metadata: a set of key/value attributes. A record with a
        `name` attribute is a named record, addressed by that name; otherwise it's unnamed. */
    struct Record {
        std::map<std::string, std::string> attributes;

        Record() = default;

        Record(std::initializer_list<std::pair<const std::string, std::string>> attrs) : attributes(attrs) {}

        /** The record's instance name, or "" if it's unnamed. */
        [[nodiscard]] const std::string& name() const;

        [[nodiscard]] bool isNamed() const { return attributes.count("name") > 0; }

        /** The value of an attribute, or nullptr if it's not present. */
        [[nodiscard]] const std::string* get(const std::string& key) const;

        void set(const std::string& key, std::string value) { attributes[key] = std::move(value); }

        bool operator==(const Record& other) const { return attributes == other.attributes; }
    };

    /** A document's content: a text body plus ordered collections of records, keyed by type
        (e.g. "FIELD", "FILEATTACHMENT"). Within a type, record order is significant. */
    class StructuredDocument {
      public:
        using RecordList = std::vector<Record>;

        StructuredDocument() = default;

        explicit StructuredDocument(std::string text) : _text(std::move(text)) {}

        [[nodiscard]] const std::string& text() const noexcept { return _text; }

        void setText(std::string text) { _text = std::move(text); }

        /** All record types present, with their records. */
        [[nodiscard]] const std::map<std::string, RecordList>& records() const noexcept { return _records; }

        /** The records of one type (empty if there are none). */
        [[nodiscard]] const RecordList& recordsOfType(const std::string& type) const;

        /** The record of `type` with instance `name` ("" for the unnamed record), or nullptr. */
        [[nodiscard]] const Record* find(const std::string& type, const std::string& name = "") const;

        /** Adds a record, replacing an existing record of the same type and name. */
        void put(const std::string& type, Record record);

        /** Appends a record without checking for duplicates. */
        void append(const std::string& type, Record record) { _records[type].push_back(std::move(record)); }

        /** Removes the record of `type` with instance `name`; returns false if there was none. */
        bool remove(const std::string& type, const std::string& name = "");

        /** Removes all records of a type. */
        void removeAll(const std::string& type) { _records.erase(type); }

        RecordList& mutableRecordsOfType(const std::string& type) { return _records[type]; }

        bool operator==(const StructuredDocument& other) const {
            return _text == other._text && _records == other._records;
        }

        bool operator!=(const StructuredDocument& other) const { return !(*this == other); }

        //////// JSON:

        /** Parses `{"text": "...", "meta": {"TYPE": [{"key": "value", ...}, ...]}}`.
            Non-string scalar attribute values are converted to their JSON form.
            Throws error(Fleece, kFLJSONError) or InvalidParameter on malformed input. */
        static StructuredDocument fromJSON(slice json);

        /** Encodes the document in the same JSON form. */
        [[nodiscard]] alloc_slice toJSON() const;

      private:
        std::string                       _text;
        std::map<std::string, RecordList> _records;
    };

}  // namespace versastore
