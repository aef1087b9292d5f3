//
// NameDictionary.hh
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
#include "DictionaryCache.hh"
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace versastore {
    class DataFile;

    /** Interns strings as stable integer ids (NIDs) in the `names` table.
        Ids are never renumbered or deleted. Sequence names ("00000000", "00000001", ...)
        always get the id `sequence + 1`; other new names get ids from kFirstDynamicNID upward. */
    class NameDictionary {
      public:
        using Cache = DictionaryCache<std::string, nameid_t>;

        /** Creates a dictionary on `db`. If `cache` is null a private one is created. */
        explicit NameDictionary(DataFile& db, std::shared_ptr<Cache> cache = nullptr);

        /** Returns the ids of all `names`, creating ids for names not seen before.
            New names are committed in their own transaction, so this must not be called while
            the DataFile is in a transaction. Concurrent creation of the same name by another
            connection is harmless: both converge on the same id. */
        std::map<std::string, nameid_t> resolve(const std::vector<std::string>& names);

        nameid_t resolve(const std::string& name);

        /** Returns the ids of those `names` that exist, without creating any. */
        std::map<std::string, nameid_t> lookup(const std::vector<std::string>& names);

        std::optional<nameid_t> lookup(const std::string& name);

        /** Returns the names of the given ids. Ids that don't exist are omitted. */
        std::map<nameid_t, std::string> namesOf(const std::vector<nameid_t>& ids);

        /** Returns the name with the given id; throws NotFound if there is none. */
        std::string nameOf(nameid_t id);

        [[nodiscard]] const std::shared_ptr<Cache>& cache() const noexcept { return _cache; }

        /** True if `name` is a sequence name: exactly eight decimal digits, whose id `seq + 1`
            stays below the catalog ids. */
        static bool isSequenceName(std::string_view name) noexcept;

        /** The sequence name for index `seq`. */
        static std::string sequenceName(unsigned seq);

      private:
        using NameMap = std::map<std::string, nameid_t>;

        void fetch(const std::vector<std::string>& names, NameMap& found);
        void insert(const std::vector<std::string>& names);

        DataFile&              _db;
        std::shared_ptr<Cache> _cache;
    };

}  // namespace versastore
