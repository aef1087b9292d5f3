//
// DictionaryCache.hh
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
#include <map>
#include <mutex>
#include <optional>

namespace versastore {

    /** Thread-safe in-memory cache of a dictionary table mapping keys to ids and back.
        Entries are never invalidated, since dictionary ids are immutable once assigned.
        Only existing ids are cached: another connection may insert a missing key at any time.
        One instance can be shared (via shared_ptr) by all dictionaries on the same database. */
    template <class KEY, class ID>
    class DictionaryCache {
      public:
        std::optional<ID> idOf(const KEY& key) const {
            std::lock_guard<std::mutex> lock(_mutex);
            if ( auto i = _ids.find(key); i != _ids.end() ) return i->second;
            return std::nullopt;
        }

        std::optional<KEY> keyOf(ID id) const {
            std::lock_guard<std::mutex> lock(_mutex);
            if ( auto i = _keys.find(id); i != _keys.end() ) return i->second;
            return std::nullopt;
        }

        void add(const KEY& key, ID id) {
            std::lock_guard<std::mutex> lock(_mutex);
            _ids.emplace(key, id);
            _keys.emplace(id, key);
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _ids.size();
        }

      private:
        mutable std::mutex _mutex;
        std::map<KEY, ID>  _ids;
        std::map<ID, KEY>  _keys;
    };

}  // namespace versastore
