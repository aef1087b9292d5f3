//
// LockLeaseManager.hh
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
#include "DateTime.hh"
#include "DocumentIdentity.hh"
#include <memory>
#include <optional>

namespace SQLite {
    class Statement;
}

namespace versastore {
    class DataFile;
    class NameDictionary;

    /** An advisory, time-bounded editing reservation of a document. */
    struct Lease {
        std::string holder;
        timestamp_t taken{0};
        timestamp_t expires{0};

        [[nodiscard]] bool isExpired(timestamp_t now) const noexcept { return expires < now; }

        bool operator==(const Lease& other) const noexcept {
            return holder == other.holder && taken == other.taken && expires == other.expires;
        }
    };

    /** The outcome of trying to take a lock. If another holder has the document locked,
        `acquired` is false and `holder`/`since` describe the existing lock. */
    struct LockResult {
        bool        acquired{false};
        std::string holder;
        timestamp_t since{0};
    };

    /** Non-blocking advisory locks and informational leases, keyed by the name ids of a
        document's container and name. Neither is enforced by the store itself; conflicts are
        returned to the caller as data.

        The methods taking a DocumentIdentity manage their own transactions and must be called
        outside of one. The NID-level methods are for use inside a caller's transaction. */
    class LockLeaseManager {
      public:
        LockLeaseManager(DataFile&, NameDictionary&);
        ~LockLeaseManager();

        //////// LOCKS:

        /** Takes the lock on a document unless someone else holds it. Re-acquiring a lock one
            already holds refreshes its time. */
        LockResult acquireLock(const DocumentIdentity&, const std::string& holder, timestamp_t now = Now());

        /** Releases the lock if `holder` holds it. Returns false if it wasn't held by `holder`. */
        bool releaseLock(const DocumentIdentity&, const std::string& holder);

        /** The current lock on a document, if any, as (holder, time). */
        std::optional<LockResult> lockInfo(const DocumentIdentity&);

        /** Removes any lock on the document, regardless of holder. */
        void breakLock(const DocumentIdentity&);

        //////// LEASES:

        std::optional<Lease> getLease(const DocumentIdentity&);

        /** Stores a lease on the document, replacing any existing one; `nullopt` deletes it. */
        void setLease(const DocumentIdentity&, const std::optional<Lease>&);

        /** Deletes every lease whose expiry is before `now`. Returns the number deleted. */
        int removeExpiredLeases(timestamp_t now = Now());

        //////// NID LEVEL (inside a transaction):

        std::optional<Lease> leaseAt(nameid_t webNID, nameid_t topicNID);
        void                 deleteLease(nameid_t webNID, nameid_t topicNID);
        void                 moveLease(nameid_t fromWeb, nameid_t fromTopic, nameid_t toWeb, nameid_t toTopic);

      private:
        using NIDPair = std::pair<nameid_t, nameid_t>;

        std::optional<NIDPair> lookupNIDs(const DocumentIdentity&);
        NIDPair                resolveNIDs(const DocumentIdentity&);
        bool                   deleteLock(const NIDPair&, std::optional<nameid_t> holder);

        DataFile&                          _db;
        NameDictionary&                    _names;
        std::unique_ptr<SQLite::Statement> _leaseStmt;
    };

}  // namespace versastore
