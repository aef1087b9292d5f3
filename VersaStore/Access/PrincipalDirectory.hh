//
// PrincipalDirectory.hh
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
#include <mutex>
#include <set>
#include <vector>

namespace versastore {

    /** The host's user and group registry, as seen by the access resolver. */
    class PrincipalDirectory {
      public:
        virtual ~PrincipalDirectory() = default;

        /** True if `principal` bypasses all access checks. */
        virtual bool isAdmin(const std::string& principal) const = 0;

        /** The groups `principal` (a user or a group) is a direct member of. */
        virtual std::vector<std::string> groupsOf(const std::string& principal) const = 0;
    };

    /** A PrincipalDirectory held in memory, populated by the host (and by tests). */
    class MemoryPrincipalDirectory : public PrincipalDirectory {
      public:
        /** Makes each of `members` (users or groups) a direct member of `group`. */
        void addToGroup(const std::string& group, const std::vector<std::string>& members);

        void addAdmin(const std::string& principal);

        bool                     isAdmin(const std::string& principal) const override;
        std::vector<std::string> groupsOf(const std::string& principal) const override;

      private:
        mutable std::mutex                          _mutex;
        std::map<std::string, std::set<std::string>> _groupsOf;
        std::set<std::string>                        _admins;
    };

}  // namespace versastore
