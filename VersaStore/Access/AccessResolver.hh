//
// AccessResolver.hh
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
#include "AccessRules.hh"
#include "DocumentIdentity.hh"
#include "Logging.hh"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <tuple>
#include <vector>

namespace versastore {
    class DataFile;
    class NameDictionary;
    class PrincipalDirectory;
    class RevisionStore;

    /** Decides whether a principal may access the root, a container, or a document, from the
        rules captured in the `access` table when preference documents were saved.

        Evaluation, first decisive result wins:
        1. Administrators are always permitted.
        2. At root scope: the root rules of the site preferences document.
        3. The container rules of the container's preferences document (memoized per
           container, mode and principal). At container scope this is the answer.
        4. At document scope: the document's own rules, loaded for every document of the
           container in one query (memoized per container, mode and principal). If the
           document has no applicable rule, the container's result applies.
        5. Otherwise access is permitted.
        A principal's identity set is itself, its groups (transitively), and "" (everyone).

        The memoized results are not invalidated by saves; create a new resolver (e.g. per
        request) to see changed rules. */
    class AccessResolver : public Logging {
      public:
        struct Options {
            std::string preferencesDocument     = "WebPreferences";
            std::string siteContainer           = "System";
            std::string sitePreferencesDocument = "DefaultPreferences";
        };

        AccessResolver(DataFile&, NameDictionary&, RevisionStore&, std::shared_ptr<PrincipalDirectory>,
                       Options options);

        /** Returns true if `principal` has `mode` access at `scope`. For Root scope `target` is
            ignored; for Container scope only its container is used. */
        bool checkAccess(const std::string& principal, const std::string& mode, AccessScope scope,
                         const DocumentIdentity& target = {});

        /** Why the last checkAccess call returned false; empty after a permitted check. */
        [[nodiscard]] const std::string& failure() const noexcept { return _failure; }

        /** Forgets all memoized results. */
        void clearCache();

      protected:
        std::string loggingClassName() const override { return "Access"; }

      private:
        using Decision   = std::optional<Permission>;
        using ScopeKey   = std::tuple<fobid_t, std::string, std::string>;  // container, mode, principal
        using MemberNIDs = std::vector<nameid_t>;

        const MemberNIDs& membersOf(const std::string& principal);
        Decision          rootDecision(const std::string& mode, const MemberNIDs&);
        Decision          containerDecision(fobid_t container, const std::string& mode, const std::string& principal,
                                            const MemberNIDs&);
        Decision          documentDecision(fobid_t container, nameid_t document, const std::string& mode,
                                           const std::string& principal, const MemberNIDs&);
        Decision          queryRule(fobid_t container, nameid_t topicNID, char context, const std::string& mode,
                                    const MemberNIDs&);
        std::optional<fobid_t> containerFobid(const std::string& container);
        bool              decide(Decision, AccessScope, bool fallback = true);

        DataFile&                                         _db;
        NameDictionary&                                   _names;
        RevisionStore&                                    _revisions;
        std::shared_ptr<PrincipalDirectory>               _directory;
        Options const                                     _options;
        std::recursive_mutex                              _mutex;
        std::map<std::string, MemberNIDs>                 _members;
        std::map<ScopeKey, Decision>                      _containerDecisions;
        std::map<ScopeKey, std::map<nameid_t, Permission>> _documentDecisions;
        std::string                                       _failure;
    };

}  // namespace versastore
