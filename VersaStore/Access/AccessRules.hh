//
// AccessRules.hh
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
    class DataFile;
    class NameDictionary;
    class StructuredDocument;

    /** The scope an access rule applies to. */
    enum class AccessScope : int { Root, Container, Document };

    /** How a rule decides. The numeric order is the evaluation order: an explicit deny beats an
        explicit allow, which beats the deny synthesized from an allow-list. */
    enum class Permission : int {
        Deny            = 1,
        Allow           = 2,
        SynthesizedDeny = 3,  ///< "Not in the allow-list"; its principal is "" (everyone)
    };

    /** One access rule. A principal of "" matches everyone. */
    struct AccessRule {
        AccessScope scope;
        std::string mode;  ///< Upper-case, e.g. "VIEW", "CHANGE"
        Permission  permission;
        std::string principal;

        bool operator==(const AccessRule& other) const {
            return scope == other.scope && mode == other.mode && permission == other.permission
                   && principal == other.principal;
        }
    };

    using AccessRuleSet = std::vector<AccessRule>;

    /** The one-letter code stored in the `context` column: R, W or T. */
    char ContextOf(AccessScope) noexcept;

    /** "root", "container" or "document". */
    const char* NameOfScope(AccessScope) noexcept;

    /** Collects a document's own preference settings: `   * Set NAME = value` lines in its
        text, then `_PREF_SET` records and PREFERENCE records of type Set (these override). */
    std::map<std::string, std::string> CollectPreferences(const StructuredDocument&);

    /** Splits a principal list on commas and whitespace, strips `Main.`, `%USERSWEB%.` and
        `%MAINWEB%.` prefixes, and drops entries that are empty or start with `%`. */
    std::vector<std::string> ParsePrincipalList(string_view);

    /** Turns preference settings named (ALLOW|DENY)(ROOT|WEB|TOPIC)MODE into rules:
        - An empty DENYTOPICmode means everyone is allowed: it becomes Allow "" and no deny.
        - Otherwise a non-empty ALLOWTOPICmode adds a SynthesizedDeny "".
        - A non-empty ALLOWWEBmode or ALLOWROOTmode adds a SynthesizedDeny "".
        Other empty lists produce no rules. */
    AccessRuleSet ExtractAccessRules(const std::map<std::string, std::string>& preferences);

    static inline AccessRuleSet ExtractAccessRules(const StructuredDocument& doc) {
        return ExtractAccessRules(CollectPreferences(doc));
    }

    /** Persists the rules captured from each latest revision in the `access` table. */
    class AccessRuleStore {
      public:
        /** Rules with their principal names resolved to ids. */
        struct Prepared {
            struct Row {
                AccessScope scope;
                std::string mode;
                Permission  permission;
                nameid_t    principal;
            };

            std::vector<Row> rows;
        };

        AccessRuleStore(DataFile&, NameDictionary&);

        /** Interns the principal names. Must be called outside a transaction. */
        Prepared prepare(const AccessRuleSet&);

        /** Replaces the rules of revision `fobid` of document `topicNID` in container `webId`. */
        void write(fobid_t webId, fobid_t fobid, nameid_t topicNID, const Prepared&);

        void remove(fobid_t fobid);

        void removeContainer(fobid_t webId);

        /** Moves rules to a document's new identity. */
        void setIdentity(fobid_t fobid, fobid_t webId, nameid_t topicNID);

      private:
        DataFile&       _db;
        NameDictionary& _names;
    };

}  // namespace versastore
