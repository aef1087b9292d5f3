//
// AccessRules.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "AccessRules.hh"
#include "Catalog.hh"
#include "DataFile.hh"
#include "NameDictionary.hh"
#include "SQLite_Internal.hh"
#include "StatementBuilder.hh"
#include "StructuredDocument.hh"
#include "Error.hh"
#include "StringUtil.hh"
#include "SQLiteCpp/SQLiteCpp.h"
#include <optional>
#include <regex>
#include <set>

using namespace std;

namespace versastore {

    char ContextOf(AccessScope scope) noexcept {
        static constexpr char kContexts[] = {'R', 'W', 'T'};
        return kContexts[int(scope)];
    }

    const char* NameOfScope(AccessScope scope) noexcept {
        static constexpr const char* kNames[] = {"root", "container", "document"};
        return kNames[int(scope)];
    }

#pragma mark - EXTRACTION:

    map<string, string> CollectPreferences(const StructuredDocument& doc) {
        static const regex kSetLine(R"(^(?:\t|   )+\*\s+Set\s+([A-Za-z_][A-Za-z0-9_]*)\s*=\s*(.*)$)");

        map<string, string> prefs;
        split(doc.text(), "\n", [&](string_view line) {
            cmatch m;
            if ( regex_match(line.data(), line.data() + line.size(), m, kSetLine) ) {
                string value = m[2].str();
                chomp(value, '\r');
                prefs[m[1].str()] = std::move(value);
            }
        });

        for ( auto& record : doc.recordsOfType(catalog::kPreference) ) {
            auto type = record.get("type");
            if ( type && !type->empty() && *type != "Set" ) continue;
            auto value                = record.get("value");
            prefs[record.name()] = value ? *value : "";
        }
        for ( auto& record : doc.recordsOfType(catalog::kPrefSet) ) {
            auto value                = record.get("value");
            prefs[record.name()] = value ? *value : "";
        }
        return prefs;
    }

    vector<string> ParsePrincipalList(string_view list) {
        static const regex kSeparators(R"([,\s]+)");
        static const regex kPrefix(R"(^(Main|%USERSWEB%|%MAINWEB%)\.)");

        vector<string> result;
        set<string>    seen;
        string         str(list);
        for ( sregex_token_iterator i(str.begin(), str.end(), kSeparators, -1), end; i != end; ++i ) {
            string entry = regex_replace(i->str(), kPrefix, "", regex_constants::format_first_only);
            if ( entry.empty() || entry[0] == '%' || isspace((unsigned char)entry[0]) ) continue;
            if ( seen.insert(entry).second ) result.push_back(std::move(entry));
        }
        return result;
    }

    AccessRuleSet ExtractAccessRules(const map<string, string>& preferences) {
        static const regex kRuleName(R"(^(ALLOW|DENY)(ROOT|WEB|TOPIC)([A-Z]+)$)");

        // mode -> scope -> {allow, deny}; a missing entry means "not set", an empty one "set to nothing".
        struct Lists {
            optional<vector<string>> allow, deny;
        };

        map<string, map<AccessScope, Lists>> acl;
        for ( auto& [name, value] : preferences ) {
            smatch m;
            if ( !regex_match(name, m, kRuleName) ) continue;
            AccessScope scope = m[2] == "ROOT" ? AccessScope::Root
                                : m[2] == "WEB" ? AccessScope::Container
                                                : AccessScope::Document;
            auto& lists = acl[m[3].str()][scope];
            (m[1] == "ALLOW" ? lists.allow : lists.deny) = ParsePrincipalList(value);
        }

        AccessRuleSet rules;
        for ( auto& modeEntry : acl ) {
            const string& mode = modeEntry.first;
            for ( auto& [scope, lists] : modeEntry.second ) {
                if ( scope == AccessScope::Document && lists.deny && lists.deny->empty() ) {
                    // An empty DENYTOPIC lets everyone in, whatever ALLOWTOPIC says:
                    rules.push_back({scope, mode, Permission::Allow, ""});
                    continue;
                }
                if ( lists.deny )
                    for ( auto& p : *lists.deny ) rules.push_back({scope, mode, Permission::Deny, p});
                if ( lists.allow && !lists.allow->empty() ) {
                    for ( auto& p : *lists.allow ) rules.push_back({scope, mode, Permission::Allow, p});
                    rules.push_back({scope, mode, Permission::SynthesizedDeny, ""});
                }
            }
        }
        return rules;
    }

#pragma mark - ACCESS RULE STORE:

    AccessRuleStore::AccessRuleStore(DataFile& db, NameDictionary& names) : _db(db), _names(names) {}

    AccessRuleStore::Prepared AccessRuleStore::prepare(const AccessRuleSet& rules) {
        vector<string> principals;
        for ( auto& rule : rules ) principals.push_back(rule.principal);
        auto     nids = _names.resolve(principals);
        Prepared prepared;
        for ( auto& rule : rules )
            prepared.rows.push_back({rule.scope, rule.mode, rule.permission, nids.at(rule.principal)});
        return prepared;
    }

    void AccessRuleStore::write(fobid_t webId, fobid_t fobid, nameid_t topicNID, const Prepared& prepared) {
        remove(fobid);
        BulkInsert insert(_db, "access", {"webId", "fobId", "permission", "context", "mode", "topicNID", "accessNID"});
        for ( auto& row : prepared.rows ) {
            insert.add({webId, fobid, int64_t(row.permission), string(1, ContextOf(row.scope)), row.mode, topicNID,
                        row.principal});
        }
        insert.flush();
    }

    void AccessRuleStore::remove(fobid_t fobid) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        SQLite::Statement stmt(_db.sqlDb(), "DELETE FROM access WHERE fobId = ?");
        stmt.bind(1, (int64_t)fobid);
        LogStatement(stmt);
        stmt.exec();
    }

    void AccessRuleStore::removeContainer(fobid_t webId) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        SQLite::Statement stmt(_db.sqlDb(), "DELETE FROM access WHERE webId = ?");
        stmt.bind(1, (int64_t)webId);
        LogStatement(stmt);
        stmt.exec();
    }

    void AccessRuleStore::setIdentity(fobid_t fobid, fobid_t webId, nameid_t topicNID) {
        if ( !_db.inTransaction() ) error::_throw(error::NotInTransaction);
        SQLite::Statement stmt(_db.sqlDb(), "UPDATE access SET webId = ?, topicNID = ? WHERE fobId = ?");
        bindAll(stmt, {webId, topicNID, fobid});
        LogStatement(stmt);
        stmt.exec();
    }

}  // namespace versastore
