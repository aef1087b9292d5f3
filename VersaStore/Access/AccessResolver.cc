//
// AccessResolver.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "AccessResolver.hh"
#include "PrincipalDirectory.hh"
#include "NameDictionary.hh"
#include "RevisionStore.hh"
#include "DataFile.hh"
#include "SQLite_Internal.hh"
#include "StatementBuilder.hh"
#include "StringUtil.hh"
#include "SQLiteCpp/SQLiteCpp.h"
#include <deque>
#include <set>

using namespace std;

namespace versastore {

    AccessResolver::AccessResolver(DataFile& db, NameDictionary& names, RevisionStore& revisions,
                                   shared_ptr<PrincipalDirectory> directory, Options options)
        : Logging(AccessLog)
        , _db(db)
        , _names(names)
        , _revisions(revisions)
        , _directory(std::move(directory))
        , _options(std::move(options)) {}

    void AccessResolver::clearCache() {
        lock_guard<recursive_mutex> lock(_mutex);
        _members.clear();
        _containerDecisions.clear();
        _documentDecisions.clear();
    }

    // The name ids of the principal, all the groups it belongs to, and "" (everyone).
    // Names that were never interned can't appear in any rule, so they're just omitted.
    const AccessResolver::MemberNIDs& AccessResolver::membersOf(const string& principal) {
        if ( auto i = _members.find(principal); i != _members.end() ) return i->second;

        set<string>   identities{principal, ""};
        deque<string> pending{principal};
        while ( _directory && !pending.empty() ) {
            string current = std::move(pending.front());
            pending.pop_front();
            for ( auto& group : _directory->groupsOf(current) )
                if ( identities.insert(group).second ) pending.push_back(group);
        }

        MemberNIDs nids;
        for ( auto& [name, nid] : _names.lookup(vector<string>(identities.begin(), identities.end())) )
            nids.push_back(nid);
        logVerbose("%s has %zu identities, %zu named in rules", principal.c_str(), identities.size(), nids.size());
        return _members.emplace(principal, std::move(nids)).first->second;
    }

    optional<fobid_t> AccessResolver::containerFobid(const string& container) {
        auto nid = _names.lookup(container);
        if ( !nid ) return nullopt;
        return _revisions.findContainer(*nid);
    }

    // The strongest rule of one preferences document that applies to any of `members`.
    AccessResolver::Decision AccessResolver::queryRule(fobid_t container, nameid_t topicNID, char context,
                                                       const string& mode, const MemberNIDs& members) {
        if ( members.empty() ) return nullopt;
        SQLite::Statement stmt(_db.sqlDb(), "SELECT a.permission FROM access a "
                                            "JOIN revisions r ON r.fobid = a.fobId AND r.namespace = 0 "
                                            "WHERE a.webId = ? AND a.topicNID = ? AND a.context = ? AND a.mode = ? "
                                            "AND a.accessNID IN ("
                                                    + placeholders(members.size())
                                                    + ") "
                                                      "ORDER BY a.permission LIMIT 1");
        string contextStr(1, context);
        bindAll(stmt, {container, topicNID, contextStr, mode});
        int index = 5;
        for ( nameid_t nid : members ) stmt.bind(index++, (int64_t)nid);
        LogStatement(stmt);
        if ( stmt.executeStep() ) return Permission(stmt.getColumn(0).getInt());
        return nullopt;
    }

    AccessResolver::Decision AccessResolver::rootDecision(const string& mode, const MemberNIDs& members) {
        auto site = containerFobid(_options.siteContainer);
        auto doc  = _names.lookup(_options.sitePreferencesDocument);
        if ( !site || !doc ) return nullopt;
        return queryRule(*site, *doc, ContextOf(AccessScope::Root), mode, members);
    }

    AccessResolver::Decision AccessResolver::containerDecision(fobid_t container, const string& mode,
                                                               const string& principal, const MemberNIDs& members) {
        ScopeKey key{container, mode, principal};
        if ( auto i = _containerDecisions.find(key); i != _containerDecisions.end() ) return i->second;
        Decision decision;
        if ( auto doc = _names.lookup(_options.preferencesDocument) )
            decision = queryRule(container, *doc, ContextOf(AccessScope::Container), mode, members);
        _containerDecisions.emplace(key, decision);
        return decision;
    }

    AccessResolver::Decision AccessResolver::documentDecision(fobid_t container, nameid_t document,
                                                              const string& mode, const string& principal,
                                                              const MemberNIDs& members) {
        ScopeKey key{container, mode, principal};
        auto     i = _documentDecisions.find(key);
        if ( i == _documentDecisions.end() ) {
            // Load the decisions for every document in the container at once:
            map<nameid_t, Permission> decisions;
            if ( !members.empty() ) {
                SQLite::Statement stmt(_db.sqlDb(), "SELECT a.topicNID, a.permission FROM access a "
                                                    "JOIN revisions r ON r.fobid = a.fobId AND r.namespace = 0 "
                                                    "WHERE a.webId = ? AND a.context = 'T' AND a.mode = ? "
                                                    "AND a.accessNID IN ("
                                                            + placeholders(members.size())
                                                            + ") "
                                                              "ORDER BY a.topicNID, a.permission");
                stmt.bind(1, (int64_t)container);
                stmt.bind(2, mode);
                int index = 3;
                for ( nameid_t nid : members ) stmt.bind(index++, (int64_t)nid);
                LogStatement(stmt);
                while ( stmt.executeStep() ) {
                    // The first (strongest) row of each document wins:
                    decisions.emplace(stmt.getColumn(0).getInt64(), Permission(stmt.getColumn(1).getInt()));
                }
            }
            logVerbose("Loaded document rules of container %lld for %s: %zu documents", (long long)container,
                       principal.c_str(), decisions.size());
            i = _documentDecisions.emplace(key, std::move(decisions)).first;
        }
        if ( auto d = i->second.find(document); d != i->second.end() ) return d->second;
        return nullopt;
    }

    bool AccessResolver::decide(Decision decision, AccessScope scope, bool fallback) {
        if ( !decision ) return fallback;
        switch ( *decision ) {
            case Permission::Allow:
                return true;
            case Permission::Deny:
                _failure = format("access denied on %s", NameOfScope(scope));
                return false;
            case Permission::SynthesizedDeny:
                _failure = format("access not allowed on %s", NameOfScope(scope));
                return false;
        }
        return fallback;
    }

    bool AccessResolver::checkAccess(const string& principal, const string& modeArg, AccessScope scope,
                                     const DocumentIdentity& target) {
        lock_guard<recursive_mutex> lock(_mutex);
        _failure.clear();
        if ( _directory && _directory->isAdmin(principal) ) {
            logVerbose("%s is an administrator", principal.c_str());
            return true;
        }
        string mode = modeArg;
        for ( auto& c : mode ) c = char(toupper((unsigned char)c));

        const MemberNIDs& members = membersOf(principal);
        bool              result;
        if ( scope == AccessScope::Root ) {
            result = decide(rootDecision(mode, members), AccessScope::Root);
        } else {
            auto     container = containerFobid(target.container);
            Decision containerResult;
            if ( container ) containerResult = containerDecision(*container, mode, principal, members);
            if ( scope == AccessScope::Container ) {
                result = decide(containerResult, AccessScope::Container);
            } else {
                Decision documentResult;
                auto     docNID = _names.lookup(target.document);
                if ( container && docNID )
                    documentResult = documentDecision(*container, *docNID, mode, principal, members);
                if ( documentResult ) result = decide(documentResult, AccessScope::Document);
                else
                    result = decide(containerResult, AccessScope::Container);
            }
        }
        if ( result ) logVerbose("%s: %s access to %s permitted", principal.c_str(), mode.c_str(), NameOfScope(scope));
        else
            logInfo("%s: %s access to %s/%s: %s", principal.c_str(), mode.c_str(), target.container.c_str(),
                    target.document.c_str(), _failure.c_str());
        return result;
    }

}  // namespace versastore
