//
// Store.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Store.hh"
#include "AccessResolver.hh"
#include "AttributeStore.hh"
#include "EmbeddedForm.hh"
#include "PrincipalDirectory.hh"
#include "DateTime.hh"
#include "Error.hh"
#include "StringUtil.hh"
#include <algorithm>

using namespace std;

namespace versastore {

    static constexpr const char* kTopicInfoType  = "TOPICINFO";
    static constexpr const char* kCreateInfoType = "CREATEINFO";

    Store::Store(const string& path, Options options, shared_ptr<PrincipalDirectory> directory,
                 const Caches& caches, const DataFile::Options* fileOptions)
        : Logging(DBLog)
        , _options(std::move(options))
        , _db(new DataFile(path, fileOptions))
        , _names(*_db, caches.names)
        , _fields(*_db, _names, caches.fields) {
        _revisions   = make_unique<RevisionStore>(*_db);
        _attributes  = make_unique<AttributeStore>(*_db, _names, _fields);
        _accessRules = make_unique<AccessRuleStore>(*_db, _names);
        _access      = make_unique<AccessResolver>(
                *_db, _names, *_revisions, std::move(directory),
                AccessResolver::Options{_options.preferencesDocument, _options.siteContainer,
                                        _options.sitePreferencesDocument});
        _locks  = make_unique<LockLeaseManager>(*_db, _names);
        _search = make_unique<TextSearch>(*_db, _names, *_revisions);
        logInfo("Opened %s", path.c_str());
    }

    Store::~Store() = default;

#pragma mark - LOOKUP:

    optional<Store::DocNIDs> Store::lookupNIDs(const DocumentIdentity& id) {
        auto nids = _names.lookup(vector<string>{id.container, id.document});
        auto web = nids.find(id.container), topic = nids.find(id.document);
        if ( web == nids.end() || topic == nids.end() ) return nullopt;
        return DocNIDs{web->second, topic->second};
    }

    optional<fobid_t> Store::containerFobid(const string& container) {
        auto nid = _names.lookup(container);
        if ( !nid ) return nullopt;
        return _revisions->findContainer(*nid);
    }

    // Finds a document's container and latest revision, if it exists.
    optional<Store::Located> Store::locate(const DocumentIdentity& id) {
        auto nids = lookupNIDs(id);
        if ( !nids ) return nullopt;
        auto container = _revisions->findContainer(nids->container);
        if ( !container ) return nullopt;
        auto latest = _revisions->latest(*container, nids->document);
        if ( !latest ) return nullopt;
        return Located{*container, *nids, *latest};
    }

    vector<RevisionRow> Store::historyOf(const DocumentIdentity& id) {
        auto nids = lookupNIDs(id);
        if ( !nids ) return {};
        auto container = _revisions->findContainer(nids->container);
        if ( !container ) return {};
        return _revisions->history(*container, nids->document);
    }

    string Store::nameOrEmpty(nameid_t nid) { return nid ? _names.nameOf(nid) : string(); }

    Record Store::topicInfoOf(const RevisionRow& row) {
        Record info;
        info.set("author", nameOrEmpty(row.author));
        info.set("date", to_string(row.date));
        info.set("version", to_string(row.version));
        info.set("comment", nameOrEmpty(row.comment));
        if ( row.reprev ) info.set("reprev", to_string(row.reprev));
        return info;
    }

    StructuredDocument Store::contentOf(const RevisionRow& row) {
        StructuredDocument doc = _attributes->read(row.fobid);
        doc.put(kTopicInfoType, topicInfoOf(row));
        if ( auto first = _revisions->atVersion(row.webId, row.nid, 1); first && first->version == 1 ) {
            Record create;
            create.set("author", nameOrEmpty(first->author));
            create.set("date", to_string(first->date));
            create.set("version", "1");
            doc.put(kCreateInfoType, std::move(create));
        }
        return doc;
    }

#pragma mark - SAVE:

    version_t Store::save(const DocumentIdentity& id, const StructuredDocument& doc, const string& author,
                          const SaveOptions& options) {
        if ( !id.isValid() ) {
            warn("Ignoring save of invalid document identity '%s'", id.description().c_str());
            return 0;
        }

        // Intern names and fields first; those inserts commit on their own.
        auto attributes = _attributes->prepare(doc);
        auto rules      = _accessRules->prepare(ExtractAccessRules(doc));
        auto nids       = _names.resolve(vector<string>{id.container, id.document, author, options.comment});
        nameid_t    webNID = nids.at(id.container), topicNID = nids.at(id.document);
        timestamp_t date   = options.forceTimestamp.value_or(Now());

        ExclusiveTransaction t(*_db);
        fobid_t     container = _revisions->ensureContainer(webNID);
        auto        latest    = _revisions->latest(container, topicNID);
        bool        asOther   = false;
        RevisionRow row;
        row.webId   = container;
        row.nid     = topicNID;
        row.date    = date;
        row.author  = nids.at(author);
        row.comment = nids.at(options.comment);

        if ( options.amendInPlace && latest ) {
            row.fobid   = latest->fobid;
            row.version = latest->version;
            row.reprev  = latest->version;
            _revisions->amend(row.fobid, row.author, row.comment, row.date, row.reprev);
            _attributes->remove(row.fobid);
            _accessRules->remove(row.fobid);
        } else {
            if ( options.explicitVersion ) {
                row.version = *options.explicitVersion;
                asOther     = options.explicitNamespaceOther;
                if ( row.version < 1 ) error::_throw(error::InvalidParameter, "Invalid version %lld", (long long)row.version);
                if ( auto existing = _revisions->atVersion(container, topicNID, row.version);
                     existing && existing->version == row.version )
                    error::_throw(error::Conflict, "%s already has version %lld", id.description().c_str(),
                                  (long long)row.version);
                if ( !asOther && latest && latest->version > row.version )
                    error::_throw(error::Conflict, "%s already has a later version %lld", id.description().c_str(),
                                  (long long)latest->version);
            } else {
                row.version = _revisions->newestVersion(container, topicNID) + 1;
            }

            if ( !asOther ) {
                if ( latest ) {
                    _revisions->retag(latest->fobid, Namespace::Other);
                    _attributes->setOther(latest->fobid, true);
                    _accessRules->remove(latest->fobid);
                } else if ( auto placeholder = _revisions->dangling(container, topicNID) ) {
                    _revisions->remove(placeholder->fobid);
                }
            }
            row.ns    = asOther ? Namespace::Other : Namespace::Latest;
            row.fobid = _revisions->insert(row);
        }

        _attributes->write(container, row.fobid, attributes, asOther);
        Record topicInfo = topicInfoOf(row);
        topicInfo.set("author", author);
        topicInfo.set("comment", options.comment);
        _attributes->writeText(container, row.fobid, EmbeddedForm::render(doc, &topicInfo), asOther);
        if ( !asOther ) _accessRules->write(container, row.fobid, topicNID, rules);
        t.commit();

        logInfo("Saved %s version %lld by %s%s", id.description().c_str(), (long long)row.version, author.c_str(),
                (options.amendInPlace && latest ? " (amended)" : ""));
        return row.version;
    }

#pragma mark - READ:

    ReadResult Store::read(const DocumentIdentity& id, optional<version_t> version) {
        ReadOnlyTransaction   snapshot(*_db);
        auto                  nids = lookupNIDs(id);
        optional<RevisionRow> row;
        if ( nids ) {
            if ( auto container = _revisions->findContainer(nids->container) ) {
                if ( version ) row = _revisions->atVersion(*container, nids->document, *version);
                else
                    row = _revisions->latest(*container, nids->document);
            }
        }
        if ( !row ) {
            if ( version )
                error::_throw(error::NotFound, "%s has no version %lld", id.description().c_str(), (long long)*version);
            error::_throw(error::NotFound, "No document %s", id.description().c_str());
        }

        ReadResult result;
        result.doc      = contentOf(*row);
        result.version  = row->version;
        result.isLatest = (row->ns == Namespace::Latest);
        return result;
    }

    map<string, StructuredDocument> Store::readLatestMany(const string& containerName, const vector<string>& documents) {
        map<string, StructuredDocument> docs;
        ReadOnlyTransaction             snapshot(*_db);
        auto                            container = containerFobid(containerName);
        if ( !container ) return docs;
        vector<nameid_t> nids;
        for ( auto& [name, nid] : _names.lookup(documents) ) nids.push_back(nid);
        auto rows  = _revisions->latestOf(*container, nids);
        vector<nameid_t> rowNIDs;
        for ( auto& row : rows ) rowNIDs.push_back(row.nid);
        auto names = _names.namesOf(rowNIDs);
        for ( auto& row : rows ) docs.emplace(names.at(row.nid), contentOf(row));
        return docs;
    }

    bool Store::exists(const DocumentIdentity& id) { return locate(id).has_value(); }

#pragma mark - ROLLBACK & RENAME:

    version_t Store::rollback(const DocumentIdentity& id, const string& author) {
        auto located = locate(id);
        if ( !located ) error::_throw(error::NotFound, "No document %s", id.description().c_str());
        if ( located->latest.version == 1 )
            error::_throw(error::CantRollBackFirstRevision, "%s is at version 1", id.description().c_str());
        auto prior = _revisions->newestOther(located->container, located->nids.document);
        if ( !prior ) error::_throw(error::NoPriorRevision, "%s has no prior revision", id.description().c_str());

        // The access rules of the revision being restored become current again:
        auto rules = _accessRules->prepare(ExtractAccessRules(_attributes->read(prior->fobid)));

        ExclusiveTransaction t(*_db);
        auto                 latest = _revisions->latest(located->container, located->nids.document);
        auto                 other  = _revisions->newestOther(located->container, located->nids.document);
        if ( !latest || latest->fobid != located->latest.fobid || !other || other->fobid != prior->fobid )
            error::_throw(error::Conflict, "%s changed during rollback", id.description().c_str());

        purgeRevision(latest->fobid);
        _revisions->retag(prior->fobid, Namespace::Latest);
        _attributes->setOther(prior->fobid, false);
        _accessRules->write(located->container, prior->fobid, located->nids.document, rules);
        t.commit();

        logInfo("%s rolled back %s from version %lld to %lld", author.c_str(), id.description().c_str(),
                (long long)latest->version, (long long)prior->version);
        return prior->version;
    }

    RenameResult Store::rename(const DocumentIdentity& from, const DocumentIdentity& to, const RenameOptions& options) {
        if ( !to.isValid() )
            error::_throw(error::BadDocumentIdentity, "Invalid document identity '%s'", to.description().c_str());
        auto located = locate(from);
        if ( !located ) error::_throw(error::NotFound, "No document %s", from.description().c_str());
        auto nids = _names.resolve(vector<string>{to.container, to.document});
        DocNIDs target{nids.at(to.container), nids.at(to.document)};

        RenameResult         result;
        timestamp_t          now = Now();
        ExclusiveTransaction t(*_db);
        auto lease = _locks->leaseAt(located->nids.container, located->nids.document);
        if ( lease && !lease->isExpired(now) && lease->holder != options.requester && !options.ignoreLeases ) {
            t.abort();
            logInfo("Not renaming %s: leased by %s", from.description().c_str(), lease->holder.c_str());
            result.conflictingLease = lease;
            return result;
        }

        fobid_t container = _revisions->ensureContainer(target.container);
        if ( !_revisions->history(container, target.document).empty() )
            error::_throw(error::Conflict, "%s already exists", to.description().c_str());
        fobid_t fobid = located->latest.fobid;
        _revisions->setIdentity(fobid, container, target.document);
        _accessRules->setIdentity(fobid, container, target.document);
        if ( container != located->container ) _attributes->moveTo(fobid, container);
        if ( lease ) {
            if ( lease->isExpired(now) ) _locks->deleteLease(located->nids.container, located->nids.document);
            else
                _locks->moveLease(located->nids.container, located->nids.document, target.container, target.document);
        }
        t.commit();

        logInfo("Renamed %s to %s", from.description().c_str(), to.description().c_str());
        result.renamed = true;
        return result;
    }

#pragma mark - RESERVE & REMOVE:

    void Store::reserve(const DocumentIdentity& id) {
        if ( !id.isValid() )
            error::_throw(error::BadDocumentIdentity, "Invalid document identity '%s'", id.description().c_str());
        auto nids = _names.resolve(vector<string>{id.container, id.document});

        ExclusiveTransaction t(*_db);
        fobid_t container = _revisions->ensureContainer(nids.at(id.container));
        nameid_t topicNID = nids.at(id.document);
        if ( !_revisions->latest(container, topicNID) && !_revisions->dangling(container, topicNID) ) {
            RevisionRow row;
            row.ns      = Namespace::Dangling;
            row.webId   = container;
            row.nid     = topicNID;
            row.version = 0;
            row.date    = Now();
            _revisions->insert(row);
            logVerbose("Reserved %s", id.description().c_str());
        }
        t.commit();
    }

    void Store::purgeRevision(fobid_t fobid) {
        _attributes->remove(fobid);
        _accessRules->remove(fobid);
        _revisions->remove(fobid);
    }

    bool Store::remove(const DocumentIdentity& id) {
        auto nids = lookupNIDs(id);
        if ( !nids ) return false;
        ExclusiveTransaction t(*_db);
        auto                 container = _revisions->findContainer(nids->container);
        vector<fobid_t>      fobids;
        if ( container ) fobids = _revisions->allRevisions(*container, nids->document);
        for ( fobid_t fobid : fobids ) purgeRevision(fobid);
        t.commit();
        if ( !fobids.empty() ) logInfo("Removed %s (%zu revisions)", id.description().c_str(), fobids.size());
        return !fobids.empty();
    }

#pragma mark - HISTORY:

    vector<version_t> Store::revisionHistory(const DocumentIdentity& id) {
        vector<version_t> versions;
        for ( auto& row : historyOf(id) ) versions.push_back(row.version);
        return versions;
    }

    version_t Store::nextRevision(const DocumentIdentity& id) {
        auto located = locate(id);
        return located ? located->latest.version + 1 : 1;
    }

    optional<version_t> Store::revisionAtTime(const DocumentIdentity& id, timestamp_t time) {
        auto nids = lookupNIDs(id);
        if ( !nids ) return nullopt;
        auto container = _revisions->findContainer(nids->container);
        if ( !container ) return nullopt;
        if ( auto row = _revisions->atTime(*container, nids->document, time) ) return row->version;
        return nullopt;
    }

    optional<VersionInfo> Store::versionInfo(const DocumentIdentity& id, optional<version_t> version) {
        auto located = locate(id);
        if ( !located ) return nullopt;
        optional<RevisionRow> row = located->latest;
        // An out-of-range version means the latest one.
        if ( version && *version >= 1 && *version < located->latest.version )
            row = _revisions->atVersion(located->container, located->nids.document, *version);
        if ( !row ) return nullopt;
        VersionInfo info;
        info.version = row->version;
        info.date    = row->date;
        info.author  = nameOrEmpty(row->author);
        info.comment = nameOrEmpty(row->comment);
        info.reprev  = row->reprev;
        return info;
    }

    size_t Store::revisionCount(const DocumentIdentity& id) { return historyOf(id).size(); }

#pragma mark - CONTAINERS:

    vector<string> Store::enumerateDocuments(const string& containerName) {
        vector<string> docs;
        if ( auto container = containerFobid(containerName) ) {
            for ( auto& [nid, name] : _names.namesOf(_revisions->latestNames(*container)) ) docs.push_back(name);
            sort(docs.begin(), docs.end());
        }
        return docs;
    }

    vector<string> Store::enumerateContainers(const string& parent, bool recursive) {
        vector<string> result;
        auto           prefsNID = _names.lookup(_options.preferencesDocument);
        if ( !prefsNID ) return result;

        string prefix = parent.empty() ? "" : parent + "/";
        vector<nameid_t> listed;
        for ( nameid_t nid : _revisions->containerNames() ) {
            auto fobid = _revisions->findContainer(nid);
            if ( fobid && _revisions->latest(*fobid, *prefsNID) ) listed.push_back(nid);
        }
        for ( auto& [nid, name] : _names.namesOf(listed) ) {
            if ( !hasPrefix(name, prefix) || name.size() == prefix.size() ) continue;
            if ( !recursive && name.find('/', prefix.size()) != string::npos ) continue;
            result.push_back(name);
        }
        sort(result.begin(), result.end());
        return result;
    }

    bool Store::containerExists(const string& container) {
        return exists(DocumentIdentity{container, _options.preferencesDocument});
    }

    void Store::renameContainer(const string& from, const string& to) {
        if ( !IsValidItemName(to) ) error::_throw(error::BadDocumentIdentity, "Invalid container name '%s'", to.c_str());
        auto container = containerFobid(from);
        if ( !container ) error::_throw(error::NotFound, "No container %s", from.c_str());
        nameid_t newNID = _names.resolve(to);
        ExclusiveTransaction t(*_db);
        _revisions->renameContainer(*container, newNID);
        t.commit();
        logInfo("Renamed container %s to %s", from.c_str(), to.c_str());
    }

    void Store::removeContainer(const string& containerName) {
        auto container = containerFobid(containerName);
        if ( !container ) return;
        ExclusiveTransaction t(*_db);
        _attributes->removeContainer(*container);
        _accessRules->removeContainer(*container);
        _revisions->removeAllIn(*container);
        _revisions->removeContainer(*container);
        t.commit();
        _access->clearCache();
        logInfo("Removed container %s", containerName.c_str());
    }

#pragma mark - SEARCH & ACCESS:

    SearchResults Store::textSearch(const string& pattern, const string& container, const SearchOptions& options,
                                    const optional<vector<string>>& candidates) {
        return _search->search(pattern, container, options, candidates);
    }

    bool Store::checkAccess(const string& principal, const string& mode, AccessScope scope,
                            const DocumentIdentity& target) {
        return _access->checkAccess(principal, mode, scope, target);
    }

    const string& Store::accessFailure() const { return _access->failure(); }

    void Store::clearAccessCache() { _access->clearCache(); }

    Lease Store::takeLease(const DocumentIdentity& id, const string& holder) {
        Lease lease;
        lease.holder  = holder;
        lease.taken   = Now();
        lease.expires = lease.taken + _options.leaseDuration;
        _locks->setLease(id, lease);
        return lease;
    }

}  // namespace versastore
