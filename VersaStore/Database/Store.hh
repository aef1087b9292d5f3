//
// Store.hh
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
#include "AccessRules.hh"
#include "DataFile.hh"
#include "DocumentIdentity.hh"
#include "FieldDictionary.hh"
#include "LockLeaseManager.hh"
#include "Logging.hh"
#include "NameDictionary.hh"
#include "RevisionStore.hh"
#include "StructuredDocument.hh"
#include "TextSearch.hh"
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace versastore {
    class AccessResolver;
    class AttributeStore;
    class PrincipalDirectory;

    struct SaveOptions {
        std::optional<timestamp_t> forceTimestamp;          ///< Revision date; default is now
        bool                       amendInPlace{false};     ///< Overwrite the latest revision, same version
        std::optional<version_t>   explicitVersion;         ///< Import a specific version (history import)
        bool                       explicitNamespaceOther{false};  ///< Import it as history, not as latest
        std::string                comment;
    };

    struct ReadResult {
        StructuredDocument doc;
        version_t          version{0};
        bool               isLatest{false};
    };

    /** Metadata of one revision. */
    struct VersionInfo {
        version_t   version{0};
        timestamp_t date{0};
        std::string author;
        std::string comment;
        version_t   reprev{0};
    };

    struct RenameOptions {
        std::string requester;             ///< Whoever is renaming; their own lease never blocks it
        bool        ignoreLeases{false};   ///< Rename even if someone else holds a lease
    };

    struct RenameResult {
        bool                 renamed{false};
        std::optional<Lease> conflictingLease;  ///< Set if another holder's lease blocked the rename
    };

    /** The top-level API: a revisioned store of structured documents grouped in containers,
        with access control, locks and leases, enumeration and text search.

        A Store is not thread-safe; open one per thread (or per request) on the same file.
        Stores created with the same Caches share the name and field dictionary caches. */
    class Store : public Logging {
      public:
        struct Options {
            std::string preferencesDocument     = "WebPreferences";
            std::string siteContainer           = "System";
            std::string sitePreferencesDocument = "DefaultPreferences";
            timestamp_t leaseDuration           = 3600;  ///< Seconds, used by takeLease()
        };

        /** Dictionary caches that can be shared between Stores on the same file. */
        struct Caches {
            std::shared_ptr<NameDictionary::Cache>  names  = std::make_shared<NameDictionary::Cache>();
            std::shared_ptr<FieldDictionary::Cache> fields = std::make_shared<FieldDictionary::Cache>();
        };

        Store(const std::string& path, Options options = {},
              std::shared_ptr<PrincipalDirectory> directory = nullptr, const Caches& caches = {},
              const DataFile::Options* fileOptions = nullptr);
        ~Store() override;

        [[nodiscard]] const Options& options() const noexcept { return _options; }

        [[nodiscard]] DataFile& dataFile() noexcept { return *_db; }

        //////// DOCUMENTS:

        /** Saves a new revision (or amends the latest one) and returns its version number.
            An invalid identity is ignored, returning 0. */
        version_t save(const DocumentIdentity&, const StructuredDocument&, const std::string& author,
                       const SaveOptions& = {});

        /** Reads the latest revision, or the oldest one whose version is >= `version`.
            Throws NotFound if there is none. */
        ReadResult read(const DocumentIdentity&, std::optional<version_t> version = std::nullopt);

        /** Reads the latest revisions of several documents of a container; missing ones are
            left out. */
        std::map<std::string, StructuredDocument> readLatestMany(const std::string& container,
                                                                 const std::vector<std::string>& documents);

        /** Discards the latest revision, making the previous one latest again. Returns the
            version that is now latest. */
        version_t rollback(const DocumentIdentity&, const std::string& author);

        /** Moves a document to a new identity. Only the latest revision moves; history stays
            with the old identity. */
        RenameResult rename(const DocumentIdentity& from, const DocumentIdentity& to, const RenameOptions& = {});

        [[nodiscard]] bool exists(const DocumentIdentity&);

        /** Creates a placeholder for a document that hasn't been saved yet. */
        void reserve(const DocumentIdentity&);

        /** Deletes a document and all its history. Returns false if it didn't exist. */
        bool remove(const DocumentIdentity&);

        //////// HISTORY:

        /** All versions of a document, newest first. */
        std::vector<version_t>     revisionHistory(const DocumentIdentity&);
        version_t                  nextRevision(const DocumentIdentity&);
        std::optional<version_t>   revisionAtTime(const DocumentIdentity&, timestamp_t);
        std::optional<VersionInfo> versionInfo(const DocumentIdentity&,
                                               std::optional<version_t> version = std::nullopt);
        size_t                     revisionCount(const DocumentIdentity&);

        //////// CONTAINERS:

        /** Names of the documents in a container, sorted. */
        std::vector<std::string> enumerateDocuments(const std::string& container);

        /** Names of the containers directly below `parent` ("" for the top level), or all
            descendants if `recursive`. Only containers with a preferences document are listed. */
        std::vector<std::string> enumerateContainers(const std::string& parent = "", bool recursive = false);

        [[nodiscard]] bool containerExists(const std::string& container);

        void renameContainer(const std::string& from, const std::string& to);

        /** Deletes a container and every document in it. */
        void removeContainer(const std::string& container);

        //////// SEARCH:

        SearchResults textSearch(const std::string& pattern, const std::string& container,
                                 const SearchOptions& = {},
                                 const std::optional<std::vector<std::string>>& candidates = std::nullopt);

        //////// ACCESS:

        bool checkAccess(const std::string& principal, const std::string& mode, AccessScope,
                         const DocumentIdentity& target = {});

        /** The reason the last checkAccess call returned false. */
        [[nodiscard]] const std::string& accessFailure() const;

        /** Forgets memoized access decisions, e.g. after saving preferences. */
        void clearAccessCache();

        //////// LOCKS & LEASES:

        LockResult acquireLock(const DocumentIdentity& id, const std::string& holder) {
            return _locks->acquireLock(id, holder);
        }

        bool releaseLock(const DocumentIdentity& id, const std::string& holder) { return _locks->releaseLock(id, holder); }

        std::optional<LockResult> lockInfo(const DocumentIdentity& id) { return _locks->lockInfo(id); }

        void breakLock(const DocumentIdentity& id) { _locks->breakLock(id); }

        std::optional<Lease> getLease(const DocumentIdentity& id) { return _locks->getLease(id); }

        void setLease(const DocumentIdentity& id, const std::optional<Lease>& lease) { _locks->setLease(id, lease); }

        /** Leases a document to `holder` for the configured lease duration, starting now. */
        Lease takeLease(const DocumentIdentity&, const std::string& holder);

        int removeExpiredLeases(timestamp_t now = Now()) { return _locks->removeExpiredLeases(now); }

        //////// MAINTENANCE:

        void optimize() { _db->optimize(); }

        void vacuum(bool always = false) { _db->vacuum(always); }

        void integrityCheck() { _db->integrityCheck(); }

        alloc_slice rawQuery(const std::string& sql) { return _db->rawQuery(sql); }

      protected:
        std::string loggingClassName() const override { return "Store"; }

      private:
        struct DocNIDs {
            nameid_t container, document;
        };

        struct Located {
            fobid_t     container;
            DocNIDs     nids;
            RevisionRow latest;
        };

        std::optional<DocNIDs>     lookupNIDs(const DocumentIdentity&);
        std::optional<fobid_t>     containerFobid(const std::string& container);
        std::optional<Located>     locate(const DocumentIdentity&);
        std::vector<RevisionRow>   historyOf(const DocumentIdentity&);
        StructuredDocument         contentOf(const RevisionRow&);
        Record                     topicInfoOf(const RevisionRow&);
        void                       purgeRevision(fobid_t);
        std::string                nameOrEmpty(nameid_t);

        Options const                       _options;
        std::unique_ptr<DataFile>           _db;
        NameDictionary                      _names;
        FieldDictionary                     _fields;
        std::unique_ptr<RevisionStore>      _revisions;
        std::unique_ptr<AttributeStore>     _attributes;
        std::unique_ptr<AccessRuleStore>    _accessRules;
        std::unique_ptr<AccessResolver>     _access;
        std::unique_ptr<LockLeaseManager>   _locks;
        std::unique_ptr<TextSearch>         _search;
    };

}  // namespace versastore
