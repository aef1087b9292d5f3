//
// RevisionStore.hh
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
#include <memory>
#include <optional>
#include <vector>

namespace SQLite {
    class Statement;
}

namespace versastore {
    class DataFile;

    /** The namespace of a row in the `revisions` table. */
    enum class Namespace : int {
        Latest    = 0,   ///< The current revision of a document (exactly one per document)
        Other     = 1,   ///< A superseded revision, kept as history
        Dangling  = 2,   ///< A placeholder for a document that hasn't been saved yet
        Container = 3,   ///< A container; its webId is the root row
        Root      = 99,  ///< The single root sentinel
    };

    /** A row of the `revisions` table. */
    struct RevisionRow {
        fobid_t     fobid{0};
        Namespace   ns{Namespace::Latest};
        fobid_t     webId{0};
        nameid_t    nid{0};
        version_t   version{0};
        timestamp_t date{0};
        nameid_t    author{0};
        nameid_t    comment{0};
        version_t   reprev{0};  ///< Version this row amended in place, or 0
    };

    /** Manages the `revisions` table: containers, and the latest/other/dangling revision rows
        of documents. Works purely with ids; callers resolve names first.
        Mutating methods must be called inside an ExclusiveTransaction. */
    class RevisionStore {
      public:
        static constexpr fobid_t kRootFobid = 1;

        explicit RevisionStore(DataFile&);
        ~RevisionStore();

        //////// CONTAINERS:

        /** The fobid of the container with name id `containerNID`, if it exists. */
        std::optional<fobid_t> findContainer(nameid_t containerNID);

        /** Returns the container's fobid, creating its row if necessary. */
        fobid_t ensureContainer(nameid_t containerNID);

        /** Changes a container's name id. */
        void renameContainer(fobid_t container, nameid_t newNID);

        /** Deletes a container row (not its documents). */
        void removeContainer(fobid_t container);

        /** The name ids of all containers. */
        std::vector<nameid_t> containerNames();

        //////// DOCUMENT REVISIONS:

        std::optional<RevisionRow> latest(fobid_t webId, nameid_t nid);

        /** The revision with the smallest version >= `version`, in `latest` or `other`. */
        std::optional<RevisionRow> atVersion(fobid_t webId, nameid_t nid, version_t version);

        /** The highest version of the document in `latest` or `other`, or 0 if it has none.
            Rows left behind by a rename count, so a new document at the old identity continues
            their numbering. */
        version_t newestVersion(fobid_t webId, nameid_t nid);

        /** The newest `other` revision. */
        std::optional<RevisionRow> newestOther(fobid_t webId, nameid_t nid);

        std::optional<RevisionRow> dangling(fobid_t webId, nameid_t nid);

        std::optional<RevisionRow> byFobid(fobid_t fobid);

        /** The newest revision whose date is <= `time`. */
        std::optional<RevisionRow> atTime(fobid_t webId, nameid_t nid, timestamp_t time);

        /** All `latest` and `other` revisions, newest first. */
        std::vector<RevisionRow> history(fobid_t webId, nameid_t nid);

        /** The fobids of every row of a document, in all namespaces. */
        std::vector<fobid_t> allRevisions(fobid_t webId, nameid_t nid);

        /** The name ids of the documents in a container with a `latest` revision. */
        std::vector<nameid_t> latestNames(fobid_t webId);

        /** The `latest` rows of the given documents of a container. */
        std::vector<RevisionRow> latestOf(fobid_t webId, const std::vector<nameid_t>& nids);

        /** Inserts a row; returns its fobid. */
        fobid_t insert(const RevisionRow&);

        /** Moves a row to another namespace. */
        void retag(fobid_t fobid, Namespace ns);

        /** Overwrites the metadata of a row being amended in place. */
        void amend(fobid_t fobid, nameid_t author, nameid_t comment, timestamp_t date, version_t reprev);

        /** Changes the identity columns of one row. */
        void setIdentity(fobid_t fobid, fobid_t webId, nameid_t nid);

        void remove(fobid_t fobid);

        /** Deletes every document revision in a container (not the container row itself). */
        void removeAllIn(fobid_t webId);

      private:
        std::optional<RevisionRow> readOne(SQLite::Statement&);
        std::vector<RevisionRow>   readAll(SQLite::Statement&);

        DataFile&                                  _db;
        std::unique_ptr<SQLite::Statement>         _latestStmt;
        std::unique_ptr<SQLite::Statement>         _findContainerStmt;
        std::unique_ptr<SQLite::Statement>         _insertStmt;
        std::unique_ptr<SQLite::Statement>         _retagStmt;
    };

}  // namespace versastore
