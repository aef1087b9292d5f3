//
// PrincipalDirectory.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "PrincipalDirectory.hh"

using namespace std;

namespace versastore {

    void MemoryPrincipalDirectory::addToGroup(const string& group, const vector<string>& members) {
        lock_guard<mutex> lock(_mutex);
        for ( auto& member : members ) _groupsOf[member].insert(group);
    }

    void MemoryPrincipalDirectory::addAdmin(const string& principal) {
        lock_guard<mutex> lock(_mutex);
        _admins.insert(principal);
    }

    bool MemoryPrincipalDirectory::isAdmin(const string& principal) const {
        lock_guard<mutex> lock(_mutex);
        return _admins.count(principal) > 0;
    }

    vector<string> MemoryPrincipalDirectory::groupsOf(const string& principal) const {
        lock_guard<mutex> lock(_mutex);
        auto              i = _groupsOf.find(principal);
        if ( i == _groupsOf.end() ) return {};
        return {i->second.begin(), i->second.end()};
    }

}  // namespace versastore
