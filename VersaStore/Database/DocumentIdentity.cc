//
// DocumentIdentity.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "DocumentIdentity.hh"
#include "StringUtil.hh"

namespace versastore {

    bool IsValidItemName(string_view name) noexcept {
        slice s(name.data(), name.size());
        return !name.empty() && isValidUTF8(s) && hasNoControlCharacters(s);
    }

    bool DocumentIdentity::isValid() const noexcept {
        return IsValidItemName(container) && IsValidItemName(document);
    }

}  // namespace versastore
