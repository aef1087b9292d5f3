//
// Base.hh
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
#include "fleece/slice.hh"
#include "fleece/PlatformCompat.hh"
#include "fleece/function_ref.hh"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace versastore {
    using fleece::slice;
    using fleece::alloc_slice;
    using fleece::nullslice;
    using fleece::function_ref;

    using std::string;
    using std::string_view;

    /// Id of an interned string in the `names` table.
    using nameid_t = int64_t;

    /// Id of an attribute coordinate in the `fields` table.
    using fieldid_t = int64_t;

    /// Row id of a revision (or container) in the `revisions` table.
    using fobid_t = int64_t;

    /// Document version number; contiguous from 1 per document lineage.
    using version_t = int64_t;

    /// Seconds since the Unix epoch, UTC.
    using timestamp_t = int64_t;

}  // namespace versastore
