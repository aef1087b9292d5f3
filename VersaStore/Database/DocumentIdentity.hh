//
// DocumentIdentity.hh
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
#include <tuple>

namespace versastore {

    /** Identifies a document: the container it lives in and its name within it.
        Container names are hierarchical, with `/` separating levels ("Main/Sub"). */
    struct DocumentIdentity {
        std::string container;
        std::string document;

        /** True if both names are non-empty, valid UTF-8, and free of control characters. */
        [[nodiscard]] bool isValid() const noexcept;

        /** "container.document", for logging. */
        [[nodiscard]] std::string description() const { return container + "." + document; }

        bool operator<(const DocumentIdentity& other) const noexcept {
            return std::tie(container, document) < std::tie(other.container, other.document);
        }

        bool operator==(const DocumentIdentity& other) const noexcept {
            return container == other.container && document == other.document;
        }
    };

    /** True if `name` can be used as a container or document name. */
    bool IsValidItemName(string_view name) noexcept;

}  // namespace versastore
