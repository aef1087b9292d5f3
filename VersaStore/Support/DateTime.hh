//
// DateTime.hh
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
#include <optional>

namespace versastore {

    /** Parses a date/time string into seconds since the Unix epoch. Recognized forms
        (all interpreted as UTC unless an explicit offset is given):
        - ISO-8601: `2001-12-31`, `2001-12-31T23:59`, `2001-12-31 23:59:59`, with optional
          fractional seconds and a `Z` or `+hh:mm` / `-hhmm` suffix
        - `2001/12/31`, `2001/12/31 23:59`, `2001/12/31 23:59:59`
        - `2001.12.31`, `2001.12.31.23.59`, `2001.12.31.23.59.59`
        - `31 Dec 2001`, `31 Dec 2001 - 23:59`, `31-Dec-2001 23:59:59`
        Leading and trailing whitespace is ignored. Returns nullopt if the string is not a date. */
    std::optional<timestamp_t> ParseDateTime(string_view str);

    /** Formats a timestamp as `YYYY-MM-DD HH:MM:SS` (UTC), the form stored in the datetime
        projection and understood by SQLite's date functions. */
    std::string FormatDateTime(timestamp_t t);

    /** The current time, in seconds since the epoch. */
    timestamp_t Now() noexcept;

}  // namespace versastore
