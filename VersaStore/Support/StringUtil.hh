//
// StringUtil.hh
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
#include "fleece/function_ref.hh"
#include "fleece/slice.hh"
#include "fleece/PlatformCompat.hh"
#include <cctype>
#include <cstdarg>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>
#include <sstream>

namespace versastore {

    /** Like sprintf(), but returns a std::string */
    std::string format(const char* fmt NONNULL, ...) __printflike(1, 2);

    /** Like vsprintf(), but returns a std::string */
    std::string vformat(const char* fmt NONNULL, va_list) __printflike(1, 0);

    void split(std::string_view str, std::string_view separator, fleece::function_ref<void(std::string_view)> callback);

    /** Returns the strings in the vector concatenated together,
        with the separator (if non-null) between them. */
    std::string join(const std::vector<std::string>&, const char* separator = nullptr);

    /** Removes last character from string (in place), but only if it equals `ending` */
    void chomp(std::string&, char ending) noexcept;

    /** Returns true if `str` begins with the string `prefix`. */
    bool hasPrefix(std::string_view str, std::string_view prefix) noexcept;

    /** Converts an ASCII string to lowercase, in place. */
    void toLowercase(std::string&);

    /** Returns a copy of `str` without leading and trailing ASCII whitespace. */
    std::string_view trimWhitespace(std::string_view str) noexcept;

    /** Escapes every character that isn't a letter, digit or underscore with a backslash,
        so the string matches itself literally when used as a regular expression. */
    std::string quoteRegex(std::string_view str);

    //////// UNICODE_AWARE FUNCTIONS:

    /** Returns true if the UTF-8 encoded slice contains no characters with code points < 32. */
    bool hasNoControlCharacters(fleece::slice) noexcept;

    /** Returns true if the UTF-8 encoded string contains no characters with code points < 32. */
    static inline bool hasNoControlCharacters(const std::string& str) noexcept {
        return hasNoControlCharacters(fleece::slice(str));
    }

    /** Returns true if the slice contains valid UTF-8 encoded data. */
    bool isValidUTF8(fleece::slice) noexcept;

    /** Returns true if the string contains valid UTF-8 encoded data. */
    static inline bool isValidUTF8(const std::string& str) noexcept { return isValidUTF8(fleece::slice(str)); }

}  // namespace versastore
