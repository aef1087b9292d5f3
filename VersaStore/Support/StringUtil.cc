//
// StringUtil.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "StringUtil.hh"
#include <cstdlib>
#include <new>
#include <sstream>

namespace versastore {
    using namespace std;
    using namespace fleece;

    std::string format(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        std::string result = vformat(fmt, args);
        va_end(args);
        return result;
    }

    std::string vformat(const char* fmt, va_list args) {
        char* cstr = nullptr;
        if ( vasprintf(&cstr, fmt, args) < 0 ) throw bad_alloc();
        std::string result(cstr);
        free(cstr);
        return result;
    }

    void split(string_view str, string_view separator, function_ref<void(string_view)> callback) {
        auto              end = str.size();
        string::size_type pos, next;
        for ( pos = 0; pos < end; pos = next + separator.size() ) {
            next = str.find(separator, pos);
            if ( next == string::npos ) break;
            callback(str.substr(pos, next - pos));
        }
        callback(str.substr(min(pos, end)));
    }

    std::string join(const std::vector<std::string>& strings, const char* separator) {
        stringstream s;
        int          n = 0;
        for ( const string& str : strings ) {
            if ( n++ && separator ) s << separator;
            s << str;
        }
        return s.str();
    }

    void chomp(std::string& str, char ending) noexcept {
        auto sz = str.size();
        if ( sz > 0 && str[sz - 1] == ending ) str.resize(sz - 1);
    }

    bool hasPrefix(string_view str, string_view prefix) noexcept {
        return str.size() >= prefix.size() && memcmp(str.data(), prefix.data(), prefix.size()) == 0;
    }

    void toLowercase(std::string& str) {
        for ( char& c : str ) c = (char)tolower((unsigned char)c);
    }

    string_view trimWhitespace(string_view str) noexcept {
        while ( !str.empty() && isspace((unsigned char)str.front()) ) str.remove_prefix(1);
        while ( !str.empty() && isspace((unsigned char)str.back()) ) str.remove_suffix(1);
        return str;
    }

    string quoteRegex(string_view str) {
        string result;
        result.reserve(str.size() * 2);
        for ( char c : str ) {
            if ( !isalnum((unsigned char)c) && c != '_' && !((unsigned char)c & 0x80) ) result += '\\';
            result += c;
        }
        return result;
    }

    // Based on utf8_check.c by Markus Kuhn, 2005
    // https://www.cl.cam.ac.uk/~mgk25/ucs/utf8_check.c
    bool isValidUTF8(fleece::slice sl) noexcept {
        auto s = (const uint8_t*)sl.buf;
        for ( auto e = s + sl.size; s != e; ) {
            while ( !(*s & 0x80) ) {
                if ( ++s == e ) { return true; }
            }

            if ( (s[0] & 0x60) == 0x40 ) {
                if ( s + 1 >= e || (s[1] & 0xc0) != 0x80 || (s[0] & 0xfe) == 0xc0 ) { return false; }
                s += 2;
            } else if ( (s[0] & 0xf0) == 0xe0 ) {
                if ( s + 2 >= e || (s[1] & 0xc0) != 0x80 || (s[2] & 0xc0) != 0x80
                     || (s[0] == 0xe0 && (s[1] & 0xe0) == 0x80) || (s[0] == 0xed && (s[1] & 0xe0) == 0xa0) ) {
                    return false;
                }
                s += 3;
            } else if ( (s[0] & 0xf8) == 0xf0 ) {
                if ( s + 3 >= e || (s[1] & 0xc0) != 0x80 || (s[2] & 0xc0) != 0x80 || (s[3] & 0xc0) != 0x80
                     || (s[0] == 0xf0 && (s[1] & 0xf0) == 0x80) || (s[0] == 0xf4 && s[1] > 0x8f) || s[0] > 0xf4 ) {
                    return false;
                }
                s += 4;
            } else {
                return false;
            }
        }
        return true;
    }

    bool hasNoControlCharacters(fleece::slice sl) noexcept {
        auto s = (const uint8_t*)sl.buf;
        for ( auto e = s + sl.size; s != e; ++s ) {
            if ( _usuallyFalse(*s < 32) ) return false;
            else if ( _usuallyFalse(*s == 0xC0 && s + 1 != e && s[1] == 0x80) )  // UTF-8 encoded NUL
                return false;
        }
        return true;
    }

}  // namespace versastore
