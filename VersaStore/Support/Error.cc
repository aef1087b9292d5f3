//
// Error.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Error.hh"
#include "Logging.hh"
#include "StringUtil.hh"
#include "fleece/Fleece.hh"
#include <sqlite3.h>
#include <SQLiteCpp/Exception.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <new>
#include <string>
#include <sstream>
#include <typeinfo>

namespace versastore {

    using namespace std;

#pragma mark ERROR CODES, NAMES, etc.

    struct codeMapping {
        int           err;
        error::Domain domain;
        int           code;
    };

    static const codeMapping kPOSIXMapping[] = {
            {ENOENT, error::VersaStore, error::NotFound},
            {0, /*must end with err=0*/ error::VersaStore, 0},
    };

    static const codeMapping kSQLiteMapping[] = {
            {SQLITE_PERM, error::VersaStore, error::NotWriteable},
            {SQLITE_BUSY, error::VersaStore, error::Busy},
            {SQLITE_LOCKED, error::VersaStore, error::Busy},
            {SQLITE_NOMEM, error::VersaStore, error::MemoryError},
            {SQLITE_READONLY, error::VersaStore, error::NotWriteable},
            {SQLITE_IOERR, error::VersaStore, error::IOError},
            {SQLITE_CORRUPT, error::VersaStore, error::CorruptData},
            {SQLITE_FULL, error::POSIX, ENOSPC},
            {SQLITE_CANTOPEN, error::VersaStore, error::CantOpenFile},
            {SQLITE_NOTADB, error::VersaStore, error::NotADatabaseFile},
            {SQLITE_CONSTRAINT, error::VersaStore, error::Conflict},
            {0, /*must end with err=0*/ error::VersaStore, 0},
    };

    static const codeMapping kFleeceMapping[] = {
            {kFLMemoryError, error::VersaStore, error::MemoryError},
            {kFLJSONError, error::VersaStore, error::WrongFormat},
            {kFLInvalidData, error::VersaStore, error::CorruptData},
            {0, /*must end with err=0*/ error::Fleece, 0},
    };

    __cold static bool mapError(error::Domain& domain, int& code, const codeMapping table[]) {
        for ( const codeMapping* row = &table[0]; row->err != 0; ++row ) {
            if ( row->err == code ) {
                domain = row->domain;
                code   = row->code;
                return true;
            }
        }
        return false;
    }

    __cold static int getPrimaryCode(const error::Domain& domain, const int& code) {
        if ( domain != error::Domain::SQLite ) { return code; }
        return code & 0xff;
    }

    __cold static const char* versastore_errstr(error::VersaStoreError code) {
        static const char* kVersaStoreMessages[] = {
                // These must match up with the codes in the declaration of VersaStoreError
                "no error",  // 0
                "assertion failed",
                "unimplemented function called",
                "database not open",
                "not found",
                "conflict",
                "invalid parameter",
                "unexpected exception",
                "can't open file",
                "file I/O error",
                "memory allocation failed",
                "not writeable",
                "data is corrupted",
                "database busy/locked",
                "must be called during a transaction",
                "transaction not closed",
                "unsupported operation",
                "file is not a database",
                "file/data is not in the requested format",
                "database is in an old file format that can't be opened",
                "database is in a newer file format than this software supports",
                "invalid container or document name",
                "no prior revision to roll back to",
                "can't roll back the first revision of a document",
                "invalid regular expression",
        };
        static_assert(sizeof(kVersaStoreMessages) / sizeof(kVersaStoreMessages[0]) == error::NumVersaStoreErrorsPlus1,
                      "Incomplete error message table");

        const char* str = nullptr;
        if ( code < sizeof(kVersaStoreMessages) / sizeof(char*) ) str = kVersaStoreMessages[code];
        if ( !str ) str = "(unknown VersaStoreError)";
        return str;
    }

    __cold static const char* fleece_errstr(int code) {
        static const char* kFleeceMessages[] = {
                // These must match up with the codes in the declaration of FLError
                "no error",  // 0
                "memory error",
                "out of range",
                "invalid data",
                "Fleece encode/decode error",
                "JSON encode/decode error",
                "unparseable Fleece value",
                "path syntax error",
                "internal error",
                "item not found",
                "misuse of Fleece shared-keys API",
        };
        const char* str = nullptr;
        if ( code >= 0 && size_t(code) < sizeof(kFleeceMessages) / sizeof(char*) ) str = kFleeceMessages[code];
        if ( !str ) str = "(unknown Fleece error)";
        return str;
    }

    __cold string error::_what(error::Domain domain, int code) noexcept {
        switch ( domain ) {
            case VersaStore:
                return versastore_errstr((VersaStoreError)code);
            case POSIX:
                return strerror(code);
            case SQLite:
                {
                    const int primary = code & 0xFF;
                    if ( code == primary ) { return sqlite3_errstr(code); }
                    stringstream ss;
                    ss << sqlite3_errstr(primary) << " (" << code << ")";
                    return ss.str();
                }
            case Fleece:
                return fleece_errstr(code);
            default:
                return "unknown error domain";
        }
    }

    __cold const char* error::nameOfDomain(Domain domain) noexcept {
        // Indexed by Domain
        static const char* kDomainNames[] = {"0", "VersaStore", "POSIX", "SQLite", "Fleece"};
        static_assert(sizeof(kDomainNames) / sizeof(kDomainNames[0]) == error::NumDomainsPlus1,
                      "Incomplete domain name table");
        if ( domain >= NumDomainsPlus1 ) return "INVALID_DOMAIN";
        return kDomainNames[domain];
    }

#pragma mark - ERROR CLASS:


    __cold error::error(error::Domain d, int c) : error(d, c, _what(d, c)) {}

    __cold error::error(error::Domain d, int c, const std::string& what)
        : runtime_error(what), domain(d), code(getPrimaryCode(d, c)) {}

    __cold error& error::operator=(const error& e) {
        // This has to be hacked, since `domain` and `code` are marked `const`.
        this->~error();
        new (this) error(e);
        return *this;
    }

    __cold error error::standardized() const {
        Domain d = domain;
        int    c = code;
        switch ( domain ) {
            case POSIX:
                mapError(d, c, kPOSIXMapping);
                break;
            case SQLite:
                mapError(d, c, kSQLiteMapping);
                break;
            case Fleece:
                mapError(d, c, kFleeceMapping);
                break;
            default:
                return *this;
        }
        if ( domain == d && code == c ) { return *this; }
        return {d, c};
    }

    __cold static error unexpectedException(const std::exception& x) {
        // Get the actual exception class name using RTTI.
        // Unmangle it by skipping class name prefix like "St12" (may be compiler dependent)
        const char* name = typeid(x).name();
        while ( isalpha(*name) ) ++name;
        while ( isdigit(*name) ) ++name;
        Warn("Caught unexpected C++ %s(\"%s\")", name, x.what());
        return {error::VersaStore, error::UnexpectedError, x.what()};
    }

    __cold error error::convertRuntimeError(const std::runtime_error& re) {
        const char* what = re.what();
        if ( auto e = dynamic_cast<const error*>(&re); e ) {
            return *e;
        } else if ( auto se = dynamic_cast<const SQLite::Exception*>(&re); se ) {
            return {SQLite, se->getExtendedErrorCode(), what};
        } else {
            return unexpectedException(re);
        }
    }

    __cold error error::convertException(const std::exception& x) {
        if ( auto re = dynamic_cast<const std::runtime_error*>(&x); re ) return convertRuntimeError(*re);
        if ( auto le = dynamic_cast<const std::logic_error*>(&x); le ) {
            VersaStoreError code = AssertionFailed;
            if ( dynamic_cast<const std::invalid_argument*>(le) != nullptr
                 || dynamic_cast<const std::domain_error*>(le) != nullptr )
                code = InvalidParameter;
            return {VersaStore, code, le->what()};
        }
        return unexpectedException(x);
    }

    __cold bool error::isUnremarkable() const {
        if ( code == 0 ) return true;
        switch ( domain ) {
            case VersaStore:
                return code == NotFound || code == Conflict;
            case POSIX:
                return code == ENOENT;
            default:
                return false;
        }
    }

    __cold void error::_throw() {
        if ( !isUnremarkable() ) LogVerbose(kDefaultLog, "throwing %s error %d: %s", nameOfDomain(domain), code, what());
        throw *this;
    }

    __cold void error::_throw(Domain domain, int code) { error{domain, code}._throw(); }

    __cold void error::_throw(error::VersaStoreError err) { error{VersaStore, err}._throw(); }

    __cold void error::_throw(error::VersaStoreError code, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        std::string message = vformat(fmt, args);
        va_end(args);
        error{VersaStore, code, message}._throw();
    }

    __cold void error::assertionFailed(const char* fn, const char* file, unsigned line, const char* expr,
                                       const char* message, ...) {
        string messageStr = "Assertion failed: ";
        if ( message ) {
            va_list args;
            va_start(args, message);
            messageStr += vformat(message, args);
            va_end(args);
        } else {
            messageStr += expr;
        }
        if ( !WillLog(LogLevel::Error) ) fprintf(stderr, "%s (%s:%u, in %s)", messageStr.c_str(), file, line, fn);
        WarnError("%s (%s:%u, in %s)", messageStr.c_str(), file, line, fn);
        throw error(VersaStore, AssertionFailed, messageStr);
    }

}  // namespace versastore
