//
// Error.hh
//
// Copyright 2014-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "fleece/PlatformCompat.hh"
#include <stdexcept>
#include <string>

#undef check

namespace versastore {

    /** Most API calls can throw this. */
    struct error : public std::runtime_error {
        enum Domain {
            VersaStore = 1,  // See VersaStoreError enum, below
            POSIX,           // See <errno.h>
            SQLite,          // See <sqlite3.h>
            Fleece,          // See FLError in fleece/FLBase.h

            // Add new domain here.
            // You MUST add a name string to kDomainNames in Error.cc!
            NumDomainsPlus1
        };

        // Error codes in VersaStore domain:
        enum VersaStoreError {
            AssertionFailed = 1,
            Unimplemented,
            NotOpen,
            NotFound,
            Conflict,
            InvalidParameter,
            UnexpectedError,
            CantOpenFile,
            IOError,
            MemoryError,
            NotWriteable,
            CorruptData,
            Busy,
            NotInTransaction,
            TransactionNotClosed,
            UnsupportedOperation,
            NotADatabaseFile,
            WrongFormat,
            DatabaseTooOld,
            DatabaseTooNew,
            BadDocumentIdentity,
            NoPriorRevision,
            CantRollBackFirstRevision,
            InvalidRegex,

            // Add new codes here. You MUST add messages to kVersaStoreMessages!

            NumVersaStoreErrorsPlus1
        };

        //---- Data members:
        Domain const domain;
        int const    code;

        error(Domain, int code);
        error(error::Domain, int code, const std::string& what);

        explicit error(VersaStoreError e) : error(VersaStore, e) {}

        error& operator=(const error& e);

        [[noreturn]] void _throw();

        /** Returns an equivalent error in the VersaStore or POSIX domain. */
        [[nodiscard]] error standardized() const;

        [[nodiscard]] bool isUnremarkable() const;

        /** Returns the error equivalent to a given runtime_error. Uses RTTI to discover if the
            error is already an `error` instance; otherwise tries to convert some other known
            exception types like SQLite::Exception. */
        static error convertRuntimeError(const std::runtime_error&);
        static error convertException(const std::exception&);

        /** Static version of the standard `what` method. */
        static std::string _what(Domain, int code) noexcept;

        static const char* nameOfDomain(Domain) noexcept;

        /** Constructs and throws an error. */
        [[noreturn]] static void _throw(Domain d, int c);
        [[noreturn]] static void _throw(VersaStoreError);
        [[noreturn]] static void _throw(VersaStoreError, const char* msg, ...) __printflike(2, 3);

        /** Throws an assertion failure exception. Called by the Assert() macro. */
        [[noreturn]] static void assertionFailed(const char* func, const char* file, unsigned line, const char* expr,
                                                 const char* message = nullptr, ...) __printflike(5, 6);
    };

    static inline bool operator==(const error& a, const error& b) noexcept {
        return a.domain == b.domain && a.code == b.code;
    }

    static inline bool operator==(const error& a, error::VersaStoreError code) noexcept {
        return a.domain == error::VersaStore && a.code == code;
    }

// Like C assert() but throws an exception instead of aborting
#ifdef __FILE_NAME__
#    define Assert(e, ...)                                                                                             \
        (_usuallyFalse(!(e)) ? versastore::error::assertionFailed(__func__, __FILE_NAME__, __LINE__, #e,               \
                                                                  ##__VA_ARGS__)                                       \
                             : (void)0)
#else
#    define Assert(e, ...)                                                                                             \
        (_usuallyFalse(!(e)) ? versastore::error::assertionFailed(__func__, __FILE__, __LINE__, #e, ##__VA_ARGS__)     \
                             : (void)0)
#endif


}  // namespace versastore
