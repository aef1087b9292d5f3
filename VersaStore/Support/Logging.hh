//
// Logging.hh
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
#include "fleece/PlatformCompat.hh"
#include <atomic>
#include <map>
#include <string>
#include <cstdarg>
#include <cstdint>
#include <cinttypes>  //for stdint.h fmt specifiers

/*
    This is a configurable console-logging facility that lets logging be turned on and off
    independently for various subsystems or areas of the code. It's used similarly to printf:
        Log("the value of foo is %d", foo);

    You can associate a log message with a particular subsystem or tag by defining a logging
    domain. In one source file, define the domain:
        LogDomain Foo("Foo");
    If you need to use the same domain in other source files, declare it `extern`.
    Now you can use the Foo domain for logging:
        LogTo(Foo, "the value of foo is %d", foo);

    Each domain has a level; messages below it are discarded before formatting. The level can
    be forced lower at runtime with an environment variable named "VersaStoreLog" followed by
    the domain name, e.g. VersaStoreLogSQL=verbose.

    Warn() is a related function that _always_ logs, and prefixes the message with "WARNING".
 */

namespace versastore {

    enum class LogLevel : int8_t { Uninitialized = -1, Debug, Verbose, Info, Warning, Error, None };

    class Logging;

    class LogDomain {
      public:
        explicit LogDomain(const char* name, LogLevel level = LogLevel::Info)
            : _level(level), _name(name), _next(sFirstDomain) {
            sFirstDomain = this;
        }

        static LogDomain* named(const char* name);

        [[nodiscard]] const char* name() const { return _name; }

        void setLevel(LogLevel lvl) noexcept;

        [[nodiscard]] LogLevel level() const noexcept;

        /** The level at which this domain will actually have an effect. This is based on the
            level(), but raised to take into account the level at which the callback will
            trigger. In other words, any log() calls below this level will produce no output. */
        LogLevel effectiveLevel() {
            computeLevel();
            return _effectiveLevel;
        }

        [[nodiscard]] bool willLog(LogLevel lv) const { return _effectiveLevel <= lv; }

        void log(LogLevel level, const char* fmt, ...) __printflike(3, 4);
        void vlog(LogLevel level, const char* fmt, va_list) __printflike(3, 0);

        using Callback_t = void (*)(const LogDomain&, LogLevel, const char* format, va_list);

        static void defaultCallback(const LogDomain&, LogLevel, const char* format, va_list) __printflike(3, 0);

        static Callback_t currentCallback();

        /** Registers (or unregisters) a callback to be passed log messages.
            @param callback  The callback function, or NULL to unregister.
            @param preformatted  If true, callback will be passed already-formatted log messages to be
                displayed verbatim (and the `va_list` parameter will be NULL.) */
        static void setCallback(Callback_t callback, bool preformatted);

        static LogLevel callbackLogLevel() noexcept;
        static void     setCallbackLogLevel(LogLevel) noexcept;

      private:
        friend class Logging;
        static std::string getObject(unsigned);
        unsigned           registerObject(const void* object, const unsigned* val, const std::string& description,
                                          const std::string& nickname, LogLevel level);
        void               unregisterObject(unsigned obj);
        void vlog(LogLevel level, const Logging* logger, const char* fmt, va_list) __printflike(4, 0);

        static LogLevel _callbackLogLevel() noexcept;
        LogLevel        computeLevel() noexcept;
        LogLevel        levelFromEnvironment() const noexcept;
        static void     _invalidateEffectiveLevels() noexcept;

        std::atomic<LogLevel> _effectiveLevel{LogLevel::Uninitialized};
        std::atomic<LogLevel> _level;
        const char* const     _name;
        LogDomain* const      _next;

        static unsigned                        slastObjRef;
        static std::map<unsigned, std::string> sObjNames;
        static LogDomain*                      sFirstDomain;
        static LogLevel                        sCallbackMinLevel;
    };

    extern LogDomain kDefaultLog, DBLog, AccessLog, SearchLog;

#define LogToAt(DOMAIN, LEVEL, FMT, ...)                                                                               \
    do {                                                                                                               \
        if ( _usuallyFalse((DOMAIN).willLog(versastore::LogLevel::LEVEL)) )                                            \
            (DOMAIN).log(versastore::LogLevel::LEVEL, FMT, ##__VA_ARGS__);                                             \
    } while ( 0 )

#define LogTo(DOMAIN, FMT, ...)      LogToAt(DOMAIN, Info, FMT, ##__VA_ARGS__)
#define LogVerbose(DOMAIN, FMT, ...) LogToAt(DOMAIN, Verbose, FMT, ##__VA_ARGS__)
#define LogWarn(DOMAIN, FMT, ...)    LogToAt(DOMAIN, Warning, FMT, ##__VA_ARGS__)
#define LogError(DOMAIN, FMT, ...)   LogToAt(DOMAIN, Error, FMT, ##__VA_ARGS__)
#define Log(FMT, ...)                LogToAt(versastore::kDefaultLog, Info, FMT, ##__VA_ARGS__)
#define Warn(FMT, ...)               LogToAt(versastore::kDefaultLog, Warning, FMT, ##__VA_ARGS__)
#define WarnError(FMT, ...)          LogToAt(versastore::kDefaultLog, Error, FMT, ##__VA_ARGS__)

    static inline bool WillLog(LogLevel lv) { return kDefaultLog.willLog(lv); }

    /** Mixin that adds log(), warn(), etc. methods. The messages these write will be prefixed
        with a description of the object; by default this is just the class and address, but
        you can customize it by overriding loggingIdentifier(). */
    class Logging {
      protected:
        explicit Logging(LogDomain& domain) : _domain(domain) {}

        virtual ~Logging();

        /** Override this to return a string identifying this object. */
        virtual std::string loggingIdentifier() const;
        virtual std::string loggingClassName() const;

#define LOGBODY(LEVEL)                                                                                                 \
    va_list args;                                                                                                      \
    va_start(args, format);                                                                                            \
    _logv(LogLevel::LEVEL, format, args);                                                                              \
    va_end(args);

        void warn(const char* format, ...) const __printflike(2, 3) { LOGBODY(Warning) }

        void logError(const char* format, ...) const __printflike(2, 3) { LOGBODY(Error) }

        // For performance reasons, logInfo() and logVerbose() are macros (below)
        void _logInfo(const char* format, ...) const __printflike(2, 3) { LOGBODY(Info) }

        void _logVerbose(const char* format, ...) const __printflike(2, 3) { LOGBODY(Verbose) }

        bool willLog(LogLevel level = LogLevel::Info) const { return _domain.willLog(level); }

        void _log(LogLevel level, const char* format, ...) const __printflike(3, 4);
        void _logv(LogLevel level, const char* format, va_list) const __printflike(3, 0);

        unsigned getObjectRef(LogLevel level = LogLevel::Info) const;

        LogDomain& _domain;

      private:
        friend class LogDomain;
        mutable unsigned _objectRef{0};
    };

#define _logAt(LEVEL, FMT, ...)                                                                                        \
    do {                                                                                                               \
        if ( _usuallyFalse(this->willLog(versastore::LogLevel::LEVEL)) )                                               \
            this->_log(versastore::LogLevel::LEVEL, FMT, ##__VA_ARGS__);                                               \
    } while ( 0 )
#define logInfo(FMT, ...)    _logAt(Info, FMT, ##__VA_ARGS__)
#define logVerbose(FMT, ...) _logAt(Verbose, FMT, ##__VA_ARGS__)

}  // namespace versastore
