//
// Logging.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Logging.hh"
#include "StringUtil.hh"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <sstream>
#include <strings.h>
#include <typeinfo>

#if defined(__linux__) || defined(__APPLE__)
#    include <cxxabi.h>
#endif

using namespace std;
using namespace std::chrono;

namespace versastore {

    LogDomain* LogDomain::sFirstDomain = nullptr;

    LogDomain kDefaultLog("", LogLevel::Info);
    LogDomain DBLog("DB", LogLevel::Info);
    LogDomain AccessLog("Access", LogLevel::Info);
    LogDomain SearchLog("Search", LogLevel::Info);

    LogLevel                        LogDomain::sCallbackMinLevel = LogLevel::Uninitialized;
    static LogDomain::Callback_t    sCallback                    = LogDomain::defaultCallback;
    static bool                     sCallbackPreformatted        = false;
    unsigned                        LogDomain::slastObjRef{0};
    std::map<unsigned, std::string> LogDomain::sObjNames;
    static mutex                    sLogMutex;

    static const char* kLevels[] = {"Debug", "Verbose", "Info", "WARNING", "ERROR"};

#pragma mark - GLOBAL SETTINGS:

    void LogDomain::setCallback(Callback_t callback, bool preformatted) {
        unique_lock<mutex> lock(sLogMutex);
        if ( !callback ) sCallbackMinLevel = LogLevel::None;
        sCallback             = callback;
        sCallbackPreformatted = preformatted;
        _invalidateEffectiveLevels();
    }

    LogDomain::Callback_t LogDomain::currentCallback() { return sCallback; }

    void LogDomain::setCallbackLogLevel(LogLevel level) noexcept {
        unique_lock<mutex> lock(sLogMutex);
        // Setting "VersaStoreLog" env var forces a minimum level of logging:
        auto envLevel = kDefaultLog.levelFromEnvironment();
        if ( envLevel != LogLevel::Uninitialized ) level = min(level, envLevel);
        if ( level != sCallbackMinLevel ) {
            sCallbackMinLevel = level;
            _invalidateEffectiveLevels();
        }
    }

    // Only call while holding sLogMutex!
    void LogDomain::_invalidateEffectiveLevels() noexcept {
        for ( auto d = sFirstDomain; d; d = d->_next ) d->_effectiveLevel = LogLevel::Uninitialized;
    }

    LogLevel LogDomain::callbackLogLevel() noexcept {
        unique_lock<mutex> lock(sLogMutex);
        return _callbackLogLevel();
    }

    // Only call while holding sLogMutex!
    LogLevel LogDomain::_callbackLogLevel() noexcept {
        auto level = sCallbackMinLevel;
        if ( level == LogLevel::Uninitialized ) {
            // Allow 'VersaStoreLog' env var to set initial callback level:
            level = kDefaultLog.levelFromEnvironment();
            if ( level == LogLevel::Uninitialized ) level = LogLevel::Info;
            sCallbackMinLevel = level;
        }
        return level;
    }

#pragma mark - INITIALIZATION:

    // Returns the LogLevel override set by an environment variable, or Uninitialized if none
    LogLevel LogDomain::levelFromEnvironment() const noexcept {
        char* val = getenv((string("VersaStoreLog") + _name).c_str());
        if ( val ) {
            static const char* const kEnvLevelNames[] = {"debug", "verbose", "info", "warning",
                                                         "error", "none",    nullptr};
            for ( int i = 0; kEnvLevelNames[i]; i++ ) {
                if ( 0 == strcasecmp(val, kEnvLevelNames[i]) ) return LogLevel(i);
            }
            return LogLevel::Info;
        }
        return LogLevel::Uninitialized;
    }

    LogLevel LogDomain::computeLevel() noexcept {
        if ( _effectiveLevel == LogLevel::Uninitialized ) setLevel(_level);
        return _level;
    }

    LogLevel LogDomain::level() const noexcept { return const_cast<LogDomain*>(this)->computeLevel(); }

    void LogDomain::setLevel(LogLevel level) noexcept {
        unique_lock<mutex> lock(sLogMutex);

        // Setting "VersaStoreLog___" env var forces a minimum level:
        auto envLevel = levelFromEnvironment();
        if ( envLevel != LogLevel::Uninitialized ) level = min(level, envLevel);

        _level = level;

        // The effective level is the level at which I will actually trigger because there is
        // a place for my output to go:
        _effectiveLevel = max((LogLevel)_level, _callbackLogLevel());
    }

    LogDomain* LogDomain::named(const char* name) {
        unique_lock<mutex> lock(sLogMutex);
        if ( !name ) name = "";
        for ( auto d = sFirstDomain; d; d = d->_next )
            if ( strcmp(d->name(), name) == 0 ) return d;
        return nullptr;
    }

#pragma mark - LOGGING:

    static char sFormatBuffer[2048];

    void LogDomain::vlog(LogLevel level, const Logging* logger, const char* fmt, va_list args) {
        if ( _effectiveLevel == LogLevel::Uninitialized ) computeLevel();
        if ( !willLog(level) ) return;

        unsigned objRef = logger ? logger->getObjectRef() : 0;

        unique_lock<mutex> lock(sLogMutex);
        if ( !sCallback || level < _callbackLogLevel() ) return;

        va_list args2;
        va_copy(args2, args);
        va_list noArgs{};
        size_t  n = 0;
        if ( objRef ) {
            n = snprintf(sFormatBuffer, sizeof(sFormatBuffer), "{%s#%u} ", getObject(objRef).c_str(), objRef);
            n = min(n, sizeof(sFormatBuffer) - 1);
        }
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
        const char* useFmt = fmt;
        if ( sCallbackPreformatted ) {
            vsnprintf(&sFormatBuffer[n], sizeof(sFormatBuffer) - n, fmt, args2);
            useFmt = sFormatBuffer;
        } else if ( n > 0 ) {
            snprintf(&sFormatBuffer[n], sizeof(sFormatBuffer) - n, "%s", fmt);
            useFmt = sFormatBuffer;
        }
        sCallback(*this, level, useFmt, sCallbackPreformatted ? noArgs : args2);
#pragma GCC diagnostic pop
        va_end(args2);
    }

    void LogDomain::vlog(LogLevel level, const char* fmt, va_list args) { vlog(level, nullptr, fmt, args); }

    void LogDomain::log(LogLevel level, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        vlog(level, nullptr, fmt, args);
        va_end(args);
    }

    static void writeTimestamp(FILE* out) {
        auto   now    = system_clock::now();
        time_t secs   = system_clock::to_time_t(now);
        auto   micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
        struct tm tm {};
        localtime_r(&secs, &tm);
        char buf[32];
        strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
        fprintf(out, "%s.%06lld", buf, (long long)micros);
    }

    // The default logging callback writes to stderr.
    void LogDomain::defaultCallback(const LogDomain& domain, LogLevel level, const char* fmt, va_list args) {
        writeTimestamp(stderr);
        const char* name = domain.name();
        if ( name[0] ) fprintf(stderr, "| [%s] %s: ", name, kLevels[(int)level]);
        else
            fprintf(stderr, "| %s: ", kLevels[(int)level]);
        vfprintf(stderr, fmt, args);
        fputc('\n', stderr);
    }

    // Must be called from a method holding sLogMutex
    string LogDomain::getObject(unsigned ref) {
        const auto found = sObjNames.find(ref);
        if ( found != sObjNames.end() ) { return found->second; }
        return "?";
    }

    unsigned LogDomain::registerObject(const void* object, const unsigned* val, const string& description,
                                       const string& nickname, LogLevel level) {
        unsigned objRef;
        {
            unique_lock<mutex> lock(sLogMutex);
            if ( *val != 0 ) { return *val; }
            objRef = ++slastObjRef;
            sObjNames.emplace(objRef, nickname);
            if ( !sCallback || level < _callbackLogLevel() || !willLog(level) ) return objRef;
        }
        log(level, "{%s#%u}==> %s @%p", nickname.c_str(), objRef, description.c_str(), object);
        return objRef;
    }

    void LogDomain::unregisterObject(unsigned objectRef) {
        unique_lock<mutex> lock(sLogMutex);
        sObjNames.erase(objectRef);
    }

#pragma mark - LOGGING CLASS:

    Logging::~Logging() {
        if ( _objectRef ) _domain.unregisterObject(_objectRef);
    }

    static std::string classNameOf(const Logging* obj) {
        const char* name = typeid(*obj).name();
#if defined(__linux__) || defined(__APPLE__)
        // Get the name of my class, unmangle it, and remove namespaces:
        size_t unmangledLen;
        int    status;
        char*  unmangled = abi::__cxa_demangle(name, nullptr, &unmangledLen, &status);
        if ( unmangled ) name = unmangled;
        string result(name);
        free(unmangled);
        return result;
#else
        return name;
#endif
    }

    std::string Logging::loggingClassName() const {
        string name  = classNameOf(this);
        auto   colon = name.find_last_of(':');
        if ( colon != string::npos ) name = name.substr(colon + 1);
        return name;
    }

    std::string Logging::loggingIdentifier() const { return format("%p", this); }

    unsigned Logging::getObjectRef(LogLevel level) const {
        if ( _objectRef == 0 ) {
            string nickname   = loggingClassName();
            string identifier = classNameOf(this) + " " + loggingIdentifier();
            _objectRef        = _domain.registerObject(this, &_objectRef, identifier, nickname, level);
        }
        return _objectRef;
    }

    void Logging::_log(LogLevel level, const char* format, ...) const {
        va_list args;
        va_start(args, format);
        _logv(level, format, args);
        va_end(args);
    }

    void Logging::_logv(LogLevel level, const char* format, va_list args) const {
        _domain.computeLevel();
        if ( _domain.willLog(level) ) _domain.vlog(level, this, format, args);
    }

}  // namespace versastore
