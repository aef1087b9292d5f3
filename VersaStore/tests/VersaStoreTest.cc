//
// VersaStoreTest.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "VersaStoreTest.hh"
#include "Store.hh"
#include "PrincipalDirectory.hh"
#include "StringUtil.hh"
#include <atomic>
#include <cstdarg>
#include <cstdlib>
#include <ctime>
#include <mutex>

using namespace std;

static string tempDirectory() {
    const char* dir = getenv("TMPDIR");
    string      path = (dir && *dir) ? dir : "/tmp";
    if ( path.back() != '/' ) path += '/';
    return path;
}

string TestFixture::sTempDir = tempDirectory();

void ExpectException(versastore::error::Domain domain, int code, const char* what,
                     const std::function<void()>& lambda) {
    try {
        Log("NOTE: Expecting an exception to be thrown...");
        lambda();
    } catch ( std::runtime_error& x ) {
        Log("... caught exception %s", x.what());
        error err = error::convertRuntimeError(x).standardized();
        CHECK(err.domain == domain);
        CHECK(err.code == code);
        if ( what ) CHECK(string_view(err.what()) == string_view(what));
        return;
    }
    FAIL("Should have thrown an exception");
}

void ExpectException(versastore::error::Domain domain, int code, const std::function<void()>& lambda) {
    ExpectException(domain, code, nullptr, lambda);
}

#pragma mark - TESTFIXTURE:

static LogDomain::Callback_t sPrevCallback;
static atomic_uint           sWarningsLogged;

static void logCallback(const LogDomain& domain, LogLevel level, const char* fmt, va_list args) {
    if ( level >= LogLevel::Warning ) { ++sWarningsLogged; }
    if ( sPrevCallback ) sPrevCallback(domain, level, fmt, args);
}

TestFixture::TestFixture() : _warningsAlreadyLogged(sWarningsLogged) {
    static once_flag once;
    call_once(once, [] {
        sPrevCallback = LogDomain::currentCallback();
        LogDomain::setCallback(&logCallback, false);
    });
}

unsigned TestFixture::warningsLogged() const noexcept { return sWarningsLogged - _warningsAlreadyLogged; }

string TestFixture::GetPath(const string& name, const string& extension) {
    static atomic_uint counter;
    static long        unique = long(time(nullptr));
    return sTempDir + format("%s_%ld_%u.%s", name.c_str(), unique, ++counter, extension.c_str());
}

#pragma mark - DATAFILETESTFIXTURE:

DataFileTestFixture::DataFileTestFixture() : _path(GetPath("db", "sqlite3")) {
    DataFile::deleteDataFile(_path);
    db = make_unique<DataFile>(_path);
}

void DataFileTestFixture::reopenDatabase() {
    Log("//// Reopening db");
    db.reset();
    db = make_unique<DataFile>(_path);
}

void DataFileTestFixture::deleteDatabase() {
    db.reset();
    DataFile::deleteDataFile(_path);
}

DataFileTestFixture::~DataFileTestFixture() { deleteDatabase(); }

#pragma mark - STORETESTFIXTURE:

StoreTestFixture::StoreTestFixture()
    : directory(make_shared<MemoryPrincipalDirectory>()), _path(GetPath("store", "sqlite3")) {
    DataFile::deleteDataFile(_path);
    store = make_unique<Store>(_path, Store::Options{}, directory);
}

StoreTestFixture::~StoreTestFixture() {
    store.reset();
    DataFile::deleteDataFile(_path);
}

unique_ptr<Store> StoreTestFixture::openAnotherStore() const {
    return make_unique<Store>(_path, Store::Options{}, directory);
}
