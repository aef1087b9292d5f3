//
// VersaStoreTest.hh
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
#include "Error.hh"
#include "Logging.hh"
#include "DataFile.hh"
#include "catch2/catch.hpp"
#include <functional>
#include <memory>
#include <string>

namespace versastore {
    class MemoryPrincipalDirectory;
    class Store;
}  // namespace versastore

using namespace versastore;

// The lambda must throw a versastore::error with the given domain and code, or the test fails.
void ExpectException(versastore::error::Domain, int code, const std::function<void()>& lambda);
// In this variant the exception message must match too, unless `what` is nullptr.
void ExpectException(versastore::error::Domain domain, int code, const char* what,
                     const std::function<void()>& lambda);

class TestFixture {
  public:
    TestFixture();
    virtual ~TestFixture() = default;

    /** Number of warnings (or errors) logged since this fixture was created. */
    unsigned warningsLogged() const noexcept;

    /** A unique path in the temporary directory. */
    static std::string GetPath(const std::string& name, const std::string& extension);

    static std::string sTempDir;

  private:
    unsigned const _warningsAlreadyLogged;
};

/** Gives each test case a brand new, empty database file. */
class DataFileTestFixture : public TestFixture {
  public:
    DataFileTestFixture();
    ~DataFileTestFixture() override;

    std::unique_ptr<DataFile> db;

    const std::string& databasePath() const { return _path; }

    void reopenDatabase();
    void deleteDatabase();

  private:
    std::string _path;
};

/** Gives each test case a Store on a new database, with an in-memory principal directory. */
class StoreTestFixture : public TestFixture {
  public:
    StoreTestFixture();
    ~StoreTestFixture() override;

    std::shared_ptr<MemoryPrincipalDirectory> directory;
    std::unique_ptr<Store>                    store;

    const std::string& databasePath() const { return _path; }

    /** Opens another Store on the same file (as another request or process would). */
    std::unique_ptr<Store> openAnotherStore() const;

  private:
    std::string _path;
};
