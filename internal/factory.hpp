#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/driver.hpp"
#include "internal/source/data_source.hpp"

namespace procdb::factory {

/*
  RuntimeDependencies

  The driver and the data source built on it. The driver is exposed so an
  application can reach backend-specific setup (registering procedures on
  the memory driver, for instance).
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Driver>         driver;
  std::shared_ptr<source::DataSource> data_source;
};

/*
  Build

  Composition root: the only place that knows concrete drivers.

    database.postgres -> PgDriver on connection_uri
    database.memory   -> MemoryDriver
    (none)            -> MemoryDriver
*/
RuntimeDependencies Build(const procdb::runtime::config::RuntimeConfig& config);

} // namespace procdb::factory
