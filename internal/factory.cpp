#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_driver.hpp"
#include "internal/observability/logging.hpp"
#if PROCDB_DB_POSTGRES
#include "internal/db/postgres/pg_driver.hpp"
#endif

namespace procdb::factory {
namespace {

constexpr const char* kMemoryConnectionString = "memory://";

} // namespace

RuntimeDependencies Build(const procdb::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;
  std::string         connection_string;

  const auto& database = config.database();
  if (database.has_postgres()) {
#if PROCDB_DB_POSTGRES
    if (database.postgres().connection_uri().empty()) {
      throw std::runtime_error("database.postgres.connection_uri is required");
    }
    deps.driver       = std::make_shared<db::postgres::PgDriver>();
    connection_string = database.postgres().connection_uri();
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  } else {
    deps.driver       = std::make_shared<db::memory::MemoryDriver>();
    connection_string = kMemoryConnectionString;
  }

  deps.data_source = std::make_shared<source::DataSource>(std::move(connection_string), deps.driver);

  PROCDB_LOG_INFO("data source ready", {observability::StringField("driver", deps.driver->Name())});
  return deps;
}

} // namespace procdb::factory
