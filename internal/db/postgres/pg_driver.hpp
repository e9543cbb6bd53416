#pragma once

#include <memory>
#include <string>

#include "internal/db/api/driver.hpp"

namespace procdb::db::postgres {

/*
  PgDriver

  Opens one pqxx::connection per call. There is no pooling here; libpq
  settings in the connection string (connect_timeout, sslmode, ...) apply.
*/
class PgDriver final : public db::Driver {
 public:
  std::string_view Name() const override {
    return "postgres";
  }

  std::unique_ptr<Connection> Open(const std::string& connection_string) override;
};

} // namespace procdb::db::postgres
