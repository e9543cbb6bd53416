#include "pg_driver.hpp"

#include "pg_connection.hpp"

namespace procdb::db::postgres {

std::unique_ptr<Connection> PgDriver::Open(const std::string& connection_string) {
  return std::make_unique<PgConnection>(connection_string);
}

} // namespace procdb::db::postgres
