#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/db/api/connection.hpp"

namespace procdb::db {

/*
  Connection factory for one backend.

  Open() must be safe to call from several threads at once; each call
  returns an independent connection. Failures propagate as the backend's
  own exception type.
*/
class Driver {
 public:
  virtual ~Driver() = default;

  virtual std::string_view Name() const = 0;

  virtual std::unique_ptr<Connection> Open(const std::string& connection_string) = 0;
};

} // namespace procdb::db
