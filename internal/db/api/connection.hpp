#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/parameter.hpp"
#include "internal/db/api/reader.hpp"

namespace procdb::db {

/*
  One open session with the database.

  Every command is a stored-procedure invocation; there is no way to send
  SQL text through this interface. Output and InputOutput parameters are
  updated in place once the procedure has run.

  Not thread-safe. Closing happens in the destructor.
*/
class Connection {
 public:
  virtual ~Connection() = default;

  // Returns the driver-reported affected-row count.
  virtual int64_t ExecuteNonQuery(const std::string& procedure, Parameters& parameters) = 0;

  // The reader may reference this connection and must be destroyed first.
  virtual std::unique_ptr<Reader> ExecuteReader(const std::string& procedure, Parameters& parameters) = 0;
};

} // namespace procdb::db
