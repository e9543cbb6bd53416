#pragma once

#include <stdexcept>
#include <string>

namespace procdb::util {

/*
  Central error types.

  Driver exceptions (pqxx::broken_connection, pqxx::sql_error, ...) are never
  translated into these; they reach the caller unchanged.
*/

// Memory driver refused to open a connection.
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Memory driver could not run the call (unknown procedure, malformed result).
class ExecutionError : public std::runtime_error {
 public:
  explicit ExecutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A value cannot be converted to the requested C++ type.
class CoercionError : public std::runtime_error {
 public:
  explicit CoercionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A row cannot populate the target record shape.
class MappingError : public std::runtime_error {
 public:
  explicit MappingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace procdb::util
