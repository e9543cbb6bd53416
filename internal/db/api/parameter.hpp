#pragma once

#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/value.hpp"

namespace procdb::db {

enum class ParameterDirection {
  Input = 0,
  Output,
  InputOutput
};

/*
  Stored-procedure argument.

  Output and InputOutput parameters receive the value the procedure
  returned once the call completes. The name is passed to the driver as-is;
  an empty name binds positionally.
*/
struct Parameter {
  std::string        name;
  Value              value;
  ParameterDirection direction = ParameterDirection::Input;

  bool ReturnsValue() const {
    return direction != ParameterDirection::Input;
  }

  bool SendsValue() const {
    return direction != ParameterDirection::Output;
  }
};

using Parameters = std::vector<Parameter>;

inline Parameter MakeInputParameter(std::string name, Value value) {
  return {std::move(name), std::move(value), ParameterDirection::Input};
}

inline Parameter MakeInputOutputParameter(std::string name, Value value) {
  return {std::move(name), std::move(value), ParameterDirection::InputOutput};
}

inline Parameter MakeOutputParameter(std::string name) {
  return {std::move(name), nullptr, ParameterDirection::Output};
}

} // namespace procdb::db
