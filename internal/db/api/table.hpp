#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/value.hpp"
#include "internal/util/strings.hpp"

namespace procdb::db {

struct Column {
  std::string name;
  std::string type; // driver type name, informational
};

// Case-insensitive, first match wins.
inline std::optional<std::size_t> FindColumn(const std::vector<Column>& columns, std::string_view name) {
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (util::EqualsIgnoreCase(columns[i].name, name)) return i;
  }
  return std::nullopt;
}

// One value per column, in driver-reported order.
using Row = std::vector<Value>;

/*
  One result set.

  Every row holds exactly columns.size() values.
*/
struct Table {
  std::vector<Column> columns;
  std::vector<Row>    rows;

  std::size_t ColumnCount() const {
    return columns.size();
  }

  bool Empty() const {
    return rows.empty();
  }

  std::optional<std::size_t> FindColumn(std::string_view name) const {
    return db::FindColumn(columns, name);
  }
};

// Every result set of one call, in the order the procedure produced them.
using DataSet = std::vector<Table>;

} // namespace procdb::db
