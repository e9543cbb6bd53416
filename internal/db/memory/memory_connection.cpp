#include "memory_connection.hpp"

#include <utility>

#include "internal/util/errors.hpp"
#include "memory_reader.hpp"

namespace procdb::db::memory {

MemoryConnection::MemoryConnection(std::shared_ptr<MemoryDriver> driver) : driver_(std::move(driver)) {
}

MemoryConnection::~MemoryConnection() {
  driver_->Release();
}

ProcedureResult MemoryConnection::Run(const std::string& procedure, Parameters& parameters) {
  auto callable = driver_->Find(procedure);
  if (!callable) {
    throw util::ExecutionError("procedure '" + procedure + "' does not exist");
  }

  // The procedure runs outside the driver lock so calls can overlap.
  auto result = (*callable)(parameters);

  if (result.affected_rows < 0) {
    throw util::ExecutionError("procedure '" + procedure + "' reported a negative affected-row count");
  }
  for (std::size_t t = 0; t < result.result_sets.size(); ++t) {
    const auto& table = result.result_sets[t];
    for (const auto& row : table.rows) {
      if (row.size() != table.columns.size()) {
        throw util::ExecutionError("procedure '" + procedure + "' result set " + std::to_string(t) + " has a row of " +
                                   std::to_string(row.size()) + " values for " + std::to_string(table.columns.size()) +
                                   " columns");
      }
    }
  }
  return result;
}

int64_t MemoryConnection::ExecuteNonQuery(const std::string& procedure, Parameters& parameters) {
  return Run(procedure, parameters).affected_rows;
}

std::unique_ptr<Reader> MemoryConnection::ExecuteReader(const std::string& procedure, Parameters& parameters) {
  return std::make_unique<MemoryReader>(Run(procedure, parameters).result_sets);
}

} // namespace procdb::db::memory
