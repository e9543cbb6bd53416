#pragma once

#include <memory>

#include "internal/db/api/connection.hpp"
#include "memory_driver.hpp"

namespace procdb::db::memory {

class MemoryConnection final : public db::Connection {
 public:
  explicit MemoryConnection(std::shared_ptr<MemoryDriver> driver);
  ~MemoryConnection() override;

  MemoryConnection(const MemoryConnection&)            = delete;
  MemoryConnection& operator=(const MemoryConnection&) = delete;

  int64_t                 ExecuteNonQuery(const std::string& procedure, Parameters& parameters) override;
  std::unique_ptr<Reader> ExecuteReader(const std::string& procedure, Parameters& parameters) override;

 private:
  ProcedureResult Run(const std::string& procedure, Parameters& parameters);

  std::shared_ptr<MemoryDriver> driver_;
};

} // namespace procdb::db::memory
