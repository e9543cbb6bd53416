#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/driver.hpp"
#include "internal/db/api/table.hpp"

namespace procdb::db::memory {

/*
  What a registered procedure hands back: the affected-row count it reports
  and the result sets it produces, in order.
*/
struct ProcedureResult {
  int64_t            affected_rows = 0;
  std::vector<Table> result_sets;
};

// Receives the call's parameters; writes Output / InputOutput values in place.
using Procedure = std::function<ProcedureResult(Parameters& parameters)>;

/*
  MemoryDriver

  In-process backend. "Stored procedures" are callables registered by name
  (case-insensitive). Used by tests and when no database is configured.

  Design notes:
  -------------
  - Must be owned by a shared_ptr; connections keep the driver alive.
  - Registration and calls may run concurrently.
  - Connection accounting lets callers check that every connection opened
    was closed again.
*/
class MemoryDriver final : public Driver, public std::enable_shared_from_this<MemoryDriver> {
 public:
  MemoryDriver();

  std::string_view Name() const override {
    return "memory";
  }

  std::unique_ptr<Connection> Open(const std::string& connection_string) override;

  void Register(const std::string& name, Procedure procedure);

  // Every Open() throws util::ConnectionError(reason) until AcceptConnections().
  void RejectConnections(std::string reason);
  void AcceptConnections();

  uint64_t    OpenedConnections() const;
  uint64_t    LiveConnections() const;
  std::string LastConnectionString() const;

 private:
  friend class MemoryConnection;

  std::optional<Procedure> Find(const std::string& name) const;
  void                     Release();

  mutable std::mutex                         mutex_;
  std::unordered_map<std::string, Procedure> procedures_;
  std::optional<std::string>                 reject_reason_;
  std::string                                last_connection_string_;
  uint64_t                                   opened_ = 0;
  uint64_t                                   live_   = 0;
};

} // namespace procdb::db::memory
