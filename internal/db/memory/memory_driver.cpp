#include "memory_driver.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "memory_connection.hpp"

namespace procdb::db::memory {

MemoryDriver::MemoryDriver() = default;

std::unique_ptr<Connection> MemoryDriver::Open(const std::string& connection_string) {
  {
    std::lock_guard lock(mutex_);
    last_connection_string_ = connection_string;
    if (reject_reason_) {
      throw util::ConnectionError(*reject_reason_);
    }
  }

  // Throws std::bad_weak_ptr when the driver is not owned by a shared_ptr.
  auto connection = std::make_unique<MemoryConnection>(shared_from_this());

  std::lock_guard lock(mutex_);
  ++opened_;
  ++live_;
  return connection;
}

void MemoryDriver::Register(const std::string& name, Procedure procedure) {
  std::lock_guard lock(mutex_);
  procedures_[util::ToLower(name)] = std::move(procedure);
}

void MemoryDriver::RejectConnections(std::string reason) {
  std::lock_guard lock(mutex_);
  reject_reason_ = std::move(reason);
}

void MemoryDriver::AcceptConnections() {
  std::lock_guard lock(mutex_);
  reject_reason_.reset();
}

uint64_t MemoryDriver::OpenedConnections() const {
  std::lock_guard lock(mutex_);
  return opened_;
}

uint64_t MemoryDriver::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_;
}

std::string MemoryDriver::LastConnectionString() const {
  std::lock_guard lock(mutex_);
  return last_connection_string_;
}

std::optional<Procedure> MemoryDriver::Find(const std::string& name) const {
  std::lock_guard lock(mutex_);
  auto            it = procedures_.find(util::ToLower(name));
  if (it == procedures_.end()) return std::nullopt;
  return it->second;
}

void MemoryDriver::Release() {
  std::lock_guard lock(mutex_);
  --live_;
}

} // namespace procdb::db::memory
