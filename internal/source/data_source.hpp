#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/db/api/driver.hpp"
#include "internal/db/api/parameter.hpp"
#include "internal/db/api/table.hpp"
#include "internal/db/api/value.hpp"
#include "internal/db/mapping/record_map.hpp"

namespace procdb::source {

/*
  DataSource

  Invokes stored procedures and hands the results back as tables, scalars
  or typed records.

  Every operation opens its own connection, issues exactly one
  stored-procedure call and closes the connection again before returning,
  whether the call succeeded or threw. Nothing is shared between calls but
  the connection string and the driver, so one instance may serve any
  number of threads.

  Errors are never caught and recovered: driver exceptions reach the caller
  unchanged; coercion and mapping problems surface as util::CoercionError /
  util::MappingError.

  Parameter lists passed as lvalues get their Output and InputOutput values
  written back once the call completes.
*/
class DataSource {
 public:
  DataSource(std::string connection_string, std::shared_ptr<db::Driver> driver);

#if PROCDB_DB_POSTGRES
  // PostgreSQL (libpqxx) driver.
  explicit DataSource(std::string connection_string);
#endif

  const std::string& ConnectionString() const {
    return connection_string_;
  }

  std::string_view DriverName() const {
    return driver_->Name();
  }

  // ---------------------------------------------------------------------
  // Parameters
  // ---------------------------------------------------------------------

  static db::Parameter MakeInputParameter(std::string name, db::Value value) {
    return db::MakeInputParameter(std::move(name), std::move(value));
  }

  static db::Parameter MakeInputOutputParameter(std::string name, db::Value value) {
    return db::MakeInputOutputParameter(std::move(name), std::move(value));
  }

  static db::Parameter MakeOutputParameter(std::string name) {
    return db::MakeOutputParameter(std::move(name));
  }

  static db::Parameter I(std::string name, db::Value value) {
    return MakeInputParameter(std::move(name), std::move(value));
  }

  static db::Parameter IO(std::string name, db::Value value) {
    return MakeInputOutputParameter(std::move(name), std::move(value));
  }

  static db::Parameter O(std::string name) {
    return MakeOutputParameter(std::move(name));
  }

  // ---------------------------------------------------------------------
  // Commands
  // ---------------------------------------------------------------------

  // Driver-reported affected-row count, passed through unchanged. PostgreSQL
  // CALL carries no row count, so the postgres driver always reports 0; the
  // memory driver reports whatever the registered procedure returns.
  int64_t Execute(const std::string& procedure, db::Parameters& parameters) const;
  int64_t Execute(const std::string& procedure, db::Parameters&& parameters = {}) const;

  // First column of the first row of the first result set; T{} when there
  // is no row or the value is NULL.
  template <typename T>
  T GetScalar(const std::string& procedure, db::Parameters& parameters) const {
    auto value = ReadScalar(procedure, parameters);
    if (!value || db::IsNull(*value)) return T{};
    return db::ValueAs<T>(*value);
  }

  template <typename T>
  T GetScalar(const std::string& procedure, db::Parameters&& parameters = {}) const {
    return GetScalar<T>(procedure, parameters);
  }

  // Like GetScalar, but nullopt when there is no row or the value is NULL.
  template <typename T>
  std::optional<T> FindScalar(const std::string& procedure, db::Parameters& parameters) const {
    auto value = ReadScalar(procedure, parameters);
    if (!value || db::IsNull(*value)) return std::nullopt;
    return db::ValueAs<T>(*value);
  }

  template <typename T>
  std::optional<T> FindScalar(const std::string& procedure, db::Parameters&& parameters = {}) const {
    return FindScalar<T>(procedure, parameters);
  }

  // First result set; empty table when the procedure produces none.
  db::Table GetTable(const std::string& procedure, db::Parameters& parameters) const;
  db::Table GetTable(const std::string& procedure, db::Parameters&& parameters = {}) const;

  template <typename T>
  std::vector<T> GetTable(const std::string& procedure, const mapping::RecordMap<T>& map, db::Parameters& parameters) const {
    return map.MapAll(GetTable(procedure, parameters));
  }

  template <typename T>
  std::vector<T> GetTable(const std::string& procedure, const mapping::RecordMap<T>& map, db::Parameters&& parameters = {}) const {
    return GetTable(procedure, map, parameters);
  }

  // First row of the first result set; map.Default() when there is none.
  template <typename T>
  T GetRecord(const std::string& procedure, const mapping::RecordMap<T>& map, db::Parameters& parameters) const {
    auto head = ReadFirstTable(procedure, parameters, 1, "GetRecord");
    if (head.rows.empty()) return map.Default();
    return map.Map(head.columns, head.rows.front());
  }

  template <typename T>
  T GetRecord(const std::string& procedure, const mapping::RecordMap<T>& map, db::Parameters&& parameters = {}) const {
    return GetRecord(procedure, map, parameters);
  }

  // Like GetRecord, but nullopt when there is no row.
  template <typename T>
  std::optional<T> FindRecord(const std::string& procedure, const mapping::RecordMap<T>& map, db::Parameters& parameters) const {
    auto head = ReadFirstTable(procedure, parameters, 1, "FindRecord");
    if (head.rows.empty()) return std::nullopt;
    return map.Map(head.columns, head.rows.front());
  }

  template <typename T>
  std::optional<T> FindRecord(const std::string& procedure, const mapping::RecordMap<T>& map, db::Parameters&& parameters = {}) const {
    return FindRecord(procedure, map, parameters);
  }

  // Every result set, in the order the procedure produced them.
  db::DataSet GetData(const std::string& procedure, db::Parameters& parameters) const;
  db::DataSet GetData(const std::string& procedure, db::Parameters&& parameters = {}) const;

  // ---------------------------------------------------------------------
  // Async variants
  //
  // Run on their own thread. Parameters are taken by value, so output
  // values are not observable. The DataSource must outlive the future.
  // ---------------------------------------------------------------------

  std::future<int64_t> ExecuteAsync(std::string procedure, db::Parameters parameters = {}) const;

  template <typename T>
  std::future<T> GetScalarAsync(std::string procedure, db::Parameters parameters = {}) const {
    return std::async(std::launch::async, [this, procedure = std::move(procedure), parameters = std::move(parameters)]() mutable {
      return GetScalar<T>(procedure, parameters);
    });
  }

  std::future<db::Table> GetTableAsync(std::string procedure, db::Parameters parameters = {}) const;

  template <typename T>
  std::future<std::vector<T>> GetTableAsync(std::string procedure, mapping::RecordMap<T> map, db::Parameters parameters = {}) const {
    return std::async(std::launch::async,
                      [this, procedure = std::move(procedure), map = std::move(map), parameters = std::move(parameters)]() mutable {
                        return GetTable(procedure, map, parameters);
                      });
  }

  template <typename T>
  std::future<T> GetRecordAsync(std::string procedure, mapping::RecordMap<T> map, db::Parameters parameters = {}) const {
    return std::async(std::launch::async,
                      [this, procedure = std::move(procedure), map = std::move(map), parameters = std::move(parameters)]() mutable {
                        return GetRecord(procedure, map, parameters);
                      });
  }

  std::future<db::DataSet> GetDataAsync(std::string procedure, db::Parameters parameters = {}) const;

 private:
  // nullopt when the first result set has no row (or there is none).
  std::optional<db::Value> ReadScalar(const std::string& procedure, db::Parameters& parameters) const;

  db::Table ReadFirstTable(const std::string& procedure, db::Parameters& parameters, std::optional<std::size_t> row_limit,
                           std::string_view operation) const;

  std::string                 connection_string_;
  std::shared_ptr<db::Driver> driver_;
};

} // namespace procdb::source
