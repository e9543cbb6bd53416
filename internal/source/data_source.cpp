#include "data_source.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

#if PROCDB_DB_POSTGRES
#include "internal/db/postgres/pg_driver.hpp"
#endif

namespace procdb::source {
namespace {

using SteadyClock = std::chrono::steady_clock;

struct CallStats {
  int64_t rows        = -1;
  int64_t result_sets = -1;
};

int64_t ElapsedMicros(SteadyClock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - start).count();
}

/*
  Opens a connection, hands it to `call` and lets it go again on every exit
  path. The connection is gone before anything is logged.
*/
template <typename Call>
auto WithConnection(db::Driver& driver, const std::string& connection_string, std::string_view operation, const std::string& procedure,
                    const db::Parameters& parameters, Call&& call) {
  const auto start = SteadyClock::now();
  CallStats  stats;
  try {
    auto result = [&] {
      auto connection = driver.Open(connection_string);
      return call(*connection, stats);
    }();

    if (stats.result_sets >= 0) {
      PROCDB_LOG_DEBUG("stored procedure call", {observability::StringField("operation", operation), observability::StringField("procedure", procedure),
                                                 observability::IntField("parameters", static_cast<int64_t>(parameters.size())),
                                                 observability::IntField("elapsed_us", ElapsedMicros(start)), observability::IntField("rows", stats.rows),
                                                 observability::IntField("result_sets", stats.result_sets)});
    } else {
      PROCDB_LOG_DEBUG("stored procedure call", {observability::StringField("operation", operation), observability::StringField("procedure", procedure),
                                                 observability::IntField("parameters", static_cast<int64_t>(parameters.size())),
                                                 observability::IntField("elapsed_us", ElapsedMicros(start)), observability::IntField("rows", stats.rows)});
    }
    return result;
  } catch (const std::exception& e) {
    PROCDB_LOG_WARN("stored procedure call failed",
                    {observability::StringField("operation", operation), observability::StringField("procedure", procedure),
                     observability::IntField("elapsed_us", ElapsedMicros(start)), observability::StringField("error", e.what())});
    throw;
  }
}

db::Table ReadCurrent(db::Reader& reader, std::optional<std::size_t> row_limit) {
  db::Table table;
  table.columns = reader.Columns();
  while ((!row_limit || table.rows.size() < *row_limit) && reader.Read()) {
    table.rows.push_back(reader.Current());
  }
  return table;
}

} // namespace

DataSource::DataSource(std::string connection_string, std::shared_ptr<db::Driver> driver)
    : connection_string_(std::move(connection_string)), driver_(std::move(driver)) {
  if (!driver_) {
    throw std::invalid_argument("DataSource requires a driver");
  }
}

#if PROCDB_DB_POSTGRES
DataSource::DataSource(std::string connection_string)
    : DataSource(std::move(connection_string), std::make_shared<db::postgres::PgDriver>()) {
}
#endif

int64_t DataSource::Execute(const std::string& procedure, db::Parameters& parameters) const {
  return WithConnection(*driver_, connection_string_, "Execute", procedure, parameters, [&](db::Connection& connection, CallStats& stats) {
    const auto affected = connection.ExecuteNonQuery(procedure, parameters);
    stats.rows          = affected;
    return affected;
  });
}

int64_t DataSource::Execute(const std::string& procedure, db::Parameters&& parameters) const {
  return Execute(procedure, parameters);
}

db::Table DataSource::GetTable(const std::string& procedure, db::Parameters& parameters) const {
  return ReadFirstTable(procedure, parameters, std::nullopt, "GetTable");
}

db::Table DataSource::GetTable(const std::string& procedure, db::Parameters&& parameters) const {
  return GetTable(procedure, parameters);
}

db::DataSet DataSource::GetData(const std::string& procedure, db::Parameters& parameters) const {
  return WithConnection(*driver_, connection_string_, "GetData", procedure, parameters, [&](db::Connection& connection, CallStats& stats) {
    db::DataSet data;
    auto        reader = connection.ExecuteReader(procedure, parameters);
    while (reader->NextResult()) {
      data.push_back(ReadCurrent(*reader, std::nullopt));
    }
    reader->Close();

    stats.rows = 0;
    for (const auto& table : data) stats.rows += static_cast<int64_t>(table.rows.size());
    stats.result_sets = static_cast<int64_t>(data.size());
    return data;
  });
}

db::DataSet DataSource::GetData(const std::string& procedure, db::Parameters&& parameters) const {
  return GetData(procedure, parameters);
}

std::future<int64_t> DataSource::ExecuteAsync(std::string procedure, db::Parameters parameters) const {
  return std::async(std::launch::async, [this, procedure = std::move(procedure), parameters = std::move(parameters)]() mutable {
    return Execute(procedure, parameters);
  });
}

std::future<db::Table> DataSource::GetTableAsync(std::string procedure, db::Parameters parameters) const {
  return std::async(std::launch::async, [this, procedure = std::move(procedure), parameters = std::move(parameters)]() mutable {
    return GetTable(procedure, parameters);
  });
}

std::future<db::DataSet> DataSource::GetDataAsync(std::string procedure, db::Parameters parameters) const {
  return std::async(std::launch::async, [this, procedure = std::move(procedure), parameters = std::move(parameters)]() mutable {
    return GetData(procedure, parameters);
  });
}

std::optional<db::Value> DataSource::ReadScalar(const std::string& procedure, db::Parameters& parameters) const {
  auto head = ReadFirstTable(procedure, parameters, 1, "GetScalar");
  if (head.rows.empty() || head.rows.front().empty()) return std::nullopt;
  return std::move(head.rows.front().front());
}

db::Table DataSource::ReadFirstTable(const std::string& procedure, db::Parameters& parameters, std::optional<std::size_t> row_limit,
                                     std::string_view operation) const {
  return WithConnection(*driver_, connection_string_, operation, procedure, parameters, [&](db::Connection& connection, CallStats& stats) {
    db::Table table;
    auto      reader = connection.ExecuteReader(procedure, parameters);
    if (reader->NextResult()) {
      table = ReadCurrent(*reader, row_limit);
    }
    reader->Close();

    stats.rows = static_cast<int64_t>(table.rows.size());
    return table;
  });
}

} // namespace procdb::source
