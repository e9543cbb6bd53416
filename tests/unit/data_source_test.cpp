#include "internal/source/data_source.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/memory/memory_driver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace {

using procdb::db::DataSet;
using procdb::db::ParameterDirection;
using procdb::db::Parameters;
using procdb::db::Table;
using procdb::db::Value;
using procdb::db::memory::MemoryDriver;
using procdb::db::memory::ProcedureResult;
using procdb::mapping::RecordMap;
using procdb::source::DataSource;

struct User {
  int64_t                    id = 0;
  std::string                name;
  std::optional<std::string> email;
};

Table UsersTable() {
  Table users;
  users.columns = {{"id", "int8"}, {"name", "text"}, {"email", "text"}};
  users.rows.push_back({int64_t{1}, std::string("alice"), std::string("alice@example.com")});
  users.rows.push_back({int64_t{2}, std::string("bob"), nullptr});
  return users;
}

const Value* FindParameter(const Parameters& parameters, const std::string& name) {
  for (const auto& parameter : parameters) {
    if (procdb::util::EqualsIgnoreCase(parameter.name, name)) return &parameter.value;
  }
  return nullptr;
}

std::shared_ptr<MemoryDriver> SeededDriver() {
  auto driver = std::make_shared<MemoryDriver>();

  driver->Register("sp_update_counter", [](Parameters&) { return ProcedureResult{3, {}}; });

  driver->Register("sp_count_items", [](Parameters&) {
    Table counts;
    counts.columns = {{"count", "int8"}};
    return ProcedureResult{0, {counts}};
  });

  driver->Register("sp_null_scalar", [](Parameters&) {
    Table scalar;
    scalar.columns = {{"value", "int8"}};
    scalar.rows.push_back({nullptr});
    return ProcedureResult{0, {scalar}};
  });

  driver->Register("sp_no_results", [](Parameters&) { return ProcedureResult{}; });

  driver->Register("sp_list_users", [](Parameters&) { return ProcedureResult{0, {UsersTable()}}; });

  driver->Register("sp_get_user", [](Parameters& parameters) {
    const auto* id    = FindParameter(parameters, "@id");
    auto        users = UsersTable();
    Table       match;
    match.columns = users.columns;
    for (const auto& row : users.rows) {
      if (id && row[0] == *id) match.rows.push_back(row);
    }
    return ProcedureResult{0, {match}};
  });

  driver->Register("sp_user_report", [](Parameters&) {
    Table totals;
    totals.columns = {{"total", "int8"}, {"active", "bool"}};
    totals.rows.push_back({int64_t{2}, true});
    return ProcedureResult{0, {UsersTable(), totals}};
  });

  driver->Register("sp_add", [](Parameters& parameters) {
    int64_t a = 0;
    int64_t b = 0;
    for (auto& parameter : parameters) {
      if (parameter.name == "@a") a = procdb::db::ValueAs<int64_t>(parameter.value);
      if (parameter.name == "@b") b = procdb::db::ValueAs<int64_t>(parameter.value);
    }
    for (auto& parameter : parameters) {
      if (parameter.name == "@sum") parameter.value = a + b;
      if (parameter.name == "@calls") parameter.value = procdb::db::ValueAs<int64_t>(parameter.value) + 1;
    }
    return ProcedureResult{1, {}};
  });

  driver->Register("sp_fail", [](Parameters&) -> ProcedureResult { throw std::logic_error("constraint violated"); });

  driver->Register("sp_bad_width", [](Parameters&) {
    Table broken;
    broken.columns = {{"a", "int8"}, {"b", "int8"}};
    broken.rows.push_back({int64_t{1}});
    return ProcedureResult{0, {broken}};
  });

  return driver;
}

RecordMap<User> UserMap() {
  RecordMap<User> map;
  map.Bind("id", &User::id).Bind("name", &User::name).Bind("email", &User::email);
  return map;
}

void TestParameterFactories() {
  const auto input = DataSource::MakeInputParameter("@id", int64_t{5});
  assert(input.name == "@id");
  assert(input.direction == ParameterDirection::Input);
  assert(input.value == Value{int64_t{5}});

  const auto inout = DataSource::MakeInputOutputParameter("@calls", int64_t{0});
  assert(inout.direction == ParameterDirection::InputOutput);
  assert(inout.value == Value{int64_t{0}});

  const auto output = DataSource::MakeOutputParameter("@sum");
  assert(output.direction == ParameterDirection::Output);
  assert(procdb::db::IsNull(output.value));

  assert(DataSource::I("", std::string("x")).direction == ParameterDirection::Input);
  assert(DataSource::IO("x", nullptr).direction == ParameterDirection::InputOutput);
  assert(DataSource::O("x").direction == ParameterDirection::Output);
}

void TestExecuteReturnsAffectedRows() {
  auto       driver = SeededDriver();
  DataSource source("memory://unit", driver);

  assert(source.Execute("sp_update_counter") == 3);
  assert(source.Execute("SP_UPDATE_COUNTER") == 3);
  assert(driver->OpenedConnections() == 2);
  assert(driver->LiveConnections() == 0);
  assert(driver->LastConnectionString() == "memory://unit");
  assert(source.DriverName() == "memory");
}

void TestGetScalarDefaultsWhenAbsentOrNull() {
  auto       driver = SeededDriver();
  DataSource source("memory://unit", driver);

  assert(source.GetScalar<int>("sp_count_items") == 0);
  assert(source.GetScalar<int64_t>("sp_null_scalar") == 0);
  assert(source.GetScalar<std::string>("sp_no_results").empty());
  assert(source.GetScalar<int64_t>("sp_list_users") == 1);

  assert(!source.FindScalar<int>("sp_count_items").has_value());
  assert(!source.FindScalar<int64_t>("sp_null_scalar").has_value());
  assert(source.FindScalar<int64_t>("sp_list_users") == 1);
  assert(driver->LiveConnections() == 0);
}

void TestGetScalarCoercion() {
  auto       driver = SeededDriver();
  DataSource source("memory://unit", driver);

  // int8 first column: widens to double, non-zero is true
  assert(source.GetScalar<double>("sp_get_user", {DataSource::I("@id", int64_t{2})}) == 2.0);
  assert(source.GetScalar<bool>("sp_user_report"));

  bool threw = false;
  try {
    (void)source.GetScalar<std::string>("sp_list_users");
  } catch (const procdb::util::CoercionError&) {
    threw = true;
  }
  assert(threw);
  assert(driver->LiveConnections() == 0);
}

void TestGetTablePreservesOrder() {
  auto       driver = SeededDriver();
  DataSource source("memory://unit", driver);

  const auto users = source.GetTable("sp_list_users");
  assert(users.ColumnCount() == 3);
  assert(users.columns[0].name == "id");
  assert(users.columns[1].name == "name");
  assert(users.columns[2].name == "email");
  assert(users.rows.size() == 2);
  for (const auto& row : users.rows) assert(row.size() == 3);
  assert(users.rows[0][1] == Value{std::string("alice")});
  assert(users.rows[1][1] == Value{std::string("bob")});
  assert(procdb::db::IsNull(users.rows[1][2]));

  assert(source.GetTable("sp_no_results").columns.empty());
  assert(source.GetTable("sp_no_results").Empty());
  assert(driver->LiveConnections() == 0);
}

void TestTypedTableAndRecord() {
  auto       driver = SeededDriver();
  DataSource source("memory://unit", driver);
  const auto map = UserMap();

  const auto users = source.GetTable("sp_list_users", map);
  assert(users.size() == 2);
  assert(users[0].name == "alice");
  assert(users[1].id == 2);
  assert(!users[1].email.has_value());

  const auto bob = source.GetRecord("sp_get_user", map, {DataSource::I("@id", int64_t{2})});
  assert(bob.id == 2);
  assert(bob.name == "bob");

  const auto nobody = source.GetRecord("sp_get_user", map, {DataSource::I("@id", int64_t{99})});
  assert(nobody.id == 0);
  assert(nobody.name.empty());

  assert(source.FindRecord("sp_get_user", map, {DataSource::I("@id", int64_t{1})}).has_value());
  assert(!source.FindRecord("sp_get_user", map, {DataSource::I("@id", int64_t{99})}).has_value());
  assert(source.GetTable("sp_no_results", map).empty());
  assert(driver->LiveConnections() == 0);
}

void TestMappingErrorReleasesConnection() {
  auto       driver = SeededDriver();
  DataSource source("memory://unit", driver);

  RecordMap<User> map;
  map.Bind("login", &User::name);

  bool threw = false;
  try {
    (void)source.GetTable("sp_list_users", map);
  } catch (const procdb::util::MappingError&) {
    threw = true;
  }
  assert(threw);
  assert(driver->LiveConnections() == 0);
}

void TestGetDataReturnsAllResultSets() {
  auto       driver = SeededDriver();
  DataSource source("memory://unit", driver);

  const DataSet data = source.GetData("sp_user_report");
  assert(data.size() == 2);
  assert(data[0].rows.size() == 2);
  assert(data[0].rows[0][0] == Value{int64_t{1}});
  assert(data[0].rows[1][0] == Value{int64_t{2}});
  assert(data[1].columns[0].name == "total");
  assert(data[1].rows[0][1] == Value{true});

  assert(source.GetData("sp_no_results").empty());
  assert(source.GetData("sp_update_counter").empty());
  assert(driver->LiveConnections() == 0);
}

void TestOutputParametersAreWrittenBack() {
  auto       driver = SeededDriver();
  DataSource source("memory://unit", driver);

  Parameters parameters{DataSource::I("@a", int64_t{2}), DataSource::I("@b", int64_t{40}), DataSource::O("@sum"),
                        DataSource::IO("@calls", int64_t{7})};
  assert(source.Execute("sp_add", parameters) == 1);
  assert(parameters[2].value == Value{int64_t{42}});
  assert(parameters[3].value == Value{int64_t{8}});
  assert(parameters[0].value == Value{int64_t{2}});

  // rvalue lists are accepted; nothing to observe afterwards
  assert(source.Execute("sp_add", {DataSource::I("@a", int64_t{1}), DataSource::I("@b", int64_t{1}), DataSource::O("@sum"),
                                   DataSource::IO("@calls", int64_t{0})}) == 1);
}

void TestFailuresPropagateAndReleaseConnections() {
  auto       driver = SeededDriver();
  DataSource source("memory://unit", driver);

  bool threw = false;
  try {
    (void)source.Execute("sp_fail");
  } catch (const std::logic_error& e) {
    threw = std::string(e.what()) == "constraint violated";
  }
  assert(threw);

  threw = false;
  try {
    (void)source.GetData("sp_missing");
  } catch (const procdb::util::ExecutionError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)source.GetTable("sp_bad_width");
  } catch (const procdb::util::ExecutionError&) {
    threw = true;
  }
  assert(threw);

  assert(driver->OpenedConnections() == 3);
  assert(driver->LiveConnections() == 0);
}

void TestConnectionFailurePropagates() {
  auto       driver = SeededDriver();
  DataSource source("memory://unit", driver);

  driver->RejectConnections("database is down");
  bool threw = false;
  try {
    (void)source.GetScalar<int>("sp_count_items");
  } catch (const procdb::util::ConnectionError& e) {
    threw = std::string(e.what()) == "database is down";
  }
  assert(threw);
  assert(driver->OpenedConnections() == 0);

  driver->AcceptConnections();
  assert(source.Execute("sp_update_counter") == 3);
}

void TestNullDriverIsRejected() {
  bool threw = false;
  try {
    DataSource source("memory://unit", nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestAsyncVariants() {
  auto       driver = SeededDriver();
  DataSource source("memory://unit", driver);

  auto executed = source.ExecuteAsync("sp_update_counter");
  auto scalar   = source.GetScalarAsync<int64_t>("sp_list_users");
  auto table    = source.GetTableAsync("sp_list_users");
  auto users    = source.GetTableAsync("sp_list_users", UserMap());
  auto record   = source.GetRecordAsync("sp_get_user", UserMap(), {DataSource::I("@id", int64_t{1})});
  auto data     = source.GetDataAsync("sp_user_report");
  auto failing  = source.ExecuteAsync("sp_fail");

  assert(executed.get() == 3);
  assert(scalar.get() == 1);
  assert(table.get().rows.size() == 2);
  assert(users.get().size() == 2);
  assert(record.get().name == "alice");
  assert(data.get().size() == 2);

  bool threw = false;
  try {
    (void)failing.get();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(driver->OpenedConnections() == 7);
  assert(driver->LiveConnections() == 0);
}

void TestConcurrentCallsShareOneDataSource() {
  auto       driver = SeededDriver();
  DataSource source("memory://unit", driver);

  constexpr int            kThreads = 8;
  constexpr int            kCalls   = 25;
  std::vector<std::thread> threads;
  std::vector<int64_t>     totals(kThreads, 0);
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kCalls; ++i) {
        totals[t] += source.Execute("sp_update_counter");
        totals[t] += static_cast<int64_t>(source.GetTable("sp_list_users").rows.size());
      }
    });
  }
  for (auto& thread : threads) thread.join();

  for (const auto total : totals) assert(total == kCalls * 5);
  assert(driver->OpenedConnections() == static_cast<uint64_t>(kThreads * kCalls * 2));
  assert(driver->LiveConnections() == 0);
}

} // namespace

int main() {
  procdb::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("debug");
  procdb::observability::InitializeLogging(config);

  TestParameterFactories();
  TestExecuteReturnsAffectedRows();
  TestGetScalarDefaultsWhenAbsentOrNull();
  TestGetScalarCoercion();
  TestGetTablePreservesOrder();
  TestTypedTableAndRecord();
  TestMappingErrorReleasesConnection();
  TestGetDataReturnsAllResultSets();
  TestOutputParametersAreWrittenBack();
  TestFailuresPropagateAndReleaseConnections();
  TestConnectionFailurePropagates();
  TestNullDriverIsRejected();
  TestAsyncVariants();
  TestConcurrentCallsShareOneDataSource();

  procdb::observability::ShutdownLogging();
  std::cout << "procdb_unit_data_source: pass\n";
  return 0;
}
