#include "internal/db/mapping/record_map.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using procdb::db::Column;
using procdb::db::Row;
using procdb::db::Table;
using procdb::db::Value;
using procdb::mapping::RecordMap;

struct User {
  int64_t                    id = 0;
  std::string                name;
  std::optional<std::string> email;
  bool                       active = true;
};

Table UsersTable() {
  Table table;
  table.columns = {{"Id", "int8"}, {"NAME", "text"}, {"email", "text"}};
  table.rows.push_back({int64_t{1}, std::string("alice"), std::string("alice@example.com")});
  table.rows.push_back({int64_t{2}, std::string("bob"), nullptr});
  return table;
}

RecordMap<User> UserMap() {
  RecordMap<User> map;
  map.Bind("id", &User::id).Bind("name", &User::name).Bind("email", &User::email);
  return map;
}

void TestMapsByCaseInsensitiveName() {
  const auto users = UserMap().MapAll(UsersTable());
  assert(users.size() == 2);
  assert(users[0].id == 1);
  assert(users[0].name == "alice");
  assert(users[0].email == "alice@example.com");
  assert(users[1].id == 2);
  assert(users[1].name == "bob");
  assert(!users[1].email.has_value());
}

void TestMapsByOrdinal() {
  RecordMap<User> map;
  map.Bind(1, &User::name).Bind(0, &User::id);

  const auto table = UsersTable();
  const auto user  = map.Map(table.columns, table.rows[1]);
  assert(user.id == 2);
  assert(user.name == "bob");
}

void TestNullLeavesFactoryDefault() {
  RecordMap<User> map([] {
    User user;
    user.name = "unknown";
    return user;
  });
  map.Bind("name", &User::name);

  const std::vector<Column> columns{{"name", "text"}};
  const auto                user = map.Map(columns, Row{nullptr});
  assert(user.name == "unknown");
  assert(map.Default().name == "unknown");
}

void TestCustomSetterSeesEveryValue() {
  RecordMap<User> map;
  map.Bind("status", [](User& user, const Value& value) {
    user.active = !procdb::db::IsNull(value) && procdb::db::ValueAs<std::string>(value) == "active";
  });

  const std::vector<Column> columns{{"status", "text"}};
  assert(map.Map(columns, Row{std::string("active")}).active);
  assert(!map.Map(columns, Row{std::string("locked")}).active);
  assert(!map.Map(columns, Row{nullptr}).active);
  assert(map.BindingCount() == 1);
}

void TestMissingColumnIsMappingError() {
  RecordMap<User> map;
  map.Bind("display_name", &User::name);

  bool threw = false;
  try {
    (void)map.MapAll(UsersTable());
  } catch (const procdb::util::MappingError& e) {
    threw = std::string(e.what()).find("display_name") != std::string::npos;
  }
  assert(threw);
}

void TestEmptyTableSkipsColumnResolution() {
  RecordMap<User> map;
  map.Bind("display_name", &User::name);

  Table empty;
  empty.columns = {{"id", "int8"}};
  assert(map.MapAll(empty).empty());
}

void TestOrdinalOutOfRangeIsMappingError() {
  RecordMap<User> map;
  map.Bind(7, &User::name);

  const auto table = UsersTable();
  bool       threw = false;
  try {
    (void)map.Map(table.columns, table.rows[0]);
  } catch (const procdb::util::MappingError&) {
    threw = true;
  }
  assert(threw);
}

void TestIncompatibleTypeIsMappingError() {
  RecordMap<User> map;
  map.Bind("name", &User::id);

  const auto table = UsersTable();
  try {
    (void)map.Map(table.columns, table.rows[0]);
    assert(false && "expected MappingError");
  } catch (const procdb::util::MappingError& e) {
    assert(std::string(e.what()).find("'name'") != std::string::npos);
  }
}

void TestFindColumnMatchesResolution() {
  const auto table = UsersTable();
  assert(table.FindColumn("id") == 0u);
  assert(table.FindColumn("Email") == 2u);
  assert(!table.FindColumn("display_name").has_value());

  RecordMap<User> map;
  map.Bind("EMAIL", &User::email).Bind("name", &User::name);
  const auto ordinals = map.Resolve(table.columns);
  assert(ordinals.size() == 2);
  assert(ordinals[0] == *table.FindColumn("EMAIL"));
  assert(ordinals[1] == *table.FindColumn("name"));
}

void TestMappingErrorNamesColumnAndField() {
  const auto table = UsersTable();

  RecordMap<User> incompatible;
  incompatible.Bind("name", &User::id, "User::id");
  try {
    (void)incompatible.Map(table.columns, table.rows[0]);
    assert(false && "expected MappingError");
  } catch (const procdb::util::MappingError& e) {
    const std::string message = e.what();
    assert(message.find("'name'") != std::string::npos);
    assert(message.find("field 'User::id'") != std::string::npos);
  }

  RecordMap<User> missing;
  missing.Bind("display_name", &User::name, "User::name");
  try {
    (void)missing.MapAll(table);
    assert(false && "expected MappingError");
  } catch (const procdb::util::MappingError& e) {
    const std::string message = e.what();
    assert(message.find("'display_name'") != std::string::npos);
    assert(message.find("field 'User::name'") != std::string::npos);
  }

  RecordMap<User> out_of_range;
  out_of_range.Bind(9, [](User&, const Value&) {}, "User::active");
  try {
    (void)out_of_range.Map(table.columns, table.rows[0]);
    assert(false && "expected MappingError");
  } catch (const procdb::util::MappingError& e) {
    const std::string message = e.what();
    assert(message.find("#9") != std::string::npos);
    assert(message.find("field 'User::active'") != std::string::npos);
  }
}

} // namespace

int main() {
  TestMapsByCaseInsensitiveName();
  TestMapsByOrdinal();
  TestNullLeavesFactoryDefault();
  TestCustomSetterSeesEveryValue();
  TestMissingColumnIsMappingError();
  TestEmptyTableSkipsColumnResolution();
  TestOrdinalOutOfRangeIsMappingError();
  TestIncompatibleTypeIsMappingError();
  TestFindColumnMatchesResolution();
  TestMappingErrorNamesColumnAndField();

  std::cout << "procdb_unit_record_map: pass\n";
  return 0;
}
