#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/table.hpp"
#include "internal/db/api/value.hpp"
#include "internal/util/errors.hpp"

namespace procdb::mapping {

/*
  Statically declared row -> record mapping.

  A map is built once per record shape and reused for every row:

    RecordMap<User> users;
    users.Bind("id", &User::id)
         .Bind("name", &User::name)
         .Bind(2, &User::email, "email");

  Bindings are keyed by column ordinal or by column name (case-insensitive).
  The optional last argument labels the record field in MappingError messages.
  Records start from the factory, T{} unless another one is supplied.

  Member bindings coerce with db::ValueAs. A SQL NULL leaves a plain member
  at the factory's value and sets an std::optional member to nullopt.
  Custom setters see every value, NULL included.
*/
template <typename Record>
class RecordMap {
 public:
  using Factory = std::function<Record()>;
  using Setter  = std::function<void(Record&, const db::Value&)>;

  RecordMap() : factory_([] { return Record{}; }) {
  }

  explicit RecordMap(Factory factory) : factory_(std::move(factory)) {
  }

  template <typename Field>
  RecordMap& Bind(std::size_t ordinal, Field Record::*member, std::string field = {}) {
    bindings_.push_back({ordinal, {}, std::move(field), MemberSetter(member)});
    return *this;
  }

  template <typename Field>
  RecordMap& Bind(std::string column, Field Record::*member, std::string field = {}) {
    bindings_.push_back({std::nullopt, std::move(column), std::move(field), MemberSetter(member)});
    return *this;
  }

  RecordMap& Bind(std::size_t ordinal, Setter setter, std::string field = {}) {
    bindings_.push_back({ordinal, {}, std::move(field), std::move(setter)});
    return *this;
  }

  RecordMap& Bind(std::string column, Setter setter, std::string field = {}) {
    bindings_.push_back({std::nullopt, std::move(column), std::move(field), std::move(setter)});
    return *this;
  }

  std::size_t BindingCount() const {
    return bindings_.size();
  }

  // Fresh record from the factory; what an absent row maps to.
  Record Default() const {
    return factory_();
  }

  // Resolves every binding to a column ordinal of `columns`.
  std::vector<std::size_t> Resolve(const std::vector<db::Column>& columns) const {
    std::vector<std::size_t> ordinals;
    ordinals.reserve(bindings_.size());
    for (const auto& binding : bindings_) {
      if (binding.ordinal) {
        ordinals.push_back(*binding.ordinal);
        continue;
      }

      const auto found = db::FindColumn(columns, binding.column);
      if (!found) {
        throw util::MappingError("column '" + binding.column + "'" + ForField(binding) +
                                 " is not present in the result set");
      }
      ordinals.push_back(*found);
    }
    return ordinals;
  }

  Record MapRow(const std::vector<std::size_t>& ordinals, const db::Row& row) const {
    Record record = factory_();
    for (std::size_t i = 0; i < bindings_.size(); ++i) {
      const auto ordinal = ordinals[i];
      if (ordinal >= row.size()) {
        throw util::MappingError("column " + Describe(i, ordinal) + " is out of range for a row of " +
                                 std::to_string(row.size()) + " values");
      }

      try {
        bindings_[i].setter(record, row[ordinal]);
      } catch (const util::CoercionError& e) {
        throw util::MappingError("column " + Describe(i, ordinal) + ": " + e.what());
      }
    }
    return record;
  }

  Record Map(const std::vector<db::Column>& columns, const db::Row& row) const {
    return MapRow(Resolve(columns), row);
  }

  std::vector<Record> MapAll(const db::Table& table) const {
    std::vector<Record> records;
    if (table.rows.empty()) return records;

    const auto ordinals = Resolve(table.columns);
    records.reserve(table.rows.size());
    for (const auto& row : table.rows) {
      records.push_back(MapRow(ordinals, row));
    }
    return records;
  }

 private:
  struct Binding {
    std::optional<std::size_t> ordinal;
    std::string                column;
    std::string                field;
    Setter                     setter;
  };

  template <typename Field>
  static Setter MemberSetter(Field Record::*member) {
    return [member](Record& record, const db::Value& value) {
      if constexpr (!db::detail::IsOptional<Field>::value) {
        if (db::IsNull(value)) return;
      }
      record.*member = db::ValueAs<Field>(value);
    };
  }

  static std::string ForField(const Binding& binding) {
    if (binding.field.empty()) return {};
    return " for field '" + binding.field + "'";
  }

  std::string Describe(std::size_t binding, std::size_t ordinal) const {
    const auto& bound  = bindings_[binding];
    std::string column = bound.column.empty() ? "#" + std::to_string(ordinal)
                                              : "'" + bound.column + "' (#" + std::to_string(ordinal) + ")";
    return column + ForField(bound);
  }

  Factory              factory_;
  std::vector<Binding> bindings_;
};

} // namespace procdb::mapping
