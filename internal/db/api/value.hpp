#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "internal/util/time.hpp"

namespace procdb::db {

/*
  Value abstraction.

  One alternative per type family the drivers decode:
    null | bool | int64 | double | text | bytes | timestamp (UTC)

  Used for parameters and for every column of every row, so driver types
  never leak past the driver.
*/

using Bytes     = std::vector<uint8_t>;
using TimePoint = util::TimePoint;

using Value = std::variant<std::nullptr_t, bool, int64_t, double, std::string, Bytes, TimePoint>;

enum class ValueKind {
  Null = 0,
  Bool,
  Int64,
  Double,
  Text,
  Bytes,
  Timestamp
};

ValueKind        KindOf(const Value& value);
std::string_view KindName(ValueKind kind);

inline bool IsNull(const Value& value) {
  return std::holds_alternative<std::nullptr_t>(value);
}

// Text form for logs and diagnostics. Not a SQL literal.
std::string ToString(const Value& value);

namespace detail {

template <typename T>
struct IsOptional : std::false_type {};

template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T>
inline constexpr bool kAlwaysFalse = false;

[[noreturn]] void ThrowCoercion(const Value& value, std::string_view target);

} // namespace detail

/*
  Coerces a value to T.

    integral T    <- int64 (range checked), bool
    bool          <- bool, int64 (non-zero is true)
    floating T    <- double, int64
    std::string   <- text
    Bytes         <- bytes
    TimePoint     <- timestamp
    optional<U>   <- null as nullopt, otherwise as U
    Value         <- anything

  Everything else, null included, throws util::CoercionError.
*/
template <typename T>
T ValueAs(const Value& value) {
  if constexpr (detail::IsOptional<T>::value) {
    if (IsNull(value)) return std::nullopt;
    return ValueAs<typename T::value_type>(value);
  } else if constexpr (std::is_same_v<T, Value>) {
    return value;
  } else if constexpr (std::is_same_v<T, bool>) {
    if (const auto* b = std::get_if<bool>(&value)) return *b;
    if (const auto* i = std::get_if<int64_t>(&value)) return *i != 0;
    detail::ThrowCoercion(value, "bool");
  } else if constexpr (std::is_integral_v<T>) {
    int64_t raw = 0;
    if (const auto* i = std::get_if<int64_t>(&value)) {
      raw = *i;
    } else if (const auto* b = std::get_if<bool>(&value)) {
      raw = *b ? 1 : 0;
    } else {
      detail::ThrowCoercion(value, "integer");
    }

    if constexpr (std::is_unsigned_v<T>) {
      if (raw < 0 || static_cast<uint64_t>(raw) > std::numeric_limits<T>::max()) {
        detail::ThrowCoercion(value, "narrower unsigned integer");
      }
    } else if constexpr (sizeof(T) < sizeof(int64_t)) {
      if (raw < std::numeric_limits<T>::min() || raw > std::numeric_limits<T>::max()) {
        detail::ThrowCoercion(value, "narrower integer");
      }
    }
    return static_cast<T>(raw);
  } else if constexpr (std::is_floating_point_v<T>) {
    if (const auto* d = std::get_if<double>(&value)) return static_cast<T>(*d);
    if (const auto* i = std::get_if<int64_t>(&value)) return static_cast<T>(*i);
    detail::ThrowCoercion(value, "floating point");
  } else if constexpr (std::is_same_v<T, std::string>) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    detail::ThrowCoercion(value, "text");
  } else if constexpr (std::is_same_v<T, Bytes>) {
    if (const auto* b = std::get_if<Bytes>(&value)) return *b;
    detail::ThrowCoercion(value, "bytes");
  } else if constexpr (std::is_same_v<T, TimePoint>) {
    if (const auto* t = std::get_if<TimePoint>(&value)) return *t;
    detail::ThrowCoercion(value, "timestamp");
  } else {
    static_assert(detail::kAlwaysFalse<T>, "no coercion from db::Value to this type");
  }
}

} // namespace procdb::db
