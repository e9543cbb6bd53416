#include "internal/db/api/value.hpp"

#include <sstream>

#include "internal/util/errors.hpp"

namespace procdb::db {

ValueKind KindOf(const Value& value) {
  return static_cast<ValueKind>(value.index());
}

std::string_view KindName(ValueKind kind) {
  switch (kind) {
    case ValueKind::Null:
      return "null";
    case ValueKind::Bool:
      return "bool";
    case ValueKind::Int64:
      return "int64";
    case ValueKind::Double:
      return "double";
    case ValueKind::Text:
      return "text";
    case ValueKind::Bytes:
      return "bytes";
    case ValueKind::Timestamp:
      return "timestamp";
  }
  return "unknown";
}

std::string ToString(const Value& value) {
  std::ostringstream out;
  std::visit(
      [&out](const auto& v) {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::nullptr_t>) {
          out << "NULL";
        } else if constexpr (std::is_same_v<V, bool>) {
          out << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<V, double>) {
          out.precision(17);
          out << v;
        } else if constexpr (std::is_same_v<V, Bytes>) {
          static constexpr char kHex[] = "0123456789abcdef";
          out << "\\x";
          for (uint8_t byte : v) {
            out << kHex[(byte >> 4) & 0x0F] << kHex[byte & 0x0F];
          }
        } else if constexpr (std::is_same_v<V, TimePoint>) {
          out << util::FormatIsoTimestamp(v);
        } else {
          out << v;
        }
      },
      value);
  return out.str();
}

namespace detail {

void ThrowCoercion(const Value& value, std::string_view target) {
  std::string message = "cannot coerce ";
  message += KindName(KindOf(value));
  message += " value";
  if (!IsNull(value)) {
    message += " '" + ToString(value) + "'";
  }
  message += " to ";
  message += target;
  throw util::CoercionError(message);
}

} // namespace detail

} // namespace procdb::db
