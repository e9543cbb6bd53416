#include "pg_value.hpp"

#include <charconv>
#include <system_error>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace procdb::db::postgres {

namespace {

[[noreturn]] void BadField(Oid type, std::string_view text) {
  throw util::CoercionError("cannot decode " + TypeName(type) + " value '" + std::string(text) + "'");
}

int64_t ParseInt(Oid type, std::string_view text) {
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) BadField(type, text);
  return value;
}

double ParseDouble(Oid type, std::string_view text) {
  double value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) BadField(type, text);
  return value;
}

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

Value DecodeText(Oid type, std::string_view text) {
  switch (type) {
    case type_oid::kBool:
      if (text == "t" || text == "true") return true;
      if (text == "f" || text == "false") return false;
      BadField(type, text);

    case type_oid::kInt2:
    case type_oid::kInt4:
    case type_oid::kInt8:
    case type_oid::kOid:
      return ParseInt(type, text);

    case type_oid::kFloat4:
    case type_oid::kFloat8:
    case type_oid::kNumeric:
      return ParseDouble(type, text);

    case type_oid::kBytea:
      return DecodeBytea(text);

    case type_oid::kDate:
    case type_oid::kTimestamp:
    case type_oid::kTimestampTz:
      return util::ParseIsoTimestamp(text);

    default:
      return std::string(text);
  }
}

std::optional<std::string> EncodeValue(const Value& value) {
  return std::visit(
      [](const auto& v) -> std::optional<std::string> {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::nullptr_t>) {
          return std::nullopt;
        } else if constexpr (std::is_same_v<V, bool>) {
          return std::string(v ? "true" : "false");
        } else if constexpr (std::is_same_v<V, int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<V, double>) {
          char buffer[32];
          auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), v);
          return std::string(buffer, ptr);
        } else if constexpr (std::is_same_v<V, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<V, Bytes>) {
          return EncodeBytea(v);
        } else {
          return util::FormatIsoTimestamp(v);
        }
      },
      value);
}

std::string EncodeBytea(const Bytes& bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out    = "\\x";
  out.reserve(2 + bytes.size() * 2);
  for (uint8_t byte : bytes) {
    out.push_back(kHex[(byte >> 4) & 0x0F]);
    out.push_back(kHex[byte & 0x0F]);
  }
  return out;
}

Bytes DecodeBytea(std::string_view text) {
  if (text.size() < 2 || text[0] != '\\' || text[1] != 'x' || text.size() % 2 != 0) {
    BadField(type_oid::kBytea, text);
  }

  Bytes bytes;
  bytes.reserve((text.size() - 2) / 2);
  for (std::size_t i = 2; i < text.size(); i += 2) {
    const int hi = HexNibble(text[i]);
    const int lo = HexNibble(text[i + 1]);
    if (hi < 0 || lo < 0) BadField(type_oid::kBytea, text);
    bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return bytes;
}

std::string TypeName(Oid type) {
  switch (type) {
    case type_oid::kBool:
      return "bool";
    case type_oid::kBytea:
      return "bytea";
    case type_oid::kInt8:
      return "int8";
    case type_oid::kInt2:
      return "int2";
    case type_oid::kInt4:
      return "int4";
    case type_oid::kText:
      return "text";
    case type_oid::kOid:
      return "oid";
    case type_oid::kFloat4:
      return "float4";
    case type_oid::kFloat8:
      return "float8";
    case type_oid::kBpchar:
      return "bpchar";
    case type_oid::kVarchar:
      return "varchar";
    case type_oid::kDate:
      return "date";
    case type_oid::kTimestamp:
      return "timestamp";
    case type_oid::kTimestampTz:
      return "timestamptz";
    case type_oid::kNumeric:
      return "numeric";
    case type_oid::kRefCursor:
      return "refcursor";
  }
  return "oid:" + std::to_string(type);
}

} // namespace procdb::db::postgres
