#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/value.hpp"

namespace procdb::db::postgres {

/*
  Text-format codec between PostgreSQL and db::Value.

  Kept free of pqxx types so it can be exercised without a server.
*/

using Oid = uint32_t;

namespace type_oid {
inline constexpr Oid kBool        = 16;
inline constexpr Oid kBytea       = 17;
inline constexpr Oid kInt8        = 20;
inline constexpr Oid kInt2        = 21;
inline constexpr Oid kInt4        = 23;
inline constexpr Oid kText        = 25;
inline constexpr Oid kOid         = 26;
inline constexpr Oid kFloat4      = 700;
inline constexpr Oid kFloat8      = 701;
inline constexpr Oid kBpchar      = 1042;
inline constexpr Oid kVarchar     = 1043;
inline constexpr Oid kDate        = 1082;
inline constexpr Oid kTimestamp   = 1114;
inline constexpr Oid kTimestampTz = 1184;
inline constexpr Oid kNumeric     = 1700;
inline constexpr Oid kRefCursor   = 1790;
} // namespace type_oid

// Session settings the text codec depends on. Run on every new connection so
// server or role defaults (DateStyle 'SQL, DMY', bytea_output 'escape') cannot
// change the wire format.
inline constexpr std::array<std::string_view, 4> kSessionSettings{
    "SET TIME ZONE 'UTC'",
    "SET DateStyle = 'ISO'",
    "SET bytea_output = 'hex'",
    "SET extra_float_digits = 3",
};

// Decodes a non-NULL field. Unknown types decode as text.
Value DecodeText(Oid type, std::string_view text);

// nullopt for NULL.
std::optional<std::string> EncodeValue(const Value& value);

// Hex bytea format ("\x0aff").
std::string EncodeBytea(const Bytes& bytes);
Bytes       DecodeBytea(std::string_view text);

std::string TypeName(Oid type);

} // namespace procdb::db::postgres
