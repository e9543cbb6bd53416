#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/parameter.hpp"

namespace procdb::db::postgres {

/*
  Stored-procedure call text plus its positional arguments.

    CALL billing.close_invoice(invoice_id => $1, total => NULL)

  Arguments are in text format; nullopt is SQL NULL.
*/
struct PgCall {
  std::string                             sql;
  std::vector<std::optional<std::string>> arguments;
};

// quote_ident: left alone when it is a plain lower-case identifier, otherwise
// double-quoted with embedded quotes doubled. Keywords are not checked.
std::string QuoteIdentifier(std::string_view identifier);

// Splits on '.' outside quotes; already quoted parts are kept as written.
std::string QualifiedName(std::string_view procedure);

// Drops one leading '@', '?' or ':' (MySQL / ADO.NET style names).
std::string_view ParameterName(std::string_view name);

// Input and InputOutput values are bound as $n in order; Output is NULL.
// Named parameters use named notation, unnamed ones stay positional.
PgCall BuildCall(std::string_view procedure, const Parameters& parameters);

} // namespace procdb::db::postgres
