#include "pg_call_builder.hpp"

#include "internal/util/errors.hpp"
#include "pg_value.hpp"

namespace procdb::db::postgres {

namespace {

bool IsPlainIdentifier(std::string_view identifier) {
  if (identifier.empty()) return false;
  const char first = identifier.front();
  if (!((first >= 'a' && first <= 'z') || first == '_')) return false;
  for (char c : identifier) {
    if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '$')) return false;
  }
  return true;
}

} // namespace

std::string QuoteIdentifier(std::string_view identifier) {
  if (IsPlainIdentifier(identifier)) return std::string(identifier);

  std::string quoted;
  quoted.reserve(identifier.size() + 2);
  quoted.push_back('"');
  for (char c : identifier) {
    if (c == '"') quoted.push_back('"');
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

std::string QualifiedName(std::string_view procedure) {
  std::vector<std::string_view> parts;
  std::size_t                   start     = 0;
  bool                          in_quotes = false;
  for (std::size_t i = 0; i < procedure.size(); ++i) {
    if (procedure[i] == '"') {
      in_quotes = !in_quotes;
    } else if (procedure[i] == '.' && !in_quotes) {
      parts.push_back(procedure.substr(start, i - start));
      start = i + 1;
    }
  }
  parts.push_back(procedure.substr(start));

  std::string qualified;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    const auto part = parts[i];
    if (part.empty()) {
      throw util::ExecutionError("invalid procedure name '" + std::string(procedure) + "'");
    }
    if (i > 0) qualified.push_back('.');
    if (part.size() >= 2 && part.front() == '"' && part.back() == '"') {
      qualified.append(part);
    } else {
      qualified += QuoteIdentifier(part);
    }
  }
  return qualified;
}

std::string_view ParameterName(std::string_view name) {
  if (!name.empty() && (name.front() == '@' || name.front() == '?' || name.front() == ':')) {
    name.remove_prefix(1);
  }
  return name;
}

PgCall BuildCall(std::string_view procedure, const Parameters& parameters) {
  PgCall call;
  call.sql = "CALL " + QualifiedName(procedure) + "(";

  for (std::size_t i = 0; i < parameters.size(); ++i) {
    const auto& parameter = parameters[i];
    if (i > 0) call.sql += ", ";

    const auto name = ParameterName(parameter.name);
    if (!name.empty()) {
      call.sql += QuoteIdentifier(name);
      call.sql += " => ";
    }

    if (parameter.SendsValue()) {
      call.arguments.push_back(EncodeValue(parameter.value));
      call.sql += "$" + std::to_string(call.arguments.size());
    } else {
      call.sql += "NULL";
    }
  }

  call.sql += ")";
  return call;
}

} // namespace procdb::db::postgres
