#include "pg_connection.hpp"

#include "internal/util/strings.hpp"
#include "pg_call_builder.hpp"
#include "pg_reader.hpp"
#include "pg_value.hpp"

namespace procdb::db::postgres {

namespace {

pqxx::params ToParams(const PgCall& call) {
  pqxx::params params;
  for (const auto& argument : call.arguments) {
    if (argument) {
      params.append(*argument);
    } else {
      params.append();
    }
  }
  return params;
}

} // namespace

Value DecodeField(const pqxx::field& field) {
  if (field.is_null()) return nullptr;
  return DecodeText(field.type(), field.view());
}

void WriteBackOutputs(const pqxx::result& call_result, Parameters& parameters) {
  if (call_result.empty() || call_result.columns() == 0) return;

  const auto row = call_result[0];
  for (auto& parameter : parameters) {
    if (!parameter.ReturnsValue()) continue;

    const auto name = ParameterName(parameter.name);
    for (pqxx::row_size_type col = 0; col < call_result.columns(); ++col) {
      if (util::EqualsIgnoreCase(call_result.column_name(col), name)) {
        parameter.value = DecodeField(row[col]);
        break;
      }
    }
  }
}

PgConnection::PgConnection(const std::string& conninfo) : conn_(conninfo) {
  pqxx::nontransaction tx(conn_);
  for (const auto setting : kSessionSettings) {
    tx.exec(std::string(setting));
  }
}

int64_t PgConnection::ExecuteNonQuery(const std::string& procedure, Parameters& parameters) {
  const auto call = BuildCall(procedure, parameters);

  pqxx::nontransaction tx(conn_);
  auto                 result = tx.exec_params(call.sql, ToParams(call));
  WriteBackOutputs(result, parameters);
  return static_cast<int64_t>(result.affected_rows());
}

std::unique_ptr<Reader> PgConnection::ExecuteReader(const std::string& procedure, Parameters& parameters) {
  const auto call = BuildCall(procedure, parameters);

  auto tx     = std::make_unique<pqxx::work>(conn_);
  auto result = tx->exec_params(call.sql, ToParams(call));
  WriteBackOutputs(result, parameters);
  return std::make_unique<PgReader>(std::move(tx), std::move(result));
}

} // namespace procdb::db::postgres
