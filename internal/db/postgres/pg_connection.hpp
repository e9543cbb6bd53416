#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/connection.hpp"

namespace procdb::db::postgres {

/*
  PgConnection

  - ExecuteNonQuery runs the CALL in autocommit mode (pqxx::nontransaction).
  - ExecuteReader runs it inside a pqxx::work so refcursors the procedure
    returns stay open until the reader has fetched them.
  - OUT / INOUT values come back as the CALL's single row and are copied
    into the matching parameters by name.

  The session time zone is pinned to UTC so timestamptz text decodes
  without a local offset.
*/
class PgConnection final : public db::Connection {
 public:
  explicit PgConnection(const std::string& conninfo);

  PgConnection(const PgConnection&)            = delete;
  PgConnection& operator=(const PgConnection&) = delete;

  int64_t                 ExecuteNonQuery(const std::string& procedure, Parameters& parameters) override;
  std::unique_ptr<Reader> ExecuteReader(const std::string& procedure, Parameters& parameters) override;

 private:
  pqxx::connection conn_;
};

// Copies OUT / INOUT values from the CALL's row into `parameters`.
void WriteBackOutputs(const pqxx::result& call_result, Parameters& parameters);

// NULL-aware decode of one field.
Value DecodeField(const pqxx::field& field);

} // namespace procdb::db::postgres
