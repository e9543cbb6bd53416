#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/api/reader.hpp"

namespace procdb::db::postgres {

/*
  PgReader

  Result sets of a CALL:

  - Every refcursor column of the CALL's row is one result set, in column
    order. Rows are streamed with FETCH FORWARD <fetch_size>.
  - Without refcursor columns, the CALL's own row (OUT values) is the only
    result set. A CALL without columns has none.

  Owns the transaction the cursors live in. Close() commits it; destroying
  an unclosed reader rolls it back.
*/
class PgReader final : public db::Reader {
 public:
  static constexpr std::size_t kDefaultFetchSize = 256;

  PgReader(std::unique_ptr<pqxx::work> tx, pqxx::result call_result, std::size_t fetch_size = kDefaultFetchSize);
  ~PgReader() override;

  PgReader(const PgReader&)            = delete;
  PgReader& operator=(const PgReader&) = delete;

  bool                       NextResult() override;
  const std::vector<Column>& Columns() const override;
  bool                       Read() override;
  const Row&                 Current() const override;
  void                       Close() override;

 private:
  void FetchBatch();
  void LoadColumns(const pqxx::result& result);

  std::unique_ptr<pqxx::work> tx_;
  pqxx::result                call_result_;
  std::size_t                 fetch_size_;

  std::vector<std::string> cursors_;
  bool                     call_row_is_result_ = false;
  std::size_t              next_result_        = 0;

  std::optional<std::string> cursor_;
  bool                       exhausted_ = true;
  pqxx::result               batch_;
  std::size_t                batch_pos_ = 0;

  std::vector<Column> columns_;
  Row                 current_;
  bool                has_row_ = false;
  bool                closed_  = false;
};

} // namespace procdb::db::postgres
