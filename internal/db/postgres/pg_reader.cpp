#include "pg_reader.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "pg_call_builder.hpp"
#include "pg_connection.hpp"
#include "pg_value.hpp"

namespace procdb::db::postgres {

PgReader::PgReader(std::unique_ptr<pqxx::work> tx, pqxx::result call_result, std::size_t fetch_size)
    : tx_(std::move(tx)), call_result_(std::move(call_result)), fetch_size_(fetch_size == 0 ? 1 : fetch_size) {
  bool has_cursor_column = false;
  for (pqxx::row_size_type col = 0; col < call_result_.columns(); ++col) {
    if (call_result_.column_type(col) != type_oid::kRefCursor) continue;

    has_cursor_column = true;
    if (!call_result_.empty() && !call_result_[0][col].is_null()) {
      cursors_.emplace_back(call_result_[0][col].c_str());
    }
  }

  call_row_is_result_ = !has_cursor_column && call_result_.columns() > 0;
}

PgReader::~PgReader() {
  if (closed_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    PROCDB_LOG_WARN("rollback of unclosed reader failed", {observability::StringField("error", e.what())});
  }
}

bool PgReader::NextResult() {
  has_row_ = false;

  if (call_row_is_result_) {
    if (next_result_ > 0) return false;
    ++next_result_;
    LoadColumns(call_result_);
    batch_     = call_result_;
    batch_pos_ = 0;
    exhausted_ = true;
    return true;
  }

  if (next_result_ >= cursors_.size()) {
    cursor_.reset();
    columns_.clear();
    batch_     = pqxx::result{};
    batch_pos_ = 0;
    exhausted_ = true;
    return false;
  }

  cursor_    = cursors_[next_result_++];
  exhausted_ = false;
  FetchBatch();
  LoadColumns(batch_);
  return true;
}

const std::vector<Column>& PgReader::Columns() const {
  return columns_;
}

bool PgReader::Read() {
  if (batch_pos_ >= static_cast<std::size_t>(batch_.size())) {
    if (exhausted_) {
      has_row_ = false;
      return false;
    }
    FetchBatch();
    if (batch_.empty()) {
      has_row_ = false;
      return false;
    }
  }

  const auto row = batch_[static_cast<pqxx::result::size_type>(batch_pos_++)];
  current_.clear();
  current_.reserve(row.size());
  for (const auto& field : row) {
    current_.push_back(DecodeField(field));
  }
  has_row_ = true;
  return true;
}

const Row& PgReader::Current() const {
  if (!has_row_) {
    throw util::ExecutionError("reader is not positioned on a row");
  }
  return current_;
}

void PgReader::Close() {
  if (closed_) return;
  tx_->commit();
  closed_ = true;
}

void PgReader::FetchBatch() {
  batch_     = tx_->exec("FETCH FORWARD " + std::to_string(fetch_size_) + " FROM " + QuoteIdentifier(*cursor_));
  batch_pos_ = 0;
  if (static_cast<std::size_t>(batch_.size()) < fetch_size_) {
    exhausted_ = true;
  }
}

void PgReader::LoadColumns(const pqxx::result& result) {
  columns_.clear();
  columns_.reserve(result.columns());
  for (pqxx::row_size_type col = 0; col < result.columns(); ++col) {
    columns_.push_back({result.column_name(col), TypeName(result.column_type(col))});
  }
}

} // namespace procdb::db::postgres
