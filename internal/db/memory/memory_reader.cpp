#include "memory_reader.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace procdb::db::memory {

MemoryReader::MemoryReader(std::vector<Table> result_sets) : result_sets_(std::move(result_sets)) {
}

bool MemoryReader::NextResult() {
  row_ = nullptr;
  if (next_result_ >= result_sets_.size()) {
    table_ = nullptr;
    return false;
  }
  table_    = &result_sets_[next_result_++];
  next_row_ = 0;
  return true;
}

const std::vector<Column>& MemoryReader::Columns() const {
  static const std::vector<Column> kNoColumns;
  return table_ ? table_->columns : kNoColumns;
}

bool MemoryReader::Read() {
  if (!table_ || next_row_ >= table_->rows.size()) {
    row_ = nullptr;
    return false;
  }
  row_ = &table_->rows[next_row_++];
  return true;
}

const Row& MemoryReader::Current() const {
  if (!row_) {
    throw util::ExecutionError("reader is not positioned on a row");
  }
  return *row_;
}

void MemoryReader::Close() {
  table_ = nullptr;
  row_   = nullptr;
}

} // namespace procdb::db::memory
