#pragma once

#include <cstddef>
#include <vector>

#include "internal/db/api/reader.hpp"

namespace procdb::db::memory {

/*
  Reader over result sets a procedure already produced.
*/
class MemoryReader final : public db::Reader {
 public:
  explicit MemoryReader(std::vector<Table> result_sets);

  bool                       NextResult() override;
  const std::vector<Column>& Columns() const override;
  bool                       Read() override;
  const Row&                 Current() const override;
  void                       Close() override;

 private:
  std::vector<Table> result_sets_;
  std::size_t        next_result_ = 0;
  const Table*       table_       = nullptr;
  std::size_t        next_row_    = 0;
  const Row*         row_         = nullptr;
};

} // namespace procdb::db::memory
