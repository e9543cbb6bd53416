#pragma once

#include <cstddef>
#include <vector>

#include "internal/db/api/table.hpp"

namespace procdb::db {

/*
  Forward-only reader over the result sets of one call.

  Starts positioned before the first result set:

    while (reader.NextResult()) {
      reader.Columns();
      while (reader.Read()) reader.Current();
    }

  Close() completes the call. A reader destroyed without Close() discards
  whatever the call left pending (PostgreSQL: the transaction rolls back).
*/
class Reader {
 public:
  virtual ~Reader() = default;

  // Advances to the next result set. False when there are no more.
  virtual bool NextResult() = 0;

  // Columns of the current result set.
  virtual const std::vector<Column>& Columns() const = 0;

  // Advances to the next row of the current result set.
  virtual bool Read() = 0;

  // Values of the current row; valid until the next Read().
  virtual const Row& Current() const = 0;

  virtual void Close() = 0;
};

} // namespace procdb::db
