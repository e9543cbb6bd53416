#pragma once

#include "internal/db/api/driver.hpp"
#include "internal/db/api/parameter.hpp"
#include "internal/db/api/table.hpp"
#include "internal/db/api/value.hpp"
#include "internal/db/mapping/record_map.hpp"
#include "internal/db/memory/memory_driver.hpp"
#include "internal/source/data_source.hpp"
#include "internal/util/errors.hpp"

#if PROCDB_DB_POSTGRES
#include "internal/db/postgres/pg_driver.hpp"
#endif

namespace procdb::v1 {
using ::procdb::db::Bytes;
using ::procdb::db::Column;
using ::procdb::db::DataSet;
using ::procdb::db::Driver;
using ::procdb::db::Parameter;
using ::procdb::db::ParameterDirection;
using ::procdb::db::Parameters;
using ::procdb::db::Row;
using ::procdb::db::Table;
using ::procdb::db::TimePoint;
using ::procdb::db::Value;
using ::procdb::db::ValueAs;
using ::procdb::db::memory::MemoryDriver;
using ::procdb::db::memory::ProcedureResult;
using ::procdb::mapping::RecordMap;
using ::procdb::source::DataSource;
using ::procdb::util::CoercionError;
using ::procdb::util::ConnectionError;
using ::procdb::util::ExecutionError;
using ::procdb::util::MappingError;
#if PROCDB_DB_POSTGRES
using ::procdb::db::postgres::PgDriver;
#endif
} // namespace procdb::v1
