#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "procdb/v1.hpp"

namespace {

using namespace procdb::v1;

struct Invoice {
  int64_t                id = 0;
  std::string            customer;
  double                 total = 0;
  std::optional<int64_t> paid_at_ms;
};

// Stand-ins for the procedures a real database would provide.
void SeedMemoryProcedures(MemoryDriver& driver) {
  driver.Register("billing.list_open_invoices", [](Parameters&) {
    Table invoices;
    invoices.columns = {{"id", "int8"}, {"customer", "text"}, {"total", "numeric"}, {"paid_at_ms", "int8"}};
    invoices.rows.push_back({int64_t{1001}, std::string("acme"), 125.5, nullptr});
    invoices.rows.push_back({int64_t{1002}, std::string("globex"), 80.0, nullptr});
    return ProcedureResult{0, {invoices}};
  });

  driver.Register("billing.open_invoice_count", [](Parameters&) {
    Table count;
    count.columns = {{"count", "int8"}};
    count.rows.push_back({int64_t{2}});
    return ProcedureResult{0, {count}};
  });

  driver.Register("billing.close_invoice", [](Parameters& parameters) {
    for (auto& parameter : parameters) {
      if (parameter.name == "@closed_total") parameter.value = 125.5;
    }
    return ProcedureResult{1, {}};
  });
}

} // namespace

int main(int argc, char** argv) {
  procdb::runtime::config::RuntimeConfig config;
  try {
    if (argc > 1) {
      config = procdb::config::ConfigLoader::LoadFromYaml(argv[1]);
    }
  } catch (const std::exception& e) {
    std::cerr << "config: " << e.what() << '\n';
    return 1;
  }
  procdb::observability::InitializeLogging(config);

  try {
    auto deps = procdb::factory::Build(config);
    if (auto memory = std::dynamic_pointer_cast<MemoryDriver>(deps.driver)) {
      SeedMemoryProcedures(*memory);
    }
    const DataSource& source = *deps.data_source;

    RecordMap<Invoice> invoice_map;
    invoice_map.Bind("id", &Invoice::id).Bind("customer", &Invoice::customer).Bind("total", &Invoice::total).Bind("paid_at_ms", &Invoice::paid_at_ms);

    std::cout << "open invoices: " << source.GetScalar<int64_t>("billing.open_invoice_count") << '\n';
    for (const auto& invoice : source.GetTable("billing.list_open_invoices", invoice_map)) {
      std::cout << "  #" << invoice.id << ' ' << invoice.customer << ' ' << invoice.total << '\n';
    }

    Parameters close{DataSource::I("@invoice_id", int64_t{1001}), DataSource::O("@closed_total")};
    const auto affected = source.Execute("billing.close_invoice", close);
    std::cout << "closed invoice 1001 (" << affected << " row(s)), total " << procdb::db::ToString(close[1].value) << '\n';
  } catch (const std::exception& e) {
    std::cerr << "stored procedure call failed: " << e.what() << '\n';
    procdb::observability::ShutdownLogging();
    return 1;
  }

  procdb::observability::ShutdownLogging();
  return 0;
}
