#include <strata.hpp>
#include <strata/mdbx_store.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

struct Invoice {
  std::uint64_t number{};
  std::string customer;
  std::int64_t amount_cents{};
};

namespace bitsery {

template <typename S>
void serialize(S& s, Invoice& v) {
  s.value8b(v.number);
  s.text1b(v.customer, 256);
  s.value8b(v.amount_cents);
}

}  // namespace bitsery

namespace {

// Invoices are compressed and encrypted, and carry parity so that a damaged
// page does not lose them.
strata::table_options invoice_options(const std::array<std::uint8_t, strata::k_key_size>& key) {
  strata::table_options options;
  options.value = strata::type_config::sealed();
  options.value.correction = {strata::direction::both, strata::correctors::preset::standard};
  options.key = key;
  return options;
}

int fail(const strata::error& err) {
  std::cerr << strata::stage_name(err.where) << ": " << strata::error_code_message(err.code) << ": " << err.message
            << "\n";
  return 1;
}

}  // namespace

int main(int argc, char** argv) {
  const std::filesystem::path dir = argc >= 2 ? argv[1] : "strata_example_db";
  strata::set_log_level(spdlog::level::info);

  auto env = strata::mdbx::Environment::open(dir);
  if (!env) {
    return fail(env.error());
  }

  // A real deployment loads this from a key store.
  std::array<std::uint8_t, strata::k_key_size> key{};
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<std::uint8_t>(0xA0U + i);
  }
  const auto options = invoice_options(key);
  const strata::Pipeline pipeline(strata::Backends::defaults());

  {
    auto txn = env->begin_write();
    if (!txn) {
      return fail(txn.error());
    }
    auto invoices = strata::OrderedTableMut<std::uint64_t, Invoice>::open(*txn, "invoices", pipeline, options);
    if (!invoices) {
      return fail(invoices.error());
    }
    for (std::uint64_t n = 1001; n <= 1010; ++n) {
      const Invoice inv{n, "customer-" + std::to_string(n % 3), static_cast<std::int64_t>(n * 125)};
      if (auto inserted = invoices->insert(n, inv); !inserted) {
        return fail(inserted.error());
      }
    }
    if (auto committed = txn->commit(); !committed) {
      return fail(committed.error());
    }
  }

  auto txn = env->begin_read();
  if (!txn) {
    return fail(txn.error());
  }
  auto invoices = strata::OrderedTable<std::uint64_t, Invoice>::open(*txn, "invoices", pipeline, options);
  if (!invoices) {
    return fail(invoices.error());
  }

  auto entries = invoices->range(strata::key_range<std::uint64_t>::closed(1003, 1006));
  if (!entries) {
    return fail(entries.error());
  }
  while (auto item = entries->next()) {
    if (!*item) {
      return fail(item->error());
    }
    const auto& [number, inv] = **item;
    std::cout << number << " " << inv.customer << " " << inv.amount_cents << "\n";
  }

  auto missing = invoices->at(2000);
  if (!missing && missing.error().code == strata::error_code::not_found) {
    std::cout << "2000: " << missing.error().message << "\n";
  }
  return 0;
}
