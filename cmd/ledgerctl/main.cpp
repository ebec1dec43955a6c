#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using ledger::db::model::ItemRecord;
using ledger::db::model::ProductRecord;

namespace {

// Exit codes, one per error class.
constexpr int kExitOk                    = 0;
constexpr int kExitUsage                 = 1;
constexpr int kExitFailure               = 2;
constexpr int kExitUnauthorized          = 3;
constexpr int kExitNotFound              = 4;
constexpr int kExitParity                = 5;
constexpr int kExitInvalidInventoryCount = 6;
constexpr int kExitVariantMismatch       = 7;
constexpr int kExitCapacityExceeded      = 8;
constexpr int kExitIneligible            = 9;
constexpr int kExitConflict              = 10;

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

void Usage() {
  std::cout << "Usage:\n"
            << "  ledgerctl --config <file> [--caller <account>] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  create-product <name> <label,...> <quantity,...>\n"
            << "  update-product <product_id> <name> <label,...> <quantity,...>\n"
            << "  product <product_id>\n"
            << "  products\n"
            << "  next-product-id\n"
            << "  mint <product_id> <label,...> [price] [location] [chipped=0|1] [digitized=0|1] [metadata_ref]\n"
            << "  update-item <item_id> <price> <location> <chipped=0|1> <digitized=0|1>\n"
            << "  item <item_id>\n"
            << "  items <product_id>\n"
            << "  next-item-id\n"
            << "  ready <item_id,...>\n"
            << "  bid|sale|ship|deliver <item_id,...> <flag,...>\n"
            << "  burn <item_id>\n"
            << "  transfer <item_id> <account>\n"
            << "  owner <item_id>\n"
            << "  metadata <item_id> [uri]\n"
            << "\n"
            << "Locations: seller, hq, partner, transit, buyer. Flags: 1/0 or true/false.\n";
}

std::vector<std::string> SplitList(const std::string& value) {
  std::vector<std::string> out;
  if (value.empty()) {
    return out;
  }
  std::stringstream ss(value);
  std::string       part;
  while (std::getline(ss, part, ',')) {
    out.push_back(part);
  }
  return out;
}

std::uint64_t ParseUint(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw UsageError("expected unsigned integer, got '" + value + "'");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw UsageError("integer out of range: '" + value + "'");
  }
}

bool ParseFlag(const std::string& value) {
  if (value == "1" || value == "true") {
    return true;
  }
  if (value == "0" || value == "false") {
    return false;
  }
  throw UsageError("expected flag 1|0|true|false, got '" + value + "'");
}

std::vector<std::uint64_t> ParseUintList(const std::string& value) {
  std::vector<std::uint64_t> out;
  for (const auto& part : SplitList(value)) {
    out.push_back(ParseUint(part));
  }
  return out;
}

std::vector<bool> ParseFlagList(const std::string& value) {
  std::vector<bool> out;
  for (const auto& part : SplitList(value)) {
    out.push_back(ParseFlag(part));
  }
  return out;
}

ledger::model::Location ParseLocationArg(const std::string& value) {
  auto parsed = ledger::model::ParseLocation(value);
  if (!parsed.has_value()) {
    throw UsageError("unsupported location: " + value);
  }
  return *parsed;
}

std::string Join(const std::vector<std::string>& values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out += ",";
    out += values[i];
  }
  return out;
}

void PrintProduct(const ProductRecord& p) {
  std::cout << "id=" << p.id << " name=" << p.name << " variants=" << Join(p.variants) << " quantities=";
  for (std::size_t i = 0; i < p.quantity_per_variant.size(); ++i) {
    if (i > 0) std::cout << ",";
    std::cout << p.quantity_per_variant[i];
  }
  std::cout << " available=" << p.inventory[ledger::model::Index(ledger::model::Bucket::kAvailable)]
            << " reserved=" << p.inventory[ledger::model::Index(ledger::model::Bucket::kReserved)]
            << " sold=" << p.inventory[ledger::model::Index(ledger::model::Bucket::kSold)]
            << " shipped=" << p.inventory[ledger::model::Index(ledger::model::Bucket::kShipped)] << "\n";
}

void PrintItem(const ItemRecord& item) {
  std::cout << "id=" << item.id << " product=" << item.product_id << " owner=" << item.owner
            << " variants=" << Join(item.variants) << " price=" << item.price
            << " location=" << ledger::model::ToString(item.location) << " chipped=" << item.is_chipped
            << " digitized=" << item.is_digitized << " state=" << ledger::model::ToString(item.state) << "\n";
}

void RequireArgs(const std::vector<std::string>& args, std::size_t count, const std::string& cmd) {
  if (args.size() < count) {
    throw UsageError(cmd + ": expected " + std::to_string(count) + " argument(s)");
  }
}

int Run(ledger::service::LedgerService& service, const std::string& caller, const std::string& cmd,
        const std::vector<std::string>& args) {
  // ------------------------------------------------------------
  // Products
  // ------------------------------------------------------------

  if (cmd == "create-product") {
    RequireArgs(args, 3, cmd);
    std::cout << "product_id=" << service.CreateProduct(caller, args[0], SplitList(args[1]), ParseUintList(args[2]))
              << "\n";
    return kExitOk;
  }

  if (cmd == "update-product") {
    RequireArgs(args, 4, cmd);
    service.UpdateProduct(caller, ParseUint(args[0]), args[1], SplitList(args[2]), ParseUintList(args[3]));
    std::cout << "updated\n";
    return kExitOk;
  }

  if (cmd == "product") {
    RequireArgs(args, 1, cmd);
    PrintProduct(service.GetProduct(ParseUint(args[0])));
    return kExitOk;
  }

  if (cmd == "products") {
    for (const auto& p : service.ListProducts()) {
      PrintProduct(p);
    }
    return kExitOk;
  }

  if (cmd == "next-product-id") {
    std::cout << service.NextProductId() << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------
  // Items
  // ------------------------------------------------------------

  if (cmd == "mint") {
    RequireArgs(args, 2, cmd);
    ledger::core::MintRequest req;
    req.product_id = ParseUint(args[0]);
    req.variants   = SplitList(args[1]);
    if (args.size() > 2) req.price = ParseUint(args[2]);
    if (args.size() > 3) req.location = ParseLocationArg(args[3]);
    if (args.size() > 4) req.is_chipped = ParseFlag(args[4]);
    if (args.size() > 5) req.is_digitized = ParseFlag(args[5]);
    if (args.size() > 6) req.metadata_ref = args[6];

    std::cout << "item_id=" << service.MintItem(caller, req) << "\n";
    return kExitOk;
  }

  if (cmd == "update-item") {
    RequireArgs(args, 5, cmd);
    service.UpdateItem(caller, ParseUint(args[0]), ParseUint(args[1]), ParseLocationArg(args[2]), ParseFlag(args[3]),
                      ParseFlag(args[4]));
    std::cout << "updated\n";
    return kExitOk;
  }

  if (cmd == "item") {
    RequireArgs(args, 1, cmd);
    PrintItem(service.GetItem(ParseUint(args[0])));
    return kExitOk;
  }

  if (cmd == "items") {
    RequireArgs(args, 1, cmd);
    for (const auto& item : service.ListItems(ParseUint(args[0]))) {
      PrintItem(item);
    }
    return kExitOk;
  }

  if (cmd == "next-item-id") {
    std::cout << service.NextItemId() << "\n";
    return kExitOk;
  }

  if (cmd == "transfer") {
    RequireArgs(args, 2, cmd);
    service.TransferItem(caller, ParseUint(args[0]), args[1]);
    std::cout << "transferred\n";
    return kExitOk;
  }

  if (cmd == "owner") {
    RequireArgs(args, 1, cmd);
    std::cout << service.OwnerOf(ParseUint(args[0])) << "\n";
    return kExitOk;
  }

  if (cmd == "metadata") {
    RequireArgs(args, 1, cmd);
    const auto id = ParseUint(args[0]);
    if (args.size() > 1) {
      service.SetMetadataRef(caller, id, args[1]);
      std::cout << "updated\n";
      return kExitOk;
    }
    auto ref = service.GetMetadataRef(id);
    std::cout << (ref.has_value() ? *ref : std::string("<none>")) << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------
  // Lifecycle
  // ------------------------------------------------------------

  if (cmd == "ready") {
    RequireArgs(args, 1, cmd);
    service.ReadyForAuction(caller, ParseUintList(args[0]));
    std::cout << "ready\n";
    return kExitOk;
  }

  if (cmd == "bid" || cmd == "sale" || cmd == "ship" || cmd == "deliver") {
    RequireArgs(args, 2, cmd);
    const auto ids   = ParseUintList(args[0]);
    const auto flags = ParseFlagList(args[1]);

    if (cmd == "bid") {
      service.SetBidStatus(caller, ids, flags);
    } else if (cmd == "sale") {
      service.SetSaleStatus(caller, ids, flags);
    } else if (cmd == "ship") {
      service.SetShippingStatus(caller, ids, flags);
    } else {
      service.SetDeliveryStatus(caller, ids, flags);
    }
    std::cout << "applied\n";
    return kExitOk;
  }

  if (cmd == "burn") {
    RequireArgs(args, 1, cmd);
    service.Burn(caller, ParseUint(args[0]));
    std::cout << "burned\n";
    return kExitOk;
  }

  throw UsageError("unknown command: " + cmd);
}

} // namespace

int main(int argc, char** argv) {
  std::string                config_path;
  std::optional<std::string> caller;
  std::string                cmd;
  std::vector<std::string>   args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (cmd.empty() && arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (cmd.empty() && arg == "--caller" && i + 1 < argc) {
      caller = argv[++i];
    } else if (cmd.empty() && (arg == "-h" || arg == "--help")) {
      Usage();
      return kExitOk;
    } else if (cmd.empty()) {
      cmd = arg;
    } else {
      args.push_back(arg);
    }
  }

  if (config_path.empty() || cmd.empty()) {
    Usage();
    return kExitUsage;
  }

  try {
    auto config = ledger::config::ConfigLoader::LoadFromYaml(config_path);
    ledger::observability::InitializeLogging(config);

    auto runtime = ledger::factory::BuildRuntime(config);

    // defaults to the catalog owner
    const auto account = caller.value_or(config.ledger().catalog_owner());
    const int  rc      = Run(*runtime.ledger_service, account, cmd, args);

    ledger::observability::ShutdownLogging();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    return kExitUsage;
  } catch (const ledger::util::AuthorizationError& e) {
    std::cerr << "unauthorized: " << e.what() << "\n";
    return kExitUnauthorized;
  } catch (const ledger::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    return kExitNotFound;
  } catch (const ledger::util::ParityError& e) {
    std::cerr << "parity: " << e.what() << "\n";
    return kExitParity;
  } catch (const ledger::util::InvalidInventoryCount& e) {
    std::cerr << "invalid inventory count: " << e.what() << "\n";
    return kExitInvalidInventoryCount;
  } catch (const ledger::util::VariantMismatch& e) {
    std::cerr << "variant mismatch: " << e.what() << "\n";
    return kExitVariantMismatch;
  } catch (const ledger::util::CapacityExceeded& e) {
    std::cerr << "capacity exceeded: " << e.what() << "\n";
    return kExitCapacityExceeded;
  } catch (const ledger::util::IneligibleTransition& e) {
    std::cerr << "ineligible transition: " << e.what() << "\n";
    return kExitIneligible;
  } catch (const ledger::util::AlreadyExists& e) {
    std::cerr << "already exists: " << e.what() << "\n";
    return kExitConflict;
  } catch (const ledger::util::InvalidState& e) {
    std::cerr << "invalid state: " << e.what() << "\n";
    return kExitConflict;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return kExitFailure;
  }
}
