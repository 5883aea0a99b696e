#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/csv_feed.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reconcile/controller.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using recon::factory::BuildRuntime;
using recon::reconcile::Controller;
using recon::reconcile::RunRequest;

namespace {

void Usage() {
  std::cerr << "Usage:\n"
            << "  recon-run --config <file.yaml> [options]\n"
            << "\n"
            << "Options (repeatable unless noted):\n"
            << "  --import <feed.csv> --account <id>   import a bank CSV export (date,description,debit,credit)\n"
            << "  --rollback-batch <batch_id>          delete an import batch and its links\n"
            << "  --unlink <transaction_id>            supersede the active link of a transaction\n"
            << "  --recompute <booking_id>             recompute a booking balance\n"
            << "  --no-match                           skip matching of unlinked transactions (once)\n"
            << "  --apply                              apply after the preview (once)\n";
}

struct PendingImport {
  std::string path;
  std::string account_id;
};

struct Arguments {
  std::string                config_path;
  std::vector<PendingImport> imports;
  RunRequest                 request;
  bool                       apply = false;
};

bool ParseArguments(int argc, char** argv, Arguments& args) {
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];

    if (flag == "--no-match") {
      args.request.match_unlinked = false;
      continue;
    }
    if (flag == "--apply") {
      args.apply = true;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "missing value for " << flag << "\n";
      return false;
    }

    const std::string value = argv[++i];
    if (flag == "--config") {
      args.config_path = value;
    } else if (flag == "--import") {
      args.imports.push_back({value, {}});
    } else if (flag == "--account") {
      if (args.imports.empty() || !args.imports.back().account_id.empty()) {
        std::cerr << "--account must follow --import\n";
        return false;
      }
      args.imports.back().account_id = value;
    } else if (flag == "--rollback-batch") {
      args.request.rollback_batch_ids.push_back(value);
    } else if (flag == "--unlink") {
      args.request.unlink_transaction_ids.push_back(value);
    } else if (flag == "--recompute") {
      args.request.recompute_booking_ids.push_back(value);
    } else {
      std::cerr << "unknown option " << flag << "\n";
      return false;
    }
  }

  if (args.config_path.empty()) {
    std::cerr << "--config is required\n";
    return false;
  }
  for (const auto& pending : args.imports) {
    if (pending.account_id.empty()) {
      std::cerr << "--import " << pending.path << " needs --account\n";
      return false;
    }
  }
  return true;
}

void PrintChangeSet(const recon::report::v1::ChangeSet& change_set) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(change_set, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to render change-set: " + std::string(status.message()));
  }
  std::cout << json << std::endl;
}

void Shutdown() {
  recon::observability::ShutdownLogging();
  recon::observability::ShutdownMetrics();
  recon::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  Arguments args;
  if (!ParseArguments(argc, argv, args)) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = recon::config::ConfigLoader::LoadFromYaml(args.config_path);

    recon::observability::InitializeTracing(config);
    recon::observability::InitializeMetrics(config);
    recon::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Read feeds (batch ids are fixed here so preview and apply agree)
    // ------------------------------------------------------------
    const auto stamp = recon::util::CompactUtcStamp(recon::util::Now());
    for (size_t i = 0; i < args.imports.size(); ++i) {
      const auto& pending  = args.imports[i];
      const auto  batch_id = std::filesystem::path(pending.path).stem().string() + "-" + stamp + "-" + std::to_string(i);

      args.request.imports.push_back(recon::ingest::CsvFeedReader::ReadFile(pending.path, pending.account_id, batch_id));
      RECON_LOG_INFO("feed read", {recon::observability::StringField("batch_id", batch_id),
                                   recon::observability::StringField("file", pending.path),
                                   recon::observability::IntField("lines", static_cast<int64_t>(args.request.imports.back().lines.size()))});
    }

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto runtime = BuildRuntime(config);

    Controller controller(runtime.repository, runtime.policy, runtime.snapshot_sink, std::move(args.request), runtime.controller_options);

    PrintChangeSet(controller.Preview());

    if (args.apply) {
      PrintChangeSet(controller.Apply());
    }

    Shutdown();
  } catch (const recon::util::ApplyAbortError& e) {
    RECON_LOG_ERROR("Apply aborted, storage unchanged", {recon::observability::StringField("error", e.what())});
    Shutdown();
    return 3;
  } catch (const std::exception& e) {
    RECON_LOG_ERROR("Fatal error", {recon::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
