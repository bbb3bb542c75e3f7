#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "keystone/api.hpp"
#include "keystone/config.hpp"
#include "keystone/hash.hpp"
#include "keystone/jsonlite.hpp"
#include "keystone/observability.hpp"
#include "keystone/runtime.hpp"
#include "keystone/version.hpp"
#include "keystone/wal.hpp"
#include "keystone/worker.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.0.0"
#endif

namespace {

constexpr const char* kUsage =
    "usage: keystone <command> [--config FILE] [--data-dir DIR]\n"
    "  serve                      NDJSON stream on stdin/stdout\n"
    "  wal replay <execution_id>  verify the chain and print the folded execution\n"
    "  wal export <execution_id>  print the WAL as NDJSON\n"
    "  recover [execution_id]     drive interrupted executions to a terminal state\n"
    "  sweep                      expire contracts past their TTL\n"
    "  config check               validate configuration\n"
    "  status [execution_id --tenant T]\n"
    "  health\n"
    "  version\n";

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  *out = std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

std::string error_json(const keystone::Error& e) { return keystone::error_body(e); }

struct CliArgs {
  std::vector<std::string> positional;
  std::string config_path;
  std::string data_dir;
  std::string tenant_id;
};

CliArgs parse_args(int argc, char** argv) {
  CliArgs a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
    } else if (arg == "--data-dir" && i + 1 < argc) {
      a.data_dir = argv[++i];
    } else if (arg == "--tenant" && i + 1 < argc) {
      a.tenant_id = argv[++i];
    } else if (arg.rfind("--", 0) != 0) {
      a.positional.push_back(arg);
    }
  }
  return a;
}

// default → --config file → KEYSTONE_* env → --data-dir.
bool load_config(const CliArgs& args, keystone::CoreConfig* cfg, keystone::Error* err) {
  *cfg = keystone::default_config();
  if (!args.config_path.empty()) {
    std::string text;
    if (!read_file(args.config_path, &text)) {
      return keystone::fail(err, keystone::ErrorCode::config_invalid,
                            "cannot read " + args.config_path);
    }
    if (!keystone::load_config_json(text, cfg, err)) return false;
  }
  keystone::apply_env_overrides(cfg);
  if (!args.data_dir.empty()) cfg->data_dir = args.data_dir;
  return true;
}

std::unique_ptr<keystone::Runtime> open_runtime(const keystone::CoreConfig& cfg, bool recover,
                                                bool sweeper) {
  keystone::RuntimeOverrides o;
  o.recover_on_start = recover;
  o.start_sweeper = sweeper;
  keystone::Error e;
  auto rt = keystone::Runtime::create(cfg, &e, o);
  if (!rt) std::cerr << error_json(e) << "\n";
  return rt;
}

// The WAL alone, for offline inspection.
std::shared_ptr<keystone::WriteAheadLog> open_wal(const keystone::CoreConfig& cfg) {
  return std::make_shared<keystone::WriteAheadLog>(
      std::make_shared<keystone::FileWalStore>(cfg.data_dir, false), cfg.infra_retry);
}

}  // namespace

int main(int argc, char** argv) {
  const CliArgs args = parse_args(argc, argv);
  if (args.positional.empty()) {
    std::cerr << kUsage;
    return 1;
  }
  const std::string& cmd = args.positional[0];
  const std::string sub = args.positional.size() > 1 ? args.positional[1] : "";

  if (cmd == "version") {
    std::cout << keystone::version::manifest_to_json(
                     keystone::version::current_manifest(PROJECT_VERSION))
              << "\n";
    return 0;
  }

  if (cmd == "health") {
    const auto h = keystone::hash_runtime_info();
    const auto& w = keystone::global_worker_identity();
    std::cout << "{\"hash_primitive\":\"" << h.primitive << "\""
              << ",\"hash_version\":\"" << h.version << "\""
              << ",\"worker\":" << keystone::worker_identity_to_json(w)
              << ",\"wal_format\":" << keystone::version::WAL_FORMAT_VERSION
              << ",\"compression_capabilities\":[\"identity\"";
#if defined(KEYSTONE_WITH_ZSTD)
    std::cout << ",\"zstd\"";
#endif
    std::cout << "]}\n";
    return 0;
  }

  keystone::CoreConfig cfg;
  keystone::Error err;
  if (!load_config(args, &cfg, &err)) {
    std::cerr << error_json(err) << "\n";
    return 2;
  }

  if (cmd == "config" && sub == "check") {
    const auto result = keystone::validate_config(cfg);
    std::cout << "{\"ok\":" << (result.ok ? "true" : "false") << ",\"errors\":[";
    for (size_t i = 0; i < result.errors.size(); ++i) {
      if (i) std::cout << ",";
      std::cout << "\"" << keystone::jsonlite::escape(result.errors[i]) << "\"";
    }
    std::cout << "],\"config\":" << keystone::config_to_json(cfg) << "}\n";
    return result.ok ? 0 : 2;
  }

  if (cmd == "wal" && (sub == "replay" || sub == "export")) {
    if (args.positional.size() < 3) {
      std::cerr << kUsage;
      return 1;
    }
    const std::string& id = args.positional[2];
    auto wal = open_wal(cfg);
    if (sub == "export") {
      auto text = wal->export_ndjson(id, &err);
      if (!text) {
        std::cerr << error_json(err) << "\n";
        return 2;
      }
      std::cout << *text;
      return 0;
    }
    auto events = wal->replay(id, &err);
    std::optional<keystone::Execution> exec;
    if (events) exec = keystone::fold(*events, &err);
    if (!exec) {
      std::cerr << error_json(err) << "\n";
      return err.code == keystone::ErrorCode::state_corruption ? 3 : 2;
    }
    std::cout << "{\"events\":" << events->size() << ",\"chain_verified\":true"
              << ",\"execution\":" << keystone::jsonlite::to_json(keystone::execution_to_json(*exec))
              << "}\n";
    return 0;
  }

  if (cmd == "recover") {
    auto rt = open_runtime(cfg, false, false);
    if (!rt) return 2;
    if (!sub.empty()) {
      auto exec = rt->saga()->recover(sub, &err);
      if (!exec) {
        std::cerr << error_json(err) << "\n";
        return 2;
      }
      std::cout << keystone::jsonlite::to_json(keystone::execution_status_json(*exec)) << "\n";
      return 0;
    }
    const auto report = rt->saga()->recover_all();
    std::cout << report.to_json() << "\n";
    return report.errors == 0 ? 0 : 2;
  }

  if (cmd == "sweep") {
    auto rt = open_runtime(cfg, false, false);
    if (!rt) return 2;
    const auto report = rt->contracts()->sweep_expired(rt->state()->clock().now_unix_ms());
    std::cout << report.to_json() << "\n";
    return report.errors == 0 ? 0 : 2;
  }

  if (cmd == "status") {
    auto rt = open_runtime(cfg, false, false);
    if (!rt) return 2;
    if (!sub.empty()) {
      auto exec = rt->saga()->status(sub, args.tenant_id, &err);
      if (!exec) {
        std::cerr << error_json(err) << "\n";
        return 2;
      }
      std::cout << keystone::jsonlite::to_json(keystone::execution_status_json(*exec)) << "\n";
      return 0;
    }
    uint64_t total = 0, terminal = 0, corrupted = 0;
    for (const auto& id : rt->wal()->execution_ids()) {
      ++total;
      keystone::Error e;
      auto events = rt->wal()->replay(id, &e);
      std::optional<keystone::Execution> exec;
      if (events) exec = keystone::fold(*events, &e);
      if (!exec) {
        ++corrupted;
      } else if (exec->terminal()) {
        ++terminal;
      }
    }
    std::cout << "{\"executions\":" << total << ",\"terminal\":" << terminal
              << ",\"in_flight\":" << (total - terminal - corrupted)
              << ",\"unreadable\":" << corrupted
              << ",\"state_backend\":\"" << rt->state()->backend_id() << "\""
              << ",\"wal_store\":\"" << rt->wal()->store_id() << "\""
              << ",\"data_dir\":\"" << keystone::jsonlite::escape(cfg.data_dir) << "\"}\n";
    return 0;
  }

  if (cmd == "serve") {
    auto rt = open_runtime(cfg, true, true);
    if (!rt) return 2;
    keystone::log_event(keystone::LogLevel::info, "cli",
                        "serving; recovery " + rt->startup_recovery().to_json());
    keystone::ApiRouter router(*rt);
    keystone::StreamConnection conn(router, rt->sessions());
    const uint64_t frames = keystone::run_stream(std::cin, std::cout, conn);
    rt->shutdown();
    keystone::log_event(keystone::LogLevel::info, "cli",
                        "stream closed after " + std::to_string(frames) + " frames");
    return 0;
  }

  std::cerr << kUsage;
  return 1;
}
