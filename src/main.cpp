/**
 * @file main.cpp
 * @brief Entry point for memexctl, the repository admin tool
 */

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

#include "config/config.h"
#include "migration/exporter.h"
#include "migration/importer.h"
#include "repository/repository.h"
#include "utils/structured_log.h"
#include "utils/time_utils.h"
#include "version.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [OPTIONS] <command> [ARGS]\n";
  std::cout << "\n";
  std::cout << "Commands:\n";
  std::cout << "  init <repo>                            Create an empty repository\n";
  std::cout << "  info <repo>                            Show header counters and format version\n";
  std::cout << "  verify <repo>                          Check the action log hash chain\n";
  std::cout << "  history <repo>                         Print the action log\n";
  std::cout << "  export <repo> <archive> [--gzip]       Export nodes and links\n";
  std::cout << "  import <repo> <archive> [--merge] [--prefix <p>] [--on-conflict skip|replace|rename]\n";
  std::cout << "                                         Import an export archive\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
  std::cout << "\n";
  std::cout << "Example:\n";
  std::cout << "  " << program << " -c /etc/memex/config.yaml export notes.memex notes.tar.gz --gzip\n";
}

/**
 * @brief Apply the logging section (level, structured format, optional file)
 */
bool SetupLogging(const memex::config::LoggingConfig& logging) {
  spdlog::set_level(spdlog::level::from_str(logging.level));
  memex::utils::StructuredLog::SetFormat(memex::utils::StructuredLog::ParseFormat(logging.format));

  if (!logging.file.empty()) {
    try {
      auto logger = spdlog::basic_logger_mt("memexctl", logging.file);
      logger->set_level(spdlog::level::from_str(logging.level));
      spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
      std::cerr << "Error: Failed to open log file " << logging.file << ": " << e.what() << "\n";
      return false;
    }
  }
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  return true;
}

int Fail(const std::string& what, const memex::utils::Error& error) {
  spdlog::error("{}: {}", what, error.message());
  std::cerr << "Error: " << what << ": " << error.to_string() << "\n";
  return kExitError;
}

int RunInit(const memex::config::Config& config, const std::string& path) {
  memex::repository::Repository repo(config);
  auto result = repo.Create(path);
  if (!result) {
    return Fail("Failed to create repository", result.error());
  }
  auto close_result = repo.Close();
  if (!close_result) {
    return Fail("Failed to close repository", close_result.error());
  }
  std::cout << "Created " << path << "\n";
  return kExitOk;
}

int RunInfo(const memex::config::Config& config, const std::string& path) {
  memex::repository::Repository repo(config);
  auto open_result = repo.Open(path);
  if (!open_result) {
    return Fail("Failed to open repository", open_result.error());
  }
  auto stats = repo.GetStats();
  if (!stats) {
    return Fail("Failed to read repository", stats.error());
  }

  const auto& header = stats->header;
  std::cout << "Repository: " << stats->path << "\n";
  std::cout << "  format_version: "
            << memex::repository::FormatVersionString(header.major_version, header.minor_version) << "\n";
  std::cout << "  creator: " << header.creator << "\n";
  std::cout << "  created: " << header.created << " (unix)\n";
  std::cout << "  modified: " << header.modified << " (unix)\n";
  std::cout << "  nodes: " << header.node_count << "\n";
  std::cout << "  links: " << header.edge_count << "\n";
  std::cout << "  chunks: " << stats->chunk_count << "\n";
  std::cout << "  file_size: " << stats->file_size << "\n";
  std::cout << "  action_log: " << stats->action_log_path << "\n";
  return kExitOk;
}

int RunVerify(const memex::config::Config& config, const std::string& path) {
  memex::repository::Repository repo(config);
  auto open_result = repo.Open(path);
  if (!open_result) {
    return Fail("Failed to open repository", open_result.error());
  }
  auto verified = repo.VerifyHistory();
  if (!verified) {
    return Fail("Failed to read action log", verified.error());
  }
  if (!*verified) {
    std::cout << "Action log verification FAILED\n";
    return kExitError;
  }
  auto history = repo.GetHistory();
  if (!history) {
    return Fail("Failed to read action log", history.error());
  }
  for (const auto& action : *history) {
    if (action.type == memex::actions::action_types::kRecoverTail) {
      std::cout << "Recovered torn tail at offset " << action.payload.value("offset", 0) << ": "
                << action.payload.value("bytes", 0) << " bytes kept in "
                << action.payload.value("torn_file", std::string()) << "\n";
    }
  }
  std::cout << "Action log OK\n";
  return kExitOk;
}

int RunHistory(const memex::config::Config& config, const std::string& path) {
  memex::repository::Repository repo(config);
  auto open_result = repo.Open(path);
  if (!open_result) {
    return Fail("Failed to open repository", open_result.error());
  }
  auto history = repo.GetHistory();
  if (!history) {
    return Fail("Failed to read action log", history.error());
  }
  for (const auto& action : *history) {
    std::cout << memex::utils::FormatTimestamp(action.timestamp) << " " << action.type << " "
              << action.payload.dump() << " " << action.hash.substr(0, 12) << "\n";
  }
  return kExitOk;
}

int RunExport(const memex::config::Config& config, const std::vector<std::string>& args) {
  if (args.size() < 2) {
    std::cerr << "Error: export requires <repo> <archive>\n";
    return kExitUsage;
  }
  memex::migration::ExportOptions options;
  options.compress = config.migration.compress;
  for (size_t i = 2; i < args.size(); ++i) {
    if (args[i] == "--gzip") {
      options.compress = true;
    } else {
      std::cerr << "Error: Unknown export option: " << args[i] << "\n";
      return kExitUsage;
    }
  }

  memex::repository::Repository repo(config);
  auto open_result = repo.Open(args[0]);
  if (!open_result) {
    return Fail("Failed to open repository", open_result.error());
  }
  memex::migration::Exporter exporter(repo, options);
  auto stats = exporter.ExportToFile(args[1]);
  if (!stats) {
    return Fail("Export failed", stats.error());
  }
  std::cout << "Exported " << stats->nodes << " nodes and " << stats->edges << " links to " << args[1] << " ("
            << stats->bytes << " bytes)\n";
  return kExitOk;
}

int RunImport(const memex::config::Config& config, const std::vector<std::string>& args) {
  if (args.size() < 2) {
    std::cerr << "Error: import requires <repo> <archive>\n";
    return kExitUsage;
  }

  memex::migration::ImportOptions options;
  auto default_policy = memex::migration::ParseConflictPolicy(config.migration.on_conflict);
  if (!default_policy) {
    return Fail("Invalid configuration", default_policy.error());
  }
  options.on_conflict = *default_policy;

  for (size_t i = 2; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--merge") {
      options.merge = true;
    } else if (arg == "--prefix" || arg == "--on-conflict") {
      if (i + 1 >= args.size()) {
        std::cerr << "Error: " << arg << " requires a value\n";
        return kExitUsage;
      }
      const std::string& value = args[++i];
      if (arg == "--prefix") {
        options.prefix = value;
      } else {
        auto policy = memex::migration::ParseConflictPolicy(value);
        if (!policy) {
          std::cerr << "Error: " << policy.error().to_string() << "\n";
          return kExitUsage;
        }
        options.on_conflict = *policy;
      }
    } else {
      std::cerr << "Error: Unknown import option: " << arg << "\n";
      return kExitUsage;
    }
  }

  memex::repository::Repository repo(config);
  auto open_result = repo.Open(args[0]);
  if (!open_result) {
    return Fail("Failed to open repository", open_result.error());
  }
  memex::migration::Importer importer(repo, options);
  auto stats = importer.ImportFromFile(args[1]);
  if (!stats) {
    return Fail("Import failed", stats.error());
  }
  std::cout << "Imported " << stats->nodes_imported << " nodes (" << stats->nodes_skipped << " skipped, "
            << stats->nodes_renamed << " renamed) and " << stats->links_imported << " links ("
            << stats->links_skipped << " skipped)\n";
  return kExitOk;
}

}  // namespace

/**
 * @brief Main entry point
 * @param argc Argument count
 * @param argv Argument values
 * @return Exit code
 */
int main(int argc, char* argv[]) {
  spdlog::set_level(spdlog::level::warn);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const char* config_path = nullptr;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (!positional.empty()) {
      // Everything after the command belongs to the command
      positional.push_back(arg);
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return kExitOk;
    }
    if (arg == "-v" || arg == "--version") {
      std::cout << memex::Version::Creator() << "\n";
      std::cout << "Local file-backed graph store for content and links\n";
      return kExitOk;
    }
    if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        config_path = argv[++i];
      } else {
        std::cerr << "Error: " << arg << " requires a file path\n";
        return kExitUsage;
      }
    } else if (arg[0] != '-') {
      positional.push_back(arg);
    } else {
      std::cerr << "Error: Unknown option: " << arg << "\n";
      std::cerr << "Use -h or --help for usage information\n";
      return kExitUsage;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  if (positional.empty()) {
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  memex::config::Config config;
  if (config_path != nullptr) {
    auto config_result = memex::config::LoadConfig(config_path);
    if (!config_result) {
      std::cerr << "Error: Failed to load config: " << config_result.error().to_string() << "\n";
      return kExitError;
    }
    config = *config_result;
  }
  if (!SetupLogging(config.logging)) {
    return kExitError;
  }

  std::string command = positional.front();
  std::vector<std::string> args(positional.begin() + 1, positional.end());

  if (command == "export") {
    return RunExport(config, args);
  }
  if (command == "import") {
    return RunImport(config, args);
  }

  if (args.size() != 1) {
    std::cerr << "Error: " << command << " requires exactly one <repo> argument\n";
    return kExitUsage;
  }
  if (command == "init") {
    return RunInit(config, args[0]);
  }
  if (command == "info") {
    return RunInfo(config, args[0]);
  }
  if (command == "verify") {
    return RunVerify(config, args[0]);
  }
  if (command == "history") {
    return RunHistory(config, args[0]);
  }

  std::cerr << "Error: Unknown command: " << command << "\n";
  std::cerr << "Use -h or --help for usage information\n";
  return kExitUsage;
}
