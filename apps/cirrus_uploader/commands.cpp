// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "config_parser.hpp"

#define CIRRUS_LOG_COMPONENT "cli"
#include <cirrus_log_init.hpp>
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace app {

using cirrus::logging::kv;
using namespace cirrus::uploader;

std::atomic<bool> Commands::exit_requested_{false};

namespace {

bool parse_local_behaviour(const std::string& value, LocalBehaviour& behaviour) {
  if (value != "copy" && value != "move" && value != "forget" && value != "delete") {
    return false;
  }
  behaviour = localBehaviourFromString(value);
  return true;
}

bool parse_collision_policy(const std::string& value, NameCollisionPolicy& policy) {
  if (value != "default" && value != "overwrite" && value != "rename" && value != "skip" &&
      value != "ask_user") {
    return false;
  }
  policy = nameCollisionPolicyFromString(value);
  return true;
}

void print_record(const UploadRecord& record) {
  std::cout << "  #" << std::left << std::setw(6) << record.id << std::setw(12)
            << uploadStatusToString(record.status) << std::setw(26)
            << resultCodeToString(record.last_result) << record.local_path << " -> "
            << record.remote_path << std::endl;
}

}  // namespace

void Commands::request_exit() {
  exit_requested_.store(true);
}

bool Commands::initialize() {
  ConfigParser parser;
  if (!parser.load_from_file(options_.config_path, config_)) {
    std::cerr << "Error: Failed to load config file '" << options_.config_path
              << "': " << parser.get_last_error() << std::endl;
    return false;
  }

  std::string error_msg;
  if (!ConfigParser::validate(config_, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    return false;
  }

  logging::LoggingConfig log_config;
  convert_logging_config(config_.logging, log_config);
  if (options_.verbose) {
    log_config.console_level = logging::severity_level::debug;
  }
  logging::apply_env_overrides(log_config);
  logging::init_logging(log_config);

  try {
    runtime_ = std::make_unique<UploaderRuntime>(config_);
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return false;
  }

  if (options_.print_events) {
    runtime_->broadcaster().subscribe([](const nlohmann::json& event) {
      std::cout << event.dump() << std::endl;
    });
  }
  return true;
}

bool Commands::drain() {
  auto deadline = std::chrono::steady_clock::now() + options_.timeout;
  bool idle = false;
  while (!exit_requested_.load()) {
    if (runtime_->scheduler().waitForIdle(std::chrono::milliseconds(500))) {
      idle = true;
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
  }
  runtime_->scheduler().stop();
  return idle;
}

int Commands::upload(
  const std::string& account, const std::string& local_path, const std::string& remote_path
) {
  AccountLookup lookup = runtime_->accounts().resolve(account);
  if (std::holds_alternative<AccountNotFound>(lookup)) {
    std::cerr << "Error: Unknown account '" << account << "'" << std::endl;
    return 1;
  }
  const User& user = std::get<AccountFound>(lookup).user;

  if (!runtime_->filesystem().is_regular_file(local_path)) {
    std::cerr << "Error: Not a regular file: " << local_path << std::endl;
    return 1;
  }

  runtime_->scheduler().start();
  auto ids = runtime_->helper().uploadNewFiles(
    user, {local_path}, {remote_path}, options_.local_behaviour, CreatedBy::USER,
    options_.collision_policy
  );
  if (ids.empty()) {
    runtime_->scheduler().stop();
    std::cerr << "Error: Failed to queue " << local_path << std::endl;
    return 1;
  }

  bool idle = drain();

  auto record = runtime_->store().getUpload(ids.front());
  if (!record) {
    std::cerr << "Error: Upload #" << ids.front() << " disappeared from the store" << std::endl;
    return 1;
  }
  print_record(*record);
  if (!idle) {
    std::cout << "Upload still queued; 'cirrus_uploader run' will continue it." << std::endl;
  }
  return record->status == UploadStatus::DONE ? 0 : 1;
}

int Commands::run() {
  if (runtime_->preferences().isGlobalUploadPaused()) {
    std::cout << "Uploads are paused; queued uploads stay pending until 'resume'." << std::endl;
  }

  runtime_->scheduler().start();
  CIRRUS_LOG_INFO("Uploader running" << kv("once", options_.once));

  while (!exit_requested_.load()) {
    if (options_.once) {
      if (runtime_->scheduler().waitForIdle(std::chrono::milliseconds(500))) {
        break;
      }
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
  }

  std::cout << "Stopping uploader..." << std::endl;
  runtime_->scheduler().stop();

  const auto& stats = runtime_->notifier().stats();
  std::cout << "\n=== Upload Statistics ===\n"
            << "Started:   " << stats.started.load() << "\n"
            << "Succeeded: " << stats.succeeded.load() << "\n"
            << "Skipped:   " << stats.skipped.load() << "\n"
            << "Retryable: " << stats.retryable.load() << "\n"
            << "Failed:    " << stats.failed.load() << "\n"
            << "Batches:   " << stats.batches.load() << "\n"
            << std::endl;
  return 0;
}

int Commands::pause() {
  runtime_->preferences().setGlobalUploadPaused(true);
  std::cout << "Uploads paused." << std::endl;
  return 0;
}

int Commands::resume() {
  runtime_->preferences().setGlobalUploadPaused(false);
  std::cout << "Uploads resumed." << std::endl;
  return 0;
}

int Commands::status(const std::string& account) {
  auto& store = runtime_->store();

  std::cout << "Upload Status: "
            << (runtime_->preferences().isGlobalUploadPaused() ? "PAUSED" : "ACTIVE") << std::endl;
  std::cout << "Database: " << store.dbPath() << std::endl;
  std::cout << "Pending:     " << store.countByStatus(UploadStatus::PENDING) << std::endl;
  std::cout << "In progress: " << store.countByStatus(UploadStatus::IN_PROGRESS) << std::endl;
  std::cout << "Done:        " << store.countByStatus(UploadStatus::DONE) << std::endl;
  std::cout << "Failed:      " << store.countByStatus(UploadStatus::FAILED) << std::endl;

  if (!account.empty()) {
    auto records = store.getUploadsForAccount(account);
    std::cout << std::endl << "Account " << account << " (" << records.size() << " uploads):" << std::endl;
    for (const auto& record : records) {
      print_record(record);
    }
  }
  return 0;
}

int Commands::cancel(const std::string& account) {
  auto records = runtime_->store().getPendingUploadsForAccount(account);
  size_t cancelled = 0;
  for (const auto& record : records) {
    if (runtime_->store().updateUploadStatus(record.id, UploadStatus::FAILED, ResultCode::CANCELLED)) {
      ++cancelled;
    } else {
      CIRRUS_LOG_WARN("Failed to cancel upload" << kv("upload_id", record.id));
    }
  }
  std::cout << "Cancelled " << cancelled << " upload(s) of " << account << "." << std::endl;
  return cancelled == records.size() ? 0 : 1;
}

int Commands::retry(const std::string& account) {
  runtime_->scheduler().start();
  size_t count = runtime_->helper().retryFailedUploads(account);
  if (count == 0) {
    runtime_->scheduler().stop();
    std::cout << "No failed uploads for " << account << "." << std::endl;
    return 0;
  }

  std::cout << "Retrying " << count << " upload(s) of " << account << "..." << std::endl;
  drain();

  int failures = 0;
  for (const auto& record : runtime_->store().getUploadsForAccount(account)) {
    if (record.status != UploadStatus::DONE) {
      print_record(record);
      ++failures;
    }
  }
  return failures == 0 ? 0 : 1;
}

int Commands::clean() {
  int removed = runtime_->store().deleteFinished();
  std::cout << "Deleted " << removed << " finished upload(s)." << std::endl;
  return 0;
}

int Commands::execute(int argc, char* argv[]) {
  std::string command;

  if (argc > 1) {
    command = argv[1];
  }

  if (command.empty() || command == "help" || command == "-h" || command == "--help") {
    print_usage();
    return 0;
  }

  // Parse flags, collect positional arguments
  std::vector<std::string> args;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        std::cerr << "Error: --config requires a file argument" << std::endl;
        return 1;
      }
      options_.config_path = argv[++i];
    } else if (arg == "--behaviour") {
      if (i + 1 >= argc || !parse_local_behaviour(argv[i + 1], options_.local_behaviour)) {
        std::cerr << "Error: --behaviour requires one of copy, move, forget, delete" << std::endl;
        return 1;
      }
      ++i;
    } else if (arg == "--collision") {
      if (i + 1 >= argc || !parse_collision_policy(argv[i + 1], options_.collision_policy)) {
        std::cerr << "Error: --collision requires one of default, overwrite, rename, skip, ask_user"
                  << std::endl;
        return 1;
      }
      ++i;
    } else if (arg == "--timeout") {
      if (i + 1 >= argc || std::atoi(argv[i + 1]) <= 0) {
        std::cerr << "Error: --timeout requires a positive number of seconds" << std::endl;
        return 1;
      }
      options_.timeout = std::chrono::seconds(std::atoi(argv[++i]));
    } else if (arg == "--once") {
      options_.once = true;
    } else if (arg == "--events") {
      options_.print_events = true;
    } else if (arg == "--verbose" || arg == "-v") {
      options_.verbose = true;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Error: Unknown option '" << arg << "'" << std::endl;
      return 1;
    } else {
      args.push_back(arg);
    }
  }

  size_t required = 0;
  if (command == "upload") {
    required = 3;
  } else if (command == "cancel" || command == "retry") {
    required = 1;
  } else if (command != "run" && command != "pause" && command != "resume" &&
             command != "status" && command != "clean") {
    std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
    print_usage();
    return 1;
  }
  if (args.size() < required) {
    std::cerr << "Error: '" << command << "' requires " << required << " argument(s)" << std::endl;
    print_usage();
    return 1;
  }

  if (!initialize()) {
    return 1;
  }

  int rc = 0;
  if (command == "upload") {
    rc = upload(args[0], args[1], args[2]);
  } else if (command == "run") {
    rc = run();
  } else if (command == "pause") {
    rc = pause();
  } else if (command == "resume") {
    rc = resume();
  } else if (command == "status") {
    rc = status(args.empty() ? std::string() : args[0]);
  } else if (command == "cancel") {
    rc = cancel(args[0]);
  } else if (command == "retry") {
    rc = retry(args[0]);
  } else {
    rc = clean();
  }

  runtime_.reset();
  logging::shutdown_logging();
  return rc;
}

void Commands::print_usage() {
  std::cout << "Usage: cirrus_uploader <command> [arguments] [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  upload <account> <local> <remote>  Queue a file and upload it" << std::endl;
  std::cout << "  run                                Process queued uploads until Ctrl+C"
            << std::endl;
  std::cout << "  pause                              Pause all uploads" << std::endl;
  std::cout << "  resume                             Resume uploads" << std::endl;
  std::cout << "  status [account]                   Show queue status" << std::endl;
  std::cout << "  cancel <account>                   Cancel unfinished uploads of an account"
            << std::endl;
  std::cout << "  retry <account>                    Retry failed uploads of an account"
            << std::endl;
  std::cout << "  clean                              Delete finished upload records" << std::endl;
  std::cout << "  help                               Show this help message" << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config, -c PATH     Config file (default: /etc/cirrus/uploader.yaml)"
            << std::endl;
  std::cout << "  --behaviour MODE      After upload: copy, move, forget, delete (default: forget)"
            << std::endl;
  std::cout << "  --collision POLICY    default, overwrite, rename, skip, ask_user" << std::endl;
  std::cout << "  --timeout SECONDS     How long upload/retry wait for completion (default: 300)"
            << std::endl;
  std::cout << "  --once                run: exit when the queue is idle" << std::endl;
  std::cout << "  --events              Print upload events as JSON lines" << std::endl;
  std::cout << "  --verbose, -v         Debug logging on the console" << std::endl;
}

}  // namespace app
}  // namespace cirrus
