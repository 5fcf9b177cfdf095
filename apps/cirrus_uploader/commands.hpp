// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOADER_COMMANDS_HPP
#define CIRRUS_UPLOADER_COMMANDS_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "uploader_config.hpp"
#include "uploader_runtime.hpp"

namespace cirrus {
namespace app {

/**
 * Options shared by all commands
 */
struct CommandOptions {
  std::string config_path = "/etc/cirrus/uploader.yaml";
  uploader::LocalBehaviour local_behaviour = uploader::LocalBehaviour::FORGET;
  uploader::NameCollisionPolicy collision_policy = uploader::NameCollisionPolicy::DEFAULT;
  bool once = false;
  bool print_events = false;
  bool verbose = false;
  std::chrono::seconds timeout{300};
};

/**
 * Command handler for the cirrus_uploader CLI
 */
class Commands {
public:
  Commands() = default;
  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

  /**
   * Queue one file and upload it in this process
   */
  int upload(const std::string& account, const std::string& local_path, const std::string& remote_path);

  /**
   * Process queued uploads until interrupted, or until idle with --once
   */
  int run();

  int pause();

  int resume();

  /**
   * Print queue counters, and the records of one account if given
   */
  int status(const std::string& account);

  /**
   * Mark every unfinished upload of an account as cancelled
   */
  int cancel(const std::string& account);

  /**
   * Re-queue the failed uploads of an account and upload them
   */
  int retry(const std::string& account);

  /**
   * Delete finished records from the store
   */
  int clean();

  /**
   * Ask a running run() loop to exit
   */
  static void request_exit();

  const CommandOptions& options() const {
    return options_;
  }

private:
  /**
   * Load and validate the config, start logging and build the runtime
   */
  bool initialize();

  /**
   * Wait for the scheduler to go idle, then stop it
   */
  bool drain();

  void print_usage();

  CommandOptions options_;
  AppConfig config_;
  std::unique_ptr<UploaderRuntime> runtime_;

  static std::atomic<bool> exit_requested_;
};

}  // namespace app
}  // namespace cirrus

#endif  // CIRRUS_UPLOADER_COMMANDS_HPP
