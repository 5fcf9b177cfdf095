// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// Cirrus Uploader - batched, resumable upload worker
// Moves local files into per-account remote storage

#include <csignal>
#include <exception>
#include <iostream>

#include "commands.hpp"

namespace {

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    cirrus::app::Commands::request_exit();
  }
}

}  // namespace

/**
 * Main entry point for cirrus_uploader
 */
int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  cirrus::app::Commands commands;

  try {
    return commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
