#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

#include "settings_manager.hpp"

// Immutable run configuration, built once at startup.
struct FetchConfig {
  std::filesystem::path target_dir = "downloads";
  std::filesystem::path catalog_file; // empty = built-in catalog
  std::size_t chunk_size = 32 * 1024;
  std::size_t verify_block_size = 1000 * 1000;
  std::chrono::milliseconds timeout{30000};
  int max_redirects = 5;
  bool verify_tls = true;
  std::filesystem::path ca_file; // empty = system trust store
  bool show_progress = true;
  std::size_t progress_meter_size = 40;
  bool verbose = false;

  // Relative paths resolve against base_dir. Throws FetchFailure(ConfigInvalid).
  static FetchConfig from_settings(const SettingsManager& settings,
                                   const std::filesystem::path& base_dir = std::filesystem::current_path());
};
