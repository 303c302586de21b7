#include "fetch_config.hpp"

#include "errors.hpp"

namespace {

std::size_t positive_setting(const SettingsManager& settings, const char* key) {
  int value = settings.get<int>(key);
  if(value <= 0) {
    throw FetchFailure(FetchError::ConfigInvalid,
                       std::string(key) + " must be positive (got " + std::to_string(value) + ")");
  }
  return static_cast<std::size_t>(value);
}

std::filesystem::path anchored(const std::filesystem::path& base, const std::string& value) {
  std::filesystem::path path(value);
  if(path.is_absolute()) return path;
  return base / path;
}

} // namespace

FetchConfig FetchConfig::from_settings(const SettingsManager& settings,
                                       const std::filesystem::path& base_dir) {
  FetchConfig config;
  try {
    auto target = settings.get<std::string>("target_dir");
    if(target.empty()) {
      throw FetchFailure(FetchError::ConfigInvalid, "target_dir must not be empty");
    }
    config.target_dir = anchored(base_dir, target).lexically_normal();

    auto catalog = settings.get<std::string>("catalog");
    if(!catalog.empty()) config.catalog_file = anchored(base_dir, catalog);

    config.chunk_size = positive_setting(settings, "chunk_size");
    config.verify_block_size = positive_setting(settings, "verify_block_size");
    config.timeout = std::chrono::milliseconds(positive_setting(settings, "timeout_ms"));
    config.max_redirects = settings.get<int>("max_redirects");
    if(config.max_redirects < 0) {
      throw FetchFailure(FetchError::ConfigInvalid, "max_redirects must not be negative");
    }
    config.verify_tls = settings.get<bool>("verify_tls");
    auto ca_file = settings.get<std::string>("ca_file");
    if(!ca_file.empty()) config.ca_file = anchored(base_dir, ca_file);
    config.show_progress = settings.get<bool>("transfer_progress");
    config.progress_meter_size = positive_setting(settings, "progress_meter_size");
    config.verbose = settings.get<bool>("verbose");
  } catch(const nlohmann::json::exception& e) {
    throw FetchFailure(FetchError::ConfigInvalid, std::string("Malformed settings: ") + e.what());
  }
  return config;
}
