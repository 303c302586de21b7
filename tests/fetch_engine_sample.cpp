#include "settings_manager.hpp"
#include "catalog.hpp"
#include "fetch_config.hpp"
#include "fetch_engine.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <stdexcept>

// Serves two files from a loopback server, interrupts one of them, then runs
// download twice and validate once the way an operator would.
int main() {
  namespace fs = std::filesystem;

  init(false);
  auto base = fs::temp_directory_path() / "fetch_engine_sample";
  std::error_code ec;
  fs::remove_all(base, ec);
  fs::create_directories(base, ec);

  fetch::test::LoopbackHttpServer server;
  server.start();
  fetch::test::LoopbackHttpServer::Resource archive;
  archive.body = fetch::test::pattern_bytes(200000, 1);
  archive.cut_after = 80000;
  server.set_resource("/files/archive.zip", archive);
  fetch::test::LoopbackHttpServer::Resource notes;
  notes.body = "sample notes without a registered digest\n";
  server.set_resource("/files/notes.txt", notes);

  nlohmann::json catalog_doc = {
    {"entries", nlohmann::json::array({
      {{"url", server.url("/files/archive.zip")}, {"sha256", fetch::test::sha256_of(archive.body)}},
      {{"url", server.url("/files/notes.txt")}}
    })}
  };

  SettingsManager settings;
  settings.set_settings_path(base / ".config" / "settings.json");
  auto configure = [&settings](const std::string& key, const nlohmann::json& value){
    std::string error;
    if(!settings.set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };
  configure("target_dir", "downloads");
  configure("timeout_ms", 2000);
  configure("transfer_progress", true);

  FetchEngine engine(FetchConfig::from_settings(settings, base), Catalog::from_json(catalog_doc));

  int first = engine.run({"download"});
  std::cout << "first download exit status " << first << "\n";
  int second = engine.run({"download", "validate"});
  std::cout << "resumed download and validate exit status " << second << "\n";

  server.stop();
  fs::remove_all(base, ec);
  return second;
}
