#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct CatalogEntry {
  std::string locator;
  std::optional<std::string> expected_digest; // lowercase sha256 hex

  // Name of the file this entry lands in: the final path segment of the locator.
  std::string file_name() const;
};

class Catalog {
public:
  Catalog() = default;
  // Validates every entry; throws FetchFailure(ConfigInvalid).
  explicit Catalog(std::vector<CatalogEntry> entries);

  static Catalog builtin();
  static Catalog from_json(const nlohmann::json& doc);
  static Catalog load_file(const std::filesystem::path& path);

  const std::vector<CatalogEntry>& entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  nlohmann::json to_json() const;

private:
  std::vector<CatalogEntry> entries_;
};
