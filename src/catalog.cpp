#include "catalog.hpp"

#include <fstream>
#include <unordered_set>

#include "errors.hpp"
#include "url.hpp"
#include "utils.hpp"

namespace {

const char* const kZenodoBase = "https://zenodo.org/record/4010759/files/";

// Zenodo record 4010759, split archives per category. No digests are published for them.
const char* const kBuiltinFiles[] = {
  "Adjectives_1of8.zip", "Adjectives_2of8.zip", "Adjectives_3of8.zip", "Adjectives_4of8.zip",
  "Adjectives_5of8.zip", "Adjectives_6of8.zip", "Adjectives_7of8.zip", "Adjectives_8of8.zip",
  "Animals_1of2.zip", "Animals_2of2.zip",
  "Clothes_1of2.zip", "Clothes_2of2.zip",
  "Days_and_Time_1of3.zip", "Days_and_Time_2of3.zip", "Days_and_Time_3of3.zip",
  "Electronics_1of2.zip", "Electronics_2of2.zip",
  "Greetings_1of2.zip", "Greetings_2of2.zip",
  "Home_1of4.zip", "Home_2of4.zip", "Home_3of4.zip", "Home_4of4.zip",
  "Jobs_1of2.zip", "Jobs_2of2.zip",
  "Means_of_Transportation_1of2.zip", "Means_of_Transportation_2of2.zip",
  "People_1of5.zip", "People_2of5.zip", "People_3of5.zip", "People_4of5.zip", "People_5of5.zip",
  "Places_1of4.zip", "Places_2of4.zip", "Places_3of4.zip", "Places_4of4.zip",
  "Pronouns_1of2.zip", "Pronouns_2of2.zip",
  "Seasons_1of1.zip",
  "Society_1of3.zip", "Society_2of3.zip", "Society_3of3.zip"
};

CatalogEntry entry_from_json(const nlohmann::json& item, std::size_t index) {
  auto where = "catalog entry " + std::to_string(index);
  if(!item.is_object()) {
    throw FetchFailure(FetchError::ConfigInvalid, where + " is not an object");
  }
  auto url = item.find("url");
  if(url == item.end() || !url->is_string()) {
    throw FetchFailure(FetchError::ConfigInvalid, where + " has no string 'url'");
  }
  CatalogEntry entry;
  entry.locator = url->get<std::string>();
  auto digest = item.find("sha256");
  if(digest != item.end() && !digest->is_null()) {
    if(!digest->is_string()) {
      throw FetchFailure(FetchError::ConfigInvalid, where + " has a non-string 'sha256'");
    }
    entry.expected_digest = digest->get<std::string>();
  }
  return entry;
}

} // namespace

std::string CatalogEntry::file_name() const {
  return file_name_from_locator(locator);
}

Catalog::Catalog(std::vector<CatalogEntry> entries)
  : entries_(std::move(entries)) {
  std::unordered_set<std::string> names;
  for(std::size_t i = 0; i < entries_.size(); ++i) {
    auto& entry = entries_[i];
    if(!parse_url(entry.locator)) {
      throw FetchFailure(FetchError::ConfigInvalid,
                         "catalog entry " + std::to_string(i) + " has no absolute http(s) URL: '" +
                         entry.locator + "'");
    }
    auto name = entry.file_name();
    if(name.empty() || name == "." || name == "..") {
      throw FetchFailure(FetchError::ConfigInvalid,
                         "catalog entry " + std::to_string(i) + " URL has no file name: " + entry.locator);
    }
    if(!names.insert(name).second) {
      throw FetchFailure(FetchError::ConfigInvalid,
                         "catalog entries share the target file name '" + name + "'");
    }
    if(entry.expected_digest) {
      if(!is_hex_digest(*entry.expected_digest)) {
        throw FetchFailure(FetchError::ConfigInvalid,
                           "catalog entry " + std::to_string(i) + " digest is not 64 hex characters");
      }
      entry.expected_digest = to_lower(*entry.expected_digest);
    }
  }
}

Catalog Catalog::builtin() {
  std::vector<CatalogEntry> entries;
  for(const char* file : kBuiltinFiles) {
    entries.push_back(CatalogEntry{std::string(kZenodoBase) + file, std::nullopt});
  }
  return Catalog(std::move(entries));
}

Catalog Catalog::from_json(const nlohmann::json& doc) {
  const nlohmann::json* list = &doc;
  if(doc.is_object()) {
    auto it = doc.find("entries");
    if(it == doc.end()) {
      throw FetchFailure(FetchError::ConfigInvalid, "catalog object has no 'entries' array");
    }
    list = &*it;
  }
  if(!list->is_array()) {
    throw FetchFailure(FetchError::ConfigInvalid, "catalog entries must be an array");
  }
  std::vector<CatalogEntry> entries;
  entries.reserve(list->size());
  for(std::size_t i = 0; i < list->size(); ++i) {
    entries.push_back(entry_from_json((*list)[i], i));
  }
  return Catalog(std::move(entries));
}

Catalog Catalog::load_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) {
    throw FetchFailure(FetchError::ConfigInvalid, "Unable to open catalog " + path.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw FetchFailure(FetchError::ConfigInvalid,
                       "Failed to parse catalog " + path.string() + ": " + e.what());
  }
  return from_json(doc);
}

nlohmann::json Catalog::to_json() const {
  nlohmann::json list = nlohmann::json::array();
  for(const auto& entry : entries_) {
    nlohmann::json item{{"url", entry.locator}};
    if(entry.expected_digest) item["sha256"] = *entry.expected_digest;
    list.push_back(std::move(item));
  }
  return nlohmann::json{{"entries", std::move(list)}};
}
