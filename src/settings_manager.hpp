#pragma once

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

// One row per option. "min"/"max" bound int values; non-persistent keys are never saved.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","target_dir"},          {"aliases", {"dir","d"}},             {"type","string"}, {"default","downloads"}, {"description","Directory the catalog files are stored in"}, {"persistent", true}},
  {{"key","catalog"},             {"aliases", {"c"}},                   {"type","string"}, {"default",""},          {"description","JSON catalog file (empty = built-in catalog)"}, {"persistent", true}},
  {{"key","chunk_size"},          {"aliases", {"cs"}},                  {"type","int"},    {"default",32768},       {"description","Bytes read and written per transfer chunk"}, {"persistent", true}, {"min", 1}, {"max", 67108864}},
  {{"key","verify_block_size"},   {"aliases", {"vbs"}},                 {"type","int"},    {"default",1000000},     {"description","Bytes hashed per block during validation"}, {"persistent", true}, {"min", 1}, {"max", 67108864}},
  {{"key","timeout_ms"},          {"aliases", {"timeout","t"}},         {"type","int"},    {"default",30000},       {"description","Per network operation timeout in milliseconds"}, {"persistent", true}, {"min", 1}, {"max", 3600000}},
  {{"key","max_redirects"},       {"aliases", {"mr"}},                  {"type","int"},    {"default",5},           {"description","Redirects followed before giving up"}, {"persistent", true}, {"min", 0}, {"max", 20}},
  {{"key","verify_tls"},          {"aliases", {"tls"}},                 {"type","bool"},   {"default",true},        {"description","Verify TLS server certificates"}, {"persistent", true}},
  {{"key","ca_file"},             {"aliases", {"ca"}},                  {"type","string"}, {"default",""},          {"description","PEM CA bundle for https (empty = system trust store)"}, {"persistent", true}},
  {{"key","transfer_progress"},   {"aliases", {"progress","tp"}},       {"type","bool"},   {"default",true},        {"description","Show ASCII progress meter during downloads"}, {"persistent", true}},
  {{"key","progress_meter_size"}, {"aliases", {"meter","pms"}},         {"type","int"},    {"default",40},          {"description","Number of characters used for the progress meter"}, {"persistent", true}, {"min", 1}, {"max", 200}},
  {{"key","verbose"},             {"aliases", {"v"}},                   {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},               {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},             {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingKind {
  Bool,
  Int,
  Text
};

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;
  bool has(const std::string& key) const;

  // Both return false and fill error when the key is unknown or the value does not fit its rule.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  // Canonical key for a key or alias, any case.
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  static bool is_bool_literal(const std::string& value);

private:
  struct Rule {
    std::string key;
    std::vector<std::string> aliases; // lower case
    SettingKind kind = SettingKind::Text;
    nlohmann::json default_value;
    bool persistent = true;
    std::optional<long long> min;
    std::optional<long long> max;
  };

  static std::vector<Rule> compile_rules(const nlohmann::json& specification);
  static std::optional<bool> bool_literal(const std::string& value);

  const Rule* find_rule(const std::string& token) const;
  bool store(const Rule& rule, const nlohmann::json& value, std::string& error);
  nlohmann::json persistent_values() const;

  std::vector<Rule> rules_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_;
};

inline std::vector<SettingsManager::Rule> SettingsManager::compile_rules(const nlohmann::json& specification) {
  std::vector<Rule> rules;
  for(const auto& entry : specification) {
    Rule rule;
    rule.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      rule.aliases.push_back(to_lower(alias));
    }
    const auto type = entry.at("type").get<std::string>();
    if(type == "bool") {
      rule.kind = SettingKind::Bool;
    } else if(type == "int") {
      rule.kind = SettingKind::Int;
    } else if(type == "string") {
      rule.kind = SettingKind::Text;
    } else {
      throw std::invalid_argument("setting '" + rule.key + "' has unknown type '" + type + "'");
    }
    rule.default_value = entry.at("default");
    rule.persistent = entry.value("persistent", true);
    if(entry.contains("min")) rule.min = entry.at("min").get<long long>();
    if(entry.contains("max")) rule.max = entry.at("max").get<long long>();
    rules.push_back(std::move(rule));
  }
  return rules;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : rules_(compile_rules(specification)) {
  for(const auto& rule : rules_) {
    values_[rule.key] = rule.default_value;
  }
}

inline const SettingsManager::Rule* SettingsManager::find_rule(const std::string& token) const {
  const std::string lowered = to_lower(token);
  for(const auto& rule : rules_) {
    if(to_lower(rule.key) == lowered ||
       std::find(rule.aliases.begin(), rule.aliases.end(), lowered) != rule.aliases.end()) {
      return &rule;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return values_.contains(key);
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::out_of_range("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}

inline std::optional<bool> SettingsManager::bool_literal(const std::string& value) {
  const std::string v = to_lower(trim(value));
  if(v == "true" || v == "on" || v == "yes" || v == "1") return true;
  if(v == "false" || v == "off" || v == "no" || v == "0") return false;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  return bool_literal(value).has_value();
}

inline bool SettingsManager::store(const Rule& rule, const nlohmann::json& value, std::string& error) {
  switch(rule.kind) {
    case SettingKind::Bool:
      if(value.is_boolean()) {
        values_[rule.key] = value.get<bool>();
        return true;
      }
      if(value.is_number_integer()) {
        values_[rule.key] = value.get<long long>() != 0;
        return true;
      }
      error = "expected boolean";
      return false;

    case SettingKind::Int: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      const auto number = value.get<long long>();
      if(rule.min && number < *rule.min) {
        error = "must be at least " + std::to_string(*rule.min);
        return false;
      }
      if(rule.max && number > *rule.max) {
        error = "must be at most " + std::to_string(*rule.max);
        return false;
      }
      if(number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        error = "out of range";
        return false;
      }
      values_[rule.key] = static_cast<int>(number);
      return true;
    }

    case SettingKind::Text:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      values_[rule.key] = value.get<std::string>();
      return true;
  }
  error = "unsupported setting";
  return false;
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  error.clear();
  const auto* rule = find_rule(key);
  if(!rule) {
    error = "unknown setting";
    return false;
  }
  return store(*rule, value, error);
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  error.clear();
  const auto* rule = find_rule(key);
  if(!rule) {
    error = "unknown setting";
    return false;
  }
  const std::string text = trim(value);
  switch(rule->kind) {
    case SettingKind::Bool: {
      auto flag = bool_literal(text);
      if(!flag) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      return store(*rule, *flag, error);
    }
    case SettingKind::Int: {
      const bool negative = !text.empty() && text.front() == '-';
      auto magnitude = parse_u64(negative ? text.substr(1) : text);
      if(!magnitude || *magnitude > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        error = "expected integer";
        return false;
      }
      const long long number = static_cast<long long>(*magnitude);
      return store(*rule, negative ? -number : number, error);
    }
    case SettingKind::Text:
      return store(*rule, text, error);
  }
  error = "unsupported setting";
  return false;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* rule = find_rule(token)) return rule->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* rule = find_rule(key);
  return rule && rule->kind == SettingKind::Bool;
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: not a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* rule = find_rule(item.key());
    if(!rule || !rule->persistent) continue;
    std::string error;
    if(!store(*rule, item.value(), error)) {
      print_err(nullptr, "Ignoring setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline nlohmann::json SettingsManager::persistent_values() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& rule : rules_) {
    if(rule.persistent) doc[rule.key] = values_.at(rule.key);
  }
  return doc;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if(ec) {
      print_err(nullptr, "Unable to create {}: {}", path.parent_path().string(), ec.message());
      return false;
    }
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << persistent_values().dump(2) << "\n";
  return static_cast<bool>(out);
}
