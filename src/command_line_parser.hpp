#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class CommandLineParser {
public:
  CommandLineParser(std::string process_name,
                    std::vector<std::string> action_names,
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION);

  // Applies options to settings and returns the positional actions in the
  // order given. Throws CommandLineError on anything it cannot place.
  std::vector<std::string> parse(int argc, const char* const argv[], SettingsManager& settings) const;
  void usage() const;

private:
  bool is_action(const std::string& word) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::vector<std::string> action_names_;
  nlohmann::json settings_spec_;
};
