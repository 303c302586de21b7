#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::vector<std::string> action_names,
                                     nlohmann::json settings_spec)
  : process_name_(std::move(process_name)),
    action_names_(std::move(action_names)),
    settings_spec_(std::move(settings_spec)) {}

bool CommandLineParser::is_action(const std::string& word) const {
  return std::find(action_names_.begin(), action_names_.end(), to_lower(word)) != action_names_.end();
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?')) {
    return true;
  }
  return false;
}

std::vector<std::string> CommandLineParser::parse(int argc,
                                                  const char* const argv[],
                                                  SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::vector<std::string> actions;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(is_option_token(token)) {
      std::string key_token = token.substr(token.rfind("--", 0) == 0 ? 2 : 1);
      std::string inline_value;
      bool has_inline = false;
      auto eq = key_token.find('=');
      if(eq != std::string::npos) {
        inline_value = key_token.substr(eq + 1);
        key_token.erase(eq);
        has_inline = true;
      }

      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        throw CommandLineError("Unknown option " + token);
      }
      std::string value;
      if(has_inline) {
        value = inline_value;
      } else if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          throw CommandLineError("Missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw CommandLineError("Invalid value for option '" + key_token + "': " + error);
      }
      continue;
    }

    if(!is_action(token)) {
      throw CommandLineError("Unexpected argument '" + token + "'");
    }
    actions.push_back(to_lower(token));
  }
  return actions;
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - resumable catalog downloader", process_name_);
  print_out(nullptr, "Usage:");

  std::string commands;
  for(const auto& action : action_names_) {
    if(!commands.empty()) commands += "|";
    commands += action;
  }
  print_out(nullptr, "  {} [options] [{}]...", process_name_, commands);
  print_out(nullptr, "");
  print_out(nullptr, "Commands run in the order given; with none, download runs.");
  print_out(nullptr, "  download   fetch every catalog file, resuming partial ones");
  print_out(nullptr, "  validate   check every downloaded file against its sha256");
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    auto description = entry.value("description", "");
    auto default_value = entry.at("default");
    std::string default_str;
    if(type == "bool") {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    print_out(nullptr, "  --{} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              description,
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
}
