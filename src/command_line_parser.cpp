#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "errors.hpp"
#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::string summary,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    summary_(std::move(summary)),
    settings_spec_(std::move(settings_spec)),
    argv_spec_(std::move(argv_spec)),
    positional_specs_(build_positional_specs(argv_spec_)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!probe.resolve_key(argv_entry.key)) {
      throw DaemonError(ErrorKind::Configuration,
                        "positional argument references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return candidate.size() > 2;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  parse(argc, argv, settings, nullptr);
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings,
                              std::vector<std::string>* rest) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, settings, rest);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings,
                              std::vector<std::string>* rest) const {
  std::size_t positional_index = 0;

  auto fail = [](const std::string& message){
    throw DaemonError(ErrorKind::Configuration, message);
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    // Returns false when a short alias is unknown so the token is treated
    // as positional (negative numbers, for instance).
    auto handle_option = [&](const std::string& key_token, bool long_form){
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) fail("unknown option --" + key_token);
        return false;
      }
      std::string value;
      if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) fail("missing value for option '" + key_token + "'");
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        fail("invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0 && token.size() > 2) {
      std::string key = token.substr(2);
      auto eq = key.find('=');
      if(eq != std::string::npos) {
        auto resolved = settings.resolve_key(key.substr(0, eq));
        if(!resolved) fail("unknown option --" + key.substr(0, eq));
        std::string error;
        if(!settings.set_from_string(*resolved, key.substr(eq + 1), error)) {
          fail("invalid value for option '" + key.substr(0, eq) + "': " + error);
        }
        continue;
      }
      handle_option(key, true);
      continue;
    }

    if(is_option_token(token) && handle_option(token.substr(1), false)) {
      continue;
    }

    if(positional_index < positional_specs_.size()) {
      const auto& spec = positional_specs_[positional_index++];
      std::string error;
      if(!settings.set_from_string(spec.key, token, error)) {
        fail("invalid value for " + spec.key + " '" + token + "': " + error);
      }
      continue;
    }

    if(!rest) fail("unexpected argument '" + token + "'");
    rest->assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    return;
  }
}

void CommandLineParser::usage(const std::string& commands_help) const {
  print_out(nullptr, "{} - {}", process_name_, summary_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_ + " [options]";
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  if(!commands_help.empty()) cmd += " <command> [args...]";
  print_out(nullptr, "  {}", cmd);

  if(!commands_help.empty()) {
    print_out(nullptr, "");
    print_out(nullptr, "Commands:");
    print_out(nullptr, "{}", commands_help);
  }

  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases") && !entry.at("aliases").empty()) {
      aliases << " (alias:";
      for(const auto& alias : entry.at("aliases")) {
        aliases << " -" << alias.get<std::string>();
      }
      aliases << ")";
    }
    if(entry.contains("env")) {
      aliases << " [env " << entry.at("env").get<std::string>() << "]";
    }
    const auto& default_value = entry.at("default");
    std::string default_str;
    if(default_value.is_boolean()) {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
      if(default_str.empty()) default_str = "auto";
    } else {
      default_str = default_value.dump();
    }
    print_out(nullptr, "  --{:<24} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              entry.value("description", ""),
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
}
