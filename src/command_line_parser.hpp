#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto a SettingsManager: `--key value`, `-alias value`, bare
// boolean flags, then positional tokens in argv_spec order. Parse failures
// throw DaemonError(ErrorKind::Configuration).
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "libreconnectd",
                    std::string summary = "LibreConnect daemon",
                    nlohmann::json settings_spec = DAEMON_SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","port"}}
                    }));

  void parse(int argc, char* argv[], SettingsManager& settings) const;

  // Once the positional settings are used up, the first further token and
  // everything after it are copied verbatim into `rest`.
  void parse(int argc, char* argv[], SettingsManager& settings,
             std::vector<std::string>* rest) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings,
             std::vector<std::string>* rest = nullptr) const;

  void usage(const std::string& commands_help = std::string()) const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::string summary_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
