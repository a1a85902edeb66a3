#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  // Positional arguments: treeswarm [command] [target] [context]
  CommandLineParser(std::string process_name = "treeswarm",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","command"}},
                      {{"index",1},{"key","target"}},
                      {{"index",2},{"key","context"}}
                    }));

  // Reports the error and exits with status 1 on a bad argument.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  bool try_parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;
  std::string usage_text() const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
