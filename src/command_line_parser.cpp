#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

namespace {

struct CommandHelp {
  const char* usage;
  const char* summary;
};

const CommandHelp kCommands[] = {
  {"serve",                "serve the share (peer) or the index (tracker) until interrupted"},
  {"index <dir>",          "hash a directory locally and print its tree hash"},
  {"search <query>",       "name substring, .ext, folder/, or hash:<hex>"},
  {"get <hash> [context]", "download a file or folder, optionally from one enclosing folder"},
  {"all",                  "list every declared root"},
  {"lookup <hash>",        "owners and enclosing folders of a hash"},
};

std::string argument_hint(const nlohmann::json& entry) {
  auto type = entry.at("type").get<std::string>();
  if(type == "bool") return "[true|false]";
  if(type == "enum") {
    std::string hint;
    for(const auto& choice : entry.value("choices", std::vector<std::string>{})) {
      hint += (hint.empty() ? "<" : "|") + choice;
    }
    return hint + ">";
  }
  if(type == "size") return "<bytes|K|M|G>";
  return "<" + type + ">";
}

std::string default_text(const nlohmann::json& entry) {
  const auto& value = entry.at("default");
  if(value.is_string()) {
    auto text = value.get<std::string>();
    return text.empty() ? "none" : text;
  }
  if(entry.at("type") == "size" && value.is_number()) {
    auto bytes = value.get<uint64_t>();
    return bytes == 0 ? "0" : format_size(bytes);
  }
  return value.dump();
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    argv_spec_(std::move(argv_spec)),
    positional_specs_(build_positional_specs(argv_spec_)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  SettingsManager known(settings_spec_);
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    if(!known.resolve_key(out.key)) {
      throw std::runtime_error("positional argument " + std::to_string(out.index) +
                               " maps to unknown setting '" + out.key + "'");
    }
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  static const char* const kLiterals[] = {"true", "false", "on", "off", "1", "0", "yes", "no"};
  auto lowered = to_lower(trim_copy(value));
  return std::any_of(std::begin(kLiterals), std::end(kLiterals),
                     [&](const char* literal){ return lowered == literal; });
}

bool CommandLineParser::try_parse(const std::vector<std::string>& args,
                                  SettingsManager& settings,
                                  std::string& error) const {
  std::size_t positional_index = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    // "--key value", "--key=value" and "-alias value". An unknown short alias
    // is taken as a positional so negative numbers still parse.
    std::optional<std::string> key;
    std::optional<std::string> inline_value;
    std::string key_token;
    if(token.rfind("--", 0) == 0) {
      key_token = token.substr(2);
      auto eq = key_token.find('=');
      if(eq != std::string::npos) {
        inline_value = key_token.substr(eq + 1);
        key_token.resize(eq);
      }
      key = settings.resolve_key(key_token);
      if(!key) {
        error = "Unknown option --" + key_token;
        return false;
      }
    } else if(token.size() > 1 && token[0] == '-') {
      key_token = token.substr(1);
      key = settings.resolve_key(key_token);
    }

    if(key) {
      std::string value;
      if(inline_value) {
        value = *inline_value;
      } else if(settings.is_bool_setting(*key)) {
        value = "true";
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
          value = args[++i];
        }
      } else if(i + 1 < args.size()) {
        value = args[++i];
      } else {
        error = "Missing value for option '" + key_token + "'";
        return false;
      }
      std::string reason;
      if(!settings.set_from_string(*key, value, reason)) {
        error = "Invalid value for option '" + key_token + "': " + reason;
        return false;
      }
      continue;
    }

    if(positional_index >= positional_specs_.size()) {
      error = "Unexpected argument '" + token + "'";
      return false;
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string reason;
    if(!settings.set_from_string(spec.key, token, reason)) {
      error = "Invalid " + spec.key + " '" + token + "': " + reason;
      return false;
    }
  }
  return true;
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::string error;
  if(!try_parse(args, settings, error)) {
    print_err(nullptr, "{}", error);
    print_err(nullptr, "Run '{} --help' for usage.", process_name_);
    std::exit(1);
  }
}

std::string CommandLineParser::usage_text() const {
  std::ostringstream out;
  out << process_name_ << " - content-addressed folder swarm\n\n";
  out << "Usage:\n  " << process_name_;
  for(const auto& pos : positional_specs_) {
    out << " [" << pos.key << "]";
  }
  out << " [--option value ...]\n\nCommands:\n";
  for(const auto& command : kCommands) {
    out << "  " << fmt::format("{:<22} {}", command.usage, command.summary) << "\n";
  }
  out << "\nOptions (also TREESWARM_<KEY> in the environment):\n";
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    std::string aliases;
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      aliases += (aliases.empty() ? " (-" : ", -") + alias;
    }
    if(!aliases.empty()) aliases += ")";
    out << "  " << fmt::format("--{:<22} {:<16} {}{} [default: {}]",
                               key,
                               argument_hint(entry),
                               entry.value("description", ""),
                               aliases,
                               default_text(entry))
        << "\n";
  }
  return out.str();
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{}", usage_text());
}
