#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positionals_(read_positionals(argv_spec)) {}

std::vector<CommandLineParser::Positional> CommandLineParser::read_positionals(const nlohmann::json& spec) const {
  std::vector<Positional> result;
  SettingsManager known(settings_spec_);
  for(const auto& entry : spec) {
    Positional positional{entry.at("index").get<std::size_t>(), entry.at("key").get<std::string>()};
    if(!known.resolve_key(positional.key)) {
      throw std::invalid_argument("positional argument " + std::to_string(positional.index) +
                                  " maps to unknown setting '" + positional.key + "'");
    }
    result.push_back(std::move(positional));
  }
  std::sort(result.begin(), result.end(),
            [](const Positional& a, const Positional& b){ return a.index < b.index; });
  return result;
}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return true;
  return token.size() >= 2 && token[0] == '-' &&
         (std::isalpha(static_cast<unsigned char>(token[1])) || token[1] == '?');
}

CommandLineParser::OptionResult CommandLineParser::apply_option(const std::vector<std::string>& args,
                                                                std::size_t& cursor,
                                                                std::string name,
                                                                bool long_form,
                                                                SettingsManager& settings,
                                                                std::string& error) const {
  std::optional<std::string> inline_value;
  if(long_form) {
    if(auto eq = name.find('='); eq != std::string::npos) {
      inline_value = name.substr(eq + 1);
      name.erase(eq);
    }
  }

  auto key = settings.resolve_key(name);
  if(!key) {
    if(!long_form) return OptionResult::NotAnOption;
    error = "Unknown option --" + name;
    return OptionResult::Failed;
  }

  std::string value;
  if(inline_value) {
    value = *inline_value;
  } else if(settings.is_bool_setting(*key)) {
    // A bare flag means true; an explicit literal may follow it.
    const bool literal_follows = cursor + 1 < args.size() &&
                                 !looks_like_option(args[cursor + 1]) &&
                                 SettingsManager::is_bool_literal(args[cursor + 1]);
    value = literal_follows ? args[++cursor] : "true";
  } else if(cursor + 1 < args.size()) {
    value = args[++cursor];
  } else {
    error = "Missing value for option '" + name + "'";
    return OptionResult::Failed;
  }

  std::string set_error;
  if(!settings.set_from_string(*key, value, set_error)) {
    error = "Invalid value for option '" + name + "': " + set_error;
    return OptionResult::Failed;
  }
  return OptionResult::Applied;
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args, settings, error);
}

bool CommandLineParser::parse(const std::vector<std::string>& args,
                              SettingsManager& settings,
                              std::string& error) const {
  error.clear();
  std::size_t next_positional = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(token.size() > 2 && token.rfind("--", 0) == 0) {
      if(apply_option(args, i, token.substr(2), true, settings, error) == OptionResult::Failed) return false;
      continue;
    }
    if(token.size() > 1 && token[0] == '-' && token[1] != '-') {
      auto result = apply_option(args, i, token.substr(1), false, settings, error);
      if(result == OptionResult::Failed) return false;
      if(result == OptionResult::NotAnOption) {
        error = "Unknown option " + token;
        return false;
      }
      continue;
    }

    if(next_positional >= positionals_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& positional = positionals_[next_positional++];
    std::string set_error;
    if(!settings.set_from_string(positional.key, token, set_error)) {
      error = "Invalid value for " + positional.key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage() const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& positional : positionals_) {
    synopsis += " [" + positional.key + "]";
  }
  print_out(nullptr, "{} - stream directory changes to server-sent-event clients", process_name_);
  print_out(nullptr, "Usage:\n  {}\n\nOptions:", synopsis);

  for(const auto& entry : settings_spec_) {
    auto flag = entry.at("key").get<std::string>();
    std::replace(flag.begin(), flag.end(), '_', '-');
    const auto type = entry.at("type").get<std::string>();
    const auto& fallback = entry.at("default");

    std::string aliases;
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      aliases += aliases.empty() ? " (alias: -" : ", -";
      aliases += alias;
    }
    if(!aliases.empty()) aliases += ")";

    std::string shown_default = fallback.is_string() ? fallback.get<std::string>() : fallback.dump();
    print_out(nullptr, "  --{:<22} {:<12} {}{} (default: {})",
              flag,
              type == "bool" ? "[true|false]" : "<" + type + ">",
              entry.value("description", ""),
              aliases,
              shown_default.empty() ? "none" : shown_default);
  }
  print_out(nullptr, "");
}
