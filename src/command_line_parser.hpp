#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "dirfeed",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","watch_dir"}}
                    }));

  // Applies argv to `settings`. On failure `error` names the offending
  // argument and nothing after it is applied.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;
  void usage() const;

private:
  enum class OptionResult { Applied, NotAnOption, Failed };

  struct Positional {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<Positional> read_positionals(const nlohmann::json& spec) const;
  OptionResult apply_option(const std::vector<std::string>& args,
                            std::size_t& cursor,
                            std::string name,
                            bool long_form,
                            SettingsManager& settings,
                            std::string& error) const;
  static bool looks_like_option(const std::string& token);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<Positional> positionals_;
};
