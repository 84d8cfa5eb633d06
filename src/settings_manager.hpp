#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","host"},                  {"aliases", {"bind","listen_ip"}},  {"type","string"}, {"default","0.0.0.0"}, {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","port"},                  {"aliases", {"p"}},               {"type","int"},    {"default",8080},      {"description","TCP port to listen on (0 = ephemeral)"}, {"persistent", true}},
  {{"key","debug"},                 {"aliases", {"verbose","v"}},     {"type","bool"},   {"default",false},     {"description","Enable debug logging"}, {"persistent", true}},
  {{"key","watch_dir"},             {"aliases", {"w","dir"}},         {"type","string"}, {"default",""},        {"description","Directory tree to watch for changes"}, {"persistent", true}},
  {{"key","debounce_ms"},           {"aliases", {"debounce"}},        {"type","int"},    {"default",200},       {"description","Coalescing window for repeated changes on one path"}, {"persistent", true}},
  {{"key","queue_capacity"},        {"aliases", {"capacity","qc"}},   {"type","int"},    {"default",256},       {"description","Records buffered per client before the oldest are dropped"}, {"persistent", true}},
  {{"key","heartbeat_interval_ms"}, {"aliases", {"heartbeat"}},       {"type","int"},    {"default",15000},     {"description","Idle time before a heartbeat frame is sent"}, {"persistent", true}},
  {{"key","watch_retry_attempts"},  {"aliases", {"retries"}},         {"type","int"},    {"default",5},         {"description","Attempts to re-establish a disrupted watch"}, {"persistent", true}},
  {{"key","watch_retry_base_ms"},   {"aliases", {"retry_base"}},      {"type","int"},    {"default",100},       {"description","First re-establish delay, doubled per attempt"}, {"persistent", true}},
  {{"key","shutdown_grace_ms"},     {"aliases", {"grace"}},           {"type","int"},    {"default",2000},      {"description","Time allowed for clients to receive the closing notice"}, {"persistent", true}},
  {{"key","help"},                  {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                  {"aliases", {"persist"}},         {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

inline constexpr const char* kSettingsFileName = "dirfeed.json";

// Typed key/value store for the server options. Values come from the
// built-in defaults, then the JSON settings file, then the command line.
// Every write is checked against the option's declared type.
class SettingsManager {
public:
  enum class ValueType { Bool, Int, String };

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const { return values_.contains(key); }

  // Text is trimmed, then parsed according to the option type.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Unknown and non-persistent keys in the file are ignored; badly typed
  // values are reported and skipped.
  bool load();
  bool save() const;

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { path_override_ = path; }

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  // Lower-case with '-' folded to '_', so "--watch-dir" names watch_dir.
  static std::string normalize_key(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct Option {
    std::string key;
    std::string match_key;
    std::vector<std::string> aliases;
    ValueType type = ValueType::String;
    nlohmann::json fallback;
    bool persistent = true;
  };

  static ValueType parse_type(const std::string& name);
  static std::vector<Option> read_options(const nlohmann::json& specification);

  const Option* lookup(const std::string& token) const;
  bool store(const Option& option, const nlohmann::json& value, std::string& error);
  static std::optional<nlohmann::json> parse_text(const Option& option, const std::string& text, std::string& error);
  static std::optional<bool> parse_bool(const std::string& text);

  std::vector<Option> options_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path path_override_;
};

inline SettingsManager::ValueType SettingsManager::parse_type(const std::string& name) {
  if(name == "bool") return ValueType::Bool;
  if(name == "int") return ValueType::Int;
  if(name == "string") return ValueType::String;
  throw std::invalid_argument("Unsupported setting type '" + name + "'");
}

inline std::vector<SettingsManager::Option> SettingsManager::read_options(const nlohmann::json& specification) {
  std::vector<Option> options;
  options.reserve(specification.size());
  for(const auto& entry : specification) {
    Option option;
    option.key = entry.at("key").get<std::string>();
    option.match_key = normalize_key(option.key);
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      option.aliases.push_back(normalize_key(alias));
    }
    option.type = parse_type(entry.at("type").get<std::string>());
    option.fallback = entry.at("default");
    option.persistent = entry.value("persistent", true);
    options.push_back(std::move(option));
  }
  return options;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : options_(read_options(specification)) {
  for(const auto& option : options_) {
    values_[option.key] = option.fallback;
  }
}

inline const SettingsManager::Option* SettingsManager::lookup(const std::string& token) const {
  const std::string wanted = normalize_key(token);
  auto it = std::find_if(options_.begin(), options_.end(), [&](const Option& option){
    return option.match_key == wanted ||
           std::find(option.aliases.begin(), option.aliases.end(), wanted) != option.aliases.end();
  });
  return it == options_.end() ? nullptr : &*it;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* option = lookup(token)) return option->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* option = lookup(key);
  return option && option->type == ValueType::Bool;
}

inline bool SettingsManager::store(const Option& option, const nlohmann::json& value, std::string& error) {
  switch(option.type) {
    case ValueType::Bool:
      if(value.is_boolean()) {
        values_[option.key] = value.get<bool>();
        return true;
      }
      if(value.is_number_integer()) {
        values_[option.key] = value.get<int>() != 0;
        return true;
      }
      error = "expected boolean";
      return false;
    case ValueType::Int:
      if(value.is_number_integer()) {
        values_[option.key] = value.get<int>();
        return true;
      }
      error = "expected integer";
      return false;
    case ValueType::String:
      if(value.is_string()) {
        values_[option.key] = value.get<std::string>();
        return true;
      }
      error = "expected string";
      return false;
  }
  error = "unknown type";
  return false;
}

inline std::optional<bool> SettingsManager::parse_bool(const std::string& text) {
  const std::string v = to_lower(trim_copy(text));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

inline std::optional<nlohmann::json> SettingsManager::parse_text(const Option& option,
                                                                  const std::string& text,
                                                                  std::string& error) {
  const std::string clean = trim_copy(text);
  switch(option.type) {
    case ValueType::Bool:
      if(auto flag = parse_bool(clean)) return nlohmann::json(*flag);
      error = "expected boolean (true|false|on|off)";
      return std::nullopt;
    case ValueType::Int:
      try {
        std::size_t used = 0;
        int parsed = std::stoi(clean, &used);
        if(used != clean.size()) {
          error = "trailing characters in integer";
          return std::nullopt;
        }
        return nlohmann::json(parsed);
      } catch(const std::logic_error& e) {
        error = std::string("expected integer (") + e.what() + ")";
        return std::nullopt;
      }
    case ValueType::String:
      return nlohmann::json(clean);
  }
  error = "unknown type";
  return std::nullopt;
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  error.clear();
  const auto* option = lookup(key);
  if(!option) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_text(*option, value, error);
  return parsed && store(*option, *parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  error.clear();
  const auto* option = lookup(key);
  if(!option) {
    error = "unknown setting";
    return false;
  }
  return store(*option, value, error);
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!path_override_.empty()) return path_override_;
  return std::filesystem::current_path() / ".config" / kSettingsFileName;
}

inline bool SettingsManager::load() {
  const auto path = settings_path();
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
    print_err(nullptr, "Ignoring {}: top level is not an object", path.string());
    return false;
  }

  for(const auto& item : doc.items()) {
    const auto* option = lookup(item.key());
    if(!option || !option->persistent) continue;
    std::string error;
    if(!store(*option, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save() const {
  const auto path = settings_path();
  if(path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }

  nlohmann::json doc = nlohmann::json::object();
  for(const auto& option : options_) {
    if(option.persistent) doc[option.key] = values_.at(option.key);
  }

  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << doc.dump(2);
  return static_cast<bool>(out);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

inline std::string SettingsManager::normalize_key(std::string value) {
  value = to_lower(trim_copy(std::move(value)));
  std::replace(value.begin(), value.end(), '-', '_');
  return value;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  return parse_bool(value).has_value();
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::out_of_range("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}
