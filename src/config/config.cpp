#include "config/config.hpp"
#include "logger/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace bucketd {
namespace config {

using json = nlohmann::json;

namespace {

constexpr std::size_t CSRF_KEY_SIZE = 32;

} // namespace

//==============================================
// LOADING
//==============================================

Settings load_config(const std::string& path) {
  std::ifstream input(path);
  if (!input) {
    throw ConfigError("couldn't read config file " + path);
  }

  BOOST_LOG_TRIVIAL(info) << "Config: Loading " << path;
  return parse_config(input);
}

Settings parse_config(std::istream& input) {
  json tree;
  try {
    tree = json::parse(input);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("couldn't parse config data: ") + e.what());
  }
  if (!tree.is_object()) {
    throw ConfigError("config data must be a JSON object");
  }

  Settings settings;
  try {
    settings.address = tree.value("address", settings.address);
    int port = tree.value("port", static_cast<int>(settings.port));
    if (port < 1 || port > 65535) {
      throw ConfigError("port out of range: " + std::to_string(port));
    }
    settings.port = static_cast<uint16_t>(port);
    settings.database = tree.value("database", settings.database);
    settings.log_file = tree.value("log_file", settings.log_file);
    settings.log_level = tree.value("log_level", settings.log_level);
    if (tree.contains("csrf")) {
      settings.csrf.key = tree.at("csrf").value("key", settings.csrf.key);
    }
  } catch (const json::type_error& e) {
    throw ConfigError(std::string("bad value: ") + e.what());
  }

  validate(settings);
  return settings;
}


//==============================================
// VALIDATION
//==============================================

void validate(const Settings& settings) {
  if (settings.csrf.enabled() && settings.csrf.key.size() != CSRF_KEY_SIZE) {
    throw ConfigError("bad CSRF key: want " + std::to_string(CSRF_KEY_SIZE) + " bytes, got "
                      + std::to_string(settings.csrf.key.size()));
  }
  if (settings.port == 0) {
    throw ConfigError("port out of range: 0");
  }
  if (settings.database.empty()) {
    throw ConfigError("database path is empty");
  }
  try {
    logging::parse_severity(settings.log_level);
  } catch (const std::invalid_argument&) {
    throw ConfigError("unknown log level: " + settings.log_level);
  }
}

} // namespace config
} // namespace bucketd
