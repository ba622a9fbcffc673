#ifndef BUCKETD_CONFIG_HPP
#define BUCKETD_CONFIG_HPP

#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>

namespace bucketd {
namespace config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Config error: " + message) {}
};

struct CsrfSettings {
  // Empty disables the guard, otherwise exactly 32 bytes
  std::string key;

  bool enabled() const { return !key.empty(); }
};

struct Settings {
  std::string address = "0.0.0.0";
  uint16_t port = 8080;
  std::string database = "bucketd.db";
  // Empty logs to the console
  std::string log_file;
  std::string log_level = "info";
  CsrfSettings csrf;
};

// ---- LOADING ----
// Reads a JSON config file. Missing fields keep their defaults. Throws ConfigError
Settings load_config(const std::string& path);
Settings parse_config(std::istream& input);


// ---- VALIDATION ----
// Throws ConfigError on the first invalid field
void validate(const Settings& settings);

} // namespace config
} // namespace bucketd

#endif // BUCKETD_CONFIG_HPP
