#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include <attest/client/error.hpp>

namespace attest::client {

constexpr std::string_view default_database        = "defaultdb";
constexpr std::string_view default_server_identity = "localhost:3322";
constexpr std::string_view default_log_level       = "info";

struct options
{
  std::string server_identity{ default_server_identity };
  std::string database{ default_database };
  std::optional< std::filesystem::path > state_dir;
  std::optional< std::filesystem::path > public_key_file;
  std::string log_level{ default_log_level };
};

/**
 * Reads the `client` section of a YAML configuration, taking any key it lacks
 * from the `global` section. Relative paths resolve against the directory of
 * the configuration file.
 */
result< options > load_options( const std::filesystem::path& yaml_path );

result< options > parse_options( const YAML::Node& config, const std::filesystem::path& basedir );

} // namespace attest::client
