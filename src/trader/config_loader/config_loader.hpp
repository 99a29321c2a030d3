#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

// Reads `key,value` lines into cfg. Returns false when the file cannot be
// opened or a value does not parse.
bool load_config_from_csv(OkxTrader::Config::SystemConfig& cfg, const std::string& csv_path);

// OKX_API_KEY, OKX_SECRET_KEY, OKX_PASSPHRASE
void load_credentials_from_environment(OkxTrader::Config::SystemConfig& cfg);

// Loads every config file from config_directory, then the environment, then validates.
// Returns 0 on success, 1 on any failure.
int load_system_config(OkxTrader::Config::SystemConfig& config, const std::string& config_directory = "config");

bool validate_config(const OkxTrader::Config::SystemConfig& config, std::string& error_message);

#endif // CONFIG_LOADER_HPP
