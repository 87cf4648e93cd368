#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/utils/utils.h"
#include "dbjob/driver.h"

#include <chrono>
#include <map>
#include <string>

#include <cstddef>

using key_value_map_t = std::map<std::string, std::string, UTF8CaseInsensitiveCompare>;

/**
 * Engine wide settings: logging attributes, job defaults and pool sizing.
 * Every field is initialized from the corresponding INI_*_DEFAULT.
 */
struct EngineSettings {
    bool driver_log = false;
    std::string driver_log_file;
    std::chrono::seconds timeout{0};
    std::size_t max_attempts = 1;
    std::chrono::milliseconds retry_delay{0};
    bool buffered = true;
    std::size_t pool_size = 8;
    std::chrono::milliseconds pool_timeout{30000};
    IsolationLevel isolation = IsolationLevel::Unspecified;
    bool plan_cache = true;

    EngineSettings();
};

// Parses "key1=value1;key2={value 2};..." into a key->value map, throws ConfigurationError on malformed input.
key_value_map_t readSettingsString(const std::string & settings_string);

EngineSettings readEngineSettings(const key_value_map_t & fields);
EngineSettings readEngineSettings(const std::string & settings_string);

std::string toString(const EngineSettings & settings);
