#include "dbjob/config/config.h"
#include "dbjob/config/ini_defines.h"
#include "dbjob/log/log.h"

#include <sstream>

#include <cctype>

namespace {

[[noreturn]] void throwConfigurationError(const std::string & message) {
    throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::Configuration, message, "HY024");
}

bool isSpace(char ch) {
    return std::isspace(static_cast<unsigned char>(ch));
}

void trimRight(std::string & str) {
    while (!str.empty() && isSpace(str.back())) {
        str.pop_back();
    }
}

bool parseFlag(const std::string & key, const std::string & value) {
    if (!isYesOrNo(value))
        throwConfigurationError("Invalid value '" + value + "' of " + key + ", expected on/off, yes/no, true/false or 1/0");
    return isYes(value);
}

template <typename T>
T parseUnsigned(const std::string & key, const std::string & value, T min_value) {
    unsigned int parsed = 0;
    if (!Poco::NumberParser::tryParseUnsigned(Poco::trim(value), parsed) || parsed < min_value)
        throwConfigurationError("Invalid value '" + value + "' of " + key + ", expected an integer not less than " + std::to_string(min_value));
    return static_cast<T>(parsed);
}

} // namespace

// Accepts the ODBC connection string syntax:
//     - keys cannot be empty and are case-insensitive
//     - '=' in the key itself should be written as '=='
//     - whitespace around keys and values is trimmed
//     - values can be enclosed in '{' and '}', in which case leading and trailing whitespace
//       and ';' characters anywhere in the value are preserved as-is
//     - if a key is met multiple times, the first value is used
key_value_map_t readSettingsString(const std::string & settings_string) {
    key_value_map_t fields;

    const auto & str = settings_string;
    std::size_t pos = 0;

    const auto skip_separators = [&] () {
        while (pos < str.size() && (isSpace(str[pos]) || str[pos] == ';')) {
            ++pos;
        }
    };

    const auto extract_key = [&] () {
        std::string key;
        bool equal_met = false;

        while (pos < str.size() && str[pos] != ';') {
            if (str[pos] == '=') {
                if (pos + 1 < str.size() && str[pos + 1] == '=') {
                    key += '=';
                    pos += 2;
                    continue;
                }

                ++pos;
                equal_met = true;
                break;
            }

            key += str[pos++];
        }

        trimRight(key);

        if (key.empty())
            throwConfigurationError("Malformed settings string: key name is missing");

        if (!equal_met)
            throwConfigurationError("Malformed settings string: '=' is missing after '" + key + "'");

        return key;
    };

    const auto extract_value = [&] () {
        std::string value;

        while (pos < str.size() && isSpace(str[pos])) {
            ++pos;
        }

        if (pos < str.size() && str[pos] == '{') {
            const auto closing = str.find('}', pos + 1);
            if (closing == std::string::npos)
                throwConfigurationError("Malformed settings string: '}' expected");

            value = str.substr(pos + 1, closing - pos - 1);
            pos = closing + 1;
        }
        else {
            while (pos < str.size() && str[pos] != ';') {
                value += str[pos++];
            }
            trimRight(value);
        }

        while (pos < str.size() && isSpace(str[pos])) {
            ++pos;
        }

        if (pos < str.size() && str[pos] != ';')
            throwConfigurationError("Malformed settings string: ';' expected");

        return value;
    };

    while (true) {
        skip_separators();

        if (pos >= str.size())
            break;

        const auto key = extract_key();
        const auto value = extract_value();

        fields.emplace(key, value);
    }

    return fields;
}

EngineSettings::EngineSettings() {
    driver_log = isYes(INI_DRIVERLOG_DEFAULT);
    driver_log_file = INI_DRIVERLOGFILE_DEFAULT;
    timeout = std::chrono::seconds{fromString<unsigned int>(INI_TIMEOUT_DEFAULT)};
    max_attempts = fromString<std::size_t>(INI_MAXATTEMPTS_DEFAULT);
    retry_delay = std::chrono::milliseconds{fromString<unsigned int>(INI_RETRYDELAY_DEFAULT)};
    buffered = isYes(INI_BUFFERED_DEFAULT);
    pool_size = fromString<std::size_t>(INI_POOLSIZE_DEFAULT);
    pool_timeout = std::chrono::milliseconds{fromString<unsigned int>(INI_POOLTIMEOUT_DEFAULT)};
    plan_cache = isYes(INI_PLANCACHE_DEFAULT);
}

EngineSettings readEngineSettings(const key_value_map_t & fields) {
    EngineSettings settings;

    for (const auto & field : fields) {
        const auto & key = field.first;
        const auto & value = field.second;

        if (equalsIgnoreCase(key, INI_DRIVERLOG)) {
            settings.driver_log = parseFlag(key, value);
        }
        else if (equalsIgnoreCase(key, INI_DRIVERLOGFILE)) {
            settings.driver_log_file = value;
        }
        else if (equalsIgnoreCase(key, INI_TIMEOUT)) {
            settings.timeout = std::chrono::seconds{parseUnsigned<unsigned int>(key, value, 0)};
        }
        else if (equalsIgnoreCase(key, INI_MAXATTEMPTS)) {
            settings.max_attempts = parseUnsigned<std::size_t>(key, value, 1);
        }
        else if (equalsIgnoreCase(key, INI_RETRYDELAY)) {
            settings.retry_delay = std::chrono::milliseconds{parseUnsigned<unsigned int>(key, value, 0)};
        }
        else if (equalsIgnoreCase(key, INI_BUFFERED)) {
            settings.buffered = parseFlag(key, value);
        }
        else if (equalsIgnoreCase(key, INI_POOLSIZE)) {
            settings.pool_size = parseUnsigned<std::size_t>(key, value, 1);
        }
        else if (equalsIgnoreCase(key, INI_POOLTIMEOUT)) {
            settings.pool_timeout = std::chrono::milliseconds{parseUnsigned<unsigned int>(key, value, 0)};
        }
        else if (equalsIgnoreCase(key, INI_ISOLATION)) {
            const auto level = tryParseIsolationLevel(value);
            if (!level)
                throwConfigurationError("Invalid value '" + value + "' of " + key);
            settings.isolation = *level;
        }
        else if (equalsIgnoreCase(key, INI_PLANCACHE)) {
            settings.plan_cache = parseFlag(key, value);
        }
        else {
            LOG("Ignoring unknown setting " << key << "=" << value);
        }
    }

    return settings;
}

EngineSettings readEngineSettings(const std::string & settings_string) {
    return readEngineSettings(readSettingsString(settings_string));
}

std::string toString(const EngineSettings & settings) {
    std::ostringstream stream;
    stream << INI_DRIVERLOG << "=" << (settings.driver_log ? "on" : "off");
    stream << ";" << INI_DRIVERLOGFILE << "={" << settings.driver_log_file << "}";
    stream << ";" << INI_TIMEOUT << "=" << settings.timeout.count();
    stream << ";" << INI_MAXATTEMPTS << "=" << settings.max_attempts;
    stream << ";" << INI_RETRYDELAY << "=" << settings.retry_delay.count();
    stream << ";" << INI_BUFFERED << "=" << (settings.buffered ? "on" : "off");
    stream << ";" << INI_POOLSIZE << "=" << settings.pool_size;
    stream << ";" << INI_POOLTIMEOUT << "=" << settings.pool_timeout.count();
    stream << ";" << INI_ISOLATION << "=" << toString(settings.isolation);
    stream << ";" << INI_PLANCACHE << "=" << (settings.plan_cache ? "on" : "off");
    return stream.str();
}
