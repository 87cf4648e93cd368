#pragma once

#include "dbjob/platform/platform.h"

#include <Poco/NumberParser.h>
#include <Poco/String.h>
#include <Poco/UTF8String.h>

#ifdef _win_
#   include <processthreadsapi.h>
#else
#   include <sys/types.h>
#   include <unistd.h>
#endif

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

#include <cerrno>
#include <cstring>
#include <ctime>

template <typename T>
inline T fromString(const std::string & s) {
    T result;

    std::istringstream iss(s);
    iss >> result;

    if (iss.fail() || !iss.eof())
        throw std::runtime_error("bad lexical cast");

    return result;
}

inline auto getPID() {
#ifdef _win_
    return GetCurrentProcessId();
#else
    return getpid();
#endif
}

inline auto getTID() {
    return std::this_thread::get_id();
}

inline void toLocalTime(const std::time_t & src, std::tm & dest) {
#ifdef _win_
    const auto err = localtime_s(&dest, &src);
#else
    auto * res = localtime_r(&src, &dest);
    const auto err = (res == &dest ? 0 : errno);
#endif

    if (err)
        throw std::runtime_error("Failed to convert time: " + std::string(std::strerror(err)));
}

inline bool isYes(std::string str) {
    Poco::trimInPlace(str);
    Poco::UTF8::toLowerInPlace(str);

    bool flag = false;
    return (Poco::NumberParser::tryParseBool(str, flag) ? flag : false);
}

inline bool isYesOrNo(std::string str) {
    Poco::trimInPlace(str);
    Poco::UTF8::toLowerInPlace(str);

    int flag_num = -1;
    if (Poco::NumberParser::tryParse(str, flag_num))
        return (flag_num == 0 || flag_num == 1);

    bool flag = false;
    return Poco::NumberParser::tryParseBool(str, flag);
}

// Parameter names may be written with the marker prefix, "@id" and "id" refer to the same parameter.
inline auto tryStripParamPrefix(std::string param_name) {
    if (!param_name.empty() && param_name[0] == '@')
        param_name.erase(0, 1);
    return param_name;
}

inline bool equalsIgnoreCase(const std::string & lhs, const std::string & rhs) {
    return (Poco::UTF8::icompare(lhs, rhs) == 0);
}

struct UTF8CaseInsensitiveCompare {
    bool operator() (const std::string & lhs, const std::string & rhs) const {
        return Poco::UTF8::icompare(lhs, rhs) < 0;
    }
};

template <typename T>
struct always_false
    : std::false_type
{
};
