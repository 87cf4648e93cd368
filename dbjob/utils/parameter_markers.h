#pragma once

#include "dbjob/platform/platform.h"

#include <functional>
#include <string>
#include <vector>

#include <cstddef>

// A parameter placeholder found in command text: either positional '?' or named '@name'.
struct ParameterMarker {
    std::size_t offset = 0;
    std::size_t length = 0;
    std::string name; // with the leading '@', empty for '?'

    bool isPositional() const noexcept {
        return name.empty();
    }
};

// Finds '?' and '@name' markers outside of quoted literals and quoted identifiers.
// '@@name' (server variables) is not a marker. A lone '@' is a syntax error.
std::vector<ParameterMarker> scanParameterMarkers(const std::string & text);

// Replaces every marker with what the callback returns for it.
std::string rewriteParameterMarkers(
    const std::string & text,
    const std::vector<ParameterMarker> & markers,
    const std::function<std::string(const ParameterMarker &)> & replacement
);
