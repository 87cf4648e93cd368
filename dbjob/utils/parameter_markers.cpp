#include "dbjob/utils/parameter_markers.h"
#include "dbjob/exception.h"

#include <cctype>

namespace {

bool isIdentifierChar(char ch, bool first) {
    const auto uch = static_cast<unsigned char>(ch);
    return (ch == '_' || std::isalpha(uch) || (!first && std::isdigit(uch)));
}

} // namespace

std::vector<ParameterMarker> scanParameterMarkers(const std::string & text) {
    std::vector<ParameterMarker> markers;

    char quoted_by = '\0';
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char curr = text[i];
        const char next = (i + 1 < text.size() ? text[i + 1] : '\0');

        switch (curr) {
            case '\\': {
                if (quoted_by != '\0')
                    ++i; // Skip the escaped char.
                break;
            }

            case '"':
            case '\'': {
                if (quoted_by == curr) {
                    if (next == curr)
                        ++i; // '' or "" SQL escaping.
                    else
                        quoted_by = '\0';
                }
                else if (quoted_by == '\0') {
                    quoted_by = curr;
                }
                break;
            }

            case '?': {
                if (quoted_by == '\0') {
                    ParameterMarker marker;
                    marker.offset = i;
                    marker.length = 1;
                    markers.push_back(marker);
                }
                break;
            }

            case '@': {
                if (quoted_by != '\0')
                    break;

                if (next == '@') {
                    ++i;
                    while (i + 1 < text.size() && isIdentifierChar(text[i + 1], false)) {
                        ++i;
                    }
                    break;
                }

                ParameterMarker marker;
                marker.offset = i;
                marker.name = '@';

                for (std::size_t j = i + 1; j < text.size() && isIdentifierChar(text[j], j == i + 1); ++j) {
                    marker.name += text[j];
                }

                if (marker.name.size() == 1)
                    throw JobException(ErrorKind::CommandExecutionError, ErrorCode::CommandRejected, Component::CommandBuilder,
                        "Syntax error: parameter name expected after '@' at offset " + std::to_string(i), "42000");

                marker.length = marker.name.size();
                i += marker.length - 1;
                markers.push_back(marker);
                break;
            }
        }
    }

    return markers;
}

std::string rewriteParameterMarkers(
    const std::string & text,
    const std::vector<ParameterMarker> & markers,
    const std::function<std::string(const ParameterMarker &)> & replacement
) {
    std::string result;
    result.reserve(text.size());

    std::size_t pos = 0;
    for (const auto & marker : markers) {
        result.append(text, pos, marker.offset - pos);
        result += replacement(marker);
        pos = marker.offset + marker.length;
    }

    result.append(text, pos, std::string::npos);
    return result;
}
