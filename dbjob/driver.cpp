#include "dbjob/driver.h"
#include "dbjob/utils/utils.h"

#include <Poco/String.h>
#include <Poco/UTF8String.h>

const char * toString(IsolationLevel level) noexcept {
    switch (level) {
        case IsolationLevel::Unspecified:     return "Unspecified";
        case IsolationLevel::ReadUncommitted: return "ReadUncommitted";
        case IsolationLevel::ReadCommitted:   return "ReadCommitted";
        case IsolationLevel::RepeatableRead:  return "RepeatableRead";
        case IsolationLevel::Serializable:    return "Serializable";
        case IsolationLevel::Snapshot:        return "Snapshot";
    }
    return "Unknown";
}

std::optional<IsolationLevel> tryParseIsolationLevel(const std::string & str) {
    auto normalized = Poco::trim(str);
    Poco::replaceInPlace(normalized, std::string{" "}, std::string{});
    Poco::replaceInPlace(normalized, std::string{"_"}, std::string{});

    if (normalized.empty())
        return IsolationLevel::Unspecified;

    for (const auto level : {
        IsolationLevel::Unspecified,
        IsolationLevel::ReadUncommitted,
        IsolationLevel::ReadCommitted,
        IsolationLevel::RepeatableRead,
        IsolationLevel::Serializable,
        IsolationLevel::Snapshot
    }) {
        if (equalsIgnoreCase(normalized, toString(level)))
            return level;
    }

    return std::nullopt;
}

const char * toString(CommandType type) noexcept {
    switch (type) {
        case CommandType::Text:            return "Text";
        case CommandType::StoredProcedure: return "StoredProcedure";
        case CommandType::TableDirect:     return "TableDirect";
    }
    return "Unknown";
}

std::string toString(CommandBehavior behavior) {
    if (behavior == CommandBehavior::Default)
        return "Default";

    std::string result;
    const auto append = [&] (CommandBehavior flag, const char * name) {
        if (hasFlag(behavior, flag)) {
            if (!result.empty())
                result += '|';
            result += name;
        }
    };

    append(CommandBehavior::SingleResult, "SingleResult");
    append(CommandBehavior::SchemaOnly, "SchemaOnly");
    append(CommandBehavior::SingleRow, "SingleRow");
    append(CommandBehavior::CloseConnection, "CloseConnection");

    return result;
}
