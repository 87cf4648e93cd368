#include "dbjob/command.h"
#include "dbjob/run_context.h"
#include "dbjob/utils/parameter_markers.h"
#include "dbjob/log/log.h"

namespace {

[[noreturn]] void throwInvalidCommand(const std::string & message) {
    throw JobException(ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration, Component::CommandBuilder, message, "HY009");
}

} // namespace

void CommandBuilder::validate(const CommandDefinition & definition) {
    if (Poco::trim(definition.text).empty())
        throwInvalidCommand("Command text is empty");

    if (definition.timeout && definition.timeout->count() < 0)
        throwInvalidCommand("Command timeout cannot be negative");

    for (const auto & descriptor : definition.parameters) {
        if (descriptor.isList() && descriptor.isOutput())
            throwInvalidCommand("List parameter '@" + descriptor.name + "' cannot be an output parameter");

        if (descriptor.isList() && definition.type != CommandType::Text)
            throwInvalidCommand("List parameter '@" + descriptor.name + "' can only be used with text commands");
    }

    if (definition.type == CommandType::TableDirect && !definition.parameters.empty())
        throwInvalidCommand("Table direct commands take no parameters");
}

ExpandedCommand CommandBuilder::expand(const CommandDefinition & definition) {
    ExpandedCommand expanded;

    bool has_lists = false;
    for (const auto & descriptor : definition.parameters) {
        if (descriptor.isList()) {
            has_lists = true;
            break;
        }
    }

    if (!has_lists) {
        expanded.text = definition.text;
        expanded.parameters = definition.parameters;
        return expanded;
    }

    for (const auto & descriptor : definition.parameters) {
        if (!descriptor.isList()) {
            expanded.parameters.add(descriptor);
            continue;
        }

        const auto & values = *descriptor.list_values;
        for (std::size_t i = 0; i < values.size(); ++i) {
            expanded.parameters.add(descriptor.name + "_" + std::to_string(i), values[i], ParameterDirection::Input, descriptor.type_hint);
        }
    }

    const auto markers = scanParameterMarkers(definition.text);
    expanded.text = rewriteParameterMarkers(definition.text, markers, [&definition] (const ParameterMarker & marker) -> std::string {
        if (marker.isPositional())
            return "?";

        const auto * descriptor = definition.parameters.find(marker.name);
        if (!descriptor || !descriptor->isList())
            return marker.name;

        const auto & values = *descriptor->list_values;
        if (values.empty())
            return "NULL";

        std::string replacement;
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0)
                replacement += ", ";
            replacement += "@" + descriptor->name + "_" + std::to_string(i);
        }
        return replacement;
    });

    return expanded;
}

std::optional<std::chrono::seconds> CommandBuilder::resolveTimeout(
    const std::optional<std::chrono::seconds> & explicit_timeout,
    const std::optional<std::chrono::seconds> & job_timeout
) {
    if (explicit_timeout)
        return explicit_timeout;

    if (job_timeout && job_timeout->count() > 0)
        return job_timeout;

    return std::nullopt;
}

DriverCommand & CommandBuilder::build(RunContext & context, const CommandDefinition & definition, const ExpandedCommand & expanded) {
    if (context.isCancellationRequested())
        throw JobException(ErrorKind::CanceledError, ErrorCode::Canceled, Component::CommandBuilder, "Canceled before the command was built", "HY008");

    auto & command = context.adoptCommand(
        context.getConnection().prepareCommand(expanded.text, definition.type, context.getTimeout(), context.getTransaction())
    );

    for (const auto & descriptor : expanded.parameters) {
        command.bindParameter(descriptor);
    }

    LOG_TARGET(context, "Prepared " << toString(definition.type) << " command"
        << (context.getTimeout() ? " (timeout " + std::to_string(context.getTimeout()->count()) + "s)" : std::string{})
        << ": " << expanded.text);

    if (hasFlag(definition.flags, JobFlags::LogParameters) && !expanded.parameters.empty())
        LOG_TARGET(context, "Parameters: " << expanded.parameters.toString());

    return command;
}
