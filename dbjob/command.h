#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/mapping/mapping_plan.h"
#include "dbjob/driver.h"
#include "dbjob/parameters.h"

#include <chrono>
#include <optional>
#include <string>

#include <cstdint>

class RunContext;

enum class JobFlags : std::uint32_t {
    None          = 0,
    NoCache       = 1 << 0, // build mapping plans for this job only
    LogParameters = 1 << 1  // include parameter values in the log
};

constexpr JobFlags operator| (JobFlags lhs, JobFlags rhs) noexcept {
    return static_cast<JobFlags>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

constexpr bool hasFlag(JobFlags flags, JobFlags flag) noexcept {
    return ((static_cast<std::uint32_t>(flags) & static_cast<std::uint32_t>(flag)) != 0);
}

// Everything needed to build one command. Filled by the job's command source before any I/O.
struct CommandDefinition {
    std::string text; // command text, procedure name or table name, depending on type
    CommandType type = CommandType::Text;
    std::optional<CommandBehavior> behavior; // default of the requested result shape if not set
    std::optional<std::chrono::seconds> timeout;
    ParameterCollection parameters;
    ColumnMapSettings map_settings;
    JobFlags flags = JobFlags::None;
};

// Text and parameters after "IN (...)" list expansion.
struct ExpandedCommand {
    std::string text;
    ParameterCollection parameters;
};

class CommandBuilder {
public:
    /// Throws ConfigurationError for definitions that cannot be built.
    static void validate(const CommandDefinition & definition);

    /// Replaces every list parameter @name with @name_0, @name_1, ... (or NULL for an empty list).
    static ExpandedCommand expand(const CommandDefinition & definition);

    /// Explicit command timeout, else the job default, else the driver default (std::nullopt).
    static std::optional<std::chrono::seconds> resolveTimeout(
        const std::optional<std::chrono::seconds> & explicit_timeout,
        const std::optional<std::chrono::seconds> & job_timeout
    );

    /// Prepares and binds the expanded command on the run's connection and transaction.
    /// The command is owned by the run context. Nothing is executed.
    static DriverCommand & build(RunContext & context, const CommandDefinition & definition, const ExpandedCommand & expanded);
};
