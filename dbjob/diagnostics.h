#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/exception.h"

#include <string>
#include <vector>

#include <cstddef>
#include <cstdint>

// A single failure record, as observed by callers of a job.
struct JobError {
    ErrorKind kind = ErrorKind::CommandExecutionError;
    ErrorCode code = ErrorCode::None;
    Component component = Component::Engine;
    std::string message;
    std::string sql_state = "HY000";
    std::int32_t native_error = 0;
    std::size_t attempt = 0; // 1-based attempt that produced the error, 0 if outside any attempt.

    bool isTransient() const noexcept;
    std::string toString() const;

    static JobError fromException(const JobException & ex, std::size_t attempt = 0);
};

// A class that enables other classes derived from it
// to accumulate diagnostics records in a common form.
// Records are numbered starting from 1, in the order they were inserted.
class DiagnosticsContainer {
public:
    void fillDiag(const JobError & error);

    std::size_t getDiagStatusCount() const noexcept;
    const JobError & getDiagStatus(std::size_t num) const;

private:
    std::vector<JobError> records;
};
