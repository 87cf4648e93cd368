#include "dbjob/diagnostics.h"

#include <sstream>
#include <stdexcept>

bool JobError::isTransient() const noexcept {
    return (kind == ErrorKind::TransientConnectionError);
}

std::string JobError::toString() const {
    std::ostringstream stream;
    stream << ::toString(kind) << "/" << ::toString(code) << " in " << ::toString(component);
    stream << " [" << sql_state;
    if (native_error != 0)
        stream << ":" << native_error;
    stream << "]";
    if (attempt > 0)
        stream << " (attempt " << attempt << ")";
    stream << ": " << message;
    return stream.str();
}

JobError JobError::fromException(const JobException & ex, std::size_t attempt) {
    JobError error;
    error.kind = ex.getKind();
    error.code = ex.getCode();
    error.component = ex.getComponent();
    error.message = ex.what();
    error.sql_state = ex.getSQLState();
    error.native_error = ex.getNativeError();
    error.attempt = attempt;
    return error;
}

void DiagnosticsContainer::fillDiag(const JobError & error) {
    records.push_back(error);
}

std::size_t DiagnosticsContainer::getDiagStatusCount() const noexcept {
    return records.size();
}

const JobError & DiagnosticsContainer::getDiagStatus(std::size_t num) const {
    if (num < 1 || num > records.size())
        throw std::out_of_range("diagnostics record " + std::to_string(num) + " does not exist");

    return records[num - 1];
}
