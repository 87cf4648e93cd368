#include "dbjob/test/gtest_env.h"

#include <stdexcept>

TestEnvironment * TestEnvironment::environment_ = nullptr;

TestEnvironment::TestEnvironment(int argc, char * argv[]) {
    static const std::string dsn_prefix = "--dsn=";

    for (int i = 1; i < argc; ++i) {
        const std::string param = argv[i];
        command_line_params_.push_back(param);

        if (param.compare(0, dsn_prefix.size(), dsn_prefix) == 0)
            connection_string_ = param.substr(dsn_prefix.size());
    }

    // A bare DSN name is turned into a connection string.
    if (!connection_string_.empty() && connection_string_.find('=') == std::string::npos)
        connection_string_ = "DSN={" + connection_string_ + "}";

    if (environment_ == nullptr)
        environment_ = this;
}

TestEnvironment::~TestEnvironment() {
    if (environment_ == this)
        environment_ = nullptr;
}

TestEnvironment & TestEnvironment::getInstance() {
    if (environment_ == nullptr)
        throw std::runtime_error("TestEnvironment instance not available");

    return *environment_;
}

bool TestEnvironment::hasConnectionString() const {
    return !connection_string_.empty();
}

const std::string & TestEnvironment::getConnectionString() const {
    if (connection_string_.empty())
        throw std::runtime_error("No --dsn=... command-line parameter given");

    return connection_string_;
}
