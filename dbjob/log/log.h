#pragma once

#include "dbjob/engine.h"

#include <sstream>
#include <stdexcept>

#include <cstdio>

// The context is anything that provides isLoggingEnabled(), writeLogMessagePrefix(std::ostream &)
// and writeLogLine(const std::string &). Logging failures are reported to stderr and never propagate.
#define LOG_INTERNAL(file, line, function, context, message) \
    { \
        try { \
            auto & context_ = context; \
            if (context_.isLoggingEnabled()) { \
                std::ostringstream stream_; \
                context_.writeLogMessagePrefix(stream_); \
                stream_ << " " << file << ":" << line; \
                stream_ << " in " << function << ": "; \
                stream_ << message; \
                context_.writeLogLine(stream_.str()); \
            } \
        } \
        catch (const std::exception & ex) { \
            std::fprintf(stderr, "Logger exception: %s\n", ex.what()); \
        } \
    }

#define LOG_TARGET(context, message) LOG_INTERNAL(__FILE__, __LINE__, __func__, context, message);
#define LOG_LOCAL(message)           LOG_INTERNAL(__FILE__, __LINE__, __func__, (*this), message);
#define LOG(message)                 LOG_INTERNAL(__FILE__, __LINE__, __func__, (Engine::getInstance()), message);
