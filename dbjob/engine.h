#pragma once

#include "dbjob/platform/platform.h"
#include "dbjob/utils/utils.h"

#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

#include <cstdint>

struct EngineSettings;

// Process wide state of the engine: logging and run numbering.
class Engine {
private:
    Engine() noexcept;

public:
    Engine(const Engine &) = delete;
    Engine(Engine &&) = delete;
    Engine& operator= (const Engine &) = delete;
    Engine& operator= (Engine &&) = delete;

    ~Engine();

    static Engine & getInstance() noexcept;

    // Applies the logging related part of a settings string, e.g. "DriverLog=on;DriverLogFile=/tmp/x.log".
    void configure(const std::string & settings_string);
    void configure(const EngineSettings & settings);

    void setLoggingEnabled(bool enabled);
    void setLogFile(const std::string & file_name);

    bool isLoggingEnabled() const;
    std::string getLogFile() const;

    void writeLogMessagePrefix(std::ostream & stream);
    void writeLogLine(const std::string & line);

    void writeLogSessionStart(std::ostream & stream);
    void writeLogSessionEnd(std::ostream & stream);

    std::uint64_t nextRunId() noexcept;

private:
    void onLogSettingsChange();
    std::ostream & getLogStream();

private:
    mutable std::recursive_mutex log_mutex;
    std::atomic<bool> logging_enabled{false};
    std::string log_file_attr;
    std::string log_file_name;
    std::ofstream log_file_stream;
    std::atomic<std::uint64_t> last_run_id{0};
};
