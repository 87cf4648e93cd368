#include "dbjob/config/config.h"
#include "dbjob/config/ini_defines.h"
#include "dbjob/engine.h"
#include "dbjob/log/log.h"

#include <chrono>
#include <ctime>

Engine::Engine() noexcept {
    try {
        log_file_attr = INI_DRIVERLOGFILE_DEFAULT;
        logging_enabled = isYes(INI_DRIVERLOG_DEFAULT);
        onLogSettingsChange();
    }
    catch (const std::exception & ex) {
        std::fprintf(stderr, "Failed to initialize engine logging: %s\n", ex.what());
        logging_enabled = false;
    }
}

Engine::~Engine() {
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    if (log_file_stream.is_open() && log_file_stream)
        writeLogSessionEnd(log_file_stream);
}

Engine & Engine::getInstance() noexcept {
    static Engine engine;
    return engine;
}

void Engine::configure(const std::string & settings_string) {
    configure(readEngineSettings(settings_string));
}

void Engine::configure(const EngineSettings & settings) {
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    log_file_attr = settings.driver_log_file;
    logging_enabled = settings.driver_log;
    onLogSettingsChange();
}

void Engine::setLoggingEnabled(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    logging_enabled = enabled;
    onLogSettingsChange();
}

void Engine::setLogFile(const std::string & file_name) {
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    log_file_attr = file_name;
    onLogSettingsChange();
}

bool Engine::isLoggingEnabled() const {
    return logging_enabled;
}

std::string Engine::getLogFile() const {
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    return log_file_attr;
}

void Engine::onLogSettingsChange() {
    bool stream_open = (log_file_stream.is_open() && log_file_stream);

    if (isLoggingEnabled()) {
        if (stream_open && log_file_attr != log_file_name) {
            LOG("Switching engine log output to " << (log_file_attr.empty() ? "standard log output" : log_file_attr));
            writeLogSessionEnd(getLogStream());
            log_file_stream.close();
            stream_open = false;
        }

        if (!stream_open) {
            log_file_name = log_file_attr;
            log_file_stream = (log_file_name.empty() ? std::ofstream{} : std::ofstream{log_file_name, std::ios_base::out | std::ios_base::app});
            writeLogSessionStart(getLogStream());
        }
    }
    else {
        if (stream_open) {
            writeLogSessionEnd(getLogStream());
            log_file_stream = std::ofstream{};
        }
        log_file_name.clear();
    }
}

std::ostream & Engine::getLogStream() {
    return (log_file_stream ? log_file_stream : std::clog);
}

void Engine::writeLogMessagePrefix(std::ostream & stream) {
    stream << std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
    stream << " [" << getPID() << ":" << getTID() << "]";
}

void Engine::writeLogLine(const std::string & line) {
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    getLogStream() << line << std::endl;
}

void Engine::writeLogSessionStart(std::ostream & stream) {
    stream << "==================== dbjob logging session started";
    {
        std::tm tm = {};
        const auto time = std::time(nullptr);
        toLocalTime(time, tm);

        char mbstr[100] = {};
        if (std::strftime(mbstr, sizeof(mbstr), "%F %T %Z", &tm))
            stream << " (" << mbstr << ")";
    }
    stream << " ====================" << std::endl;

    stream << "dbjob";
    stream << " VERSION=" << VERSION_STRING;
    stream << " SYSTEM=" << SYSTEM_STRING;
    stream << " MAX_RESULT_SETS=" << DBJOB_MAX_RESULT_SETS;
    stream << " sizeof(void *)=" << sizeof(void *);
    stream << std::endl;
}

void Engine::writeLogSessionEnd(std::ostream & stream) {
    stream << "==================== dbjob logging session ended";
    {
        std::tm tm = {};
        const auto time = std::time(nullptr);
        toLocalTime(time, tm);

        char mbstr[100] = {};
        if (std::strftime(mbstr, sizeof(mbstr), "%F %T %Z", &tm))
            stream << " (" << mbstr << ")";
    }
    stream << " ====================" << std::endl;
}

std::uint64_t Engine::nextRunId() noexcept {
    return ++last_run_id;
}
