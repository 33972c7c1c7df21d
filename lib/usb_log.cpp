#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>

#include "usb_log.hpp"

const char *USBLogLevelName(USBLogLevel level)
{
    switch (level) {
        case USB1_LOG_LEVEL_DEBUG:
            return "DEBUG";
        case USB1_LOG_LEVEL_INFO:
            return "INFO";
        case USB1_LOG_LEVEL_WARNING:
            return "WARNING";
        case USB1_LOG_LEVEL_ERROR:
            return "ERROR";
        default:
            return "NONE";
    }
}

USBLogStore &USBLogStore::getInstance()
{
    static USBLogStore instance;
    return instance;
}

USBLogStore::USBLogStore() : m_minLogLevel(USB1_LOG_LEVEL_WARNING)
{}

USBLogStore::~USBLogStore()
{
    Close();
}

void USBLogStore::Open(const std::string &logPath, USBLogLevel minLogLevel)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    m_minLogLevel.store(minLogLevel);

    if (m_logFile.is_open()) {
        m_logFile.close();
    }

    if (!logPath.empty()) {
        m_logFile.open(logPath, std::ios::out | std::ios::app);
        if (!m_logFile.is_open()) {
            std::cerr << "Failed to open log file: " << logPath << std::endl;
        }
    }
}

void USBLogStore::Close()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_logFile.is_open()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void USBLogStore::Write(USBLogLevel level, const std::string &function, const std::string &message)
{
    if (level < m_minLogLevel.load() || level >= USB1_LOG_LEVEL_NONE) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm localTime;
    localtime_r(&nowTime, &localTime);

    std::lock_guard<std::mutex> lock(m_mutex);

    std::ostream &out = m_logFile.is_open() ? static_cast<std::ostream &>(m_logFile) : std::cerr;
    out << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3)
        << millis.count() << " [" << USBLogLevelName(level) << "] " << function << ": " << message << std::endl;
}

USBLog::~USBLog()
{
    if (!m_stream.str().empty()) {
        Flush();
    }
}

void USBLog::Flush()
{
    USBLogStore::getInstance().Write(m_level, m_function, m_stream.str());
    m_stream.str("");
    m_stream.clear();
}

USBLog &endLog(USBLog &log)
{
    log.Flush();
    return log;
}
