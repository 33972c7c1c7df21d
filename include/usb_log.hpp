#pragma once

#include <string>
#include <sstream>
#include <fstream>
#include <mutex>
#include <atomic>
#include <ios>

enum USBLogLevel {
    USB1_LOG_LEVEL_DEBUG,
    USB1_LOG_LEVEL_INFO,
    USB1_LOG_LEVEL_WARNING,
    USB1_LOG_LEVEL_ERROR,
    USB1_LOG_LEVEL_NONE,
};

const char *USBLogLevelName(USBLogLevel level);

class USBLogStore {
public:
    static USBLogStore &getInstance();

    // An empty path sends the log to stderr.
    void Open(const std::string &logPath, USBLogLevel minLogLevel);
    void Close();

    void SetMinLevel(USBLogLevel level) { m_minLogLevel.store(level); }
    USBLogLevel GetMinLevel() const { return m_minLogLevel.load(); }

    void Write(USBLogLevel level, const std::string &function, const std::string &message);

private:
    USBLogStore();
    ~USBLogStore();
    USBLogStore(const USBLogStore &) = delete;
    USBLogStore &operator=(const USBLogStore &) = delete;

    std::mutex m_mutex;
    std::ofstream m_logFile;
    std::atomic<USBLogLevel> m_minLogLevel;
};

class USBLog {
public:
    explicit USBLog(const char *function) : m_function(function), m_level(USB1_LOG_LEVEL_INFO)
    {}
    ~USBLog();

    USBLog &operator()(USBLogLevel level)
    {
        m_level = level;
        return *this;
    }

    template<typename T>
    USBLog &operator<<(const T &value)
    {
        m_stream << value;
        return *this;
    }

    USBLog &operator<<(std::ostream &(*manip)(std::ostream &))
    {
        m_stream << manip;
        return *this;
    }

    USBLog &operator<<(std::ios_base &(*manip)(std::ios_base &))
    {
        m_stream << manip;
        return *this;
    }

    USBLog &operator<<(USBLog &(*manip)(USBLog &))
    {
        return manip(*this);
    }

    void Flush();

private:
    std::string m_function;
    USBLogLevel m_level;
    std::ostringstream m_stream;
};

USBLog &endLog(USBLog &log);

#define USB1_LOG USBLog log(__FUNCTION__)
