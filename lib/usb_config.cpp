#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

#include "usb_config.hpp"
#include "usb_constants.hpp"

static std::string ToLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

static USBLogLevel ParseLogLevel(const std::string &value)
{
    std::string level = ToLower(value);
    if (level == "debug") {
        return USB1_LOG_LEVEL_DEBUG;
    } else if (level == "info") {
        return USB1_LOG_LEVEL_INFO;
    } else if (level == "warning") {
        return USB1_LOG_LEVEL_WARNING;
    } else if (level == "error") {
        return USB1_LOG_LEVEL_ERROR;
    } else if (level == "none") {
        return USB1_LOG_LEVEL_NONE;
    }

    throw std::runtime_error("Invalid log level: " + value);
}

static int ParseNativeLogLevel(const std::string &value)
{
    std::string level = ToLower(value);
    if (level == "none") {
        return USB1_NATIVE_LOG_LEVEL_NONE;
    } else if (level == "error") {
        return USB1_NATIVE_LOG_LEVEL_ERROR;
    } else if (level == "warning") {
        return USB1_NATIVE_LOG_LEVEL_WARNING;
    } else if (level == "info") {
        return USB1_NATIVE_LOG_LEVEL_INFO;
    } else if (level == "debug") {
        return USB1_NATIVE_LOG_LEVEL_DEBUG;
    }

    throw std::runtime_error("Invalid native log level: " + value);
}

int USBContextOptions::Load(const std::string &path)
{
    USB1_LOG;

    try {
        YAML::Node config = YAML::LoadFile(path);
        USBContextOptions loaded = *this;

        if (config["log_level"]) {
            loaded.logLevel = ParseLogLevel(config["log_level"].as<std::string>());
        }
        if (config["log_file"]) {
            loaded.logPath = config["log_file"].as<std::string>();
        }
        if (config["native_log_level"]) {
            loaded.nativeLogLevel = ParseNativeLogLevel(config["native_log_level"].as<std::string>());
        }
        if (config["use_usbdk"]) {
            loaded.useUsbDk = config["use_usbdk"].as<bool>();
        }
        if (config["with_device_discovery"]) {
            loaded.withDeviceDiscovery = config["with_device_discovery"].as<bool>();
        }
        if (config["close_drain_timeout_ms"]) {
            int timeout = config["close_drain_timeout_ms"].as<int>();
            if (timeout < 0) {
                throw std::runtime_error("Invalid close_drain_timeout_ms");
            }
            loaded.closeDrainTimeout = std::chrono::milliseconds(timeout);
        }

        *this = loaded;

        log(USB1_LOG_LEVEL_INFO) << "Loaded options from " << path << endLog;
        log(USB1_LOG_LEVEL_DEBUG) << "  native_log_level: " << nativeLogLevel << endLog;
        log(USB1_LOG_LEVEL_DEBUG) << "  with_device_discovery: " << (withDeviceDiscovery ? "true" : "false") << endLog;
        log(USB1_LOG_LEVEL_DEBUG) << "  close_drain_timeout_ms: " << closeDrainTimeout.count() << endLog;
    } catch (const YAML::BadFile& e) {
        log(USB1_LOG_LEVEL_ERROR) << "Unable to open the options file: " << e.what() << endLog;
        return -1;
    } catch (const std::exception& e) {
        log(USB1_LOG_LEVEL_ERROR) << "Invalid options file " << path << ": " << e.what() << endLog;
        return -1;
    }

    return 0;
}
