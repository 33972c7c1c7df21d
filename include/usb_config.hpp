#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "usb_log.hpp"

typedef std::function<void(int level, const std::string &message)> USBNativeLogCallback;

struct USBContextOptions {
    // Returns -1 if the file cannot be read or holds an invalid value. Keys
    // missing from the file keep their current value.
    int Load(const std::string &path);

    USBLogLevel logLevel = USB1_LOG_LEVEL_WARNING;
    std::string logPath;

    // Negative keeps the native library's default
    int nativeLogLevel = -1;
    bool useUsbDk = false;
    bool withDeviceDiscovery = true;

    // Upper bound on the time USBContext::Close() spends reaping cancelled transfers
    std::chrono::milliseconds closeDrainTimeout{1000};

    USBNativeLogCallback logCallback;
};
