#include <iostream>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <csignal>
#include <queue>
#include <condition_variable>
#include <thread>
#include <cxxopts.hpp>

#include "usb_config.hpp"
#include "usb_context.hpp"
#include "usb_device.hpp"
#include "usb_log.hpp"

struct HotplugEventRecord {
    int event;
    std::string description;
};

std::queue<HotplugEventRecord> hotplugEvents;
std::condition_variable hotplugEventsCV;
std::mutex hotplugEventsMutex;

static std::atomic<bool> stopRequested(false);

static void HandleSignal(int)
{
    stopRequested.store(true);
}

static std::string FormatHex(int value, int width)
{
    std::stringstream ss;
    ss << "0x" << std::hex << std::setw(width) << std::setfill('0') << value;
    return ss.str();
}

static std::string FormatPortPath(const USBDevice &device)
{
    std::stringstream ss;
    ss << static_cast<int>(device.GetBusNumber()) << "-";

    const std::vector<uint8_t> &ports = device.GetPortNumberList();
    for (size_t i = 0; i < ports.size(); ++i) {
        if (i) {
            ss << ".";
        }
        ss << static_cast<int>(ports[i]);
    }

    return ss.str();
}

static std::string TryGetString(USBDeviceHandle *handle, uint8_t index)
{
    if (handle == nullptr || index == 0) {
        return std::string();
    }

    try {
        return handle->GetASCIIStringDescriptor(index);
    } catch (const USBError &) {
        return std::string();
    }
}

static void PrintDeviceLine(const USBDevice &device)
{
    std::cout << device.ToString() << " Path " << FormatPortPath(device)
        << " Speed " << USBSpeedName(device.GetDeviceSpeed()) << std::endl;
}

static void PrintDeviceTree(const USBDevice &device)
{
    std::unique_ptr<USBDeviceHandle> handle;
    try {
        handle = device.Open();
    } catch (const USBError &) {
        // Descriptors are still available without a handle
    }

    const USBDeviceDescriptor &desc = device.GetDeviceDescriptor();
    std::cout << device.ToString() << std::endl;
    std::cout << "  bcdUSB: " << FormatHex(desc.bcdUSB, 4) << std::endl;
    std::cout << "  bDeviceClass: " << static_cast<int>(desc.bDeviceClass) << std::endl;
    std::cout << "  bMaxPacketSize0: " << static_cast<int>(desc.bMaxPacketSize0) << std::endl;
    std::cout << "  iManufacturer: " << TryGetString(handle.get(), desc.iManufacturer) << std::endl;
    std::cout << "  iProduct: " << TryGetString(handle.get(), desc.iProduct) << std::endl;
    std::cout << "  iSerialNumber: " << TryGetString(handle.get(), desc.iSerialNumber) << std::endl;

    for (const USBConfiguration &config : device.GetConfigurations()) {
        std::cout << "  Configuration " << static_cast<int>(config.bConfigurationValue) << ": "
            << TryGetString(handle.get(), config.iConfiguration) << std::endl;
        std::cout << "    MaxPower: " << config.GetMaxPowerMilliAmps(device.GetDeviceSpeed()) << "mA" << std::endl;
        if (!config.extra.empty()) {
            std::cout << "    Extra: " << config.extra.size() << " bytes" << std::endl;
        }

        for (const USBInterface &interface : config.interfaces) {
            for (const USBInterfaceSetting &setting : interface.altsettings) {
                std::cout << "    Interface " << static_cast<int>(setting.bInterfaceNumber)
                    << " Setting " << static_cast<int>(setting.bAlternateSetting)
                    << ": class " << FormatHex(setting.bInterfaceClass, 2)
                    << " subclass " << FormatHex(setting.bInterfaceSubClass, 2)
                    << " protocol " << FormatHex(setting.bInterfaceProtocol, 2)
                    << " " << TryGetString(handle.get(), setting.iInterface) << std::endl;

                for (const USBEndpointDescriptor &endpoint : setting.endpoints) {
                    static const char *transferTypes[] = { "Control", "Isochronous", "Bulk", "Interrupt" };
                    std::cout << "      Endpoint " << FormatHex(endpoint.bEndpointAddress, 2)
                        << (endpoint.IsIn() ? " IN " : " OUT ")
                        << transferTypes[endpoint.GetTransferType()]
                        << " wMaxPacketSize " << endpoint.wMaxPacketSize
                        << " bInterval " << static_cast<int>(endpoint.bInterval) << std::endl;
                }
            }
        }
    }
}

static int RunHotplugMonitor(USBContext &context)
{
    if (!context.HasCapability(USB1_CAP_HAS_HOTPLUG)) {
        std::cerr << "Hotplug is not supported on this platform" << std::endl;
        return 1;
    }

    int handle = context.HotplugRegisterCallback([](USBContext *, const USBDevice &device, int event) {
        std::lock_guard<std::mutex> lock(hotplugEventsMutex);
        hotplugEvents.push(HotplugEventRecord{event, device.ToString()});
        hotplugEventsCV.notify_one();
        return false;
    });

    std::thread eventThread([&context]() {
        USB1_LOG;

        while (!stopRequested.load()) {
            try {
                context.HandleEventsTimeout(std::chrono::milliseconds(500));
            } catch (const USBError &e) {
                if (e.GetCode() != USB1_ERROR_INTERRUPTED) {
                    log(USB1_LOG_LEVEL_ERROR) << "Failed to handle events: " << e.what() << endLog;
                    stopRequested.store(true);
                }
            }
        }

        hotplugEventsCV.notify_one();
    });

    while (true) {
        std::unique_lock<std::mutex> lock(hotplugEventsMutex);
        hotplugEventsCV.wait_for(lock, std::chrono::milliseconds(500), []{
            return !hotplugEvents.empty() || stopRequested.load();
        });

        while (!hotplugEvents.empty()) {
            HotplugEventRecord record = hotplugEvents.front();
            hotplugEvents.pop();
            std::cout << (record.event == USB1_HOTPLUG_EVENT_DEVICE_ARRIVED ? "Arrived: " : "Left: ")
                << record.description << std::endl;
        }

        if (stopRequested.load()) {
            break;
        }
    }

    eventThread.join();
    context.HotplugDeregisterCallback(handle);

    return 0;
}

int main(int argc, char* argv[])
{
    cxxopts::Options options("usb1util", "USB device inspection utility");

    options.add_options()
        ("l,list", "List connected devices", cxxopts::value<bool>()->default_value("false"))
        ("t,tree", "Print the descriptor tree of every device", cxxopts::value<bool>()->default_value("false"))
        ("H,hotplug", "Print device arrivals and departures until interrupted", cxxopts::value<bool>()->default_value("false"))
        ("c,config", "Options file path", cxxopts::value<std::string>())
        ("L,log", "Log file path", cxxopts::value<std::string>()->default_value(""))
        ("D,debug", "Enable debug logging", cxxopts::value<bool>()->default_value("false"))
        ("u,usb-debug", "Enable libusb debug logging", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    USBContextOptions contextOptions;
    if (result.count("config")) {
        if (contextOptions.Load(result["config"].as<std::string>()) < 0) {
            std::cerr << "Failed to load options file" << std::endl;
            return 1;
        }
    }

    if (result.count("log")) {
        contextOptions.logPath = result["log"].as<std::string>();
    }
    if (result["debug"].as<bool>()) {
        contextOptions.logLevel = USB1_LOG_LEVEL_DEBUG;
    }
    if (result["usb-debug"].as<bool>()) {
        contextOptions.nativeLogLevel = USB1_NATIVE_LOG_LEVEL_DEBUG;
    }

    USBLogStore::getInstance().Open(contextOptions.logPath, contextOptions.logLevel);

    bool list = result["list"].as<bool>();
    bool tree = result["tree"].as<bool>();
    bool hotplug = result["hotplug"].as<bool>();
    if (!list && !tree && !hotplug) {
        list = true;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    int ret = 0;
    try {
        USBContext context(contextOptions);
        context.Open();

        if (list || tree) {
            context.EnumerateDevices([tree](const USBDevice &device) {
                if (tree) {
                    PrintDeviceTree(device);
                } else {
                    PrintDeviceLine(device);
                }
                return !stopRequested.load();
            }, true, true);
        }

        if (hotplug) {
            ret = RunHotplugMonitor(context);
        }

        context.Close();
    } catch (const USBError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        ret = 1;
    }

    USBLogStore::getInstance().Close();

    return ret;
}
