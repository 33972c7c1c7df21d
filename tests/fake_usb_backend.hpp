#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "usb_backend.hpp"
#include "usb_constants.hpp"

// In-process implementation of the native capability surface. A test keeps a
// shared_ptr to the FakeUSBBus to script devices and completions, and hands a
// FakeUSBBackend bound to it to the USBContext under test.

struct FakeDeviceConfig {
    uint8_t busNumber = 1;
    uint8_t deviceAddress = 1;
    uint8_t portNumber = 1;
    std::vector<uint8_t> portNumbers = { 1 };
    int speed = USB1_SPEED_HIGH;

    std::vector<uint8_t> deviceDescriptor;
    std::vector<std::vector<uint8_t>> configDescriptors;

    // Returned by GetDeviceDescriptor() and Open() when non zero
    int probeError = 0;
    int openError = 0;

    std::vector<uint16_t> languages;
    std::map<uint8_t, std::string> strings;
};

// Mutable per-device state, shared by every handle opened on the device
struct FakeDeviceState {
    FakeDeviceConfig config;
    int configuration = 1;
    std::set<int> claimedInterfaces;
    std::map<int, int> altSettings;
    std::set<int> kernelDrivers;
    bool autoDetach = false;
    int openCount = 0;
    int resetCount = 0;
    std::vector<uint8_t> clearedHalts;
};

class FakeUSBBus;

class FakeUSBTransfer : public USBNativeTransfer {
public:
    FakeUSBTransfer(std::weak_ptr<FakeUSBBus> bus, std::shared_ptr<std::atomic<int>> liveCounter, int maxIsoPackets);
    ~FakeUSBTransfer();

    int Submit() override;
    int Cancel() override;

    std::chrono::steady_clock::time_point deadline;
    bool hasDeadline = false;

private:
    std::weak_ptr<FakeUSBBus> m_bus;
    std::shared_ptr<std::atomic<int>> m_liveCounter;
};

class FakeUSBBus : public std::enable_shared_from_this<FakeUSBBus> {
public:
    // Called under the bus lock when a transfer is submitted. Return true to
    // complete it right away with the given status and IN data.
    typedef std::function<bool(const USBNativeTransfer &transfer, int *status, std::vector<uint8_t> *data)> Responder;

    FakeUSBBus();
    ~FakeUSBBus();

    std::shared_ptr<FakeDeviceState> AddDevice(const FakeDeviceConfig &config);
    // Adds or removes a device and queues the matching hotplug event
    std::shared_ptr<FakeDeviceState> Plug(const FakeDeviceConfig &config);
    void Unplug(uint8_t busNumber, uint8_t deviceAddress);

    void SetResponder(Responder responder);
    // Completes the oldest pending transfer on endpoint. IN data is copied into
    // the transfer buffer, OUT transfers report their whole buffer as sent
    // when status is completed.
    bool Complete(uint8_t endpoint, int status, const std::vector<uint8_t> &data = std::vector<uint8_t>());
    size_t CompleteAll(int status);

    void SetInitError(int error) { m_initError = error; }
    void SetSubmitError(int error);
    // Cancel() succeeds but the transfer never completes
    void SetCancelIgnored(bool ignored);
    // Runs on the cancelling thread after a pending transfer was cancelled
    void SetCancelHook(std::function<void()> hook);
    // The next HandleEvents() call returns error without draining
    void InjectHandleEventsError(int error);

    // Simulates the native layer changing its fd set
    void AddPollFD(int fd, short events);
    void RemovePollFD(int fd);
    int GetEventFD() const { return m_eventPipe[0]; }

    size_t GetPendingCount();
    int GetLiveTransferCount() const { return m_liveTransfers->load(); }
    int GetMaxActiveDrainers() const { return m_maxActiveDrainers.load(); }
    int GetDeliveredCompletions() const { return m_deliveredCompletions.load(); }
    int GetHandleEventsCalls() const { return m_handleEventsCalls.load(); }
    int GetInterruptCount() const { return m_interruptCount.load(); }
    size_t GetHotplugRegistrationCount();
    bool IsInitialized() const { return m_initialized.load(); }
    bool IsShutdown() const { return m_shutdown.load(); }
    const USBContextOptions &GetOptions() const { return m_options; }
    int GetLogLevel() const { return m_logLevel; }
    void EmitLogMessage(int level, const std::string &message);

    // Slows down draining so concurrent callers overlap
    void SetDrainDelay(std::chrono::milliseconds delay) { m_drainDelay = delay; }

private:
    friend class FakeUSBBackend;
    friend class FakeUSBTransfer;
    friend class FakeUSBDevice;
    friend class FakeUSBDeviceHandle;

    struct Completion {
        FakeUSBTransfer *transfer;
        int status;
        std::vector<uint8_t> data;
        bool hasData;
    };

    struct HotplugRegistration {
        int events;
        int flags;
        int vendorId;
        int productId;
        int deviceClass;
        USBBackend::HotplugCallback callback;
    };

    struct HotplugEvent {
        std::shared_ptr<FakeDeviceState> device;
        int event;
    };

    int Init(const USBContextOptions &options);
    void Shutdown();
    int GetDeviceList(std::vector<std::shared_ptr<USBNativeDevice>> *devices);
    std::vector<USBPollFD> GetPollFDs();
    void SetPollFDNotifiers(USBBackend::PollFDAddedCallback added, USBBackend::PollFDRemovedCallback removed);
    int GetNextTimeout(std::chrono::microseconds *timeout);
    int HandleEvents(std::chrono::microseconds timeout);
    void InterruptEventHandler();
    int HotplugRegister(int events, int flags, int vendorId, int productId, int deviceClass,
        USBBackend::HotplugCallback callback, int *handle);
    void HotplugDeregister(int handle);
    void SetLogLevel(int level) { m_logLevel = level; }
    void SetLogCallback(USBNativeLogCallback callback);

    int SubmitTransfer(FakeUSBTransfer *transfer);
    int CancelTransfer(FakeUSBTransfer *transfer);
    void ForgetTransfer(FakeUSBTransfer *transfer);

    bool MatchesLocked(const HotplugRegistration &registration, const FakeDeviceState &device, int event);
    bool ExpireLocked(std::chrono::steady_clock::time_point now);
    void ApplyCompletion(const Completion &completion);
    void SignalLocked();
    void DrainPipe();

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<std::shared_ptr<FakeDeviceState>> m_devices;
    std::deque<FakeUSBTransfer *> m_pending;
    std::deque<Completion> m_ready;
    std::deque<HotplugEvent> m_hotplugEvents;
    std::map<int, std::shared_ptr<HotplugRegistration>> m_hotplugRegistrations;
    int m_nextHotplugHandle;
    // Records abandoned by a closed context
    std::vector<std::unique_ptr<FakeUSBTransfer>> m_leaked;

    Responder m_responder;
    int m_initError;
    int m_submitError;
    bool m_cancelIgnored;
    std::function<void()> m_cancelHook;
    int m_injectedError;
    bool m_interrupted;
    std::chrono::milliseconds m_drainDelay;

    USBBackend::PollFDAddedCallback m_pollFDAdded;
    USBBackend::PollFDRemovedCallback m_pollFDRemoved;
    std::vector<USBPollFD> m_extraPollFDs;
    int m_eventPipe[2];

    USBContextOptions m_options;
    int m_logLevel;
    USBNativeLogCallback m_logCallback;

    std::shared_ptr<std::atomic<int>> m_liveTransfers;
    std::atomic<int> m_activeDrainers;
    std::atomic<int> m_maxActiveDrainers;
    std::atomic<int> m_deliveredCompletions;
    std::atomic<int> m_handleEventsCalls;
    std::atomic<int> m_interruptCount;
    std::atomic<bool> m_initialized;
    std::atomic<bool> m_shutdown;
};

class FakeUSBDeviceHandle : public USBNativeDeviceHandle {
public:
    FakeUSBDeviceHandle(std::shared_ptr<FakeUSBBus> bus, std::shared_ptr<FakeDeviceState> device);
    ~FakeUSBDeviceHandle();

    int GetConfiguration(int *config) override;
    int SetConfiguration(int config) override;
    int ClaimInterface(int interface) override;
    int ReleaseInterface(int interface) override;
    int SetInterfaceAltSetting(int interface, int altSetting) override;
    int ClearHalt(uint8_t endpoint) override;
    int ResetDevice() override;
    int KernelDriverActive(int interface) override;
    int DetachKernelDriver(int interface) override;
    int AttachKernelDriver(int interface) override;
    int SetAutoDetachKernelDriver(bool enable) override;
    int GetStringDescriptor(uint8_t index, uint16_t langId, uint8_t *data, int length) override;
    int GetStringDescriptorAscii(uint8_t index, uint8_t *data, int length) override;
    std::unique_ptr<USBNativeTransfer> AllocTransfer(int isoPackets) override;

private:
    std::shared_ptr<FakeUSBBus> m_bus;
    std::shared_ptr<FakeDeviceState> m_device;
};

class FakeUSBDevice : public USBNativeDevice {
public:
    FakeUSBDevice(std::shared_ptr<FakeUSBBus> bus, std::shared_ptr<FakeDeviceState> device);

    int GetDeviceDescriptor(USBDeviceDescriptor *descriptor) override;
    int GetConfiguration(uint8_t index, USBConfiguration *config) override;
    uint8_t GetBusNumber() override;
    uint8_t GetPortNumber() override;
    int GetPortNumbers(std::vector<uint8_t> *ports) override;
    uint8_t GetDeviceAddress() override;
    int GetDeviceSpeed() override;
    int GetMaxPacketSize(uint8_t endpoint) override;
    int GetMaxIsoPacketSize(uint8_t endpoint) override;
    int Open(std::unique_ptr<USBNativeDeviceHandle> *handle) override;

private:
    const USBEndpointDescriptor *FindEndpoint(uint8_t endpoint);

    std::shared_ptr<FakeUSBBus> m_bus;
    std::shared_ptr<FakeDeviceState> m_device;
    std::vector<USBConfiguration> m_configurations;
};

class FakeUSBBackend : public USBBackend {
public:
    explicit FakeUSBBackend(std::shared_ptr<FakeUSBBus> bus) : m_bus(std::move(bus))
    {}
    ~FakeUSBBackend();

    int Init(const USBContextOptions &options) override;
    int GetDeviceList(std::vector<std::shared_ptr<USBNativeDevice>> *devices) override;
    int WrapSysDevice(intptr_t sysDevice, std::shared_ptr<USBNativeDevice> *device,
        std::unique_ptr<USBNativeDeviceHandle> *handle) override;
    std::vector<USBPollFD> GetPollFDs() override;
    void SetPollFDNotifiers(PollFDAddedCallback added, PollFDRemovedCallback removed) override;
    int GetNextTimeout(std::chrono::microseconds *timeout) override;
    int HandleEvents(std::chrono::microseconds timeout) override;
    void InterruptEventHandler() override;
    int HotplugRegister(int events, int flags, int vendorId, int productId, int deviceClass,
        HotplugCallback callback, int *handle) override;
    void HotplugDeregister(int handle) override;
    bool HasCapability(uint32_t capability) override;
    void SetLogLevel(int level) override;
    void SetLogCallback(USBNativeLogCallback callback) override;

private:
    std::shared_ptr<FakeUSBBus> m_bus;
};

// Raw descriptor builders
std::vector<uint8_t> BuildDeviceDescriptor(uint16_t vendorId, uint16_t productId, uint8_t numConfigurations = 1,
    uint8_t deviceClass = 0);
std::vector<uint8_t> BuildEndpointDescriptor(uint8_t address, uint8_t attributes, uint16_t maxPacketSize,
    uint8_t interval = 0);
std::vector<uint8_t> BuildInterfaceDescriptor(uint8_t number, uint8_t altSetting, uint8_t numEndpoints,
    uint8_t interfaceClass = USB1_CLASS_VENDOR_SPEC, uint8_t subClass = 0, uint8_t protocol = 0, uint8_t iInterface = 0);
// Prepends a configuration header to the given interface/endpoint descriptors
std::vector<uint8_t> BuildConfigDescriptor(uint8_t value, uint8_t numInterfaces, const std::vector<uint8_t> &body,
    uint8_t maxPower = 50, uint8_t attributes = 0x80);

// Vendor specific device with one interface: bulk IN 0x81, bulk OUT 0x02,
// interrupt IN 0x83 and isochronous IN 0x84.
FakeDeviceConfig MakeFakeDevice(uint16_t vendorId, uint16_t productId, uint8_t busNumber = 1,
    uint8_t deviceAddress = 1);
