#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <libusb-1.0/libusb.h>

#include "usb_backend.hpp"

// The libusb context is exited once the backend and every device, handle
// and transfer created from it have been released.
typedef std::shared_ptr<libusb_context> LibUSBContextPtr;

class LibUSBTransfer : public USBNativeTransfer {
public:
    LibUSBTransfer(std::shared_ptr<libusb_device_handle> handle, libusb_transfer *transfer, int maxIsoPackets);
    ~LibUSBTransfer();

    int Submit() override;
    int Cancel() override;

private:
    std::shared_ptr<libusb_device_handle> m_handle;
    libusb_transfer *m_transfer;

    static void LIBUSB_CALL HandleTransferCompletion(libusb_transfer *transfer);
};

class LibUSBDeviceHandle : public USBNativeDeviceHandle {
public:
    explicit LibUSBDeviceHandle(std::shared_ptr<libusb_device_handle> handle) : m_handle(std::move(handle))
    {}

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
    std::shared_ptr<libusb_device_handle> m_handle;
};

class LibUSBDevice : public USBNativeDevice {
public:
    LibUSBDevice(LibUSBContextPtr ctx, libusb_device *device);
    ~LibUSBDevice();

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
    LibUSBContextPtr m_ctx;
    libusb_device *m_device;
};

class LibUSBBackend : public USBBackend {
public:
    LibUSBBackend();
    ~LibUSBBackend();

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
    // A running callback keeps its registration alive, it may deregister
    // itself from inside the callback.
    struct HotplugRegistration : public std::enable_shared_from_this<HotplugRegistration> {
        LibUSBBackend *backend;
        HotplugCallback callback;
        // Set once the callback asked to be deregistered
        std::atomic<bool> finished;
    };

    void ReapHotplugRegistrations();
    void ForwardLogMessage(int level, const char *message);

    static void LIBUSB_CALL HandlePollFDAdded(int fd, short events, void *userData);
    static void LIBUSB_CALL HandlePollFDRemoved(int fd, void *userData);
    static int LIBUSB_CALL HandleHotplugEvent(libusb_context *ctx, libusb_device *device,
        libusb_hotplug_event event, void *userData);
    static void LIBUSB_CALL HandleLogMessage(libusb_context *ctx, enum libusb_log_level level, const char *message);

    LibUSBContextPtr m_ctx;
    std::mutex m_mutex;
    PollFDAddedCallback m_pollFDAdded;
    PollFDRemovedCallback m_pollFDRemoved;
    std::map<int, std::shared_ptr<HotplugRegistration>> m_hotplugRegistrations;
    USBNativeLogCallback m_logCallback;
};
