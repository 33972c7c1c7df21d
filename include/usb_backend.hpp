#pragma once

#include <cstdint>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "usb_config.hpp"
#include "usb_descriptors.hpp"

// Capability surface of the native USB layer. Every call returning int
// reports failures as negative USBErrorCode values.

struct USBIsoPacket {
    unsigned int length = 0;
    unsigned int actualLength = 0;
    int status = 0;
};

// One native transfer record. The request fields are read by Submit(), the
// result fields are written before callback is invoked. Deleting the record
// releases the native resources, which must not happen while it is in flight.
class USBNativeTransfer {
public:
    typedef void (*CompletionCallback)(USBNativeTransfer *transfer);

    explicit USBNativeTransfer(int maxIsoPackets) : isoPackets(maxIsoPackets)
    {}
    virtual ~USBNativeTransfer()
    {}

    virtual int Submit() = 0;
    virtual int Cancel() = 0;

    uint8_t type = 0;
    uint8_t endpoint = 0;
    uint8_t flags = 0;
    unsigned int timeout = 0;
    // Control transfers carry the setup packet in the first 8 bytes
    std::vector<uint8_t> buffer;
    int numIsoPackets = 0;
    std::vector<USBIsoPacket> isoPackets;
    CompletionCallback callback = nullptr;
    void *userData = nullptr;

    int status = 0;
    int actualLength = 0;
};

class USBNativeDeviceHandle {
public:
    virtual ~USBNativeDeviceHandle()
    {}

    virtual int GetConfiguration(int *config) = 0;
    virtual int SetConfiguration(int config) = 0;
    virtual int ClaimInterface(int interface) = 0;
    virtual int ReleaseInterface(int interface) = 0;
    virtual int SetInterfaceAltSetting(int interface, int altSetting) = 0;
    virtual int ClearHalt(uint8_t endpoint) = 0;
    virtual int ResetDevice() = 0;
    virtual int KernelDriverActive(int interface) = 0;
    virtual int DetachKernelDriver(int interface) = 0;
    virtual int AttachKernelDriver(int interface) = 0;
    virtual int SetAutoDetachKernelDriver(bool enable) = 0;

    // Both return the number of bytes written to data.
    virtual int GetStringDescriptor(uint8_t index, uint16_t langId, uint8_t *data, int length) = 0;
    virtual int GetStringDescriptorAscii(uint8_t index, uint8_t *data, int length) = 0;

    // Returns nullptr when the record cannot be allocated.
    virtual std::unique_ptr<USBNativeTransfer> AllocTransfer(int isoPackets) = 0;
};

class USBNativeDevice {
public:
    virtual ~USBNativeDevice()
    {}

    virtual int GetDeviceDescriptor(USBDeviceDescriptor *descriptor) = 0;
    virtual int GetConfiguration(uint8_t index, USBConfiguration *config) = 0;
    virtual uint8_t GetBusNumber() = 0;
    virtual uint8_t GetPortNumber() = 0;
    virtual int GetPortNumbers(std::vector<uint8_t> *ports) = 0;
    virtual uint8_t GetDeviceAddress() = 0;
    virtual int GetDeviceSpeed() = 0;
    virtual int GetMaxPacketSize(uint8_t endpoint) = 0;
    virtual int GetMaxIsoPacketSize(uint8_t endpoint) = 0;
    virtual int Open(std::unique_ptr<USBNativeDeviceHandle> *handle) = 0;
};

struct USBPollFD {
    int fd;
    short events;
};

class USBBackend {
public:
    typedef std::function<void(int fd, short events)> PollFDAddedCallback;
    typedef std::function<void(int fd)> PollFDRemovedCallback;
    // Returning true deregisters the callback.
    typedef std::function<bool(std::shared_ptr<USBNativeDevice> device, int event)> HotplugCallback;

    virtual ~USBBackend()
    {}

    virtual int Init(const USBContextOptions &options) = 0;

    virtual int GetDeviceList(std::vector<std::shared_ptr<USBNativeDevice>> *devices) = 0;
    virtual int WrapSysDevice(intptr_t sysDevice, std::shared_ptr<USBNativeDevice> *device,
        std::unique_ptr<USBNativeDeviceHandle> *handle) = 0;

    virtual std::vector<USBPollFD> GetPollFDs() = 0;
    virtual void SetPollFDNotifiers(PollFDAddedCallback added, PollFDRemovedCallback removed) = 0;

    // Returns 1 and fills timeout when a native timeout is pending, 0 when none is.
    virtual int GetNextTimeout(std::chrono::microseconds *timeout) = 0;

    // Waits up to timeout for native events, then runs the completion
    // callbacks of every finished transfer on the calling thread.
    virtual int HandleEvents(std::chrono::microseconds timeout) = 0;
    virtual void InterruptEventHandler() = 0;

    virtual int HotplugRegister(int events, int flags, int vendorId, int productId, int deviceClass,
        HotplugCallback callback, int *handle) = 0;
    virtual void HotplugDeregister(int handle) = 0;

    virtual bool HasCapability(uint32_t capability) = 0;
    virtual void SetLogLevel(int level) = 0;
    virtual void SetLogCallback(USBNativeLogCallback callback) = 0;
};

std::unique_ptr<USBBackend> CreateLibUSBBackend();

struct USBVersion {
    uint16_t major;
    uint16_t minor;
    uint16_t micro;
    uint16_t nano;
    std::string rc;
};

USBVersion USBGetVersion();
bool USBHasCapability(uint32_t capability);
int USBSetLocale(const std::string &locale);
