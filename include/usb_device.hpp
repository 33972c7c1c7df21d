#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "usb_backend.hpp"
#include "usb_descriptors.hpp"
#include "usb_transfer.hpp"

class USBContext;
class USBDeviceHandle;

// Snapshot of a device as seen at enumeration time. All descriptors are read
// when the snapshot is built and never change afterwards.
class USBDevice {
public:
    USBDevice(USBContext *context, std::shared_ptr<USBNativeDevice> device);

    uint8_t GetBusNumber() const { return m_busNumber; }
    uint8_t GetPortNumber() const { return m_portNumber; }
    const std::vector<uint8_t> &GetPortNumberList() const { return m_portNumbers; }
    uint8_t GetDeviceAddress() const { return m_deviceAddress; }
    int GetDeviceSpeed() const { return m_speed; }

    const USBDeviceDescriptor &GetDeviceDescriptor() const { return m_descriptor; }
    uint16_t GetbcdUSB() const { return m_descriptor.bcdUSB; }
    uint8_t GetDeviceClass() const { return m_descriptor.bDeviceClass; }
    uint8_t GetDeviceSubClass() const { return m_descriptor.bDeviceSubClass; }
    uint8_t GetDeviceProtocol() const { return m_descriptor.bDeviceProtocol; }
    uint8_t GetMaxPacketSize0() const { return m_descriptor.bMaxPacketSize0; }
    uint16_t GetVendorID() const { return m_descriptor.idVendor; }
    uint16_t GetProductID() const { return m_descriptor.idProduct; }
    uint16_t GetbcdDevice() const { return m_descriptor.bcdDevice; }
    uint8_t GetNumConfigurations() const { return m_descriptor.bNumConfigurations; }

    const std::vector<USBConfiguration> &GetConfigurations() const { return m_configurations; }
    // Every alternate setting of every interface of every configuration
    std::vector<USBInterfaceSetting> GetSettings() const;

    int GetMaxPacketSize(uint8_t endpoint) const;
    int GetMaxIsoPacketSize(uint8_t endpoint) const;

    // The string getters open the device and return an empty string when
    // the descriptor is absent.
    std::string GetManufacturer() const;
    std::string GetProduct() const;
    std::string GetSerialNumber() const;

    // "Bus 001 Device 004: ID 1d6b:0002"
    std::string ToString() const;

    std::unique_ptr<USBDeviceHandle> Open() const;

private:
    std::string GetASCIIString(uint8_t index) const;

    USBContext *m_context;
    std::shared_ptr<USBNativeDevice> m_device;
    USBDeviceDescriptor m_descriptor;
    std::vector<USBConfiguration> m_configurations;
    uint8_t m_busNumber;
    uint8_t m_portNumber;
    std::vector<uint8_t> m_portNumbers;
    uint8_t m_deviceAddress;
    int m_speed;
};

class USBDeviceHandle {
public:
    ~USBDeviceHandle();

    USBDeviceHandle(const USBDeviceHandle &) = delete;
    USBDeviceHandle &operator=(const USBDeviceHandle &) = delete;

    // Cancels in-flight transfers of this handle, lets them complete, dooms
    // every transfer created by this handle and releases the native handle.
    void Close();
    bool IsOpen() const;

    const USBDevice &GetDevice() const { return m_device; }

    int GetConfiguration();
    void SetConfiguration(int config);
    void ClaimInterface(int interface);
    void ReleaseInterface(int interface);
    void SetInterfaceAltSetting(int interface, int altSetting);
    void ClearHalt(uint8_t endpoint);
    void ResetDevice();

    bool KernelDriverActive(int interface);
    void DetachKernelDriver(int interface);
    void AttachKernelDriver(int interface);
    void SetAutoDetachKernelDriver(bool enable);

    // Empty when the device has no string descriptors
    std::vector<uint16_t> GetSupportedLanguageList();
    std::string GetStringDescriptor(uint8_t index, uint16_t langId);
    std::string GetASCIIStringDescriptor(uint8_t index);
    std::string GetManufacturer();
    std::string GetProduct();
    std::string GetSerialNumber();

    std::unique_ptr<USBTransfer> GetTransfer(int isoPackets = 0, bool shortIsError = false,
        bool addZeroPacket = false);

    // Synchronous transfers. Timeouts are in milliseconds, 0 waits forever. A
    // timed out transfer raises USBTimeoutError with the partial result.
    size_t ControlWrite(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
        const std::vector<uint8_t> &data, unsigned int timeout = 0);
    std::vector<uint8_t> ControlRead(uint8_t requestType, uint8_t request, uint16_t value,
        uint16_t index, uint16_t length, unsigned int timeout = 0);
    size_t BulkWrite(uint8_t endpoint, const std::vector<uint8_t> &data, unsigned int timeout = 0);
    std::vector<uint8_t> BulkRead(uint8_t endpoint, size_t length, unsigned int timeout = 0);
    size_t InterruptWrite(uint8_t endpoint, const std::vector<uint8_t> &data, unsigned int timeout = 0);
    std::vector<uint8_t> InterruptRead(uint8_t endpoint, size_t length, unsigned int timeout = 0);

private:
    friend class USBDevice;
    friend class USBContext;
    friend class USBTransfer;

    USBDeviceHandle(USBContext *context, const USBDevice &device, std::unique_ptr<USBNativeDeviceHandle> handle);

    USBNativeDeviceHandle *GetNative();
    void RunTransfer(USBTransfer *transfer, bool isRead);
    void CancelAndWait(USBTransfer *transfer, std::atomic<bool> *completed);
    void ReleaseNative();
    void RegisterTransfer(USBTransfer *transfer);
    void UnregisterTransfer(USBTransfer *transfer);
    std::vector<USBTransfer *> GetTransfers();

    USBContext *m_context;
    USBDevice m_device;
    std::unique_ptr<USBNativeDeviceHandle> m_handle;
    std::mutex m_mutex;
    std::unordered_set<USBTransfer *> m_transfers;
};

// Claims an interface for the lifetime of the object.
class USBInterfaceClaim {
public:
    USBInterfaceClaim(USBDeviceHandle *handle, int interface);
    ~USBInterfaceClaim();

    USBInterfaceClaim(const USBInterfaceClaim &) = delete;
    USBInterfaceClaim &operator=(const USBInterfaceClaim &) = delete;

private:
    USBDeviceHandle *m_handle;
    int m_interface;
};
