#include <algorithm>
#include <iomanip>
#include <sstream>

#include "usb_device.hpp"
#include "usb_context.hpp"
#include "usb_log.hpp"

// Largest string descriptor a device can return
static const int stringDescriptorLength = 255;
// Steps used while a closing handle waits for its cancelled transfers
static const std::chrono::milliseconds closeDrainStep(100);
static const int closeDrainSteps = 10;

USBDevice::USBDevice(USBContext *context, std::shared_ptr<USBNativeDevice> device)
    : m_context(context), m_device(std::move(device))
{
    USB1_LOG;

    if (!m_device) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "No native device");
    }

    USBCheck(m_device->GetDeviceDescriptor(&m_descriptor), "Failed to get device descriptor");

    for (uint8_t i = 0; i < m_descriptor.bNumConfigurations; ++i) {
        USBConfiguration config;
        int ret = m_device->GetConfiguration(i, &config);
        if (ret == USB1_ERROR_NOT_FOUND) {
            // Root hubs on some platforms announce a configuration they do not have
            log(USB1_LOG_LEVEL_DEBUG) << "Configuration " << static_cast<int>(i) << " not found" << endLog;
            continue;
        }
        USBCheck(ret, "Failed to get configuration descriptor");
        m_configurations.push_back(std::move(config));
    }

    m_busNumber = m_device->GetBusNumber();
    m_portNumber = m_device->GetPortNumber();
    m_deviceAddress = m_device->GetDeviceAddress();
    m_speed = m_device->GetDeviceSpeed();

    int ret = m_device->GetPortNumbers(&m_portNumbers);
    if (ret < 0) {
        log(USB1_LOG_LEVEL_DEBUG) << "Failed to get port numbers: " << USBErrorName(ret) << endLog;
        m_portNumbers.clear();
    }
}

std::vector<USBInterfaceSetting> USBDevice::GetSettings() const
{
    std::vector<USBInterfaceSetting> settings;

    for (const auto &config : m_configurations) {
        for (const auto &interface : config.interfaces) {
            settings.insert(settings.end(), interface.altsettings.begin(), interface.altsettings.end());
        }
    }

    return settings;
}

int USBDevice::GetMaxPacketSize(uint8_t endpoint) const
{
    return USBCheck(m_device->GetMaxPacketSize(endpoint), "Failed to get max packet size");
}

int USBDevice::GetMaxIsoPacketSize(uint8_t endpoint) const
{
    return USBCheck(m_device->GetMaxIsoPacketSize(endpoint), "Failed to get max isochronous packet size");
}

std::string USBDevice::GetASCIIString(uint8_t index) const
{
    if (index == 0) {
        return std::string();
    }

    return Open()->GetASCIIStringDescriptor(index);
}

std::string USBDevice::GetManufacturer() const
{
    return GetASCIIString(m_descriptor.iManufacturer);
}

std::string USBDevice::GetProduct() const
{
    return GetASCIIString(m_descriptor.iProduct);
}

std::string USBDevice::GetSerialNumber() const
{
    return GetASCIIString(m_descriptor.iSerialNumber);
}

std::string USBDevice::ToString() const
{
    std::stringstream ss;
    ss << "Bus " << std::setw(3) << std::setfill('0') << static_cast<int>(m_busNumber)
        << " Device " << std::setw(3) << static_cast<int>(m_deviceAddress)
        << ": ID " << std::hex << std::setw(4) << m_descriptor.idVendor
        << ":" << std::setw(4) << m_descriptor.idProduct;

    return ss.str();
}

std::unique_ptr<USBDeviceHandle> USBDevice::Open() const
{
    USB1_LOG;

    if (m_context == nullptr || !m_context->IsOpen()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Context is not open");
    }

    std::unique_ptr<USBNativeDeviceHandle> handle;
    int ret = m_device->Open(&handle);
    if (ret < 0) {
        log(USB1_LOG_LEVEL_ERROR) << "Failed to open " << ToString() << ": " << USBErrorName(ret) << endLog;
        throw USBError(ret, "Failed to open USB device");
    }

    return std::unique_ptr<USBDeviceHandle>(new USBDeviceHandle(m_context, *this, std::move(handle)));
}

USBDeviceHandle::USBDeviceHandle(USBContext *context, const USBDevice &device,
    std::unique_ptr<USBNativeDeviceHandle> handle)
    : m_context(context), m_device(device), m_handle(std::move(handle))
{
    m_context->RegisterHandle(this);
}

USBDeviceHandle::~USBDeviceHandle()
{
    USB1_LOG;

    try {
        Close();
    } catch (const std::exception &e) {
        log(USB1_LOG_LEVEL_ERROR) << "Error while closing device handle: " << e.what() << endLog;
    }

    // Transfers outliving the handle keep working until their next use
    for (USBTransfer *transfer : GetTransfers()) {
        transfer->m_handle = nullptr;
    }
}

void USBDeviceHandle::Close()
{
    USB1_LOG;

    if (!m_handle) {
        return;
    }

    log(USB1_LOG_LEVEL_DEBUG) << "Closing " << m_device.ToString() << endLog;

    bool inFlight = false;
    for (USBTransfer *transfer : GetTransfers()) {
        int ret = transfer->CancelInFlight();
        if (ret < 0 && ret != USB1_ERROR_NOT_FOUND) {
            log(USB1_LOG_LEVEL_DEBUG) << "Failed to cancel transfer: " << USBErrorName(ret) << endLog;
        }
        if (transfer->IsSubmitted()) {
            inFlight = true;
        }
    }

    // The draining thread cannot wait for itself, its transfers are reaped by Doom()
    if (inFlight && m_context != nullptr && m_context->IsOpen() && !m_context->IsEventHandler()) {
        for (int i = 0; i < closeDrainSteps; ++i) {
            bool pending = false;
            for (USBTransfer *transfer : GetTransfers()) {
                if (transfer->IsSubmitted()) {
                    pending = true;
                    break;
                }
            }
            if (!pending) {
                break;
            }

            try {
                m_context->HandleEventsTimeout(closeDrainStep);
            } catch (const USBError &e) {
                if (e.GetCode() != USB1_ERROR_INTERRUPTED) {
                    log(USB1_LOG_LEVEL_WARNING) << "Failed to handle events while closing: " << e.what() << endLog;
                    break;
                }
            }
        }
    }

    ReleaseNative();

    if (m_context != nullptr) {
        m_context->UnregisterHandle(this);
    }
}

bool USBDeviceHandle::IsOpen() const
{
    return m_handle != nullptr;
}

void USBDeviceHandle::ReleaseNative()
{
    for (USBTransfer *transfer : GetTransfers()) {
        transfer->Doom();
    }

    m_handle.reset();
}

USBNativeDeviceHandle *USBDeviceHandle::GetNative()
{
    if (!m_handle) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Device handle is closed");
    }

    return m_handle.get();
}

void USBDeviceHandle::RegisterTransfer(USBTransfer *transfer)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_transfers.insert(transfer);
}

void USBDeviceHandle::UnregisterTransfer(USBTransfer *transfer)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_transfers.erase(transfer);
}

std::vector<USBTransfer *> USBDeviceHandle::GetTransfers()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<USBTransfer *>(m_transfers.begin(), m_transfers.end());
}

int USBDeviceHandle::GetConfiguration()
{
    int config = 0;
    USBCheck(GetNative()->GetConfiguration(&config), "Failed to get configuration");

    return config;
}

void USBDeviceHandle::SetConfiguration(int config)
{
    USBCheck(GetNative()->SetConfiguration(config), "Failed to set configuration");
}

void USBDeviceHandle::ClaimInterface(int interface)
{
    USB1_LOG;

    int ret = GetNative()->ClaimInterface(interface);
    if (ret < 0) {
        log(USB1_LOG_LEVEL_ERROR) << "Failed to claim interface " << interface << ": " << USBErrorName(ret) << endLog;
        throw USBError(ret, "Failed to claim interface");
    }
}

void USBDeviceHandle::ReleaseInterface(int interface)
{
    USBCheck(GetNative()->ReleaseInterface(interface), "Failed to release interface");
}

void USBDeviceHandle::SetInterfaceAltSetting(int interface, int altSetting)
{
    USBCheck(GetNative()->SetInterfaceAltSetting(interface, altSetting), "Failed to set alternate setting");
}

void USBDeviceHandle::ClearHalt(uint8_t endpoint)
{
    USBCheck(GetNative()->ClearHalt(endpoint), "Failed to clear halt");
}

void USBDeviceHandle::ResetDevice()
{
    USBCheck(GetNative()->ResetDevice(), "Failed to reset device");
}

bool USBDeviceHandle::KernelDriverActive(int interface)
{
    return USBCheck(GetNative()->KernelDriverActive(interface), "Failed to query kernel driver") == 1;
}

void USBDeviceHandle::DetachKernelDriver(int interface)
{
    USB1_LOG;

    int ret = GetNative()->DetachKernelDriver(interface);
    if (ret < 0) {
        if (ret == USB1_ERROR_NOT_FOUND || ret == USB1_ERROR_NOT_SUPPORTED) {
            log(USB1_LOG_LEVEL_INFO) << "Failed to detach kernel driver: " << USBErrorName(ret) << endLog;
        } else {
            log(USB1_LOG_LEVEL_ERROR) << "Failed to detach kernel driver: " << USBErrorName(ret) << endLog;
        }
        throw USBError(ret, "Failed to detach kernel driver");
    }
}

void USBDeviceHandle::AttachKernelDriver(int interface)
{
    USBCheck(GetNative()->AttachKernelDriver(interface), "Failed to attach kernel driver");
}

void USBDeviceHandle::SetAutoDetachKernelDriver(bool enable)
{
    USBCheck(GetNative()->SetAutoDetachKernelDriver(enable), "Failed to set kernel driver auto detach");
}

std::vector<uint16_t> USBDeviceHandle::GetSupportedLanguageList()
{
    uint8_t descriptor[stringDescriptorLength];
    std::vector<uint16_t> languages;

    int ret = GetNative()->GetStringDescriptor(0, 0, descriptor, sizeof(descriptor));
    if (ret == USB1_ERROR_PIPE) {
        // The device does not support string requests
        return languages;
    }
    USBCheck(ret, "Failed to get supported languages");

    int length = std::min(ret, static_cast<int>(descriptor[0]));
    for (int i = 2; i + 1 < length; i += 2) {
        languages.push_back(static_cast<uint16_t>(descriptor[i] | (descriptor[i + 1] << 8)));
    }

    return languages;
}

static void AppendUTF8(std::string &out, uint32_t codePoint)
{
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xc0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3f));
    } else if (codePoint < 0x10000) {
        out += static_cast<char>(0xe0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (codePoint & 0x3f));
    } else {
        out += static_cast<char>(0xf0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3f));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (codePoint & 0x3f));
    }
}

static std::string DecodeUTF16LE(const uint8_t *data, int length)
{
    std::string out;

    for (int i = 0; i + 1 < length; i += 2) {
        uint32_t unit = data[i] | (data[i + 1] << 8);
        if (unit >= 0xd800 && unit < 0xdc00 && i + 3 < length) {
            uint32_t low = data[i + 2] | (data[i + 3] << 8);
            if (low >= 0xdc00 && low < 0xe000) {
                AppendUTF8(out, 0x10000 + ((unit - 0xd800) << 10) + (low - 0xdc00));
                i += 2;
                continue;
            }
        }
        if (unit >= 0xd800 && unit < 0xe000) {
            throw USBError(USB1_ERROR_IO, "Invalid UTF-16 in string descriptor");
        }
        AppendUTF8(out, unit);
    }

    return out;
}

std::string USBDeviceHandle::GetStringDescriptor(uint8_t index, uint16_t langId)
{
    USB1_LOG;

    if (index == 0) {
        return std::string();
    }

    uint8_t descriptor[stringDescriptorLength];
    int ret = GetNative()->GetStringDescriptor(index, langId, descriptor, sizeof(descriptor));
    if (ret == USB1_ERROR_NOT_FOUND) {
        return std::string();
    }
    USBCheck(ret, "Failed to get string descriptor");

    if (ret < 2 || descriptor[1] != USB1_DT_STRING) {
        log(USB1_LOG_LEVEL_ERROR) << "Invalid string descriptor " << static_cast<int>(index) << endLog;
        throw USBError(USB1_ERROR_IO, "Invalid string descriptor");
    }

    int length = std::min(ret, static_cast<int>(descriptor[0]));

    return DecodeUTF16LE(descriptor + 2, length - 2);
}

std::string USBDeviceHandle::GetASCIIStringDescriptor(uint8_t index)
{
    if (index == 0) {
        return std::string();
    }

    uint8_t descriptor[stringDescriptorLength];
    int ret = GetNative()->GetStringDescriptorAscii(index, descriptor, sizeof(descriptor));
    if (ret == USB1_ERROR_NOT_FOUND) {
        return std::string();
    }
    USBCheck(ret, "Failed to get string descriptor");

    return std::string(descriptor, descriptor + ret);
}

std::string USBDeviceHandle::GetManufacturer()
{
    return GetASCIIStringDescriptor(m_device.GetDeviceDescriptor().iManufacturer);
}

std::string USBDeviceHandle::GetProduct()
{
    return GetASCIIStringDescriptor(m_device.GetDeviceDescriptor().iProduct);
}

std::string USBDeviceHandle::GetSerialNumber()
{
    return GetASCIIStringDescriptor(m_device.GetDeviceDescriptor().iSerialNumber);
}

std::unique_ptr<USBTransfer> USBDeviceHandle::GetTransfer(int isoPackets, bool shortIsError, bool addZeroPacket)
{
    USB1_LOG;

    if (isoPackets < 0) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "Negative isochronous packet count");
    }
    if (m_context == nullptr || !m_context->IsOpen()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Context is not open");
    }

    std::unique_ptr<USBNativeTransfer> native = GetNative()->AllocTransfer(isoPackets);
    if (!native) {
        log(USB1_LOG_LEVEL_ERROR) << "Failed to allocate transfer" << endLog;
        throw USBError(USB1_ERROR_NO_MEM, "Failed to allocate transfer");
    }

    std::unique_ptr<USBTransfer> transfer(new USBTransfer(m_context, this, std::move(native), isoPackets,
        shortIsError, addZeroPacket));
    m_context->RegisterTransfer(transfer.get());
    RegisterTransfer(transfer.get());

    return transfer;
}

void USBDeviceHandle::CancelAndWait(USBTransfer *transfer, std::atomic<bool> *completed)
{
    USB1_LOG;

    try {
        transfer->Cancel();
    } catch (const USBError &e) {
        log(USB1_LOG_LEVEL_DEBUG) << "Failed to cancel transfer: " << e.what() << endLog;
    }

    while (transfer->IsSubmitted() && m_context != nullptr && m_context->IsOpen()) {
        try {
            m_context->HandleEventsCompleted(completed);
        } catch (const USBError &e) {
            if (e.GetCode() != USB1_ERROR_INTERRUPTED) {
                log(USB1_LOG_LEVEL_WARNING) << "Failed to wait for cancelled transfer: " << e.what() << endLog;
                break;
            }
        }
    }
}

void USBDeviceHandle::RunTransfer(USBTransfer *transfer, bool isRead)
{
    USB1_LOG;

    std::atomic<bool> completed(false);
    transfer->SetCallback([&completed](USBTransfer *) {
        completed.store(true);
    });

    transfer->Submit();

    try {
        while (!completed.load()) {
            try {
                m_context->HandleEventsCompleted(&completed);
            } catch (const USBError &e) {
                if (e.GetCode() != USB1_ERROR_INTERRUPTED) {
                    throw;
                }
            }
        }
    } catch (...) {
        CancelAndWait(transfer, &completed);
        throw;
    }

    int status = transfer->GetStatus();
    switch (status) {
    case USB1_TRANSFER_COMPLETED:
        return;
    case USB1_TRANSFER_TIMED_OUT: {
        std::vector<uint8_t> received;
        size_t actualLength = transfer->GetActualLength();
        if (isRead) {
            received = transfer->GetBuffer();
            received.resize(std::min(actualLength, received.size()));
        }
        log(USB1_LOG_LEVEL_DEBUG) << "Transfer timed out after " << actualLength << " bytes" << endLog;
        throw USBTimeoutError("Transfer timed out", actualLength, std::move(received));
    }
    case USB1_TRANSFER_STALL:
        throw USBError(USB1_ERROR_PIPE, "Endpoint stalled");
    case USB1_TRANSFER_NO_DEVICE:
        throw USBError(USB1_ERROR_NO_DEVICE, "Device is gone");
    case USB1_TRANSFER_OVERFLOW:
        throw USBError(USB1_ERROR_OVERFLOW, "Device sent more data than requested");
    default:
        log(USB1_LOG_LEVEL_ERROR) << "Transfer failed: " << USBTransferStatusName(status) << endLog;
        throw USBError(USB1_ERROR_IO, "Transfer failed");
    }
}

size_t USBDeviceHandle::ControlWrite(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
    const std::vector<uint8_t> &data, unsigned int timeout)
{
    std::unique_ptr<USBTransfer> transfer = GetTransfer();
    transfer->SetControl(static_cast<uint8_t>(requestType & ~USB1_ENDPOINT_DIR_MASK), request, value, index, data, nullptr,
        std::any(), timeout);
    RunTransfer(transfer.get(), false);

    return transfer->GetActualLength();
}

std::vector<uint8_t> USBDeviceHandle::ControlRead(uint8_t requestType, uint8_t request, uint16_t value,
    uint16_t index, uint16_t length, unsigned int timeout)
{
    std::unique_ptr<USBTransfer> transfer = GetTransfer();
    transfer->SetControl(static_cast<uint8_t>(requestType | USB1_ENDPOINT_IN), request, value, index, length, nullptr, std::any(),
        timeout);
    RunTransfer(transfer.get(), true);

    std::vector<uint8_t> data = transfer->GetBuffer();
    data.resize(std::min(transfer->GetActualLength(), data.size()));

    return data;
}

size_t USBDeviceHandle::BulkWrite(uint8_t endpoint, const std::vector<uint8_t> &data, unsigned int timeout)
{
    std::unique_ptr<USBTransfer> transfer = GetTransfer();
    transfer->SetBulk(static_cast<uint8_t>(endpoint & ~USB1_ENDPOINT_DIR_MASK), data, nullptr, std::any(), timeout);
    RunTransfer(transfer.get(), false);

    return transfer->GetActualLength();
}

std::vector<uint8_t> USBDeviceHandle::BulkRead(uint8_t endpoint, size_t length, unsigned int timeout)
{
    std::unique_ptr<USBTransfer> transfer = GetTransfer();
    transfer->SetBulk(static_cast<uint8_t>(endpoint | USB1_ENDPOINT_IN), length, nullptr, std::any(), timeout);
    RunTransfer(transfer.get(), true);

    std::vector<uint8_t> data = transfer->GetBuffer();
    data.resize(std::min(transfer->GetActualLength(), data.size()));

    return data;
}

size_t USBDeviceHandle::InterruptWrite(uint8_t endpoint, const std::vector<uint8_t> &data, unsigned int timeout)
{
    std::unique_ptr<USBTransfer> transfer = GetTransfer();
    transfer->SetInterrupt(static_cast<uint8_t>(endpoint & ~USB1_ENDPOINT_DIR_MASK), data, nullptr, std::any(), timeout);
    RunTransfer(transfer.get(), false);

    return transfer->GetActualLength();
}

std::vector<uint8_t> USBDeviceHandle::InterruptRead(uint8_t endpoint, size_t length, unsigned int timeout)
{
    std::unique_ptr<USBTransfer> transfer = GetTransfer();
    transfer->SetInterrupt(static_cast<uint8_t>(endpoint | USB1_ENDPOINT_IN), length, nullptr, std::any(), timeout);
    RunTransfer(transfer.get(), true);

    std::vector<uint8_t> data = transfer->GetBuffer();
    data.resize(std::min(transfer->GetActualLength(), data.size()));

    return data;
}

USBInterfaceClaim::USBInterfaceClaim(USBDeviceHandle *handle, int interface)
    : m_handle(handle), m_interface(interface)
{
    m_handle->ClaimInterface(m_interface);
}

USBInterfaceClaim::~USBInterfaceClaim()
{
    USB1_LOG;

    try {
        m_handle->ReleaseInterface(m_interface);
    } catch (const USBError &e) {
        log(USB1_LOG_LEVEL_WARNING) << "Failed to release interface " << m_interface << ": " << e.what() << endLog;
    }
}
