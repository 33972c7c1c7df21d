#include <sys/time.h>
#include <vector>

#include "libusb_backend.hpp"
#include "usb_constants.hpp"
#include "usb_error.hpp"
#include "usb_log.hpp"

// USB 3.0 allows up to 7 tiers of hubs
static const int maxPortDepth = 7;

// libusb_set_log_cb() has no user data, context log messages are routed
// through this table.
static std::mutex logBackendsMutex;
static std::map<libusb_context *, LibUSBBackend *> logBackends;

static struct timeval ToTimeval(std::chrono::microseconds timeout)
{
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000000);
    tv.tv_usec = static_cast<suseconds_t>(timeout.count() % 1000000);
    return tv;
}

static std::vector<uint8_t> CopyExtra(const unsigned char *extra, int length)
{
    if (extra == nullptr || length <= 0) {
        return std::vector<uint8_t>();
    }

    return std::vector<uint8_t>(extra, extra + length);
}

LibUSBTransfer::LibUSBTransfer(std::shared_ptr<libusb_device_handle> handle, libusb_transfer *transfer,
    int maxIsoPackets)
    : USBNativeTransfer(maxIsoPackets), m_handle(std::move(handle)), m_transfer(transfer)
{}

LibUSBTransfer::~LibUSBTransfer()
{
    libusb_free_transfer(m_transfer);
}

int LibUSBTransfer::Submit()
{
    m_transfer->dev_handle = m_handle.get();
    m_transfer->flags = flags;
    m_transfer->endpoint = endpoint;
    m_transfer->type = type;
    m_transfer->timeout = timeout;
    m_transfer->length = static_cast<int>(buffer.size());
    m_transfer->buffer = buffer.empty() ? nullptr : buffer.data();
    m_transfer->num_iso_packets = numIsoPackets;
    for (int i = 0; i < numIsoPackets; ++i) {
        m_transfer->iso_packet_desc[i].length = isoPackets[i].length;
    }
    m_transfer->callback = HandleTransferCompletion;
    m_transfer->user_data = this;

    return libusb_submit_transfer(m_transfer);
}

int LibUSBTransfer::Cancel()
{
    return libusb_cancel_transfer(m_transfer);
}

void LibUSBTransfer::HandleTransferCompletion(libusb_transfer *transfer)
{
    LibUSBTransfer *self = static_cast<LibUSBTransfer *>(transfer->user_data);

    self->status = transfer->status;
    self->actualLength = transfer->actual_length;
    for (int i = 0; i < transfer->num_iso_packets; ++i) {
        self->isoPackets[i].actualLength = transfer->iso_packet_desc[i].actual_length;
        self->isoPackets[i].status = transfer->iso_packet_desc[i].status;
    }

    // The callback may free this record
    if (self->callback != nullptr) {
        self->callback(self);
    }
}

int LibUSBDeviceHandle::GetConfiguration(int *config)
{
    return libusb_get_configuration(m_handle.get(), config);
}

int LibUSBDeviceHandle::SetConfiguration(int config)
{
    return libusb_set_configuration(m_handle.get(), config);
}

int LibUSBDeviceHandle::ClaimInterface(int interface)
{
    return libusb_claim_interface(m_handle.get(), interface);
}

int LibUSBDeviceHandle::ReleaseInterface(int interface)
{
    return libusb_release_interface(m_handle.get(), interface);
}

int LibUSBDeviceHandle::SetInterfaceAltSetting(int interface, int altSetting)
{
    return libusb_set_interface_alt_setting(m_handle.get(), interface, altSetting);
}

int LibUSBDeviceHandle::ClearHalt(uint8_t endpoint)
{
    return libusb_clear_halt(m_handle.get(), endpoint);
}

int LibUSBDeviceHandle::ResetDevice()
{
    return libusb_reset_device(m_handle.get());
}

int LibUSBDeviceHandle::KernelDriverActive(int interface)
{
    return libusb_kernel_driver_active(m_handle.get(), interface);
}

int LibUSBDeviceHandle::DetachKernelDriver(int interface)
{
    return libusb_detach_kernel_driver(m_handle.get(), interface);
}

int LibUSBDeviceHandle::AttachKernelDriver(int interface)
{
    return libusb_attach_kernel_driver(m_handle.get(), interface);
}

int LibUSBDeviceHandle::SetAutoDetachKernelDriver(bool enable)
{
    return libusb_set_auto_detach_kernel_driver(m_handle.get(), enable ? 1 : 0);
}

int LibUSBDeviceHandle::GetStringDescriptor(uint8_t index, uint16_t langId, uint8_t *data, int length)
{
    return libusb_get_string_descriptor(m_handle.get(), index, langId, data, length);
}

int LibUSBDeviceHandle::GetStringDescriptorAscii(uint8_t index, uint8_t *data, int length)
{
    return libusb_get_string_descriptor_ascii(m_handle.get(), index, data, length);
}

std::unique_ptr<USBNativeTransfer> LibUSBDeviceHandle::AllocTransfer(int isoPackets)
{
    libusb_transfer *transfer = libusb_alloc_transfer(isoPackets);
    if (transfer == nullptr) {
        return nullptr;
    }

    return std::unique_ptr<USBNativeTransfer>(new LibUSBTransfer(m_handle, transfer, isoPackets));
}

LibUSBDevice::LibUSBDevice(LibUSBContextPtr ctx, libusb_device *device)
    : m_ctx(std::move(ctx)), m_device(libusb_ref_device(device))
{}

LibUSBDevice::~LibUSBDevice()
{
    libusb_unref_device(m_device);
}

int LibUSBDevice::GetDeviceDescriptor(USBDeviceDescriptor *descriptor)
{
    libusb_device_descriptor desc;
    int ret = libusb_get_device_descriptor(m_device, &desc);
    if (ret < 0) {
        return ret;
    }

    descriptor->bLength = desc.bLength;
    descriptor->bDescriptorType = desc.bDescriptorType;
    descriptor->bcdUSB = desc.bcdUSB;
    descriptor->bDeviceClass = desc.bDeviceClass;
    descriptor->bDeviceSubClass = desc.bDeviceSubClass;
    descriptor->bDeviceProtocol = desc.bDeviceProtocol;
    descriptor->bMaxPacketSize0 = desc.bMaxPacketSize0;
    descriptor->idVendor = desc.idVendor;
    descriptor->idProduct = desc.idProduct;
    descriptor->bcdDevice = desc.bcdDevice;
    descriptor->iManufacturer = desc.iManufacturer;
    descriptor->iProduct = desc.iProduct;
    descriptor->iSerialNumber = desc.iSerialNumber;
    descriptor->bNumConfigurations = desc.bNumConfigurations;

    return LIBUSB_SUCCESS;
}

int LibUSBDevice::GetConfiguration(uint8_t index, USBConfiguration *config)
{
    libusb_config_descriptor *desc = nullptr;
    int ret = libusb_get_config_descriptor(m_device, index, &desc);
    if (ret < 0) {
        return ret;
    }

    config->bLength = desc->bLength;
    config->bDescriptorType = desc->bDescriptorType;
    config->wTotalLength = desc->wTotalLength;
    config->bNumInterfaces = desc->bNumInterfaces;
    config->bConfigurationValue = desc->bConfigurationValue;
    config->iConfiguration = desc->iConfiguration;
    config->bmAttributes = desc->bmAttributes;
    config->MaxPower = desc->MaxPower;
    config->extra = CopyExtra(desc->extra, desc->extra_length);
    config->interfaces.clear();

    for (int i = 0; i < desc->bNumInterfaces; ++i) {
        const libusb_interface &interface = desc->interface[i];
        USBInterface usbInterface;

        for (int j = 0; j < interface.num_altsetting; ++j) {
            const libusb_interface_descriptor &altsetting = interface.altsetting[j];
            USBInterfaceSetting setting;
            setting.bLength = altsetting.bLength;
            setting.bDescriptorType = altsetting.bDescriptorType;
            setting.bInterfaceNumber = altsetting.bInterfaceNumber;
            setting.bAlternateSetting = altsetting.bAlternateSetting;
            setting.bNumEndpoints = altsetting.bNumEndpoints;
            setting.bInterfaceClass = altsetting.bInterfaceClass;
            setting.bInterfaceSubClass = altsetting.bInterfaceSubClass;
            setting.bInterfaceProtocol = altsetting.bInterfaceProtocol;
            setting.iInterface = altsetting.iInterface;
            setting.extra = CopyExtra(altsetting.extra, altsetting.extra_length);

            for (int k = 0; k < altsetting.bNumEndpoints; ++k) {
                const libusb_endpoint_descriptor &endpoint = altsetting.endpoint[k];
                USBEndpointDescriptor usbEndpoint;
                usbEndpoint.bLength = endpoint.bLength;
                usbEndpoint.bDescriptorType = endpoint.bDescriptorType;
                usbEndpoint.bEndpointAddress = endpoint.bEndpointAddress;
                usbEndpoint.bmAttributes = endpoint.bmAttributes;
                usbEndpoint.wMaxPacketSize = endpoint.wMaxPacketSize;
                usbEndpoint.bInterval = endpoint.bInterval;
                usbEndpoint.bRefresh = endpoint.bRefresh;
                usbEndpoint.bSynchAddress = endpoint.bSynchAddress;
                usbEndpoint.extra = CopyExtra(endpoint.extra, endpoint.extra_length);
                setting.endpoints.push_back(std::move(usbEndpoint));
            }

            usbInterface.altsettings.push_back(std::move(setting));
        }

        config->interfaces.push_back(std::move(usbInterface));
    }

    libusb_free_config_descriptor(desc);

    return LIBUSB_SUCCESS;
}

uint8_t LibUSBDevice::GetBusNumber()
{
    return libusb_get_bus_number(m_device);
}

uint8_t LibUSBDevice::GetPortNumber()
{
    return libusb_get_port_number(m_device);
}

int LibUSBDevice::GetPortNumbers(std::vector<uint8_t> *ports)
{
    uint8_t portNumbers[maxPortDepth];
    int ret = libusb_get_port_numbers(m_device, portNumbers, maxPortDepth);
    if (ret < 0) {
        return ret;
    }

    ports->assign(portNumbers, portNumbers + ret);

    return ret;
}

uint8_t LibUSBDevice::GetDeviceAddress()
{
    return libusb_get_device_address(m_device);
}

int LibUSBDevice::GetDeviceSpeed()
{
    return libusb_get_device_speed(m_device);
}

int LibUSBDevice::GetMaxPacketSize(uint8_t endpoint)
{
    return libusb_get_max_packet_size(m_device, endpoint);
}

int LibUSBDevice::GetMaxIsoPacketSize(uint8_t endpoint)
{
    return libusb_get_max_iso_packet_size(m_device, endpoint);
}

int LibUSBDevice::Open(std::unique_ptr<USBNativeDeviceHandle> *handle)
{
    libusb_device_handle *rawHandle = nullptr;
    int ret = libusb_open(m_device, &rawHandle);
    if (ret < 0) {
        return ret;
    }

    LibUSBContextPtr ctx = m_ctx;
    std::shared_ptr<libusb_device_handle> sharedHandle(rawHandle, [ctx](libusb_device_handle *h) {
        libusb_close(h);
    });
    handle->reset(new LibUSBDeviceHandle(sharedHandle));

    return LIBUSB_SUCCESS;
}

LibUSBBackend::LibUSBBackend()
{}

LibUSBBackend::~LibUSBBackend()
{
    USB1_LOG;

    if (!m_ctx) {
        return;
    }

    std::map<int, std::shared_ptr<HotplugRegistration>> registrations;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        registrations.swap(m_hotplugRegistrations);
    }
    for (auto &entry : registrations) {
        if (!entry.second->finished.load()) {
            libusb_hotplug_deregister_callback(m_ctx.get(), entry.first);
        }
    }

    libusb_set_pollfd_notifiers(m_ctx.get(), nullptr, nullptr, nullptr);

    {
        std::lock_guard<std::mutex> lock(logBackendsMutex);
        logBackends.erase(m_ctx.get());
    }

    log(USB1_LOG_LEVEL_DEBUG) << "Releasing libusb context" << endLog;
    m_ctx.reset();
}

int LibUSBBackend::Init(const USBContextOptions &options)
{
    USB1_LOG;

    int ret;

    if (!options.withDeviceDiscovery) {
        // Only applies to contexts created afterwards
        ret = libusb_set_option(nullptr, LIBUSB_OPTION_NO_DEVICE_DISCOVERY);
        if (ret < 0) {
            log(USB1_LOG_LEVEL_ERROR) << "Failed to disable device discovery: " << libusb_error_name(ret) << endLog;
            return ret;
        }
    }

    libusb_context *ctx = nullptr;
    ret = libusb_init(&ctx);
    if (ret < 0) {
        log(USB1_LOG_LEVEL_ERROR) << "Failed to initialize libusb: " << libusb_error_name(ret) << endLog;
        return ret;
    }
    m_ctx = LibUSBContextPtr(ctx, libusb_exit);

    {
        std::lock_guard<std::mutex> lock(logBackendsMutex);
        logBackends[ctx] = this;
    }
    m_logCallback = options.logCallback;
    libusb_set_log_cb(ctx, HandleLogMessage, LIBUSB_LOG_CB_CONTEXT);

    if (options.nativeLogLevel >= 0) {
        libusb_set_option(ctx, LIBUSB_OPTION_LOG_LEVEL, options.nativeLogLevel);
    }

    if (options.useUsbDk) {
        ret = libusb_set_option(ctx, LIBUSB_OPTION_USE_USBDK);
        if (ret < 0) {
            if (ret == LIBUSB_ERROR_NOT_SUPPORTED) {
                log(USB1_LOG_LEVEL_INFO) << "UsbDk is not available on this platform" << endLog;
            } else {
                log(USB1_LOG_LEVEL_ERROR) << "Failed to enable UsbDk: " << libusb_error_name(ret) << endLog;
                return ret;
            }
        }
    }

    if (libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG)) {
        log(USB1_LOG_LEVEL_DEBUG) << "Hotplug is supported" << endLog;
    } else {
        log(USB1_LOG_LEVEL_DEBUG) << "Hotplug is NOT supported" << endLog;
    }

    return LIBUSB_SUCCESS;
}

int LibUSBBackend::GetDeviceList(std::vector<std::shared_ptr<USBNativeDevice>> *devices)
{
    USB1_LOG;

    libusb_device **deviceList;
    ssize_t count = libusb_get_device_list(m_ctx.get(), &deviceList);
    if (count < 0) {
        log(USB1_LOG_LEVEL_ERROR) << "Failed to get device list: " << libusb_error_name(count) << endLog;
        return static_cast<int>(count);
    }

    devices->clear();
    for (ssize_t i = 0; i < count; ++i) {
        devices->push_back(std::make_shared<LibUSBDevice>(m_ctx, deviceList[i]));
    }

    libusb_free_device_list(deviceList, 1);

    return LIBUSB_SUCCESS;
}

int LibUSBBackend::WrapSysDevice(intptr_t sysDevice, std::shared_ptr<USBNativeDevice> *device,
    std::unique_ptr<USBNativeDeviceHandle> *handle)
{
    libusb_device_handle *rawHandle = nullptr;
    int ret = libusb_wrap_sys_device(m_ctx.get(), sysDevice, &rawHandle);
    if (ret < 0) {
        return ret;
    }

    LibUSBContextPtr ctx = m_ctx;
    std::shared_ptr<libusb_device_handle> sharedHandle(rawHandle, [ctx](libusb_device_handle *h) {
        libusb_close(h);
    });

    *device = std::make_shared<LibUSBDevice>(m_ctx, libusb_get_device(rawHandle));
    handle->reset(new LibUSBDeviceHandle(sharedHandle));

    return LIBUSB_SUCCESS;
}

std::vector<USBPollFD> LibUSBBackend::GetPollFDs()
{
    std::vector<USBPollFD> pollFDs;

    const libusb_pollfd **list = libusb_get_pollfds(m_ctx.get());
    if (list == nullptr) {
        return pollFDs;
    }

    for (const libusb_pollfd **it = list; *it != nullptr; ++it) {
        USBPollFD pollFD;
        pollFD.fd = (*it)->fd;
        pollFD.events = (*it)->events;
        pollFDs.push_back(pollFD);
    }

    libusb_free_pollfds(list);

    return pollFDs;
}

void LibUSBBackend::SetPollFDNotifiers(PollFDAddedCallback added, PollFDRemovedCallback removed)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pollFDAdded = std::move(added);
        m_pollFDRemoved = std::move(removed);
    }

    if (!m_ctx) {
        return;
    }

    libusb_set_pollfd_notifiers(m_ctx.get(), HandlePollFDAdded, HandlePollFDRemoved, this);
}

void LibUSBBackend::HandlePollFDAdded(int fd, short events, void *userData)
{
    LibUSBBackend *backend = static_cast<LibUSBBackend *>(userData);

    PollFDAddedCallback callback;
    {
        std::lock_guard<std::mutex> lock(backend->m_mutex);
        callback = backend->m_pollFDAdded;
    }

    if (callback) {
        callback(fd, events);
    }
}

void LibUSBBackend::HandlePollFDRemoved(int fd, void *userData)
{
    LibUSBBackend *backend = static_cast<LibUSBBackend *>(userData);

    PollFDRemovedCallback callback;
    {
        std::lock_guard<std::mutex> lock(backend->m_mutex);
        callback = backend->m_pollFDRemoved;
    }

    if (callback) {
        callback(fd);
    }
}

int LibUSBBackend::GetNextTimeout(std::chrono::microseconds *timeout)
{
    struct timeval tv;
    int ret = libusb_get_next_timeout(m_ctx.get(), &tv);
    if (ret == 1) {
        *timeout = std::chrono::seconds(tv.tv_sec) + std::chrono::microseconds(tv.tv_usec);
    }

    return ret;
}

int LibUSBBackend::HandleEvents(std::chrono::microseconds timeout)
{
    struct timeval tv = ToTimeval(timeout);

    return libusb_handle_events_timeout_completed(m_ctx.get(), &tv, nullptr);
}

void LibUSBBackend::InterruptEventHandler()
{
    if (m_ctx) {
        libusb_interrupt_event_handler(m_ctx.get());
    }
}

int LibUSBBackend::HandleHotplugEvent(libusb_context *ctx, libusb_device *device, libusb_hotplug_event event,
    void *userData)
{
    std::shared_ptr<HotplugRegistration> registration =
        static_cast<HotplugRegistration *>(userData)->weak_from_this().lock();
    if (!registration || registration->finished.load()) {
        return 0;
    }

    std::shared_ptr<USBNativeDevice> nativeDevice =
        std::make_shared<LibUSBDevice>(registration->backend->m_ctx, device);
    if (registration->callback(nativeDevice, event)) {
        registration->finished.store(true);
        return 1;
    }

    return 0;
}

void LibUSBBackend::ReapHotplugRegistrations()
{
    std::vector<std::shared_ptr<HotplugRegistration>> reaped;
    std::lock_guard<std::mutex> lock(m_mutex);

    for (auto it = m_hotplugRegistrations.begin(); it != m_hotplugRegistrations.end();) {
        if (it->second->finished.load()) {
            reaped.push_back(std::move(it->second));
            it = m_hotplugRegistrations.erase(it);
        } else {
            ++it;
        }
    }
}

int LibUSBBackend::HotplugRegister(int events, int flags, int vendorId, int productId, int deviceClass,
    HotplugCallback callback, int *handle)
{
    USB1_LOG;

    ReapHotplugRegistrations();

    std::shared_ptr<HotplugRegistration> registration = std::make_shared<HotplugRegistration>();
    registration->backend = this;
    registration->callback = std::move(callback);
    registration->finished.store(false);

    // Enumerated devices are reported from inside the call, without the lock held
    libusb_hotplug_callback_handle callbackHandle;
    int ret = libusb_hotplug_register_callback(m_ctx.get(), events, flags, vendorId, productId, deviceClass,
        HandleHotplugEvent, registration.get(), &callbackHandle);
    if (ret != LIBUSB_SUCCESS) {
        log(USB1_LOG_LEVEL_ERROR) << "Failed to register hotplug callback: " << libusb_error_name(ret) << endLog;
        return ret;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_hotplugRegistrations[callbackHandle] = registration;
    }
    *handle = callbackHandle;

    return LIBUSB_SUCCESS;
}

void LibUSBBackend::HotplugDeregister(int handle)
{
    std::shared_ptr<HotplugRegistration> registration;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_hotplugRegistrations.find(handle);
        if (it == m_hotplugRegistrations.end()) {
            return;
        }
        registration = std::move(it->second);
        m_hotplugRegistrations.erase(it);
    }

    if (!registration->finished.exchange(true)) {
        libusb_hotplug_deregister_callback(m_ctx.get(), handle);
    }
}

bool LibUSBBackend::HasCapability(uint32_t capability)
{
    return libusb_has_capability(capability) != 0;
}

void LibUSBBackend::SetLogLevel(int level)
{
    libusb_set_option(m_ctx.get(), LIBUSB_OPTION_LOG_LEVEL, level);
}

void LibUSBBackend::SetLogCallback(USBNativeLogCallback callback)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_logCallback = std::move(callback);
}

void LibUSBBackend::ForwardLogMessage(int level, const char *message)
{
    USB1_LOG;

    std::string text(message != nullptr ? message : "");
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }

    USBLogLevel logLevel;
    switch (level) {
        case LIBUSB_LOG_LEVEL_ERROR:
            logLevel = USB1_LOG_LEVEL_ERROR;
            break;
        case LIBUSB_LOG_LEVEL_WARNING:
            logLevel = USB1_LOG_LEVEL_WARNING;
            break;
        case LIBUSB_LOG_LEVEL_INFO:
            logLevel = USB1_LOG_LEVEL_INFO;
            break;
        default:
            logLevel = USB1_LOG_LEVEL_DEBUG;
            break;
    }
    log(logLevel) << "libusb: " << text << endLog;

    USBNativeLogCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callback = m_logCallback;
    }
    if (callback) {
        callback(level, text);
    }
}

void LibUSBBackend::HandleLogMessage(libusb_context *ctx, enum libusb_log_level level, const char *message)
{
    LibUSBBackend *backend = nullptr;
    {
        std::lock_guard<std::mutex> lock(logBackendsMutex);
        auto it = logBackends.find(ctx);
        if (it != logBackends.end()) {
            backend = it->second;
        }
    }

    if (backend != nullptr) {
        backend->ForwardLogMessage(level, message);
    }
}

std::unique_ptr<USBBackend> CreateLibUSBBackend()
{
    return std::unique_ptr<USBBackend>(new LibUSBBackend());
}

USBVersion USBGetVersion()
{
    const libusb_version *version = libusb_get_version();

    USBVersion result;
    result.major = version->major;
    result.minor = version->minor;
    result.micro = version->micro;
    result.nano = version->nano;
    result.rc = version->rc != nullptr ? version->rc : "";

    return result;
}

bool USBHasCapability(uint32_t capability)
{
    return libusb_has_capability(capability) != 0;
}

int USBSetLocale(const std::string &locale)
{
    return libusb_setlocale(locale.c_str());
}
