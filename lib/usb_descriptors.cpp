#include <utility>

#include "usb_descriptors.hpp"
#include "usb_error.hpp"
#include "usb_log.hpp"

static uint16_t ReadLE16(const uint8_t *data)
{
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

static bool IsStructuralDescriptor(uint8_t type)
{
    return type == USB1_DT_DEVICE || type == USB1_DT_CONFIG
        || type == USB1_DT_INTERFACE || type == USB1_DT_ENDPOINT;
}

// Appends every descriptor up to the next structural one to extra.
static size_t CollectExtra(const uint8_t *data, size_t size, size_t pos, std::vector<uint8_t> *extra)
{
    USB1_LOG;

    while (pos + 2 <= size) {
        uint8_t length = data[pos];
        uint8_t type = data[pos + 1];

        if (length < 2) {
            log(USB1_LOG_LEVEL_ERROR) << "Invalid descriptor length " << static_cast<int>(length)
                << " at offset " << pos << endLog;
            throw USBError(USB1_ERROR_IO, "Invalid descriptor length");
        }
        if (IsStructuralDescriptor(type)) {
            break;
        }
        if (pos + length > size) {
            log(USB1_LOG_LEVEL_ERROR) << "Short extra descriptor: need " << static_cast<int>(length) << " bytes, have "
                << (size - pos) << endLog;
            throw USBError(USB1_ERROR_IO, "Short extra descriptor");
        }

        extra->insert(extra->end(), data + pos, data + pos + length);
        pos += length;
    }

    return pos;
}

static size_t ParseEndpoint(const uint8_t *data, size_t size, size_t pos, USBEndpointDescriptor *endpoint)
{
    USB1_LOG;

    if (pos + 2 > size || data[pos + 1] != USB1_DT_ENDPOINT) {
        log(USB1_LOG_LEVEL_ERROR) << "Expected an endpoint descriptor at offset " << pos << endLog;
        throw USBError(USB1_ERROR_IO, "Missing endpoint descriptor");
    }

    uint8_t length = data[pos];
    if (length < USB1_DT_ENDPOINT_SIZE || pos + length > size) {
        log(USB1_LOG_LEVEL_ERROR) << "Invalid endpoint descriptor length " << static_cast<int>(length) << endLog;
        throw USBError(USB1_ERROR_IO, "Invalid endpoint descriptor");
    }

    const uint8_t *desc = data + pos;
    endpoint->bLength = desc[0];
    endpoint->bDescriptorType = desc[1];
    endpoint->bEndpointAddress = desc[2];
    endpoint->bmAttributes = desc[3];
    endpoint->wMaxPacketSize = ReadLE16(desc + 4);
    endpoint->bInterval = desc[6];
    if (length >= USB1_DT_ENDPOINT_AUDIO_SIZE) {
        endpoint->bRefresh = desc[7];
        endpoint->bSynchAddress = desc[8];
    }

    return CollectExtra(data, size, pos + length, &endpoint->extra);
}

static size_t ParseInterface(const uint8_t *data, size_t size, size_t pos, USBInterface *interface)
{
    USB1_LOG;

    do {
        uint8_t length = data[pos];
        if (data[pos + 1] != USB1_DT_INTERFACE || length < USB1_DT_INTERFACE_SIZE || pos + length > size) {
            log(USB1_LOG_LEVEL_ERROR) << "Invalid interface descriptor at offset " << pos << endLog;
            throw USBError(USB1_ERROR_IO, "Invalid interface descriptor");
        }

        const uint8_t *desc = data + pos;
        USBInterfaceSetting setting;
        setting.bLength = desc[0];
        setting.bDescriptorType = desc[1];
        setting.bInterfaceNumber = desc[2];
        setting.bAlternateSetting = desc[3];
        setting.bNumEndpoints = desc[4];
        setting.bInterfaceClass = desc[5];
        setting.bInterfaceSubClass = desc[6];
        setting.bInterfaceProtocol = desc[7];
        setting.iInterface = desc[8];

        pos = CollectExtra(data, size, pos + length, &setting.extra);

        for (int i = 0; i < setting.bNumEndpoints; ++i) {
            USBEndpointDescriptor endpoint;
            pos = ParseEndpoint(data, size, pos, &endpoint);
            setting.endpoints.push_back(std::move(endpoint));
        }

        interface->altsettings.push_back(std::move(setting));

        // Alternate settings of the same interface follow each other
    } while (pos + USB1_DT_INTERFACE_SIZE <= size
        && data[pos + 1] == USB1_DT_INTERFACE
        && data[pos + 2] == interface->altsettings.front().bInterfaceNumber);

    return pos;
}

USBDeviceDescriptor ParseDeviceDescriptor(const uint8_t *data, size_t size)
{
    USB1_LOG;

    if (data == nullptr || size < USB1_DT_DEVICE_SIZE || data[1] != USB1_DT_DEVICE) {
        log(USB1_LOG_LEVEL_ERROR) << "Invalid device descriptor of " << size << " bytes" << endLog;
        throw USBError(USB1_ERROR_IO, "Invalid device descriptor");
    }

    USBDeviceDescriptor desc;
    desc.bLength = data[0];
    desc.bDescriptorType = data[1];
    desc.bcdUSB = ReadLE16(data + 2);
    desc.bDeviceClass = data[4];
    desc.bDeviceSubClass = data[5];
    desc.bDeviceProtocol = data[6];
    desc.bMaxPacketSize0 = data[7];
    desc.idVendor = ReadLE16(data + 8);
    desc.idProduct = ReadLE16(data + 10);
    desc.bcdDevice = ReadLE16(data + 12);
    desc.iManufacturer = data[14];
    desc.iProduct = data[15];
    desc.iSerialNumber = data[16];
    desc.bNumConfigurations = data[17];

    return desc;
}

USBConfiguration ParseConfigDescriptor(const uint8_t *data, size_t size)
{
    USB1_LOG;

    if (data == nullptr || size < USB1_DT_CONFIG_SIZE || data[1] != USB1_DT_CONFIG
        || data[0] < USB1_DT_CONFIG_SIZE)
    {
        log(USB1_LOG_LEVEL_ERROR) << "Invalid configuration descriptor of " << size << " bytes" << endLog;
        throw USBError(USB1_ERROR_IO, "Invalid configuration descriptor");
    }

    USBConfiguration config;
    config.bLength = data[0];
    config.bDescriptorType = data[1];
    config.wTotalLength = ReadLE16(data + 2);
    config.bNumInterfaces = data[4];
    config.bConfigurationValue = data[5];
    config.iConfiguration = data[6];
    config.bmAttributes = data[7];
    config.MaxPower = data[8];

    if (config.wTotalLength < config.bLength) {
        log(USB1_LOG_LEVEL_ERROR) << "Invalid wTotalLength " << config.wTotalLength << endLog;
        throw USBError(USB1_ERROR_IO, "Invalid configuration descriptor");
    }

    if (size > config.wTotalLength) {
        size = config.wTotalLength;
    } else if (size < config.wTotalLength) {
        log(USB1_LOG_LEVEL_WARNING) << "Configuration descriptor truncated: " << size << " of "
            << config.wTotalLength << " bytes" << endLog;
    }

    size_t pos = CollectExtra(data, size, config.bLength, &config.extra);

    for (int i = 0; i < config.bNumInterfaces; ++i) {
        if (pos + USB1_DT_INTERFACE_SIZE > size) {
            log(USB1_LOG_LEVEL_ERROR) << "Missing interface " << i << " of " << static_cast<int>(config.bNumInterfaces) << endLog;
            throw USBError(USB1_ERROR_IO, "Truncated configuration descriptor");
        }

        USBInterface interface;
        pos = ParseInterface(data, size, pos, &interface);
        config.interfaces.push_back(std::move(interface));
    }

    return config;
}
