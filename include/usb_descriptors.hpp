#pragma once

#include <cstdint>
#include <cstddef>
#include <tuple>
#include <vector>

#include "usb_constants.hpp"

struct USBDeviceDescriptor {
    uint8_t bLength = 0;
    uint8_t bDescriptorType = 0;
    uint16_t bcdUSB = 0;
    uint8_t bDeviceClass = 0;
    uint8_t bDeviceSubClass = 0;
    uint8_t bDeviceProtocol = 0;
    uint8_t bMaxPacketSize0 = 0;
    uint16_t idVendor = 0;
    uint16_t idProduct = 0;
    uint16_t bcdDevice = 0;
    uint8_t iManufacturer = 0;
    uint8_t iProduct = 0;
    uint8_t iSerialNumber = 0;
    uint8_t bNumConfigurations = 0;
};

struct USBEndpointDescriptor {
    uint8_t bLength = 0;
    uint8_t bDescriptorType = 0;
    uint8_t bEndpointAddress = 0;
    uint8_t bmAttributes = 0;
    uint16_t wMaxPacketSize = 0;
    uint8_t bInterval = 0;
    // Audio class endpoints only
    uint8_t bRefresh = 0;
    uint8_t bSynchAddress = 0;
    std::vector<uint8_t> extra;

    bool IsIn() const { return (bEndpointAddress & USB1_ENDPOINT_DIR_MASK) == USB1_ENDPOINT_IN; }
    int GetTransferType() const { return bmAttributes & USB1_TRANSFER_TYPE_MASK; }
};

struct USBInterfaceSetting {
    uint8_t bLength = 0;
    uint8_t bDescriptorType = 0;
    uint8_t bInterfaceNumber = 0;
    uint8_t bAlternateSetting = 0;
    uint8_t bNumEndpoints = 0;
    uint8_t bInterfaceClass = 0;
    uint8_t bInterfaceSubClass = 0;
    uint8_t bInterfaceProtocol = 0;
    uint8_t iInterface = 0;
    std::vector<USBEndpointDescriptor> endpoints;
    std::vector<uint8_t> extra;

    std::tuple<uint8_t, uint8_t> GetClassTuple() const
    {
        return std::make_tuple(bInterfaceClass, bInterfaceSubClass);
    }
};

struct USBInterface {
    std::vector<USBInterfaceSetting> altsettings;
};

struct USBConfiguration {
    uint8_t bLength = 0;
    uint8_t bDescriptorType = 0;
    uint16_t wTotalLength = 0;
    uint8_t bNumInterfaces = 0;
    uint8_t bConfigurationValue = 0;
    uint8_t iConfiguration = 0;
    uint8_t bmAttributes = 0;
    uint8_t MaxPower = 0;
    std::vector<USBInterface> interfaces;
    std::vector<uint8_t> extra;

    // MaxPower is expressed in 2mA units, 8mA units from SuperSpeed on.
    unsigned int GetMaxPowerMilliAmps(int speed) const
    {
        return MaxPower * (speed >= USB1_SPEED_SUPER ? 8 : 2);
    }
};

// Decoders for raw descriptor buffers as returned by GET_DESCRIPTOR. Class or
// vendor specific descriptors are kept verbatim in the extra field of the
// descriptor they follow. Malformed buffers throw USBError(USB1_ERROR_IO).
USBDeviceDescriptor ParseDeviceDescriptor(const uint8_t *data, size_t size);
USBConfiguration ParseConfigDescriptor(const uint8_t *data, size_t size);
