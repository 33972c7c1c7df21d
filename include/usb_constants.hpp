#pragma once

#include <cstdint>

// Values follow the USB 2.0/3.x specifications and libusb-1.0.

enum USBEndpointDirection {
    USB1_ENDPOINT_OUT = 0x00,
    USB1_ENDPOINT_IN = 0x80,
};

#define USB1_ENDPOINT_DIR_MASK 0x80
#define USB1_ENDPOINT_ADDRESS_MASK 0x0f
#define USB1_TRANSFER_TYPE_MASK 0x03
#define USB1_CONTROL_SETUP_SIZE 8

enum USBTransferType {
    USB1_TRANSFER_TYPE_CONTROL = 0,
    USB1_TRANSFER_TYPE_ISOCHRONOUS = 1,
    USB1_TRANSFER_TYPE_BULK = 2,
    USB1_TRANSFER_TYPE_INTERRUPT = 3,
};

enum USBTransferStatus {
    USB1_TRANSFER_COMPLETED = 0,
    USB1_TRANSFER_ERROR = 1,
    USB1_TRANSFER_TIMED_OUT = 2,
    USB1_TRANSFER_CANCELLED = 3,
    USB1_TRANSFER_STALL = 4,
    USB1_TRANSFER_NO_DEVICE = 5,
    USB1_TRANSFER_OVERFLOW = 6,
};

enum USBTransferFlags {
    USB1_TRANSFER_SHORT_NOT_OK = 1 << 0,
    USB1_TRANSFER_ADD_ZERO_PACKET = 1 << 3,
};

enum USBRequestType {
    USB1_REQUEST_TYPE_STANDARD = 0x00 << 5,
    USB1_REQUEST_TYPE_CLASS = 0x01 << 5,
    USB1_REQUEST_TYPE_VENDOR = 0x02 << 5,
    USB1_REQUEST_TYPE_RESERVED = 0x03 << 5,
};

enum USBRequestRecipient {
    USB1_RECIPIENT_DEVICE = 0x00,
    USB1_RECIPIENT_INTERFACE = 0x01,
    USB1_RECIPIENT_ENDPOINT = 0x02,
    USB1_RECIPIENT_OTHER = 0x03,
};

enum USBStandardRequest {
    USB1_REQUEST_GET_STATUS = 0x00,
    USB1_REQUEST_CLEAR_FEATURE = 0x01,
    USB1_REQUEST_SET_FEATURE = 0x03,
    USB1_REQUEST_SET_ADDRESS = 0x05,
    USB1_REQUEST_GET_DESCRIPTOR = 0x06,
    USB1_REQUEST_SET_DESCRIPTOR = 0x07,
    USB1_REQUEST_GET_CONFIGURATION = 0x08,
    USB1_REQUEST_SET_CONFIGURATION = 0x09,
    USB1_REQUEST_GET_INTERFACE = 0x0a,
    USB1_REQUEST_SET_INTERFACE = 0x0b,
    USB1_REQUEST_SYNCH_FRAME = 0x0c,
    USB1_REQUEST_SET_SEL = 0x30,
    USB1_SET_ISOCH_DELAY = 0x31,
};

enum USBDescriptorType {
    USB1_DT_DEVICE = 0x01,
    USB1_DT_CONFIG = 0x02,
    USB1_DT_STRING = 0x03,
    USB1_DT_INTERFACE = 0x04,
    USB1_DT_ENDPOINT = 0x05,
    USB1_DT_INTERFACE_ASSOCIATION = 0x0b,
    USB1_DT_BOS = 0x0f,
    USB1_DT_DEVICE_CAPABILITY = 0x10,
    USB1_DT_HID = 0x21,
    USB1_DT_REPORT = 0x22,
    USB1_DT_PHYSICAL = 0x23,
    USB1_DT_HUB = 0x29,
    USB1_DT_SUPERSPEED_HUB = 0x2a,
    USB1_DT_SS_ENDPOINT_COMPANION = 0x30,
};

#define USB1_DT_DEVICE_SIZE 18
#define USB1_DT_CONFIG_SIZE 9
#define USB1_DT_INTERFACE_SIZE 9
#define USB1_DT_ENDPOINT_SIZE 7
#define USB1_DT_ENDPOINT_AUDIO_SIZE 9

enum USBClassCode {
    USB1_CLASS_PER_INTERFACE = 0x00,
    USB1_CLASS_AUDIO = 0x01,
    USB1_CLASS_COMM = 0x02,
    USB1_CLASS_HID = 0x03,
    USB1_CLASS_PHYSICAL = 0x05,
    USB1_CLASS_IMAGE = 0x06,
    USB1_CLASS_PRINTER = 0x07,
    USB1_CLASS_MASS_STORAGE = 0x08,
    USB1_CLASS_HUB = 0x09,
    USB1_CLASS_DATA = 0x0a,
    USB1_CLASS_SMART_CARD = 0x0b,
    USB1_CLASS_CONTENT_SECURITY = 0x0d,
    USB1_CLASS_VIDEO = 0x0e,
    USB1_CLASS_PERSONAL_HEALTHCARE = 0x0f,
    USB1_CLASS_DIAGNOSTIC_DEVICE = 0xdc,
    USB1_CLASS_WIRELESS = 0xe0,
    USB1_CLASS_MISCELLANEOUS = 0xef,
    USB1_CLASS_APPLICATION = 0xfe,
    USB1_CLASS_VENDOR_SPEC = 0xff,
};

enum USBSpeed {
    USB1_SPEED_UNKNOWN = 0,
    USB1_SPEED_LOW = 1,
    USB1_SPEED_FULL = 2,
    USB1_SPEED_HIGH = 3,
    USB1_SPEED_SUPER = 4,
    USB1_SPEED_SUPER_PLUS = 5,
};

enum USBHotplugEvent {
    USB1_HOTPLUG_EVENT_DEVICE_ARRIVED = 0x01,
    USB1_HOTPLUG_EVENT_DEVICE_LEFT = 0x02,
};

enum USBHotplugFlag {
    USB1_HOTPLUG_NO_FLAGS = 0,
    USB1_HOTPLUG_ENUMERATE = 1 << 0,
};

#define USB1_HOTPLUG_MATCH_ANY -1

enum USBCapability {
    USB1_CAP_HAS_CAPABILITY = 0x0000,
    USB1_CAP_HAS_HOTPLUG = 0x0001,
    USB1_CAP_HAS_HID_ACCESS = 0x0100,
    USB1_CAP_SUPPORTS_DETACH_KERNEL_DRIVER = 0x0101,
};

// Verbosity of the native library's own diagnostics.
enum USBNativeLogLevel {
    USB1_NATIVE_LOG_LEVEL_NONE = 0,
    USB1_NATIVE_LOG_LEVEL_ERROR = 1,
    USB1_NATIVE_LOG_LEVEL_WARNING = 2,
    USB1_NATIVE_LOG_LEVEL_INFO = 3,
    USB1_NATIVE_LOG_LEVEL_DEBUG = 4,
};

const char *USBTransferStatusName(int status);
const char *USBSpeedName(int speed);
