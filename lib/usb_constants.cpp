#include "usb_constants.hpp"

const char *USBTransferStatusName(int status)
{
    switch (status) {
        case USB1_TRANSFER_COMPLETED:
            return "COMPLETED";
        case USB1_TRANSFER_ERROR:
            return "ERROR";
        case USB1_TRANSFER_TIMED_OUT:
            return "TIMED_OUT";
        case USB1_TRANSFER_CANCELLED:
            return "CANCELLED";
        case USB1_TRANSFER_STALL:
            return "STALL";
        case USB1_TRANSFER_NO_DEVICE:
            return "NO_DEVICE";
        case USB1_TRANSFER_OVERFLOW:
            return "OVERFLOW";
        default:
            return "UNKNOWN";
    }
}

const char *USBSpeedName(int speed)
{
    switch (speed) {
        case USB1_SPEED_LOW:
            return "Low Speed (1.5Mbit/s)";
        case USB1_SPEED_FULL:
            return "Full Speed (12Mbit/s)";
        case USB1_SPEED_HIGH:
            return "High Speed (480Mbit/s)";
        case USB1_SPEED_SUPER:
            return "Super Speed (5000Mbit/s)";
        case USB1_SPEED_SUPER_PLUS:
            return "Super Speed Plus (10000Mbit/s)";
        default:
            return "Unknown speed";
    }
}
