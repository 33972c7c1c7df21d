#include "usb_error.hpp"

const char *USBErrorName(int code)
{
    switch (code) {
        case USB1_SUCCESS:
            return "USB1_SUCCESS";
        case USB1_ERROR_IO:
            return "USB1_ERROR_IO";
        case USB1_ERROR_INVALID_PARAM:
            return "USB1_ERROR_INVALID_PARAM";
        case USB1_ERROR_ACCESS:
            return "USB1_ERROR_ACCESS";
        case USB1_ERROR_NO_DEVICE:
            return "USB1_ERROR_NO_DEVICE";
        case USB1_ERROR_NOT_FOUND:
            return "USB1_ERROR_NOT_FOUND";
        case USB1_ERROR_BUSY:
            return "USB1_ERROR_BUSY";
        case USB1_ERROR_TIMEOUT:
            return "USB1_ERROR_TIMEOUT";
        case USB1_ERROR_OVERFLOW:
            return "USB1_ERROR_OVERFLOW";
        case USB1_ERROR_PIPE:
            return "USB1_ERROR_PIPE";
        case USB1_ERROR_INTERRUPTED:
            return "USB1_ERROR_INTERRUPTED";
        case USB1_ERROR_NO_MEM:
            return "USB1_ERROR_NO_MEM";
        case USB1_ERROR_NOT_SUPPORTED:
            return "USB1_ERROR_NOT_SUPPORTED";
        case USB1_ERROR_INVALID_STATE:
            return "USB1_ERROR_INVALID_STATE";
        case USB1_ERROR_DOOMED_TRANSFER:
            return "USB1_ERROR_DOOMED_TRANSFER";
        case USB1_ERROR_OTHER:
            return "USB1_ERROR_OTHER";
        default:
            return "USB1_ERROR_UNKNOWN";
    }
}

USBError::USBError(int code, const std::string &message)
    : std::runtime_error(message + ": " + USBErrorName(code)), m_code(code)
{}

USBTimeoutError::USBTimeoutError(const std::string &message, size_t transferred,
    std::vector<uint8_t> received)
    : USBError(USB1_ERROR_TIMEOUT, message), m_transferred(transferred), m_received(std::move(received))
{}

int USBCheck(int ret, const std::string &message)
{
    if (ret < 0) {
        throw USBError(ret, message);
    }

    return ret;
}
