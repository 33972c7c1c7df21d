#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// Values below -13 are library specific, the rest match libusb_error.
enum USBErrorCode {
    USB1_SUCCESS = 0,
    USB1_ERROR_IO = -1,
    USB1_ERROR_INVALID_PARAM = -2,
    USB1_ERROR_ACCESS = -3,
    USB1_ERROR_NO_DEVICE = -4,
    USB1_ERROR_NOT_FOUND = -5,
    USB1_ERROR_BUSY = -6,
    USB1_ERROR_TIMEOUT = -7,
    USB1_ERROR_OVERFLOW = -8,
    USB1_ERROR_PIPE = -9,
    USB1_ERROR_INTERRUPTED = -10,
    USB1_ERROR_NO_MEM = -11,
    USB1_ERROR_NOT_SUPPORTED = -12,
    USB1_ERROR_INVALID_STATE = -13,
    USB1_ERROR_DOOMED_TRANSFER = -14,
    USB1_ERROR_OTHER = -99,
};

const char *USBErrorName(int code);

class USBError : public std::runtime_error {
public:
    USBError(int code, const std::string &message);

    int GetCode() const { return m_code; }

private:
    int m_code;
};

// Raised by any operation on a transfer that has been marked for destruction.
class DoomedTransferError : public USBError {
public:
    explicit DoomedTransferError(const std::string &message)
        : USBError(USB1_ERROR_DOOMED_TRANSFER, message)
    {}
};

// Raised by the synchronous helpers when the transfer timed out. The bytes
// moved before the timeout are kept so partial transfers are not lost.
class USBTimeoutError : public USBError {
public:
    USBTimeoutError(const std::string &message, size_t transferred,
        std::vector<uint8_t> received = std::vector<uint8_t>());

    size_t GetTransferred() const { return m_transferred; }
    const std::vector<uint8_t> &GetReceived() const { return m_received; }

private:
    size_t m_transferred;
    std::vector<uint8_t> m_received;
};

// Throws USBError when ret is a negative error code, returns ret otherwise.
int USBCheck(int ret, const std::string &message);
