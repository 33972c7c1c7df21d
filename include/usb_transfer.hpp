#pragma once

#include <any>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "usb_backend.hpp"
#include "usb_constants.hpp"
#include "usb_error.hpp"

class USBContext;
class USBDeviceHandle;

struct USBControlSetup {
    uint8_t requestType;
    uint8_t request;
    uint16_t value;
    uint16_t index;
    uint16_t length;
};

struct USBIsoPacketResult {
    int status;
    // Truncated to the packet's actual length
    std::vector<uint8_t> data;
};

// One asynchronous transfer, bound to the device handle which created it.
//
// A transfer is configured with one of the Set* methods, submitted, and
// reported back through its callback while the owning context handles
// events. It may then be reconfigured or resubmitted. Doom() retires it: the
// native record is released immediately when idle, or once the final
// completion has been delivered when in flight.
class USBTransfer {
public:
    typedef std::function<void(USBTransfer *transfer)> Callback;

    ~USBTransfer();

    USBTransfer(const USBTransfer &) = delete;
    USBTransfer &operator=(const USBTransfer &) = delete;

    void SetControl(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
        const std::vector<uint8_t> &data, Callback callback = nullptr, std::any userData = std::any(),
        unsigned int timeout = 0);
    void SetControl(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
        uint16_t length, Callback callback = nullptr, std::any userData = std::any(),
        unsigned int timeout = 0);

    void SetBulk(uint8_t endpoint, const std::vector<uint8_t> &data, Callback callback = nullptr,
        std::any userData = std::any(), unsigned int timeout = 0);
    void SetBulk(uint8_t endpoint, size_t length, Callback callback = nullptr,
        std::any userData = std::any(), unsigned int timeout = 0);

    void SetInterrupt(uint8_t endpoint, const std::vector<uint8_t> &data, Callback callback = nullptr,
        std::any userData = std::any(), unsigned int timeout = 0);
    void SetInterrupt(uint8_t endpoint, size_t length, Callback callback = nullptr,
        std::any userData = std::any(), unsigned int timeout = 0);

    // Without isoLengths the buffer is split evenly over every allocated packet.
    void SetIsochronous(uint8_t endpoint, const std::vector<uint8_t> &data, Callback callback = nullptr,
        std::any userData = std::any(), unsigned int timeout = 0,
        const std::vector<unsigned int> &isoLengths = std::vector<unsigned int>());
    void SetIsochronous(uint8_t endpoint, size_t length, Callback callback = nullptr,
        std::any userData = std::any(), unsigned int timeout = 0,
        const std::vector<unsigned int> &isoLengths = std::vector<unsigned int>());

    // Replaces the data buffer. Isochronous buffers cannot be resized and
    // control transfers must use SetControl().
    void SetBuffer(const std::vector<uint8_t> &data);
    void SetBuffer(size_t length);

    void Submit();
    void Cancel();
    void Doom();
    void Close();

    bool IsSubmitted() const { return m_submitted.load(); }
    bool IsDoomed() const { return m_doomed.load(); }

    int GetType() const;
    uint8_t GetEndpoint() const;
    USBControlSetup GetControlSetup() const;

    int GetStatus() const;
    size_t GetActualLength() const;
    // Data stage only for control transfers
    std::vector<uint8_t> GetBuffer() const;

    std::vector<unsigned int> GetISOSetupList() const;
    std::vector<std::vector<uint8_t>> GetISOBufferList() const;
    std::vector<USBIsoPacketResult> GetISOResults() const;

    void SetCallback(Callback callback);
    Callback GetCallback() const;
    void SetUserData(std::any userData);
    const std::any &GetUserData() const;

    void SetShortIsError(bool shortIsError);
    bool IsShortAnError() const;
    void SetAddZeroPacket(bool addZeroPacket);
    bool IsZeroPacketAdded() const;

private:
    friend class USBDeviceHandle;
    friend class USBContext;

    USBTransfer(USBContext *context, USBDeviceHandle *handle, std::unique_ptr<USBNativeTransfer> native,
        int maxIsoPackets, bool shortIsError, bool addZeroPacket);

    void Configure(int type, uint8_t endpoint, std::vector<uint8_t> buffer, Callback callback,
        std::any userData, unsigned int timeout, const std::vector<unsigned int> *isoLengths);
    void CheckAlterable() const;
    const USBNativeTransfer &GetNative() const;
    void CheckCompleted() const;
    void UpdateFlags();
    void HandleCompletion();
    // Cancels the native transfer whether or not it is doomed
    int CancelInFlight();
    void Detach();

    static void CompletionTrampoline(USBNativeTransfer *native);

    USBContext *m_context;
    USBDeviceHandle *m_handle;
    std::unique_ptr<USBNativeTransfer> m_native;
    int m_maxIsoPackets;
    bool m_shortIsError;
    bool m_addZeroPacket;

    Callback m_callback;
    std::any m_userData;

    // Guards the doom/release decision against the completion path
    mutable std::mutex m_lock;
    std::atomic<bool> m_submitted;
    std::atomic<bool> m_doomed;
    bool m_inCallback;
    bool m_configured;
    bool m_completed;
    bool *m_destroyedFlag;
};

// Dispatches completions to one callback per transfer status. When the
// selected callback returns true the transfer is resubmitted. Copies share
// the same callback table, so a helper may be installed with
// SetCallback(helper) and changed afterwards.
class USBTransferHelper {
public:
    typedef std::function<bool(USBTransfer *transfer)> EventCallback;

    USBTransferHelper();

    void SetEventCallback(int status, EventCallback callback);
    EventCallback GetEventCallback(int status) const;
    void SetDefaultCallback(EventCallback callback);

    void operator()(USBTransfer *transfer) const;

private:
    struct CallbackTable {
        std::mutex mutex;
        std::map<int, EventCallback> callbacks;
        EventCallback defaultCallback;
    };

    std::shared_ptr<CallbackTable> m_table;
};
