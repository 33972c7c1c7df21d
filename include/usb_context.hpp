#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "usb_backend.hpp"
#include "usb_config.hpp"
#include "usb_constants.hpp"
#include "usb_error.hpp"

class USBDevice;
class USBDeviceHandle;
class USBTransfer;

enum USBContextState {
    USB1_CONTEXT_STATE_NEW,
    USB1_CONTEXT_STATE_OPEN,
    USB1_CONTEXT_STATE_CLOSED,
};

// Owns one native USB library instance and drives its event loop.
//
// Any number of threads may call the HandleEvents* family concurrently: one
// of them drains native completions while the others wait for it to finish.
// The lower level locking calls (TryLockEvents() ... UnlockEventWaiters())
// allow integrating the context into an external event loop the same way.
//
// Transfer completion and hotplug callbacks run on the draining thread,
// inside HandleEvents*. They may submit, cancel or doom transfers but must
// not handle events on this context again.
class USBContext {
public:
    typedef std::function<bool(USBContext *context, const USBDevice &device, int event)> HotplugCallback;

    explicit USBContext(const USBContextOptions &options = USBContextOptions());
    USBContext(std::unique_ptr<USBBackend> backend, const USBContextOptions &options = USBContextOptions());
    ~USBContext();

    USBContext(const USBContext &) = delete;
    USBContext &operator=(const USBContext &) = delete;

    void Open();
    void Close();
    bool IsOpen() const { return m_state.load() == USB1_CONTEXT_STATE_OPEN; }

    // Enumeration. Devices which cannot be probed are skipped when requested,
    // otherwise the probing error is raised and enumeration stops. The
    // callback returns false to stop early.
    void EnumerateDevices(const std::function<bool(const USBDevice &device)> &callback,
        bool skipOnAccessError = false, bool skipOnError = false);
    std::vector<USBDevice> GetDeviceList(bool skipOnAccessError = false, bool skipOnError = false);
    std::optional<USBDevice> GetByVendorIDAndProductID(uint16_t vendorId, uint16_t productId,
        bool skipOnAccessError = false, bool skipOnError = false);
    std::unique_ptr<USBDeviceHandle> OpenByVendorIDAndProductID(uint16_t vendorId, uint16_t productId,
        bool skipOnAccessError = false, bool skipOnError = false);
    std::unique_ptr<USBDeviceHandle> WrapSysDevice(intptr_t sysDevice);

    // Event handling
    void HandleEvents();
    void HandleEventsTimeout(std::chrono::microseconds timeout);
    void HandleEventsCompleted(std::atomic<bool> *completed);
    void HandleEventsTimeoutCompleted(std::chrono::microseconds timeout, std::atomic<bool> *completed);
    // The calling thread must hold the events lock.
    void HandleEventsLocked(std::chrono::microseconds timeout);
    void InterruptEventHandler();

    bool TryLockEvents();
    void LockEvents();
    void UnlockEvents();
    void LockEventWaiters();
    void UnlockEventWaiters();
    // The calling thread must hold the event waiters lock. Returns true if
    // the timeout expired before another thread finished handling events.
    bool WaitForEvent(std::chrono::microseconds timeout);
    void WaitForEvent();
    bool EventHandlingOK() const;
    bool EventHandlerActive() const;
    bool IsEventHandler() const;

    std::vector<USBPollFD> GetPollFDList();
    void SetPollFDNotifiers(USBBackend::PollFDAddedCallback added, USBBackend::PollFDRemovedCallback removed);
    std::optional<std::chrono::microseconds> GetNextTimeout();

    // Hotplug. The callback returns true to be deregistered.
    int HotplugRegisterCallback(HotplugCallback callback,
        int events = USB1_HOTPLUG_EVENT_DEVICE_ARRIVED | USB1_HOTPLUG_EVENT_DEVICE_LEFT,
        int flags = USB1_HOTPLUG_ENUMERATE, int vendorId = USB1_HOTPLUG_MATCH_ANY,
        int productId = USB1_HOTPLUG_MATCH_ANY, int deviceClass = USB1_HOTPLUG_MATCH_ANY);
    void HotplugDeregisterCallback(int handle);

    bool HasCapability(uint32_t capability);
    void SetNativeLogLevel(int level);
    void SetLogCallback(USBNativeLogCallback callback);

    size_t GetSubmittedTransferCount();

private:
    friend class USBTransfer;
    friend class USBDeviceHandle;
    friend class USBDevice;

    void CheckOpen() const;
    int DrainLocked(std::chrono::microseconds timeout);
    void RethrowCallbackException();
    void StoreCallbackException(std::exception_ptr exception);
    void NotifyEventWaiters();
    bool HandleHotplugEvent(const HotplugCallback &callback, std::shared_ptr<USBNativeDevice> native, int event);
    void DrainForClose();

    // Transfer registry
    void RegisterTransfer(USBTransfer *transfer);
    void UnregisterTransfer(USBTransfer *transfer);
    int AddSubmittedTransfer(USBNativeTransfer *native, USBTransfer *transfer);
    void RemoveSubmittedTransfer(USBNativeTransfer *native);
    bool OrphanSubmittedTransfer(USBNativeTransfer *native);
    bool TakeSubmittedTransfer(USBNativeTransfer *native, USBTransfer **transfer);

    void RegisterHandle(USBDeviceHandle *handle);
    void UnregisterHandle(USBDeviceHandle *handle);

    std::unique_ptr<USBBackend> m_backend;
    USBContextOptions m_options;
    std::atomic<USBContextState> m_state;
    std::atomic<bool> m_closing;

    std::mutex m_eventsLock;
    std::atomic<std::thread::id> m_eventHandlerThread;
    std::atomic<bool> m_eventHandlerActive;
    bool m_draining;
    std::mutex m_waitersLock;
    std::condition_variable m_eventWaitersCV;

    std::mutex m_mutex;
    std::unordered_map<USBNativeTransfer *, USBTransfer *> m_submittedTransfers;
    std::unordered_set<USBTransfer *> m_transfers;
    std::unordered_set<USBDeviceHandle *> m_handles;
    std::set<int> m_hotplugHandles;
    // Raised by callbacks while draining, rethrown by the draining call
    std::vector<std::exception_ptr> m_callbackExceptions;
};
