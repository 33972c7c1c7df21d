#include <algorithm>

#include "usb_context.hpp"
#include "usb_device.hpp"
#include "usb_transfer.hpp"
#include "usb_log.hpp"

// libusb waits this long in libusb_handle_events()
static const std::chrono::microseconds defaultEventTimeout = std::chrono::seconds(60);
static const std::chrono::microseconds closeDrainStep = std::chrono::milliseconds(100);

USBContext::USBContext(const USBContextOptions &options)
    : USBContext(CreateLibUSBBackend(), options)
{}

USBContext::USBContext(std::unique_ptr<USBBackend> backend, const USBContextOptions &options)
    : m_backend(std::move(backend)), m_options(options), m_state(USB1_CONTEXT_STATE_NEW), m_closing(false),
    m_eventHandlerThread(std::thread::id()), m_eventHandlerActive(false), m_draining(false)
{
    if (!m_backend) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "No USB backend");
    }
}

USBContext::~USBContext()
{
    USB1_LOG;

    try {
        Close();
    } catch (const std::exception &e) {
        log(USB1_LOG_LEVEL_ERROR) << "Error while closing USB context: " << e.what() << endLog;
    }
}

void USBContext::Open()
{
    USB1_LOG;

    USBContextState state = m_state.load();
    if (state == USB1_CONTEXT_STATE_OPEN) {
        return;
    }
    if (state == USB1_CONTEXT_STATE_CLOSED) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Context has been closed");
    }

    int ret = m_backend->Init(m_options);
    if (ret < 0) {
        log(USB1_LOG_LEVEL_ERROR) << "Failed to initialize USB backend: " << USBErrorName(ret) << endLog;
        throw USBError(ret, "Failed to initialize USB context");
    }

    m_state.store(USB1_CONTEXT_STATE_OPEN);
    log(USB1_LOG_LEVEL_DEBUG) << "USB context opened" << endLog;
}

void USBContext::Close()
{
    USB1_LOG;

    if (IsEventHandler()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Cannot close a context from its own event handler");
    }

    USBContextState state = m_state.load();
    if (state == USB1_CONTEXT_STATE_CLOSED) {
        return;
    }
    if (state == USB1_CONTEXT_STATE_NEW) {
        m_state.store(USB1_CONTEXT_STATE_CLOSED);
        m_backend.reset();
        return;
    }
    if (m_closing.exchange(true)) {
        return;
    }

    log(USB1_LOG_LEVEL_DEBUG) << "Closing USB context" << endLog;

    std::vector<USBTransfer *> transfers;
    std::set<int> hotplugHandles;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        transfers.assign(m_transfers.begin(), m_transfers.end());
        hotplugHandles.swap(m_hotplugHandles);
    }

    for (USBTransfer *transfer : transfers) {
        int ret = transfer->CancelInFlight();
        if (ret < 0 && ret != USB1_ERROR_NOT_FOUND) {
            log(USB1_LOG_LEVEL_DEBUG) << "Failed to cancel transfer: " << USBErrorName(ret) << endLog;
        }
        transfer->Doom();
    }

    for (int handle : hotplugHandles) {
        m_backend->HotplugDeregister(handle);
    }

    // Make a thread blocked in HandleEvents* give up the events lock
    m_backend->InterruptEventHandler();
    LockEvents();

    DrainForClose();

    std::vector<USBDeviceHandle *> handles;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handles.assign(m_handles.begin(), m_handles.end());
        m_handles.clear();
        transfers.assign(m_transfers.begin(), m_transfers.end());
        m_transfers.clear();
        if (!m_submittedTransfers.empty()) {
            log(USB1_LOG_LEVEL_WARNING) << m_submittedTransfers.size() << " transfers still in flight, "
                << "their native records are leaked" << endLog;
            m_submittedTransfers.clear();
        }
    }

    for (USBDeviceHandle *handle : handles) {
        handle->ReleaseNative();
        handle->m_context = nullptr;
    }

    for (USBTransfer *transfer : transfers) {
        transfer->Detach();
    }

    m_backend->SetPollFDNotifiers(nullptr, nullptr);
    m_backend.reset();
    m_state.store(USB1_CONTEXT_STATE_CLOSED);

    UnlockEvents();

    log(USB1_LOG_LEVEL_DEBUG) << "USB context closed" << endLog;

    RethrowCallbackException();
}

void USBContext::DrainForClose()
{
    USB1_LOG;

    auto deadline = std::chrono::steady_clock::now() + m_options.closeDrainTimeout;

    while (GetSubmittedTransferCount() > 0) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            log(USB1_LOG_LEVEL_WARNING) << "Gave up waiting for " << GetSubmittedTransferCount()
                << " cancelled transfers after " << m_options.closeDrainTimeout.count() << "ms" << endLog;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);
        int ret = DrainLocked(std::min(remaining, closeDrainStep));
        if (ret < 0 && ret != USB1_ERROR_INTERRUPTED) {
            log(USB1_LOG_LEVEL_ERROR) << "Failed to handle events while closing: " << USBErrorName(ret) << endLog;
            break;
        }
    }
}

void USBContext::CheckOpen() const
{
    if (m_state.load() != USB1_CONTEXT_STATE_OPEN) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Context is not open");
    }
}

void USBContext::EnumerateDevices(const std::function<bool(const USBDevice &device)> &callback,
    bool skipOnAccessError, bool skipOnError)
{
    USB1_LOG;

    CheckOpen();

    std::vector<std::shared_ptr<USBNativeDevice>> devices;
    int ret = m_backend->GetDeviceList(&devices);
    if (ret < 0) {
        log(USB1_LOG_LEVEL_ERROR) << "Failed to get device list: " << USBErrorName(ret) << endLog;
        throw USBError(ret, "Failed to get device list");
    }

    for (const auto &native : devices) {
        std::optional<USBDevice> device;
        try {
            device.emplace(this, native);
        } catch (const USBError &e) {
            if (e.GetCode() == USB1_ERROR_ACCESS) {
                if (!skipOnAccessError) {
                    throw;
                }
            } else if (!skipOnError) {
                throw;
            }
            log(USB1_LOG_LEVEL_INFO) << "Skipping device: " << e.what() << endLog;
            continue;
        }

        if (!callback(*device)) {
            break;
        }
    }
}

std::vector<USBDevice> USBContext::GetDeviceList(bool skipOnAccessError, bool skipOnError)
{
    std::vector<USBDevice> devices;

    EnumerateDevices([&devices](const USBDevice &device) {
        devices.push_back(device);
        return true;
    }, skipOnAccessError, skipOnError);

    return devices;
}

std::optional<USBDevice> USBContext::GetByVendorIDAndProductID(uint16_t vendorId, uint16_t productId,
    bool skipOnAccessError, bool skipOnError)
{
    std::optional<USBDevice> result;

    EnumerateDevices([&result, vendorId, productId](const USBDevice &device) {
        if (device.GetVendorID() == vendorId && device.GetProductID() == productId) {
            result.emplace(device);
            return false;
        }
        return true;
    }, skipOnAccessError, skipOnError);

    return result;
}

std::unique_ptr<USBDeviceHandle> USBContext::OpenByVendorIDAndProductID(uint16_t vendorId, uint16_t productId,
    bool skipOnAccessError, bool skipOnError)
{
    std::optional<USBDevice> device = GetByVendorIDAndProductID(vendorId, productId, skipOnAccessError, skipOnError);
    if (!device) {
        return nullptr;
    }

    return device->Open();
}

std::unique_ptr<USBDeviceHandle> USBContext::WrapSysDevice(intptr_t sysDevice)
{
    USB1_LOG;

    CheckOpen();

    std::shared_ptr<USBNativeDevice> native;
    std::unique_ptr<USBNativeDeviceHandle> handle;
    int ret = m_backend->WrapSysDevice(sysDevice, &native, &handle);
    if (ret < 0) {
        log(USB1_LOG_LEVEL_ERROR) << "Failed to wrap system device: " << USBErrorName(ret) << endLog;
        throw USBError(ret, "Failed to wrap system device");
    }

    USBDevice device(this, native);
    return std::unique_ptr<USBDeviceHandle>(new USBDeviceHandle(this, device, std::move(handle)));
}

void USBContext::HandleEvents()
{
    HandleEventsTimeoutCompleted(defaultEventTimeout, nullptr);
}

void USBContext::HandleEventsTimeout(std::chrono::microseconds timeout)
{
    HandleEventsTimeoutCompleted(timeout, nullptr);
}

void USBContext::HandleEventsCompleted(std::atomic<bool> *completed)
{
    HandleEventsTimeoutCompleted(defaultEventTimeout, completed);
}

void USBContext::HandleEventsTimeoutCompleted(std::chrono::microseconds timeout, std::atomic<bool> *completed)
{
    USB1_LOG;

    CheckOpen();
    if (IsEventHandler()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Event handling is not reentrant");
    }

    while (true) {
        if (TryLockEvents()) {
            if (!EventHandlingOK()) {
                UnlockEvents();
                throw USBError(USB1_ERROR_INVALID_STATE, "Context is closing");
            }

            int ret = USB1_SUCCESS;
            if (completed == nullptr || !completed->load()) {
                try {
                    ret = DrainLocked(timeout);
                } catch (...) {
                    UnlockEvents();
                    throw;
                }
            }
            UnlockEvents();

            RethrowCallbackException();
            if (ret < 0) {
                if (ret != USB1_ERROR_INTERRUPTED) {
                    log(USB1_LOG_LEVEL_ERROR) << "Failed to handle events: " << USBErrorName(ret) << endLog;
                }
                throw USBError(ret, "Failed to handle events");
            }
            return;
        }

        // Another thread is handling events, wait for it to be done
        LockEventWaiters();

        if (completed != nullptr && completed->load()) {
            UnlockEventWaiters();
            return;
        }

        if (!EventHandlerActive()) {
            // The other handler finished before we got here, try again
            UnlockEventWaiters();
            continue;
        }

        WaitForEvent(timeout);
        UnlockEventWaiters();
        return;
    }
}

void USBContext::HandleEventsLocked(std::chrono::microseconds timeout)
{
    USB1_LOG;

    CheckOpen();
    if (!IsEventHandler()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Events lock is not held by the calling thread");
    }

    int ret = DrainLocked(timeout);

    RethrowCallbackException();
    if (ret < 0) {
        log(USB1_LOG_LEVEL_ERROR) << "Failed to handle events: " << USBErrorName(ret) << endLog;
        throw USBError(ret, "Failed to handle events");
    }
}

int USBContext::DrainLocked(std::chrono::microseconds timeout)
{
    if (m_draining) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Event handling is not reentrant");
    }

    m_draining = true;
    int ret = m_backend->HandleEvents(timeout);
    m_draining = false;

    return ret;
}

void USBContext::InterruptEventHandler()
{
    CheckOpen();
    m_backend->InterruptEventHandler();
}

bool USBContext::TryLockEvents()
{
    if (IsEventHandler()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Events lock is already held by the calling thread");
    }

    if (!m_eventsLock.try_lock()) {
        return false;
    }

    m_eventHandlerThread.store(std::this_thread::get_id());
    m_eventHandlerActive.store(true);

    return true;
}

void USBContext::LockEvents()
{
    if (IsEventHandler()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Events lock is already held by the calling thread");
    }

    m_eventsLock.lock();
    m_eventHandlerThread.store(std::this_thread::get_id());
    m_eventHandlerActive.store(true);
}

void USBContext::UnlockEvents()
{
    if (!IsEventHandler()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Events lock is not held by the calling thread");
    }

    m_eventHandlerActive.store(false);
    m_eventHandlerThread.store(std::thread::id());
    m_eventsLock.unlock();

    NotifyEventWaiters();
}

void USBContext::LockEventWaiters()
{
    m_waitersLock.lock();
}

void USBContext::UnlockEventWaiters()
{
    m_waitersLock.unlock();
}

bool USBContext::WaitForEvent(std::chrono::microseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_waitersLock, std::adopt_lock);
    std::cv_status status = m_eventWaitersCV.wait_for(lock, timeout);
    lock.release();

    return status == std::cv_status::timeout;
}

void USBContext::WaitForEvent()
{
    WaitForEvent(defaultEventTimeout);
}

bool USBContext::EventHandlingOK() const
{
    return IsOpen() && !m_closing.load();
}

bool USBContext::EventHandlerActive() const
{
    return m_eventHandlerActive.load();
}

bool USBContext::IsEventHandler() const
{
    return m_eventHandlerThread.load() == std::this_thread::get_id();
}

void USBContext::NotifyEventWaiters()
{
    std::lock_guard<std::mutex> lock(m_waitersLock);
    m_eventWaitersCV.notify_all();
}

void USBContext::StoreCallbackException(std::exception_ptr exception)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callbackExceptions.push_back(exception);
}

void USBContext::RethrowCallbackException()
{
    std::exception_ptr exception;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_callbackExceptions.empty()) {
            return;
        }
        exception = m_callbackExceptions.front();
        m_callbackExceptions.erase(m_callbackExceptions.begin());
    }

    std::rethrow_exception(exception);
}

std::vector<USBPollFD> USBContext::GetPollFDList()
{
    CheckOpen();
    return m_backend->GetPollFDs();
}

void USBContext::SetPollFDNotifiers(USBBackend::PollFDAddedCallback added, USBBackend::PollFDRemovedCallback removed)
{
    CheckOpen();
    m_backend->SetPollFDNotifiers(std::move(added), std::move(removed));
}

std::optional<std::chrono::microseconds> USBContext::GetNextTimeout()
{
    CheckOpen();

    std::chrono::microseconds timeout(0);
    int ret = USBCheck(m_backend->GetNextTimeout(&timeout), "Failed to get next timeout");
    if (ret == 0) {
        return std::nullopt;
    }

    return timeout;
}

int USBContext::HotplugRegisterCallback(HotplugCallback callback, int events, int flags, int vendorId,
    int productId, int deviceClass)
{
    USB1_LOG;

    CheckOpen();
    if (!callback) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "Hotplug callback is empty");
    }

    // The handle is only known once registration returns, enumerated
    // arrivals are delivered before that.
    auto registeredHandle = std::make_shared<std::atomic<int>>(-1);
    auto hotplugCallback = std::make_shared<HotplugCallback>(std::move(callback));

    int handle = -1;
    int ret = m_backend->HotplugRegister(events, flags, vendorId, productId, deviceClass,
        [this, hotplugCallback, registeredHandle](std::shared_ptr<USBNativeDevice> native, int event) {
            bool deregister = HandleHotplugEvent(*hotplugCallback, native, event);
            if (deregister && registeredHandle->load() >= 0) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_hotplugHandles.erase(registeredHandle->load());
            }
            return deregister;
        }, &handle);
    if (ret < 0) {
        log(USB1_LOG_LEVEL_ERROR) << "Failed to register hotplug callback: " << USBErrorName(ret) << endLog;
        throw USBError(ret, "Failed to register hotplug callback");
    }

    registeredHandle->store(handle);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_hotplugHandles.insert(handle);
    }

    log(USB1_LOG_LEVEL_DEBUG) << "Registered hotplug callback " << handle << endLog;

    return handle;
}

void USBContext::HotplugDeregisterCallback(int handle)
{
    USB1_LOG;

    CheckOpen();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_hotplugHandles.erase(handle) == 0) {
            log(USB1_LOG_LEVEL_DEBUG) << "Hotplug callback " << handle << " is not registered" << endLog;
            return;
        }
    }

    m_backend->HotplugDeregister(handle);
}

bool USBContext::HandleHotplugEvent(const HotplugCallback &callback, std::shared_ptr<USBNativeDevice> native,
    int event)
{
    USB1_LOG;

    std::optional<USBDevice> device;
    try {
        device.emplace(this, native);
    } catch (const USBError &e) {
        log(USB1_LOG_LEVEL_WARNING) << "Failed to probe hotplug device: " << e.what() << endLog;
        return false;
    }

    log(USB1_LOG_LEVEL_DEBUG) << (event == USB1_HOTPLUG_EVENT_DEVICE_ARRIVED ? "Device arrived: " : "Device left: ")
        << device->ToString() << endLog;

    try {
        return callback(this, *device, event);
    } catch (...) {
        StoreCallbackException(std::current_exception());
    }

    return false;
}

bool USBContext::HasCapability(uint32_t capability)
{
    CheckOpen();
    return m_backend->HasCapability(capability);
}

void USBContext::SetNativeLogLevel(int level)
{
    CheckOpen();
    m_backend->SetLogLevel(level);
}

void USBContext::SetLogCallback(USBNativeLogCallback callback)
{
    CheckOpen();
    m_backend->SetLogCallback(std::move(callback));
}

size_t USBContext::GetSubmittedTransferCount()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_submittedTransfers.size();
}

void USBContext::RegisterTransfer(USBTransfer *transfer)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_transfers.insert(transfer);
}

void USBContext::UnregisterTransfer(USBTransfer *transfer)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_transfers.erase(transfer);
}

int USBContext::AddSubmittedTransfer(USBNativeTransfer *native, USBTransfer *transfer)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_closing.load() || m_state.load() != USB1_CONTEXT_STATE_OPEN) {
        return USB1_ERROR_INVALID_STATE;
    }

    m_submittedTransfers[native] = transfer;

    return USB1_SUCCESS;
}

void USBContext::RemoveSubmittedTransfer(USBNativeTransfer *native)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_submittedTransfers.erase(native);
}

bool USBContext::OrphanSubmittedTransfer(USBNativeTransfer *native)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_submittedTransfers.find(native);
    if (it == m_submittedTransfers.end()) {
        return false;
    }
    it->second = nullptr;

    return true;
}

bool USBContext::TakeSubmittedTransfer(USBNativeTransfer *native, USBTransfer **transfer)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_submittedTransfers.find(native);
    if (it == m_submittedTransfers.end()) {
        return false;
    }
    *transfer = it->second;
    m_submittedTransfers.erase(it);

    return true;
}

void USBContext::RegisterHandle(USBDeviceHandle *handle)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handles.insert(handle);
}

void USBContext::UnregisterHandle(USBDeviceHandle *handle)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handles.erase(handle);
}
