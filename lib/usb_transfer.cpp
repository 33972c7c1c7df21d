#include <algorithm>
#include <numeric>

#include "usb_transfer.hpp"
#include "usb_context.hpp"
#include "usb_device.hpp"
#include "usb_log.hpp"

USBTransfer::USBTransfer(USBContext *context, USBDeviceHandle *handle, std::unique_ptr<USBNativeTransfer> native,
    int maxIsoPackets, bool shortIsError, bool addZeroPacket)
    : m_context(context), m_handle(handle), m_native(std::move(native)), m_maxIsoPackets(maxIsoPackets),
    m_shortIsError(shortIsError), m_addZeroPacket(addZeroPacket), m_submitted(false), m_doomed(false),
    m_inCallback(false), m_configured(false), m_completed(false), m_destroyedFlag(nullptr)
{
    UpdateFlags();
}

USBTransfer::~USBTransfer()
{
    USB1_LOG;

    if (m_destroyedFlag != nullptr) {
        *m_destroyedFlag = true;
    }

    // An in-flight record is handed over to the completion trampoline, which
    // frees it once the native layer is done with it.
    if (m_context != nullptr && m_native && m_submitted.load()) {
        if (m_context->OrphanSubmittedTransfer(m_native.get())) {
            USBNativeTransfer *native = m_native.release();
            int ret = native->Cancel();
            if (ret < 0) {
                log(USB1_LOG_LEVEL_DEBUG) << "Failed to cancel orphaned transfer: " << USBErrorName(ret) << endLog;
            }
        }
    }

    if (m_context != nullptr) {
        m_context->UnregisterTransfer(this);
    }
    if (m_handle != nullptr) {
        m_handle->UnregisterTransfer(this);
    }
}

void USBTransfer::CheckAlterable() const
{
    if (m_doomed.load()) {
        throw DoomedTransferError("Cannot alter a doomed transfer");
    }
    if (m_submitted.load()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Cannot alter a submitted transfer");
    }
}

const USBNativeTransfer &USBTransfer::GetNative() const
{
    if (!m_native) {
        throw DoomedTransferError("Transfer has been released");
    }

    return *m_native;
}

void USBTransfer::CheckCompleted() const
{
    if (m_submitted.load()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Transfer is still in flight");
    }
    if (!m_completed) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Transfer has not completed");
    }
}

void USBTransfer::UpdateFlags()
{
    if (!m_native) {
        return;
    }

    uint8_t flags = 0;
    if (m_shortIsError) {
        flags |= USB1_TRANSFER_SHORT_NOT_OK;
    }
    if (m_addZeroPacket) {
        flags |= USB1_TRANSFER_ADD_ZERO_PACKET;
    }
    m_native->flags = flags;
}

void USBTransfer::Configure(int type, uint8_t endpoint, std::vector<uint8_t> buffer, Callback callback,
    std::any userData, unsigned int timeout, const std::vector<unsigned int> *isoLengths)
{
    USB1_LOG;

    CheckAlterable();

    std::vector<unsigned int> packetLengths;
    if (type == USB1_TRANSFER_TYPE_ISOCHRONOUS) {
        if (m_maxIsoPackets == 0) {
            throw USBError(USB1_ERROR_INVALID_PARAM, "Transfer was allocated without isochronous packets");
        }

        size_t bufferLength = buffer.size();
        if (isoLengths == nullptr || isoLengths->empty()) {
            if (bufferLength % m_maxIsoPackets) {
                log(USB1_LOG_LEVEL_ERROR) << "Buffer size " << bufferLength << " cannot be evenly distributed among "
                    << m_maxIsoPackets << " packets" << endLog;
                throw USBError(USB1_ERROR_INVALID_PARAM, "Buffer cannot be evenly distributed among isochronous packets");
            }
            packetLengths.assign(m_maxIsoPackets, static_cast<unsigned int>(bufferLength / m_maxIsoPackets));
        } else {
            if (isoLengths->size() > static_cast<size_t>(m_maxIsoPackets)) {
                log(USB1_LOG_LEVEL_ERROR) << isoLengths->size() << " isochronous packets requested, "
                    << m_maxIsoPackets << " allocated" << endLog;
                throw USBError(USB1_ERROR_INVALID_PARAM, "Too many isochronous packets");
            }

            size_t total = std::accumulate(isoLengths->begin(), isoLengths->end(), static_cast<size_t>(0));
            if (total != bufferLength) {
                log(USB1_LOG_LEVEL_ERROR) << "Isochronous packets add up to " << total << " bytes, buffer is "
                    << bufferLength << " bytes" << endLog;
                throw USBError(USB1_ERROR_INVALID_PARAM, "Isochronous packet lengths do not match the buffer size");
            }
            packetLengths = *isoLengths;
        }
    }

    m_native->type = static_cast<uint8_t>(type);
    m_native->endpoint = endpoint;
    m_native->timeout = timeout;
    m_native->buffer = std::move(buffer);
    m_native->numIsoPackets = static_cast<int>(packetLengths.size());
    for (size_t i = 0; i < packetLengths.size(); ++i) {
        m_native->isoPackets[i].length = packetLengths[i];
        m_native->isoPackets[i].actualLength = 0;
        m_native->isoPackets[i].status = 0;
    }
    m_native->callback = &USBTransfer::CompletionTrampoline;
    m_native->userData = m_context;
    m_native->status = 0;
    m_native->actualLength = 0;
    UpdateFlags();

    m_callback = std::move(callback);
    m_userData = std::move(userData);
    m_configured = true;
    m_completed = false;
}

static std::vector<uint8_t> MakeControlBuffer(uint8_t requestType, uint8_t request, uint16_t value,
    uint16_t index, uint16_t length)
{
    std::vector<uint8_t> buffer(USB1_CONTROL_SETUP_SIZE + length, 0);
    buffer[0] = requestType;
    buffer[1] = request;
    buffer[2] = value & 0xff;
    buffer[3] = value >> 8;
    buffer[4] = index & 0xff;
    buffer[5] = index >> 8;
    buffer[6] = length & 0xff;
    buffer[7] = length >> 8;

    return buffer;
}

void USBTransfer::SetControl(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
    const std::vector<uint8_t> &data, Callback callback, std::any userData, unsigned int timeout)
{
    if (data.size() > 0xffff) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "Control transfer data too large");
    }

    std::vector<uint8_t> buffer = MakeControlBuffer(requestType, request, value, index,
        static_cast<uint16_t>(data.size()));
    std::copy(data.begin(), data.end(), buffer.begin() + USB1_CONTROL_SETUP_SIZE);

    Configure(USB1_TRANSFER_TYPE_CONTROL, 0, std::move(buffer), std::move(callback), std::move(userData),
        timeout, nullptr);
}

void USBTransfer::SetControl(uint8_t requestType, uint8_t request, uint16_t value, uint16_t index,
    uint16_t length, Callback callback, std::any userData, unsigned int timeout)
{
    Configure(USB1_TRANSFER_TYPE_CONTROL, 0, MakeControlBuffer(requestType, request, value, index, length),
        std::move(callback), std::move(userData), timeout, nullptr);
}

void USBTransfer::SetBulk(uint8_t endpoint, const std::vector<uint8_t> &data, Callback callback,
    std::any userData, unsigned int timeout)
{
    Configure(USB1_TRANSFER_TYPE_BULK, endpoint, data, std::move(callback), std::move(userData), timeout, nullptr);
}

void USBTransfer::SetBulk(uint8_t endpoint, size_t length, Callback callback, std::any userData,
    unsigned int timeout)
{
    Configure(USB1_TRANSFER_TYPE_BULK, endpoint, std::vector<uint8_t>(length, 0), std::move(callback),
        std::move(userData), timeout, nullptr);
}

void USBTransfer::SetInterrupt(uint8_t endpoint, const std::vector<uint8_t> &data, Callback callback,
    std::any userData, unsigned int timeout)
{
    Configure(USB1_TRANSFER_TYPE_INTERRUPT, endpoint, data, std::move(callback), std::move(userData), timeout,
        nullptr);
}

void USBTransfer::SetInterrupt(uint8_t endpoint, size_t length, Callback callback, std::any userData,
    unsigned int timeout)
{
    Configure(USB1_TRANSFER_TYPE_INTERRUPT, endpoint, std::vector<uint8_t>(length, 0), std::move(callback),
        std::move(userData), timeout, nullptr);
}

void USBTransfer::SetIsochronous(uint8_t endpoint, const std::vector<uint8_t> &data, Callback callback,
    std::any userData, unsigned int timeout, const std::vector<unsigned int> &isoLengths)
{
    Configure(USB1_TRANSFER_TYPE_ISOCHRONOUS, endpoint, data, std::move(callback), std::move(userData), timeout,
        &isoLengths);
}

void USBTransfer::SetIsochronous(uint8_t endpoint, size_t length, Callback callback, std::any userData,
    unsigned int timeout, const std::vector<unsigned int> &isoLengths)
{
    Configure(USB1_TRANSFER_TYPE_ISOCHRONOUS, endpoint, std::vector<uint8_t>(length, 0), std::move(callback),
        std::move(userData), timeout, &isoLengths);
}

void USBTransfer::SetBuffer(const std::vector<uint8_t> &data)
{
    CheckAlterable();

    if (!m_configured) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Transfer has not been configured");
    }
    if (m_native->type == USB1_TRANSFER_TYPE_CONTROL) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "Control transfer buffers are set with SetControl");
    }
    if (m_native->type == USB1_TRANSFER_TYPE_ISOCHRONOUS && data.size() != m_native->buffer.size()) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "Isochronous buffers cannot be resized");
    }

    m_native->buffer = data;
    m_completed = false;
}

void USBTransfer::SetBuffer(size_t length)
{
    SetBuffer(std::vector<uint8_t>(length, 0));
}

void USBTransfer::Submit()
{
    USB1_LOG;

    {
        std::lock_guard<std::mutex> lock(m_lock);

        if (m_doomed.load()) {
            throw DoomedTransferError("Cannot submit a doomed transfer");
        }
        if (m_submitted.load()) {
            throw USBError(USB1_ERROR_INVALID_STATE, "Cannot submit a submitted transfer");
        }
        if (!m_configured) {
            throw USBError(USB1_ERROR_INVALID_STATE, "Cannot submit a transfer until it has been configured");
        }
        if (m_context == nullptr) {
            throw USBError(USB1_ERROR_INVALID_STATE, "Context is closed");
        }

        m_submitted.store(true);
        m_completed = false;
    }

    int ret = m_context->AddSubmittedTransfer(m_native.get(), this);
    if (ret < 0) {
        m_submitted.store(false);
        throw USBError(ret, "Cannot submit a transfer on a closing context");
    }

    ret = m_native->Submit();
    if (ret < 0) {
        m_context->RemoveSubmittedTransfer(m_native.get());
        m_submitted.store(false);
        log(USB1_LOG_LEVEL_ERROR) << "Failed to submit transfer on endpoint 0x" << std::hex
            << static_cast<int>(m_native->endpoint) << std::dec << ": " << USBErrorName(ret) << endLog;
        throw USBError(ret, "Failed to submit transfer");
    }
}

void USBTransfer::Cancel()
{
    USB1_LOG;

    if (m_doomed.load()) {
        throw DoomedTransferError("Cannot cancel a doomed transfer");
    }
    if (!m_submitted.load()) {
        throw USBError(USB1_ERROR_NOT_FOUND, "Transfer is not submitted");
    }

    int ret = m_native->Cancel();
    if (ret < 0) {
        log(USB1_LOG_LEVEL_DEBUG) << "Failed to cancel transfer: " << USBErrorName(ret) << endLog;
        throw USBError(ret, "Failed to cancel transfer");
    }
}

int USBTransfer::CancelInFlight()
{
    std::lock_guard<std::mutex> lock(m_lock);

    if (!m_submitted.load() || !m_native) {
        return USB1_ERROR_NOT_FOUND;
    }

    return m_native->Cancel();
}

void USBTransfer::Doom()
{
    std::unique_ptr<USBNativeTransfer> released;
    {
        std::lock_guard<std::mutex> lock(m_lock);

        if (m_doomed.exchange(true)) {
            return;
        }
        if (!m_submitted.load() && !m_inCallback) {
            released = std::move(m_native);
        }
    }
}

void USBTransfer::Close()
{
    if (m_submitted.load()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Cannot close a submitted transfer");
    }

    Doom();
    m_callback = nullptr;
    m_userData.reset();
}

int USBTransfer::GetType() const
{
    return GetNative().type;
}

uint8_t USBTransfer::GetEndpoint() const
{
    return GetNative().endpoint;
}

USBControlSetup USBTransfer::GetControlSetup() const
{
    const USBNativeTransfer &native = GetNative();

    if (m_submitted.load()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Transfer is still in flight");
    }
    if (native.type != USB1_TRANSFER_TYPE_CONTROL || native.buffer.size() < USB1_CONTROL_SETUP_SIZE) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "Not a control transfer");
    }

    const std::vector<uint8_t> &buffer = native.buffer;
    USBControlSetup setup;
    setup.requestType = buffer[0];
    setup.request = buffer[1];
    setup.value = static_cast<uint16_t>(buffer[2] | (buffer[3] << 8));
    setup.index = static_cast<uint16_t>(buffer[4] | (buffer[5] << 8));
    setup.length = static_cast<uint16_t>(buffer[6] | (buffer[7] << 8));

    return setup;
}

int USBTransfer::GetStatus() const
{
    const USBNativeTransfer &native = GetNative();
    CheckCompleted();

    return native.status;
}

size_t USBTransfer::GetActualLength() const
{
    const USBNativeTransfer &native = GetNative();
    CheckCompleted();

    return static_cast<size_t>(native.actualLength);
}

std::vector<uint8_t> USBTransfer::GetBuffer() const
{
    const USBNativeTransfer &native = GetNative();

    if (m_submitted.load()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Transfer is still in flight");
    }

    if (native.type == USB1_TRANSFER_TYPE_CONTROL) {
        if (native.buffer.size() < USB1_CONTROL_SETUP_SIZE) {
            return std::vector<uint8_t>();
        }
        return std::vector<uint8_t>(native.buffer.begin() + USB1_CONTROL_SETUP_SIZE, native.buffer.end());
    }

    return native.buffer;
}

std::vector<unsigned int> USBTransfer::GetISOSetupList() const
{
    const USBNativeTransfer &native = GetNative();

    if (native.type != USB1_TRANSFER_TYPE_ISOCHRONOUS) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "Not an isochronous transfer");
    }

    std::vector<unsigned int> lengths;
    for (int i = 0; i < native.numIsoPackets; ++i) {
        lengths.push_back(native.isoPackets[i].length);
    }

    return lengths;
}

std::vector<std::vector<uint8_t>> USBTransfer::GetISOBufferList() const
{
    const USBNativeTransfer &native = GetNative();

    if (native.type != USB1_TRANSFER_TYPE_ISOCHRONOUS) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "Not an isochronous transfer");
    }
    if (m_submitted.load()) {
        throw USBError(USB1_ERROR_INVALID_STATE, "Transfer is still in flight");
    }

    std::vector<std::vector<uint8_t>> buffers;
    size_t offset = 0;
    for (int i = 0; i < native.numIsoPackets; ++i) {
        size_t length = native.isoPackets[i].length;
        buffers.emplace_back(native.buffer.begin() + offset, native.buffer.begin() + offset + length);
        offset += length;
    }

    return buffers;
}

std::vector<USBIsoPacketResult> USBTransfer::GetISOResults() const
{
    const USBNativeTransfer &native = GetNative();

    if (native.type != USB1_TRANSFER_TYPE_ISOCHRONOUS) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "Not an isochronous transfer");
    }
    CheckCompleted();

    std::vector<USBIsoPacketResult> results;
    size_t offset = 0;
    for (int i = 0; i < native.numIsoPackets; ++i) {
        const USBIsoPacket &packet = native.isoPackets[i];
        size_t actualLength = std::min(packet.actualLength, packet.length);

        USBIsoPacketResult result;
        result.status = packet.status;
        result.data.assign(native.buffer.begin() + offset, native.buffer.begin() + offset + actualLength);
        results.push_back(std::move(result));

        offset += packet.length;
    }

    return results;
}

void USBTransfer::SetCallback(Callback callback)
{
    CheckAlterable();
    m_callback = std::move(callback);
}

USBTransfer::Callback USBTransfer::GetCallback() const
{
    return m_callback;
}

void USBTransfer::SetUserData(std::any userData)
{
    if (m_doomed.load()) {
        throw DoomedTransferError("Cannot alter a doomed transfer");
    }
    m_userData = std::move(userData);
}

const std::any &USBTransfer::GetUserData() const
{
    return m_userData;
}

void USBTransfer::SetShortIsError(bool shortIsError)
{
    CheckAlterable();
    m_shortIsError = shortIsError;
    UpdateFlags();
}

bool USBTransfer::IsShortAnError() const
{
    return m_shortIsError;
}

void USBTransfer::SetAddZeroPacket(bool addZeroPacket)
{
    CheckAlterable();
    m_addZeroPacket = addZeroPacket;
    UpdateFlags();
}

bool USBTransfer::IsZeroPacketAdded() const
{
    return m_addZeroPacket;
}

void USBTransfer::HandleCompletion()
{
    USB1_LOG;

    USBContext *context = m_context;
    Callback callback;
    {
        std::lock_guard<std::mutex> lock(m_lock);
        m_submitted.store(false);
        m_completed = true;
        m_inCallback = true;
        callback = m_callback;
    }

    log(USB1_LOG_LEVEL_DEBUG) << "Transfer on endpoint 0x" << std::hex << static_cast<int>(m_native->endpoint)
        << std::dec << " completed: " << USBTransferStatusName(m_native->status) << ", "
        << m_native->actualLength << " bytes" << endLog;

    // The callback may destroy this transfer
    bool destroyed = false;
    m_destroyedFlag = &destroyed;

    if (callback) {
        try {
            callback(this);
        } catch (...) {
            context->StoreCallbackException(std::current_exception());
        }
    }

    if (destroyed) {
        return;
    }
    m_destroyedFlag = nullptr;

    std::unique_ptr<USBNativeTransfer> released;
    {
        std::lock_guard<std::mutex> lock(m_lock);
        m_inCallback = false;
        if (m_doomed.load() && !m_submitted.load()) {
            released = std::move(m_native);
        }
    }
}

void USBTransfer::Detach()
{
    USB1_LOG;

    std::lock_guard<std::mutex> lock(m_lock);

    if (m_submitted.load() && m_native) {
        // The native layer may still write to the record, it is never freed
        log(USB1_LOG_LEVEL_WARNING) << "Transfer on endpoint 0x" << std::hex << static_cast<int>(m_native->endpoint)
            << std::dec << " still in flight after close" << endLog;
        m_native.release();
        m_submitted.store(false);
    }

    m_doomed.store(true);
    m_native.reset();
    m_context = nullptr;
}

void USBTransfer::CompletionTrampoline(USBNativeTransfer *native)
{
    USB1_LOG;

    USBContext *context = static_cast<USBContext *>(native->userData);

    USBTransfer *transfer = nullptr;
    if (!context->TakeSubmittedTransfer(native, &transfer)) {
        log(USB1_LOG_LEVEL_ERROR) << "Completion of an unknown transfer" << endLog;
        return;
    }

    if (transfer == nullptr) {
        log(USB1_LOG_LEVEL_DEBUG) << "Releasing orphaned transfer: " << USBTransferStatusName(native->status) << endLog;
        delete native;
    } else {
        transfer->HandleCompletion();
    }

    context->NotifyEventWaiters();
}

USBTransferHelper::USBTransferHelper() : m_table(std::make_shared<CallbackTable>())
{}

static bool IsTransferStatus(int status)
{
    return status >= USB1_TRANSFER_COMPLETED && status <= USB1_TRANSFER_OVERFLOW;
}

void USBTransferHelper::SetEventCallback(int status, EventCallback callback)
{
    if (!IsTransferStatus(status)) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "Unknown transfer status " + std::to_string(status));
    }

    std::lock_guard<std::mutex> lock(m_table->mutex);
    m_table->callbacks[status] = std::move(callback);
}

USBTransferHelper::EventCallback USBTransferHelper::GetEventCallback(int status) const
{
    if (!IsTransferStatus(status)) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "Unknown transfer status " + std::to_string(status));
    }

    std::lock_guard<std::mutex> lock(m_table->mutex);
    auto it = m_table->callbacks.find(status);
    if (it == m_table->callbacks.end()) {
        return nullptr;
    }

    return it->second;
}

void USBTransferHelper::SetDefaultCallback(EventCallback callback)
{
    std::lock_guard<std::mutex> lock(m_table->mutex);
    m_table->defaultCallback = std::move(callback);
}

void USBTransferHelper::operator()(USBTransfer *transfer) const
{
    USB1_LOG;

    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_table->mutex);
        auto it = m_table->callbacks.find(transfer->GetStatus());
        if (it != m_table->callbacks.end() && it->second) {
            callback = it->second;
        } else {
            callback = m_table->defaultCallback;
        }
    }

    if (callback && callback(transfer)) {
        try {
            transfer->Submit();
        } catch (const DoomedTransferError &) {
            log(USB1_LOG_LEVEL_DEBUG) << "Not resubmitting doomed transfer" << endLog;
        }
    }
}
