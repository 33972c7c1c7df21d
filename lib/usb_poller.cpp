#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>

#include "usb_poller.hpp"
#include "usb_context.hpp"
#include "usb_log.hpp"

USBPoller::USBPoller(USBContext *context) : m_context(context)
{
    USB1_LOG;

    if (m_context == nullptr) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "No USB context");
    }

    m_context->SetPollFDNotifiers(
        [this](int fd, short events) { AddUSBFD(fd, events); },
        [this](int fd) { RemoveUSBFD(fd); });

    for (const USBPollFD &pollFD : m_context->GetPollFDList()) {
        AddUSBFD(pollFD.fd, pollFD.events);
    }

    log(USB1_LOG_LEVEL_DEBUG) << "Polling " << m_usbFds.size() << " USB fds" << endLog;
}

USBPoller::~USBPoller()
{
    USB1_LOG;

    if (!m_context->IsOpen()) {
        return;
    }

    try {
        m_context->SetPollFDNotifiers(nullptr, nullptr);
    } catch (const USBError &e) {
        log(USB1_LOG_LEVEL_WARNING) << "Failed to clear fd notifiers: " << e.what() << endLog;
    }
}

void USBPoller::AddUSBFD(int fd, short events)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fds[fd] = events;
    m_usbFds.insert(fd);
}

void USBPoller::RemoveUSBFD(int fd)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_usbFds.erase(fd);
    m_fds.erase(fd);
}

bool USBPoller::IsUSBFD(int fd)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_usbFds.count(fd) != 0;
}

void USBPoller::Register(int fd, short events)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_usbFds.count(fd)) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "fd " + std::to_string(fd) + " is a USB event fd, it cannot be polled");
    }

    m_fds[fd] = events;
}

void USBPoller::Unregister(int fd)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_usbFds.count(fd)) {
        throw USBError(USB1_ERROR_INVALID_PARAM, "fd " + std::to_string(fd) + " is a USB event fd, it must stay registered");
    }

    m_fds.erase(fd);
}

std::vector<std::pair<int, short>> USBPoller::Poll(std::optional<std::chrono::milliseconds> timeout)
{
    USB1_LOG;

    std::optional<std::chrono::microseconds> nextTimeout = m_context->GetNextTimeout();

    int pollTimeout = -1;
    if (timeout && timeout->count() >= 0) {
        std::chrono::milliseconds wait = *timeout;
        if (nextTimeout) {
            wait = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(*nextTimeout));
        }
        pollTimeout = static_cast<int>(wait.count());
    } else if (nextTimeout) {
        pollTimeout = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(*nextTimeout).count());
    }

    std::vector<struct pollfd> pollFDs;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &entry : m_fds) {
            struct pollfd pollFD;
            pollFD.fd = entry.first;
            pollFD.events = entry.second;
            pollFD.revents = 0;
            pollFDs.push_back(pollFD);
        }
    }

    int ret = poll(pollFDs.data(), pollFDs.size(), pollTimeout);
    if (ret < 0) {
        if (errno == EINTR) {
            throw USBError(USB1_ERROR_INTERRUPTED, "poll interrupted");
        }
        log(USB1_LOG_LEVEL_ERROR) << "poll failed: " << strerror(errno) << endLog;
        throw USBError(USB1_ERROR_IO, "poll failed");
    }

    std::vector<std::pair<int, short>> result;
    bool usbReady = false;
    for (const struct pollfd &pollFD : pollFDs) {
        if (pollFD.revents == 0) {
            continue;
        }
        if (IsUSBFD(pollFD.fd)) {
            usbReady = true;
        } else {
            result.emplace_back(pollFD.fd, pollFD.revents);
        }
    }

    // Expired native timeouts are only processed by handling events
    if (usbReady || ret == 0) {
        m_context->HandleEventsTimeout(std::chrono::microseconds(0));
    }

    return result;
}
