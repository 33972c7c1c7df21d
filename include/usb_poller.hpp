#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <utility>
#include <vector>

class USBContext;

// Integrates a context's event fds into a poll(2) loop alongside unrelated
// fds. The context's fd notifiers are owned by the poller for its lifetime.
//
// Poll() must not be called from several threads at once.
class USBPoller {
public:
    explicit USBPoller(USBContext *context);
    ~USBPoller();

    USBPoller(const USBPoller &) = delete;
    USBPoller &operator=(const USBPoller &) = delete;

    void Register(int fd, short events);
    void Unregister(int fd);

    // Returns the ready (fd, revents) pairs of the fds added with Register().
    // Without a timeout the wait is bounded only by the context's next
    // native timeout.
    std::vector<std::pair<int, short>> Poll(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    bool IsUSBFD(int fd);

private:
    void AddUSBFD(int fd, short events);
    void RemoveUSBFD(int fd);

    USBContext *m_context;
    std::mutex m_mutex;
    std::map<int, short> m_fds;
    std::set<int> m_usbFds;
};
