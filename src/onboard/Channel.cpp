#include "Channel.hpp"
#include "../helpers/Logger.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

using namespace Hyprutils::OS;

CExecutionChannel::CExecutionChannel() {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) < 0) {
        g_logger->log(LOG_ERR, "channel: pipe2 failed: {}", strerror(errno));
        return;
    }

    m_wakeRead  = CFileDescriptor{fds[0]};
    m_wakeWrite = CFileDescriptor{fds[1]};
}

bool CExecutionChannel::good() const {
    return m_wakeRead.isValid() && m_wakeWrite.isValid();
}

void CExecutionChannel::post(SExecutionMessage&& msg) {
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_queue.emplace_back(std::move(msg));
    }

    // a full pipe already means "wake up"
    if (m_wakeWrite.isValid() && write(m_wakeWrite.get(), "x", 1) < 0 && errno != EAGAIN)
        g_logger->log(LOG_WARN, "channel: wake write failed: {}", strerror(errno));
}

std::vector<SExecutionMessage> CExecutionChannel::drain() {
    if (m_wakeRead.isValid()) {
        char buf[64];
        while (read(m_wakeRead.get(), buf, sizeof(buf)) > 0) {
            ;
        }
    }

    std::lock_guard<std::mutex>    lg(m_mutex);
    std::vector<SExecutionMessage> out{std::make_move_iterator(m_queue.begin()), std::make_move_iterator(m_queue.end())};
    m_queue.clear();
    return out;
}

int CExecutionChannel::wakeFd() const {
    return m_wakeRead.get();
}
