#pragma once

#include "Messages.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include <hyprutils/os/FileDescriptor.hpp>

// Ordered, thread safe mailbox from workers to the ui thread.
// Every post also makes wakeFd() readable so the ui loop's poll() returns.
class CExecutionChannel {
  public:
    CExecutionChannel();
    ~CExecutionChannel() = default;

    CExecutionChannel(const CExecutionChannel&)            = delete;
    CExecutionChannel& operator=(const CExecutionChannel&) = delete;

    bool                           good() const;

    void                           post(SExecutionMessage&& msg);

    // everything posted so far, oldest first. Also drains the wake pipe.
    std::vector<SExecutionMessage> drain();

    int                            wakeFd() const;

  private:
    std::mutex                     m_mutex;
    std::deque<SExecutionMessage>  m_queue;

    Hyprutils::OS::CFileDescriptor m_wakeRead, m_wakeWrite;
};
