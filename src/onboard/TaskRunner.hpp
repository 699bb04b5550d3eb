#pragma once

#include <expected>
#include <functional>
#include <string>
#include <thread>

// Owns the worker thread of one background operation at a time.
// A new launch joins the previous worker first, and so does destruction.
class CTaskRunner {
  public:
    CTaskRunner() = default;
    ~CTaskRunner();

    CTaskRunner(const CTaskRunner&)            = delete;
    CTaskRunner& operator=(const CTaskRunner&) = delete;

    std::expected<void, std::string> launch(std::function<void()>&& job);

    // blocks until the current job returned
    void                             wait();

  private:
    std::thread m_thread;
};
