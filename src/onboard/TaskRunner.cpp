#include "TaskRunner.hpp"
#include "../helpers/Logger.hpp"

#include <format>
#include <system_error>

CTaskRunner::~CTaskRunner() {
    wait();
}

std::expected<void, std::string> CTaskRunner::launch(std::function<void()>&& job) {
    wait();

    try {
        m_thread = std::thread(std::move(job));
    } catch (const std::system_error& e) {
        g_logger->log(LOG_ERR, "runner: failed to start a worker: {}", e.what());
        return std::unexpected(std::format("Failed to start background task: {}", e.what()));
    }

    return {};
}

void CTaskRunner::wait() {
    if (m_thread.joinable())
        m_thread.join();
}
