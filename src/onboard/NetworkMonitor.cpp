#include "NetworkMonitor.hpp"
#include "Service.hpp"
#include "../helpers/Logger.hpp"

#include <system_error>

CNetworkMonitor::CNetworkMonitor(IOnboardService& service) : m_service(service) {
    ;
}

CNetworkMonitor::~CNetworkMonitor() {
    if (m_thread.joinable())
        m_thread.join();
}

bool CNetworkMonitor::connected() const {
    return m_connected;
}

void CNetworkMonitor::probeNow() {
    m_connected = m_service.checkNetwork();
    g_logger->log(LOG_TRACE, "network: connected = {}", m_connected.load());
}

void CNetworkMonitor::probeAsync() {
    if (m_probing)
        return;

    if (m_thread.joinable())
        m_thread.join();

    m_probing = true;

    try {
        m_thread = std::thread([this] {
            m_connected = m_service.checkNetwork();
            m_probing   = false;
        });
    } catch (const std::system_error& e) {
        m_probing = false;
        g_logger->log(LOG_WARN, "network: failed to start probe: {}", e.what());
    }
}
