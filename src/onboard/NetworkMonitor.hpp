#pragma once

#include <atomic>
#include <thread>

class IOnboardService;

// Connectivity as last seen by the probe. Probes after the first one run on
// their own thread so a slow ping never stalls the ui.
class CNetworkMonitor {
  public:
    explicit CNetworkMonitor(IOnboardService& service);
    ~CNetworkMonitor();

    CNetworkMonitor(const CNetworkMonitor&)            = delete;
    CNetworkMonitor& operator=(const CNetworkMonitor&) = delete;

    bool connected() const;

    void probeNow();
    // no-op while a probe is still running
    void probeAsync();

  private:
    IOnboardService&  m_service;
    std::atomic<bool> m_connected = false;
    std::atomic<bool> m_probing   = false;
    std::thread       m_thread;
};
