#pragma once

#include "Messages.hpp"

#include <cstdint>
#include <optional>
#include <vector>

enum eSimulationTarget : uint8_t {
    SIMULATION_REVIEW = 0,
    SIMULATION_UPDATE,
};

// Stands in for the task runner in dry runs: every tick moves the active task
// 10% further. A task at 100% succeeds and the next one starts on the following tick.
// The tick after the last task finished reports which completion to run.
class CSimulationClock {
  public:
    static constexpr uint8_t STEP = 10;

    void                             start(eSimulationTarget target);
    bool                             active() const;
    void                             stop();

    std::optional<eSimulationTarget> tick(std::vector<STaskStatus>& tasks);

  private:
    bool              m_active   = false;
    size_t            m_task     = 0;
    uint8_t           m_progress = 0;
    eSimulationTarget m_target   = SIMULATION_REVIEW;
};
