#include "Simulation.hpp"

void CSimulationClock::start(eSimulationTarget target) {
    m_active   = true;
    m_task     = 0;
    m_progress = 0;
    m_target   = target;
}

bool CSimulationClock::active() const {
    return m_active;
}

void CSimulationClock::stop() {
    m_active = false;
}

std::optional<eSimulationTarget> CSimulationClock::tick(std::vector<STaskStatus>& tasks) {
    if (!m_active)
        return std::nullopt;

    if (m_task >= tasks.size()) {
        m_active = false;
        return m_target;
    }

    auto& task = tasks[m_task];
    task.state = TASK_RUNNING;

    m_progress += STEP;
    task.progress = m_progress;

    if (m_progress >= 100) {
        task.state = TASK_SUCCESS;
        m_task++;
        m_progress = 0;
    }

    return std::nullopt;
}
