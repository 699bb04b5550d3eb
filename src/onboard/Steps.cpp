#include "Steps.hpp"
#include "Config.hpp"

const char* stepName(eStepId id) {
    switch (id) {
        case STEP_USER: return "User";
        case STEP_LOCALE: return "Locale";
        case STEP_KEYBOARD: return "Keyboard";
        case STEP_NETWORK: return "Network";
        case STEP_PREFERENCES: return "Timezone";
        case STEP_REVIEW: return "Review";
        case STEP_UPDATE: return "Update";
        case STEP_REBOOT: return "Reboot";
    }
    return "?";
}

const char* stepResultName(eStepResult result) {
    switch (result) {
        case STEP_RESULT_PENDING: return "pending";
        case STEP_RESULT_COMPLETED: return "done";
        case STEP_RESULT_SKIPPED: return "skipped";
        case STEP_RESULT_FAILED: return "failed";
        case STEP_RESULT_LOCKED: return "locked";
    }
    return "?";
}

CStepSequence::CStepSequence(const SOnboardConfig& config) {
    m_items.emplace_back(SStepItem{.id = STEP_USER, .required = true, .hasForm = true});

    if (config.locale.enabled)
        m_items.emplace_back(SStepItem{.id = STEP_LOCALE, .hasPicker = true});
    if (config.keyboard.enabled)
        m_items.emplace_back(SStepItem{.id = STEP_KEYBOARD, .hasPicker = true});
    if (config.network.enabled)
        m_items.emplace_back(SStepItem{.id = STEP_NETWORK});
    if (config.preferences.timezoneEnabled)
        m_items.emplace_back(SStepItem{.id = STEP_PREFERENCES, .hasPicker = true});

    m_items.emplace_back(SStepItem{.id = STEP_REVIEW, .required = true});

    // the sudo password field is the form here
    if (!config.updates.empty())
        m_items.emplace_back(SStepItem{.id = STEP_UPDATE, .hasForm = true});

    m_items.emplace_back(SStepItem{.id = STEP_REBOOT, .required = true});

    for (const auto& i : m_items) {
        m_results.emplace_back(i.id == STEP_UPDATE || i.id == STEP_REBOOT ? STEP_RESULT_LOCKED : STEP_RESULT_PENDING);
    }
}

size_t CStepSequence::size() const {
    return m_items.size();
}

const SStepItem& CStepSequence::item(size_t idx) const {
    return m_items.at(idx);
}

eStepResult CStepSequence::result(size_t idx) const {
    return m_results.at(idx);
}

std::optional<size_t> CStepSequence::indexOf(eStepId id) const {
    for (size_t i = 0; i < m_items.size(); ++i) {
        if (m_items[i].id == id)
            return i;
    }
    return std::nullopt;
}

bool CStepSequence::isLocked(size_t idx) const {
    return idx < m_results.size() && m_results[idx] == STEP_RESULT_LOCKED;
}

bool CStepSequence::setResult(size_t idx, eStepResult result) {
    if (idx >= m_results.size())
        return false;

    const auto CURRENT = m_results[idx];

    // locked steps only open through onReviewCompleted / onUpdateFinished
    if (CURRENT == STEP_RESULT_LOCKED || result == STEP_RESULT_LOCKED)
        return false;

    if ((CURRENT == STEP_RESULT_COMPLETED || CURRENT == STEP_RESULT_SKIPPED) && result == STEP_RESULT_PENDING)
        return false;

    m_results[idx] = result;
    return true;
}

void CStepSequence::unlock(eStepId id) {
    const auto IDX = indexOf(id);
    if (IDX && m_results[*IDX] == STEP_RESULT_LOCKED)
        m_results[*IDX] = STEP_RESULT_PENDING;
}

void CStepSequence::onReviewCompleted() {
    if (indexOf(STEP_UPDATE))
        unlock(STEP_UPDATE);
    else
        unlock(STEP_REBOOT);
}

void CStepSequence::onUpdateFinished() {
    unlock(STEP_REBOOT);
}
