#pragma once

#include <cstdint>
#include <optional>
#include <vector>

struct SOnboardConfig;

enum eStepId : uint8_t {
    STEP_USER = 0,
    STEP_LOCALE,
    STEP_KEYBOARD,
    STEP_NETWORK,
    STEP_PREFERENCES,
    STEP_REVIEW,
    STEP_UPDATE,
    STEP_REBOOT,
};

enum eStepResult : uint8_t {
    STEP_RESULT_PENDING = 0,
    STEP_RESULT_COMPLETED,
    STEP_RESULT_SKIPPED,
    STEP_RESULT_FAILED,
    STEP_RESULT_LOCKED,
};

struct SStepItem {
    eStepId id        = STEP_USER;
    bool    required  = false;
    bool    hasPicker = false;
    bool    hasForm   = false;
};

const char* stepName(eStepId id);
const char* stepResultName(eStepResult result);

// The ordered steps of the wizard and one result per step.
// Update and Reboot start locked. Unlocking is one way, and a finished
// (completed or skipped) step never goes back to pending or locked.
class CStepSequence {
  public:
    explicit CStepSequence(const SOnboardConfig& config);

    size_t                  size() const;
    const SStepItem&        item(size_t idx) const;
    eStepResult             result(size_t idx) const;
    std::optional<size_t>   indexOf(eStepId id) const;
    bool                    isLocked(size_t idx) const;

    // false when the transition isn't allowed
    bool                    setResult(size_t idx, eStepResult result);

    // review completed: Update opens, or Reboot if there is no Update step
    void                    onReviewCompleted();
    // update completed or skipped: Reboot opens
    void                    onUpdateFinished();

  private:
    void                     unlock(eStepId id);

    std::vector<SStepItem>   m_items;
    std::vector<eStepResult> m_results;
};
