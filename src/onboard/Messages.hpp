#pragma once

#include "Steps.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

enum eTaskState : uint8_t {
    TASK_PENDING = 0,
    TASK_RUNNING,
    TASK_SUCCESS,
    TASK_FAILED,
};

struct STaskStatus {
    std::string                name;
    eTaskState                 state = TASK_PENDING;
    std::optional<std::string> output;
    std::optional<uint8_t>     progress; // simulated runs only
};

// what background work tells the controller, in the order it happened

struct STaskStarted {
    size_t idx = 0;
};

struct STaskSucceeded {
    size_t                     idx = 0;
    std::optional<std::string> output;
};

struct STaskFailed {
    size_t      idx = 0;
    std::string error;
};

struct SUserCreated {
    std::optional<std::string> username;
};

struct SStepComplete {
    eStepResult result = STEP_RESULT_COMPLETED;
};

struct SReviewComplete {
    bool anyFailed = false;
};

struct SUpdateComplete {
    bool anyFailed = false;
};

using SExecutionMessage = std::variant<STaskStarted, STaskSucceeded, STaskFailed, SUserCreated, SStepComplete, SReviewComplete, SUpdateComplete>;
