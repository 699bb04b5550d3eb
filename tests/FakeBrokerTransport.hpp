#pragma once

#include "ipc/Transport.hpp"

#include <deque>
#include <vector>

// Replays canned responses in order and records every request it was sent.
// Runs dry with an io error.
class CFakeBrokerTransport : public IBrokerTransport {
  public:
    struct SState {
        std::deque<std::expected<SResponse, std::string>> script;
        std::vector<SRequest>                             sent;
    };

    explicit CFakeBrokerTransport(SState& state) : m_state(state) {
        ;
    }

    std::expected<SResponse, std::string> roundtrip(const SRequest& req) override {
        m_state.sent.push_back(req);

        if (m_state.script.empty())
            return std::unexpected("script exhausted");

        auto next = std::move(m_state.script.front());
        m_state.script.pop_front();
        return next;
    }

  private:
    SState& m_state;
};

inline SResponse secretPrompt(std::string text = "Password:") {
    return SBrokerAuthMessage{.type = AUTH_MESSAGE_SECRET, .message = std::move(text)};
}

inline SResponse authMessage(eAuthMessageType type, std::string text) {
    return SBrokerAuthMessage{.type = type, .message = std::move(text)};
}

inline SResponse brokerError(eBrokerErrorType type, std::string text) {
    return SBrokerError{.type = type, .description = std::move(text)};
}
