#pragma once

#include "Transport.hpp"

struct SPromptSecret {
    std::string prompt;
};

struct SPromptVisible {
    std::string prompt;
};

struct SAuthInfo {
    std::string text;
};

struct SAuthError {
    std::string text;
    bool        sessionEnded = true; // false for a pam error message that still wants an answer
};

struct SAuthSuccess {};

using SAuthExchange = std::variant<SPromptSecret, SPromptVisible, SAuthInfo, SAuthError, SAuthSuccess>;

// Typed requests over a broker transport. Transport failures are errors,
// anything the broker says (including refusals) is an SAuthExchange.
class CGreetdClient {
  public:
    explicit CGreetdClient(UP<IBrokerTransport>&& transport);

    std::expected<SAuthExchange, std::string> createSession(const std::string& username);
    std::expected<SAuthExchange, std::string> postAuthResponse(std::optional<std::string> response);
    std::expected<void, std::string>          startSession(const std::vector<std::string>& cmd, const std::vector<std::string>& env);
    std::expected<void, std::string>          cancelSession();

  private:
    std::expected<SAuthExchange, std::string> toExchange(std::expected<SResponse, std::string>&& resp);

    UP<IBrokerTransport>                      m_transport;
};
