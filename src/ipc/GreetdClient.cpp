#include "GreetdClient.hpp"
#include "../helpers/Logger.hpp"

#include <algorithm>
#include <format>

CGreetdClient::CGreetdClient(UP<IBrokerTransport>&& transport) : m_transport(std::move(transport)) {
    ;
}

std::expected<SAuthExchange, std::string> CGreetdClient::toExchange(std::expected<SResponse, std::string>&& resp) {
    if (!resp)
        return std::unexpected(resp.error());

    return std::visit(
        [](auto&& r) -> SAuthExchange {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, SBrokerSuccess>)
                return SAuthSuccess{};
            else if constexpr (std::is_same_v<T, SBrokerAuthMessage>) {
                switch (r.type) {
                    case AUTH_MESSAGE_SECRET: return SPromptSecret{r.message};
                    case AUTH_MESSAGE_VISIBLE: return SPromptVisible{r.message};
                    case AUTH_MESSAGE_INFO: return SAuthInfo{r.message};
                    case AUTH_MESSAGE_ERROR: return SAuthError{.text = r.message, .sessionEnded = false};
                }
                return SAuthError{r.message};
            } else {
                // don't leak pam's reason for a failed auth
                if (r.type == BROKER_ERROR_AUTH)
                    return SAuthError{.text = "Authentication failed"};
                return SAuthError{.text = r.description};
            }
        },
        std::move(*resp));
}

std::expected<SAuthExchange, std::string> CGreetdClient::createSession(const std::string& username) {
    return toExchange(m_transport->roundtrip(SCreateSession{.username = username}));
}

std::expected<SAuthExchange, std::string> CGreetdClient::postAuthResponse(std::optional<std::string> response) {
    SRequest req = SPostAuthResponse{.response = std::move(response)};
    auto     resp = m_transport->roundtrip(req);

    if (auto& r = std::get<SPostAuthResponse>(req); r.response)
        std::fill(r.response->begin(), r.response->end(), '\0');

    return toExchange(std::move(resp));
}

std::expected<void, std::string> CGreetdClient::startSession(const std::vector<std::string>& cmd, const std::vector<std::string>& env) {
    const auto RESP = m_transport->roundtrip(SStartSession{.cmd = cmd, .env = env});
    if (!RESP)
        return std::unexpected(RESP.error());

    if (std::holds_alternative<SBrokerSuccess>(*RESP))
        return {};

    if (const auto ERR = std::get_if<SBrokerError>(&*RESP)) {
        g_logger->log(LOG_ERR, "ipc: start_session failed: {}", ERR->description);
        return std::unexpected(std::format("Failed to start session: {}", ERR->description));
    }

    return std::unexpected("Failed to start session: unexpected response");
}

std::expected<void, std::string> CGreetdClient::cancelSession() {
    const auto RESP = m_transport->roundtrip(SCancelSession{});
    if (!RESP)
        return std::unexpected(RESP.error());

    if (const auto ERR = std::get_if<SBrokerError>(&*RESP))
        return std::unexpected(ERR->description);

    return {};
}
