#include "Protocol.hpp"
#include "../helpers/Memory.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <cstring>
#include <format>

// flat shapes of the json on the wire, member names are the keys. Absent optionals are not written.
struct SWireRequest {
    std::string                             type;
    std::optional<std::string>              username;
    std::optional<std::string>              response;
    std::optional<std::vector<std::string>> cmd;
    std::optional<std::vector<std::string>> env;
};

struct SWireResponse {
    std::string                type;
    std::optional<std::string> auth_message_type;
    std::optional<std::string> auth_message;
    std::optional<std::string> error_type;
    std::optional<std::string> description;
};

constexpr const char* AUTH_MESSAGE_TYPE_NAMES[] = {"secret", "visible", "info", "error"};

//
std::expected<std::string, std::string> Protocol::encodeRequest(const SRequest& req) {
    SWireRequest wire;

    std::visit(
        [&wire](const auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, SCreateSession>) {
                wire.type     = "create_session";
                wire.username = r.username;
            } else if constexpr (std::is_same_v<T, SPostAuthResponse>) {
                wire.type     = "post_auth_message_response";
                wire.response = r.response;
            } else if constexpr (std::is_same_v<T, SStartSession>) {
                wire.type = "start_session";
                wire.cmd  = r.cmd;
                wire.env  = r.env;
            } else if constexpr (std::is_same_v<T, SCancelSession>)
                wire.type = "cancel_session";
        },
        req);

    auto json = glz::write_json(wire);

    // the response may have been a secret, don't leave a copy behind in the wire struct
    if (wire.response)
        std::fill(wire.response->begin(), wire.response->end(), '\0');

    if (!json)
        return std::unexpected(std::format("failed to encode {} request", wire.type));

    return std::move(*json);
}

std::expected<SRequest, std::string> Protocol::decodeRequest(std::string_view json) {
    SWireRequest wire;
    std::string  buf{json};

    if (const auto ERR = glz::read<glz::opts{.error_on_unknown_keys = false}>(wire, buf); ERR)
        return std::unexpected(std::format("malformed request: {}", glz::format_error(ERR, buf)));

    if (wire.type == "create_session") {
        if (!wire.username)
            return std::unexpected("malformed request: create_session without username");
        return SCreateSession{.username = *wire.username};
    }

    if (wire.type == "post_auth_message_response")
        return SPostAuthResponse{.response = wire.response};

    if (wire.type == "start_session") {
        if (!wire.cmd)
            return std::unexpected("malformed request: start_session without cmd");
        return SStartSession{.cmd = *wire.cmd, .env = wire.env.value_or(std::vector<std::string>{})};
    }

    if (wire.type == "cancel_session")
        return SCancelSession{};

    return std::unexpected(std::format("malformed request: unknown type \"{}\"", wire.type));
}

std::expected<std::string, std::string> Protocol::encodeResponse(const SResponse& resp) {
    SWireResponse wire;

    std::visit(
        [&wire](const auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, SBrokerSuccess>)
                wire.type = "success";
            else if constexpr (std::is_same_v<T, SBrokerAuthMessage>) {
                wire.type              = "auth_message";
                wire.auth_message_type = AUTH_MESSAGE_TYPE_NAMES[r.type];
                wire.auth_message      = r.message;
            } else if constexpr (std::is_same_v<T, SBrokerError>) {
                wire.type        = "error";
                wire.error_type  = r.type == BROKER_ERROR_AUTH ? "auth_error" : "error";
                wire.description = r.description;
            }
        },
        resp);

    auto json = glz::write_json(wire);
    if (!json)
        return std::unexpected(std::format("failed to encode {} response", wire.type));

    return std::move(*json);
}

std::expected<SResponse, std::string> Protocol::decodeResponse(std::string_view json) {
    SWireResponse wire;
    std::string   buf{json};

    if (const auto ERR = glz::read<glz::opts{.error_on_unknown_keys = false}>(wire, buf); ERR)
        return std::unexpected(std::format("malformed response: {}", glz::format_error(ERR, buf)));

    if (wire.type == "success")
        return SBrokerSuccess{};

    if (wire.type == "auth_message") {
        if (!wire.auth_message_type)
            return std::unexpected("malformed response: auth_message without auth_message_type");

        for (size_t i = 0; i < std::size(AUTH_MESSAGE_TYPE_NAMES); ++i) {
            if (*wire.auth_message_type == AUTH_MESSAGE_TYPE_NAMES[i])
                return SBrokerAuthMessage{.type = sc<eAuthMessageType>(i), .message = wire.auth_message.value_or("")};
        }

        return std::unexpected(std::format("malformed response: unknown auth_message_type \"{}\"", *wire.auth_message_type));
    }

    if (wire.type == "error") {
        const auto TYPE = wire.error_type.value_or("error");
        if (TYPE != "auth_error" && TYPE != "error")
            return std::unexpected(std::format("malformed response: unknown error_type \"{}\"", TYPE));

        return SBrokerError{.type = TYPE == "auth_error" ? BROKER_ERROR_AUTH : BROKER_ERROR_OTHER, .description = wire.description.value_or("")};
    }

    return std::unexpected(std::format("malformed response: unknown type \"{}\"", wire.type));
}

std::string Protocol::frame(std::string_view payload) {
    const auto  LEN = sc<uint32_t>(payload.size());

    std::string out;
    out.resize(sizeof(LEN) + payload.size());
    std::memcpy(out.data(), &LEN, sizeof(LEN));
    std::memcpy(out.data() + sizeof(LEN), payload.data(), payload.size());
    return out;
}

std::expected<uint32_t, std::string> Protocol::frameLength(std::string_view header) {
    uint32_t len = 0;

    if (header.size() != sizeof(len))
        return std::unexpected(std::format("malformed frame: header is {} bytes", header.size()));

    std::memcpy(&len, header.data(), sizeof(len));

    if (len > MAX_FRAME_LENGTH)
        return std::unexpected(std::format("malformed frame: {} bytes exceeds the limit", len));

    return len;
}

std::string Protocol::describe(const SRequest& req) {
    return std::visit(
        [](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, SCreateSession>)
                return std::format("create_session(username: {})", r.username);
            else if constexpr (std::is_same_v<T, SPostAuthResponse>)
                return std::format("post_auth_message_response({})", r.response ? "<redacted>" : "none");
            else if constexpr (std::is_same_v<T, SStartSession>)
                return std::format("start_session(cmd: {}, env: {})", r.cmd.size(), r.env.size());
            else
                return "cancel_session";
        },
        req);
}
