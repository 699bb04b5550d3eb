#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// greetd ipc: every message is a native endian u32 length followed by that many bytes of json

struct SCreateSession {
    std::string username;
};

struct SPostAuthResponse {
    std::optional<std::string> response;
};

struct SStartSession {
    std::vector<std::string> cmd;
    std::vector<std::string> env;
};

struct SCancelSession {};

using SRequest = std::variant<SCreateSession, SPostAuthResponse, SStartSession, SCancelSession>;

enum eAuthMessageType : uint8_t {
    AUTH_MESSAGE_SECRET = 0,
    AUTH_MESSAGE_VISIBLE,
    AUTH_MESSAGE_INFO,
    AUTH_MESSAGE_ERROR,
};

enum eBrokerErrorType : uint8_t {
    BROKER_ERROR_AUTH = 0,
    BROKER_ERROR_OTHER,
};

struct SBrokerSuccess {};

struct SBrokerAuthMessage {
    eAuthMessageType type = AUTH_MESSAGE_SECRET;
    std::string      message;
};

struct SBrokerError {
    eBrokerErrorType type = BROKER_ERROR_OTHER;
    std::string      description;
};

using SResponse = std::variant<SBrokerSuccess, SBrokerAuthMessage, SBrokerError>;

namespace Protocol {
    constexpr uint32_t                         MAX_FRAME_LENGTH = 1024 * 1024;

    std::expected<std::string, std::string>    encodeRequest(const SRequest& req);
    std::expected<SRequest, std::string>       decodeRequest(std::string_view json);

    std::expected<std::string, std::string>    encodeResponse(const SResponse& resp);
    std::expected<SResponse, std::string>      decodeResponse(std::string_view json);

    // length prefix + payload
    std::string                                frame(std::string_view payload);

    // payload length from a 4 byte header
    std::expected<uint32_t, std::string>       frameLength(std::string_view header);

    // for logs, never contains an auth response
    std::string                                describe(const SRequest& req);
}
