#include "Transport.hpp"
#include "../helpers/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace Hyprutils::OS;

std::expected<UP<CSocketTransport>, std::string> CSocketTransport::connect() {
    const auto PATH = getenv("GREETD_SOCK");

    if (!PATH || PATH[0] == '\0')
        return std::unexpected(SOCKET_NOT_FOUND_ERROR);

    return connect(PATH);
}

std::expected<UP<CSocketTransport>, std::string> CSocketTransport::connect(const std::string& path) {
    sockaddr_un addr = {.sun_family = AF_UNIX};

    if (path.size() >= sizeof(addr.sun_path))
        return std::unexpected(std::format("greetd socket path too long: {}", path));

    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    CFileDescriptor fd{socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0)};
    if (!fd.isValid())
        return std::unexpected(std::format("failed to create socket: {}", strerror(errno)));

    if (::connect(fd.get(), rc<sockaddr*>(&addr), sizeof(addr)) < 0)
        return std::unexpected(std::format("failed to connect to greetd at {}: {}", path, strerror(errno)));

    g_logger->log(LOG_DEBUG, "ipc: connected to {}", path);

    return makeUnique<CSocketTransport>(std::move(fd));
}

CSocketTransport::CSocketTransport(CFileDescriptor&& fd) : m_fd(std::move(fd)) {
    ;
}

std::expected<void, std::string> CSocketTransport::writeAll(std::string_view data) {
    size_t written = 0;
    while (written < data.size()) {
        const auto RET = send(m_fd.get(), data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (RET < 0) {
            if (errno == EINTR)
                continue;
            return std::unexpected(std::format("write to greetd failed: {}", strerror(errno)));
        }
        written += sc<size_t>(RET);
    }
    return {};
}

std::expected<std::string, std::string> CSocketTransport::readExact(size_t len) {
    std::string out;
    out.resize(len);

    size_t got = 0;
    while (got < len) {
        const auto RET = read(m_fd.get(), out.data() + got, len - got);
        if (RET < 0) {
            if (errno == EINTR)
                continue;
            return std::unexpected(std::format("read from greetd failed: {}", strerror(errno)));
        }
        if (RET == 0)
            return std::unexpected(std::format("greetd closed the connection ({} of {} bytes read)", got, len));
        got += sc<size_t>(RET);
    }

    return out;
}

std::expected<SResponse, std::string> CSocketTransport::roundtrip(const SRequest& req) {
    if (!m_fd.isValid())
        return std::unexpected("not connected to greetd");

    g_logger->log(LOG_DEBUG, "ipc: >> {}", Protocol::describe(req));

    auto payload = Protocol::encodeRequest(req);
    if (!payload)
        return std::unexpected(payload.error());

    auto       frame = Protocol::frame(*payload);
    const auto WROTE = writeAll(frame);

    // both may carry a password
    std::fill(payload->begin(), payload->end(), '\0');
    std::fill(frame.begin(), frame.end(), '\0');

    if (!WROTE)
        return std::unexpected(WROTE.error());

    const auto HEADER = readExact(sizeof(uint32_t));
    if (!HEADER)
        return std::unexpected(HEADER.error());

    const auto LEN = Protocol::frameLength(*HEADER);
    if (!LEN)
        return std::unexpected(LEN.error());

    const auto BODY = readExact(*LEN);
    if (!BODY)
        return std::unexpected(BODY.error());

    auto resp = Protocol::decodeResponse(*BODY);
    if (resp)
        g_logger->log(LOG_DEBUG, "ipc: << {}", *BODY);

    return resp;
}

//
std::expected<SResponse, std::string> CDemoTransport::roundtrip(const SRequest& req) {
    return std::visit(
        [this](const auto& r) -> std::expected<SResponse, std::string> {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, SCreateSession>) {
                g_logger->log(LOG_DEBUG, "demo: create_session for {}", r.username);
                m_sessionOpen = true;
                return SBrokerAuthMessage{.type = AUTH_MESSAGE_SECRET, .message = "Password: "};
            } else if constexpr (std::is_same_v<T, SPostAuthResponse>) {
                if (!m_sessionOpen)
                    return SBrokerError{.type = BROKER_ERROR_OTHER, .description = "no session in progress"};
                if (r.response && *r.response == "demo")
                    return SBrokerSuccess{};
                // greetd drops the session on a failed auth
                m_sessionOpen = false;
                return SBrokerError{.type = BROKER_ERROR_OTHER, .description = "Invalid password (hint: use 'demo')"};
            } else if constexpr (std::is_same_v<T, SStartSession>) {
                g_logger->log(LOG_DEBUG, "demo: would start {} with {} env vars", r.cmd.empty() ? "nothing" : r.cmd.front(), r.env.size());
                m_sessionOpen = false;
                return SBrokerSuccess{};
            } else {
                m_sessionOpen = false;
                return SBrokerSuccess{};
            }
        },
        req);
}
