#pragma once

#include "Protocol.hpp"
#include "../helpers/Memory.hpp"

#include <hyprutils/os/FileDescriptor.hpp>

constexpr const char* SOCKET_NOT_FOUND_ERROR = "greetd socket not found (GREETD_SOCK not set)";

// One request, then exactly one response. No pipelining.
class IBrokerTransport {
  public:
    virtual ~IBrokerTransport() = default;

    virtual std::expected<SResponse, std::string> roundtrip(const SRequest& req) = 0;
};

class CSocketTransport : public IBrokerTransport {
  public:
    ~CSocketTransport() override = default;

    // connects to $GREETD_SOCK
    static std::expected<UP<CSocketTransport>, std::string> connect();
    static std::expected<UP<CSocketTransport>, std::string> connect(const std::string& path);

    // for an already connected stream (tests use a socketpair)
    explicit CSocketTransport(Hyprutils::OS::CFileDescriptor&& fd);

    std::expected<SResponse, std::string> roundtrip(const SRequest& req) override;

  private:
    std::expected<void, std::string>        writeAll(std::string_view data);
    std::expected<std::string, std::string> readExact(size_t len);

    Hyprutils::OS::CFileDescriptor          m_fd;
};

// Answers like a broker that knows a single password, "demo". Does no io.
class CDemoTransport : public IBrokerTransport {
  public:
    ~CDemoTransport() override = default;

    std::expected<SResponse, std::string> roundtrip(const SRequest& req) override;

  private:
    bool m_sessionOpen = false;
};
