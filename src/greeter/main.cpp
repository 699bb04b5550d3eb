#include "Greeter.hpp"
#include "Ui.hpp"

#include "../helpers/Logger.hpp"
#include "../ipc/Transport.hpp"
#include "../tui/Terminal.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <print>

#include <poll.h>
#include <unistd.h>

#include <hyprutils/cli/ArgumentParser.hpp>

using namespace Hyprutils::CLI;

#define ASSERT(expr)                                                                                                                                                               \
    if (!(expr)) {                                                                                                                                                                 \
        g_logger->log(LOG_CRIT, "Failed assertion at line {} in {}: {} was false", __LINE__,                                                                                       \
                      ([]() constexpr -> std::string { return std::string(__FILE__).substr(std::string(__FILE__).find("/src/") + 1); })(), #expr);                                 \
        std::abort();                                                                                                                                                              \
    }

// the header clock
constexpr int REDRAW_MS = 1000;

static int run(CTerminal& term, CGreeter& greeter) {
    pollfd fd = {
        .fd     = STDIN_FILENO,
        .events = POLLIN,
    };

    GreeterUi::draw(term, greeter);

    while (!greeter.shouldExit()) {
        if (poll(&fd, 1, REDRAW_MS) < 0) {
            if (errno == EINTR)
                continue;
            g_logger->log(LOG_ERR, "poll() failed: {}", strerror(errno));
            return 1;
        }

        if (fd.revents & POLLIN) {
            for (const auto& key : term.readKeys()) {
                greeter.handleKey(key);
                GreeterUi::draw(term, greeter);

                if (greeter.shouldExit())
                    break;
            }
        } else if (fd.revents & (POLLHUP | POLLERR)) {
            g_logger->log(LOG_ERR, "terminal went away");
            return 1;
        }

        GreeterUi::draw(term, greeter);
    }

    return greeter.exitSuccess() ? 0 : 1;
}

int main(int argc, const char** argv) {
    CArgumentParser parser({argv, sc<size_t>(argc)});

    ASSERT(parser.registerBoolOption("dryrun", "", "Talk to a fake broker, the password is \"demo\""));
    ASSERT(parser.registerStringOption("log-file", "", "Write a log to this file"));
    ASSERT(parser.registerBoolOption("verbose", "", "Enable more logging"));
    ASSERT(parser.registerBoolOption("help", "h", "Show the help menu"));

    if (const auto ret = parser.parse(); !ret) {
        std::println(stderr, "Failed parsing arguments: {}", ret.error());
        return 1;
    }

    if (parser.getBool("help").value_or(false)) {
        std::println("{}", parser.getDescription(std::format("vimgreet v{}", VIMGREET_VERSION)));
        return 0;
    }

    const auto LOG_FILE = parser.getString("log-file");
    if (!Log::init(LOG_FILE ? std::optional<std::string>{std::string{*LOG_FILE}} : std::nullopt, parser.getBool("verbose").value_or(false)))
        return 1;

    signal(SIGPIPE, SIG_IGN);

    const bool DRYRUN = parser.getBool("dryrun").value_or(false);

    g_logger->log(LOG_DEBUG, "vimgreet v{} starting, dryrun {}", VIMGREET_VERSION, DRYRUN);

    UP<IBrokerTransport> transport;
    if (DRYRUN)
        transport = makeUnique<CDemoTransport>();
    else {
        auto sock = CSocketTransport::connect();
        if (!sock) {
            g_logger->log(LOG_CRIT, "broker: {}", sock.error());
            std::println(stderr, "vimgreet: {}", sock.error());
            return 1;
        }
        transport = std::move(*sock);
    }

    auto sessions = Sessions::discover();
    if (sessions.empty()) {
        g_logger->log(LOG_WARN, "no sessions found");
        if (DRYRUN)
            sessions.emplace_back(SSession{.name = "Demo shell", .slug = "demo", .exec = "sh", .command = {"sh"}});
    }

    CGreeter  greeter(makeUnique<CGreetdClient>(std::move(transport)), makePowerControl(DRYRUN), std::move(sessions), Users::discover());

    CTerminal term;
    if (const auto RET = term.init(); !RET) {
        g_logger->log(LOG_CRIT, "terminal: {}", RET.error());
        std::println(stderr, "vimgreet: {}", RET.error());
        return 1;
    }

    return run(term, greeter);
}
