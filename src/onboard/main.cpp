#include "Onboard.hpp"
#include "Ui.hpp"

#include "../helpers/Exec.hpp"
#include "../helpers/Logger.hpp"
#include "../tui/Terminal.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cerrno>
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

constexpr auto TICK = std::chrono::milliseconds(250);

static void launchExternal(CTerminal& term, COnboard& onboard, const SLaunchRequest& request) {
    g_logger->log(LOG_DEBUG, "onboard: handing the terminal to {}", request.program);

    term.suspend();
    const auto RESULT = Exec::runInteractive(request.program, request.args);
    term.resume();

    onboard.onExternalReturned(RESULT, request.program);
}

static int run(CTerminal& term, COnboard& onboard) {
    pollfd fds[2] = {
        pollfd{
            .fd     = STDIN_FILENO,
            .events = POLLIN,
        },
        pollfd{
            .fd     = onboard.wakeFd(),
            .events = POLLIN,
        },
    };

    auto lastTick = std::chrono::steady_clock::now();

    OnboardUi::draw(term, onboard);

    while (!onboard.shouldExit()) {
        const auto TIMEOUT = std::chrono::duration_cast<std::chrono::milliseconds>(TICK - (std::chrono::steady_clock::now() - lastTick));

        if (poll(fds, 2, std::max<int>(0, TIMEOUT.count())) < 0) {
            if (errno == EINTR)
                continue;
            g_logger->log(LOG_ERR, "poll() failed: {}", strerror(errno));
            return 1;
        }

        if (fds[1].revents & POLLIN)
            onboard.pumpMessages();

        if (fds[0].revents & POLLIN) {
            for (const auto& key : term.readKeys()) {
                if (const auto REQUEST = onboard.handleKey(key); REQUEST)
                    launchExternal(term, onboard, *REQUEST);

                OnboardUi::draw(term, onboard);

                if (onboard.shouldExit())
                    break;
            }
        } else if (fds[0].revents & (POLLHUP | POLLERR)) {
            g_logger->log(LOG_ERR, "terminal went away");
            return 1;
        }

        if (std::chrono::steady_clock::now() - lastTick >= TICK) {
            lastTick = std::chrono::steady_clock::now();
            onboard.tick();
        }

        OnboardUi::draw(term, onboard);
    }

    // the last worker must be done before the service it uses goes away
    onboard.waitIdle();
    onboard.pumpMessages();

    return 0;
}

int main(int argc, const char** argv) {
    CArgumentParser parser({argv, sc<size_t>(argc)});

    ASSERT(parser.registerBoolOption("dryrun", "", "Simulate everything, change nothing on this system"));
    ASSERT(parser.registerStringOption("config", "", "Path to the onboarding config"));
    ASSERT(parser.registerStringOption("log-file", "", "Write a log to this file"));
    ASSERT(parser.registerBoolOption("verbose", "", "Enable more logging"));
    ASSERT(parser.registerBoolOption("help", "h", "Show the help menu"));

    if (const auto ret = parser.parse(); !ret) {
        std::println(stderr, "Failed parsing arguments: {}", ret.error());
        return 1;
    }

    if (parser.getBool("help").value_or(false)) {
        std::println("{}", parser.getDescription(std::format("vimgreet-onboard v{}", VIMGREET_VERSION)));
        return 0;
    }

    const auto LOG_FILE = parser.getString("log-file");
    if (!Log::init(LOG_FILE ? std::optional<std::string>{std::string{*LOG_FILE}} : std::nullopt, parser.getBool("verbose").value_or(false)))
        return 1;

    signal(SIGPIPE, SIG_IGN);

    const auto CONFIG_PATH = parser.getString("config");
    auto       config      = Config::load(CONFIG_PATH ? std::string{*CONFIG_PATH} : std::string{DEFAULT_CONFIG_PATH});

    if (!config) {
        g_logger->log(LOG_CRIT, "config: {}", config.error());
        std::println(stderr, "vimgreet-onboard: {}", config.error());
        return 1;
    }

    if (parser.getBool("dryrun").value_or(false))
        config->general.dryrun = true;

    const bool DRYRUN = config->general.dryrun;

    g_logger->log(LOG_DEBUG, "vimgreet-onboard v{} starting, dryrun {}", VIMGREET_VERSION, DRYRUN);

    COnboard  onboard(std::move(*config), makeOnboardService(DRYRUN), makePowerControl(DRYRUN));

    CTerminal term;
    if (const auto RET = term.init(); !RET) {
        g_logger->log(LOG_CRIT, "terminal: {}", RET.error());
        std::println(stderr, "vimgreet-onboard: {}", RET.error());
        return 1;
    }

    return run(term, onboard);
}
