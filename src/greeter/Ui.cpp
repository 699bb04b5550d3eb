#include "Ui.hpp"
#include "Greeter.hpp"

#include "../helpers/Logger.hpp"
#include "../tui/Terminal.hpp"
#include "../tui/Widgets.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <stdexcept>

#include <unistd.h>

constexpr int FORM_WIDTH = 44;

static const std::vector<std::string> HELP_LINES = {
    "h / l        move the cursor",
    "j / k        switch field",
    "i a          insert mode",
    "x            delete a character",
    "dd           clear the field",
    "Enter        login",
    "F2 / F3      user / session picker",
    "F12          power off",
    "",
    ":session [name]  select a session",
    ":user [name]     select a user",
    ":reboot :poweroff :cancel :q",
    "",
    "Esc to close",
};

static std::string hostname() {
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0')
        return "localhost";
    return buf;
}

std::string GreeterUi::clockTextLibc(time_t now) {
    tm local = {};
    if (!localtime_r(&now, &local))
        return "";

    char buf[64] = {0};
    if (strftime(buf, sizeof(buf), "%A, %B %d  %H:%M", &local) == 0)
        return "";

    return buf;
}

std::string GreeterUi::clockText(std::chrono::system_clock::time_point now) {
    static bool zoneBroken = false;

    if (!zoneBroken) {
        try {
            const auto LOCAL = std::chrono::zoned_time{std::chrono::current_zone(), std::chrono::floor<std::chrono::minutes>(now)};
            return std::format("{:%A, %B %d}  {:%H:%M}", LOCAL, LOCAL);
        } catch (const std::runtime_error& e) {
            zoneBroken = true;
            g_logger->log(LOG_WARN, "greeter: no time zone database ({}), using the libc clock", e.what());
        }
    }

    return clockTextLibc(std::chrono::system_clock::to_time_t(now));
}

static void drawHeader(CTerminal& term) {
    term.print(0, 1, hostname(), STYLE_TITLE);

    const auto STAMP = GreeterUi::clockText(std::chrono::system_clock::now());

    term.print(0, std::max(0, term.width() - sc<int>(STAMP.size()) - 1), STAMP, STYLE_DIM);
}

static std::string hintFor(const CGreeter& greeter) {
    if (greeter.working())
        return "authenticating...  Ctrl-c: cancel";

    switch (greeter.editor().mode()) {
        case EDIT_MODE_INSERT: return "Esc: normal  Enter: next / login  Tab: switch field";
        case EDIT_MODE_NORMAL: return "i: edit  j/k: field  Enter: login  F2: users  F3: sessions  :help";
        case EDIT_MODE_COMMAND: break;
    }

    return "";
}

static void drawForm(CTerminal& term, const CGreeter& greeter) {
    const auto [Y, X]  = Widgets::centeredBox(term, 10, FORM_WIDTH + 4, "Login");
    const bool INSERT  = greeter.editor().mode() == EDIT_MODE_INSERT;
    const auto SESSION = greeter.selectedSession() < greeter.sessions().size() ? greeter.sessions()[greeter.selectedSession()].name : std::string{"none"};

    term.print(Y + 1, X + 2, std::format("Session: {} (F3)", SESSION), STYLE_DIM, FORM_WIDTH);

    Widgets::drawField(term, Y + 3, X + 2, FORM_WIDTH, "Username", greeter.username(), greeter.focus() == GREETER_FIELD_USERNAME, INSERT);
    Widgets::drawField(term, Y + 5, X + 2, FORM_WIDTH, greeter.pendingPrompt() ? *greeter.pendingPrompt() : "Password", greeter.password(),
                       greeter.focus() == GREETER_FIELD_PASSWORD, INSERT);

    if (const auto& MSG = greeter.message(); MSG)
        term.print(Y + 7, X + 2, MSG->text, MSG->isError ? STYLE_ERROR : STYLE_INFO, FORM_WIDTH);
}

template <typename T, typename F>
static void drawPicker(CTerminal& term, const char* title, const std::vector<T>& items, size_t selected, F&& label) {
    const int  H      = std::clamp(sc<int>(items.size()) + 2, 3, std::max(3, term.height() - 4));
    const auto [Y, X] = Widgets::centeredBox(term, H, FORM_WIDTH, title);

    if (items.empty()) {
        term.print(Y + 1, X + 2, "nothing found", STYLE_DIM, FORM_WIDTH - 4);
        return;
    }

    const size_t ROWS  = H - 2;
    const size_t FIRST = selected >= ROWS ? selected - ROWS + 1 : 0;

    for (size_t i = FIRST; i < items.size() && i - FIRST < ROWS; ++i) {
        const bool SEL = i == selected;
        term.print(Y + 1 + sc<int>(i - FIRST), X + 2, std::format("{} {}", SEL ? ">" : " ", label(items[i])), SEL ? STYLE_SELECTED : STYLE_NORMAL, FORM_WIDTH - 4);
    }
}

void GreeterUi::draw(CTerminal& term, const CGreeter& greeter) {
    term.clear();
    term.hideCursor();

    drawHeader(term);
    drawForm(term, greeter);

    Widgets::drawStatusLine(term, greeter.editor(), std::nullopt, hintFor(greeter));

    switch (greeter.overlay()) {
        case GREETER_OVERLAY_NONE: break;
        case GREETER_OVERLAY_HELP: Widgets::drawHelp(term, "Help", HELP_LINES); break;
        case GREETER_OVERLAY_SESSIONS:
            drawPicker(term, "Sessions", greeter.sessions(), greeter.selectedSession(),
                       [](const SSession& s) { return std::format("{} ({})", s.name, s.type == SESSION_WAYLAND ? "wayland" : "x11"); });
            break;
        case GREETER_OVERLAY_USERS: drawPicker(term, "Users", greeter.users(), greeter.selectedUser(), [](const SUser& u) { return u.label(); }); break;
    }

    if (const auto CONFIRM = greeter.confirmAction(); CONFIRM)
        Widgets::drawConfirm(term, *CONFIRM == GREETER_CONFIRM_REBOOT ? "Reboot the system?" : "Power off the system?");

    term.present();
}
