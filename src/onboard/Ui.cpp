#include "Ui.hpp"
#include "Onboard.hpp"

#include "../tui/Terminal.hpp"
#include "../tui/Widgets.hpp"
#include "../helpers/Text.hpp"

#include <algorithm>
#include <format>

constexpr int SIDEBAR_WIDTH = 24;

static const std::vector<std::string> HELP_LINES = {
    "Ctrl-h / Ctrl-l   sidebar / content",
    "j k               move",
    "i a               edit the focused field",
    "Esc               back to normal mode",
    "Enter             select, submit, run",
    "Space             toggle a package",
    "1-9               jump to a step (sidebar)",
    "F12               power off",
    "",
    ":next :skip :submit :finish",
    ":reboot :poweroff :cancel :help",
};

static const char* resultMarker(eStepResult result) {
    switch (result) {
        case STEP_RESULT_PENDING: return "[ ]";
        case STEP_RESULT_COMPLETED: return "[x]";
        case STEP_RESULT_SKIPPED: return "[-]";
        case STEP_RESULT_FAILED: return "[!]";
        case STEP_RESULT_LOCKED: return "[#]";
    }
    return "[?]";
}

static std::string hintFor(const COnboard& onboard) {
    if (onboard.executing())
        return "working...";

    switch (onboard.panel()) {
        case PANEL_WELCOME: return "Enter: start  :q quit";
        case PANEL_SIDEBAR: return "j/k: move  Enter/l: open  1-9: jump  :help";
        case PANEL_CONTENT: break;
    }

    if (onboard.steps().isLocked(onboard.selectedStep()))
        return "locked, finish the previous steps first  h: back";

    const bool INSERT = onboard.editor().mode() == EDIT_MODE_INSERT;

    switch (onboard.steps().item(onboard.selectedStep()).id) {
        case STEP_USER: return INSERT ? "Enter: next field  Tab: switch  Esc: normal" : "i: edit  j/k: field  :submit  h: back";
        case STEP_LOCALE:
        case STEP_KEYBOARD:
        case STEP_PREFERENCES: return INSERT ? "type to filter  Up/Down: move  Enter: select  Esc: normal" : "j/k: move  Enter: select  :skip";
        case STEP_NETWORK: return onboard.networkConnected() ? "Enter: continue  :skip" : "Enter: open network setup  :skip";
        case STEP_REVIEW: return "Enter: apply configuration";
        case STEP_UPDATE: return onboard.sudoNeeded() ? "j/k: move  Space: toggle  i: sudo password  Enter: install  :skip" : "j/k: move  Space: toggle  Enter: install  :skip";
        case STEP_REBOOT: return "Enter: finish setup";
    }

    return "";
}

static void drawTasks(CTerminal& term, const COnboard& onboard, int y, int x, int w, int maxY) {
    for (const auto& t : onboard.tasks()) {
        if (y >= maxY)
            return;

        std::string icon;
        eStyle      style = STYLE_NORMAL;

        switch (t.state) {
            case TASK_PENDING: icon = "  "; style = STYLE_DIM; break;
            case TASK_RUNNING: icon = std::format("{} ", onboard.spinnerChar()); style = STYLE_WARNING; break;
            case TASK_SUCCESS: icon = "ok"; style = STYLE_SUCCESS; break;
            case TASK_FAILED: icon = "!!"; style = STYLE_ERROR; break;
        }

        term.print(y, x, icon, style);
        term.print(y, x + 3, t.name, STYLE_NORMAL, w - 3);

        if (t.progress) {
            const int NAME_W = std::min<int>(t.name.size(), w / 2);
            term.print(y, x + 4 + NAME_W, Widgets::progressBar(*t.progress, 20), STYLE_DIM, w - 4 - NAME_W);
        }

        y++;

        if (t.output && y < maxY) {
            // first line only, the log has the rest
            const auto NL = t.output->find('\n');
            term.print(y++, x + 5, t.output->substr(0, NL), t.state == TASK_FAILED ? STYLE_ERROR : STYLE_DIM, w - 5);
        }
    }
}

static void drawWelcome(CTerminal& term, const COnboard& onboard) {
    const auto& GENERAL = onboard.config().general;
    const auto [Y, X]   = Widgets::centeredBox(term, 14, 54, std::format("{} (v{})", GENERAL.title, VIMGREET_VERSION));

    const std::vector<std::string> LINES = {
        GENERAL.subtitle,
        "",
        "This wizard will help you set up your system:",
        "",
        "  * Create your user account",
        "  * Configure language and keyboard",
        "  * Set your timezone",
        "  * Connect to the network (if needed)",
        "  * Install applications",
    };

    for (size_t i = 0; i < LINES.size(); ++i) {
        term.print(Y + 1 + sc<int>(i), X + 3, LINES[i], i == 0 ? STYLE_TITLE : STYLE_NORMAL, 48);
    }

    term.print(Y + 11, X + 19, "[ Start Setup ]", STYLE_SELECTED);
    term.print(Y + 12, X + 17, "Press Enter to begin", STYLE_DIM);
    term.hideCursor();
}

static void drawSidebar(CTerminal& term, const COnboard& onboard, int h) {
    term.box(1, 0, h, SIDEBAR_WIDTH, "Steps");

    const auto& STEPS = onboard.steps();
    for (size_t i = 0; i < STEPS.size() && sc<int>(i) < h - 2; ++i) {
        const bool SELECTED = i == onboard.selectedStep();
        const auto LINE     = std::format("{} {}. {}", resultMarker(STEPS.result(i)), i + 1, stepName(STEPS.item(i).id));

        eStyle     style = STYLE_NORMAL;
        if (SELECTED)
            style = onboard.panel() == PANEL_SIDEBAR ? STYLE_SELECTED : STYLE_TITLE;
        else if (STEPS.isLocked(i))
            style = STYLE_DIM;
        else if (STEPS.result(i) == STEP_RESULT_FAILED)
            style = STYLE_ERROR;

        term.print(2 + sc<int>(i), 2, LINE, style, SIDEBAR_WIDTH - 4);
    }
}

static void drawUser(CTerminal& term, const COnboard& onboard, int y, int x, int w) {
    const bool FOCUS  = onboard.panel() == PANEL_CONTENT && onboard.contentFocus() == CONTENT_FIELD;
    const bool INSERT = onboard.editor().mode() == EDIT_MODE_INSERT;

    term.print(y, x, "Create your user account", STYLE_TITLE);
    term.print(y + 1, x, std::format("Groups: {}", onboard.config().user.groups.empty() ? std::string{"none"} : Text::join(onboard.config().user.groups, ", ")), STYLE_DIM, w);

    Widgets::drawField(term, y + 3, x, std::min(w, 50), "Username", onboard.username(), FOCUS && onboard.userField() == USER_FIELD_USERNAME, INSERT);
    Widgets::drawField(term, y + 4, x, std::min(w, 50), "Password", onboard.password(), FOCUS && onboard.userField() == USER_FIELD_PASSWORD, INSERT);
    Widgets::drawField(term, y + 5, x, std::min(w, 50), "Confirm", onboard.passwordConfirm(), FOCUS && onboard.userField() == USER_FIELD_CONFIRM, INSERT);

    if (onboard.createdUsername())
        term.print(y + 7, x, std::format("User '{}' has been created.", *onboard.createdUsername()), STYLE_SUCCESS, w);
}

static void drawPicker(CTerminal& term, const COnboard& onboard, int y, int x, int w, int maxY) {
    const auto                        ID      = onboard.steps().item(onboard.selectedStep()).id;
    const std::optional<std::string>* current = nullptr;

    switch (ID) {
        case STEP_LOCALE:
            term.print(y, x, "Select your language", STYLE_TITLE);
            current = &onboard.selectedLocale();
            break;
        case STEP_KEYBOARD:
            term.print(y, x, "Select your keyboard layout", STYLE_TITLE);
            current = &onboard.selectedKeyboard();
            break;
        default:
            term.print(y, x, "Select your timezone", STYLE_TITLE);
            current = &onboard.selectedTimezone();
            break;
    }

    if (*current)
        term.print(y + 1, x, std::format("Current: {}", **current), STYLE_DIM, w);

    const bool FOCUS = onboard.panel() == PANEL_CONTENT && onboard.contentFocus() == CONTENT_PICKER;
    Widgets::drawField(term, y + 2, x, std::min(w, 50), "Filter", onboard.pickerFilter(), FOCUS, onboard.editor().mode() == EDIT_MODE_INSERT);

    const auto ITEMS = onboard.filteredPickerItems();
    const int  ROWS  = std::max(1, maxY - (y + 4));
    const int  SEL   = sc<int>(onboard.pickerSelected());
    const int  FIRST = std::clamp(SEL - ROWS / 2, 0, std::max(0, sc<int>(ITEMS.size()) - ROWS));

    if (ITEMS.empty())
        term.print(y + 4, x + 2, "no matches", STYLE_DIM);

    for (int i = 0; i < ROWS && FIRST + i < sc<int>(ITEMS.size()); ++i) {
        const bool SELECTED = FIRST + i == SEL;
        term.print(y + 4 + i, x, std::format("{} {}", SELECTED ? ">" : " ", ITEMS[FIRST + i]), SELECTED ? STYLE_SELECTED : STYLE_NORMAL, w);
    }
}

static void drawNetwork(CTerminal& term, const COnboard& onboard, int y, int x, int w) {
    term.print(y, x, "Network", STYLE_TITLE);

    if (onboard.networkConnected()) {
        term.print(y + 2, x, "Connected to the internet.", STYLE_SUCCESS, w);
        term.print(y + 3, x, "Press Enter to continue.", STYLE_DIM, w);
        return;
    }

    term.print(y + 2, x, "Not connected.", STYLE_WARNING, w);
    term.print(y + 3, x, std::format("Press Enter to open {}.", onboard.config().network.program), STYLE_DIM, w);
}

static void drawReview(CTerminal& term, const COnboard& onboard, int y, int x, int w, int maxY) {
    term.print(y, x, "Review", STYLE_TITLE);

    const auto  NONE = std::string{"(unchanged)"};
    const auto& USER = onboard.username().content();

    term.print(y + 2, x, std::format("{:>10}: {}", "User", USER.empty() ? std::string_view{"(not set)"} : USER), STYLE_NORMAL, w);
    term.print(y + 3, x, std::format("{:>10}: {}", "Locale", onboard.selectedLocale().value_or(NONE)), STYLE_NORMAL, w);
    term.print(y + 4, x, std::format("{:>10}: {}", "Keyboard", onboard.selectedKeyboard().value_or(NONE)), STYLE_NORMAL, w);
    term.print(y + 5, x, std::format("{:>10}: {}", "Timezone", onboard.selectedTimezone().value_or(NONE)), STYLE_NORMAL, w);

    if (onboard.taskStep() == STEP_REVIEW)
        drawTasks(term, onboard, y + 7, x, w, maxY);
    else
        term.print(y + 7, x, "Press Enter to apply this configuration.", STYLE_DIM, w);
}

static void drawUpdate(CTerminal& term, const COnboard& onboard, int y, int x, int w, int maxY) {
    term.print(y, x, "Install applications", STYLE_TITLE);
    y += 2;

    if (onboard.taskStep() == STEP_UPDATE && !onboard.tasks().empty()) {
        drawTasks(term, onboard, y, x, w, maxY);
        return;
    }

    if (onboard.sudoNeeded()) {
        const bool FOCUS = onboard.panel() == PANEL_CONTENT && onboard.contentFocus() == CONTENT_FIELD;
        Widgets::drawField(term, y, x, std::min(w, 50), "sudo", onboard.sudoPassword(), FOCUS, onboard.editor().mode() == EDIT_MODE_INSERT);
        y += 2;
    }

    const auto& SEL  = onboard.selection();
    const auto& CATS = SEL.categories();

    for (size_t c = 0; c < CATS.size() && y < maxY; ++c) {
        const bool ON_HEADER = SEL.cursorCategory() == c && !SEL.cursorPackage();
        const auto MARK      = SEL.isCategoryFullySelected(c) ? "[x]" : (SEL.isCategoryPartiallySelected(c) ? "[~]" : "[ ]");

        term.print(y++, x, std::format("{} {}", MARK, CATS[c].name), ON_HEADER ? STYLE_SELECTED : STYLE_TITLE, w);

        for (size_t p = 0; p < CATS[c].packages.size() && y < maxY; ++p) {
            const auto& PKG = CATS[c].packages[p];
            const bool  ON  = SEL.cursorCategory() == c && SEL.cursorPackage() == p;

            auto        line = std::format("  {} {}", SEL.isSelected(c, p) ? "[x]" : "[ ]", PKG.title);
            if (PKG.required)
                line += " (required)";
            if (!PKG.description.empty())
                line += std::format(" - {}", PKG.description);

            term.print(y++, x, line, ON ? STYLE_SELECTED : STYLE_NORMAL, w);
        }
    }
}

static void drawReboot(CTerminal& term, const COnboard& onboard, int y, int x, int w, int maxY) {
    term.print(y, x, "Setup Complete!", STYLE_TITLE);
    term.print(y + 2, x, "Your system is configured and ready.", STYLE_NORMAL, w);

    if (onboard.createdUsername())
        term.print(y + 3, x, std::format("User '{}' has been created.", *onboard.createdUsername()), STYLE_SUCCESS, w);

    const auto& ACTION = onboard.config().completion.action;
    if (ACTION == "reboot" || ACTION == "poweroff")
        term.print(y + 5, x, std::format("Press Enter to finish, the system will {}.", ACTION), STYLE_DIM, w);
    else
        term.print(y + 5, x, "Press Enter to finish and go to the login screen.", STYLE_DIM, w);

    if (onboard.taskStep() == STEP_REBOOT)
        drawTasks(term, onboard, y + 7, x, w, maxY);
}

static void drawContent(CTerminal& term, const COnboard& onboard, int h) {
    const int X = SIDEBAR_WIDTH;
    const int W = term.width() - SIDEBAR_WIDTH;

    const auto& ITEM = onboard.steps().item(onboard.selectedStep());
    term.box(1, X, h, W, stepName(ITEM.id));

    const int CY    = 2;
    const int CX    = X + 2;
    const int CW    = W - 4;
    const int MAX_Y = 1 + h - 1;

    if (onboard.steps().isLocked(onboard.selectedStep())) {
        term.print(CY, CX, "This step is locked.", STYLE_WARNING, CW);
        term.print(CY + 1, CX, "Complete the previous steps first.", STYLE_DIM, CW);
        return;
    }

    switch (ITEM.id) {
        case STEP_USER: drawUser(term, onboard, CY, CX, CW); break;
        case STEP_LOCALE:
        case STEP_KEYBOARD:
        case STEP_PREFERENCES: drawPicker(term, onboard, CY, CX, CW, MAX_Y); break;
        case STEP_NETWORK: drawNetwork(term, onboard, CY, CX, CW); break;
        case STEP_REVIEW: drawReview(term, onboard, CY, CX, CW, MAX_Y); break;
        case STEP_UPDATE: drawUpdate(term, onboard, CY, CX, CW, MAX_Y); break;
        case STEP_REBOOT: drawReboot(term, onboard, CY, CX, CW, MAX_Y); break;
    }

    // tasks of a step the user navigated away from keep running, show them here too
    if (onboard.executing() && onboard.taskStep() && onboard.taskStep() != ITEM.id)
        term.print(MAX_Y - 1, CX, std::format("{} {} is still running", onboard.spinnerChar(), stepName(*onboard.taskStep())), STYLE_WARNING, CW);
}

void OnboardUi::draw(CTerminal& term, const COnboard& onboard) {
    term.clear();
    term.hideCursor();

    auto header = onboard.config().general.title;
    if (onboard.dryrun())
        header += " [DRYRUN]";
    term.print(0, 1, header, STYLE_TITLE);

    if (onboard.panel() == PANEL_WELCOME)
        drawWelcome(term, onboard);
    else {
        const int H = term.height() - 2;
        drawSidebar(term, onboard, H);
        drawContent(term, onboard, H);
    }

    Widgets::drawStatusLine(term, onboard.editor(), onboard.message(), hintFor(onboard));

    if (onboard.showHelp())
        Widgets::drawHelp(term, "Help", HELP_LINES);

    if (const auto CONFIRM = onboard.confirmAction(); CONFIRM) {
        switch (*CONFIRM) {
            case CONFIRM_REBOOT: Widgets::drawConfirm(term, onboard.dryrun() && onboard.setupComplete() ? "Finish setup and go to login?" : "Reboot the system?"); break;
            case CONFIRM_POWEROFF: Widgets::drawConfirm(term, "Power off the system?"); break;
            case CONFIRM_CANCEL: Widgets::drawConfirm(term, "Quit the setup wizard?"); break;
        }
    }

    term.present();
}
