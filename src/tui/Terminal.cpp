#include "Terminal.hpp"
#include "../helpers/Logger.hpp"
#include "../helpers/Text.hpp"

#include <algorithm>
#include <atomic>
#include <clocale>
#include <csignal>
#include <cstring>
#include <exception>

#include <ncurses.h>
#include <termios.h>
#include <unistd.h>

static std::atomic<bool>      g_cursesActive      = false;
static std::terminate_handler g_previousTerminate = nullptr;

static termios                g_savedTermios = {};
static bool                   g_haveTermios  = false;
static char                   g_resetSequence[128];
static size_t                 g_resetLen = 0;

constexpr int FATAL_SIGNALS[] = {SIGINT, SIGTERM, SIGHUP, SIGSEGV, SIGABRT, SIGBUS, SIGFPE};

static void restoreTerminal() {
    if (!g_cursesActive.exchange(false))
        return;

    endwin();
}

// only async-signal-safe calls in here: put the tty modes back and write
// the reset sequence that init() looked up
static void onFatalSignal(int sig) {
    if (g_cursesActive.exchange(false)) {
        if (g_resetLen > 0) {
            [[maybe_unused]] const auto WROTE = write(STDOUT_FILENO, g_resetSequence, g_resetLen);
        }
        if (g_haveTermios)
            tcsetattr(STDIN_FILENO, TCSANOW, &g_savedTermios);
    }

    signal(sig, SIG_DFL);
    raise(sig);
}

static void onTerminate() {
    restoreTerminal();
    if (g_previousTerminate)
        g_previousTerminate();
    std::abort();
}

//
CTerminal::~CTerminal() {
    if (!m_active)
        return;

    restoreTerminal();

    for (int sig : FATAL_SIGNALS) {
        signal(sig, SIG_DFL);
    }

    std::set_terminate(g_previousTerminate);
}

std::expected<void, std::string> CTerminal::init() {
    if (m_active || g_cursesActive)
        return std::unexpected("terminal already initialized");

    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO))
        return std::unexpected("stdin and stdout must be a terminal");

    setlocale(LC_ALL, "");

    g_haveTermios = tcgetattr(STDIN_FILENO, &g_savedTermios) == 0;

    // installed before curses touches the tty so nothing can leave it raw
    g_previousTerminate = std::set_terminate(onTerminate);
    for (int sig : FATAL_SIGNALS) {
        signal(sig, onFatalSignal);
    }

    if (!initscr())
        return std::unexpected("failed to initialize curses");

    // attributes off, cursor on, leave the alternate screen
    g_resetLen = buildResetSequence({tigetstr("sgr0"), tigetstr("cnorm"), tigetstr("rmcup")}, g_resetSequence);

    g_cursesActive = true;
    m_active       = true;

    raw();
    noecho();
    nonl();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);

    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(STYLE_TITLE, COLOR_CYAN, -1);
        init_pair(STYLE_DIM, COLOR_WHITE, -1);
        init_pair(STYLE_SELECTED, COLOR_BLACK, COLOR_CYAN);
        init_pair(STYLE_ERROR, COLOR_RED, -1);
        init_pair(STYLE_INFO, COLOR_BLUE, -1);
        init_pair(STYLE_SUCCESS, COLOR_GREEN, -1);
        init_pair(STYLE_WARNING, COLOR_YELLOW, -1);
    }

    g_logger->log(LOG_DEBUG, "terminal: {}x{}", COLS, LINES);

    return {};
}

void CTerminal::suspend() {
    if (!m_active)
        return;

    def_prog_mode();
    endwin();
}

void CTerminal::resume() {
    if (!m_active)
        return;

    reset_prog_mode();
    refresh();
    clearok(stdscr, TRUE);
}

std::vector<SKeyEvent> CTerminal::readKeys() {
    std::vector<SKeyEvent> keys;

    wint_t                 ch = 0;
    int                    status;
    while ((status = wget_wch(stdscr, &ch)) != ERR) {
        const auto KEY = decodeKey(status, sc<uint32_t>(ch));
        if (KEY.code != INPUT_KEY_NONE)
            keys.emplace_back(KEY);
    }

    return keys;
}

size_t CTerminal::buildResetSequence(const std::vector<const char*>& caps, std::span<char> out) {
    size_t len = 0;

    for (const auto* cap : caps) {
        // tigetstr: null when the terminal lacks it, -1 when it isn't a string capability
        if (!cap || cap == rc<const char*>(-1))
            continue;

        const auto CAP_LEN = std::strlen(cap);
        if (len + CAP_LEN > out.size())
            break;

        std::memcpy(out.data() + len, cap, CAP_LEN);
        len += CAP_LEN;
    }

    return len;
}

SKeyEvent CTerminal::decodeKey(int status, uint32_t ch) {
    if (status == KEY_CODE_YES) {
        switch (ch) {
            case KEY_BACKSPACE: return SKeyEvent::special(INPUT_KEY_BACKSPACE);
            case KEY_DC: return SKeyEvent::special(INPUT_KEY_DELETE);
            case KEY_ENTER: return SKeyEvent::special(INPUT_KEY_ENTER);
            case KEY_BTAB: return SKeyEvent::special(INPUT_KEY_BACKTAB);
            case KEY_LEFT: return SKeyEvent::special(INPUT_KEY_LEFT);
            case KEY_RIGHT: return SKeyEvent::special(INPUT_KEY_RIGHT);
            case KEY_UP: return SKeyEvent::special(INPUT_KEY_UP);
            case KEY_DOWN: return SKeyEvent::special(INPUT_KEY_DOWN);
            case KEY_HOME: return SKeyEvent::special(INPUT_KEY_HOME);
            case KEY_END: return SKeyEvent::special(INPUT_KEY_END);
            default: break;
        }

        if (ch >= sc<uint32_t>(KEY_F(1)) && ch <= sc<uint32_t>(KEY_F(12)))
            return SKeyEvent::function(sc<uint8_t>(ch - KEY_F0));

        return {};
    }

    if (status != OK)
        return {};

    switch (ch) {
        case 27: return SKeyEvent::special(INPUT_KEY_ESCAPE);
        case '\r':
        case '\n': return SKeyEvent::special(INPUT_KEY_ENTER);
        case '\t': return SKeyEvent::special(INPUT_KEY_TAB);
        case 127: return SKeyEvent::special(INPUT_KEY_BACKSPACE);
        default: break;
    }

    // ^A .. ^Z, ^H stays a control key so it can be bound
    if (ch >= 1 && ch <= 26)
        return SKeyEvent::control(sc<char>('a' + ch - 1));

    if (ch < 0x20 || ch == 0x7F || ch > 0x10FFFF || (ch >= 0xD800 && ch <= 0xDFFF))
        return {};

    return SKeyEvent::character(sc<char32_t>(ch));
}

int CTerminal::width() const {
    return m_active ? COLS : 80;
}

int CTerminal::height() const {
    return m_active ? LINES : 24;
}

void CTerminal::clear() {
    erase();
    m_cursorY = m_cursorX = -1;
}

void CTerminal::print(int y, int x, std::string_view text, eStyle style, int maxWidth) {
    if (y < 0 || x < 0 || y >= height() || x >= width())
        return;

    int attr = A_NORMAL;
    if (style != STYLE_NORMAL) {
        if (has_colors())
            attr |= COLOR_PAIR(style);
        else if (style == STYLE_SELECTED)
            attr |= A_REVERSE;

        if (style == STYLE_TITLE || style == STYLE_SELECTED)
            attr |= A_BOLD;
        else if (style == STYLE_DIM)
            attr |= A_DIM;
    }

    // mvaddnstr counts bytes, not cells, stop at the edge by codepoint count instead
    const int LIMIT = maxWidth < 0 ? width() - x : std::min(maxWidth, width() - x);

    std::string clipped;
    int         cells = 0;
    for (size_t i = 0; i < text.size() && cells < LIMIT; ++cells) {
        const auto LEN = std::min<size_t>(Text::sequenceLength(sc<unsigned char>(text[i])), text.size() - i);
        clipped.append(text.substr(i, LEN));
        i += LEN;
    }

    attron(attr);
    mvaddstr(y, x, clipped.c_str());
    attroff(attr);
}

void CTerminal::box(int y, int x, int h, int w, std::string_view title) {
    if (h < 2 || w < 2)
        return;

    mvaddch(y, x, ACS_ULCORNER);
    mvaddch(y, x + w - 1, ACS_URCORNER);
    mvaddch(y + h - 1, x, ACS_LLCORNER);
    mvaddch(y + h - 1, x + w - 1, ACS_LRCORNER);
    mvhline(y, x + 1, ACS_HLINE, w - 2);
    mvhline(y + h - 1, x + 1, ACS_HLINE, w - 2);
    mvvline(y + 1, x, ACS_VLINE, h - 2);
    mvvline(y + 1, x + w - 1, ACS_VLINE, h - 2);

    if (!title.empty())
        print(y, x + 2, std::string{" "} + std::string{title} + " ", STYLE_TITLE, w - 4);
}

void CTerminal::hline(int y, int x, int w) {
    mvhline(y, x, ACS_HLINE, w);
}

void CTerminal::setCursor(int y, int x) {
    m_cursorY = y;
    m_cursorX = x;
}

void CTerminal::hideCursor() {
    m_cursorY = m_cursorX = -1;
}

void CTerminal::present() {
    if (m_cursorY >= 0 && m_cursorX >= 0) {
        move(m_cursorY, m_cursorX);
        curs_set(1);
    } else
        curs_set(0);

    refresh();
}
