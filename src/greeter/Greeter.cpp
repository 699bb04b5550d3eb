#include "Greeter.hpp"

#include "../helpers/Logger.hpp"
#include "../helpers/Text.hpp"
#include "../input/Command.hpp"

#include <hyprutils/utils/ScopeGuard.hpp>

#include <algorithm>
#include <format>
#include <type_traits>
#include <variant>

using namespace Hyprutils::Utils;

// a broker that keeps sending info messages never lets us in
constexpr size_t MAX_AUTH_ROUNDS = 16;

CGreeter::CGreeter(UP<CGreetdClient>&& client, UP<IPowerControl>&& power, std::vector<SSession> sessions, std::vector<SUser> users) :
    m_client(std::move(client)), m_power(std::move(power)), m_sessions(std::move(sessions)), m_users(std::move(users)) {
    g_logger->log(LOG_DEBUG, "greeter: {} sessions, {} users", m_sessions.size(), m_users.size());
}

void CGreeter::handleKey(const SKeyEvent& key) {
    if (m_message && !m_working)
        m_message.reset();

    // ctrl-c never quits a greeter, it aborts the login in flight
    if (key.isCtrl('c')) {
        cancel();
        return;
    }

    if (m_confirm) {
        handleConfirm(key, *m_confirm);
        return;
    }

    switch (m_overlay) {
        case GREETER_OVERLAY_NONE: break;
        case GREETER_OVERLAY_HELP:
            if (key.code == INPUT_KEY_ESCAPE || key.isChar('q'))
                m_overlay = GREETER_OVERLAY_NONE;
            return;
        case GREETER_OVERLAY_SESSIONS:
        case GREETER_OVERLAY_USERS: handlePicker(key); return;
    }

    switch (m_editor.mode()) {
        case EDIT_MODE_NORMAL: handleNormal(key); break;
        case EDIT_MODE_INSERT: handleInsert(key); break;
        case EDIT_MODE_COMMAND: handleCommand(key); break;
    }
}

void CGreeter::handleNormal(const SKeyEvent& key) {
    if (m_editor.feedNormal(currentField(), key))
        return;

    if (key.isChar('i')) {
        m_editor.apply(MODE_ACTION_ENTER_INSERT);
    } else if (key.isChar('a')) {
        currentField().moveRight();
        m_editor.apply(MODE_ACTION_ENTER_INSERT);
    } else if (key.isChar('A')) {
        currentField().moveEnd();
        m_editor.apply(MODE_ACTION_ENTER_INSERT);
    } else if (key.isChar('I')) {
        currentField().moveStart();
        m_editor.apply(MODE_ACTION_ENTER_INSERT);
    } else if (key.isChar(':'))
        m_editor.enterCommand();
    else if (key.isChar('j') || key.isChar('k') || key.code == INPUT_KEY_DOWN || key.code == INPUT_KEY_UP || key.code == INPUT_KEY_TAB || key.code == INPUT_KEY_BACKTAB)
        toggleField();
    else if (key.code == INPUT_KEY_ENTER)
        login();
    else if (key.isFunction(2))
        m_overlay = GREETER_OVERLAY_USERS;
    else if (key.isFunction(3))
        m_overlay = GREETER_OVERLAY_SESSIONS;
    else if (key.isFunction(12))
        m_confirm = GREETER_CONFIRM_POWEROFF;
}

void CGreeter::handleInsert(const SKeyEvent& key) {
    switch (key.code) {
        case INPUT_KEY_ESCAPE: m_editor.apply(MODE_ACTION_CANCEL); return;
        case INPUT_KEY_ENTER:
            if (m_focus == GREETER_FIELD_USERNAME && !m_username.empty()) {
                m_focus = GREETER_FIELD_PASSWORD;
                m_editor.setMode(EDIT_MODE_NORMAL);
            } else if (m_focus == GREETER_FIELD_PASSWORD) {
                m_editor.setMode(EDIT_MODE_NORMAL);
                login();
            }
            return;
        case INPUT_KEY_TAB:
        case INPUT_KEY_BACKTAB: toggleField(); return;
        case INPUT_KEY_FUNCTION:
            if (key.isFunction(2))
                m_overlay = GREETER_OVERLAY_USERS;
            else if (key.isFunction(3))
                m_overlay = GREETER_OVERLAY_SESSIONS;
            else if (key.isFunction(12))
                m_confirm = GREETER_CONFIRM_POWEROFF;
            return;
        default: break;
    }

    m_editor.feedInsert(currentField(), key);
}

void CGreeter::handleCommand(const SKeyEvent& key) {
    const auto FEED = m_editor.feedCommand(key);
    if (FEED.executed)
        runCommand(*FEED.executed);
}

void CGreeter::handlePicker(const SKeyEvent& key) {
    const bool SESSIONS = m_overlay == GREETER_OVERLAY_SESSIONS;
    auto&      selected = SESSIONS ? m_selectedSession : m_selectedUser;
    const auto COUNT    = SESSIONS ? m_sessions.size() : m_users.size();

    if (key.code == INPUT_KEY_ESCAPE || key.isChar('q'))
        m_overlay = GREETER_OVERLAY_NONE;
    else if (key.isChar('j') || key.code == INPUT_KEY_DOWN) {
        if (selected + 1 < COUNT)
            selected++;
    } else if (key.isChar('k') || key.code == INPUT_KEY_UP) {
        if (selected > 0)
            selected--;
    } else if (key.code == INPUT_KEY_ENTER) {
        if (!SESSIONS && selected < m_users.size()) {
            m_username.set(m_users[selected].username);
            m_focus = GREETER_FIELD_PASSWORD;
        }
        m_overlay = GREETER_OVERLAY_NONE;
    }
}

void CGreeter::handleConfirm(const SKeyEvent& key, eGreeterConfirm action) {
    if (key.isChar('n') || key.isChar('N') || key.code == INPUT_KEY_ESCAPE) {
        m_confirm.reset();
        return;
    }

    if (!key.isChar('y') && !key.isChar('Y'))
        return;

    m_confirm.reset();

    const auto RESULT = action == GREETER_CONFIRM_REBOOT ? m_power->reboot() : m_power->poweroff();
    if (!RESULT)
        setError(std::format("{} failed: {}", action == GREETER_CONFIRM_REBOOT ? "Reboot" : "Poweroff", RESULT.error()));
}

void CGreeter::runCommand(const std::string& text) {
    const auto CMD = Command::parseLogin(text);
    if (!CMD) {
        setError(CMD.error());
        return;
    }

    switch (CMD->command) {
        case LOGIN_COMMAND_REBOOT: m_confirm = GREETER_CONFIRM_REBOOT; break;
        case LOGIN_COMMAND_POWEROFF: m_confirm = GREETER_CONFIRM_POWEROFF; break;
        case LOGIN_COMMAND_SESSION: {
            if (!CMD->arg) {
                m_overlay = GREETER_OVERLAY_SESSIONS;
                break;
            }

            const auto NAME = Text::lower(*CMD->arg);
            const auto IT   = std::ranges::find_if(m_sessions, [&NAME](const auto& s) { return Text::containsInsensitive(s.name, NAME) || Text::lower(s.slug) == NAME; });

            if (IT == m_sessions.end()) {
                setError(std::format("Session not found: {}", *CMD->arg));
                break;
            }

            m_selectedSession = IT - m_sessions.begin();
            break;
        }
        case LOGIN_COMMAND_USER: {
            if (!CMD->arg) {
                m_overlay = GREETER_OVERLAY_USERS;
                break;
            }

            const auto NAME = Text::lower(*CMD->arg);
            const auto IT   = std::ranges::find_if(m_users, [&NAME](const auto& u) { return Text::lower(u.username) == NAME; });

            if (IT == m_users.end()) {
                setError(std::format("User not found: {}", *CMD->arg));
                break;
            }

            m_selectedUser = IT - m_users.begin();
            m_username.set(IT->username);
            break;
        }
        case LOGIN_COMMAND_LOGIN:
        case LOGIN_COMMAND_QUIT: login(); break;
        case LOGIN_COMMAND_CANCEL: cancel(); break;
        case LOGIN_COMMAND_HELP: m_overlay = GREETER_OVERLAY_HELP; break;
    }
}

void CGreeter::login() {
    if (m_working) {
        setError("Login already in progress");
        return;
    }

    if (m_username.empty()) {
        setError("Username is required");
        return;
    }

    m_working = true;
    m_message.reset();

    CScopeGuard x([this] { m_working = false; });

    // the broker is still waiting on an answer from the last round
    if (m_sessionOpen && m_pendingPrompt) {
        m_pendingPrompt.reset();
        auto resp = m_client->postAuthResponse(std::string{m_password.content()});
        m_password.clear();
        drive(std::move(resp), true);
        return;
    }

    // a half open session from an earlier attempt would make create_session fail
    if (m_sessionOpen) {
        if (const auto RET = m_client->cancelSession(); !RET)
            g_logger->log(LOG_DEBUG, "greeter: stale session cancel failed: {}", RET.error());
        m_sessionOpen = false;
    }

    const auto USERNAME = std::string{m_username.content()};
    g_logger->log(LOG_DEBUG, "greeter: creating session for {}", USERNAME);

    auto resp     = m_client->createSession(USERNAME);
    m_sessionOpen = resp.has_value();
    drive(std::move(resp), false);
}

void CGreeter::drive(std::expected<SAuthExchange, std::string> resp, bool passwordSent) {
    for (size_t round = 0; round < MAX_AUTH_ROUNDS; ++round) {
        if (!resp) {
            g_logger->log(LOG_ERR, "greeter: broker i/o failed: {}", resp.error());
            abortLogin(resp.error());
            return;
        }

        bool done = false;

        std::visit(
            [&](const auto& r) {
                using T = std::decay_t<decltype(r)>;

                if constexpr (std::is_same_v<T, SPromptSecret> || std::is_same_v<T, SPromptVisible>) {
                    // only a secret prompt gets the password that was typed in advance
                    if constexpr (std::is_same_v<T, SPromptSecret>) {
                        if (!passwordSent) {
                            passwordSent = true;
                            resp         = m_client->postAuthResponse(std::string{m_password.content()});
                            m_password.clear();
                            return;
                        }
                    }

                    // the user has to type the answer
                    g_logger->log(LOG_DEBUG, "greeter: broker asks again");
                    m_password.clear();
                    m_pendingPrompt = r.prompt;
                    m_focus         = GREETER_FIELD_PASSWORD;
                    m_editor.setMode(EDIT_MODE_INSERT);
                    setInfo(r.prompt);
                    done = true;
                } else if constexpr (std::is_same_v<T, SAuthInfo>) {
                    setInfo(r.text);
                    resp = m_client->postAuthResponse(std::nullopt);
                } else if constexpr (std::is_same_v<T, SAuthError>) {
                    if (!r.sessionEnded) {
                        setError(r.text);
                        resp = m_client->postAuthResponse(std::nullopt);
                        return;
                    }

                    g_logger->log(LOG_WARN, "greeter: authentication failed: {}", r.text);
                    abortLogin(r.text);
                    done = true;
                } else {
                    g_logger->log(LOG_DEBUG, "greeter: authenticated");
                    startSession();
                    done = true;
                }
            },
            *resp);

        if (done)
            return;
    }

    abortLogin("Too many authentication messages");
}

void CGreeter::startSession() {
    if (m_selectedSession >= m_sessions.size()) {
        abortLogin("No session selected");
        return;
    }

    const auto& SESSION = m_sessions[m_selectedSession];
    g_logger->log(LOG_DEBUG, "greeter: starting session {} ({})", SESSION.name, Text::join(SESSION.command, " "));

    if (const auto RET = m_client->startSession(SESSION.command, SESSION.buildEnv()); !RET) {
        abortLogin(RET.error());
        return;
    }

    m_sessionOpen = false;
    m_shouldExit  = true;
    m_exitSuccess = true;
}

void CGreeter::abortLogin(std::string error) {
    m_password.clear();
    m_pendingPrompt.reset();

    if (m_sessionOpen) {
        if (const auto RET = m_client->cancelSession(); !RET)
            g_logger->log(LOG_DEBUG, "greeter: cancel after failure failed: {}", RET.error());
        m_sessionOpen = false;
    }

    m_focus = GREETER_FIELD_PASSWORD;
    m_editor.setMode(EDIT_MODE_INSERT);
    setError(std::move(error));
}

void CGreeter::cancel() {
    if (m_sessionOpen) {
        if (const auto RET = m_client->cancelSession(); !RET)
            g_logger->log(LOG_DEBUG, "greeter: cancel failed: {}", RET.error());
    }

    m_sessionOpen = false;
    m_working     = false;
    m_pendingPrompt.reset();
    m_password.clear();
    setInfo("Login cancelled");
}

CTextBuffer& CGreeter::currentField() {
    return m_focus == GREETER_FIELD_USERNAME ? m_username : m_password;
}

void CGreeter::toggleField() {
    m_focus = m_focus == GREETER_FIELD_USERNAME ? GREETER_FIELD_PASSWORD : GREETER_FIELD_USERNAME;
    m_editor.resetPending();
}

void CGreeter::setError(std::string text) {
    m_message = SStatusMessage{.text = std::move(text), .isError = true};
}

void CGreeter::setInfo(std::string text) {
    m_message = SStatusMessage{.text = std::move(text), .isError = false};
}

//
bool CGreeter::shouldExit() const {
    return m_shouldExit;
}

bool CGreeter::exitSuccess() const {
    return m_exitSuccess;
}

const CModalEditor& CGreeter::editor() const {
    return m_editor;
}

eGreeterField CGreeter::focus() const {
    return m_focus;
}

const CTextBuffer& CGreeter::username() const {
    return m_username;
}

const CTextBuffer& CGreeter::password() const {
    return m_password;
}

const std::vector<SSession>& CGreeter::sessions() const {
    return m_sessions;
}

size_t CGreeter::selectedSession() const {
    return m_selectedSession;
}

const std::vector<SUser>& CGreeter::users() const {
    return m_users;
}

size_t CGreeter::selectedUser() const {
    return m_selectedUser;
}

eGreeterOverlay CGreeter::overlay() const {
    return m_overlay;
}

std::optional<eGreeterConfirm> CGreeter::confirmAction() const {
    return m_confirm;
}

const std::optional<SStatusMessage>& CGreeter::message() const {
    return m_message;
}

const std::optional<std::string>& CGreeter::pendingPrompt() const {
    return m_pendingPrompt;
}

bool CGreeter::working() const {
    return m_working;
}

bool CGreeter::sessionOpen() const {
    return m_sessionOpen;
}
