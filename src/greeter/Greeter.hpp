#pragma once

#include "../helpers/Memory.hpp"
#include "../helpers/Message.hpp"
#include "../input/Key.hpp"
#include "../input/Modal.hpp"
#include "../input/TextBuffer.hpp"
#include "../ipc/GreetdClient.hpp"
#include "../system/Power.hpp"
#include "../system/Sessions.hpp"
#include "../system/Users.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum eGreeterField : uint8_t {
    GREETER_FIELD_USERNAME = 0,
    GREETER_FIELD_PASSWORD,
};

enum eGreeterOverlay : uint8_t {
    GREETER_OVERLAY_NONE = 0,
    GREETER_OVERLAY_HELP,
    GREETER_OVERLAY_SESSIONS,
    GREETER_OVERLAY_USERS,
};

enum eGreeterConfirm : uint8_t {
    GREETER_CONFIRM_REBOOT = 0,
    GREETER_CONFIRM_POWEROFF,
};

// The login screen: two fields, a session and a user picker, and the
// greetd handshake behind them. Round trips are synchronous.
class CGreeter {
  public:
    CGreeter(UP<CGreetdClient>&& client, UP<IPowerControl>&& power, std::vector<SSession> sessions, std::vector<SUser> users);

    void                                 handleKey(const SKeyEvent& key);

    // submit: starts a login, or answers the prompt the broker is waiting on
    void                                 login();
    // best effort, never fails
    void                                 cancel();

    bool                                 shouldExit() const;
    bool                                 exitSuccess() const;

    const CModalEditor&                  editor() const;
    eGreeterField                        focus() const;
    const CTextBuffer&                   username() const;
    const CTextBuffer&                   password() const;
    const std::vector<SSession>&         sessions() const;
    size_t                               selectedSession() const;
    const std::vector<SUser>&            users() const;
    size_t                               selectedUser() const;
    eGreeterOverlay                      overlay() const;
    std::optional<eGreeterConfirm>       confirmAction() const;
    const std::optional<SStatusMessage>& message() const;
    const std::optional<std::string>&    pendingPrompt() const;
    bool                                 working() const;
    bool                                 sessionOpen() const;

  private:
    void                          handleNormal(const SKeyEvent& key);
    void                          handleInsert(const SKeyEvent& key);
    void                          handleCommand(const SKeyEvent& key);
    void                          handlePicker(const SKeyEvent& key);
    void                          handleConfirm(const SKeyEvent& key, eGreeterConfirm action);
    void                          runCommand(const std::string& text);

    // follow the broker until it succeeds, fails or asks something the user has to answer
    void                          drive(std::expected<SAuthExchange, std::string> resp, bool passwordSent);
    void                          startSession();
    void                          abortLogin(std::string error);

    CTextBuffer&                  currentField();
    void                          toggleField();
    void                          setError(std::string text);
    void                          setInfo(std::string text);

    UP<CGreetdClient>             m_client;
    UP<IPowerControl>             m_power;

    std::vector<SSession>         m_sessions;
    std::vector<SUser>            m_users;
    size_t                        m_selectedSession = 0;
    size_t                        m_selectedUser    = 0;

    CModalEditor                  m_editor{EDIT_MODE_INSERT};
    eGreeterField                 m_focus = GREETER_FIELD_USERNAME;
    CTextBuffer                   m_username;
    CTextBuffer                   m_password = CTextBuffer::makeMasked();

    eGreeterOverlay               m_overlay = GREETER_OVERLAY_NONE;
    std::optional<eGreeterConfirm> m_confirm;
    std::optional<SStatusMessage> m_message;

    std::optional<std::string>    m_pendingPrompt;
    bool                          m_working     = false;
    bool                          m_sessionOpen = false;
    bool                          m_shouldExit  = false;
    bool                          m_exitSuccess = false;
};
