#include "greeter/Greeter.hpp"

#include "FakeBrokerTransport.hpp"
#include "MockPower.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

using ::testing::Return;

class GreeterTest : public ::testing::Test {
  protected:
    void SetUp() override {
        auto power = makeUnique<CMockPower>();
        m_power    = power.get();

        std::vector<SSession> sessions = {
            SSession{.name = "Sway", .slug = "sway", .exec = "sway", .command = {"sway"}},
            SSession{.name = "GNOME on Xorg", .slug = "gnome-xorg", .exec = "gnome-session", .command = {"gnome-session"}, .type = SESSION_X11},
        };
        std::vector<SUser> users = {SUser{.username = "alice"}, SUser{.username = "bob", .displayName = "Bob B"}};

        m_greeter = makeUnique<CGreeter>(makeUnique<CGreetdClient>(makeUnique<CFakeBrokerTransport>(m_broker)), std::move(power), std::move(sessions), std::move(users));
    }

    void type(std::string_view text) {
        for (char c : text) {
            m_greeter->handleKey(SKeyEvent::character(c));
        }
    }

    void press(eKeyCode code) {
        m_greeter->handleKey(SKeyEvent::special(code));
    }

    void command(std::string_view text) {
        m_greeter->handleKey(SKeyEvent::special(INPUT_KEY_ESCAPE));
        type(":");
        type(text);
        press(INPUT_KEY_ENTER);
    }

    // username, Enter, i, password, Enter
    void enterCredentials(std::string_view user, std::string_view password) {
        type(user);
        press(INPUT_KEY_ENTER);
        type("i");
        type(password);
        press(INPUT_KEY_ENTER);
    }

    template <typename T>
    size_t countSent() const {
        return std::ranges::count_if(m_broker.sent, [](const SRequest& r) { return std::holds_alternative<T>(r); });
    }

    CFakeBrokerTransport::SState m_broker;
    CMockPower*                  m_power = nullptr;
    UP<CGreeter>                 m_greeter;
};

TEST_F(GreeterTest, starts_in_insert_on_username) {
    EXPECT_EQ(m_greeter->editor().mode(), EDIT_MODE_INSERT);
    EXPECT_EQ(m_greeter->focus(), GREETER_FIELD_USERNAME);
}

TEST_F(GreeterTest, empty_username_never_reaches_the_broker) {
    press(INPUT_KEY_TAB);
    press(INPUT_KEY_ENTER);

    ASSERT_TRUE(m_greeter->message());
    EXPECT_TRUE(m_greeter->message()->isError);
    EXPECT_EQ(m_greeter->message()->text, "Username is required");
    EXPECT_TRUE(m_broker.sent.empty());
}

TEST_F(GreeterTest, password_handshake_starts_the_session) {
    m_broker.script = {secretPrompt("Password:"), SBrokerSuccess{}, SBrokerSuccess{}};

    enterCredentials("alice", "demo");

    ASSERT_EQ(m_broker.sent.size(), 3u);
    EXPECT_EQ(std::get<SCreateSession>(m_broker.sent[0]).username, "alice");
    EXPECT_EQ(std::get<SPostAuthResponse>(m_broker.sent[1]).response, std::optional<std::string>{"demo"});
    EXPECT_EQ(std::get<SStartSession>(m_broker.sent[2]).cmd, (std::vector<std::string>{"sway"}));

    EXPECT_TRUE(m_greeter->shouldExit());
    EXPECT_TRUE(m_greeter->exitSuccess());
    EXPECT_TRUE(m_greeter->password().empty());
    EXPECT_FALSE(m_greeter->working());
}

TEST_F(GreeterTest, passwordless_login) {
    m_broker.script = {SBrokerSuccess{}, SBrokerSuccess{}};

    type("alice");
    press(INPUT_KEY_ENTER);
    press(INPUT_KEY_ENTER);

    EXPECT_EQ(countSent<SPostAuthResponse>(), 0u);
    EXPECT_TRUE(m_greeter->exitSuccess());
}

TEST_F(GreeterTest, auth_failure_cancels_and_clears_password) {
    m_broker.script = {secretPrompt(), brokerError(BROKER_ERROR_AUTH, "pam_unix(greetd:auth): bad password"), SBrokerSuccess{}};

    enterCredentials("alice", "wrong");

    ASSERT_TRUE(m_greeter->message());
    EXPECT_TRUE(m_greeter->message()->isError);
    EXPECT_EQ(m_greeter->message()->text, "Authentication failed");

    EXPECT_TRUE(std::holds_alternative<SCancelSession>(m_broker.sent.back()));
    EXPECT_TRUE(m_greeter->password().empty());
    EXPECT_FALSE(m_greeter->sessionOpen());
    EXPECT_FALSE(m_greeter->shouldExit());
    EXPECT_EQ(m_greeter->focus(), GREETER_FIELD_PASSWORD);

    // and a retry starts from scratch
    m_broker.script = {secretPrompt(), SBrokerSuccess{}, SBrokerSuccess{}};
    type("demo");
    press(INPUT_KEY_ENTER);

    EXPECT_EQ(countSent<SCreateSession>(), 2u);
    EXPECT_TRUE(m_greeter->exitSuccess());
}

TEST_F(GreeterTest, second_prompt_waits_for_the_user) {
    m_broker.script = {secretPrompt("Password:"), authMessage(AUTH_MESSAGE_VISIBLE, "OTP code:")};

    enterCredentials("alice", "demo");

    ASSERT_TRUE(m_greeter->pendingPrompt());
    EXPECT_EQ(*m_greeter->pendingPrompt(), "OTP code:");
    EXPECT_TRUE(m_greeter->password().empty());
    EXPECT_EQ(m_greeter->editor().mode(), EDIT_MODE_INSERT);
    EXPECT_FALSE(m_greeter->shouldExit());

    m_broker.script = {SBrokerSuccess{}, SBrokerSuccess{}};
    type("123456");
    press(INPUT_KEY_ENTER);

    ASSERT_EQ(countSent<SPostAuthResponse>(), 2u);
    EXPECT_EQ(std::get<SPostAuthResponse>(m_broker.sent[2]).response, std::optional<std::string>{"123456"});
    EXPECT_EQ(countSent<SCreateSession>(), 1u);
    EXPECT_TRUE(m_greeter->exitSuccess());
}

TEST_F(GreeterTest, visible_first_prompt_never_gets_the_password) {
    m_broker.script = {authMessage(AUTH_MESSAGE_VISIBLE, "Token serial:")};

    enterCredentials("alice", "demo");

    EXPECT_EQ(countSent<SPostAuthResponse>(), 0u);
    ASSERT_TRUE(m_greeter->pendingPrompt());
    EXPECT_EQ(*m_greeter->pendingPrompt(), "Token serial:");
    EXPECT_TRUE(m_greeter->password().empty());
    EXPECT_EQ(m_greeter->focus(), GREETER_FIELD_PASSWORD);
    EXPECT_EQ(m_greeter->editor().mode(), EDIT_MODE_INSERT);

    m_broker.script = {secretPrompt("Password:")};
    type("TK-42");
    press(INPUT_KEY_ENTER);

    ASSERT_EQ(countSent<SPostAuthResponse>(), 1u);
    EXPECT_EQ(std::get<SPostAuthResponse>(m_broker.sent[1]).response, std::optional<std::string>{"TK-42"});
    ASSERT_TRUE(m_greeter->pendingPrompt());
    EXPECT_EQ(*m_greeter->pendingPrompt(), "Password:");

    m_broker.script = {SBrokerSuccess{}, SBrokerSuccess{}};
    type("demo");
    press(INPUT_KEY_ENTER);

    ASSERT_EQ(countSent<SPostAuthResponse>(), 2u);
    EXPECT_EQ(std::get<SPostAuthResponse>(m_broker.sent[2]).response, std::optional<std::string>{"demo"});
    EXPECT_TRUE(m_greeter->exitSuccess());
}

TEST_F(GreeterTest, info_and_pam_errors_are_acknowledged) {
    m_broker.script = {secretPrompt(), authMessage(AUTH_MESSAGE_INFO, "Last login: yesterday"), authMessage(AUTH_MESSAGE_ERROR, "password expires soon"), SBrokerSuccess{},
                       SBrokerSuccess{}};

    enterCredentials("alice", "demo");

    ASSERT_EQ(m_broker.sent.size(), 5u);
    EXPECT_FALSE(std::get<SPostAuthResponse>(m_broker.sent[2]).response);
    EXPECT_FALSE(std::get<SPostAuthResponse>(m_broker.sent[3]).response);
    EXPECT_TRUE(m_greeter->exitSuccess());
}

TEST_F(GreeterTest, endless_info_gives_up) {
    m_broker.script = {secretPrompt()};
    for (int i = 0; i < 20; ++i) {
        m_broker.script.push_back(authMessage(AUTH_MESSAGE_INFO, "still thinking"));
    }

    enterCredentials("alice", "demo");

    ASSERT_TRUE(m_greeter->message());
    EXPECT_EQ(m_greeter->message()->text, "Too many authentication messages");
    EXPECT_FALSE(m_greeter->sessionOpen());
}

TEST_F(GreeterTest, session_start_failure_resets) {
    m_broker.script = {secretPrompt(), SBrokerSuccess{}, brokerError(BROKER_ERROR_OTHER, "exec failed"), SBrokerSuccess{}};

    enterCredentials("alice", "demo");

    ASSERT_TRUE(m_greeter->message());
    EXPECT_EQ(m_greeter->message()->text, "Failed to start session: exec failed");
    EXPECT_TRUE(std::holds_alternative<SCancelSession>(m_broker.sent.back()));
    EXPECT_FALSE(m_greeter->shouldExit());
}

TEST_F(GreeterTest, broker_io_failure_is_reported) {
    type("alice");
    press(INPUT_KEY_ENTER);
    press(INPUT_KEY_ENTER);

    ASSERT_TRUE(m_greeter->message());
    EXPECT_TRUE(m_greeter->message()->isError);
    EXPECT_EQ(m_greeter->message()->text, "script exhausted");
    EXPECT_FALSE(m_greeter->sessionOpen());
}

TEST_F(GreeterTest, ctrl_c_cancels_a_pending_prompt) {
    m_broker.script = {secretPrompt(), secretPrompt("Token:"), SBrokerSuccess{}};

    enterCredentials("alice", "demo");
    ASSERT_TRUE(m_greeter->pendingPrompt());

    m_greeter->handleKey(SKeyEvent::control('c'));

    EXPECT_TRUE(std::holds_alternative<SCancelSession>(m_broker.sent.back()));
    EXPECT_FALSE(m_greeter->pendingPrompt());
    EXPECT_FALSE(m_greeter->sessionOpen());
    EXPECT_FALSE(m_greeter->working());
    EXPECT_TRUE(m_greeter->password().empty());
}

TEST_F(GreeterTest, messages_clear_on_next_key) {
    press(INPUT_KEY_TAB);
    press(INPUT_KEY_ENTER);
    ASSERT_TRUE(m_greeter->message());

    type("x");
    EXPECT_FALSE(m_greeter->message());
}

TEST_F(GreeterTest, session_command) {
    command("session xorg");
    EXPECT_EQ(m_greeter->selectedSession(), 1u);

    command("s SWAY");
    EXPECT_EQ(m_greeter->selectedSession(), 0u);

    command("session kde");
    ASSERT_TRUE(m_greeter->message());
    EXPECT_EQ(m_greeter->message()->text, "Session not found: kde");
    EXPECT_EQ(m_greeter->selectedSession(), 0u);

    command("s");
    EXPECT_EQ(m_greeter->overlay(), GREETER_OVERLAY_SESSIONS);
}

TEST_F(GreeterTest, user_command_fills_username) {
    command("user BOB");
    EXPECT_EQ(m_greeter->username().content(), "bob");

    command("u carol");
    ASSERT_TRUE(m_greeter->message());
    EXPECT_EQ(m_greeter->message()->text, "User not found: carol");
    EXPECT_EQ(m_greeter->username().content(), "bob");
}

TEST_F(GreeterTest, unknown_command_changes_nothing) {
    command("bogus");
    ASSERT_TRUE(m_greeter->message());
    EXPECT_EQ(m_greeter->message()->text, "Unknown command: bogus");
    EXPECT_EQ(m_greeter->editor().mode(), EDIT_MODE_NORMAL);
    EXPECT_EQ(m_greeter->overlay(), GREETER_OVERLAY_NONE);
}

TEST_F(GreeterTest, user_picker) {
    m_greeter->handleKey(SKeyEvent::function(2));
    ASSERT_EQ(m_greeter->overlay(), GREETER_OVERLAY_USERS);

    type("j");
    press(INPUT_KEY_ENTER);

    EXPECT_EQ(m_greeter->overlay(), GREETER_OVERLAY_NONE);
    EXPECT_EQ(m_greeter->username().content(), "bob");
    EXPECT_EQ(m_greeter->focus(), GREETER_FIELD_PASSWORD);
}

TEST_F(GreeterTest, session_picker_clamps) {
    m_greeter->handleKey(SKeyEvent::function(3));
    type("jjjj");
    EXPECT_EQ(m_greeter->selectedSession(), 1u);
    type("kkkk");
    EXPECT_EQ(m_greeter->selectedSession(), 0u);
    type("q");
    EXPECT_EQ(m_greeter->overlay(), GREETER_OVERLAY_NONE);
}

TEST_F(GreeterTest, poweroff_needs_confirmation) {
    EXPECT_CALL(*m_power, poweroff()).Times(0);

    m_greeter->handleKey(SKeyEvent::function(12));
    ASSERT_EQ(m_greeter->confirmAction(), std::optional{GREETER_CONFIRM_POWEROFF});

    type("n");
    EXPECT_FALSE(m_greeter->confirmAction());
}

TEST_F(GreeterTest, confirmed_reboot_reaches_power_control) {
    EXPECT_CALL(*m_power, reboot()).WillOnce(Return(std::expected<void, std::string>{}));

    command("reboot");
    ASSERT_EQ(m_greeter->confirmAction(), std::optional{GREETER_CONFIRM_REBOOT});

    type("y");
    EXPECT_FALSE(m_greeter->confirmAction());
    EXPECT_FALSE(m_greeter->message());
}

TEST_F(GreeterTest, power_failure_is_shown) {
    EXPECT_CALL(*m_power, poweroff()).WillOnce(Return(std::unexpected<std::string>("not allowed")));

    command("po");
    type("Y");

    ASSERT_TRUE(m_greeter->message());
    EXPECT_EQ(m_greeter->message()->text, "Poweroff failed: not allowed");
}

TEST_F(GreeterTest, normal_mode_editing) {
    type("alicex");
    press(INPUT_KEY_ESCAPE);
    ASSERT_EQ(m_greeter->editor().mode(), EDIT_MODE_NORMAL);

    type("hx");
    EXPECT_EQ(m_greeter->username().content(), "alice");

    type("j");
    EXPECT_EQ(m_greeter->focus(), GREETER_FIELD_PASSWORD);
    type("k");
    type("dd");
    EXPECT_TRUE(m_greeter->username().empty());
}
