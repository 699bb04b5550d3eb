#include "input/Modal.hpp"

#include <gtest/gtest.h>

TEST(modal_tests, transition_table) {
    EXPECT_EQ(transition(EDIT_MODE_NORMAL, MODE_ACTION_ENTER_INSERT), EDIT_MODE_INSERT);
    EXPECT_EQ(transition(EDIT_MODE_NORMAL, MODE_ACTION_ENTER_COMMAND), EDIT_MODE_COMMAND);
    EXPECT_EQ(transition(EDIT_MODE_NORMAL, MODE_ACTION_CANCEL), EDIT_MODE_NORMAL);
    EXPECT_EQ(transition(EDIT_MODE_NORMAL, MODE_ACTION_EXECUTE), EDIT_MODE_NORMAL);

    EXPECT_EQ(transition(EDIT_MODE_INSERT, MODE_ACTION_CANCEL), EDIT_MODE_NORMAL);
    EXPECT_EQ(transition(EDIT_MODE_INSERT, MODE_ACTION_ENTER_INSERT), EDIT_MODE_INSERT);
    EXPECT_EQ(transition(EDIT_MODE_INSERT, MODE_ACTION_ENTER_COMMAND), EDIT_MODE_INSERT);
    EXPECT_EQ(transition(EDIT_MODE_INSERT, MODE_ACTION_EXECUTE), EDIT_MODE_INSERT);

    EXPECT_EQ(transition(EDIT_MODE_COMMAND, MODE_ACTION_CANCEL), EDIT_MODE_NORMAL);
    EXPECT_EQ(transition(EDIT_MODE_COMMAND, MODE_ACTION_EXECUTE), EDIT_MODE_NORMAL);
    EXPECT_EQ(transition(EDIT_MODE_COMMAND, MODE_ACTION_ENTER_INSERT), EDIT_MODE_COMMAND);
    EXPECT_EQ(transition(EDIT_MODE_COMMAND, MODE_ACTION_ENTER_COMMAND), EDIT_MODE_COMMAND);
}

TEST(modal_tests, normal_motions) {
    CModalEditor editor;
    CTextBuffer  buf;
    buf.set("abcd");

    EXPECT_TRUE(editor.feedNormal(buf, SKeyEvent::character('0')));
    EXPECT_EQ(buf.cursor(), 0u);
    EXPECT_TRUE(editor.feedNormal(buf, SKeyEvent::character('l')));
    EXPECT_TRUE(editor.feedNormal(buf, SKeyEvent::character('x')));
    EXPECT_EQ(buf.content(), "acd");
    EXPECT_TRUE(editor.feedNormal(buf, SKeyEvent::character('$')));
    EXPECT_EQ(buf.cursor(), 3u);
    EXPECT_TRUE(editor.feedNormal(buf, SKeyEvent::special(INPUT_KEY_LEFT)));
    EXPECT_EQ(buf.cursor(), 2u);

    EXPECT_FALSE(editor.feedNormal(buf, SKeyEvent::character('j')));
}

TEST(modal_tests, dd_clears_field) {
    CModalEditor editor;
    CTextBuffer  buf;
    buf.set("alice");

    editor.feedNormal(buf, SKeyEvent::character('d'));
    EXPECT_TRUE(editor.pendingDelete());
    EXPECT_EQ(buf.content(), "alice");

    editor.feedNormal(buf, SKeyEvent::character('d'));
    EXPECT_FALSE(editor.pendingDelete());
    EXPECT_TRUE(buf.empty());
}

TEST(modal_tests, other_key_resets_pending_delete) {
    CModalEditor editor;
    CTextBuffer  buf;
    buf.set("alice");

    editor.feedNormal(buf, SKeyEvent::character('d'));
    editor.feedNormal(buf, SKeyEvent::character('h'));
    EXPECT_FALSE(editor.pendingDelete());

    editor.feedNormal(buf, SKeyEvent::character('d'));
    EXPECT_EQ(buf.content(), "alice");

    // unknown keys reset it too
    editor.feedNormal(buf, SKeyEvent::character('j'));
    editor.feedNormal(buf, SKeyEvent::character('d'));
    EXPECT_EQ(buf.content(), "alice");
}

TEST(modal_tests, insert_editing) {
    CModalEditor editor{EDIT_MODE_INSERT};
    CTextBuffer  buf;

    for (char c : std::string{"foo bar"}) {
        EXPECT_TRUE(editor.feedInsert(buf, SKeyEvent::character(c)));
    }
    EXPECT_EQ(buf.content(), "foo bar");

    EXPECT_TRUE(editor.feedInsert(buf, SKeyEvent::control('w')));
    EXPECT_EQ(buf.content(), "foo ");

    EXPECT_TRUE(editor.feedInsert(buf, SKeyEvent::control('a')));
    EXPECT_EQ(buf.cursor(), 0u);
    EXPECT_TRUE(editor.feedInsert(buf, SKeyEvent::control('e')));
    EXPECT_EQ(buf.cursor(), 4u);

    EXPECT_TRUE(editor.feedInsert(buf, SKeyEvent::special(INPUT_KEY_BACKSPACE)));
    EXPECT_EQ(buf.content(), "foo");

    EXPECT_TRUE(editor.feedInsert(buf, SKeyEvent::control('u')));
    EXPECT_TRUE(buf.empty());

    EXPECT_FALSE(editor.feedInsert(buf, SKeyEvent::special(INPUT_KEY_ESCAPE)));
    EXPECT_FALSE(editor.feedInsert(buf, SKeyEvent::special(INPUT_KEY_ENTER)));
    EXPECT_FALSE(editor.feedInsert(buf, SKeyEvent::control('x')));
    EXPECT_EQ(editor.mode(), EDIT_MODE_INSERT);
}

TEST(modal_tests, command_line_executes_trimmed) {
    CModalEditor editor;
    editor.enterCommand();
    ASSERT_EQ(editor.mode(), EDIT_MODE_COMMAND);

    for (char c : std::string{"  s gnome "}) {
        editor.feedCommand(SKeyEvent::character(c));
    }

    const auto FEED = editor.feedCommand(SKeyEvent::special(INPUT_KEY_ENTER));
    ASSERT_TRUE(FEED.executed);
    EXPECT_EQ(*FEED.executed, "s gnome");
    EXPECT_EQ(editor.mode(), EDIT_MODE_NORMAL);
    EXPECT_TRUE(editor.commandLine().empty());
}

TEST(modal_tests, command_line_cancel) {
    CModalEditor editor;
    editor.enterCommand();
    editor.feedCommand(SKeyEvent::character('q'));

    const auto FEED = editor.feedCommand(SKeyEvent::special(INPUT_KEY_ESCAPE));
    EXPECT_FALSE(FEED.executed);
    EXPECT_EQ(editor.mode(), EDIT_MODE_NORMAL);

    // backspace on an empty line leaves command mode
    editor.enterCommand();
    editor.feedCommand(SKeyEvent::special(INPUT_KEY_BACKSPACE));
    EXPECT_EQ(editor.mode(), EDIT_MODE_NORMAL);
}
