#include "Modal.hpp"

#include <hyprutils/string/String.hpp>

eEditMode transition(eEditMode mode, eModeAction action) {
    switch (mode) {
        case EDIT_MODE_NORMAL:
            if (action == MODE_ACTION_ENTER_INSERT)
                return EDIT_MODE_INSERT;
            if (action == MODE_ACTION_ENTER_COMMAND)
                return EDIT_MODE_COMMAND;
            break;
        case EDIT_MODE_INSERT:
            if (action == MODE_ACTION_CANCEL)
                return EDIT_MODE_NORMAL;
            break;
        case EDIT_MODE_COMMAND:
            if (action == MODE_ACTION_CANCEL || action == MODE_ACTION_EXECUTE)
                return EDIT_MODE_NORMAL;
            break;
    }

    return mode;
}

const char* modeName(eEditMode mode) {
    switch (mode) {
        case EDIT_MODE_NORMAL: return "NORMAL";
        case EDIT_MODE_INSERT: return "INSERT";
        case EDIT_MODE_COMMAND: return "COMMAND";
    }
    return "?";
}

//
CModalEditor::CModalEditor(eEditMode initial) : m_mode(initial) {
    ;
}

eEditMode CModalEditor::mode() const {
    return m_mode;
}

void CModalEditor::apply(eModeAction action) {
    m_mode = transition(m_mode, action);
}

void CModalEditor::setMode(eEditMode mode) {
    m_mode = mode;
}

const CTextBuffer& CModalEditor::commandLine() const {
    return m_command;
}

void CModalEditor::enterCommand() {
    apply(MODE_ACTION_ENTER_COMMAND);
    m_command.clear();
    m_pendingDelete = false;
}

void CModalEditor::resetPending() {
    m_pendingDelete = false;
}

bool CModalEditor::pendingDelete() const {
    return m_pendingDelete;
}

bool CModalEditor::feedNormal(CTextBuffer& buf, const SKeyEvent& key) {
    if (key.isChar('d')) {
        if (m_pendingDelete)
            buf.clear();
        m_pendingDelete = !m_pendingDelete;
        return true;
    }

    m_pendingDelete = false;

    if (key.isChar('h') || key.code == INPUT_KEY_LEFT)
        buf.moveLeft();
    else if (key.isChar('l') || key.code == INPUT_KEY_RIGHT)
        buf.moveRight();
    else if (key.isChar('0') || key.code == INPUT_KEY_HOME)
        buf.moveStart();
    else if (key.isChar('$') || key.code == INPUT_KEY_END)
        buf.moveEnd();
    else if (key.isChar('x') || key.code == INPUT_KEY_DELETE)
        buf.deleteForward();
    else
        return false;

    return true;
}

bool CModalEditor::feedInsert(CTextBuffer& buf, const SKeyEvent& key) {
    switch (key.code) {
        case INPUT_KEY_BACKSPACE: buf.deleteBack(); return true;
        case INPUT_KEY_DELETE: buf.deleteForward(); return true;
        case INPUT_KEY_LEFT: buf.moveLeft(); return true;
        case INPUT_KEY_RIGHT: buf.moveRight(); return true;
        case INPUT_KEY_HOME: buf.moveStart(); return true;
        case INPUT_KEY_END: buf.moveEnd(); return true;
        case INPUT_KEY_CHAR: break;
        default: return false;
    }

    if (key.ctrl) {
        switch (key.ch) {
            case 'w': buf.deleteWordBack(); return true;
            case 'u': buf.clear(); return true;
            case 'a': buf.moveStart(); return true;
            case 'e': buf.moveEnd(); return true;
            default: return false;
        }
    }

    if (!key.isPrintable())
        return false;

    buf.insert(key.ch);
    return true;
}

SCommandFeed CModalEditor::feedCommand(const SKeyEvent& key) {
    switch (key.code) {
        case INPUT_KEY_ESCAPE:
            apply(MODE_ACTION_CANCEL);
            m_command.clear();
            return {};
        case INPUT_KEY_ENTER: {
            auto text = Hyprutils::String::trim(std::string{m_command.content()});
            apply(MODE_ACTION_EXECUTE);
            m_command.clear();
            return {.executed = std::move(text)};
        }
        case INPUT_KEY_BACKSPACE:
            if (m_command.empty())
                apply(MODE_ACTION_CANCEL);
            else
                m_command.deleteBack();
            return {};
        default: break;
    }

    if (!feedInsert(m_command, key))
        return {.consumed = false};

    return {};
}
