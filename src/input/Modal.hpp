#pragma once

#include "Key.hpp"
#include "TextBuffer.hpp"

#include <optional>
#include <string>

enum eEditMode : uint8_t {
    EDIT_MODE_NORMAL = 0,
    EDIT_MODE_INSERT,
    EDIT_MODE_COMMAND,
};

enum eModeAction : uint8_t {
    MODE_ACTION_ENTER_INSERT = 0,
    MODE_ACTION_ENTER_COMMAND,
    MODE_ACTION_CANCEL,
    MODE_ACTION_EXECUTE,
};

// total: pairs not listed here keep the current mode
eEditMode   transition(eEditMode mode, eModeAction action);
const char* modeName(eEditMode mode);

struct SCommandFeed {
    bool                       consumed = true;
    std::optional<std::string> executed; // set when the command line was submitted, trimmed
};

// The vim-style editing state shared by the greeter and the onboarding wizard.
// It owns the mode, the `:` command line and the pending `d` of a `dd`.
class CModalEditor {
  public:
    explicit CModalEditor(eEditMode initial = EDIT_MODE_NORMAL);

    eEditMode          mode() const;
    void               apply(eModeAction action);
    // forced switches the state machine doesn't model (e.g. submit from insert)
    void               setMode(eEditMode mode);

    const CTextBuffer& commandLine() const;

    // Normal mode cursor motions and edits on `buf`: h l 0 $ x dd, arrows.
    // Returns false for keys it does not know, which also resets the pending `d`.
    bool               feedNormal(CTextBuffer& buf, const SKeyEvent& key);

    // Insert mode editing of `buf`. Returns false for keys the caller should handle (Esc, Enter, Tab...)
    bool               feedInsert(CTextBuffer& buf, const SKeyEvent& key);

    // Command mode. `:` must already have been handled by the caller via enterCommand().
    SCommandFeed       feedCommand(const SKeyEvent& key);

    void               enterCommand();
    void               resetPending();
    bool               pendingDelete() const;

  private:
    eEditMode   m_mode          = EDIT_MODE_NORMAL;
    CTextBuffer m_command;
    bool        m_pendingDelete = false;
};
