#pragma once

#include "../input/Key.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

enum eStyle : uint8_t {
    STYLE_NORMAL = 0,
    STYLE_TITLE,
    STYLE_DIM,
    STYLE_SELECTED,
    STYLE_ERROR,
    STYLE_INFO,
    STYLE_SUCCESS,
    STYLE_WARNING,
};

// Owns curses for the process. Only one may exist. The original terminal mode
// comes back on destruction, on std::terminate and on fatal signals.
class CTerminal {
  public:
    CTerminal() = default;
    ~CTerminal();

    CTerminal(const CTerminal&)            = delete;
    CTerminal& operator=(const CTerminal&) = delete;

    std::expected<void, std::string> init();

    // give the tty to a child and take it back afterwards
    void                             suspend();
    void                             resume();

    // everything that is pending on stdin right now
    std::vector<SKeyEvent>           readKeys();

    int                              width() const;
    int                              height() const;

    void                             clear();
    void                             print(int y, int x, std::string_view text, eStyle style = STYLE_NORMAL, int maxWidth = -1);
    void                             box(int y, int x, int h, int w, std::string_view title = "");
    void                             hline(int y, int x, int w);
    void                             setCursor(int y, int x);
    void                             hideCursor();
    void                             present();

    // maps a wget_wch() result to a key, INPUT_KEY_NONE for what we don't handle
    static SKeyEvent                 decodeKey(int status, uint32_t ch);

    // concatenates terminfo strings into `out`, skipping missing ones. A capability
    // that doesn't fit ends the sequence. Returns the bytes used.
    static size_t                    buildResetSequence(const std::vector<const char*>& caps, std::span<char> out);

  private:
    bool m_active  = false;
    int  m_cursorY = -1;
    int  m_cursorX = -1;
};
