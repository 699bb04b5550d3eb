#pragma once

#include "Terminal.hpp"

#include "../helpers/Message.hpp"
#include "../input/Modal.hpp"
#include "../input/TextBuffer.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// plain building blocks the greeter and the wizard draw with
namespace Widgets {
    // "label: [content   ]". Puts the terminal cursor in the field when it has focus in insert mode.
    void drawField(CTerminal& term, int y, int x, int w, std::string_view label, const CTextBuffer& buf, bool focused, bool insert);

    // bottom line: mode, then the message or the hint. In command mode it's the `:` line instead.
    void drawStatusLine(CTerminal& term, const CModalEditor& editor, const std::optional<SStatusMessage>& message, std::string_view hint);

    void drawConfirm(CTerminal& term, std::string_view question);
    void drawHelp(CTerminal& term, std::string_view title, const std::vector<std::string>& lines);

    // a centered box, returns its top left corner
    std::pair<int, int> centeredBox(CTerminal& term, int h, int w, std::string_view title);

    std::string         progressBar(uint8_t percent, int w);
}
