#include "Widgets.hpp"

#include "../helpers/Text.hpp"

#include <algorithm>
#include <format>

void Widgets::drawField(CTerminal& term, int y, int x, int w, std::string_view label, const CTextBuffer& buf, bool focused, bool insert) {
    const auto LABEL = std::format("{:>10}: ", label);
    term.print(y, x, LABEL, focused ? STYLE_TITLE : STYLE_DIM);

    const int  FIELD_X = x + sc<int>(LABEL.size());
    const int  FIELD_W = std::max(4, w - sc<int>(LABEL.size()));

    const auto TEXT = buf.display();
    const int  LEN  = sc<int>(Text::codepointCount(TEXT));
    const int  CUR  = sc<int>(buf.cursor());

    // scroll so the cursor stays visible
    const int SHIFT = std::max(0, CUR - (FIELD_W - 1));

    term.print(y, FIELD_X, std::string(FIELD_W, ' '), focused ? STYLE_SELECTED : STYLE_NORMAL);
    if (LEN > 0)
        term.print(y, FIELD_X, TEXT.substr(Text::byteOffset(TEXT, SHIFT)), focused ? STYLE_SELECTED : STYLE_NORMAL, FIELD_W);

    if (focused && insert)
        term.setCursor(y, FIELD_X + CUR - SHIFT);
}

void Widgets::drawStatusLine(CTerminal& term, const CModalEditor& editor, const std::optional<SStatusMessage>& message, std::string_view hint) {
    const int Y = term.height() - 1;

    if (editor.mode() == EDIT_MODE_COMMAND) {
        const auto& CMD = editor.commandLine();
        term.print(Y, 0, std::format(":{}", CMD.content()));
        term.setCursor(Y, 1 + sc<int>(CMD.cursor()));
        return;
    }

    const auto MODE = std::format(" {} ", modeName(editor.mode()));
    term.print(Y, 0, MODE, STYLE_SELECTED);

    const int X = sc<int>(MODE.size()) + 1;

    if (message)
        term.print(Y, X, message->text, message->isError ? STYLE_ERROR : STYLE_INFO);
    else
        term.print(Y, X, hint, STYLE_DIM);
}

std::pair<int, int> Widgets::centeredBox(CTerminal& term, int h, int w, std::string_view title) {
    w = std::min(w, term.width());
    h = std::min(h, term.height());

    const int Y = std::max(0, (term.height() - h) / 2);
    const int X = std::max(0, (term.width() - w) / 2);

    for (int i = 0; i < h; ++i) {
        term.print(Y + i, X, std::string(w, ' '));
    }

    term.box(Y, X, h, w, title);
    return {Y, X};
}

void Widgets::drawConfirm(CTerminal& term, std::string_view question) {
    const int  W      = std::max(30, sc<int>(Text::codepointCount(question)) + 6);
    const auto [Y, X] = centeredBox(term, 5, W, "Confirm");

    term.print(Y + 1, X + 3, question, STYLE_WARNING, W - 6);
    term.print(Y + 3, X + 3, "[y]es  [n]o", STYLE_DIM, W - 6);
    term.hideCursor();
}

void Widgets::drawHelp(CTerminal& term, std::string_view title, const std::vector<std::string>& lines) {
    int w = 20;
    for (const auto& l : lines) {
        w = std::max(w, sc<int>(Text::codepointCount(l)) + 6);
    }

    const auto [Y, X] = centeredBox(term, sc<int>(lines.size()) + 4, w, title);

    for (size_t i = 0; i < lines.size(); ++i) {
        term.print(Y + 1 + sc<int>(i), X + 3, lines[i], STYLE_NORMAL, w - 6);
    }

    term.print(Y + sc<int>(lines.size()) + 2, X + 3, "Esc or q to close", STYLE_DIM, w - 6);
    term.hideCursor();
}

std::string Widgets::progressBar(uint8_t percent, int w) {
    percent         = std::min<uint8_t>(percent, 100);
    const int FILL  = w * percent / 100;
    std::string bar = "[";
    bar += std::string(FILL, '#');
    bar += std::string(w - FILL, '.');
    bar += std::format("] {:>3}%", percent);
    return bar;
}
