#include "TextBuffer.hpp"
#include "../helpers/Text.hpp"
#include "../helpers/Memory.hpp"

#include <algorithm>
#include <cstring>

#include <openssl/crypto.h>

constexpr const size_t MIN_CAPACITY = 32;

//
CTextBuffer::~CTextBuffer() {
    if (m_masked)
        wipe();
}

CTextBuffer::CTextBuffer(CTextBuffer&& other) noexcept :
    m_data(std::move(other.m_data)), m_capacity(other.m_capacity), m_size(other.m_size), m_cursor(other.m_cursor), m_length(other.m_length), m_masked(other.m_masked) {
    other.m_capacity = 0;
    other.m_size     = 0;
    other.m_cursor   = 0;
    other.m_length   = 0;
}

CTextBuffer& CTextBuffer::operator=(CTextBuffer&& other) noexcept {
    if (this == &other)
        return *this;

    wipe();

    m_data     = std::move(other.m_data);
    m_capacity = other.m_capacity;
    m_size     = other.m_size;
    m_cursor   = other.m_cursor;
    m_length   = other.m_length;
    m_masked   = other.m_masked;

    other.m_capacity = 0;
    other.m_size     = 0;
    other.m_cursor   = 0;
    other.m_length   = 0;

    return *this;
}

CTextBuffer CTextBuffer::makeMasked() {
    CTextBuffer buf;
    buf.m_masked = true;
    return buf;
}

void CTextBuffer::wipe() {
    if (m_data && m_capacity > 0)
        OPENSSL_cleanse(m_data.get(), m_capacity);
}

void CTextBuffer::release() {
    wipe();
    m_size   = 0;
    m_cursor = 0;
    m_length = 0;
}

void CTextBuffer::reserve(size_t bytes) {
    if (bytes <= m_capacity)
        return;

    const size_t NEWCAP = std::max({bytes, m_capacity * 2, MIN_CAPACITY});
    auto         block  = std::make_unique<char[]>(NEWCAP);

    if (m_size > 0)
        std::memcpy(block.get(), m_data.get(), m_size);

    // never leave the previous block around with our content in it
    wipe();

    m_data     = std::move(block);
    m_capacity = NEWCAP;
}

size_t CTextBuffer::cursorByte() const {
    return Text::byteOffset(content(), m_cursor);
}

void CTextBuffer::insert(char32_t c) {
    const auto ENCODED = Text::encode(c);
    if (ENCODED.empty())
        return;

    reserve(m_size + ENCODED.size());

    const auto POS = cursorByte();
    std::memmove(m_data.get() + POS + ENCODED.size(), m_data.get() + POS, m_size - POS);
    std::memcpy(m_data.get() + POS, ENCODED.data(), ENCODED.size());

    m_size += ENCODED.size();
    m_length++;
    m_cursor++;
}

bool CTextBuffer::deleteBack() {
    if (m_cursor == 0)
        return false;

    m_cursor--;
    return deleteForward();
}

bool CTextBuffer::deleteForward() {
    if (m_cursor >= m_length)
        return false;

    const auto POS = cursorByte();
    const auto LEN = std::min(Text::sequenceLength(sc<unsigned char>(m_data[POS])), m_size - POS);

    std::memmove(m_data.get() + POS, m_data.get() + POS + LEN, m_size - POS - LEN);
    m_size -= LEN;
    m_length--;

    // the tail moved left, scrub what it left behind
    OPENSSL_cleanse(m_data.get() + m_size, LEN);
    return true;
}

void CTextBuffer::deleteWordBack() {
    auto charBefore = [this]() -> char {
        const auto POS = Text::byteOffset(content(), m_cursor - 1);
        return m_data[POS];
    };

    // whitespace right before the cursor goes first, unless it's the very first character
    while (m_cursor > 1 && (charBefore() == ' ' || charBefore() == '\t')) {
        deleteBack();
    }

    while (m_cursor > 0 && charBefore() != ' ' && charBefore() != '\t') {
        deleteBack();
    }
}

void CTextBuffer::moveLeft() {
    if (m_cursor > 0)
        m_cursor--;
}

void CTextBuffer::moveRight() {
    if (m_cursor < m_length)
        m_cursor++;
}

void CTextBuffer::moveStart() {
    m_cursor = 0;
}

void CTextBuffer::moveEnd() {
    m_cursor = m_length;
}

void CTextBuffer::clear() {
    release();
}

void CTextBuffer::set(std::string_view text) {
    release();

    if (text.empty())
        return;

    reserve(text.size());
    std::memcpy(m_data.get(), text.data(), text.size());
    m_size   = text.size();
    m_length = Text::codepointCount(text);
    m_cursor = m_length;
}

std::string_view CTextBuffer::content() const {
    if (!m_data)
        return {};
    return {m_data.get(), m_size};
}

size_t CTextBuffer::cursor() const {
    return m_cursor;
}

size_t CTextBuffer::len() const {
    return m_length;
}

bool CTextBuffer::empty() const {
    return m_length == 0;
}

bool CTextBuffer::masked() const {
    return m_masked;
}

std::string CTextBuffer::display(char32_t maskChar) const {
    if (!m_masked)
        return std::string{content()};

    const auto  MASK = Text::encode(maskChar);
    std::string out;
    out.reserve(MASK.size() * m_length);
    for (size_t i = 0; i < m_length; ++i) {
        out += MASK;
    }
    return out;
}

std::span<const char> CTextBuffer::storage() const {
    return {m_data.get(), m_capacity};
}
