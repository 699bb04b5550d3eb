#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

// Cursor-addressable utf-8 text with optional secret semantics.
// The cursor counts unicode scalar values and is always within [0, len()].
// Old contents are wiped on clear(), set() and on every reallocation; masked buffers
// are also wiped on destruction.
class CTextBuffer {
  public:
    CTextBuffer() = default;
    ~CTextBuffer();

    CTextBuffer(const CTextBuffer&)            = delete;
    CTextBuffer& operator=(const CTextBuffer&) = delete;
    CTextBuffer(CTextBuffer&& other) noexcept;
    CTextBuffer& operator=(CTextBuffer&& other) noexcept;

    static CTextBuffer makeMasked();

    void               insert(char32_t c);
    bool               deleteBack();
    bool               deleteForward();
    void               deleteWordBack();

    void               moveLeft();
    void               moveRight();
    void               moveStart();
    void               moveEnd();

    void               clear();
    void               set(std::string_view text);

    std::string_view   content() const;
    size_t             cursor() const;
    size_t             len() const;
    bool               empty() const;
    bool               masked() const;

    // the real content when unmasked, otherwise one mask char per character
    std::string        display(char32_t maskChar = U'*') const;

    // the whole backing allocation, including bytes past the content
    std::span<const char> storage() const;

  private:
    void                    reserve(size_t bytes);
    void                    wipe();
    void                    release();
    size_t                  cursorByte() const;

    std::unique_ptr<char[]> m_data;
    size_t                  m_capacity = 0;
    size_t                  m_size     = 0;
    size_t                  m_cursor   = 0;
    size_t                  m_length   = 0;
    bool                    m_masked   = false;
};
