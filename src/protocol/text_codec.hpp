#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace pikelink::protocol::text {

// Control codes understood by the engine's text processor
namespace special {
    constexpr uint8_t TEXT_START = 0x00;   // Start a text section
    constexpr uint8_t SPACE = 0x7F;
    constexpr uint8_t LINE_DOWN = 0x4E;    // Move down a line
    constexpr uint8_t BOTTOM_LINE = 0x4F;  // Start writing to the bottom line
    constexpr uint8_t TERMINATOR = 0x50;   // Terminates the string
    constexpr uint8_t PARAGRAPH = 0x51;
    constexpr uint8_t SCROLL_LINE = 0x55;
    constexpr uint8_t END_MSG = 0x57;      // End the message box
    constexpr uint8_t END_PROMPT = 0x58;   // Prompt player to end text box
}

constexpr uint8_t QUESTION_MARK = 0xE6;

uint8_t encode_char(char c);

// Length in bytes of the UTF-8 sequence starting at text[pos]. Stray
// continuation bytes and truncated sequences count as one character.
size_t sequence_length(std::string_view text, size_t pos);

// Lazy, restartable view yielding one engine byte per UTF-8 code point.
// Anything outside ASCII becomes QUESTION_MARK.
// The caller keeps the underlying characters alive while iterating.
class EncodeView : public std::ranges::view_interface<EncodeView> {
public:
    class iterator {
    public:
        using iterator_concept = std::forward_iterator_tag;
        using iterator_category = std::input_iterator_tag;
        using value_type = uint8_t;
        using difference_type = std::ptrdiff_t;

        iterator() = default;
        iterator(std::string_view text, size_t pos) : text_(text), pos_(pos) {}

        uint8_t operator*() const {
            if (sequence_length(text_, pos_) > 1) return QUESTION_MARK;
            return encode_char(text_[pos_]);
        }

        iterator& operator++() {
            pos_ += sequence_length(text_, pos_);
            return *this;
        }

        iterator operator++(int) {
            iterator prev = *this;
            ++*this;
            return prev;
        }

        bool operator==(const iterator& other) const { return pos_ == other.pos_; }

    private:
        std::string_view text_;
        size_t pos_ = 0;
    };

    EncodeView() = default;
    explicit EncodeView(std::string_view text) : text_(text) {}

    iterator begin() const { return iterator(text_, 0); }
    iterator end() const { return iterator(text_, text_.size()); }

private:
    std::string_view text_;
};

inline EncodeView encode(std::string_view text) {
    return EncodeView(text);
}

std::vector<uint8_t> encode_to_vector(std::string_view text);

// TEXT_START, encoded text, END_MSG, TERMINATOR
std::vector<uint8_t> message_box(std::string_view text);

// Display-only inverse mapping. Stops at TERMINATOR; unmapped bytes become '?'.
std::string decode(const std::vector<uint8_t>& bytes);

} // namespace pikelink::protocol::text
