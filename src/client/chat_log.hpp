#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace pikelink::client {

struct ChatLine {
    std::vector<uint8_t> sender;   // Engine-encoded
    std::vector<uint8_t> message;  // Engine-encoded

    bool operator==(const ChatLine&) const = default;
};

// One frame of chat box editing
struct ChatEdit {
    std::string_view typed;  // UTF-8
    int backspaces = 0;
    bool submitted = false;
    bool cancelled = false;  // Escape discards the draft
};

// Chat transcript plus the line currently being typed
class ChatLog {
public:
    explicit ChatLog(size_t max_lines = 64) : max_lines_(max_lines) {}

    void push(ChatLine line);
    const std::deque<ChatLine>& lines() const { return lines_; }

    // Input line editing. remove_char drops a whole UTF-8 character.
    void remove_char();
    void clear_input() { input_.clear(); }
    const std::string& input() const { return input_; }

    // Returns the typed line and clears the input
    std::string take_input();

    // Applies typing, then backspaces, then submit or cancel.
    // Returns the submitted line, empty when nothing was submitted.
    std::string apply(const ChatEdit& edit);

private:
    size_t max_lines_;
    std::deque<ChatLine> lines_;
    std::string input_;
};

} // namespace pikelink::client
