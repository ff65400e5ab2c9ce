#include "chat_log.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace pikelink::client {

void ChatLog::push(ChatLine line) {
    lines_.push_back(std::move(line));
    while (lines_.size() > max_lines_) {
        lines_.pop_front();
    }
}

void ChatLog::remove_char() {
    while (!input_.empty() && (static_cast<uint8_t>(input_.back()) & 0xC0) == 0x80) {
        input_.pop_back();
    }
    if (!input_.empty()) {
        input_.pop_back();
    }
}

std::string ChatLog::take_input() {
    std::string line;
    std::swap(line, input_);
    return line;
}

std::string ChatLog::apply(const ChatEdit& edit) {
    input_.append(edit.typed);
    for (int i = 0; i < edit.backspaces; ++i) {
        remove_char();
    }
    if (edit.submitted) {
        return take_input();
    }
    if (edit.cancelled) {
        clear_input();
    }
    return {};
}

} // namespace pikelink::client
