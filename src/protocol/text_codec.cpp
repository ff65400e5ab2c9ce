#include "text_codec.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <string>
#include <vector>

namespace pikelink::protocol::text {

uint8_t encode_char(char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<uint8_t>(0x80 + (c - 'A'));
    if (c >= 'a' && c <= 'z') return static_cast<uint8_t>(0xA0 + (c - 'a'));
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(0xF6 + (c - '0'));

    switch (c) {
        case '(':  return 0x9A;
        case ')':  return 0x9B;
        case ':':  return 0x9C;
        case ';':  return 0x9D;
        case '[':  return 0x9E;
        case ']':  return 0x9F;
        case '\'': return 0xE0;
        case '-':  return 0xE3;
        case '?':  return 0xE6;
        case '!':  return 0xE7;
        case '.':  return 0xE8;
        case '/':  return 0xF3;
        case ',':  return 0xF4;
        case ' ':  return special::SPACE;
        case '\n': return special::LINE_DOWN;
        default:   return QUESTION_MARK;
    }
}

size_t sequence_length(std::string_view text, size_t pos) {
    auto lead = static_cast<uint8_t>(text[pos]);
    size_t length = 1;
    if ((lead & 0xE0) == 0xC0) length = 2;
    else if ((lead & 0xF0) == 0xE0) length = 3;
    else if ((lead & 0xF8) == 0xF0) length = 4;

    // Stop early at the end of the text or at a byte that cannot continue the sequence
    size_t n = 1;
    while (n < length && pos + n < text.size() && (static_cast<uint8_t>(text[pos + n]) & 0xC0) == 0x80) {
        ++n;
    }
    return n;
}

std::vector<uint8_t> encode_to_vector(std::string_view text) {
    std::vector<uint8_t> out;
    out.reserve(text.size());
    for (uint8_t b : encode(text)) {
        out.push_back(b);
    }
    return out;
}

std::vector<uint8_t> message_box(std::string_view text) {
    std::vector<uint8_t> out;
    out.reserve(text.size() + 3);
    out.push_back(special::TEXT_START);
    for (uint8_t b : encode(text)) {
        out.push_back(b);
    }
    out.push_back(special::END_MSG);
    out.push_back(special::TERMINATOR);
    return out;
}

namespace {

char decode_byte(uint8_t b) {
    if (b >= 0x80 && b <= 0x99) return static_cast<char>('A' + (b - 0x80));
    if (b >= 0xA0 && b <= 0xB9) return static_cast<char>('a' + (b - 0xA0));
    if (b >= 0xF6) return static_cast<char>('0' + (b - 0xF6));

    switch (b) {
        case 0x9A: return '(';
        case 0x9B: return ')';
        case 0x9C: return ':';
        case 0x9D: return ';';
        case 0x9E: return '[';
        case 0x9F: return ']';
        case 0xE0: return '\'';
        case 0xE3: return '-';
        case 0xE7: return '!';
        case 0xE8: return '.';
        case 0xF3: return '/';
        case 0xF4: return ',';
        case special::SPACE: return ' ';
        case special::LINE_DOWN: return '\n';
        default: return '?';
    }
}

} // namespace

std::string decode(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t b : bytes) {
        if (b == special::TERMINATOR) break;
        out.push_back(decode_byte(b));
    }
    return out;
}

} // namespace pikelink::protocol::text
