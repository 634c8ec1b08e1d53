#include "credential_buffer.hpp"

#include <string.h>

namespace umbra {

namespace {

bool appendUtf8(std::string &out, char32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return false;
    }
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return true;
}

}  // namespace

CredentialBuffer::CredentialBuffer(std::size_t capacity) : cap(capacity == 0 ? 1 : capacity) {
    chars.reserve(cap);
}

CredentialBuffer::~CredentialBuffer() {
    wipe();
}

void CredentialBuffer::push(char32_t ch) {
    if (chars.size() >= cap) {
        clear();
    }
    chars.push_back(ch);
}

void CredentialBuffer::pop() {
    if (chars.empty()) {
        return;
    }
    chars.back() = 0;
    chars.pop_back();
}

void CredentialBuffer::clear() {
    wipe();
    chars.clear();
}

std::optional<std::string> CredentialBuffer::materialize() const {
    std::string text;
    text.reserve(chars.size() * 4);
    for (char32_t cp : chars) {
        if (!appendUtf8(text, cp)) {
            secureErase(text);
            return std::nullopt;
        }
    }
    return text;
}

void CredentialBuffer::wipe() {
    if (!chars.empty()) {
        explicit_bzero(chars.data(), chars.size() * sizeof(char32_t));
    }
}

void secureErase(std::string &text) {
    if (!text.empty()) {
        explicit_bzero(&text[0], text.size());
    }
    text.clear();
}

}  // namespace umbra
