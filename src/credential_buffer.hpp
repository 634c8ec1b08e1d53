#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"

namespace umbra {

// In-progress credential. Holds code points; overflowing the capacity
// resets the buffer instead of truncating it.
class CredentialBuffer {
public:
    explicit CredentialBuffer(std::size_t capacity = kMaxCredentialLength);
    ~CredentialBuffer();

    CredentialBuffer(const CredentialBuffer &) = delete;
    CredentialBuffer &operator=(const CredentialBuffer &) = delete;

    void push(char32_t ch);
    void pop();
    void clear();

    // UTF-8 text of the buffer, or nullopt if a stored code point cannot be encoded.
    std::optional<std::string> materialize() const;

    bool empty() const { return chars.empty(); }
    std::size_t size() const { return chars.size(); }
    std::size_t capacity() const { return cap; }

private:
    void wipe();

    std::vector<char32_t> chars;
    std::size_t cap;
};

// Overwrites a string's storage before releasing it.
void secureErase(std::string &text);

}  // namespace umbra
