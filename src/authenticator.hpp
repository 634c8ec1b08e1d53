#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace umbra {

// Deliberately two-valued: callers never learn why an attempt failed.
enum class AuthVerdict {
    Correct,
    Incorrect,
};

class Authenticator {
public:
    virtual ~Authenticator() = default;
    virtual AuthVerdict verify(const std::string &text) = 0;
    // Checked once before locking. False means no attempt could ever succeed.
    virtual bool ready() { return true; }
};

// Passes auth through when it is ready, otherwise logs and returns null.
std::unique_ptr<Authenticator> requireReady(std::unique_ptr<Authenticator> auth);

// Returns the stored crypt(3) hash of the locking account.
using HashLookup = std::function<std::optional<std::string>()>;

// Verifies against a locally stored password hash. The hash is fetched
// through the injected lookup at most once and kept until destruction.
class ShadowAuthenticator : public Authenticator {
public:
    explicit ShadowAuthenticator(HashLookup lookup);
    ~ShadowAuthenticator() override;

    ShadowAuthenticator(const ShadowAuthenticator &) = delete;
    ShadowAuthenticator &operator=(const ShadowAuthenticator &) = delete;

    // Performs the lookup now. False means no usable hash is available,
    // which callers treat as a setup failure.
    bool prime();

    bool ready() override { return prime(); }
    AuthVerdict verify(const std::string &text) override;

private:
    HashLookup lookup;
    std::optional<std::string> hash;
    bool attempted{false};
};

// Shadow database lookup for account, falling back to a hash stored
// directly in the passwd entry.
HashLookup shadowHashLookup(const std::string &account);

// Account to authenticate: $USER, else the passwd entry of the real uid
// (or of the sudo caller when running as root).
std::optional<std::string> resolveAccountName();

// Drops leading and trailing ASCII whitespace.
std::string trimWhitespace(const std::string &input);

}  // namespace umbra
