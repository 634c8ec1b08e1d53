#include "authenticator.hpp"

#include <crypt.h>
#include <stdlib.h>

#include <cassert>
#include <memory>
#include <optional>
#include <string>

using umbra::AuthVerdict;
using umbra::ShadowAuthenticator;

static std::string hashFor(const std::string &secret) {
    auto data = std::make_unique<crypt_data>();
    const char *hash = crypt_r(secret.c_str(), "$6$umbratestsalt$", data.get());
    assert(hash && hash[0] != '*');
    return hash;
}

static void testCorrectAndIncorrect() {
    const std::string stored = hashFor("correct horse");
    int lookups = 0;
    ShadowAuthenticator auth([&]() -> std::optional<std::string> {
        ++lookups;
        return stored;
    });
    assert(auth.prime());
    assert(auth.verify("correct horse") == AuthVerdict::Correct);
    assert(auth.verify("correct horse") == AuthVerdict::Correct);
    assert(auth.verify("hi") == AuthVerdict::Incorrect);
    assert(auth.verify("hi") == AuthVerdict::Incorrect);
    assert(auth.verify("") == AuthVerdict::Incorrect);
    // Repeated failures do not lock the account out.
    assert(auth.verify("correct horse") == AuthVerdict::Correct);
    assert(lookups == 1);
}

static void testLookupIsLazy() {
    const std::string stored = hashFor("pw");
    int lookups = 0;
    ShadowAuthenticator auth([&]() -> std::optional<std::string> {
        ++lookups;
        return stored;
    });
    assert(lookups == 0);
    assert(auth.verify("pw") == AuthVerdict::Correct);
    assert(auth.verify("nope") == AuthVerdict::Incorrect);
    assert(auth.prime());
    assert(lookups == 1);
}

static void testSurroundingWhitespaceIsTrimmed() {
    ShadowAuthenticator auth([stored = hashFor("secret")]() -> std::optional<std::string> { return stored; });
    assert(auth.verify("  secret\n") == AuthVerdict::Correct);
    assert(auth.verify("sec ret") == AuthVerdict::Incorrect);
}

static void testMissingHash() {
    int lookups = 0;
    ShadowAuthenticator auth([&]() -> std::optional<std::string> {
        ++lookups;
        return std::nullopt;
    });
    assert(!auth.prime());
    assert(!auth.prime());
    assert(auth.verify("anything") == AuthVerdict::Incorrect);
    assert(lookups == 1);
}

static void testLockedAccountHashIsRejected() {
    for (const char *stored : {"!", "*", "", "!$6$abc$def"}) {
        ShadowAuthenticator auth([stored]() -> std::optional<std::string> { return std::string(stored); });
        assert(!auth.prime());
        assert(auth.verify("") == AuthVerdict::Incorrect);
        assert(auth.verify("!") == AuthVerdict::Incorrect);
    }
}

static void testTrimWhitespace() {
    assert(umbra::trimWhitespace("  a b \t\n") == "a b");
    assert(umbra::trimWhitespace("   ") == "");
    assert(umbra::trimWhitespace("") == "");
    assert(umbra::trimWhitespace("x") == "x");
    assert(umbra::trimWhitespace("\v\fkey\r") == "key");
}

namespace {

struct UnavailableBackend : umbra::Authenticator {
    AuthVerdict verify(const std::string &) override { return AuthVerdict::Incorrect; }
    bool ready() override { return false; }
};

}  // namespace

static void testUnavailableBackendRefusesToLock() {
    assert(!umbra::requireReady(std::make_unique<UnavailableBackend>()));
    assert(!umbra::requireReady(nullptr));

    // A shadow backend with no usable hash is not ready either.
    assert(!umbra::requireReady(std::make_unique<ShadowAuthenticator>([]() -> std::optional<std::string> {
        return std::string("!locked");
    })));

    const std::string stored = hashFor("pw");
    auto ready = umbra::requireReady(std::make_unique<ShadowAuthenticator>([&]() -> std::optional<std::string> {
        return stored;
    }));
    assert(ready);
    assert(ready->verify("pw") == AuthVerdict::Correct);
}

static void testAccountFromEnvironment() {
    setenv("USER", "umbra-test-user", 1);
    auto account = umbra::resolveAccountName();
    assert(account && *account == "umbra-test-user");
}

int main() {
    testCorrectAndIncorrect();
    testLookupIsLazy();
    testSurroundingWhitespaceIsTrimmed();
    testMissingHash();
    testLockedAccountHashIsRejected();
    testTrimWhitespace();
    testAccountFromEnvironment();
    testUnavailableBackendRefusesToLock();
    return 0;
}
