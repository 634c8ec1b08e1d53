#include "authenticator.hpp"

#include <crypt.h>
#include <pwd.h>
#include <shadow.h>
#include <string.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include "credential_buffer.hpp"
#include "settings.hpp"

namespace umbra {

namespace {

bool usableHash(const std::string &hash) {
    // Empty means no password; '!' and '*' mark locked or disabled accounts.
    return !hash.empty() && hash[0] != '!' && hash[0] != '*';
}

bool constantTimeEquals(const char *lhs, const std::string &rhs) {
    const size_t lhsLen = std::strlen(lhs);
    unsigned char diff = lhsLen == rhs.size() ? 0 : 1;
    const size_t len = std::min(lhsLen, rhs.size());
    for (size_t i = 0; i < len; ++i) {
        diff |= static_cast<unsigned char>(lhs[i] ^ rhs[i]);
    }
    return diff == 0;
}

}  // namespace

std::unique_ptr<Authenticator> requireReady(std::unique_ptr<Authenticator> auth) {
    if (!auth || !auth->ready()) {
        std::cerr << "umbra: authentication backend unavailable" << std::endl;
        return nullptr;
    }
    return auth;
}

ShadowAuthenticator::ShadowAuthenticator(HashLookup lookup) : lookup(std::move(lookup)) {}

ShadowAuthenticator::~ShadowAuthenticator() {
    if (hash) {
        secureErase(*hash);
    }
}

bool ShadowAuthenticator::prime() {
    if (!attempted) {
        attempted = true;
        if (lookup) {
            hash = lookup();
        }
        if (hash && !usableHash(*hash)) {
            secureErase(*hash);
            hash.reset();
        }
    }
    return hash.has_value();
}

AuthVerdict ShadowAuthenticator::verify(const std::string &text) {
    if (!prime()) {
        return AuthVerdict::Incorrect;
    }
    std::string candidate = trimWhitespace(text);
    auto data = std::make_unique<crypt_data>();
    const char *computed = crypt_r(candidate.c_str(), hash->c_str(), data.get());
    secureErase(candidate);

    AuthVerdict verdict = AuthVerdict::Incorrect;
    // libxcrypt signals failure with a string starting with '*'.
    if (computed && computed[0] != '*' && constantTimeEquals(computed, *hash)) {
        verdict = AuthVerdict::Correct;
    }
    explicit_bzero(data.get(), sizeof(crypt_data));
    return verdict;
}

HashLookup shadowHashLookup(const std::string &account) {
    return [account]() -> std::optional<std::string> {
        if (const spwd *entry = getspnam(account.c_str())) {
            if (entry->sp_pwdp) {
                return std::string(entry->sp_pwdp);
            }
        }
        if (const passwd *pw = getpwnam(account.c_str())) {
            // "x" means the real hash lives in the shadow database we could not read.
            if (pw->pw_passwd && std::strcmp(pw->pw_passwd, "x") != 0) {
                return std::string(pw->pw_passwd);
            }
        }
        return std::nullopt;
    };
}

std::optional<std::string> resolveAccountName() {
    if (const char *user = std::getenv("USER")) {
        if (*user) {
            return std::string(user);
        }
    }

    uid_t uid = getuid();
    passwd *pw = getpwuid(uid);
    if (!pw && uid == 0) {
        if (auto sudoUid = parseUnsigned(std::getenv("SUDO_UID"))) {
            pw = getpwuid(static_cast<uid_t>(*sudoUid));
        }
        const char *sudoUser = std::getenv("SUDO_USER");
        if (!pw && sudoUser && *sudoUser) {
            pw = getpwnam(sudoUser);
        }
    }
    if (!pw || !pw->pw_name) {
        return std::nullopt;
    }
    return std::string(pw->pw_name);
}

std::string trimWhitespace(const std::string &input) {
    static const char kBlank[] = " \t\n\v\f\r";
    const size_t first = input.find_first_not_of(kBlank);
    if (first == std::string::npos) {
        return std::string();
    }
    return input.substr(first, input.find_last_not_of(kBlank) - first + 1);
}

}  // namespace umbra
