#include "pam_authenticator.hpp"

#include <security/pam_appl.h>

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace umbra {

namespace {

struct PamData {
    const std::string *password;
};

void freeResponses(pam_response *responses, int count) {
    for (int i = 0; i < count; ++i) {
        if (responses[i].resp) {
            explicit_bzero(responses[i].resp, std::strlen(responses[i].resp));
            std::free(responses[i].resp);
        }
    }
    std::free(responses);
}

int pamConversation(int num_msg, const pam_message **msg, pam_response **resp, void *appdata_ptr) {
    if (!resp || !msg) {
        return PAM_CONV_ERR;
    }
    if (num_msg <= 0) {
        return PAM_CONV_ERR;
    }

    size_t responseCount = static_cast<size_t>(num_msg);
    pam_response *responses = static_cast<pam_response *>(std::calloc(responseCount, sizeof(pam_response)));
    if (!responses) {
        return PAM_BUF_ERR;
    }

    PamData *data = static_cast<PamData *>(appdata_ptr);
    for (int i = 0; i < num_msg; ++i) {
        switch (msg[i]->msg_style) {
            case PAM_PROMPT_ECHO_OFF:
            case PAM_PROMPT_ECHO_ON:
                responses[i].resp = strdup(data && data->password ? data->password->c_str() : "");
                if (!responses[i].resp) {
                    freeResponses(responses, num_msg);
                    return PAM_BUF_ERR;
                }
                break;
            case PAM_ERROR_MSG:
            case PAM_TEXT_INFO:
                responses[i].resp = nullptr;
                break;
            default:
                freeResponses(responses, num_msg);
                return PAM_CONV_ERR;
        }
    }

    *resp = responses;
    return PAM_SUCCESS;
}

}  // namespace

PamAuthenticator::PamAuthenticator(std::string account, std::string service)
    : account(std::move(account)), service(std::move(service)) {}

bool PamAuthenticator::ready() {
    pam_handle_t *pamh = nullptr;
    PamData data{nullptr};
    pam_conv conv{pamConversation, &data};

    int ret = pam_start(service.c_str(), account.c_str(), &conv, &pamh);
    if (ret != PAM_SUCCESS) {
        std::cerr << "umbra: pam_start failed for service " << service << ": " << pam_strerror(pamh, ret)
                  << std::endl;
        if (pamh) {
            pam_end(pamh, ret);
        }
        return false;
    }
    return pam_end(pamh, PAM_SUCCESS) == PAM_SUCCESS;
}

AuthVerdict PamAuthenticator::verify(const std::string &text) {
    pam_handle_t *pamh = nullptr;
    PamData data{&text};
    pam_conv conv{pamConversation, &data};

    int ret = pam_start(service.c_str(), account.c_str(), &conv, &pamh);
    if (ret != PAM_SUCCESS) {
        std::cerr << "umbra: warning: pam_start failed: " << pam_strerror(pamh, ret) << std::endl;
        return AuthVerdict::Incorrect;
    }

    ret = pam_authenticate(pamh, 0);
    if (ret == PAM_SUCCESS) {
        ret = pam_acct_mgmt(pamh, 0);
    }

    pam_end(pamh, ret);
    return ret == PAM_SUCCESS ? AuthVerdict::Correct : AuthVerdict::Incorrect;
}

}  // namespace umbra
