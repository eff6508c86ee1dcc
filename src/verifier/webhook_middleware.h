// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_VERIFIER_WEBHOOK_MIDDLEWARE_H
#define SCVERIFY_VERIFIER_WEBHOOK_MIDDLEWARE_H

/**
 * @file webhook_middleware.h
 * @brief Notification of successful verifications
 */

#include <verifier/client.h>

#include <memory>
#include <string>

class HTTPClient;

namespace scverify {

/** Posts every verification success as JSON to a URL */
class WebhookMiddleware : public Middleware
{
public:
    WebhookMiddleware(const std::string& url, std::shared_ptr<HTTPClient> http);

    void OnSuccess(const VerificationSuccess& success) override;

private:
    const std::string url_;
    std::shared_ptr<HTTPClient> http_;
};

} // namespace scverify

#endif // SCVERIFY_VERIFIER_WEBHOOK_MIDDLEWARE_H
