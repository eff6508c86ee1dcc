// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verifier/webhook_middleware.h>

#include <httpclient.h>
#include <util.h>

namespace scverify {

WebhookMiddleware::WebhookMiddleware(const std::string& url, std::shared_ptr<HTTPClient> http)
    : url_(url), http_(std::move(http))
{
}

void WebhookMiddleware::OnSuccess(const VerificationSuccess& success)
{
    HTTPClientRequest request("POST", url_);
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = success.ToJSON().write();

    HTTPClientResponse response = http_->Perform(request);
    if (!response.IsSuccess()) {
        throw std::runtime_error(strprintf("webhook %s answered HTTP %d", url_, response.status));
    }
    LogPrint(BCLog::VERIFY, "Forwarded %s:%s to %s\n", success.file_path, success.contract_name, url_);
}

} // namespace scverify
