// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <httpserver/verification_handlers.h>

#include <compiler/manager.h>
#include <httpserver.h>
#include <threadinterrupt.h>
#include <util.h>
#include <utilstrencodings.h>

#include <vector>

namespace scverify {

static std::vector<std::pair<std::string, bool>> g_registered;

static std::string RequiredString(const UniValue& body, const std::string& key)
{
    const UniValue& value = find_value(body, key);
    if (!value.isStr() || value.get_str().empty()) {
        throw VerificationError(ErrorKind::INVALID_REQUEST, strprintf("%s is required", key));
    }
    return value.get_str();
}

static std::optional<std::string> OptionalString(const UniValue& body, const std::string& key)
{
    const UniValue& value = find_value(body, key);
    if (value.isNull()) {
        return std::nullopt;
    }
    if (value.isNum()) {
        return value.getValStr();
    }
    if (!value.isStr()) {
        throw VerificationError(ErrorKind::INVALID_REQUEST, strprintf("%s must be a string", key));
    }
    if (value.get_str().empty()) {
        return std::nullopt;
    }
    return value.get_str();
}

static Bytecode ParseBytecode(const std::string& hex, const std::string& key)
{
    Bytecode code;
    if (!DecodeHexBytes(hex, code)) {
        throw VerificationError(ErrorKind::INVALID_REQUEST, strprintf("%s is not valid hex", key));
    }
    return code;
}

static void ParseCommonFields(const UniValue& body, VerificationRequest& request)
{
    if (!body.isObject()) {
        throw VerificationError(ErrorKind::INVALID_REQUEST, "request body must be a JSON object");
    }
    request.deployed_bytecode = ParseBytecode(RequiredString(body, "deployedBytecode"), "deployedBytecode");
    std::optional<std::string> creation = OptionalString(body, "creationBytecode");
    if (creation) {
        request.creation_bytecode = ParseBytecode(*creation, "creationBytecode");
    }
    request.compiler_version = RequiredString(body, "compilerVersion");
    request.chain_id = OptionalString(body, "chainId");
}

VerificationRequest ParseMultiFileRequest(const UniValue& body)
{
    VerificationRequest request;
    ParseCommonFields(body, request);

    const UniValue& sources = find_value(body, "sources");
    if (!sources.isObject() || sources.empty()) {
        throw VerificationError(ErrorKind::INVALID_REQUEST, "sources must be a non-empty object");
    }
    MultiFileContent content;
    const std::vector<std::string>& paths = sources.getKeys();
    for (size_t i = 0; i < paths.size(); ++i) {
        const UniValue& text = sources.getValues()[i];
        if (!text.isStr()) {
            throw VerificationError(ErrorKind::INVALID_REQUEST, strprintf("source %s must be a string", paths[i]));
        }
        content.sources[paths[i]] = text.get_str();
    }
    content.evm_version = OptionalString(body, "evmVersion");
    if (content.evm_version && *content.evm_version == "default") {
        content.evm_version = std::nullopt;
    }
    request.content = content;
    return request;
}

VerificationRequest ParseStandardJsonRequest(const UniValue& body)
{
    VerificationRequest request;
    ParseCommonFields(body, request);
    request.content = StandardJsonContent{RequiredString(body, "input")};
    return request;
}

UniValue SuccessResponse(const VerificationSuccess& success)
{
    UniValue response(UniValue::VOBJ);
    response.pushKV("status", "0");
    response.pushKV("message", "OK");
    response.pushKV("result", success.ToJSON());
    return response;
}

UniValue FailureResponse(const VerificationError& error)
{
    UniValue response(UniValue::VOBJ);
    response.pushKV("status", "1");
    response.pushKV("message", error.what());
    response.pushKV("kind", ErrorKindToString(error.Kind()));
    return response;
}

static bool WriteJSON(HTTPRequest* req, int nStatus, const UniValue& value)
{
    req->WriteHeader("Content-Type", "application/json");
    req->WriteReply(nStatus, value.write() + "\n");
    return true;
}

static bool WriteError(HTTPRequest* req, int nStatus, const std::string& message)
{
    UniValue response(UniValue::VOBJ);
    response.pushKV("status", "1");
    response.pushKV("message", message);
    return WriteJSON(req, nStatus, response);
}

typedef VerificationRequest (*RequestParser)(const UniValue& body);

static bool VerifyHandler(HTTPRequest* req, const std::shared_ptr<Client>& client, RequestParser parse,
                          const CThreadInterrupt* interrupt)
{
    if (req->GetRequestMethod() != HTTPRequest::POST) {
        return WriteError(req, HTTP_BAD_METHOD, "Only POST requests allowed");
    }
    UniValue body;
    if (!body.read(req->ReadBody())) {
        return WriteError(req, HTTP_BAD_REQUEST, "request body is not valid JSON");
    }

    try {
        VerificationRequest request = parse(body);
        VerificationSuccess success = client->Verify(request, interrupt);
        return WriteJSON(req, HTTP_OK, SuccessResponse(success));
    } catch (const VerificationError& e) {
        LogPrint(BCLog::VERIFY, "Verification failed (%s): %s\n", ErrorKindToString(e.Kind()), e.what());
        int nStatus = e.Kind() == ErrorKind::INVALID_REQUEST ? HTTP_BAD_REQUEST : HTTP_OK;
        return WriteJSON(req, nStatus, FailureResponse(e));
    } catch (const MiddlewareError& e) {
        return WriteError(req, HTTP_INTERNAL_SERVER_ERROR, e.what());
    } catch (const std::exception& e) {
        LogPrintf("%s: unexpected error: %s\n", __func__, e.what());
        return WriteError(req, HTTP_INTERNAL_SERVER_ERROR, e.what());
    }
}

static bool VersionsHandler(HTTPRequest* req, const std::shared_ptr<Client>& client)
{
    if (req->GetRequestMethod() != HTTPRequest::GET) {
        return WriteError(req, HTTP_BAD_METHOD, "Only GET requests allowed");
    }
    UniValue versions(UniValue::VARR);
    for (const CompilerVersion& version : client->Compilers().AllVersions()) {
        versions.push_back(version.ToString());
    }
    UniValue response(UniValue::VOBJ);
    response.pushKV("versions", versions);
    return WriteJSON(req, HTTP_OK, response);
}

static bool HealthHandler(HTTPRequest* req, const std::string&)
{
    if (req->GetRequestMethod() != HTTPRequest::GET) {
        return WriteError(req, HTTP_BAD_METHOD, "Only GET requests allowed");
    }
    UniValue response(UniValue::VOBJ);
    response.pushKV("status", "SERVING");
    return WriteJSON(req, HTTP_OK, response);
}

static void Register(const std::string& path, const HTTPRequestHandler& handler)
{
    RegisterHTTPHandler(path, true, handler);
    g_registered.emplace_back(path, true);
}

void RegisterHealthHandler()
{
    Register("/health", HealthHandler);
}

void RegisterVerificationHandlers(std::shared_ptr<Client> client, const CThreadInterrupt* interrupt)
{
    const std::string base = "/api/v1/" + LanguageName(client->GetLanguage());

    Register(base + "/versions", [client](HTTPRequest* req, const std::string&) {
        return VersionsHandler(req, client);
    });
    Register(base + "/verify/multiple-files", [client, interrupt](HTTPRequest* req, const std::string&) {
        return VerifyHandler(req, client, ParseMultiFileRequest, interrupt);
    });
    if (client->GetLanguage() == Language::SOLIDITY) {
        Register(base + "/verify/standard-json", [client, interrupt](HTTPRequest* req, const std::string&) {
            return VerifyHandler(req, client, ParseStandardJsonRequest, interrupt);
        });
    }
    LogPrintf("%s verification available at %s\n", LanguageToString(client->GetLanguage()), base);
}

void UnregisterVerificationHandlers()
{
    for (const auto& handler : g_registered) {
        UnregisterHTTPHandler(handler.first, handler.second);
    }
    g_registered.clear();
}

} // namespace scverify
