// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_HTTPSERVER_VERIFICATION_HANDLERS_H
#define SCVERIFY_HTTPSERVER_VERIFICATION_HANDLERS_H

/**
 * @file verification_handlers.h
 * @brief REST endpoints of the verifier
 *
 * - GET  /health
 * - GET  /api/v1/<language>/versions
 * - POST /api/v1/<language>/verify/multiple-files
 * - POST /api/v1/solidity/verify/standard-json
 */

#include <verifier/client.h>

#include <memory>
#include <string>

#include <univalue.h>

class CThreadInterrupt;
class HTTPRequest;

namespace scverify {

/**
 * @brief Build a request from a multiple-files body
 *
 * Fields: deployedBytecode, creationBytecode (optional), compilerVersion,
 * sources (path to content), evmVersion (optional), chainId (optional).
 * @throws VerificationError(INVALID_REQUEST)
 */
VerificationRequest ParseMultiFileRequest(const UniValue& body);

/**
 * @brief Build a request from a standard-json body
 *
 * Same bytecode and version fields as multiple-files, plus "input" holding
 * the compiler input document as a string.
 * @throws VerificationError(INVALID_REQUEST)
 */
VerificationRequest ParseStandardJsonRequest(const UniValue& body);

/** Response envelope for a success */
UniValue SuccessResponse(const VerificationSuccess& success);

/** Response envelope for a verification failure */
UniValue FailureResponse(const VerificationError& error);

/**
 * @brief Register handlers for a language client
 * @param interrupt cancels running compilations on shutdown
 */
void RegisterVerificationHandlers(std::shared_ptr<Client> client, const CThreadInterrupt* interrupt);

/** @brief Register GET /health */
void RegisterHealthHandler();

/** @brief Remove every handler registered by this module */
void UnregisterVerificationHandlers();

} // namespace scverify

#endif // SCVERIFY_HTTPSERVER_VERIFICATION_HANDLERS_H
