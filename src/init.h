// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SCVERIFY_INIT_H
#define SCVERIFY_INIT_H

#include <string>

void StartShutdown();
bool ShutdownRequested();
/** Interrupt threads */
void Interrupt();
void Shutdown();
//!Initialize the logging infrastructure
void InitLogging();
/**
 * Initialize basic process settings (signal handlers).
 * @note This can be done before daemonization.
 * @return true on success, false on failure
 */
bool AppInitBasicSetup();
/**
 * Read and validate the configuration.
 * @pre Parameters should be parsed and config file should be read.
 * @return false if a setting is invalid (the error is logged)
 */
bool AppInitParameterInteraction();
/**
 * Start compiler managers, verification clients and the HTTP server.
 * @pre AppInitParameterInteraction should have been called.
 */
bool AppInitMain();

/** Help for options shared between UI and daemon */
std::string HelpMessage();
/** Returns licensing information (for -version) */
std::string LicenseInfo();

#endif // SCVERIFY_INIT_H
