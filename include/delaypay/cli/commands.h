// DELAYPAY - CLI Commands
// Copyright (c) 2024 DELAYPAY Developers
// MIT License
//
// Command dispatch behind delaypay-cli. Each command opens what it needs
// from the settings, runs once and reports through its exit code:
//
//     0  success
//     1  a claim error (any ClaimError, including storage failures)
//     2  usage or configuration error

#ifndef DELAYPAY_CLI_COMMANDS_H
#define DELAYPAY_CLI_COMMANDS_H

#include "delaypay/util/config.h"

#include <string>
#include <vector>

namespace delaypay {
namespace cli {

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "DELAYPAY CLI";

constexpr int EXIT_OK = 0;
constexpr int EXIT_CLAIM_ERROR = 1;
constexpr int EXIT_USAGE = 2;

void PrintHelp();

/**
 * Run one command against the configured ledger.
 * @param args Positional arguments; args[0] is the command name
 */
int RunCommand(const util::Settings& settings, const std::vector<std::string>& args);

/**
 * Parse argv (and the config file it names) into config, set up logging
 * and run the requested command.
 */
int AppMain(util::ConfigManager& config, int argc, const char* const argv[]);

} // namespace cli
} // namespace delaypay

#endif // DELAYPAY_CLI_COMMANDS_H
