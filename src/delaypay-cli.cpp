// DELAYPAY CLI - Command Line Interface
// Copyright (c) 2024 DELAYPAY Developers
// MIT License
//
// delaypay-cli drives both sides of the payout flow from the shell: it
// builds batch commitments and operates the claim ledger stored in the
// data directory.

#include <delaypay/cli/commands.h>
#include <delaypay/util/config.h>
#include <delaypay/util/logging.h>

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    int rc;
    try {
        rc = delaypay::cli::AppMain(delaypay::util::GetConfig(), argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        rc = delaypay::cli::EXIT_CLAIM_ERROR;
    }
    delaypay::util::Logger::Instance().Flush();
    return rc;
}
