// DELAYPAY - CLI Commands Implementation
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include "delaypay/cli/commands.h"
#include "delaypay/commitment/batchfile.h"
#include "delaypay/commitment/builder.h"
#include "delaypay/db/database.h"
#include "delaypay/ledger/ledger.h"
#include "delaypay/payout/engine.h"
#include "delaypay/util/logging.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace delaypay {
namespace cli {

// ============================================================================
// Help
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n"
              << "Usage: delaypay-cli [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  -datadir=<dir>        Data directory (default: ~/.delaypay)\n"
              << "  -conf=<file>          Config file (default: delaypay.conf)\n"
              << "  -loglevel=<level>     trace, debug, info, warn, error, off\n"
              << "  -ledger.backend=<b>   leveldb or memory\n"
              << "  -admin=<address>      Administrator address (repeatable)\n"
              << "  -help                 Show this help\n"
              << "  -version              Show version\n\n"
              << "Commands:\n"
              << "  build <claims> <out>                         Commit a claims file\n"
              << "  setroot <caller> <root>                      Commit a new root\n"
              << "  claim <beneficiary> <claim-id> <amount> <proof>\n"
              << "                                               Claim a payout\n"
              << "  claimfile <commitment> <claim-id|policy-id>  Claim from a commitment file\n"
              << "  retry <leaf|all>                             Retry pending payouts\n"
              << "  status                                       Show ledger state\n";
}

namespace {

int Fail(ClaimError err, const std::string& message) {
    std::cerr << "error: " << ClaimErrorToString(err) << ": " << message << "\n";
    return EXIT_CLAIM_ERROR;
}

int Usage(const std::string& message) {
    std::cerr << "error: " << message << "\n"
              << "Use 'delaypay-cli -help' for usage information.\n";
    return EXIT_USAGE;
}

// ============================================================================
// Setup
// ============================================================================

void SetupLogging(const util::Settings& settings) {
    util::Logger& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(util::LogLevelFromString(settings.logLevel));

    if (settings.printToConsole) {
        util::ConsoleSink::Config console;
        console.useStderr = true;
        console.level = util::LogLevelFromString(settings.logLevel);
        logger.AddSink(std::make_shared<util::ConsoleSink>(console));
    }
    if (!settings.logFile.empty()) {
        util::FileSink::Config file;
        file.path = settings.logFile;
        file.autoFlush = true;
        auto sink = std::make_shared<util::FileSink>(file);
        if (sink->IsOpen()) {
            logger.AddSink(sink);
        }
    }
}

/// Ledger plus the pieces it needs, opened from the settings
struct LedgerContext {
    std::unique_ptr<ledger::ClaimLedger> ledger;
    std::shared_ptr<payout::ITransferSink> sink;
    std::unique_ptr<payout::PayoutEngine> engine;
};

int OpenLedger(const util::Settings& settings, LedgerContext& ctx) {
    std::set<Address> admins;
    for (const std::string& admin : settings.admins) {
        try {
            admins.insert(Address::FromHex(admin));
        } catch (const std::invalid_argument& e) {
            return Usage("bad admin address '" + admin + "': " + e.what());
        }
    }
    auto authorizer = std::make_shared<ledger::AdminAuthorizer>(std::move(admins));

    std::unique_ptr<db::Database> database;
    if (settings.ledgerBackend == "leveldb") {
        db::Options options;
        options.block_cache_size = static_cast<size_t>(settings.dbCacheMiB) * 1024 * 1024;
        auto opened = db::OpenDatabase(settings.LedgerPath(), options);
        if (!opened.first.ok()) {
            return Fail(ClaimError::STORAGE_ERROR, opened.first.ToString());
        }
        database = std::move(opened.second);
    } else if (settings.ledgerBackend == "memory") {
        LOG_WARN(util::LogCategory::LEDGER) << "Using the memory backend; nothing is persisted";
        database = db::NewMemoryDatabase();
    } else {
        return Usage("unknown ledger.backend '" + settings.ledgerBackend + "'");
    }

    ctx.ledger = std::make_unique<ledger::ClaimLedger>(std::move(database), authorizer);
    db::Status s = ctx.ledger->Load();
    if (!s.ok()) {
        return Fail(ClaimError::STORAGE_ERROR, s.ToString());
    }

    ctx.sink = std::make_shared<payout::JournalTransferSink>(settings.payoutJournal);
    ctx.engine = std::make_unique<payout::PayoutEngine>(*ctx.ledger, ctx.sink);
    return EXIT_OK;
}

int PrintClaimResult(const payout::ClaimResult& result) {
    if (!result.ok()) {
        if (!result.leaf.IsNull()) {
            std::cerr << "leaf: " << result.leaf.ToHex() << "\n";
        }
        return Fail(result.error, result.message);
    }
    std::cout << "paid " << result.amount << " (leaf " << result.leaf.ToHex() << ")\n";
    return EXIT_OK;
}

// ============================================================================
// Commands
// ============================================================================

int CmdBuild(const util::Settings& settings, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return Usage("build expects <claims> <out>");
    }

    commitment::ClaimsParseResult parsed = commitment::ParseClaimsFile(args[1]);
    if (!parsed.ok()) {
        return Fail(parsed.error, parsed.message);
    }

    commitment::CommitmentBuilder builder(settings.maxAmount);
    commitment::CommitmentResult built = builder.Build(parsed.claims);
    if (!built.ok()) {
        return Fail(built.error, built.message);
    }

    std::string error;
    if (!commitment::WriteCommitmentFile(args[2], built.commitment, &error)) {
        return Fail(ClaimError::STORAGE_ERROR, error);
    }

    std::cout << built.commitment.root.ToHex() << "\n";
    return EXIT_OK;
}

int CmdSetRoot(const util::Settings& settings, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return Usage("setroot expects <caller> <root>");
    }

    Address caller;
    Hash256 root;
    try {
        caller = Address::FromHex(args[1]);
        root = Hash256::FromHex(args[2]);
    } catch (const std::invalid_argument& e) {
        return Fail(ClaimError::INVALID_ROOT, e.what());
    }

    LedgerContext ctx;
    int rc = OpenLedger(settings, ctx);
    if (rc != EXIT_OK) {
        return rc;
    }

    ClaimError err = ctx.ledger->SetRoot(caller, root);
    if (err != ClaimError::OK) {
        return Fail(err, "root not changed");
    }
    std::cout << "batch " << ctx.ledger->GetRoot().batchId << " root " << root.ToHex() << "\n";
    return EXIT_OK;
}

int CmdClaim(const util::Settings& settings, const std::vector<std::string>& args) {
    if (args.size() != 5) {
        return Usage("claim expects <beneficiary> <claim-id> <amount> <proof>");
    }

    Claim claim;
    MerkleProof proof;
    try {
        claim.beneficiary = Address::FromHex(args[1]);
        claim.claimId = ClaimId::FromHex(args[2]);
    } catch (const std::invalid_argument& e) {
        return Fail(ClaimError::INVALID_CLAIM, e.what());
    }
    if (!ParseAmount(args[3], claim.amount)) {
        return Fail(ClaimError::INVALID_CLAIM, "bad amount '" + args[3] + "'");
    }
    if (!commitment::ParseProof(args[4], proof)) {
        return Fail(ClaimError::INVALID_PROOF, "malformed proof");
    }

    LedgerContext ctx;
    int rc = OpenLedger(settings, ctx);
    if (rc != EXIT_OK) {
        return rc;
    }
    return PrintClaimResult(ctx.engine->ClaimPayout(claim, proof));
}

int CmdClaimFile(const util::Settings& settings, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return Usage("claimfile expects <commitment> <claim-id|policy-id>");
    }

    commitment::CommitmentResult loaded = commitment::ReadCommitmentFile(args[1]);
    if (!loaded.ok()) {
        return Fail(loaded.error, loaded.message);
    }

    ClaimId id;
    try {
        id = ClaimId::FromHex(args[2]);
    } catch (const std::invalid_argument&) {
        id = ClaimIdFromPolicy(args[2]);
    }
    const commitment::CommitmentEntry* entry = loaded.commitment.FindByClaimId(id);
    if (!entry) {
        return Fail(ClaimError::INVALID_CLAIM, "claim " + args[2] + " is not in " + args[1]);
    }

    LedgerContext ctx;
    int rc = OpenLedger(settings, ctx);
    if (rc != EXIT_OK) {
        return rc;
    }
    return PrintClaimResult(ctx.engine->ClaimPayout(entry->claim, entry->proof));
}

int CmdRetry(const util::Settings& settings, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return Usage("retry expects <leaf|all>");
    }

    LedgerContext ctx;
    int rc = OpenLedger(settings, ctx);
    if (rc != EXIT_OK) {
        return rc;
    }

    if (args[1] == "all") {
        size_t pending = ctx.ledger->GetPendingPayouts().size();
        size_t issued = ctx.engine->RetryPending();
        std::cout << "issued " << issued << " of " << pending << " pending payouts\n";
        return issued == pending ? EXIT_OK
                                 : Fail(ClaimError::TRANSFER_FAILED, "some payouts still pending");
    }

    Hash256 leaf;
    try {
        leaf = Hash256::FromHex(args[1]);
    } catch (const std::invalid_argument& e) {
        return Fail(ClaimError::UNKNOWN_PAYOUT, e.what());
    }
    return PrintClaimResult(ctx.engine->RetryPayout(leaf));
}

int CmdStatus(const util::Settings& settings) {
    LedgerContext ctx;
    int rc = OpenLedger(settings, ctx);
    if (rc != EXIT_OK) {
        return rc;
    }

    ledger::RootRecord root = ctx.ledger->GetRoot();
    std::cout << "root:    " << (root.IsNull() ? std::string("(none)") : root.root.ToHex()) << "\n"
              << "batch:   " << root.batchId << "\n"
              << "spent:   " << ctx.ledger->SpentCount() << "\n";

    std::vector<ledger::RootRecord> history = ctx.ledger->GetRootHistory();
    std::cout << "history: " << history.size() << " batches\n";
    for (const ledger::RootRecord& record : history) {
        std::cout << "  " << record.batchId << " " << record.root.ToHex()
                  << " @" << record.committedAt << "\n";
    }

    std::vector<ledger::SpendRecord> pending = ctx.ledger->GetPendingPayouts();
    std::cout << "pending: " << pending.size() << "\n";
    for (const ledger::SpendRecord& record : pending) {
        std::cout << "  " << record.leaf.ToHex() << " " << record.claim.amount
                  << " -> " << record.claim.beneficiary.ToHex() << "\n";
    }
    return EXIT_OK;
}

} // namespace

// ============================================================================
// Main Entry Point
// ============================================================================

int RunCommand(const util::Settings& settings, const std::vector<std::string>& args) {
    if (args.empty()) {
        return Usage("no command specified");
    }

    const std::string& command = args[0];
    if (command == "build") return CmdBuild(settings, args);
    if (command == "setroot") return CmdSetRoot(settings, args);
    if (command == "claim") return CmdClaim(settings, args);
    if (command == "claimfile") return CmdClaimFile(settings, args);
    if (command == "retry") return CmdRetry(settings, args);
    if (command == "status") return CmdStatus(settings);
    if (command == "help") {
        PrintHelp();
        return EXIT_OK;
    }
    return Usage("unknown command '" + command + "'");
}

int AppMain(util::ConfigManager& config, int argc, const char* const argv[]) {
    util::ConfigParseResult parsed = util::InitConfig(config, argc, argv);
    if (!parsed.success) {
        std::string where = parsed.errorFile;
        if (parsed.errorLine > 0) {
            where += ":" + std::to_string(parsed.errorLine);
        }
        return Usage(where.empty() ? parsed.errorMessage : where + ": " + parsed.errorMessage);
    }

    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return EXIT_OK;
    }
    if (config.GetBool("version", false)) {
        std::cout << CLIENT_NAME << " v" << VERSION << "\n";
        return EXIT_OK;
    }

    const std::vector<std::string>& args = config.GetArgs();
    if (args.empty()) {
        return Usage("no command specified");
    }

    util::Settings settings = util::Settings::FromConfig(config);
    std::error_code ec;
    std::filesystem::create_directories(settings.dataDir, ec);
    if (ec) {
        return Usage("cannot create data directory " + settings.dataDir + ": " + ec.message());
    }
    SetupLogging(settings);

    return RunCommand(settings, args);
}

} // namespace cli
} // namespace delaypay
