// DELAYPAY - Batch Files Implementation
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include "delaypay/commitment/batchfile.h"
#include "delaypay/util/logging.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace delaypay {
namespace commitment {

namespace {

std::string Where(const std::string& source, int lineNum) {
    return source + ":" + std::to_string(lineNum);
}

/// Strip a trailing comment and split on whitespace
std::vector<std::string> Tokenize(const std::string& line) {
    std::string body = line.substr(0, line.find('#'));
    std::istringstream iss(body);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

} // namespace

// ============================================================================
// Proof Text
// ============================================================================

std::string FormatProof(const MerkleProof& proof) {
    if (proof.empty()) {
        return "-";
    }
    std::string out;
    for (size_t i = 0; i < proof.size(); ++i) {
        if (i) out += ',';
        out += proof[i].ToHex();
    }
    return out;
}

bool ParseProof(const std::string& text, MerkleProof& proof) {
    MerkleProof parsed;
    if (!text.empty() && text != "-") {
        std::istringstream iss(text);
        std::string item;
        while (std::getline(iss, item, ',')) {
            try {
                parsed.push_back(Hash256::FromHex(item));
            } catch (const std::invalid_argument&) {
                return false;
            }
        }
        // A trailing comma leaves an empty final element unread
        if (text.back() == ',') {
            return false;
        }
    }
    proof = std::move(parsed);
    return true;
}

// ============================================================================
// Claims Files
// ============================================================================

ClaimsParseResult ParseClaims(std::istream& in, const std::string& source) {
    ClaimsParseResult result;
    std::string line;
    int lineNum = 0;

    while (std::getline(in, line)) {
        ++lineNum;
        std::vector<std::string> tokens = Tokenize(line);
        if (tokens.empty()) {
            continue;
        }
        if (tokens.size() != 3) {
            return ClaimsParseResult::Error(ClaimError::INVALID_CLAIM,
                Where(source, lineNum) + ": expected '<beneficiary> <policy-id> <amount>'");
        }

        Claim claim;
        try {
            claim.beneficiary = Address::FromHex(tokens[0]);
        } catch (const std::invalid_argument& e) {
            return ClaimsParseResult::Error(ClaimError::INVALID_CLAIM,
                Where(source, lineNum) + ": bad beneficiary: " + e.what());
        }
        claim.claimId = ClaimIdFromPolicy(tokens[1]);
        if (!ParseAmount(tokens[2], claim.amount)) {
            return ClaimsParseResult::Error(ClaimError::INVALID_CLAIM,
                Where(source, lineNum) + ": bad amount '" + tokens[2] + "'");
        }
        result.claims.push_back(claim);
    }

    if (in.bad()) {
        return ClaimsParseResult::Error(ClaimError::INVALID_CLAIM,
                                        source + ": read error");
    }
    return result;
}

ClaimsParseResult ParseClaimsFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return ClaimsParseResult::Error(ClaimError::INVALID_CLAIM,
                                        "cannot open " + path);
    }
    return ParseClaims(in, path);
}

// ============================================================================
// Commitment Files
// ============================================================================

void WriteCommitment(std::ostream& out, const BatchCommitment& commitment) {
    out << "root " << commitment.root.ToHex() << "\n";
    for (const CommitmentEntry& entry : commitment.entries) {
        out << "claim " << entry.claim.beneficiary.ToHex()
            << ' ' << entry.claim.claimId.ToHex()
            << ' ' << entry.claim.amount
            << ' ' << entry.leaf.ToHex()
            << ' ' << FormatProof(entry.proof) << "\n";
    }
}

bool WriteCommitmentFile(const std::string& path, const BatchCommitment& commitment,
                         std::string* error) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        if (error) *error = "cannot open " + path + " for writing";
        return false;
    }
    WriteCommitment(out, commitment);
    out.flush();
    if (!out) {
        if (error) *error = "write to " + path + " failed";
        return false;
    }
    LOG_DEBUG(util::LogCategory::MERKLE) << "Wrote " << commitment.size()
                                         << " entries to " << path;
    return true;
}

CommitmentResult ReadCommitment(std::istream& in, const std::string& source) {
    CommitmentResult result;
    bool haveRoot = false;
    std::string line;
    int lineNum = 0;

    while (std::getline(in, line)) {
        ++lineNum;
        std::vector<std::string> tokens = Tokenize(line);
        if (tokens.empty()) {
            continue;
        }

        if (tokens[0] == "root") {
            if (haveRoot || tokens.size() != 2) {
                return CommitmentResult::Error(ClaimError::INVALID_CLAIM,
                    Where(source, lineNum) + ": expected a single 'root <hex>' line");
            }
            try {
                result.commitment.root = Hash256::FromHex(tokens[1]);
            } catch (const std::invalid_argument& e) {
                return CommitmentResult::Error(ClaimError::INVALID_CLAIM,
                    Where(source, lineNum) + ": bad root: " + e.what());
            }
            haveRoot = true;
            continue;
        }

        if (tokens[0] != "claim" || tokens.size() != 6 || !haveRoot) {
            return CommitmentResult::Error(ClaimError::INVALID_CLAIM,
                Where(source, lineNum) + ": expected 'claim <beneficiary> <claim-id> "
                "<amount> <leaf> <proof>' after the root line");
        }

        CommitmentEntry entry;
        try {
            entry.claim.beneficiary = Address::FromHex(tokens[1]);
            entry.claim.claimId = ClaimId::FromHex(tokens[2]);
            entry.leaf = Hash256::FromHex(tokens[4]);
        } catch (const std::invalid_argument& e) {
            return CommitmentResult::Error(ClaimError::INVALID_CLAIM,
                Where(source, lineNum) + ": " + e.what());
        }
        if (!ParseAmount(tokens[3], entry.claim.amount)) {
            return CommitmentResult::Error(ClaimError::INVALID_CLAIM,
                Where(source, lineNum) + ": bad amount '" + tokens[3] + "'");
        }
        if (!ParseProof(tokens[5], entry.proof)) {
            return CommitmentResult::Error(ClaimError::INVALID_CLAIM,
                Where(source, lineNum) + ": bad proof");
        }

        if (EncodeLeaf(entry.claim) != entry.leaf) {
            return CommitmentResult::Error(ClaimError::INVALID_PROOF,
                Where(source, lineNum) + ": leaf does not match claim");
        }
        if (!VerifyMerkleProof(entry.leaf, entry.proof, result.commitment.root)) {
            return CommitmentResult::Error(ClaimError::INVALID_PROOF,
                Where(source, lineNum) + ": proof does not reach the root");
        }
        result.commitment.entries.push_back(std::move(entry));
    }

    if (!haveRoot) {
        return CommitmentResult::Error(ClaimError::INVALID_CLAIM,
                                       source + ": missing root line");
    }
    return result;
}

CommitmentResult ReadCommitmentFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return CommitmentResult::Error(ClaimError::INVALID_CLAIM, "cannot open " + path);
    }
    return ReadCommitment(in, path);
}

} // namespace commitment
} // namespace delaypay
