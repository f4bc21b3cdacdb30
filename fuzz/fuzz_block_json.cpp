// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

// Fuzz target for block record parsing
// Block records come from blocks.json on disk and must never crash the loader

#include "chain/block.hpp"
#include "chain/merkle.hpp"
#include "chain/pow.hpp"
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using json = nlohmann::json;
    using blockledger::chain::Block;

    json parsed = json::parse(data, data + size, nullptr, false);
    if (parsed.is_discarded()) {
        return 0;
    }

    Block block;
    try {
        block = Block::FromJson(parsed);
    } catch (const json::exception &) {
        return 0;
    } catch (const std::invalid_argument &) {
        return 0;
    }

    // A parsed record must serialize, and its serialization must parse back
    // to a record with the same hash
    std::string hash;
    std::string candidate;
    try {
        hash = block.GetHash();
        candidate = block.GetCandidateSerialization();
    } catch (const json::type_error &) {
        // Strings that are not valid UTF-8 cannot be serialized canonically
        return 0;
    }

    Block reparsed = Block::FromJson(block.ToJson());
    if (reparsed.GetHash() != hash) {
        // Serialize/parse changed the record - BUG!
        __builtin_trap();
    }
    if (reparsed.GetCandidateSerialization() != candidate) {
        __builtin_trap();
    }

    // Verification paths must handle any parsed record
    (void)blockledger::consensus::CheckProofOfWork(block);
    (void)blockledger::chain::ComputeMerkleRoot(block.GetTransactionIds());

    return 0;
}
