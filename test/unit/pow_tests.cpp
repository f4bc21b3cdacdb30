// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Proof-of-work and schedule tests

#include <catch2/catch_test_macros.hpp>
#include "chain/block.hpp"
#include "chain/hasher.hpp"
#include "chain/chainparams.hpp"
#include "chain/miner.hpp"
#include "chain/pow.hpp"
#include <string>
#include <vector>

using namespace blockledger;
using namespace blockledger::chain;
using namespace blockledger::consensus;

namespace {

ConsensusParams MakeParams(int64_t halving, int64_t bits_interval,
                           int64_t recompute_interval, int64_t initial = 50) {
    ConsensusParams params{};
    params.initialReward = Reward::FromInteger(initial);
    params.nRewardHalvingInterval = halving;
    params.nDifficultyBitsInterval = bits_interval;
    params.nDifficultyRecomputeInterval = recompute_interval;
    params.nMaxNonce = 1ULL << 32;
    return params;
}

// Apply the schedule along a chain of `count` blocks, starting at genesis
std::vector<Block> BuildSchedule(const ConsensusParams& params, int64_t count) {
    std::vector<Block> chain;
    chain.reserve(static_cast<size_t>(count));
    for (int64_t h = 1; h <= count; ++h) {
        const Block* prev = chain.empty() ? nullptr : &chain.back();
        Block block;
        block.height = h;
        block.block_reward = GetNextBlockReward(prev, params);
        block.difficulty_bits = GetNextDifficultyBits(prev, params);
        block.difficulty = GetNextDifficulty(prev, params);
        chain.push_back(block);
    }
    return chain;
}

} // namespace

TEST_CASE("Genesis schedule values", "[pow][schedule]") {
    ConsensusParams params = MakeParams(1000, 100, 100);

    REQUIRE(GetNextBlockReward(nullptr, params) == Reward::FromInteger(50));
    REQUIRE(GetNextDifficultyBits(nullptr, params) == 0);
    REQUIRE(GetNextDifficulty(nullptr, params) == 1);
}

TEST_CASE("Reward halving schedule", "[pow][schedule]") {
    ConsensusParams params = MakeParams(1000, 100, 100);
    std::vector<Block> chain = BuildSchedule(params, 7002);

    auto reward_after = [&](int64_t h) {
        return GetNextBlockReward(&chain[static_cast<size_t>(h - 1)], params);
    };

    SECTION("50 until the first boundary") {
        REQUIRE(reward_after(1) == Reward::FromInteger(50));
        REQUIRE(reward_after(999) == Reward::FromInteger(50));
    }

    SECTION("Halves on each boundary") {
        REQUIRE(reward_after(1000).ToDouble() == 25.0);
        REQUIRE(reward_after(1999).ToDouble() == 25.0);
        REQUIRE(reward_after(2000).ToDouble() == 12.5);
        REQUIRE(reward_after(3000).ToDouble() == 6.25);
        REQUIRE(reward_after(5000).ToDouble() == 1.5625);
        REQUIRE(reward_after(6000).ToDouble() == 0.78125);
    }

    SECTION("Zero forever once below one") {
        REQUIRE(reward_after(6001).IsZero());
        REQUIRE(reward_after(7000).IsZero());
        REQUIRE(reward_after(7001).IsZero());
    }
}

TEST_CASE("Reward of exactly one never halves", "[pow][schedule]") {
    ConsensusParams params = MakeParams(2, 100, 100, 2);
    std::vector<Block> chain = BuildSchedule(params, 10);

    REQUIRE(chain[1].block_reward == Reward::FromInteger(2));
    REQUIRE(chain[2].block_reward == Reward::FromInteger(1));
    REQUIRE(chain[9].block_reward == Reward::FromInteger(1));
}

TEST_CASE("Difficulty bits schedule", "[pow][schedule]") {
    ConsensusParams params = MakeParams(1000, 100, 100);
    std::vector<Block> chain = BuildSchedule(params, 450);

    auto bits_after = [&](int64_t h) {
        return GetNextDifficultyBits(&chain[static_cast<size_t>(h - 1)], params);
    };

    REQUIRE(bits_after(1) == 0);
    REQUIRE(bits_after(99) == 0);
    REQUIRE(bits_after(100) == 1);
    REQUIRE(bits_after(199) == 1);
    REQUIRE(bits_after(200) == 2);
    REQUIRE(bits_after(400) == 4);

    SECTION("Non-decreasing, +1 at each boundary") {
        for (size_t i = 1; i < chain.size(); ++i) {
            int step = chain[i].difficulty_bits - chain[i - 1].difficulty_bits;
            REQUIRE(step == (chain[i - 1].height % 100 == 0 ? 1 : 0));
        }
    }
}

TEST_CASE("Difficulty recompute schedule", "[pow][schedule]") {
    SECTION("Same intervals keep difficulty == 2^bits after the first step") {
        ConsensusParams params = MakeParams(1000, 5, 5);
        std::vector<Block> chain = BuildSchedule(params, 30);

        REQUIRE(chain[4].difficulty == 1);   // height 5
        REQUIRE(chain[5].difficulty == 2);   // height 6: 2^(0 + 1)
        REQUIRE(chain[5].difficulty_bits == 1);
        REQUIRE(chain[10].difficulty == 4);  // height 11: 2^(1 + 1)
        REQUIRE(chain[10].difficulty_bits == 2);
    }

    SECTION("Recurrence is independent of the bits schedule") {
        // Bits step every 2 blocks, difficulty every 3
        ConsensusParams params = MakeParams(1000, 2, 3);
        std::vector<Block> chain = BuildSchedule(params, 10);

        // Height 3 has bits 1 (stepped after height 2)
        REQUIRE(chain[2].difficulty_bits == 1);
        // Height 4 follows the boundary at height 3: 2^(1 + 1)
        REQUIRE(chain[3].difficulty == 4);
        // Height 5 keeps the previous difficulty even though bits moved to 2
        REQUIRE(chain[4].difficulty_bits == 2);
        REQUIRE(chain[4].difficulty == 4);
    }

    SECTION("Saturates at 2^63") {
        ConsensusParams params = MakeParams(1000, 1, 1);
        Block prev;
        prev.height = 10;
        prev.difficulty_bits = 70;
        REQUIRE(GetNextDifficulty(&prev, params) == (uint64_t{1} << 63));
    }
}

TEST_CASE("Targets from difficulty bits", "[pow]") {
    REQUIRE(GetTargetFromBits(1).GetHex() ==
            "8000000000000000000000000000000000000000000000000000000000000000");
    REQUIRE(GetTargetFromBits(8).GetHex() ==
            "0100000000000000000000000000000000000000000000000000000000000000");
    REQUIRE(GetTargetFromBits(256).GetHex() ==
            "0000000000000000000000000000000000000000000000000000000000000001");
    REQUIRE(GetTargetFromBits(0).IsNull());
    REQUIRE(GetTargetFromBits(257).IsNull());
}

TEST_CASE("CheckProofOfWork on digests", "[pow]") {
    uint256 max_hash = uint256S(std::string(64, 'f'));
    uint256 zero;

    SECTION("Bits <= 0 accept everything") {
        REQUIRE(CheckProofOfWork(max_hash, 0));
        REQUIRE(CheckProofOfWork(max_hash, -5));
    }

    SECTION("Bits above 256 accept nothing") {
        REQUIRE_FALSE(CheckProofOfWork(zero, 257));
    }

    SECTION("Strict inequality against the target") {
        uint256 target = GetTargetFromBits(4);
        REQUIRE_FALSE(CheckProofOfWork(target, 4));
        REQUIRE(CheckProofOfWork(uint256S("0fffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff"), 4));
        REQUIRE(CheckProofOfWork(zero, 256));
        REQUIRE_FALSE(CheckProofOfWork(uint256S("01"), 256));
    }
}

TEST_CASE("CheckProofOfWork on blocks", "[pow]") {
    Block block;
    block.height = 2;
    block.previous_hash = std::string(64, 'a');
    block.timestamp = "Sun Oct 18 18:43:00 2026";
    block.block_reward = Reward::FromInteger(50);

    SECTION("Bits 0 is trivially valid") {
        block.difficulty_bits = 0;
        block.nonce = 12345;
        REQUIRE(CheckProofOfWork(block));
    }

    SECTION("Sealed nonce verifies, other fields outside the pre-image do not matter") {
        block.difficulty_bits = 8;
        auto result = mining::FindNonce(block.GetCandidateSerialization(),
                                        block.difficulty_bits, 1ULL << 20);
        REQUIRE(result.Found());
        block.nonce = result.nonce;
        REQUIRE(CheckProofOfWork(block));

        block.elapsed_time = 3.5;
        block.hash_power = 1e6;
        REQUIRE(CheckProofOfWork(block));

        SECTION("Changing a candidate field invalidates it") {
            // Find a height for which the sealed nonce no longer works
            bool invalidated = false;
            for (int64_t h = 3; h < 200 && !invalidated; ++h) {
                block.height = h;
                invalidated = !CheckProofOfWork(block);
            }
            REQUIRE(invalidated);
        }
    }

    SECTION("Digest is the candidate bytes followed by the decimal nonce") {
        const std::string candidate = block.GetCandidateSerialization();
        REQUIRE(GetProofOfWorkHash(candidate, 907) == crypto::Sha256(candidate + "907"));
    }
}
