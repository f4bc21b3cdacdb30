// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "chain/block_store.hpp"
#include "util/files.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace blockledger;
using namespace blockledger::chain;

namespace {

Block MakeBlock(int64_t height, double elapsed = 0, uint64_t nonce = 0) {
    Block block;
    block.height = height;
    block.timestamp = "Sun Oct 18 18:43:00 2026";
    block.block_reward = Reward::FromInteger(50);
    block.elapsed_time = elapsed;
    block.nonce = nonce;
    return block;
}

std::vector<int64_t> Heights(const std::vector<Block>& blocks) {
    std::vector<int64_t> heights;
    for (const auto& block : blocks) {
        heights.push_back(block.height);
    }
    return heights;
}

// Store whose persistence step can be made to fail
class FailingStore : public MemoryBlockStore {
public:
    bool fail = false;

protected:
    void Persist(const std::vector<Block>& /*blocks*/) override {
        if (fail) {
            throw BlockStoreError("disk full");
        }
    }
};

class TempDir {
public:
    TempDir() : path_(std::filesystem::temp_directory_path() / "blockledger_store_test") {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() { std::filesystem::remove_all(path_); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("MemoryBlockStore insert and lookup", "[store]") {
    MemoryBlockStore store;
    REQUIRE(store.Count() == 0);
    REQUIRE_FALSE(store.GetLast().has_value());

    store.Insert(MakeBlock(1));
    store.Insert(MakeBlock(2));
    store.Insert(MakeBlock(3));
    REQUIRE(store.Count() == 3);

    SECTION("FindByHeight inside and outside the range") {
        REQUIRE(store.FindByHeight(1)->height == 1);
        REQUIRE(store.FindByHeight(3)->height == 3);
        REQUIRE_FALSE(store.FindByHeight(0).has_value());
        REQUIRE_FALSE(store.FindByHeight(4).has_value());
        REQUIRE_FALSE(store.FindByHeight(-1).has_value());
    }

    SECTION("GetLast is the highest block") {
        REQUIRE(store.GetLast()->height == 3);
    }

    SECTION("Insert rejects heights that do not extend the chain") {
        REQUIRE_THROWS_AS(store.Insert(MakeBlock(3)), BlockStoreError);
        REQUIRE_THROWS_AS(store.Insert(MakeBlock(5)), BlockStoreError);
        REQUIRE(store.Count() == 3);
    }

    SECTION("DropAll empties the store") {
        store.DropAll();
        REQUIRE(store.Count() == 0);
        store.Insert(MakeBlock(1));
        REQUIRE(store.Count() == 1);
    }
}

TEST_CASE("MemoryBlockStore ranking", "[store]") {
    MemoryBlockStore store;
    store.Insert(MakeBlock(1, 0.5, 10));
    store.Insert(MakeBlock(2, 2.0, 30));
    store.Insert(MakeBlock(3, 0.5, 20));
    store.Insert(MakeBlock(4, 2.0, 5));

    SECTION("Sorted descending by field") {
        REQUIRE(Heights(store.FindTopN(BlockField::NONCE, 4)) ==
                std::vector<int64_t>{2, 3, 1, 4});
    }

    SECTION("Ties keep ascending height") {
        REQUIRE(Heights(store.FindTopN(BlockField::ELAPSED_TIME, 4)) ==
                std::vector<int64_t>{2, 4, 1, 3});
        REQUIRE(Heights(store.FindTopN(BlockField::BLOCK_REWARD, 4)) ==
                std::vector<int64_t>{1, 2, 3, 4});
    }

    SECTION("n limits the result") {
        REQUIRE(Heights(store.FindTopN("nonce", 2)) == std::vector<int64_t>{2, 3});
        REQUIRE(store.FindTopN("nonce", 100).size() == 4);
    }

    SECTION("n == 0 is empty") {
        REQUIRE(store.FindTopN(BlockField::HEIGHT, 0).empty());
    }

    SECTION("Unknown field is empty") {
        REQUIRE(store.FindTopN("timestamp", 3).empty());
        REQUIRE(store.FindTopN("", 3).empty());
    }

    SECTION("FindLastN is newest first") {
        REQUIRE(Heights(store.FindLastN(3)) == std::vector<int64_t>{4, 3, 2});
    }
}

TEST_CASE("ParseBlockField", "[store]") {
    REQUIRE(ParseBlockField("difficulty") == BlockField::DIFFICULTY);
    REQUIRE(ParseBlockField("elapsed_time") == BlockField::ELAPSED_TIME);
    REQUIRE(ParseBlockField("block_reward") == BlockField::BLOCK_REWARD);
    REQUIRE(ParseBlockField("hash_power") == BlockField::HASH_POWER);
    REQUIRE(ParseBlockField("height") == BlockField::HEIGHT);
    REQUIRE(ParseBlockField("nonce") == BlockField::NONCE);
    REQUIRE(ParseBlockField("number_of_transactions") == BlockField::NUMBER_OF_TRANSACTIONS);
    REQUIRE_FALSE(ParseBlockField("merkle_root").has_value());
    REQUIRE_FALSE(ParseBlockField("HEIGHT").has_value());
}

TEST_CASE("Failed persistence rolls the change back", "[store]") {
    FailingStore store;
    store.Insert(MakeBlock(1));
    store.Insert(MakeBlock(2));

    store.fail = true;

    SECTION("Insert") {
        REQUIRE_THROWS_AS(store.Insert(MakeBlock(3)), BlockStoreError);
        REQUIRE(store.Count() == 2);
    }

    SECTION("DropAll") {
        REQUIRE_THROWS_AS(store.DropAll(), BlockStoreError);
        REQUIRE(store.Count() == 2);
        REQUIRE(store.GetLast()->height == 2);
    }
}

TEST_CASE("JsonFileBlockStore persistence", "[store]") {
    TempDir dir;
    const auto path = dir.path() / "blocks.json";

    SECTION("Missing file starts empty") {
        JsonFileBlockStore store(path);
        REQUIRE(store.Count() == 0);
        REQUIRE(store.GetPath() == path);
    }

    SECTION("Blocks survive reopening") {
        std::string last_hash;
        {
            JsonFileBlockStore store(path);
            store.Insert(MakeBlock(1));
            store.Insert(MakeBlock(2, 1.5, 42));
            last_hash = store.GetLast()->GetHash();
        }

        JsonFileBlockStore reopened(path);
        REQUIRE(reopened.Count() == 2);
        REQUIRE(reopened.GetLast()->GetHash() == last_hash);
        REQUIRE(reopened.FindByHeight(2)->nonce == 42);

        // File layout
        auto contents = util::read_file_string(path);
        REQUIRE(contents.has_value());
        auto root = nlohmann::json::parse(*contents);
        REQUIRE(root["version"] == 1);
        REQUIRE(root["block_count"] == 2);
        REQUIRE(root["blocks"].size() == 2);
    }

    SECTION("DropAll is persisted") {
        {
            JsonFileBlockStore store(path);
            store.Insert(MakeBlock(1));
            store.DropAll();
        }
        JsonFileBlockStore reopened(path);
        REQUIRE(reopened.Count() == 0);
    }

    SECTION("Corrupt file is rejected") {
        REQUIRE(util::atomic_write_file(path, "{not json"));
        REQUIRE_THROWS_AS(JsonFileBlockStore(path), BlockStoreError);
    }

    SECTION("Unknown version is rejected") {
        REQUIRE(util::atomic_write_file(path, R"({"version":2,"block_count":0,"blocks":[]})"));
        REQUIRE_THROWS_AS(JsonFileBlockStore(path), BlockStoreError);
    }

    SECTION("Out of order heights are rejected") {
        nlohmann::json root;
        root["version"] = 1;
        root["block_count"] = 2;
        root["blocks"] = nlohmann::json::array({MakeBlock(1).ToJson(), MakeBlock(3).ToJson()});
        REQUIRE(util::atomic_write_file(path, root.dump()));
        REQUIRE_THROWS_AS(JsonFileBlockStore(path), BlockStoreError);
    }

    SECTION("Malformed block record is rejected") {
        nlohmann::json bad = MakeBlock(1).ToJson();
        bad.erase("nonce");
        nlohmann::json root;
        root["version"] = 1;
        root["block_count"] = 1;
        root["blocks"] = nlohmann::json::array({bad});
        REQUIRE(util::atomic_write_file(path, root.dump()));
        REQUIRE_THROWS_AS(JsonFileBlockStore(path), BlockStoreError);
    }
}
