// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "chain/block_store.hpp"
#include "chain/chainparams.hpp"
#include "chain/ledger.hpp"
#include "network/rpc_client.hpp"
#include "network/rpc_server.hpp"
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/stat.h>
#include <vector>

using namespace blockledger;
using json = nlohmann::json;

namespace {

class RPCFixture {
public:
    RPCFixture()
        : dir(std::filesystem::temp_directory_path() / "blockledger_rpc_test"),
          params(chain::ChainParams::CreateRegTest()),
          ledger(store, *params) {
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        ledger.Reset();
        server = std::make_unique<rpc::RPCServer>(
            (dir / "node.sock").string(), ledger, store, *params,
            [this]() { stop_requested = true; });
    }

    ~RPCFixture() {
        server->Stop();
        std::filesystem::remove_all(dir);
    }

    json Call(const std::string& method, const std::vector<std::string>& args = {}) {
        return json::parse(server->ExecuteCommand(method, args));
    }

    std::filesystem::path dir;
    chain::MemoryBlockStore store;
    std::unique_ptr<chain::ChainParams> params;
    chain::Ledger ledger;
    std::unique_ptr<rpc::RPCServer> server;
    bool stop_requested = false;
};

} // namespace

TEST_CASE("RPC transaction commands", "[rpc]") {
    RPCFixture f;

    json entry = f.Call("addtransaction", {"alice", "bob", "12.5"});
    REQUIRE(entry["transaction_info"]["sender"] == "alice");
    REQUIRE(entry["transaction_info"]["amount"] == 12.5);
    REQUIRE(entry["transaction_id"].get<std::string>().size() == 64);

    json pending = f.Call("getpendingtransactions");
    REQUIRE(pending.size() == 1);
    REQUIRE(pending[0]["transaction_id"] == entry["transaction_id"]);

    SECTION("Bad arguments") {
        REQUIRE(f.Call("addtransaction", {"alice", "bob"}).contains("error"));
        REQUIRE(f.Call("addtransaction", {"alice", "bob", "lots"})["error"] == "Invalid amount");
        REQUIRE(f.Call("getpendingtransactions").size() == 1);
    }
}

TEST_CASE("RPC mining commands", "[rpc]") {
    RPCFixture f;
    f.Call("addtransaction", {"alice", "bob", "1"});

    json block = f.Call("mine");
    REQUIRE(block["height"] == 2);
    REQUIRE(block["number_of_transactions"] == 2);
    REQUIRE(f.Call("getpendingtransactions").empty());

    json heights = f.Call("generate", {"3"});
    REQUIRE(heights == json::array({3, 4, 5}));

    json info = f.Call("getmininginfo");
    REQUIRE(info["chain"] == "regtest");
    REQUIRE(info["blocks"] == 5);
    REQUIRE(info["next_difficulty_bits"] == 1);
    REQUIRE(info["next_difficulty"] == 2);
    REQUIRE(info["next_block_reward"] == 50);
    REQUIRE(info["pending_transactions"] == 0);
    REQUIRE(info.contains("hash_power"));
    REQUIRE(info.contains("elapsed_time"));

    SECTION("generate bounds") {
        REQUIRE(f.Call("generate", {"0"}).contains("error"));
        REQUIRE(f.Call("generate", {"1001"}).contains("error"));
        REQUIRE(f.Call("generate").contains("error"));
    }

    SECTION("Mining failure is reported as an error") {
        f.params->SetMaxNonce(0);
        json failed = f.Call("mine");
        REQUIRE(failed.contains("error"));
        REQUIRE(f.store.Count() == 5);
    }
}

TEST_CASE("RPC block queries", "[rpc]") {
    RPCFixture f;
    f.Call("generate", {"4"});

    SECTION("getblock") {
        json block = f.Call("getblock", {"3"});
        REQUIRE(block["height"] == 3);
        REQUIRE(block["previous_hash"] == f.store.FindByHeight(2)->GetHash());

        REQUIRE(f.Call("getblock", {"6"})["error"] == "Block not found");
        REQUIRE(f.Call("getblock", {"0"})["error"] == "Block not found");
        REQUIRE(f.Call("getblock", {"-3"})["error"] == "Block not found");
        REQUIRE(f.Call("getblock", {"abc"})["error"] == "Invalid height");
        REQUIRE(f.Call("getblock", {"abc"}).contains("error"));
    }

    SECTION("getblockcount") {
        REQUIRE(f.server->ExecuteCommand("getblockcount", {}) == "5\n");
    }

    SECTION("getgenesisblock") {
        json genesis = f.Call("getgenesisblock");
        REQUIRE(genesis["height"] == 1);
        REQUIRE(genesis["previous_hash"].is_null());
        REQUIRE(genesis["merkle_root"].is_null());
    }

    SECTION("getlastblocks") {
        json last = f.Call("getlastblocks", {"2"});
        REQUIRE(last.size() == 2);
        REQUIRE(last[0]["height"] == 5);
        REQUIRE(last[1]["height"] == 4);
        REQUIRE(f.Call("getlastblocks", {"0"}).empty());
    }

    SECTION("gettopblocks") {
        json top = f.Call("gettopblocks", {"height", "3"});
        REQUIRE(top.size() == 3);
        REQUIRE(top[0]["height"] == 5);

        REQUIRE(f.Call("gettopblocks", {"timestamp", "3"}).empty());
        REQUIRE(f.Call("gettopblocks", {"height"}).contains("error"));
    }

    SECTION("verifychain") {
        json result = f.Call("verifychain");
        REQUIRE(result["valid"] == true);
        REQUIRE(result["height"] == 5);
    }

    SECTION("reset") {
        json genesis = f.Call("reset");
        REQUIRE(genesis["height"] == 1);
        REQUIRE(f.store.Count() == 1);
    }
}

TEST_CASE("RPC control commands", "[rpc]") {
    RPCFixture f;

    REQUIRE(f.Call("nosuchcommand")["error"] == "Unknown command");

    REQUIRE(f.server->ExecuteCommand("stop", {}) == "\"BlockLedger stopping\"\n");
    REQUIRE(f.stop_requested);
}

TEST_CASE("RPC over the Unix socket", "[rpc]") {
    RPCFixture f;
    const std::string socket_path = (f.dir / "node.sock").string();

    REQUIRE(f.server->Start());
    REQUIRE(f.server->IsRunning());

    struct stat st;
    REQUIRE(stat(socket_path.c_str(), &st) == 0);
    REQUIRE((st.st_mode & 0777) == 0600);

    rpc::RPCClient client(socket_path);
    REQUIRE(client.Connect());
    REQUIRE(client.ExecuteCommand("getblockcount") == "1\n");
    REQUIRE_FALSE(client.IsConnected());

    REQUIRE(client.Connect());
    json block = json::parse(client.ExecuteCommand("getblock", {"1"}));
    REQUIRE(block["height"] == 1);

    f.server->Stop();
    REQUIRE_FALSE(f.server->IsRunning());
    REQUIRE_FALSE(std::filesystem::exists(socket_path));

    rpc::RPCClient late(socket_path);
    REQUIRE_FALSE(late.Connect());
}
