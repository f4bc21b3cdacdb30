// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/rpc_client.hpp"
#include "util/files.hpp"
#include "version.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

void PrintUsage(const char *program_name) {
  std::cout
      << "BlockLedger CLI - Query and drive the ledger node\n\n"
      << "Usage: " << program_name << " [options] <command> [params]\n\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.blockledger)\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n\n"
      << "Commands:\n"
      << "\n"
      << "Transactions:\n"
      << "  addtransaction <sender> <recipient> <amount>  Add to the pending pool\n"
      << "  getpendingtransactions   List the pending pool\n"
      << "\n"
      << "Mining:\n"
      << "  mine                     Seal the pending pool into a new block\n"
      << "  generate <n>             Mine n blocks (1-1000)\n"
      << "  getmininginfo            Next reward and difficulty, last hash power\n"
      << "\n"
      << "Blockchain:\n"
      << "  getblock <height>        Get block at height\n"
      << "  getblockcount            Get number of blocks\n"
      << "  getgenesisblock          Get block 1\n"
      << "  getlastblocks <n>        Get the latest n blocks, newest first\n"
      << "  gettopblocks <field> <n> Get n blocks with the largest field value\n"
      << "                           Fields: difficulty, elapsed_time, block_reward,\n"
      << "                           hash_power, height, nonce, number_of_transactions\n"
      << "  verifychain              Check links, Merkle roots and proof-of-work\n"
      << "  reset                    Drop every block and store a new genesis\n"
      << "\n"
      << "Control:\n"
      << "  stop                     Stop the node\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    if (argc < 2) {
      PrintUsage(argv[0]);
      return 1;
    }

    // Parse options
    std::string datadir = blockledger::util::get_default_datadir().string();
    std::string command;
    std::vector<std::string> params;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (command.empty() && (arg == "--help" || arg == "-h")) {
        PrintUsage(argv[0]);
        return 0;
      } else if (command.empty() && (arg == "--version" || arg == "-v")) {
        std::cout << blockledger::GetFullVersionString() << std::endl;
        std::cout << blockledger::GetCopyrightString() << std::endl;
        return 0;
      } else if (command.empty() && arg.find("--datadir=") == 0) {
        datadir = arg.substr(10);
      } else if (command.empty()) {
        command = arg;
      } else {
        // Everything after the command is passed through, including values
        // that start with '-' such as negative amounts
        params.push_back(arg);
      }
    }

    if (command.empty()) {
      std::cerr << "Error: No command specified\n";
      PrintUsage(argv[0]);
      return 1;
    }

    // RPC is a Unix domain socket in the data directory; there is no network
    // RPC port
    std::string socket_path = datadir + "/node.sock";
    blockledger::rpc::RPCClient client(socket_path);

    if (!client.Connect()) {
      std::cerr << "Error: Cannot connect to node at " << socket_path << "\n"
                << "Make sure the node is running.\n";
      return 1;
    }

    std::string response = client.ExecuteCommand(command, params);

    // Errors go to stderr with a non-zero exit code
    nlohmann::json parsed = nlohmann::json::parse(response, nullptr, false);
    if (parsed.is_object() && parsed.contains("error")) {
      std::cerr << "Error: " << parsed["error"].get<std::string>() << std::endl;
      return 1;
    }

    std::cout << response;
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
