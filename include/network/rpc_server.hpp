// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace blockledger {

// Forward declarations
namespace chain {
class BlockStore;
class ChainParams;
class Ledger;
} // namespace chain

namespace rpc {

/**
 * RPC Server using Unix Domain Sockets (Local-Only Access)
 *
 * The socket is created at datadir/node.sock with mode 0600; access control
 * is the filesystem permission on that file. There is no TCP listener.
 *
 * Protocol: one request per connection.
 *   request:  {"method": "getblock", "params": ["1"]}
 *   response: JSON document, or {"error": "..."} on failure
 * The server closes the connection after writing the response.
 *
 * Requests are handled one at a time on the server thread, so a long "mine"
 * delays every other command until the search ends.
 */
class RPCServer {
public:
  using CommandHandler =
      std::function<std::string(const std::vector<std::string> &)>;

  RPCServer(const std::string &socket_path, chain::Ledger &ledger,
            const chain::BlockStore &store, const chain::ChainParams &params,
            std::function<void()> shutdown_callback = nullptr);
  ~RPCServer();

  bool Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Dispatch one command; unknown commands and handler exceptions become
  // {"error": ...} responses
  std::string ExecuteCommand(const std::string &method,
                             const std::vector<std::string> &params);

private:
  void ServerThread();
  void HandleClient(int client_fd);
  void RegisterHandlers();

  // Command handlers - Transactions
  std::string HandleAddTransaction(const std::vector<std::string> &params);
  std::string
  HandleGetPendingTransactions(const std::vector<std::string> &params);

  // Command handlers - Mining
  std::string HandleMine(const std::vector<std::string> &params);
  std::string HandleGenerate(const std::vector<std::string> &params);
  std::string HandleGetMiningInfo(const std::vector<std::string> &params);

  // Command handlers - Blockchain
  std::string HandleGetBlock(const std::vector<std::string> &params);
  std::string HandleGetBlockCount(const std::vector<std::string> &params);
  std::string HandleGetGenesisBlock(const std::vector<std::string> &params);
  std::string HandleGetLastBlocks(const std::vector<std::string> &params);
  std::string HandleGetTopBlocks(const std::vector<std::string> &params);
  std::string HandleVerifyChain(const std::vector<std::string> &params);
  std::string HandleReset(const std::vector<std::string> &params);

  // Command handlers - Control
  std::string HandleStop(const std::vector<std::string> &params);

  std::string socket_path_;
  chain::Ledger &ledger_;
  const chain::BlockStore &store_;
  const chain::ChainParams &params_;
  std::function<void()> shutdown_callback_;

  int server_fd_;
  std::atomic<bool> running_;
  std::atomic<bool> shutting_down_;
  std::thread server_thread_;

  std::map<std::string, CommandHandler> handlers_;
};

} // namespace rpc
} // namespace blockledger
