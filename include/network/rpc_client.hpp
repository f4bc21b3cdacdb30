// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>
#include <vector>

namespace blockledger {
namespace rpc {

/**
 * Simple JSON-RPC client for querying the node
 *
 * Uses Unix domain sockets for IPC between cli and node.
 * The server answers one request per connection, so ExecuteCommand() reads
 * until the server closes and the client must Connect() again afterwards.
 */
class RPCClient {
public:
  /**
   * Constructor
   * @param socket_path Path to Unix domain socket (e.g.,
   * ~/.blockledger/node.sock)
   */
  explicit RPCClient(const std::string &socket_path);
  ~RPCClient();

  RPCClient(const RPCClient &) = delete;
  RPCClient &operator=(const RPCClient &) = delete;

  /**
   * Connect to the node
   * @return true if connected successfully
   */
  bool Connect();

  /**
   * Execute RPC command
   * @param method Method name (e.g., "getblock", "mine")
   * @param params Command parameters, sent as JSON strings
   * @return Response string (JSON)
   * @throws std::runtime_error if not connected or the socket fails
   */
  std::string ExecuteCommand(const std::string &method,
                             const std::vector<std::string> &params = {});

  bool IsConnected() const { return socket_fd_ >= 0; }

  void Disconnect();

private:
  std::string socket_path_;
  int socket_fd_;
};

} // namespace rpc
} // namespace blockledger
