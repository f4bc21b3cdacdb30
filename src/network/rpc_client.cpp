// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/rpc_client.hpp"
#include <cerrno>
#include <cstring>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace blockledger {
namespace rpc {

RPCClient::RPCClient(const std::string &socket_path)
    : socket_path_(socket_path), socket_fd_(-1) {}

RPCClient::~RPCClient() { Disconnect(); }

bool RPCClient::Connect() {
  if (socket_fd_ >= 0) {
    return true; // Already connected
  }

  struct sockaddr_un addr;
  if (socket_path_.size() >= sizeof(addr.sun_path)) {
    return false;
  }

  socket_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
  if (socket_fd_ < 0) {
    return false;
  }

  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  if (connect(socket_fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
    close(socket_fd_);
    socket_fd_ = -1;
    return false;
  }

  return true;
}

std::string RPCClient::ExecuteCommand(const std::string &method,
                                      const std::vector<std::string> &params) {
  if (!IsConnected()) {
    throw std::runtime_error("Not connected to node");
  }

  nlohmann::json request;
  request["method"] = method;
  if (!params.empty()) {
    request["params"] = params;
  }
  const std::string request_str = request.dump() + "\n";

  size_t offset = 0;
  while (offset < request_str.size()) {
    ssize_t sent = send(socket_fd_, request_str.data() + offset,
                        request_str.size() - offset, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR)
        continue;
      throw std::runtime_error("Failed to send request");
    }
    offset += static_cast<size_t>(sent);
  }

  // The server closes the connection after the response
  std::string response;
  char buffer[4096];
  for (;;) {
    ssize_t received = recv(socket_fd_, buffer, sizeof(buffer), 0);
    if (received < 0) {
      if (errno == EINTR)
        continue;
      throw std::runtime_error("Failed to receive response");
    }
    if (received == 0) {
      break;
    }
    response.append(buffer, static_cast<size_t>(received));
  }

  Disconnect();
  return response;
}

void RPCClient::Disconnect() {
  if (socket_fd_ >= 0) {
    close(socket_fd_);
    socket_fd_ = -1;
  }
}

} // namespace rpc
} // namespace blockledger
