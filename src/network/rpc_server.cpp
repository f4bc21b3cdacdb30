// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

/**
 * RPC Server Implementation - Unix Domain Sockets
 *
 * RPC is only reachable from the local machine through datadir/node.sock.
 * No network port is opened and there is no authentication beyond the
 * socket file permissions.
 */

#include "network/rpc_server.hpp"
#include "chain/block.hpp"
#include "chain/block_store.hpp"
#include "chain/chainparams.hpp"
#include "chain/ledger.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <cerrno>
#include <cstring>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

namespace blockledger {
namespace rpc {

namespace {

// Requests larger than this are rejected
constexpr size_t MAX_REQUEST_SIZE = 64 * 1024;

// Limits for commands taking a count
constexpr int MAX_GENERATE_BLOCKS = 1000;
constexpr int MAX_LIST_BLOCKS = 100000;

std::string ToResponse(const nlohmann::json &j) { return j.dump(2) + "\n"; }

nlohmann::json BlocksToJson(const std::vector<chain::Block> &blocks) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto &block : blocks) {
    array.push_back(block.ToJson());
  }
  return array;
}

void SendAll(int fd, const std::string &data) {
  size_t offset = 0;
  while (offset < data.size()) {
    ssize_t sent = send(fd, data.data() + offset, data.size() - offset,
                        MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR)
        continue;
      LOG_RPC_WARN("Failed to send RPC response: {}", std::strerror(errno));
      return;
    }
    offset += static_cast<size_t>(sent);
  }
}

} // namespace

RPCServer::RPCServer(const std::string &socket_path, chain::Ledger &ledger,
                     const chain::BlockStore &store,
                     const chain::ChainParams &params,
                     std::function<void()> shutdown_callback)
    : socket_path_(socket_path), ledger_(ledger), store_(store),
      params_(params), shutdown_callback_(std::move(shutdown_callback)),
      server_fd_(-1), running_(false), shutting_down_(false) {
  RegisterHandlers();
}

RPCServer::~RPCServer() { Stop(); }

void RPCServer::RegisterHandlers() {
  // Transaction commands
  handlers_["addtransaction"] = [this](const auto &p) {
    return HandleAddTransaction(p);
  };
  handlers_["getpendingtransactions"] = [this](const auto &p) {
    return HandleGetPendingTransactions(p);
  };

  // Mining commands
  handlers_["mine"] = [this](const auto &p) { return HandleMine(p); };
  handlers_["generate"] = [this](const auto &p) { return HandleGenerate(p); };
  handlers_["getmininginfo"] = [this](const auto &p) {
    return HandleGetMiningInfo(p);
  };

  // Blockchain commands
  handlers_["getblock"] = [this](const auto &p) { return HandleGetBlock(p); };
  handlers_["getblockcount"] = [this](const auto &p) {
    return HandleGetBlockCount(p);
  };
  handlers_["getgenesisblock"] = [this](const auto &p) {
    return HandleGetGenesisBlock(p);
  };
  handlers_["getlastblocks"] = [this](const auto &p) {
    return HandleGetLastBlocks(p);
  };
  handlers_["gettopblocks"] = [this](const auto &p) {
    return HandleGetTopBlocks(p);
  };
  handlers_["verifychain"] = [this](const auto &p) {
    return HandleVerifyChain(p);
  };
  handlers_["reset"] = [this](const auto &p) { return HandleReset(p); };

  // Control commands
  handlers_["stop"] = [this](const auto &p) { return HandleStop(p); };
}

bool RPCServer::Start() {
  if (running_) {
    return true;
  }

  // Remove old socket file if it exists
  unlink(socket_path_.c_str());

  struct sockaddr_un addr;
  if (socket_path_.size() >= sizeof(addr.sun_path)) {
    LOG_RPC_ERROR("RPC socket path too long: {}", socket_path_);
    return false;
  }

  // Owner-only socket file
  mode_t old_umask = umask(0077);

  server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
  if (server_fd_ < 0) {
    umask(old_umask);
    LOG_RPC_ERROR("Failed to create RPC socket");
    return false;
  }

  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  if (bind(server_fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
    LOG_RPC_ERROR("Failed to bind RPC socket to {}", socket_path_);
    close(server_fd_);
    server_fd_ = -1;
    umask(old_umask);
    return false;
  }

  umask(old_umask);
  chmod(socket_path_.c_str(), 0600);

  if (listen(server_fd_, 5) < 0) {
    LOG_RPC_ERROR("Failed to listen on RPC socket");
    close(server_fd_);
    server_fd_ = -1;
    return false;
  }

  running_ = true;
  server_thread_ = std::thread(&RPCServer::ServerThread, this);

  LOG_RPC_INFO("RPC server started on {}", socket_path_);
  return true;
}

void RPCServer::Stop() {
  if (!running_) {
    return;
  }

  shutting_down_.store(true, std::memory_order_release);
  running_ = false;

  if (server_fd_ >= 0) {
    // Wakes the accept() in ServerThread
    shutdown(server_fd_, SHUT_RDWR);
    close(server_fd_);
    server_fd_ = -1;
  }

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  unlink(socket_path_.c_str());

  LOG_RPC_INFO("RPC server stopped");
}

void RPCServer::ServerThread() {
  while (running_) {
    struct sockaddr_un client_addr;
    socklen_t client_len = sizeof(client_addr);

    int client_fd =
        accept(server_fd_, (struct sockaddr *)&client_addr, &client_len);
    if (client_fd < 0) {
      if (running_) {
        LOG_RPC_WARN("failed to accept RPC connection");
      }
      continue;
    }

    HandleClient(client_fd);
    close(client_fd);
  }
}

void RPCServer::HandleClient(int client_fd) {
  if (shutting_down_.load(std::memory_order_acquire)) {
    SendAll(client_fd, util::JsonError("Server shutting down"));
    return;
  }

  // Read until the request's terminating newline or EOF
  std::string request;
  char buffer[4096];
  while (request.find('\n') == std::string::npos) {
    ssize_t received = recv(client_fd, buffer, sizeof(buffer), 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received <= 0) {
      break;
    }
    request.append(buffer, static_cast<size_t>(received));
    if (request.size() > MAX_REQUEST_SIZE) {
      LOG_RPC_ERROR("RPC request too large: {} bytes", request.size());
      SendAll(client_fd, util::JsonError("Request too large"));
      return;
    }
  }

  if (request.empty()) {
    return;
  }

  std::string method;
  std::vector<std::string> params;

  try {
    nlohmann::json j = nlohmann::json::parse(request);

    if (!j.contains("method") || !j["method"].is_string()) {
      SendAll(client_fd, util::JsonError("Missing or invalid method field"));
      return;
    }

    method = j["method"].get<std::string>();

    // Extract params (optional)
    if (j.contains("params")) {
      if (j["params"].is_array()) {
        for (const auto &param : j["params"]) {
          if (param.is_string()) {
            params.push_back(param.get<std::string>());
          } else {
            // Convert non-string params to string
            params.push_back(param.dump());
          }
        }
      } else if (j["params"].is_string()) {
        params.push_back(j["params"].get<std::string>());
      }
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_RPC_WARN("RPC JSON parse error: {}", e.what());
    SendAll(client_fd, util::JsonError("Invalid JSON"));
    return;
  }

  LOG_RPC_DEBUG("RPC request: {} ({} params)", method, params.size());
  SendAll(client_fd, ExecuteCommand(method, params));
}

std::string RPCServer::ExecuteCommand(const std::string &method,
                                      const std::vector<std::string> &params) {
  auto it = handlers_.find(method);
  if (it == handlers_.end()) {
    return util::JsonError("Unknown command");
  }

  try {
    return it->second(params);
  } catch (const std::exception &e) {
    LOG_RPC_ERROR("RPC command '{}' failed: {}", method, e.what());
    return util::JsonError(e.what());
  }
}

std::string
RPCServer::HandleAddTransaction(const std::vector<std::string> &params) {
  if (params.size() < 3) {
    return util::JsonError("Usage: addtransaction <sender> <recipient> <amount>");
  }

  auto amount = util::SafeParseAmount(params[2]);
  if (!amount) {
    return util::JsonError("Invalid amount");
  }

  chain::TransactionRecord record =
      ledger_.AddTransaction(params[0], params[1], *amount);
  return ToResponse(record.ToJson());
}

std::string RPCServer::HandleGetPendingTransactions(
    const std::vector<std::string> & /*params*/) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto &record : ledger_.GetPendingTransactions()) {
    array.push_back(record.ToJson());
  }
  return ToResponse(array);
}

std::string RPCServer::HandleMine(const std::vector<std::string> & /*params*/) {
  chain::Block block = ledger_.Mine();
  return ToResponse(block.ToJson());
}

std::string RPCServer::HandleGenerate(const std::vector<std::string> &params) {
  if (params.empty()) {
    return util::JsonError("Missing number of blocks parameter");
  }

  auto num_blocks = util::SafeParseInt(params[0], 1, MAX_GENERATE_BLOCKS);
  if (!num_blocks) {
    return util::JsonError("Invalid number of blocks (must be 1-1000)");
  }

  nlohmann::json heights = nlohmann::json::array();
  for (int i = 0; i < *num_blocks; ++i) {
    heights.push_back(ledger_.Mine().height);
  }
  return ToResponse(heights);
}

std::string
RPCServer::HandleGetMiningInfo(const std::vector<std::string> & /*params*/) {
  chain::MiningInfo info = ledger_.GetMiningInfo();

  nlohmann::json j;
  j["chain"] = params_.GetChainTypeString();
  j["blocks"] = info.blocks;
  j["next_block_reward"] = chain::RewardToJson(info.next_reward);
  j["next_difficulty_bits"] = info.next_difficulty_bits;
  j["next_difficulty"] = info.next_difficulty;
  j["elapsed_time"] = info.last_elapsed_time;
  j["hash_power"] = info.last_hash_power;
  j["pending_transactions"] = info.pending_transactions;
  return ToResponse(j);
}

std::string RPCServer::HandleGetBlock(const std::vector<std::string> &params) {
  if (params.empty()) {
    return util::JsonError("Missing height parameter");
  }

  // Any integer parses; heights outside the chain are simply not found
  auto height = util::SafeParseInt64(params[0],
                                     std::numeric_limits<int64_t>::min(),
                                     std::numeric_limits<int64_t>::max());
  if (!height) {
    return util::JsonError("Invalid height");
  }

  auto block = store_.FindByHeight(*height);
  if (!block) {
    return util::JsonError("Block not found");
  }
  return ToResponse(block->ToJson());
}

std::string
RPCServer::HandleGetBlockCount(const std::vector<std::string> & /*params*/) {
  return std::to_string(store_.Count()) + "\n";
}

std::string
RPCServer::HandleGetGenesisBlock(const std::vector<std::string> & /*params*/) {
  auto block = store_.FindByHeight(1);
  if (!block) {
    return util::JsonError("Block not found");
  }
  return ToResponse(block->ToJson());
}

std::string
RPCServer::HandleGetLastBlocks(const std::vector<std::string> &params) {
  if (params.empty()) {
    return util::JsonError("Missing count parameter");
  }

  auto count = util::SafeParseInt(params[0], 0, MAX_LIST_BLOCKS);
  if (!count) {
    return util::JsonError("Invalid count");
  }
  return ToResponse(BlocksToJson(store_.FindLastN(static_cast<size_t>(*count))));
}

std::string
RPCServer::HandleGetTopBlocks(const std::vector<std::string> &params) {
  if (params.size() < 2) {
    return util::JsonError("Usage: gettopblocks <field> <count>");
  }

  auto count = util::SafeParseInt(params[1], 0, MAX_LIST_BLOCKS);
  if (!count) {
    return util::JsonError("Invalid count");
  }
  return ToResponse(
      BlocksToJson(store_.FindTopN(params[0], static_cast<size_t>(*count))));
}

std::string
RPCServer::HandleVerifyChain(const std::vector<std::string> & /*params*/) {
  std::optional<int64_t> bad_height = ledger_.VerifyChain();

  nlohmann::json j;
  j["valid"] = !bad_height.has_value();
  j["height"] = bad_height ? *bad_height : store_.Count();
  return ToResponse(j);
}

std::string RPCServer::HandleReset(const std::vector<std::string> & /*params*/) {
  LOG_RPC_INFO("Chain reset requested via RPC");
  chain::Block genesis = ledger_.Reset();
  return ToResponse(genesis.ToJson());
}

std::string RPCServer::HandleStop(const std::vector<std::string> & /*params*/) {
  LOG_RPC_INFO("Received stop command via RPC");

  shutting_down_.store(true, std::memory_order_release);

  if (shutdown_callback_) {
    shutdown_callback_();
  }

  return "\"BlockLedger stopping\"\n";
}

} // namespace rpc
} // namespace blockledger
