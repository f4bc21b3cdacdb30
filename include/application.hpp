// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block_store.hpp"
#include "chain/chainparams.hpp"
#include "chain/ledger.hpp"
#include "network/rpc_server.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace blockledger {
namespace app {

// Application configuration
struct AppConfig {
  // Data directory
  std::filesystem::path datadir;

  // Chain preset (main, regtest)
  chain::ChainType chain_type = chain::ChainType::MAIN;

  // Keep blocks in <datadir>/blocks.json (false = in-memory only)
  bool persist = true;

  // Consensus overrides (unset = preset value)
  std::optional<uint64_t> max_nonce;
  std::optional<int64_t> halving_interval;
  std::optional<int64_t> difficulty_interval;

  // Logging
  bool verbose = false;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  chain::Ledger &ledger() { return *ledger_; }
  chain::BlockStore &block_store() { return *block_store_; }
  const chain::ChainParams &chain_params() const { return *chain_params_; }

  // Status
  bool is_running() const { return running_; }

  // Shutdown request (RPC stop command); also stops a running nonce search
  void request_shutdown();

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Components (initialized in order, destroyed in reverse)
  std::unique_ptr<util::DataDirLock> datadir_lock_;
  std::unique_ptr<chain::ChainParams> chain_params_;
  std::unique_ptr<chain::BlockStore> block_store_;
  std::unique_ptr<chain::Ledger> ledger_;
  std::unique_ptr<rpc::RPCServer> rpc_server_;

  // Initialization steps
  bool init_datadir();
  bool init_chain();
  bool init_rpc();

  // Shutdown
  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace blockledger
