// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <thread>
#include <unistd.h> // For write(), STDOUT_FILENO (async-signal-safe)

namespace blockledger {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

void Application::request_shutdown() {
  shutdown_requested_ = true;
  if (ledger_) {
    ledger_->Interrupt();
  }
}

bool Application::initialize() {
  const std::string chain_name =
      config_.chain_type == chain::ChainType::REGTEST ? "REGTEST" : "MAIN";

  // Print startup banner (use std::cout for immediate visibility before logger
  // fully initialized)
  std::cout << GetStartupBanner(chain_name) << std::flush;

  LOG_INFO("Initializing BlockLedger...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_chain()) {
    LOG_ERROR("Failed to initialize blockchain");
    return false;
  }

  if (!init_rpc()) {
    LOG_ERROR("Failed to initialize RPC server");
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting BlockLedger...");

  setup_signal_handlers();

  if (!rpc_server_->Start()) {
    LOG_ERROR("Failed to start RPC server");
    return false;
  }

  running_ = true;

  LOG_INFO("BlockLedger started successfully");
  LOG_INFO("Data directory: {}", config_.datadir.string());
  LOG_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down BlockLedger...");

  running_ = false;

  // A mine request may be holding the RPC thread
  if (ledger_) {
    LOG_INFO("Interrupting nonce search...");
    ledger_->Interrupt();
  }

  if (rpc_server_) {
    LOG_INFO("Stopping RPC server...");
    rpc_server_->Stop();
  }

  // Every change is already on disk; only the lock remains
  if (datadir_lock_) {
    LOG_INFO("Releasing data directory lock...");
    datadir_lock_->Release();
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // Lock the data directory to prevent multiple instances
  datadir_lock_ = std::make_unique<util::DataDirLock>(config_.datadir);
  util::LockResult lock_result = datadir_lock_->TryAcquire();

  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }

  if (lock_result == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "BlockLedger is probably already running.",
              config_.datadir.string());
    return false;
  }

  LOG_DEBUG("Successfully locked data directory");
  return true;
}

bool Application::init_chain() {
  LOG_INFO("Initializing blockchain...");

  chain_params_ = chain::ChainParams::Create(config_.chain_type);
  LOG_INFO("Using {} parameters", chain_params_->GetChainTypeString());

  // Apply command-line overrides to chain params if provided
  try {
    if (config_.max_nonce) {
      LOG_INFO("Overriding max nonce: {} (default was {})", *config_.max_nonce,
               chain_params_->GetConsensus().nMaxNonce);
      chain_params_->SetMaxNonce(*config_.max_nonce);
    }
    if (config_.halving_interval) {
      LOG_INFO("Overriding reward halving interval: {} (default was {})",
               *config_.halving_interval,
               chain_params_->GetConsensus().nRewardHalvingInterval);
      chain_params_->SetRewardHalvingInterval(*config_.halving_interval);
    }
    if (config_.difficulty_interval) {
      LOG_INFO("Overriding difficulty interval: {} (default was {})",
               *config_.difficulty_interval,
               chain_params_->GetConsensus().nDifficultyBitsInterval);
      chain_params_->SetDifficultyInterval(*config_.difficulty_interval);
    }
  } catch (const std::invalid_argument &e) {
    LOG_ERROR("Invalid chain parameter override: {}", e.what());
    return false;
  }

  try {
    if (config_.persist) {
      block_store_ = std::make_unique<chain::JsonFileBlockStore>(
          config_.datadir / "blocks.json");
    } else {
      LOG_INFO("Persistence disabled, blocks are kept in memory");
      block_store_ = std::make_unique<chain::MemoryBlockStore>();
    }

    ledger_ = std::make_unique<chain::Ledger>(*block_store_, *chain_params_);

    if (block_store_->Count() == 0) {
      LOG_INFO("No existing blocks found, initializing with genesis block");
      ledger_->Reset();
    } else {
      LOG_INFO("Loaded blocks from disk");
    }
  } catch (const chain::BlockStoreError &e) {
    LOG_ERROR("Block store unavailable: {}", e.what());
    return false;
  }

  LOG_INFO("Blockchain initialized at height: {}", block_store_->Count());
  return true;
}

bool Application::init_rpc() {
  LOG_INFO("Initializing RPC server...");

  std::string socket_path = (config_.datadir / "node.sock").string();

  auto shutdown_callback = [this]() { this->request_shutdown(); };

  rpc_server_ = std::make_unique<rpc::RPCServer>(
      socket_path, *ledger_, *block_store_, *chain_params_, shutdown_callback);

  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;

    // Lock-free atomic stores only
    instance_->shutdown_requested_ = true;
    if (instance_->ledger_) {
      instance_->ledger_->Interrupt();
    }
  }
}

} // namespace app
} // namespace blockledger
