/**
 * CtlSvr - 凭证控制服务
 * 提供 Auth.Generate / Auth.Fetch / Auth.Reset 与 Server.MemStats / Server.SysInfo
 * JSON-RPC 接口（POST /rpc）。
 */

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <keyward/log_helper.h>

#include "config/config.h"
#include "handler/auth_handler.h"
#include "handler/server_handler.h"
#include "http/http_listener.h"
#include "rpc/rpc_dispatcher.h"
#include "service/credential_generator.h"
#include "service/credential_registry.h"
#include "service/node_stats.h"
#include "store/credential_store.h"

namespace {
constexpr const char *kCtlSvrVersion = "0.1.0";
} // namespace

int main(int argc, char *argv[]) {
  std::string config_file;
  if (argc > 1) {
    config_file = argv[1];
  } else {
    const char *env_config = std::getenv("CTLSVR_CONFIG");
    config_file = env_config ? env_config : "ctlsvr.conf";
  }

  keyward::ctl::CtlConfig config = keyward::ctl::LoadConfig(config_file);
  std::string invalid = keyward::ctl::ValidateConfig(config);
  if (!invalid.empty()) {
    std::cerr << "Invalid config (" << config_file << "): " << invalid << std::endl;
    return 1;
  }

  if (!keyward::log::InitForService("ctlsvr", config.log_dir, config.log_level)) {
    std::cerr << "Failed to initialize logger!" << std::endl;
    return 1;
  }

  LogInfo("========================================");
  LogInfo("CtlSvr " << kCtlSvrVersion << " starting...");
  LogInfo("========================================");
  LogInfo(TAG("service", "ctlsvr"), "Using config file: " << config_file);
  LogInfo(TAG("service", "ctlsvr"),
          "Config: host=" << config.host << " port=" << config.port
                          << " workers=" << config.worker_threads
                          << " store=" << config.store_type
                          << " path=" << config.rocksdb_path);

  // 存储
  std::shared_ptr<keyward::ctl::CredentialStore> store;
  if (config.store_type == "rocksdb") {
    try {
      store = std::make_shared<keyward::ctl::RocksDBCredentialStore>(config.rocksdb_path);
      LogInfo(TAG("service", "ctlsvr"), "RocksDB opened: " << config.rocksdb_path);
    } catch (const std::exception &e) {
      LogError(TAG("service", "ctlsvr"), "Failed to open RocksDB: " << e.what());
      keyward::log::Shutdown();
      return 1;
    }
  } else {
    store = std::make_shared<keyward::ctl::MemoryCredentialStore>();
    LogWarning(TAG("service", "ctlsvr"), "Using in-memory store, credentials are lost on exit");
  }

  // 业务层与 Handler
  auto registry = std::make_shared<keyward::ctl::CredentialRegistry>(
      store, std::make_shared<keyward::ctl::RandomCredentialGenerator>());
  auto auth_handler = std::make_shared<keyward::ctl::AuthHandler>(registry);
  auto server_handler = std::make_shared<keyward::ctl::ServerHandler>(
      std::make_shared<keyward::ctl::NodeStats>(kCtlSvrVersion));
  auto dispatcher = std::make_shared<keyward::ctl::RpcDispatcher>(auth_handler, server_handler);

  // HTTP 服务
  boost::asio::io_context ioc{config.worker_threads};
  std::shared_ptr<keyward::ctl::HttpListener> listener;
  try {
    listener = std::make_shared<keyward::ctl::HttpListener>(
        ioc, config.host, config.port, dispatcher, config.request_timeout_sec);
  } catch (const std::exception &e) {
    LogError(TAG("service", "ctlsvr"), "Failed to start HTTP server: " << e.what());
    keyward::log::Shutdown();
    return 1;
  }
  listener->Run();

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&ioc, listener](const boost::system::error_code &ec, int signo) {
    if (ec)
      return;
    LogInfo(TAG("service", "ctlsvr").Add("signal", std::to_string(signo)),
            "Received signal, shutting down...");
    listener->Stop();
    ioc.stop();
  });

  LogInfo(TAG("service", "ctlsvr"),
          "CtlSvr listening on " << config.host << ":" << config.port
                                 << " with " << store->Count() << " credential(s)"
                                 << " (press Ctrl+C to stop)");

  std::vector<std::thread> workers;
  workers.reserve(config.worker_threads);
  for (int i = 0; i < config.worker_threads; ++i)
    workers.emplace_back([&ioc]() {
      // run() 因 handler 抛异常返回时继续运行，stop() 后正常返回
      for (;;) {
        try {
          ioc.run();
          break;
        } catch (const std::exception &e) {
          LogError(TAG("service", "ctlsvr"), "io worker caught exception: " << e.what());
        }
      }
    });
  for (auto &t : workers)
    t.join();

  LogInfo(TAG("service", "ctlsvr"), "CtlSvr shut down.");
  keyward::log::Shutdown();
  return 0;
}
