#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/PollScheduler.hpp"
#include "core/ReconciliationEngine.hpp"
#include "http/BeastHttpClient.hpp"
#include "ip/HttpIpResolver.hpp"
#include "providers/CloudflareProvider.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <openssl/crypto.h>

// Usage: ddns-sync [config.json]

int main(int argc, char** argv) {
  const std::string sConfigPath = argc > 1 ? argv[1] : "config.json";

  // ── Step 1: Load and validate configuration ────────────────────────────
  ddns::common::Config cfgApp;
  try {
    cfgApp = ddns::common::Config::load(sConfigPath);
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] Failed to load config: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }

  try {
    ddns::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = ddns::common::Logger::get();
    spLog->info("Step 1: Configuration loaded from {} ({} zone(s))", sConfigPath,
                cfgApp.vZones.size());

    // ── Step 2: HTTP transport ───────────────────────────────────────────
    auto upHttp = std::make_unique<ddns::http::BeastHttpClient>(
        std::chrono::seconds(cfgApp.iRequestTimeoutSeconds));

    // ── Step 3: Provider client ──────────────────────────────────────────
    auto upProvider = std::make_unique<ddns::providers::CloudflareProvider>(
        *upHttp, cfgApp.sApiBaseUrl, cfgApp.sApiToken);

    // Zero API token from Config after handoff
    OPENSSL_cleanse(cfgApp.sApiToken.data(), cfgApp.sApiToken.size());
    cfgApp.sApiToken.clear();

    spLog->info("Step 3: {} provider ready ({})", upProvider->name(), cfgApp.sApiBaseUrl);

    // ── Step 4: IP resolver and reconciliation engine ────────────────────
    auto upResolver =
        std::make_unique<ddns::ip::HttpIpResolver>(*upHttp, cfgApp.ipLookupUrl());
    auto upEngine = std::make_unique<ddns::core::ReconciliationEngine>(
        cfgApp.vZones, *upProvider, *upResolver);
    spLog->info("Step 4: Reconciliation engine ready (ip provider {})", cfgApp.ipLookupUrl());

    // ── Step 5: Poll scheduler ───────────────────────────────────────────
    auto upScheduler = std::make_unique<ddns::core::PollScheduler>(
        std::chrono::seconds(cfgApp.iPollIntervalSeconds),
        [&upEngine]() { upEngine->runCycle(); });

    // Signals are registered before the first cycle so an early SIGTERM
    // still takes the graceful path.
    boost::asio::io_context iocSignals;
    boost::asio::signal_set ssSignals(iocSignals, SIGINT, SIGTERM);

    upScheduler->start();
    spLog->info("Step 5: Polling every {}",
                ddns::core::formatInterval(std::chrono::seconds(cfgApp.iPollIntervalSeconds)));

    // ── Step 6: Block until SIGINT/SIGTERM ───────────────────────────────
    ssSignals.async_wait([&spLog](const boost::system::error_code& ec, int iSignal) {
      if (!ec) {
        spLog->info("Received signal {}, shutting down", iSignal);
      }
    });
    iocSignals.run();

    // Graceful shutdown
    upScheduler->stop();
    spLog->info("PollScheduler stopped");

    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
