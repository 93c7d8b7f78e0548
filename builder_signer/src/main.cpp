#include "builder_signer.hpp"
#include "sign_server.hpp"
#include "trade_config.hpp"
#include "trade_errors.hpp"
#include "trade_log.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

static std::atomic<bool> g_running{true};
static void on_sigint(int) { g_running.store(false); }

int main(int argc, char** argv) {
    const std::string config_path = (argc > 1) ? argv[1] : "config.json";

    TradeConfig cfg;
    try {
        cfg = TradeConfig::load(config_path);
    } catch (const TradeError& e) {
        std::cerr << "[builder_signer] config error: " << e.what() << "\n";
        return 1;
    }
    set_log_level(parse_log_level(cfg.log_level));

    std::unique_ptr<LocalBuilderSigner> signer;
    if (cfg.builder.present()) {
        try {
            signer = std::make_unique<LocalBuilderSigner>(cfg.builder);
        } catch (const ConfigurationError& e) {
            log_error("SIGNER", e.what());
        }
    } else {
        log_warn("SIGNER", "POLY_BUILDER_API_KEY / _SECRET / _PASSPHRASE not set");
    }

    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);

    try {
        SignServer server(static_cast<std::uint16_t>(cfg.signer_port), signer.get(), g_running);
        server.run();
    } catch (const std::exception& e) {
        log_error("SIGNER", e.what());
        return 1;
    }
    return 0;
}
