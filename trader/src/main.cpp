#include "builder_signer.hpp"
#include "cancel_token.hpp"
#include "chain_reader.hpp"
#include "contracts.hpp"
#include "http_client.hpp"
#include "kalshi_client.hpp"
#include "order_signer.hpp"
#include "order_submitter.hpp"
#include "polymarket_client.hpp"
#include "proxy_wallet_manager.hpp"
#include "relay_client.hpp"
#include "trade_config.hpp"
#include "trade_errors.hpp"
#include "trade_log.hpp"
#include "trade_orchestrator.hpp"
#include "wallet_signer.hpp"
#include "wallet_state_db.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// ---- Ctrl+C: cancels the running command, or quits when idle ----
static std::atomic<bool> g_sigint{false};
static void on_sigint(int) { g_sigint.store(true); }

static std::mutex g_cancel_mtx;
static std::shared_ptr<CancelToken> g_current;
static std::atomic<bool> g_quit{false};

// Installs a fresh token for one command and removes it afterwards
class CommandScope {
public:
    CommandScope() : token_(std::make_shared<CancelToken>()) {
        std::lock_guard<std::mutex> lk(g_cancel_mtx);
        g_current = token_;
    }
    ~CommandScope() {
        std::lock_guard<std::mutex> lk(g_cancel_mtx);
        g_current.reset();
    }
    const CancelToken* token() const { return token_.get(); }

private:
    std::shared_ptr<CancelToken> token_;
};

static void print_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

static nlohmann::json error_json(const TradeError& e) {
    return {{"success", false}, {"error", {{"code", e.code()}, {"message", e.what()}}}};
}

static std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream is(line);
    std::string w;
    while (is >> w) out.push_back(w);
    return out;
}

static bool parse_double(const std::string& s, double& out) {
    try {
        size_t pos = 0;
        out = std::stod(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

static void print_help() {
    std::cout << "\nCommands:\n"
              << "  status\n"
              << "  deploy\n"
              << "  approve std|neg\n"
              << "  balance\n"
              << "  buy|sell poly   <tokenId> <price> <amount> [neg] [fok]\n"
              << "  buy|sell kalshi <ticker> yes|no <price> <amount> [fok]\n"
              << "  quit\n\n";
}

struct TraderContext {
    TradeConfig cfg;
    CurlHttpClient http;
    std::unique_ptr<IBuilderHeaderSigner> builder;
    std::unique_ptr<LocalWalletSigner> wallet;
    std::unique_ptr<RelayClient> relay;
    std::unique_ptr<RpcChainReader> chain;
    std::unique_ptr<WalletStateDB> journal;
    std::unique_ptr<ProxyWalletManager> wallets;
    std::unique_ptr<KalshiClient> kalshi;
    std::unique_ptr<PolymarketClient> polymarket;
    std::unique_ptr<OrderTypedDataSigner> order_signer;
    std::unique_ptr<OrderSubmitter> submitter;
    std::unique_ptr<TradeOrchestrator> orchestrator;
};

static void build_context(TraderContext& c) {
    try {
        c.builder = make_builder_signer(c.cfg, c.http);
    } catch (const ConfigurationError& e) {
        log_warn("TRADER", std::string("Polymarket relay/attribution disabled: ") + e.what());
    }

    if (!c.cfg.wallet_private_key.empty()) {
        try {
            c.wallet = std::make_unique<LocalWalletSigner>(c.cfg.wallet_private_key);
            log_info("TRADER", "owner wallet " + c.wallet->address());
        } catch (const ConfigurationError& e) {
            log_error("TRADER", e.what());
        }
    } else {
        log_warn("TRADER", "POLY_PRIVATE_KEY not set, Polymarket trading disabled");
    }

    c.chain = std::make_unique<RpcChainReader>(c.http, c.cfg.polygon_rpc_url, kUsdcAddress, c.cfg.http_timeout_ms);

    if (c.builder) {
        c.relay = std::make_unique<RelayClient>(c.http, *c.builder, c.cfg.relayer_url, c.cfg.http_timeout_ms);

        c.journal = std::make_unique<WalletStateDB>(c.cfg.journal_path);
        std::vector<ProxyWalletRecord> rows = c.journal->load_latest();
        if (!c.journal->start()) {
            log_warn("TRADER", "wallet journal unavailable at " + c.cfg.journal_path);
            c.journal.reset();
        }

        c.wallets = std::make_unique<ProxyWalletManager>(*c.relay, *c.chain, c.cfg, c.journal.get());
        c.wallets->restore(rows);
    }

    try {
        c.kalshi = std::make_unique<KalshiClient>(c.http, c.cfg);
    } catch (const ConfigurationError& e) {
        log_error("TRADER", std::string("Kalshi disabled: ") + e.what());
    }

    c.polymarket = std::make_unique<PolymarketClient>(c.http, c.builder.get(), c.cfg);
    if (c.wallet) {
        c.order_signer = std::make_unique<OrderTypedDataSigner>(*c.wallet, c.cfg.chain_id);
    }

    c.submitter = std::make_unique<OrderSubmitter>(c.kalshi.get(), c.polymarket.get(), c.order_signer.get());
    c.orchestrator = std::make_unique<TradeOrchestrator>(*c.submitter, c.kalshi.get(),
                                                         c.wallets.get(), c.wallet.get());
}

static void require_wallet_ops(const TraderContext& c) {
    if (!c.wallet) throw ConfigurationError("POLY_PRIVATE_KEY not configured");
    if (!c.wallets) throw ConfigurationError("builder credentials or signing server not configured");
}

static nlohmann::json cmd_balance(TraderContext& c) {
    nlohmann::json out;
    out["success"] = true;

    if (c.wallet && c.wallets) {
        try {
            out["polymarket"] = c.wallets->usdc_balance(c.wallet->address());
        } catch (const TradeError& e) {
            out["polymarket"] = error_json(e)["error"];
        }
    }
    if (c.kalshi && c.kalshi->configured()) {
        try {
            out["kalshi"] = c.kalshi->get_balance();
        } catch (const TradeError& e) {
            out["kalshi"] = error_json(e)["error"];
        }
    }
    return out;
}

// buy|sell poly <tokenId> <price> <amount> [neg] [fok]
// buy|sell kalshi <ticker> yes|no <price> <amount> [fok]
static bool parse_trade(const std::vector<std::string>& w, TradeRequest& req, std::string& err) {
    req.side = (w[0] == "sell") ? TradeSide::Sell : TradeSide::Buy;

    if (w.size() >= 5 && w[1] == "poly") {
        req.market.venue = Venue::Polymarket;
        req.outcome.token_id = w[2];
        if (!parse_double(w[3], req.outcome.price) || !parse_double(w[4], req.amount)) {
            err = "price and amount must be numbers";
            return false;
        }
        for (size_t i = 5; i < w.size(); ++i) {
            if (w[i] == "neg") req.market.neg_risk = true;
            else if (w[i] == "fok") req.lifetime = OrderLifetime::FillOrKill;
            else { err = "unknown flag '" + w[i] + "'"; return false; }
        }
        return true;
    }

    if (w.size() >= 6 && w[1] == "kalshi") {
        req.market.venue = Venue::Kalshi;
        req.market.id = w[2];
        req.outcome.name = w[3];
        if (w[3] != "yes" && w[3] != "no") {
            err = "side must be yes or no";
            return false;
        }
        if (!parse_double(w[4], req.outcome.price) || !parse_double(w[5], req.amount)) {
            err = "price and amount must be numbers";
            return false;
        }
        for (size_t i = 6; i < w.size(); ++i) {
            if (w[i] == "fok") req.lifetime = OrderLifetime::FillOrKill;
            else { err = "unknown flag '" + w[i] + "'"; return false; }
        }
        return true;
    }

    err = "usage: buy|sell poly <tokenId> <price> <amount> [neg] [fok] | buy|sell kalshi <ticker> yes|no <price> <amount> [fok]";
    return false;
}

static nlohmann::json run_command(TraderContext& c, const std::vector<std::string>& w,
                                  const CancelToken* cancel) {
    const std::string& cmd = w[0];

    if (cmd == "status") {
        require_wallet_ops(c);
        return wallet_record_json(c.wallets->check_status(c.wallet->address()));
    }
    if (cmd == "deploy") {
        require_wallet_ops(c);
        return wallet_record_json(c.wallets->deploy(*c.wallet, cancel));
    }
    if (cmd == "approve") {
        require_wallet_ops(c);
        if (w.size() < 2 || (w[1] != "std" && w[1] != "neg")) {
            throw InvalidOrderError("usage: approve std|neg");
        }
        const ApprovalTarget t = (w[1] == "neg") ? ApprovalTarget::NegRisk : ApprovalTarget::Standard;
        return wallet_record_json(c.wallets->approve(*c.wallet, t, cancel));
    }
    if (cmd == "balance") {
        return cmd_balance(c);
    }
    if (cmd == "buy" || cmd == "sell") {
        TradeRequest req;
        std::string err;
        if (!parse_trade(w, req, err)) throw InvalidOrderError(err);
        return c.orchestrator->execute_trade(req, cancel).to_json();
    }

    return {{"success", false}, {"error", {{"code", "UNKNOWN_COMMAND"}, {"message", "unknown command '" + cmd + "'"}}}};
}

int main(int argc, char** argv) {
    const std::string config_path = (argc > 1) ? argv[1] : "config.json";

    TraderContext ctx;
    try {
        ctx.cfg = TradeConfig::load(config_path);
    } catch (const TradeError& e) {
        std::cerr << "[trader] config error: " << e.what() << "\n";
        return 1;
    }
    set_log_level(parse_log_level(ctx.cfg.log_level));
    build_context(ctx);

    std::signal(SIGINT, on_sigint);

    std::atomic<bool> running{true};
    std::thread watcher([&]() {
        while (running.load()) {
            if (g_sigint.exchange(false)) {
                std::lock_guard<std::mutex> lk(g_cancel_mtx);
                if (g_current) {
                    log_warn("TRADER", "cancelling current command");
                    g_current->cancel();
                } else {
                    g_quit.store(true);
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    print_help();

    std::string line;
    while (!g_quit.load() && std::getline(std::cin, line)) {
        const std::vector<std::string> words = split_words(line);
        if (words.empty()) continue;
        if (words[0] == "quit") break;
        if (words[0] == "help") { print_help(); continue; }

        CommandScope scope;
        try {
            print_json(run_command(ctx, words, scope.token()));
        } catch (const TradeError& e) {
            print_json(error_json(e));
        }
    }

    running.store(false);
    watcher.join();
    if (ctx.journal) ctx.journal->stop();
    return 0;
}
