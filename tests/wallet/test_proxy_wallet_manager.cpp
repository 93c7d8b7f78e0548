#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "chain_reader.hpp"
#include "contracts.hpp"
#include "proxy_wallet_manager.hpp"
#include "safe_transactions.hpp"
#include "trade_errors.hpp"
#include "common/fake_chain_reader.hpp"
#include "common/fake_http_client.hpp"
#include "common/test_check.hpp"
#include "common/test_keys.hpp"

static const char* kProxy = "0x2222222222222222222222222222222222222222";

// -----------------------------------------------------------------------------
// Relay + chain fakes wired to a manager
// -----------------------------------------------------------------------------
struct Fixture {
    TradeConfig cfg;
    FakeHttpClient http;
    std::unique_ptr<LocalBuilderSigner> builder;
    std::unique_ptr<RelayClient> relay;
    FakeChainReader chain;
    std::unique_ptr<ProxyWalletManager> mgr;
    LocalWalletSigner owner{cow_private_key()};

    std::atomic<bool> deployed{false};
    std::atomic<int> submits{0};
    std::string tx_state = "STATE_MINED";   // state served by GET /transaction/...
    bool tx_has_proxy = true;
    nlohmann::json last_submit;

    Fixture() {
        cfg.poll.deploy_max_attempts = 3;
        cfg.poll.approve_max_attempts = 3;
        cfg.poll.interval_ms = 0;

        BuilderCredentials bc;
        bc.key = "k";
        bc.secret = kBuilderSecretB64;
        bc.passphrase = "p";
        builder = std::make_unique<LocalBuilderSigner>(bc);
        relay = std::make_unique<RelayClient>(http, *builder, "http://relay.local");
        mgr = std::make_unique<ProxyWalletManager>(*relay, chain, cfg);

        http.on("GET", "/deployed", [this](const HttpRequest&) {
            if (deployed) return FakeHttpClient::json(200, {{"deployed", true}, {"proxyAddress", kProxy}});
            return FakeHttpClient::json(200, {{"deployed", false}});
        });
        http.on("GET", "/nonce", [](const HttpRequest&) {
            return FakeHttpClient::json(200, {{"nonce", "3"}, {"address", kProxy}});
        });
        http.on("POST", "/submit", [this](const HttpRequest& req) {
            last_submit = nlohmann::json::parse(req.body);
            ++submits;
            return FakeHttpClient::json(200, {{"transactionID", "tx-" + std::to_string(submits.load())}});
        });
        for (const char* id : {"/transaction/tx-1", "/transaction/tx-2", "/transaction/tx-3"}) {
            http.on("GET", id, [this](const HttpRequest&) {
                nlohmann::json tx = {{"state", tx_state}, {"transactionHash", "0xhash"}};
                if (tx_state == "STATE_MINED") {
                    deployed = true;
                    if (tx_has_proxy) tx["proxyAddress"] = kProxy;
                }
                if (tx_state == "STATE_FAILED") tx["errorMsg"] = "execution reverted";
                return FakeHttpClient::json(200, tx);
            });
        }
    }

    std::string owner_addr() const { return owner.address(); }
};

// -----------------------------------------------------------------------------
// Test: status check
// -----------------------------------------------------------------------------
void test_check_status() {
    std::cout << "[TEST] check_status\n";

    Fixture f;
    TEST_CHECK(!f.mgr->record(f.owner_addr()).has_value());

    ProxyWalletRecord r = f.mgr->check_status(f.owner_addr());
    TEST_CHECK(r.state == WalletState::NotDeployed);
    TEST_CHECK(r.proxy_address.empty());

    f.deployed = true;
    r = f.mgr->check_status(f.owner_addr());
    TEST_CHECK(r.state == WalletState::Deployed);
    TEST_CHECK(r.proxy_address == kProxy);
    TEST_CHECK(f.mgr->record(f.owner_addr())->state == WalletState::Deployed);

    // record keys are case-insensitive
    TEST_CHECK(f.mgr->record(wallet_key(f.owner_addr()))->proxy_address == kProxy);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: relay outage during status check leaves Unknown with the error
// -----------------------------------------------------------------------------
void test_check_status_unavailable() {
    std::cout << "[TEST] check_status relay unavailable\n";

    Fixture f;
    f.http.on("GET", "/deployed", [](const HttpRequest&) {
        return FakeHttpClient::html(403, "<html>challenge</html>");
    });

    TEST_THROWS(f.mgr->check_status(f.owner_addr()), RelayUnavailableError);

    const auto r = f.mgr->record(f.owner_addr());
    TEST_CHECK(r.has_value());
    TEST_CHECK(r->state == WalletState::Unknown);
    TEST_CHECK(r->last_error.has_value());
    TEST_CHECK(r->last_error->kind == ErrorKind::RelayUnavailable);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: mistyped /deployed reply is a relay fault, not a stuck Checking
// -----------------------------------------------------------------------------
void test_check_status_malformed_reply() {
    std::cout << "[TEST] check_status malformed reply\n";

    Fixture f;
    f.http.on("GET", "/deployed", [](const HttpRequest&) {
        return FakeHttpClient::json(200, {{"deployed", "true"}, {"proxyAddress", kProxy}});
    });

    TEST_THROWS(f.mgr->check_status(f.owner_addr()), RelayUnavailableError);

    auto r = f.mgr->record(f.owner_addr());
    TEST_CHECK(r.has_value());
    TEST_CHECK(r->state == WalletState::Unknown);
    TEST_CHECK(r->last_error.has_value());
    TEST_CHECK(r->last_error->kind == ErrorKind::RelayUnavailable);

    f.http.on("GET", "/deployed", [](const HttpRequest&) {
        return FakeHttpClient::json(200, {{"deployed", true}, {"proxyAddress", kProxy}});
    });
    TEST_CHECK(f.mgr->check_status(f.owner_addr()).state == WalletState::Deployed);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: deploy submits a signed CreateProxy and records the proxy
// -----------------------------------------------------------------------------
void test_deploy() {
    std::cout << "[TEST] deploy\n";

    Fixture f;
    f.mgr->check_status(f.owner_addr());

    const ProxyWalletRecord r = f.mgr->deploy(f.owner);
    TEST_CHECK(r.state == WalletState::Deployed);
    TEST_CHECK(r.proxy_address == kProxy);
    TEST_CHECK(r.last_tx_id == "tx-1");
    TEST_CHECK(r.last_tx_hash == "0xhash");
    TEST_CHECK(!r.last_error.has_value());

    TEST_CHECK(f.last_submit["type"] == "SAFE-CREATE");
    TEST_CHECK(f.last_submit["from"] == f.owner_addr());
    TEST_CHECK(f.last_submit["to"] == kSafeProxyFactoryAddress);
    const std::string sig = f.last_submit["signature"].get<std::string>();
    TEST_CHECK(LocalWalletSigner::recover_address(create_proxy_digest(kPolygonChainId), sig) == f.owner_addr());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: deploy is refused outside NotDeployed / Failed
// -----------------------------------------------------------------------------
void test_deploy_invalid_state() {
    std::cout << "[TEST] deploy invalid state\n";

    Fixture f;
    TEST_THROWS(f.mgr->deploy(f.owner), InvalidStateError);   // never checked

    f.deployed = true;
    f.mgr->check_status(f.owner_addr());
    TEST_THROWS(f.mgr->deploy(f.owner), InvalidStateError);   // already deployed
    TEST_CHECK(f.submits == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: mined deploy with no proxy in the reply and a broken lookup
// -----------------------------------------------------------------------------
void test_deploy_proxy_unresolved() {
    std::cout << "[TEST] deploy proxy unresolved\n";

    Fixture f;
    f.mgr->check_status(f.owner_addr());

    f.tx_has_proxy = false;
    f.http.on("GET", "/deployed", [](const HttpRequest&) {
        return FakeHttpClient::json(200, {{"deployed", 1}});
    });

    ProxyWalletRecord r = f.mgr->deploy(f.owner);
    TEST_CHECK(r.state == WalletState::Deployed);
    TEST_CHECK(r.proxy_address.empty());
    TEST_CHECK(r.last_tx_id == "tx-1");
    TEST_CHECK(f.mgr->record(f.owner_addr())->state != WalletState::Deploying);

    f.http.on("GET", "/deployed", [](const HttpRequest&) {
        return FakeHttpClient::json(200, {{"deployed", true}, {"proxyAddress", kProxy}});
    });
    r = f.mgr->check_status(f.owner_addr());
    TEST_CHECK(r.state == WalletState::Deployed);
    TEST_CHECK(r.proxy_address == kProxy);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: on-chain failure -> Failed; a new deploy is allowed from Failed
// -----------------------------------------------------------------------------
void test_deploy_failed_then_retry() {
    std::cout << "[TEST] deploy failure and retry\n";

    Fixture f;
    f.mgr->check_status(f.owner_addr());

    f.tx_state = "STATE_FAILED";
    ProxyWalletRecord r = f.mgr->deploy(f.owner);
    TEST_CHECK(r.state == WalletState::Failed);
    TEST_CHECK(r.last_error.has_value());
    TEST_CHECK(r.last_error->kind == ErrorKind::RelayerRejected);
    TEST_CHECK(r.last_error->message.find("execution reverted") != std::string::npos);

    f.tx_state = "STATE_MINED";
    r = f.mgr->deploy(f.owner);
    TEST_CHECK(r.state == WalletState::Deployed);
    TEST_CHECK(f.submits == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: poll timeout -> Failed(RelayTimeout); status check reconciles
// -----------------------------------------------------------------------------
void test_deploy_timeout() {
    std::cout << "[TEST] deploy timeout\n";

    Fixture f;
    f.mgr->check_status(f.owner_addr());

    f.tx_state = "STATE_NEW";
    ProxyWalletRecord r = f.mgr->deploy(f.owner);
    TEST_CHECK(r.state == WalletState::Failed);
    TEST_CHECK(r.last_error->kind == ErrorKind::RelayTimeout);
    TEST_CHECK(f.http.count("GET", "/transaction/tx-1") == f.cfg.poll.deploy_max_attempts);

    // the relay eventually mined it
    f.deployed = true;
    r = f.mgr->check_status(f.owner_addr());
    TEST_CHECK(r.state == WalletState::Deployed);
    TEST_CHECK(!r.last_error.has_value());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: cancellation ends the deploy wait with a Cancelled error
// -----------------------------------------------------------------------------
void test_deploy_cancelled() {
    std::cout << "[TEST] deploy cancelled\n";

    Fixture f;
    f.mgr->check_status(f.owner_addr());

    CancelToken token;
    token.cancel();
    const ProxyWalletRecord r = f.mgr->deploy(f.owner, &token);
    TEST_CHECK(r.state == WalletState::Failed);
    TEST_CHECK(r.last_error->kind == ErrorKind::Cancelled);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: approve builds a signed Safe call to USDC.approve(spender, max)
// -----------------------------------------------------------------------------
void test_approve() {
    std::cout << "[TEST] approve\n";

    Fixture f;
    TEST_THROWS(f.mgr->approve(f.owner, ApprovalTarget::Standard), ProxyNotDeployedError);

    f.deployed = true;
    f.mgr->check_status(f.owner_addr());
    f.chain.set_allowance(1e12);

    ProxyWalletRecord r = f.mgr->approve(f.owner, ApprovalTarget::Standard);
    TEST_CHECK(r.approval(ApprovalTarget::Standard).state == ApprovalState::Approved);
    TEST_CHECK(r.approval(ApprovalTarget::Standard).allowance == 1e12);
    TEST_CHECK(r.approval(ApprovalTarget::NegRisk).state == ApprovalState::Unapproved);

    TEST_CHECK(f.last_submit["type"] == "SAFE");
    TEST_CHECK(f.last_submit["to"] == kUsdcAddress);
    TEST_CHECK(f.last_submit["proxyWallet"] == kProxy);
    TEST_CHECK(f.last_submit["nonce"] == "3");
    TEST_CHECK(f.last_submit["data"] == encode_approve_max(kConditionalTokensAddress));

    SafeCall call;
    call.to = kUsdcAddress;
    call.data = encode_approve_max(kConditionalTokensAddress);
    const Bytes32 digest = safe_tx_digest(kProxy, call, "3", kPolygonChainId);
    TEST_CHECK(LocalWalletSigner::recover_address(digest, f.last_submit["signature"].get<std::string>()) ==
               f.owner_addr());

    r = f.mgr->approve(f.owner, ApprovalTarget::NegRisk);
    TEST_CHECK(f.last_submit["data"] == encode_approve_max(kNegRiskAdapterAddress));
    TEST_CHECK(r.approval(ApprovalTarget::NegRisk).state == ApprovalState::Approved);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: failed approval leaves the target Unapproved with the error kept
// -----------------------------------------------------------------------------
void test_approve_failed() {
    std::cout << "[TEST] approve failure\n";

    Fixture f;
    f.deployed = true;
    f.mgr->check_status(f.owner_addr());

    f.tx_state = "STATE_INVALID";
    const ProxyWalletRecord r = f.mgr->approve(f.owner, ApprovalTarget::Standard);
    TEST_CHECK(r.state == WalletState::Deployed);
    TEST_CHECK(r.approval(ApprovalTarget::Standard).state == ApprovalState::Unapproved);
    TEST_CHECK(r.last_error.has_value());
    TEST_CHECK(r.last_error->kind == ErrorKind::RelayerRejected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: allowance and balance reads
// -----------------------------------------------------------------------------
void test_reads() {
    std::cout << "[TEST] allowance / balance reads\n";

    Fixture f;
    TEST_THROWS(f.mgr->usdc_balance(f.owner_addr()), ProxyNotDeployedError);
    TEST_THROWS(f.mgr->refresh_allowance(f.owner_addr(), ApprovalTarget::Standard), ProxyNotDeployedError);

    f.deployed = true;
    f.mgr->check_status(f.owner_addr());

    f.chain.set_balance(42.5);
    TEST_CHECK(f.mgr->usdc_balance(f.owner_addr()) == 42.5);

    f.chain.set_allowance(0.0);
    TEST_CHECK(f.mgr->refresh_allowance(f.owner_addr(), ApprovalTarget::Standard) == 0.0);
    TEST_CHECK(f.mgr->record(f.owner_addr())->approval(ApprovalTarget::Standard).state == ApprovalState::Unapproved);

    f.chain.set_allowance(250.0);
    TEST_CHECK(f.mgr->refresh_allowance(f.owner_addr(), ApprovalTarget::Standard) == 250.0);
    TEST_CHECK(f.mgr->record(f.owner_addr())->approval(ApprovalTarget::Standard).state == ApprovalState::Approved);

    f.chain.fail = true;
    TEST_THROWS(f.mgr->usdc_balance(f.owner_addr()), TransportError);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: one operation per owner; other owners are not blocked
// -----------------------------------------------------------------------------
void test_single_flight_per_owner() {
    std::cout << "[TEST] single in-flight operation per owner\n";

    Fixture f;
    f.mgr->check_status(f.owner_addr());

    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    f.http.on("POST", "/submit", [&](const HttpRequest&) {
        entered = true;
        while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return FakeHttpClient::json(200, {{"transactionID", "tx-1"}});
    });

    ProxyWalletRecord deployed;
    std::thread t([&]() { deployed = f.mgr->deploy(f.owner); });

    while (!entered) std::this_thread::sleep_for(std::chrono::milliseconds(5));

    TEST_THROWS(f.mgr->check_status(f.owner_addr()), WalletBusyError);
    TEST_THROWS(f.mgr->deploy(f.owner), WalletBusyError);
    TEST_CHECK(f.mgr->record(f.owner_addr())->state == WalletState::Deploying);

    // a different owner proceeds
    const ProxyWalletRecord other = f.mgr->check_status("0x3333333333333333333333333333333333333333");
    TEST_CHECK(other.state == WalletState::NotDeployed);

    release = true;
    t.join();
    TEST_CHECK(deployed.state == WalletState::Deployed);

    // guard released
    TEST_CHECK(f.mgr->check_status(f.owner_addr()).state == WalletState::Deployed);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_check_status();
    test_check_status_unavailable();
    test_check_status_malformed_reply();
    test_deploy();
    test_deploy_invalid_state();
    test_deploy_proxy_unresolved();
    test_deploy_failed_then_retry();
    test_deploy_timeout();
    test_deploy_cancelled();
    test_approve();
    test_approve_failed();
    test_reads();
    test_single_flight_per_owner();

    std::cout << "\n[ALL PROXY WALLET MANAGER TESTS PASSED]\n";
    return 0;
}
