#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "builder_signer.hpp"
#include "relay_client.hpp"
#include "trade_errors.hpp"
#include "common/fake_http_client.hpp"
#include "common/test_check.hpp"
#include "common/test_keys.hpp"

static const char* kOwner = "0x1111111111111111111111111111111111111111";
static const char* kProxy = "0x2222222222222222222222222222222222222222";

static BuilderCredentials creds() {
    BuilderCredentials c;
    c.key = "builder-key";
    c.secret = kBuilderSecretB64;
    c.passphrase = "builder-pass";
    return c;
}

static PollSettings fast_poll(int attempts) {
    PollSettings ps;
    ps.max_attempts = attempts;
    ps.interval = std::chrono::milliseconds(0);
    return ps;
}

// Serves the given transaction states in order, repeating the last one
static FakeHttpClient::Handler tx_sequence(std::vector<nlohmann::json> replies) {
    auto idx = std::make_shared<std::atomic<size_t>>(0);
    return [replies, idx](const HttpRequest&) {
        size_t i = idx->fetch_add(1);
        if (i >= replies.size()) i = replies.size() - 1;
        return FakeHttpClient::json(200, replies[i]);
    };
}

// -----------------------------------------------------------------------------
// Test: builder headers are signed over the full path including the query
// -----------------------------------------------------------------------------
void test_get_deployed_signed() {
    std::cout << "[TEST] get_deployed signs path and query\n";

    LocalBuilderSigner builder(creds());
    FakeHttpClient http;
    http.on("GET", "/deployed", [](const HttpRequest&) {
        return FakeHttpClient::json(200, {{"deployed", true}, {"proxyAddress", kProxy}});
    });

    RelayClient relay(http, builder, "http://relay.local/");
    const DeployedStatus st = relay.get_deployed(kOwner);
    TEST_CHECK(st.deployed);
    TEST_CHECK(st.proxy_address == kProxy);

    const auto calls = http.calls();
    TEST_CHECK(calls.size() == 1);
    TEST_CHECK(calls[0].url == std::string("http://relay.local/deployed?address=") + kOwner);

    const std::string ts = FakeHttpClient::header(calls[0], "POLY_BUILDER_TIMESTAMP");
    TEST_CHECK(!ts.empty());
    const std::string expected =
        builder.signature({"GET", std::string("/deployed?address=") + kOwner, "", std::stoll(ts)});
    TEST_CHECK(FakeHttpClient::header(calls[0], "POLY_BUILDER_SIGNATURE") == expected);
    TEST_CHECK(FakeHttpClient::header(calls[0], "POLY_BUILDER_API_KEY") == "builder-key");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: error classification
// -----------------------------------------------------------------------------
void test_error_classification() {
    std::cout << "[TEST] relay error classification\n";

    LocalBuilderSigner builder(creds());

    FakeHttpClient challenge;
    challenge.on("GET", "/deployed", [](const HttpRequest&) {
        return FakeHttpClient::html(403, "<html>Just a moment...</html>");
    });
    RelayClient a(challenge, builder, "http://relay.local");
    TEST_THROWS(a.get_deployed(kOwner), RelayUnavailableError);

    FakeHttpClient down;
    down.on("GET", "/deployed", [](const HttpRequest&) -> HttpResponse {
        throw TransportError("connection refused");
    });
    RelayClient b(down, builder, "http://relay.local");
    TEST_THROWS(b.get_deployed(kOwner), RelayUnavailableError);

    FakeHttpClient rejecting;
    rejecting.on("POST", "/submit", [](const HttpRequest&) {
        return FakeHttpClient::json(400, {{"error", "invalid signature"}});
    });
    RelayClient c(rejecting, builder, "http://relay.local");
    bool caught = false;
    try {
        c.submit(RelayAction::DeployWallet, nlohmann::json::object());
    } catch (const RelayerRejectedError& e) {
        caught = true;
        TEST_CHECK(std::string(e.what()).find("invalid signature") != std::string::npos);
    }
    TEST_CHECK(caught);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: nonce lookup
// -----------------------------------------------------------------------------
void test_get_nonce() {
    std::cout << "[TEST] get_nonce\n";

    LocalBuilderSigner builder(creds());
    FakeHttpClient http;
    http.on("GET", "/nonce", [](const HttpRequest& req) {
        if (split_url(req.url).query.find("signerType=EOA") == std::string::npos) {
            return FakeHttpClient::json(400, {{"error", "signerType required"}});
        }
        return FakeHttpClient::json(200, {{"nonce", 7}, {"address", kProxy}});
    });

    RelayClient relay(http, builder, "http://relay.local");
    const NonceInfo n = relay.get_nonce(kOwner);
    TEST_CHECK(n.nonce == "7");
    TEST_CHECK(n.proxy_address == kProxy);

    FakeHttpClient empty;
    empty.on("GET", "/nonce", [](const HttpRequest&) { return FakeHttpClient::json(200, nlohmann::json::object()); });
    RelayClient r2(empty, builder, "http://relay.local");
    TEST_THROWS(r2.get_nonce(kOwner), RelayerRejectedError);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: submit tags the payload type and returns the transaction id
// -----------------------------------------------------------------------------
void test_submit() {
    std::cout << "[TEST] submit\n";

    LocalBuilderSigner builder(creds());
    FakeHttpClient http;
    std::string seen_type;
    http.on("POST", "/submit", [&](const HttpRequest& req) {
        seen_type = nlohmann::json::parse(req.body).value("type", "");
        return FakeHttpClient::json(200, {{"transactionID", "tx-1"}, {"state", "STATE_NEW"}});
    });

    RelayClient relay(http, builder, "http://relay.local");
    TEST_CHECK(relay.submit(RelayAction::DeployWallet, {{"from", kOwner}}) == "tx-1");
    TEST_CHECK(seen_type == "SAFE-CREATE");
    TEST_CHECK(relay.submit(RelayAction::ExecuteBatch, {{"from", kOwner}}) == "tx-1");
    TEST_CHECK(seen_type == "SAFE");

    // the signature covers the exact body sent
    const auto calls = http.calls();
    const HttpRequest& last = calls.back();
    const std::string ts = FakeHttpClient::header(last, "POLY_BUILDER_TIMESTAMP");
    TEST_CHECK(FakeHttpClient::header(last, "POLY_BUILDER_SIGNATURE") ==
               builder.signature({"POST", "/submit", last.body, std::stoll(ts)}));

    FakeHttpClient no_id;
    no_id.on("POST", "/submit", [](const HttpRequest&) { return FakeHttpClient::json(200, {{"state", "STATE_NEW"}}); });
    RelayClient r2(no_id, builder, "http://relay.local");
    TEST_THROWS(r2.submit(RelayAction::ExecuteBatch, nlohmann::json::object()), RelayerRejectedError);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: transaction parsing (object and array replies)
// -----------------------------------------------------------------------------
void test_get_transaction() {
    std::cout << "[TEST] get_transaction\n";

    TEST_CHECK(parse_relay_state("STATE_NEW") == RelayTxState::Pending);
    TEST_CHECK(parse_relay_state("STATE_EXECUTED") == RelayTxState::Pending);
    TEST_CHECK(parse_relay_state("STATE_MINED") == RelayTxState::Mined);
    TEST_CHECK(parse_relay_state("STATE_CONFIRMED") == RelayTxState::Confirmed);
    TEST_CHECK(parse_relay_state("STATE_FAILED") == RelayTxState::Failed);
    TEST_CHECK(parse_relay_state("STATE_INVALID") == RelayTxState::Failed);
    TEST_CHECK(parse_relay_state("SOMETHING_NEW") == RelayTxState::Pending);

    LocalBuilderSigner builder(creds());
    FakeHttpClient http;
    http.on("GET", "/transaction/tx-1", [](const HttpRequest&) {
        return FakeHttpClient::json(200, nlohmann::json::array({
            {{"state", "STATE_MINED"}, {"transactionHash", "0xhash"}, {"proxyAddress", kProxy}}}));
    });
    http.on("GET", "/transaction/tx-2", [](const HttpRequest&) {
        return FakeHttpClient::json(200, nlohmann::json::array());
    });

    RelayClient relay(http, builder, "http://relay.local");
    RelayerTransaction tx = relay.get_transaction("tx-1");
    TEST_CHECK(tx.state == RelayTxState::Mined);
    TEST_CHECK(tx.state_raw == "STATE_MINED");
    TEST_CHECK(tx.tx_hash == "0xhash");
    TEST_CHECK(tx.proxy_address == kProxy);

    tx = relay.get_transaction("tx-2");
    TEST_CHECK(tx.state == RelayTxState::Pending);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: poll reaches a success state
// -----------------------------------------------------------------------------
void test_poll_success() {
    std::cout << "[TEST] poll until mined\n";

    LocalBuilderSigner builder(creds());
    FakeHttpClient http;
    http.on("GET", "/transaction/tx-1", tx_sequence({
        {{"state", "STATE_NEW"}},
        {{"state", "STATE_EXECUTED"}},
        {{"state", "STATE_MINED"}, {"transactionHash", "0xhash"}},
    }));

    RelayClient relay(http, builder, "http://relay.local");
    const PollOutcome out = relay.poll("tx-1", fast_poll(10));
    TEST_CHECK(out.status == PollStatus::Terminal);
    TEST_CHECK(out.attempts == 3);
    TEST_CHECK(out.tx.state == RelayTxState::Mined);
    TEST_CHECK(http.count("GET", "/transaction/tx-1") == 3);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: first fetch happens without waiting an interval
// -----------------------------------------------------------------------------
void test_poll_no_initial_sleep() {
    std::cout << "[TEST] poll first fetch is immediate\n";

    LocalBuilderSigner builder(creds());
    FakeHttpClient http;
    http.on("GET", "/transaction/tx-1", tx_sequence({{{"state", "STATE_CONFIRMED"}}}));

    RelayClient relay(http, builder, "http://relay.local");
    PollSettings ps;
    ps.max_attempts = 5;
    ps.interval = std::chrono::milliseconds(3000);

    const auto t0 = std::chrono::steady_clock::now();
    const PollOutcome out = relay.poll("tx-1", ps);
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    TEST_CHECK(out.status == PollStatus::Terminal);
    TEST_CHECK(out.attempts == 1);
    TEST_CHECK(elapsed < std::chrono::milliseconds(1000));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a failure state is terminal, not a timeout
// -----------------------------------------------------------------------------
void test_poll_failure_state() {
    std::cout << "[TEST] poll stops at failure state\n";

    LocalBuilderSigner builder(creds());
    FakeHttpClient http;
    http.on("GET", "/transaction/tx-1", tx_sequence({
        {{"state", "STATE_NEW"}},
        {{"state", "STATE_FAILED"}, {"errorMsg", "execution reverted"}},
    }));

    RelayClient relay(http, builder, "http://relay.local");
    const RelayerTransaction tx = relay.poll_until_terminal("tx-1", fast_poll(10));
    TEST_CHECK(tx.state == RelayTxState::Failed);
    TEST_CHECK(tx.error == "execution reverted");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: exactly max_attempts fetches, then timeout
// -----------------------------------------------------------------------------
void test_poll_timeout() {
    std::cout << "[TEST] poll timeout\n";

    LocalBuilderSigner builder(creds());
    FakeHttpClient http;
    http.on("GET", "/transaction/tx-1", tx_sequence({{{"state", "STATE_NEW"}}}));

    RelayClient relay(http, builder, "http://relay.local");
    const PollOutcome out = relay.poll("tx-1", fast_poll(4));
    TEST_CHECK(out.status == PollStatus::TimedOut);
    TEST_CHECK(out.attempts == 4);
    TEST_CHECK(http.count("GET", "/transaction/tx-1") == 4);

    bool caught = false;
    try {
        relay.poll_until_terminal("tx-1", fast_poll(2));
    } catch (const RelayTimeoutError& e) {
        caught = true;
        TEST_CHECK(std::string(e.what()).find("outcome unknown") != std::string::npos);
    }
    TEST_CHECK(caught);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a failed fetch consumes an attempt without ending the poll
// -----------------------------------------------------------------------------
void test_poll_transient_error() {
    std::cout << "[TEST] poll transient fetch error\n";

    LocalBuilderSigner builder(creds());

    auto first = std::make_shared<std::atomic<bool>>(true);
    FakeHttpClient http;
    http.on("GET", "/transaction/tx-1", [first](const HttpRequest&) {
        if (first->exchange(false)) return FakeHttpClient::html(502, "<html>Bad gateway</html>");
        return FakeHttpClient::json(200, {{"state", "STATE_MINED"}});
    });

    RelayClient relay(http, builder, "http://relay.local");
    PollOutcome out = relay.poll("tx-1", fast_poll(2));
    TEST_CHECK(out.status == PollStatus::Terminal);
    TEST_CHECK(out.attempts == 2);
    TEST_CHECK(!out.last_error.empty());

    first->store(true);
    out = relay.poll("tx-1", fast_poll(1));
    TEST_CHECK(out.status == PollStatus::TimedOut);
    TEST_CHECK(out.attempts == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: unreachable remote header signer is a relay outage
// -----------------------------------------------------------------------------
void test_remote_signer_unreachable() {
    std::cout << "[TEST] remote builder signer unreachable\n";

    FakeHttpClient signer_http;
    signer_http.on("POST", "/sign", [](const HttpRequest&) -> HttpResponse {
        throw TransportError("connection refused");
    });
    RemoteBuilderSigner builder(signer_http, "http://signer.local");

    FakeHttpClient http;
    http.on("GET", "/transaction/tx-1", [](const HttpRequest&) {
        return FakeHttpClient::json(200, {{"state", "STATE_MINED"}});
    });
    RelayClient relay(http, builder, "http://relay.local");

    TEST_THROWS(relay.get_deployed(kOwner), RelayUnavailableError);
    TEST_THROWS(relay.get_transaction("tx-1"), RelayUnavailableError);

    // each unsigned poll attempt is spent, not fatal
    PollOutcome out = relay.poll("tx-1", fast_poll(3));
    TEST_CHECK(out.status == PollStatus::TimedOut);
    TEST_CHECK(out.attempts == 3);
    TEST_CHECK(out.last_error.find("builder signer unreachable") != std::string::npos);
    TEST_CHECK(signer_http.count("POST", "/sign") == 5);
    TEST_CHECK(http.calls().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: cancellation interrupts the wait between attempts
// -----------------------------------------------------------------------------
void test_poll_cancel() {
    std::cout << "[TEST] poll cancellation\n";

    LocalBuilderSigner builder(creds());
    FakeHttpClient http;
    http.on("GET", "/transaction/tx-1", tx_sequence({{{"state", "STATE_NEW"}}}));

    RelayClient relay(http, builder, "http://relay.local");
    PollSettings ps;
    ps.max_attempts = 100;
    ps.interval = std::chrono::milliseconds(5000);

    CancelToken token;
    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });

    const auto t0 = std::chrono::steady_clock::now();
    const PollOutcome out = relay.poll("tx-1", ps, &token);
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    canceller.join();

    TEST_CHECK(out.status == PollStatus::Cancelled);
    TEST_CHECK(out.attempts == 1);
    TEST_CHECK(elapsed < std::chrono::milliseconds(2000));

    // already-cancelled token: no fetch at all
    TEST_THROWS(relay.poll_until_terminal("tx-1", ps, &token), CancelledError);
    TEST_CHECK(http.count("GET", "/transaction/tx-1") == 1);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_get_deployed_signed();
    test_error_classification();
    test_get_nonce();
    test_submit();
    test_get_transaction();
    test_poll_success();
    test_poll_no_initial_sleep();
    test_poll_failure_state();
    test_poll_timeout();
    test_poll_transient_error();
    test_remote_signer_unreachable();
    test_poll_cancel();

    std::cout << "\n[ALL RELAY CLIENT TESTS PASSED]\n";
    return 0;
}
