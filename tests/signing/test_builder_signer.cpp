#include <iostream>
#include <string>

#include "builder_signer.hpp"
#include "trade_errors.hpp"
#include "common/fake_http_client.hpp"
#include "common/test_check.hpp"
#include "common/test_keys.hpp"

static BuilderCredentials creds() {
    BuilderCredentials c;
    c.key = "builder-key";
    c.secret = kBuilderSecretB64;
    c.passphrase = "builder-pass";
    return c;
}

static std::string header(const HeaderList& h, const std::string& name) {
    for (const auto& kv : h) {
        if (kv.first == name) return kv.second;
    }
    return "";
}

// -----------------------------------------------------------------------------
// Test: HMAC over timestamp + method + path + body, URL-safe base64
// -----------------------------------------------------------------------------
void test_local_signature() {
    std::cout << "[TEST] local builder signature\n";

    LocalBuilderSigner s(creds());

    TEST_CHECK(s.signature({"GET", "/deployed?address=0xabc", "", 1700000000}) ==
               "NyUfGw8VMchxvF52mwlvGKU1jv4pEnztUEZVU-Iw8B4=");
    TEST_CHECK(s.signature({"POST", "/submit", "{\"type\":\"SAFE\"}", 1700000000}) ==
               "5uy6zkp5qwBv-SLVr18Kmxb07COAB48gideEDFRsiwo=");

    const HeaderList h = s.headers({"POST", "/submit", "{\"type\":\"SAFE\"}", 1700000000});
    TEST_CHECK(h.size() == 4);
    TEST_CHECK(header(h, "POLY_BUILDER_API_KEY") == "builder-key");
    TEST_CHECK(header(h, "POLY_BUILDER_PASSPHRASE") == "builder-pass");
    TEST_CHECK(header(h, "POLY_BUILDER_TIMESTAMP") == "1700000000");
    TEST_CHECK(header(h, "POLY_BUILDER_SIGNATURE") == "5uy6zkp5qwBv-SLVr18Kmxb07COAB48gideEDFRsiwo=");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: bad credentials are configuration errors
// -----------------------------------------------------------------------------
void test_local_credentials() {
    std::cout << "[TEST] local builder credentials\n";

    TEST_THROWS(LocalBuilderSigner(BuilderCredentials{}), ConfigurationError);

    BuilderCredentials bad = creds();
    bad.secret = "***not base64***";
    TEST_THROWS(LocalBuilderSigner{bad}, ConfigurationError);

    LocalBuilderSigner s(creds());
    TEST_THROWS(s.signature({"", "/submit", "", 1}), SignatureError);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: POST /sign handler
// -----------------------------------------------------------------------------
void test_sign_handler() {
    std::cout << "[TEST] /sign handler\n";

    LocalBuilderSigner s(creds());

    SignReply r = handle_sign_request("{\"method\":\"GET\",\"path\":\"/deployed?address=0xabc\"}", &s, 1700000000);
    TEST_CHECK(r.status == 200);
    TEST_CHECK(r.body["success"] == true);
    TEST_CHECK(r.body["timestamp"] == 1700000000);
    TEST_CHECK(r.body["headers"]["POLY_BUILDER_SIGNATURE"] == "NyUfGw8VMchxvF52mwlvGKU1jv4pEnztUEZVU-Iw8B4=");
    TEST_CHECK(r.body.dump().find(kBuilderSecretB64) == std::string::npos);

    // explicit timestamp as a string, body as a string
    r = handle_sign_request(
        "{\"method\":\"POST\",\"path\":\"/submit\",\"body\":\"{\\\"type\\\":\\\"SAFE\\\"}\",\"timestamp\":\"1700000000\"}",
        &s, 42);
    TEST_CHECK(r.status == 200);
    TEST_CHECK(r.body["headers"]["POLY_BUILDER_SIGNATURE"] == "5uy6zkp5qwBv-SLVr18Kmxb07COAB48gideEDFRsiwo=");

    // body given as a JSON object is signed in its compact serialization
    r = handle_sign_request("{\"method\":\"POST\",\"path\":\"/submit\",\"body\":{\"type\":\"SAFE\"},\"timestamp\":1700000000}",
                            &s, 42);
    TEST_CHECK(r.status == 200);
    TEST_CHECK(r.body["headers"]["POLY_BUILDER_SIGNATURE"] == "5uy6zkp5qwBv-SLVr18Kmxb07COAB48gideEDFRsiwo=");

    TEST_CHECK(handle_sign_request("{", &s, 1).status == 400);
    TEST_CHECK(handle_sign_request("[1,2]", &s, 1).status == 400);
    TEST_CHECK(handle_sign_request("{\"method\":\"GET\"}", &s, 1).status == 400);
    TEST_CHECK(handle_sign_request("{\"method\":\"\",\"path\":\"/x\"}", &s, 1).status == 400);

    // timestamp must be integral unix seconds when given
    TEST_CHECK(handle_sign_request("{\"method\":\"GET\",\"path\":\"/x\",\"timestamp\":1.7e9}", &s, 1).status == 400);
    TEST_CHECK(handle_sign_request("{\"method\":\"GET\",\"path\":\"/x\",\"timestamp\":1700000000.5}", &s, 1).status == 400);
    TEST_CHECK(handle_sign_request("{\"method\":\"GET\",\"path\":\"/x\",\"timestamp\":\"17e8\"}", &s, 1).status == 400);
    TEST_CHECK(handle_sign_request("{\"method\":\"GET\",\"path\":\"/x\",\"timestamp\":\"soon\"}", &s, 1).status == 400);
    TEST_CHECK(handle_sign_request("{\"method\":\"GET\",\"path\":\"/x\",\"timestamp\":true}", &s, 1).status == 400);
    r = handle_sign_request("{\"method\":\"GET\",\"path\":\"/x\",\"timestamp\":null}", &s, 77);
    TEST_CHECK(r.status == 200);
    TEST_CHECK(r.body["timestamp"] == 77);

    r = handle_sign_request("{\"method\":\"GET\",\"path\":\"/x\"}", nullptr, 1);
    TEST_CHECK(r.status == 503);
    TEST_CHECK(r.body["success"] == false);

    TEST_CHECK(sign_endpoint_status(true)["configured"] == true);
    TEST_CHECK(sign_endpoint_status(false)["configured"] == false);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: remote signer yields the same headers as the local one
// -----------------------------------------------------------------------------
void test_remote_matches_local() {
    std::cout << "[TEST] remote signer matches local\n";

    LocalBuilderSigner local(creds());
    FakeHttpClient http;
    http.on("POST", "/sign", [&](const HttpRequest& req) {
        SignReply r = handle_sign_request(req.body, &local, 1);
        return FakeHttpClient::json(r.status, r.body);
    });

    RemoteBuilderSigner remote(http, "http://signer.local/");

    const BuilderSignRequest req{"POST", "/submit", "{\"type\":\"SAFE\"}", 1700000000};
    const HeaderList a = local.headers(req);
    const HeaderList b = remote.headers(req);

    TEST_CHECK(a.size() == b.size());
    for (const auto& kv : a) TEST_CHECK(header(b, kv.first) == kv.second);

    const auto calls = http.calls();
    TEST_CHECK(calls.size() == 1);
    TEST_CHECK(calls[0].url == "http://signer.local/sign");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: remote signer failure modes
// -----------------------------------------------------------------------------
void test_remote_errors() {
    std::cout << "[TEST] remote signer errors\n";

    const BuilderSignRequest req{"GET", "/nonce", "", 1700000000};

    FakeHttpClient unconfigured;
    unconfigured.on("POST", "/sign", [](const HttpRequest& r) {
        SignReply reply = handle_sign_request(r.body, nullptr, 1);
        return FakeHttpClient::json(reply.status, reply.body);
    });
    RemoteBuilderSigner a(unconfigured, "http://signer.local");
    TEST_THROWS(a.headers(req), ConfigurationError);

    FakeHttpClient html;
    html.on("POST", "/sign", [](const HttpRequest&) { return FakeHttpClient::html(200, "<html>challenge</html>"); });
    RemoteBuilderSigner b(html, "http://signer.local");
    TEST_THROWS(b.headers(req), TransportError);

    FakeHttpClient refused;
    refused.on("POST", "/sign", [](const HttpRequest&) {
        return FakeHttpClient::json(500, {{"success", false}, {"error", "boom"}});
    });
    RemoteBuilderSigner c(refused, "http://signer.local");
    TEST_THROWS(c.headers(req), SignatureError);

    // reply fields of the wrong type are a refusal, not a JSON library error
    FakeHttpClient odd;
    odd.on("POST", "/sign", [](const HttpRequest&) {
        return FakeHttpClient::json(200, {{"success", "true"}, {"error", {{"message", "bad shape"}}}});
    });
    RemoteBuilderSigner d(odd, "http://signer.local");
    TEST_THROWS(d.headers(req), SignatureError);

    TEST_THROWS(RemoteBuilderSigner(html, ""), ConfigurationError);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: factory picks local, then remote, else fails
// -----------------------------------------------------------------------------
void test_factory() {
    std::cout << "[TEST] make_builder_signer\n";

    FakeHttpClient http;

    TradeConfig cfg;
    cfg.builder = creds();
    cfg.builder_signing_server_url = "http://signer.local";
    auto s = make_builder_signer(cfg, http);
    TEST_CHECK(dynamic_cast<LocalBuilderSigner*>(s.get()) != nullptr);

    cfg.builder = BuilderCredentials{};
    s = make_builder_signer(cfg, http);
    TEST_CHECK(dynamic_cast<RemoteBuilderSigner*>(s.get()) != nullptr);

    cfg.builder_signing_server_url.clear();
    TEST_THROWS(make_builder_signer(cfg, http), ConfigurationError);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_local_signature();
    test_local_credentials();
    test_sign_handler();
    test_remote_matches_local();
    test_remote_errors();
    test_factory();

    std::cout << "\n[ALL BUILDER SIGNER TESTS PASSED]\n";
    return 0;
}
