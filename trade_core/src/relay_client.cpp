#include "relay_client.hpp"
#include "json_fields.hpp"
#include "trade_errors.hpp"
#include "trade_log.hpp"

#include <algorithm>
#include <thread>

const char* relay_state_name(RelayTxState s) {
    switch (s) {
        case RelayTxState::Pending:   return "pending";
        case RelayTxState::Mined:     return "mined";
        case RelayTxState::Confirmed: return "confirmed";
        case RelayTxState::Failed:    return "failed";
    }
    return "pending";
}

RelayTxState parse_relay_state(const std::string& raw) {
    if (raw == "STATE_MINED")     return RelayTxState::Mined;
    if (raw == "STATE_CONFIRMED") return RelayTxState::Confirmed;
    if (raw == "STATE_FAILED" || raw == "STATE_INVALID") return RelayTxState::Failed;
    return RelayTxState::Pending;
}

const char* relay_action_type(RelayAction a) {
    return a == RelayAction::DeployWallet ? "SAFE-CREATE" : "SAFE";
}

static std::string snippet(const std::string& body) {
    return body.size() > 160 ? body.substr(0, 160) + "..." : body;
}

RelayClient::RelayClient(IHttpClient& http, IBuilderHeaderSigner& builder, std::string base_url,
                         long timeout_ms)
    : http_(http), builder_(builder), base_url_(std::move(base_url)), timeout_ms_(timeout_ms)
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

nlohmann::json RelayClient::request(const std::string& method, const std::string& path_and_query,
                                    const std::string& body) {
    BuilderSignRequest sreq;
    sreq.method = method;
    sreq.path = path_and_query;
    sreq.body = body;
    sreq.timestamp = now_unix_seconds();

    HttpRequest req;
    req.method = method;
    req.url = base_url_ + path_and_query;
    req.body = body;
    req.timeout_ms = timeout_ms_;

    try {
        req.headers = builder_.headers(sreq);
    } catch (const TransportError& e) {
        throw RelayUnavailableError(std::string("builder signer unreachable: ") + e.what());
    }

    HttpResponse resp;
    try {
        resp = http_.send(req);
    } catch (const TransportError& e) {
        throw RelayUnavailableError(std::string("relay unreachable: ") + e.what());
    }

    if (!resp.is_json()) {
        throw RelayUnavailableError("relay returned a non-JSON response (HTTP " + std::to_string(resp.status) +
                                    ", content-type '" + resp.content_type + "')");
    }

    nlohmann::json j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded()) {
        throw RelayUnavailableError("relay returned malformed JSON: " + snippet(resp.body));
    }

    if (!resp.ok()) {
        std::string msg = first_text(j, kErrorMessageFields);
        if (msg.empty()) msg = snippet(resp.body);
        throw RelayerRejectedError("relay rejected " + method + " " + sreq.path +
                                   " (HTTP " + std::to_string(resp.status) + "): " + msg);
    }
    return j;
}

DeployedStatus RelayClient::get_deployed(const std::string& owner) {
    nlohmann::json j = request("GET", "/deployed?address=" + url_encode(owner));

    const auto it = j.find("deployed");
    if (it == j.end() || !it->is_boolean()) {
        throw RelayUnavailableError("relay /deployed reply has no boolean 'deployed' field: " + snippet(j.dump()));
    }

    DeployedStatus st;
    st.deployed = it->get<bool>();
    st.proxy_address = first_text(j, kProxyAddressFields);
    return st;
}

NonceInfo RelayClient::get_nonce(const std::string& owner, const std::string& signer_type) {
    nlohmann::json j = request("GET", "/nonce?address=" + url_encode(owner) + "&signerType=" + url_encode(signer_type));

    NonceInfo n;
    n.nonce = first_text(j, {"/nonce"});
    n.proxy_address = first_text(j, kProxyAddressFields);
    if (n.nonce.empty()) throw RelayerRejectedError("relay nonce reply has no nonce");
    return n;
}

std::string RelayClient::submit(RelayAction action, nlohmann::json payload) {
    payload["type"] = relay_action_type(action);
    nlohmann::json j = request("POST", "/submit", payload.dump());

    const std::string id = first_text(j, kTransactionIdFields);
    if (id.empty()) throw RelayerRejectedError("relay accepted submit but returned no transaction id");

    log_info("RELAY", std::string("submitted ") + relay_action_type(action) + " tx=" + id);
    return id;
}

RelayerTransaction RelayClient::get_transaction(const std::string& id) {
    nlohmann::json j = request("GET", "/transaction/" + url_encode(id));

    RelayerTransaction tx;
    tx.id = id;

    const nlohmann::json* node = &j;
    if (j.is_array()) {
        if (j.empty()) return tx;  // not indexed yet
        node = &j[0];
    }

    tx.state_raw = first_text(*node, kTxStateFields);
    tx.state = parse_relay_state(tx.state_raw);
    tx.proxy_address = first_text(*node, kProxyAddressFields);
    tx.tx_hash = first_text(*node, kTxHashFields);
    tx.error = first_text(*node, kErrorMessageFields);
    return tx;
}

PollOutcome RelayClient::poll(const std::string& id, const PollSettings& settings,
                              const CancelToken* cancel) {
    PollOutcome out;
    out.tx.id = id;

    for (int attempt = 1; attempt <= settings.max_attempts; ++attempt) {
        if (attempt > 1) {
            if (cancel) {
                if (!cancel->wait_for(settings.interval)) {
                    out.status = PollStatus::Cancelled;
                    return out;
                }
            } else if (settings.interval.count() > 0) {
                std::this_thread::sleep_for(settings.interval);
            }
        }
        if (cancel && cancel->cancelled()) {
            out.status = PollStatus::Cancelled;
            return out;
        }

        out.attempts = attempt;
        try {
            out.tx = get_transaction(id);
        } catch (const TradeError& e) {
            if (e.kind() != ErrorKind::RelayUnavailable && e.kind() != ErrorKind::RelayerRejected) throw;
            out.last_error = e.what();
            log_warn("RELAY", "poll " + id + " attempt " + std::to_string(attempt) + " failed: " + e.what());
            continue;
        }

        const RelayTxState st = out.tx.state;
        const bool success = std::find(settings.success_states.begin(),
                                       settings.success_states.end(), st) != settings.success_states.end();
        if (success || st == settings.failure_state) {
            out.status = PollStatus::Terminal;
            return out;
        }
        log_debug("RELAY", "poll " + id + " attempt " + std::to_string(attempt) + " state=" + out.tx.state_raw);
    }

    out.status = PollStatus::TimedOut;
    return out;
}

RelayerTransaction RelayClient::poll_until_terminal(const std::string& id, const PollSettings& settings,
                                                    const CancelToken* cancel) {
    PollOutcome out = poll(id, settings, cancel);
    switch (out.status) {
        case PollStatus::Terminal:
            return out.tx;
        case PollStatus::Cancelled:
            throw CancelledError("polling of relay tx " + id + " cancelled");
        case PollStatus::TimedOut:
            break;
    }
    std::string msg = "relay tx " + id + " not terminal after " + std::to_string(out.attempts) +
                      " attempts; outcome unknown";
    if (!out.last_error.empty()) msg += " (last error: " + out.last_error + ")";
    throw RelayTimeoutError(msg);
}
