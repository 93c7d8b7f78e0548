#pragma once
#include "builder_signer.hpp"
#include "cancel_token.hpp"
#include "http_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

enum class RelayTxState { Pending, Mined, Confirmed, Failed };

const char* relay_state_name(RelayTxState s);

// STATE_NEW / STATE_EXECUTED -> Pending, STATE_INVALID -> Failed.
// Unrecognised strings are treated as Pending.
RelayTxState parse_relay_state(const std::string& raw);

enum class RelayAction { DeployWallet, ExecuteBatch };

// Wire "type" for POST /submit: SAFE-CREATE / SAFE
const char* relay_action_type(RelayAction a);

struct RelayerTransaction {
    std::string id;
    RelayTxState state{RelayTxState::Pending};
    std::string state_raw;
    std::string proxy_address;
    std::string tx_hash;
    std::string error;
};

struct DeployedStatus {
    bool deployed{false};
    std::string proxy_address;
};

struct NonceInfo {
    std::string nonce;
    std::string proxy_address;
};

enum class PollStatus { Terminal, TimedOut, Cancelled };

struct PollOutcome {
    PollStatus status{PollStatus::TimedOut};
    RelayerTransaction tx;   // last observed snapshot
    int attempts{0};         // fetches made
    std::string last_error;  // last transient fetch failure, if any
};

struct PollSettings {
    std::vector<RelayTxState> success_states{RelayTxState::Mined, RelayTxState::Confirmed};
    RelayTxState failure_state{RelayTxState::Failed};
    int max_attempts{20};
    std::chrono::milliseconds interval{2000};
};

// Gasless relay: every request carries builder attribution headers.
// Errors: RelayUnavailableError (transport failure or non-JSON body, e.g. an
// edge-proxy challenge page), RelayerRejectedError (non-2xx JSON reply).
class RelayClient {
public:
    RelayClient(IHttpClient& http, IBuilderHeaderSigner& builder, std::string base_url,
                long timeout_ms = 15000);

    DeployedStatus get_deployed(const std::string& owner);
    NonceInfo get_nonce(const std::string& owner, const std::string& signer_type = "EOA");

    // Returns the relay transaction id
    std::string submit(RelayAction action, nlohmann::json payload);

    RelayerTransaction get_transaction(const std::string& id);

    // Exactly settings.max_attempts fetches before TimedOut; a failed fetch
    // consumes an attempt. No sleep before the first fetch.
    PollOutcome poll(const std::string& id, const PollSettings& settings,
                     const CancelToken* cancel = nullptr);

    // Returns the terminal transaction (success or failure state).
    // Throws RelayTimeoutError or CancelledError.
    RelayerTransaction poll_until_terminal(const std::string& id, const PollSettings& settings,
                                           const CancelToken* cancel = nullptr);

private:
    nlohmann::json request(const std::string& method, const std::string& path_and_query,
                           const std::string& body = "");

    IHttpClient& http_;
    IBuilderHeaderSigner& builder_;
    std::string base_url_;
    long timeout_ms_;
};
