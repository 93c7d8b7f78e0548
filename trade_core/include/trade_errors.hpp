#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    Configuration,
    Signature,
    ProxyNotDeployed,
    InsufficientBalance,
    InsufficientAllowance,
    RelayUnavailable,
    RelayTimeout,
    RelayerRejected,
    VenueRejectedOrder,
    InvalidOrder,
    InvalidState,
    WalletBusy,
    Cancelled,
    Network
};

// Stable code reported to callers, e.g. "PROXY_NOT_DEPLOYED"
const char* error_code(ErrorKind kind);

// Transient kinds may succeed on a later, caller-initiated attempt
bool is_transient(ErrorKind kind);

class TradeError : public std::runtime_error {
public:
    TradeError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    const char* code() const { return error_code(kind_); }

private:
    ErrorKind kind_;
};

#define MRKT_DEFINE_TRADE_ERROR(Name, Kind)                              \
    class Name : public TradeError {                                     \
    public:                                                              \
        explicit Name(const std::string& msg) : TradeError(Kind, msg) {} \
    }

MRKT_DEFINE_TRADE_ERROR(ConfigurationError, ErrorKind::Configuration);
MRKT_DEFINE_TRADE_ERROR(SignatureError, ErrorKind::Signature);
MRKT_DEFINE_TRADE_ERROR(ProxyNotDeployedError, ErrorKind::ProxyNotDeployed);
MRKT_DEFINE_TRADE_ERROR(InsufficientBalanceError, ErrorKind::InsufficientBalance);
MRKT_DEFINE_TRADE_ERROR(InsufficientAllowanceError, ErrorKind::InsufficientAllowance);
MRKT_DEFINE_TRADE_ERROR(RelayUnavailableError, ErrorKind::RelayUnavailable);
MRKT_DEFINE_TRADE_ERROR(RelayTimeoutError, ErrorKind::RelayTimeout);
MRKT_DEFINE_TRADE_ERROR(RelayerRejectedError, ErrorKind::RelayerRejected);
MRKT_DEFINE_TRADE_ERROR(VenueRejectedOrderError, ErrorKind::VenueRejectedOrder);
MRKT_DEFINE_TRADE_ERROR(InvalidOrderError, ErrorKind::InvalidOrder);
MRKT_DEFINE_TRADE_ERROR(InvalidStateError, ErrorKind::InvalidState);
MRKT_DEFINE_TRADE_ERROR(WalletBusyError, ErrorKind::WalletBusy);
MRKT_DEFINE_TRADE_ERROR(CancelledError, ErrorKind::Cancelled);
MRKT_DEFINE_TRADE_ERROR(TransportError, ErrorKind::Network);

#undef MRKT_DEFINE_TRADE_ERROR
