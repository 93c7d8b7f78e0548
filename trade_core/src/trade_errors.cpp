#include "trade_errors.hpp"

const char* error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration:         return "NOT_CONFIGURED";
        case ErrorKind::Signature:             return "INVALID_SIGNATURE";
        case ErrorKind::ProxyNotDeployed:      return "PROXY_NOT_DEPLOYED";
        case ErrorKind::InsufficientBalance:   return "INSUFFICIENT_BALANCE";
        case ErrorKind::InsufficientAllowance: return "INSUFFICIENT_ALLOWANCE";
        case ErrorKind::RelayUnavailable:      return "RELAY_UNAVAILABLE";
        case ErrorKind::RelayTimeout:          return "RELAY_TIMEOUT";
        case ErrorKind::RelayerRejected:       return "RELAYER_REJECTED";
        case ErrorKind::VenueRejectedOrder:    return "ORDER_FAILED";
        case ErrorKind::InvalidOrder:          return "INVALID_ORDER";
        case ErrorKind::InvalidState:          return "INVALID_STATE";
        case ErrorKind::WalletBusy:            return "WALLET_BUSY";
        case ErrorKind::Cancelled:             return "CANCELLED";
        case ErrorKind::Network:               return "NETWORK_ERROR";
    }
    return "API_ERROR";
}

bool is_transient(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RelayUnavailable:
        case ErrorKind::RelayTimeout:
        case ErrorKind::WalletBusy:
        case ErrorKind::Network:
            return true;
        default:
            return false;
    }
}
