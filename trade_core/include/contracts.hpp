#pragma once

// Polygon mainnet deployment used by the Polymarket CLOB

constexpr int kPolygonChainId = 137;

constexpr const char* kUsdcAddress              = "0x2791Bca1f2de4661ED88A30C99A7a9449Aa84174";
constexpr const char* kCtfExchangeAddress       = "0x4bFb41d5B3570DeFd03C39a9A4D8dE6Bd8B8982E";
constexpr const char* kNegRiskExchangeAddress   = "0xC5d563A36AE78145C45a50134d48A1215220f80a";
constexpr const char* kNegRiskAdapterAddress    = "0xd91E80cF2E7be2e162c6513ceD06f1dD0dA35296";
constexpr const char* kConditionalTokensAddress = "0x4D97DCd97eC945f40cF65F87097ACe5EA0476045";
constexpr const char* kSafeProxyFactoryAddress  = "0xaacFeEa03eb1561C4e67d661e40682Bd20E3541b";
constexpr const char* kZeroAddress              = "0x0000000000000000000000000000000000000000";

constexpr const char* kExchangeDomainName = "Polymarket CTF Exchange";
constexpr const char* kExchangeDomainVersion = "1";
constexpr const char* kSafeFactoryDomainName = "Polymarket Contract Proxy Factory";

// USDC and outcome shares both use 6 decimals
constexpr int kUsdcDecimals = 6;
constexpr int kShareDecimals = 6;

constexpr double kMinOrderAmountUsd = 1.0;
constexpr double kMaxOrderAmountUsd = 100000.0;

// Orders stay valid for one day unless filled or cancelled
constexpr long long kOrderLifetimeSeconds = 24 * 60 * 60;
