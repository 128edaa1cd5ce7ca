#pragma once
#include <cstdint>
#include <string>
#include <vector>

enum class UpdateKind : uint8_t {
    Transaction = 0,
    Account     = 1,
    Ping        = 2,
    Error       = 3, // provider reported a stream-level error
    Other       = 4
};

// One decoded provider message, already in Solana's base58 text form.
struct StreamUpdate {
    UpdateKind kind{UpdateKind::Other};
    std::string signature;                 // Transaction: first signature; Account: txn signature (may be empty)
    std::vector<std::string> account_keys; // Transaction only
    std::string account;                   // Account only: written pubkey
    std::uint64_t slot{0};
    std::string detail;                    // Error text, or the update type name for Other
};
