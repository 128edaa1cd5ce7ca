#pragma once
#include <string>
#include <string_view>
#include <vector>

struct DecodedTransaction {
    std::string signature;                 // first signature, base58
    std::vector<std::string> account_keys; // static account keys, base58
};

// Decodes a bincode `Vec<Entry>` as shipped by the shredstream proxy.
// Entry { num_hashes: u64, hash: [u8; 32], transactions: Vec<VersionedTransaction> }
// Transactions without a signature are skipped.
// Throws DecodeError on truncated or malformed input.
std::vector<DecodedTransaction> decode_entries(std::string_view bytes);
