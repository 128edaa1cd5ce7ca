#pragma once
#include <optional>
#include <string>
#include <string_view>

// Bitcoin-alphabet base58, the text form of Solana keys and signatures.
std::string base58_encode(std::string_view bytes);

// nullopt when `text` contains a character outside the alphabet.
std::optional<std::string> base58_decode(std::string_view text);
