#pragma once
#include <optional>
#include <string>
#include <string_view>

// Standard base64 with padding (proto3 JSON encoding of `bytes` fields).
std::string base64_encode(std::string_view bytes);

// nullopt when `text` is not valid base64.
std::optional<std::string> base64_decode(std::string_view text);
