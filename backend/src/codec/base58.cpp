#include "base58.hpp"

#include <array>
#include <cstdint>
#include <vector>

static constexpr char kAlphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static const std::array<int8_t, 128>& reverse_table() {
    static const std::array<int8_t, 128> table = [] {
        std::array<int8_t, 128> t{};
        t.fill(-1);
        for (int i = 0; i < 58; ++i) t[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
        return t;
    }();
    return table;
}

std::string base58_encode(std::string_view bytes) {
    std::size_t zeros = 0;
    while (zeros < bytes.size() && bytes[zeros] == 0) ++zeros;

    // log(256) / log(58) ~= 1.37
    std::vector<uint8_t> digits((bytes.size() - zeros) * 138 / 100 + 1, 0);
    std::size_t len = 0;
    for (std::size_t i = zeros; i < bytes.size(); ++i) {
        uint32_t carry = static_cast<uint8_t>(bytes[i]);
        std::size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < len) && it != digits.rend(); ++it, ++j) {
            carry += 256u * *it;
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        len = j;
    }

    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - len);
    while (it != digits.end() && *it == 0) ++it;

    std::string out(zeros, '1');
    out.reserve(zeros + static_cast<std::size_t>(digits.end() - it));
    for (; it != digits.end(); ++it) out += kAlphabet[*it];
    return out;
}

std::optional<std::string> base58_decode(std::string_view text) {
    const auto& table = reverse_table();

    std::size_t ones = 0;
    while (ones < text.size() && text[ones] == '1') ++ones;

    // log(58) / log(256) ~= 0.733
    std::vector<uint8_t> bytes((text.size() - ones) * 733 / 1000 + 1, 0);
    std::size_t len = 0;
    for (std::size_t i = ones; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c >= 128 || table[c] < 0) return std::nullopt;

        uint32_t carry = static_cast<uint32_t>(table[c]);
        std::size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < len) && it != bytes.rend(); ++it, ++j) {
            carry += 58u * *it;
            *it = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        len = j;
    }

    auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - len);
    while (it != bytes.end() && *it == 0) ++it;

    std::string out(ones, '\0');
    out.append(it, bytes.end());
    return out;
}
