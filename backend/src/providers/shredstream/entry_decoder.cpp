#include "entry_decoder.hpp"

#include <cstdint>

#include "codec/base58.hpp"
#include "stream/stream_errors.hpp"

namespace {

constexpr std::size_t kSignatureLen = 64;
constexpr std::size_t kPubkeyLen    = 32;
constexpr std::size_t kHashLen      = 32;

class ByteReader {
public:
    explicit ByteReader(std::string_view buf) : buf_(buf) {}

    std::size_t remaining() const noexcept { return buf_.size() - pos_; }

    uint8_t u8() {
        need(1);
        return static_cast<uint8_t>(buf_[pos_++]);
    }

    uint8_t peek_u8() const {
        if (remaining() < 1) throw DecodeError("unexpected end of entry data");
        return static_cast<uint8_t>(buf_[pos_]);
    }

    // bincode fixed-width integers are little-endian
    uint64_t u64() {
        need(8);
        uint64_t v = 0;
        for (int i = 7; i >= 0; --i) v = (v << 8) | static_cast<uint8_t>(buf_[pos_ + static_cast<std::size_t>(i)]);
        pos_ += 8;
        return v;
    }

    std::string_view take(std::size_t n) {
        need(n);
        std::string_view out = buf_.substr(pos_, n);
        pos_ += n;
        return out;
    }

    void skip(std::size_t n) {
        need(n);
        pos_ += n;
    }

    // Solana short_vec length: compact-u16, 7 bits per byte, at most 3 bytes.
    std::size_t short_len() {
        std::size_t value = 0;
        for (int i = 0; i < 3; ++i) {
            const uint8_t b = u8();
            value |= static_cast<std::size_t>(b & 0x7f) << (7 * i);
            if ((b & 0x80) == 0) return value;
        }
        throw DecodeError("short_vec length overflow");
    }

    // bincode Vec length, bounded by what is left to read
    std::size_t vec_len(std::size_t min_elem_size) {
        const uint64_t n = u64();
        if (min_elem_size > 0 && n > remaining() / min_elem_size)
            throw DecodeError("vector length exceeds entry data");
        return static_cast<std::size_t>(n);
    }

private:
    void need(std::size_t n) const {
        if (remaining() < n) throw DecodeError("unexpected end of entry data");
    }

    std::string_view buf_;
    std::size_t pos_{0};
};

void skip_short_bytes(ByteReader& r) {
    r.skip(r.short_len());
}

DecodedTransaction decode_transaction(ByteReader& r) {
    DecodedTransaction tx;

    const std::size_t num_sigs = r.short_len();
    for (std::size_t i = 0; i < num_sigs; ++i) {
        std::string_view sig = r.take(kSignatureLen);
        if (i == 0) tx.signature = base58_encode(sig);
    }

    // VersionedMessage: a set high bit marks a versioned message, otherwise
    // the byte is the legacy header's num_required_signatures.
    bool v0 = false;
    if (r.peek_u8() & 0x80) {
        const uint8_t version = r.u8() & 0x7f;
        if (version != 0) throw DecodeError("unsupported message version " + std::to_string(version));
        v0 = true;
    }
    r.skip(3); // header

    const std::size_t num_keys = r.short_len();
    tx.account_keys.reserve(num_keys);
    for (std::size_t i = 0; i < num_keys; ++i) {
        tx.account_keys.push_back(base58_encode(r.take(kPubkeyLen)));
    }

    r.skip(kHashLen); // recent blockhash

    const std::size_t num_ix = r.short_len();
    for (std::size_t i = 0; i < num_ix; ++i) {
        r.skip(1);           // program_id_index
        skip_short_bytes(r); // account indexes
        skip_short_bytes(r); // data
    }

    if (v0) {
        const std::size_t num_lookups = r.short_len();
        for (std::size_t i = 0; i < num_lookups; ++i) {
            r.skip(kPubkeyLen);
            skip_short_bytes(r); // writable indexes
            skip_short_bytes(r); // readonly indexes
        }
    }
    return tx;
}

} // namespace

std::vector<DecodedTransaction> decode_entries(std::string_view bytes) {
    ByteReader r(bytes);
    std::vector<DecodedTransaction> out;

    const std::size_t num_entries = r.vec_len(8 + kHashLen + 8);
    for (std::size_t e = 0; e < num_entries; ++e) {
        (void)r.u64(); // num_hashes
        r.skip(kHashLen);

        const std::size_t num_txs = r.vec_len(1);
        for (std::size_t t = 0; t < num_txs; ++t) {
            DecodedTransaction tx = decode_transaction(r);
            if (!tx.signature.empty()) out.push_back(std::move(tx));
        }
    }
    return out;
}
