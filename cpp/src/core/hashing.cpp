#include "vb9/core/hashing.hpp"

#include <cstddef>
#include <limits>

#include <blake3.h>

namespace vb9::core {
    namespace {
        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    } // namespace

    Status hash_compute(BufferView data, Hash128* out) noexcept {
        if (out == nullptr){
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr){
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0){
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return ok_status();
    }

    Status hash_text(std::string_view text, Hash128* out) noexcept {
        if (text.size() > std::numeric_limits<u32>::max()) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        const BufferView view{reinterpret_cast<const u8*>(text.data()), static_cast<u32>(text.size())};
        return hash_compute(view, out);
    }

    std::string hash_to_hex(const Hash128& h) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(kHashHexChars);
        for (u8 b : h.b) {
            out.push_back(hex[(b >> 4) & 0xF]);
            out.push_back(hex[b & 0xF]);
        }
        return out;
    }

    bool hash_from_hex(std::string_view hex, Hash128* out) noexcept {
        if (out == nullptr || hex.size() != kHashHexChars) {
            return false;
        }
        Hash128 h{};
        for (std::size_t i = 0; i < h.b.size(); ++i) {
            const int hi = hex_value(hex[i * 2]);
            const int lo = hex_value(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            h.b[i] = static_cast<u8>((hi << 4) | lo);
        }
        *out = h;
        return true;
    }
} // namespace vb9::core
