#pragma once

#include <string>
#include <string_view>

#include "vb9/core/buffer.hpp"
#include "vb9/core/errors.hpp"
#include "vb9/core/types.hpp"

namespace vb9::core {
    [[nodiscard]] constexpr bool hash_is_zero(const Hash128& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // BLAKE3 extendable output truncated to 16 bytes. Never change: digests are persisted.
    Status hash_compute(BufferView data, Hash128* out) noexcept;

    Status hash_text(std::string_view text, Hash128* out) noexcept;

    [[nodiscard]] std::string hash_to_hex(const Hash128& h);

    // Accepts exactly 32 hex digits, either case.
    [[nodiscard]] bool hash_from_hex(std::string_view hex, Hash128* out) noexcept;

} // namespace vb9::core
