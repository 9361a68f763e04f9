#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace vb9::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // 128-bit content digest. Persisted in manifests as 32 hex digits.
    struct Hash128 {
        std::array<u8, 16> b{};
        friend constexpr bool operator==(const Hash128&, const Hash128&) noexcept = default;
        friend constexpr auto operator<=>(const Hash128&, const Hash128&) noexcept = default;
    };
    static_assert(sizeof(Hash128) == 16);
    static_assert(std::is_trivially_copyable_v<Hash128>);
    static_assert(std::is_standard_layout_v<Hash128>);

    inline constexpr std::size_t kHashHexChars = 32;

} // namespace vb9::core
