#pragma once

#include <type_traits>

#include "vb9/core/types.hpp"

namespace vb9::core {
    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
} // namespace vb9::core
