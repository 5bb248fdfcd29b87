#pragma once

#include <type_traits>

#include "filecenter/core/types.hpp"

namespace filecenter::storage {
    using u8 = filecenter::core::u8;
    using u32 = filecenter::core::u32;
    using u64 = filecenter::core::u64;

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u64 len{0};
    };

    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    [[nodiscard]] constexpr bool buffer_ok(BufferMut b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace filecenter::storage
