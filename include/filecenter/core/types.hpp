#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace filecenter::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Milliseconds since the Unix epoch.
    using Timestamp = i64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);


    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    // Assigned by the backing store on insert; never derived from content.
    struct FileIdTag {};
    using FileId = Id<FileIdTag, u64>;

    enum class StorageShape : u8 {
        Inline = 0,
        Chunked = 1,
    };

    using ClockFn = Timestamp (*)() noexcept;

    static_assert(std::is_trivially_copyable_v<FileId>);
    static_assert(std::is_standard_layout_v<FileId>);

} // namespace filecenter::core
