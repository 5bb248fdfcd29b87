#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

#include "filecenter/core/types.hpp"

namespace filecenter::test {

    // Unique path under the temp directory, removed (with sqlite side files)
    // when the object goes away.
    class TempPath {
    public:
        explicit TempPath(std::string_view name) {
            static int counter = 0;
            path_ = (std::filesystem::temp_directory_path() /
                     ("filecenter_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + "_" + std::string(name)))
                        .string();
        }
        ~TempPath() {
            std::error_code ec;
            for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
                std::filesystem::remove(path_ + suffix, ec);
            }
        }
        TempPath(const TempPath&) = delete;
        TempPath& operator=(const TempPath&) = delete;

        [[nodiscard]] const char* c_str() const noexcept { return path_.c_str(); }
        [[nodiscard]] const std::string& str() const noexcept { return path_; }

    private:
        std::string path_;
    };

    inline std::vector<filecenter::core::u8> bytes_of(std::string_view s) {
        return std::vector<filecenter::core::u8>(s.begin(), s.end());
    }

    inline std::vector<filecenter::core::u8> pattern_bytes(std::size_t n, unsigned seed = 1) {
        std::vector<filecenter::core::u8> out(n);
        for (std::size_t i = 0; i < n; ++i) {
            out[i] = static_cast<filecenter::core::u8>((i * 131u + seed * 7u) & 0xffu);
        }
        return out;
    }

} // namespace filecenter::test
