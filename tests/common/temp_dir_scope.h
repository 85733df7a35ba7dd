#pragma once

#include <atomic>
#include <filesystem>
#include <random>
#include <string>
#include <system_error>

namespace ragcore::test {

// Fresh directory under the system temp dir, removed with everything in it when the scope ends
class TempDirScope {
public:
    static TempDirScope unique_under(const std::string& prefix) {
        static std::atomic<unsigned> sequence{0};
        std::random_device entropy;
        auto dir = std::filesystem::temp_directory_path() /
                   (prefix + "-" + std::to_string(entropy()) + "-" +
                    std::to_string(sequence.fetch_add(1)));
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        return TempDirScope(std::move(dir));
    }

    TempDirScope(TempDirScope&& other) noexcept : dir_(std::move(other.dir_)) { other.dir_.clear(); }
    TempDirScope(const TempDirScope&) = delete;
    TempDirScope& operator=(const TempDirScope&) = delete;
    TempDirScope& operator=(TempDirScope&&) = delete;

    ~TempDirScope() {
        if (!dir_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
        }
    }

    const std::filesystem::path& path() const { return dir_; }

private:
    explicit TempDirScope(std::filesystem::path dir) : dir_(std::move(dir)) {}

    std::filesystem::path dir_;
};

} // namespace ragcore::test
