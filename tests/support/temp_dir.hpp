#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace mist::test_support {

namespace fs = std::filesystem;

inline fs::path create_temp_dir(const std::string& prefix = "mist_test_") {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = static_cast<uint64_t>(timestamp) ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path(prefix + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

/**
 * @brief Scratch directory removed at scope exit
 */
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "mist_test_") : path_(create_temp_dir(prefix)) {}

    ~TempDir() {
        std::error_code ec;
        // Undo read-only permissions some tests set so removal succeeds
        for (auto it = fs::recursive_directory_iterator(path_, ec); !ec && it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            if (it->is_directory(ec)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
            }
        }
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }
    fs::path operator/(const std::string& relative) const { return path_ / relative; }

private:
    fs::path path_;
};

} // namespace mist::test_support
