#pragma once

#include "mist/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace mist {

/**
 * @brief Streaming FNV-1a (64 bit) digest
 *
 * Change detection only (manifest entries, tree snapshots). Not a
 * security primitive.
 */
class Fnv1a64 {
public:
    void update(const void* data, std::size_t size) noexcept;
    void update(const std::string& text) noexcept { update(text.data(), text.size()); }

    [[nodiscard]] std::uint64_t value() const noexcept { return hash_; }
    [[nodiscard]] std::string hex() const;

private:
    std::uint64_t hash_ = 0xcbf29ce484222325ULL;
};

/// Hex digest of a file's contents.
Result<std::string> hash_file(const std::filesystem::path& path);

} // namespace mist
