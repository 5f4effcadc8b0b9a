#include "mist/core/hash.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace mist {

void Fnv1a64::update(const void* data, std::size_t size) noexcept {
    constexpr std::uint64_t prime = 0x100000001b3ULL;
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < size; ++i) {
        hash_ ^= static_cast<std::uint64_t>(bytes[i]);
        hash_ *= prime;
    }
}

std::string Fnv1a64::hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash_) * 2) << std::setfill('0') << hash_;
    return oss.str();
}

Result<std::string> hash_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(Error{ErrorCode::Filesystem, "Failed to open file for hashing"}.with_path(path));
    }

    Fnv1a64 hash;
    char buffer[4096];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        hash.update(buffer, static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        return Err<std::string>(Error{ErrorCode::Filesystem, "Failed to read file for hashing"}.with_path(path));
    }
    return Ok(hash.hex());
}

} // namespace mist
