#pragma once

#include <array>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ctxpack::core {

// RFC 4122 version 4 identifier
class UUID {
public:
    UUID() : bytes_{} {}

    // Generate a new random UUID (v4)
    static UUID generate() {
        // Seeded once per thread, then mt19937_64 for generation
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        // 128 bits of randomness
        uint64_t high = dist(gen);
        uint64_t low = dist(gen);
        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // Version 4
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // Variant 1

        UUID uuid;
        for (int i = 0; i < 8; ++i) {
            uuid.bytes_[i] = static_cast<uint8_t>(high >> (56 - i * 8));
            uuid.bytes_[i + 8] = static_cast<uint8_t>(low >> (56 - i * 8));
        }
        return uuid;
    }

    // Parses xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx; anything else yields the nil UUID
    static UUID from_string(const std::string& str) {
        UUID uuid;
        if (str.length() != 36) {
            return uuid;
        }

        std::array<uint8_t, 16> parsed{};
        size_t byte_idx = 0;
        for (size_t i = 0; i < str.length();) {
            if (str[i] == '-') {
                ++i;
                continue;
            }
            if (byte_idx >= parsed.size() || i + 1 >= str.length()) {
                return uuid;
            }
            char hex[3] = {str[i], str[i + 1], '\0'};
            char* end = nullptr;
            unsigned long v = std::strtoul(hex, &end, 16);
            if (end != hex + 2) {
                return uuid;
            }
            parsed[byte_idx++] = static_cast<uint8_t>(v);
            i += 2;
        }
        if (byte_idx == parsed.size()) {
            uuid.bytes_ = parsed;
        }
        return uuid;
    }

    // Canonical lowercase form
    std::string to_string() const {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < bytes_.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes_[i]);
        }
        return ss.str();
    }

    // Nil UUID is invalid
    bool is_valid() const {
        for (auto b : bytes_) {
            if (b != 0) return true;
        }
        return false;
    }

    // Comparison operators
    bool operator==(const UUID& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const UUID& other) const { return bytes_ != other.bytes_; }

private:
    std::array<uint8_t, 16> bytes_;
};

// Thread ids carry a "T-" prefix
inline std::string generate_thread_id() {
    return "T-" + UUID::generate().to_string();
}

}  // namespace ctxpack::core
