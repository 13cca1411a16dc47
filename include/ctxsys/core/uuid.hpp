#pragma once

#include <array>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ctxsys::core {

// UUID v4
class UUID {
public:
    UUID() : bytes_{} {}

    static UUID generate() {
        UUID uuid;

        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // RFC 4122 variant

        for (int i = 0; i < 8; ++i) {
            uuid.bytes_[i] = static_cast<uint8_t>((high >> (56 - i * 8)) & 0xFF);
            uuid.bytes_[i + 8] = static_cast<uint8_t>((low >> (56 - i * 8)) & 0xFF);
        }

        return uuid;
    }

    // Parses xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx; anything else yields the nil UUID
    static UUID from_string(const std::string& str) {
        UUID uuid;
        if (str.length() != 36) {
            return uuid;
        }

        size_t byte_idx = 0;
        for (size_t i = 0; i + 1 < str.length() && byte_idx < 16; ) {
            if (str[i] == '-') {
                ++i;
                continue;
            }
            char hex[3] = {str[i], str[i + 1], '\0'};
            char* end = nullptr;
            unsigned long v = std::strtoul(hex, &end, 16);
            if (end != hex + 2) {
                return UUID{};
            }
            uuid.bytes_[byte_idx++] = static_cast<uint8_t>(v);
            i += 2;
        }

        return uuid;
    }

    std::string to_string() const {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');

        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes_[i]);
        }

        return ss.str();
    }

    bool is_valid() const {
        for (auto b : bytes_) {
            if (b != 0) return true;
        }
        return false;
    }

    bool operator==(const UUID& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const UUID& other) const { return bytes_ != other.bytes_; }

private:
    std::array<uint8_t, 16> bytes_;
};

inline std::string generate_checkpoint_id() {
    return "ckpt_" + UUID::generate().to_string();
}

inline std::string generate_memory_item_id() {
    return "mem_" + UUID::generate().to_string();
}

}  // namespace ctxsys::core
