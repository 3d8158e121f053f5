#include "util/uuid.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace billsync {

std::expected<std::string, std::string> GenerateUuidV4() {
    std::array<unsigned char, 16> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        char buf[256]{};
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        return std::unexpected(std::string("RAND_bytes failed: ") + buf);
    }

    raw[6] = static_cast<unsigned char>((raw[6] & 0x0F) | 0x40);
    raw[8] = static_cast<unsigned char>((raw[8] & 0x3F) | 0x80);

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < raw.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHex[(raw[i] >> 4) & 0x0F]);
        out.push_back(kHex[raw[i] & 0x0F]);
    }
    return out;
}

bool LooksLikeUuid(const std::string& s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace billsync
