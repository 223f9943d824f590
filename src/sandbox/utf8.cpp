#include "utf8.hpp"

static const char kReplacement[] = "\xEF\xBF\xBD";

static std::string decode_lossy(const uint8_t* p, size_t n) {
    std::string out;
    out.reserve(n);
    size_t i = 0;
    while (i < n) {
        uint8_t b = p[i];
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
            ++i;
            continue;
        }

        // Expected length and the valid range of the first continuation byte.
        size_t len = 0;
        uint8_t lo = 0x80, hi = 0xBF;
        if (b >= 0xC2 && b <= 0xDF) { len = 2; }
        else if (b == 0xE0) { len = 3; lo = 0xA0; }
        else if ((b >= 0xE1 && b <= 0xEC) || b == 0xEE || b == 0xEF) { len = 3; }
        else if (b == 0xED) { len = 3; hi = 0x9F; }
        else if (b == 0xF0) { len = 4; lo = 0x90; }
        else if (b >= 0xF1 && b <= 0xF3) { len = 4; }
        else if (b == 0xF4) { len = 4; hi = 0x8F; }

        if (len == 0) {
            out += kReplacement;
            ++i;
            continue;
        }

        // Consume the longest valid prefix; a broken sequence becomes one
        // replacement and decoding resumes at the offending byte.
        size_t k = 1;
        while (k < len && i + k < n) {
            uint8_t c = p[i + k];
            uint8_t min = (k == 1) ? lo : 0x80;
            uint8_t max = (k == 1) ? hi : 0xBF;
            if (c < min || c > max) break;
            ++k;
        }
        if (k == len) {
            out.append(reinterpret_cast<const char*>(p + i), len);
        } else {
            out += kReplacement;
        }
        i += k;
    }
    return out;
}

std::string utf8_lossy(const std::vector<uint8_t>& bytes) {
    return decode_lossy(bytes.data(), bytes.size());
}

std::string utf8_lossy(const std::string& bytes) {
    return decode_lossy(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

bool is_valid_utf8(const std::string& bytes) {
    return decode_lossy(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()) == bytes;
}
