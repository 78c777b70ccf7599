#include "base64.hpp"
#include <array>
#include <stdexcept>
#include <string>
#include <vector>

static const char b64_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

static const std::array<int, 256>& decode_table() {
    static const std::array<int, 256> table = [] {
        std::array<int, 256> t{};
        t.fill(-1);
        for (int i = 0; i < 64; i++) t[static_cast<uint8_t>(b64_chars[i])] = i;
        return t;
    }();
    return table;
}

template <typename Bytes>
static std::string encode_bytes(const Bytes& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    int val = 0, valb = -6;
    for (auto ch : data) {
        val = (val << 8) + static_cast<uint8_t>(ch);
        valb += 8;
        while (valb >= 0) {
            out.push_back(b64_chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) out.push_back(b64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
    while (out.size() % 4) out.push_back('=');
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) { return encode_bytes(data); }

std::string base64_encode(const std::string& data) { return encode_bytes(data); }

std::vector<uint8_t> base64_decode(const std::string& s) {
    const auto& table = decode_table();
    std::vector<uint8_t> out;
    out.reserve((s.size() / 4) * 3);
    int val = 0, valb = -8;
    for (size_t i = 0; i < s.size(); i++) {
        const auto c = static_cast<uint8_t>(s[i]);
        if (c == '=') break;
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (table[c] == -1) {
            throw std::invalid_argument("invalid base64 character at offset " + std::to_string(i));
        }
        val = (val << 6) + table[c];
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return out;
}

std::string base64_decode_to_string(const std::string& s) {
    auto bytes = base64_decode(s);
    return std::string(bytes.begin(), bytes.end());
}
