#include "files.hpp"
#include "base64.hpp"
#include <stdexcept>

FileContent FileContent::from_bytes(const std::string& raw) {
    if (is_valid_utf8(raw)) return text(raw);
    return base64(base64_encode(raw));
}

std::string FileContent::bytes() const {
    if (kind == Kind::text) return data;
    return base64_decode_to_string(data);
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) { i++; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;
        if (i + len > n) return false;
        for (size_t k = 1; k < len; k++) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates and values past U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

void to_json(nlohmann::json& j, const FileContent& c) {
    if (c.is_text()) j = c.data;
    else j = nlohmann::json{{"base64", c.data}};
}

void from_json(const nlohmann::json& j, FileContent& c) {
    if (j.is_string()) {
        c = FileContent::text(j.get<std::string>());
    } else if (j.is_object() && j.contains("base64") && j["base64"].is_string()) {
        c = FileContent::base64(j["base64"].get<std::string>());
    } else {
        throw std::invalid_argument("file content must be a string or {\"base64\": string}");
    }
}
