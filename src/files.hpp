#pragma once
#include <map>
#include <string>
#include <nlohmann/json.hpp>

// One staged file. Text is stored as UTF-8, binary content as base64 so it
// can cross process and JSON boundaries unchanged.
struct FileContent {
    enum class Kind { text, binary };

    Kind kind{Kind::text};
    std::string data;

    static FileContent text(std::string utf8) { return {Kind::text, std::move(utf8)}; }
    static FileContent base64(std::string encoded) { return {Kind::binary, std::move(encoded)}; }
    static FileContent from_bytes(const std::string& raw);

    bool is_text() const { return kind == Kind::text; }
    bool is_binary() const { return kind == Kind::binary; }

    // Raw bytes as they are written to disk.
    std::string bytes() const;

    bool operator==(const FileContent& o) const { return kind == o.kind && data == o.data; }
    bool operator!=(const FileContent& o) const { return !(*this == o); }
};

// Relative path -> content.
using Files = std::map<std::string, FileContent>;

bool is_valid_utf8(const std::string& s);

void to_json(nlohmann::json& j, const FileContent& c);
void from_json(const nlohmann::json& j, FileContent& c);
