#include "config.hpp"
#include "errors.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>

namespace config {

// one year
static constexpr double kMaxSeconds = 365.0 * 24 * 3600;

static void expect(bool ok, const std::string& key, const char* type) {
    if (!ok) throw ConfigurationError("option '" + key + "' must be " + type);
}

std::string get_string(const json& cfg, const std::string& key, const std::string& fallback) {
    if (!cfg.is_object() || !cfg.contains(key) || cfg[key].is_null()) return fallback;
    expect(cfg[key].is_string(), key, "a string");
    return cfg[key].get<std::string>();
}

std::vector<std::string> get_string_list(const json& cfg, const std::string& key,
                                         const std::vector<std::string>& fallback) {
    if (!cfg.is_object() || !cfg.contains(key) || cfg[key].is_null()) return fallback;
    expect(cfg[key].is_array(), key, "an array of strings");
    std::vector<std::string> out;
    for (const auto& x : cfg[key]) {
        expect(x.is_string(), key, "an array of strings");
        out.push_back(x.get<std::string>());
    }
    return out;
}

std::chrono::milliseconds get_seconds(const json& cfg, const std::string& key, std::chrono::milliseconds fallback) {
    if (!cfg.is_object() || !cfg.contains(key) || cfg[key].is_null()) return fallback;
    expect(cfg[key].is_number(), key, "a number of seconds");
    const double s = cfg[key].get<double>();
    expect(std::isfinite(s) && s > 0, key, "a positive number of seconds");
    expect(s <= kMaxSeconds, key, "at most 31536000 seconds");
    const long long ms = std::llround(s * 1000.0);
    // 0 ms would read as "no limit" downstream
    expect(ms >= 1, key, "at least 0.001 seconds");
    return std::chrono::milliseconds(ms);
}

int get_int(const json& cfg, const std::string& key, int fallback) {
    if (!cfg.is_object() || !cfg.contains(key) || cfg[key].is_null()) return fallback;
    expect(cfg[key].is_number_integer(), key, "an integer");
    if (cfg[key].is_number_unsigned()) {
        expect(cfg[key].get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max()),
               key, "an integer in int range");
    } else {
        const auto v = cfg[key].get<std::int64_t>();
        expect(v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max(),
               key, "an integer in int range");
    }
    return cfg[key].get<int>();
}

json load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("cannot open " + path);
    json j = json::parse(in, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded()) throw ConfigurationError("malformed JSON in " + path);
    return j;
}

} // namespace config
