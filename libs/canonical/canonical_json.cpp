/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization and file helpers
 */

#include "depimpact/canonical_json.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <format>
#include <fstream>
#include <limits>
#include <ranges>
#include <string_view>
#include <vector>

namespace depimpact::canonical {

namespace {

depimpact::VoidResult validate_no_float(const nlohmann::json& j, std::string_view path)
{
    if (j.is_number_float()) {
        return std::unexpected(Error::make(
            "FloatingPointNotAllowed",
            std::format("Floating point numbers not allowed in canonical JSON at: {}", path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_no_float(val, std::format("{}.{}", path, key)); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        for (auto [i, elem] : std::views::enumerate(j)) {
            if (auto result = validate_no_float(elem, std::format("{}[{}]", path, i)); !result) {
                return result;
            }
        }
    }
    return {};
}

/**
 * @brief Recursively create a copy with object keys in lexicographic order
 */
[[nodiscard]] nlohmann::json make_sorted_copy(const nlohmann::json& j)
{
    if (j.is_object()) {
        std::vector<std::string> keys;
        keys.reserve(j.size());
        for (const auto& [key, _] : j.items()) {
            keys.push_back(key);
        }
        std::ranges::sort(keys);

        nlohmann::json result = nlohmann::json::object();
        for (const auto& key : keys) {
            result[key] = make_sorted_copy(j.at(key));
        }
        return result;
    }
    if (j.is_array()) {
        nlohmann::json result = nlohmann::json::array();
        for (const auto& elem : j) {
            result.push_back(make_sorted_copy(elem));
        }
        return result;
    }
    return j;
}

}  // namespace

depimpact::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = validate_no_float(j, "$"); !result) {
        return std::unexpected(result.error());
    }
    return make_sorted_copy(j).dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
}

depimpact::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return validate_no_float(j, "$");
}

std::optional<int> as_int(const nlohmann::json& value)
{
    constexpr auto kMin = static_cast<std::int64_t>(std::numeric_limits<int>::min());
    constexpr auto kMax = static_cast<std::int64_t>(std::numeric_limits<int>::max());
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(kMax)) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }
    if (value.is_number_integer()) {
        const auto raw = value.get<std::int64_t>();
        if (raw < kMin || raw > kMax) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }
    return std::nullopt;
}

depimpact::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            depimpact::Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(depimpact::Error::make(
            "ParseError",
            "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

depimpact::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                                const nlohmann::json& payload)
{
    auto canonical = canonicalize(payload);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            depimpact::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << *canonical << "\n";
    if (!out) {
        return std::unexpected(
            depimpact::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace depimpact::canonical
