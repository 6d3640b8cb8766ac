#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for reproducible, diffable results
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Integers only (scoring constants are stored in per-mille)
 * - Array order is preserved; producers emit arrays in a deterministic order
 */

#include "depimpact/common.hpp"

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace depimpact::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] depimpact::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Validate JSON for canonical form requirements (no floating point numbers)
 * @param j JSON value
 * @return Empty on success, FloatingPointNotAllowed on failure
 */
[[nodiscard]] depimpact::VoidResult validate_for_canonical(const nlohmann::json& j);

/**
 * Read an integer that must fit in an int. Floats, non-numbers and values
 * outside the int range give nullopt instead of a narrowed value.
 */
[[nodiscard]] std::optional<int> as_int(const nlohmann::json& value);

/**
 * Read and parse a JSON document.
 * @return Document, IOError or ParseError
 */
[[nodiscard]] depimpact::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Write @p payload in canonical form followed by a newline.
 * @return Empty on success, IOError or a canonicalization error
 */
[[nodiscard]] depimpact::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                                              const nlohmann::json& payload);

}  // namespace depimpact::canonical
