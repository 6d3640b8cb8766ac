#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of input and output documents
 */

#include "depimpact/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace depimpact::common {

/**
 * Validate JSON against a JSON Schema file.
 * "$ref": "depimpact:schema/<name>" resolves to <schema dir>/<name>.schema.json.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] depimpact::VoidResult validate_json(const nlohmann::json& j,
                                                  const std::string& schema_path);

}  // namespace depimpact::common
