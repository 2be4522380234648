#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "lucid_core/types.hpp"

namespace lucid_api {

// Body of PUT /documents/<id>.
struct DocumentUpsert {
  std::string content;
  std::optional<std::string> previous_content;
};

nlohmann::json chunk_to_json(const lucid_core::Chunk& chunk, bool include_embedding = true);

nlohmann::json response_to_json(const lucid_core::Response& response);

/**
 * @brief Decodes {query, top_k?, threshold?}.
 *
 * Absent optional fields are left at 0 so the service applies its defaults.
 * @throws lucid_core::InvalidQueryError on a non-object body or wrong field types.
 */
lucid_core::Query query_from_json(const nlohmann::json& body);

// Throws lucid_core::InvalidQueryError when content is missing or not a string.
DocumentUpsert document_upsert_from_json(const nlohmann::json& body);

}  // namespace lucid_api
