#include "lucid_api/mappers.hpp"

#include "lucid_core/errors.hpp"
#include "lucid_core/utils/time_format.hpp"

namespace lucid_api {

nlohmann::json chunk_to_json(const lucid_core::Chunk& chunk, bool include_embedding) {
  nlohmann::json result;
  result["id"] = chunk.id;
  result["document_id"] = chunk.document_id;
  result["chunk_index"] = chunk.chunk_index;
  result["content"] = chunk.content;
  if (include_embedding) {
    result["embedding"] = chunk.embedding;
  }
  result["created_at"] = lucid_core::time_format::to_iso8601(chunk.created_at);
  return result;
}

nlohmann::json response_to_json(const lucid_core::Response& response) {
  nlohmann::json chunks = nlohmann::json::array();
  for (const auto& chunk : response.relevant_chunks) {
    chunks.push_back(chunk_to_json(chunk));
  }

  nlohmann::json result;
  result["answer"] = response.answer;
  result["relevant_chunks"] = chunks;
  result["confidence_score"] = response.confidence_score;
  result["processing_time_ms"] = response.processing_time_ms;
  return result;
}

lucid_core::Query query_from_json(const nlohmann::json& body) {
  if (!body.is_object()) {
    throw lucid_core::InvalidQueryError("request body must be a JSON object");
  }

  lucid_core::Query query;
  if (body.contains("query")) {
    if (!body["query"].is_string()) {
      throw lucid_core::InvalidQueryError("query must be a string");
    }
    query.text = body["query"].get<std::string>();
  }
  if (body.contains("top_k") && !body["top_k"].is_null()) {
    if (!body["top_k"].is_number_integer()) {
      throw lucid_core::InvalidQueryError("top_k must be an integer");
    }
    query.top_k = body["top_k"].get<int>();
  }
  if (body.contains("threshold") && !body["threshold"].is_null()) {
    if (!body["threshold"].is_number()) {
      throw lucid_core::InvalidQueryError("threshold must be a number");
    }
    query.threshold = body["threshold"].get<float>();
  }
  return query;
}

DocumentUpsert document_upsert_from_json(const nlohmann::json& body) {
  if (!body.is_object()) {
    throw lucid_core::InvalidQueryError("request body must be a JSON object");
  }
  if (!body.contains("content") || !body["content"].is_string()) {
    throw lucid_core::InvalidQueryError("content must be a string");
  }

  DocumentUpsert upsert;
  upsert.content = body["content"].get<std::string>();
  if (body.contains("previous_content") && !body["previous_content"].is_null()) {
    if (!body["previous_content"].is_string()) {
      throw lucid_core::InvalidQueryError("previous_content must be a string");
    }
    upsert.previous_content = body["previous_content"].get<std::string>();
  }
  return upsert;
}

}  // namespace lucid_api
