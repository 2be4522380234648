#include "lucid_api/routes.hpp"

#include <iostream>

#include "lucid_api/mappers.hpp"
#include "lucid_core/db/chunk_store.hpp"
#include "lucid_core/errors.hpp"
#include "lucid_core/services/document_index_sync.hpp"
#include "lucid_core/services/rag_service.hpp"

namespace lucid_api {

Routes::Routes(std::shared_ptr<lucid_core::RagService> rag_service,
               std::shared_ptr<lucid_core::DocumentIndexSync> index_sync,
               std::shared_ptr<lucid_core::ChunkStore> store,
               std::chrono::milliseconds request_timeout)
    : rag_service_(std::move(rag_service)),
      index_sync_(std::move(index_sync)),
      store_(std::move(store)),
      request_timeout_(request_timeout) {}

void Routes::register_routes(Server& server) {
  auto& app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request& req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/query").methods(crow::HTTPMethod::POST)([this](const crow::request& req) {
    return handle_query(req);
  });

  CROW_ROUTE(app, "/documents/<string>")
      .methods(crow::HTTPMethod::PUT)([this](const crow::request& req, const std::string& id) {
        return handle_put_document(req, id);
      });

  CROW_ROUTE(app, "/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request& req, const std::string& id) {
        return handle_delete_document(req, id);
      });

  CROW_ROUTE(app, "/documents/<string>/chunks")
  ([this](const crow::request& req, const std::string& id) {
    return handle_get_document_chunks(req, id);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request& /*req*/) {
  nlohmann::json response;
  response["status"] = "healthy";
  response["version"] = VERSION;
  try {
    response["chunks"] = store_ ? store_->count() : 0;
  } catch (const lucid_core::ChunkStoreError& e) {
    std::cerr << "Warning: health check could not count chunks: " << e.what() << std::endl;
    response["status"] = "degraded";
    response["chunks"] = nullptr;
  }
  return create_json_response(response);
}

crow::response Routes::handle_query(const crow::request& req) {
  try {
    lucid_core::Query query = query_from_json(parse_json_body(req.body));
    auto context = lucid_core::RequestContext::with_timeout(request_timeout_);

    lucid_core::Response response = rag_service_->query(query, context);
    std::cout << "Query (" << query.text.size() << " bytes) answered in "
              << response.processing_time_ms << " ms with " << response.relevant_chunks.size()
              << " chunks" << std::endl;
    return create_json_response(response_to_json(response));
  } catch (const nlohmann::json::parse_error&) {
    return create_json_response(create_error_response("Invalid JSON body"), 400);
  } catch (const lucid_core::InvalidQueryError& e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const lucid_core::DeadlineExceededError& e) {
    std::cerr << "Error: query timed out: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 504);
  } catch (const std::exception& e) {
    std::cerr << "Error: query failed: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_put_document(const crow::request& req,
                                           const std::string& document_id) {
  DocumentUpsert upsert;
  try {
    upsert = document_upsert_from_json(parse_json_body(req.body));
  } catch (const nlohmann::json::parse_error&) {
    return create_json_response(create_error_response("Invalid JSON body"), 400);
  } catch (const lucid_core::InvalidQueryError& e) {
    return create_json_response(create_error_response(e.what()), 400);
  }

  auto context = lucid_core::RequestContext::with_timeout(request_timeout_);
  size_t stored = 0;
  if (upsert.previous_content) {
    stored = index_sync_->on_document_updated(document_id, *upsert.previous_content,
                                              upsert.content, context);
  } else {
    stored = index_sync_->on_document_created(document_id, upsert.content, context);
  }
  std::cout << "Indexed document " << document_id << ": " << stored << " chunks" << std::endl;

  nlohmann::json response;
  response["document_id"] = document_id;
  response["chunks"] = stored;
  return create_json_response(response);
}

crow::response Routes::handle_delete_document(const crow::request& /*req*/,
                                              const std::string& document_id) {
  index_sync_->on_document_deleted(document_id);
  nlohmann::json response;
  response["document_id"] = document_id;
  response["deleted"] = true;
  return create_json_response(response);
}

crow::response Routes::handle_get_document_chunks(const crow::request& /*req*/,
                                                  const std::string& document_id) {
  nlohmann::json chunks = nlohmann::json::array();
  if (store_) {
    try {
      for (const auto& chunk : store_->get_by_document_id(document_id)) {
        chunks.push_back(chunk_to_json(chunk, /*include_embedding*/ false));
      }
    } catch (const lucid_core::ChunkStoreError& e) {
      std::cerr << "Error: failed to load chunks of " << document_id << ": " << e.what()
                << std::endl;
      return create_json_response(create_error_response(e.what()), 500);
    }
  }

  nlohmann::json response;
  response["document_id"] = document_id;
  response["chunks"] = chunks;
  return create_json_response(response);
}

crow::response Routes::create_json_response(const nlohmann::json& json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_error_response(const std::string& error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string& body) {
  return nlohmann::json::parse(body);
}

}  // namespace lucid_api
