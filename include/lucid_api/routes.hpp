#pragma once
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>

#include "lucid_api/server.hpp"

namespace lucid_core {
class RagService;
class DocumentIndexSync;
class ChunkStore;
}  // namespace lucid_core

namespace lucid_api {

class Routes {
 public:
  static constexpr const char* VERSION = "0.1.0";

  // store may be null when no chunk store is configured.
  Routes(std::shared_ptr<lucid_core::RagService> rag_service,
         std::shared_ptr<lucid_core::DocumentIndexSync> index_sync,
         std::shared_ptr<lucid_core::ChunkStore> store,
         std::chrono::milliseconds request_timeout);
  ~Routes() = default;

  Routes(const Routes&) = delete;
  Routes& operator=(const Routes&) = delete;

  void register_routes(Server& server);

  // Route handlers, callable without a running server.
  crow::response handle_health_check(const crow::request& req);
  crow::response handle_query(const crow::request& req);
  crow::response handle_put_document(const crow::request& req, const std::string& document_id);
  crow::response handle_delete_document(const crow::request& req, const std::string& document_id);
  crow::response handle_get_document_chunks(const crow::request& req,
                                            const std::string& document_id);

 private:
  std::shared_ptr<lucid_core::RagService> rag_service_;
  std::shared_ptr<lucid_core::DocumentIndexSync> index_sync_;
  std::shared_ptr<lucid_core::ChunkStore> store_;
  std::chrono::milliseconds request_timeout_;

  nlohmann::json parse_json_body(const std::string& body);
  nlohmann::json create_error_response(const std::string& error);
  crow::response create_json_response(const nlohmann::json& json_data, int status_code = 200);
};

}  // namespace lucid_api
