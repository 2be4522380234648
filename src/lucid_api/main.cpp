#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "lucid_api/config.hpp"
#include "lucid_api/routes.hpp"
#include "lucid_api/server.hpp"
#include "lucid_core/chunking/chunker.hpp"
#include "lucid_core/db/database_manager.hpp"
#include "lucid_core/db/memory_chunk_store.hpp"
#include "lucid_core/db/sqlite_chunk_store.hpp"
#include "lucid_core/errors.hpp"
#include "lucid_core/llm/ollama_client.hpp"
#include "lucid_core/llm/openai_client.hpp"
#include "lucid_core/services/document_index_sync.hpp"
#include "lucid_core/services/rag_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

namespace {

// Leaves the providers empty when none is usable; the service then runs degraded.
void attach_providers(const lucid_api::Config& config, lucid_core::RagDependencies& deps) {
  const std::chrono::milliseconds timeout(config.request_timeout_ms);

  if (config.provider == "openai") {
    if (config.openai_api_key.empty()) {
      std::cerr << "Warning: OPENAI_API_KEY is not set; queries will not be answered" << std::endl;
      return;
    }
    auto client = std::make_shared<lucid_core::OpenAIClient>(config.openai_api_key,
                                                             config.openai_base_url, timeout);
    deps.embedder = client;
    deps.chat = client;
  } else if (config.provider == "ollama") {
    try {
      auto client = std::make_shared<lucid_core::OllamaClient>(config.ollama_url, timeout);
      deps.embedder = client;
      deps.chat = client;
    } catch (const lucid_core::ProviderError& e) {
      std::cerr << "Warning: " << e.what() << "; queries will not be answered" << std::endl;
    }
  }
}

}  // namespace

int main() {
  try {
    lucid_api::Config config = lucid_api::Config::load();

    std::cout << "Starting Lucid API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Chunk store: " << config.chunk_store << std::endl;
    if (config.chunk_store == "sqlite") {
      std::cout << "Database Path: " << config.database_path << std::endl;
    }
    std::cout << "Provider: " << config.provider << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Chat Model: " << config.chat_model << std::endl;

    auto& db_manager = lucid_core::DatabaseManager::get_instance();
    lucid_core::RagDependencies deps;
    if (config.chunk_store == "sqlite") {
      db_manager.initialize(config.database_path, config.db_pool_size);
      deps.store = std::make_shared<lucid_core::SqliteChunkStore>(db_manager);
    } else {
      deps.store = std::make_shared<lucid_core::InMemoryChunkStore>();
    }
    deps.chunker = std::make_shared<lucid_core::Chunker>(config.chunk_size, config.chunk_overlap);
    attach_providers(config, deps);

    lucid_core::RagServiceConfig rag_config;
    rag_config.embedding_model = config.embedding_model;
    rag_config.chat_model = config.chat_model;
    rag_config.default_top_k = config.top_k;
    rag_config.default_threshold = static_cast<float>(config.threshold);
    rag_config.index_workers = config.index_workers;

    auto store = deps.store;
    auto rag_service = std::make_shared<lucid_core::RagService>(rag_config, std::move(deps));
    auto index_sync = std::make_shared<lucid_core::DocumentIndexSync>(rag_service);

    const auto& caps = rag_service->capabilities();
    std::cout << "Capabilities: query=" << (caps.can_query ? "yes" : "no")
              << " index=" << (caps.can_index ? "yes" : "no")
              << " delete=" << (caps.can_delete ? "yes" : "no") << std::endl;

    lucid_api::Server server(config.host(), config.port());
    lucid_api::Routes routes(rag_service, index_sync, store,
                             std::chrono::milliseconds(config.request_timeout_ms));
    routes.register_routes(server);

    server.get_app().signal_clear();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
