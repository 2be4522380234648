#include "lucid_core/services/document_index_sync.hpp"

#include <iostream>

namespace lucid_core {

DocumentIndexSync::DocumentIndexSync(std::shared_ptr<RagService> rag_service)
    : rag_service_(std::move(rag_service)) {}

size_t DocumentIndexSync::on_document_created(const std::string& document_id,
                                              const std::string& content,
                                              const RequestContext& context) {
  try {
    return rag_service_->index_document(document_id, content, context);
  } catch (const std::exception& e) {
    std::cerr << "Warning: failed to index document " << document_id << ": " << e.what()
              << std::endl;
    return 0;
  }
}

size_t DocumentIndexSync::on_document_updated(const std::string& document_id,
                                              const std::string& old_content,
                                              const std::string& new_content,
                                              const RequestContext& context) {
  if (old_content == new_content) {
    return 0;
  }

  try {
    rag_service_->delete_document_chunks(document_id);
  } catch (const std::exception& e) {
    std::cerr << "Warning: failed to delete old chunks of document " << document_id << ": "
              << e.what() << std::endl;
  }

  if (new_content.empty()) {
    return 0;
  }
  return on_document_created(document_id, new_content, context);
}

void DocumentIndexSync::on_document_deleted(const std::string& document_id) {
  try {
    rag_service_->delete_document_chunks(document_id);
  } catch (const std::exception& e) {
    std::cerr << "Warning: failed to delete chunks of document " << document_id << ": "
              << e.what() << std::endl;
  }
}

}  // namespace lucid_core
