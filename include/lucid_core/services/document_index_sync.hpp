#pragma once

#include <memory>
#include <string>

#include "lucid_core/services/rag_service.hpp"

namespace lucid_core {

/**
 * @brief Keeps the chunk index in step with document mutations.
 *
 * Indexing runs after the document itself was saved, so failures here are
 * logged and never propagated to the caller.
 */
class DocumentIndexSync {
 public:
  explicit DocumentIndexSync(std::shared_ptr<RagService> rag_service);

  // Returns the number of chunks stored.
  size_t on_document_created(const std::string& document_id,
                             const std::string& content,
                             const RequestContext& context = {});

  /**
   * @brief Re-indexes a document whose content changed.
   *
   * Old chunks are deleted first; new ones are indexed only when the new
   * content is non-empty. The two steps are not atomic.
   *
   * @return Number of chunks stored for the new content; 0 if unchanged.
   */
  size_t on_document_updated(const std::string& document_id,
                             const std::string& old_content,
                             const std::string& new_content,
                             const RequestContext& context = {});

  void on_document_deleted(const std::string& document_id);

 private:
  std::shared_ptr<RagService> rag_service_;
};

}  // namespace lucid_core
