#pragma once

#include <string>

namespace lucid_core {

/**
 * @brief Generates chunk identifiers.
 */
class IdGenerator {
 public:
  static constexpr size_t ID_BYTES = 12;

  /**
   * @brief Creates a new random identifier.
   * @return ID_BYTES random bytes as a lowercase hex string (24 characters).
   * @throws std::runtime_error if the OpenSSL random generator fails.
   */
  static std::string generate();
};

}  // namespace lucid_core
