#include "lucid_core/utils/id_generator.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lucid_core {

std::string IdGenerator::generate() {
  unsigned char bytes[ID_BYTES];
  if (RAND_bytes(bytes, static_cast<int>(ID_BYTES)) != 1) {
    char reason[256];
    ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
    throw std::runtime_error("Failed to generate random identifier: " + std::string(reason));
  }

  std::stringstream ss;
  for (unsigned char byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

}  // namespace lucid_core
