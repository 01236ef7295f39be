#include "crypto.hpp"
#include <iomanip>
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <sstream>
#include <stdexcept>

std::string random_pseudonym() {
  unsigned char bytes[8];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw std::runtime_error("Failed to generate random pseudonym");
  }

  std::ostringstream oss;
  oss << "anon-" << std::hex << std::setfill('0');
  for (unsigned char b : bytes)
    oss << std::setw(2) << static_cast<int>(b);
  return oss.str();
}

void secure_wipe(std::string& secret) {
  if (!secret.empty())
    OPENSSL_cleanse(&secret[0], secret.size());
  secret.clear();
}
