#include "bcrypt.hpp"
#include <algorithm>
#include <bcrypt/bcrypt.h>
#include <cctype>
#include <openssl/crypto.h>
#include <stdexcept>
#include <string>

BcryptCredentials::BcryptCredentials(int rounds) : rounds(rounds) {
  if (rounds < BCRYPT_MIN_ROUNDS || rounds > BCRYPT_MAX_ROUNDS) {
    throw std::invalid_argument("bcrypt rounds must be between 4 and 31");
  }
}

std::string BcryptCredentials::generate_salt() {
  char salt[BCRYPT_HASHSIZE] = {0};
  if (bcrypt_gensalt(rounds, salt) != 0) {
    throw std::runtime_error("Failed to generate bcrypt salt");
  }
  return std::string(salt);
}

std::string BcryptCredentials::derive(const std::string& password, const std::string& salt) {
  // "$2b$NN$" + 22 salt chars
  if (salt.size() < 29 || salt[0] != '$' || salt[3] != '$' || salt[6] != '$' || !std::isdigit(static_cast<unsigned char>(salt[4])) ||
      !std::isdigit(static_cast<unsigned char>(salt[5]))) {
    throw std::runtime_error("Malformed bcrypt salt");
  }
  int salt_rounds = (salt[4] - '0') * 10 + (salt[5] - '0');
  if (salt_rounds > std::max(rounds, BCRYPT_MAX_SALT_ROUNDS)) {
    throw std::runtime_error("bcrypt salt cost " + std::to_string(salt_rounds) + " is too high");
  }

  char hash[BCRYPT_HASHSIZE] = {0};
  if (bcrypt_hashpw(password.c_str(), salt.c_str(), hash) != 0) {
    OPENSSL_cleanse(hash, sizeof(hash));
    throw std::runtime_error("Failed to hash password");
  }
  std::string credential(hash);
  OPENSSL_cleanse(hash, sizeof(hash));
  return credential;
}
