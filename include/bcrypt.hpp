#pragma once
// bcrypt credentials (libbcrypt).
//
// Credentials are 60-char strings like $2b$10$N9qo8uLOickgx2ZMRZoMye...;
// the first 29 chars are the salt, which is what the server hands out on join.
#include "credentials.hpp"

#define BCRYPT_MIN_ROUNDS 4
#define BCRYPT_MAX_ROUNDS 31
#define BCRYPT_DEFAULT_ROUNDS 10
// Highest cost accepted in a salt from the server, unless our own cost is higher.
#define BCRYPT_MAX_SALT_ROUNDS 16

class BcryptCredentials : public CredentialScheme {
  int rounds;

public:
  // Throws std::invalid_argument if `rounds` is outside [4, 31].
  explicit BcryptCredentials(int rounds = BCRYPT_DEFAULT_ROUNDS);

  std::string generate_salt() override;
  // Throws std::runtime_error on a malformed salt or one whose cost exceeds
  // max(cost(), BCRYPT_MAX_SALT_ROUNDS).
  std::string derive(const std::string& password, const std::string& salt) override;

  int cost() const {
    return rounds;
  }
};
