#pragma once
// Credential scheme: turns a conference password into the salted value
// sent to the server. The plaintext never leaves the client.
//
// Create: credential = derive(password, generate_salt()).
// Join:   the server returns the conference salt; credential =
//         derive(password, salt) must reproduce the stored value.
#include <string>

class CredentialScheme {
public:
  virtual ~CredentialScheme() = default;

  // Fresh salt for a new conference. Throws std::runtime_error on failure.
  virtual std::string generate_salt() = 0;

  // Throws std::runtime_error if `salt` is not usable by this scheme.
  virtual std::string derive(const std::string& password, const std::string& salt) = 0;
};
