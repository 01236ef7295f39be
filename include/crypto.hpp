#pragma once
// Crypto module: OpenSSL-backed randomness and secret hygiene.
#include <string>

// Local pseudonym for the creator of a conference: "anon-" followed by
// 16 hex digits from the OpenSSL CSPRNG. Throws std::runtime_error if the
// generator is not seeded.
std::string random_pseudonym();

// Overwrite the contents of `secret` and leave it empty.
void secure_wipe(std::string& secret);
