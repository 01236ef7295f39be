#include <catch2/catch.hpp>

#include "crypto.hpp"
#include <set>

TEST_CASE("Pseudonyms are anon- plus sixteen hex digits", "[crypto]") {
  std::string p = random_pseudonym();
  REQUIRE(p.size() == 21);
  REQUIRE(p.compare(0, 5, "anon-") == 0);
  for (size_t i = 5; i < p.size(); ++i) {
    char c = p[i];
    REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
  }
}

TEST_CASE("Pseudonyms do not repeat", "[crypto]") {
  std::set<std::string> seen;
  for (int i = 0; i < 200; ++i)
    seen.insert(random_pseudonym());
  REQUIRE(seen.size() == 200);
}

TEST_CASE("Wiping empties the secret", "[crypto]") {
  std::string secret = "hunter2";
  secure_wipe(secret);
  REQUIRE(secret.empty());

  std::string empty;
  secure_wipe(empty);
  REQUIRE(empty.empty());
}
