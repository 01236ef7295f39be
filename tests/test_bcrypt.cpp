#include <catch2/catch.hpp>

#include "bcrypt.hpp"
#include <stdexcept>

TEST_CASE("Rounds outside the bcrypt range are refused", "[bcrypt]") {
  REQUIRE_THROWS_AS(BcryptCredentials(3), std::invalid_argument);
  REQUIRE_THROWS_AS(BcryptCredentials(32), std::invalid_argument);
  REQUIRE(BcryptCredentials().cost() == BCRYPT_DEFAULT_ROUNDS);
  REQUIRE(BcryptCredentials(4).cost() == 4);
}

TEST_CASE("A credential can be reproduced from its salt", "[bcrypt]") {
  BcryptCredentials bcrypt(4);
  std::string salt = bcrypt.generate_salt();
  REQUIRE(salt.size() >= 29);
  REQUIRE(salt[0] == '$');

  std::string credential = bcrypt.derive("hello", salt);
  REQUIRE(credential.size() == 60);
  REQUIRE(credential.find("hello") == std::string::npos);

  // The server hands joiners the first 29 chars of the stored credential.
  std::string stored_salt = credential.substr(0, 29);
  REQUIRE(bcrypt.derive("hello", stored_salt) == credential);
  REQUIRE(bcrypt.derive("hellO", stored_salt) != credential);
}

TEST_CASE("Fresh salts differ", "[bcrypt]") {
  BcryptCredentials bcrypt(4);
  REQUIRE(bcrypt.generate_salt() != bcrypt.generate_salt());
}

TEST_CASE("Malformed salts are rejected", "[bcrypt]") {
  BcryptCredentials bcrypt(4);
  REQUIRE_THROWS_AS(bcrypt.derive("hello", ""), std::runtime_error);
  REQUIRE_THROWS_AS(bcrypt.derive("hello", "salt-1"), std::runtime_error);
  REQUIRE_THROWS_AS(bcrypt.derive("hello", std::string(29, 'x')), std::runtime_error);
}

TEST_CASE("Salts demanding an excessive cost are refused before hashing", "[bcrypt]") {
  BcryptCredentials bcrypt(4);
  const std::string tail = "abcdefghijklmnopqrstuu";
  REQUIRE_THROWS_AS(bcrypt.derive("hello", "$2b$31$" + tail), std::runtime_error);
  REQUIRE_THROWS_AS(bcrypt.derive("hello", "$2b$17$" + tail), std::runtime_error);
  REQUIRE_THROWS_AS(bcrypt.derive("hello", "$2b$x4$" + tail), std::runtime_error);

  // Our own cost raises the ceiling for salts we generated.
  BcryptCredentials costly(18);
  REQUIRE(costly.cost() == 18);
  REQUIRE_THROWS_AS(costly.derive("hello", "$2b$19$" + tail), std::runtime_error);
}

TEST_CASE("Salts within the accepted cost are usable", "[bcrypt]") {
  BcryptCredentials bcrypt(4);
  std::string credential = bcrypt.derive("hello", "$2a$05$abcdefghijklmnopqrstuu");
  REQUIRE(credential.size() == 60);
  REQUIRE(credential.compare(0, 7, "$2a$05$") == 0);
}
