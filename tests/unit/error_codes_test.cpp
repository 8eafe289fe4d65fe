#include <veclex/error.hpp>
#include <catch2/catch_all.hpp>

#include <string>

TEST_CASE("error codes stable subset", "[errors]") {
  using veclex::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::data_integrity) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::precondition_failed) == 4001u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::invalid_argument) == 9002u);
}

TEST_CASE("error codes have names", "[errors]") {
  using veclex::core::error_code;
  using veclex::core::to_string;
  REQUIRE(std::string(to_string(error_code::invalid_argument)) == "invalid_argument");
  REQUIRE(std::string(to_string(error_code::precondition_failed)) == "precondition_failed");
  REQUIRE(std::string(to_string(error_code::config_invalid)) == "config_invalid");
}
