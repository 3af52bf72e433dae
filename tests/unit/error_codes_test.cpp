#include <verdict/error.hpp>
#include <catch2/catch_all.hpp>

#include <string>

TEST_CASE("error codes stable subset", "[errors]") {
  using verdict::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::not_eligible) == 4002u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::invalid_argument) == 9002u);
  REQUIRE(static_cast<unsigned>(error_code::unsupported) == 9005u);
}

TEST_CASE("error code names", "[errors]") {
  using verdict::core::error_code;
  using verdict::core::to_string;
  REQUIRE(std::string(to_string(error_code::not_eligible)) == "not_eligible");
  REQUIRE(std::string(to_string(error_code::config_invalid)) == "config_invalid");
  REQUIRE(std::string(to_string(error_code::unsupported)) == "unsupported");
}
