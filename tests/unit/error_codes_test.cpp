#include <lumen/error.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using lumen::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::data_integrity) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::decode_failed) == 3002u);
  REQUIRE(static_cast<unsigned>(error_code::unavailable) == 7001u);
  REQUIRE(static_cast<unsigned>(error_code::provider_failed) == 7002u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::invalid_argument) == 9002u);
  REQUIRE(static_cast<unsigned>(error_code::unsupported) == 9005u);
}

TEST_CASE("error codes have names", "[errors]") {
  using lumen::core::error_code;
  using lumen::core::to_string;
  REQUIRE(to_string(error_code::data_integrity) == "data_integrity");
  REQUIRE(to_string(error_code::cancelled) == "cancelled");
  REQUIRE(to_string(static_cast<error_code>(4242)) == "unknown");
}

TEST_CASE("make_unexpected carries code, message and component", "[errors]") {
  using namespace lumen::core;
  std::expected<int, error> r = make_unexpected(error_code::not_found, "gone", "cache.load");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::not_found);
  REQUIRE(r.error().message == "gone");
  REQUIRE(r.error().component == "cache.load");
}
