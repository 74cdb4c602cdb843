/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp types
 */

#include "lanxfer/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

namespace {

enum class TestError : uint8_t { kFirst = 0, kSecond };

}  // namespace

// ============================================================================
// expected<V, E> tests
// ============================================================================

TEST_CASE("expected success path", "[vocabulary][expected]") {
  auto r = lanxfer::expected<int, TestError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
}

TEST_CASE("expected error path", "[vocabulary][expected]") {
  auto r = lanxfer::expected<int, TestError>::error(TestError::kSecond);
  REQUIRE(!r.has_value());
  REQUIRE(!static_cast<bool>(r));
  REQUIRE(r.get_error() == TestError::kSecond);
}

TEST_CASE("expected void specialization", "[vocabulary][expected]") {
  auto ok = lanxfer::expected<void, TestError>::success();
  REQUIRE(ok.has_value());

  auto err = lanxfer::expected<void, TestError>::error(TestError::kFirst);
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == TestError::kFirst);
}

TEST_CASE("expected value_or", "[vocabulary][expected]") {
  auto ok = lanxfer::expected<int, TestError>::success(10);
  REQUIRE(ok.value_or(99) == 10);

  auto err = lanxfer::expected<int, TestError>::error(TestError::kFirst);
  REQUIRE(err.value_or(99) == 99);
}

TEST_CASE("expected holds non-trivial values", "[vocabulary][expected]") {
  auto r1 = lanxfer::expected<std::string, TestError>::success("payload");
  auto r2 = r1;  // copy
  REQUIRE(r2.value() == "payload");

  auto r3 = static_cast<lanxfer::expected<std::string, TestError>&&>(r1);
  REQUIRE(r3.value() == "payload");

  r2 = lanxfer::expected<std::string, TestError>::error(TestError::kSecond);
  REQUIRE(!r2.has_value());
  REQUIRE(r2.get_error() == TestError::kSecond);
}

TEST_CASE("and_then chains on success", "[vocabulary][expected]") {
  using IntResult = lanxfer::expected<int, TestError>;
  using StrResult = lanxfer::expected<std::string, TestError>;

  auto r = lanxfer::and_then(IntResult::success(7), [](int v) {
    return StrResult::success(std::to_string(v * 6));
  });
  REQUIRE(r.has_value());
  REQUIRE(r.value() == "42");
}

TEST_CASE("and_then passes errors through", "[vocabulary][expected]") {
  using IntResult = lanxfer::expected<int, TestError>;
  bool called = false;
  auto r = lanxfer::and_then(IntResult::error(TestError::kSecond),
                             [&called](int v) {
                               called = true;
                               return IntResult::success(v);
                             });
  REQUIRE_FALSE(called);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == TestError::kSecond);
}

TEST_CASE("or_else sees only errors", "[vocabulary][expected]") {
  using IntResult = lanxfer::expected<int, TestError>;
  TestError seen = TestError::kFirst;
  int calls = 0;
  auto on_error = [&](TestError e) {
    seen = e;
    ++calls;
  };

  auto ok = lanxfer::or_else(IntResult::success(1), on_error);
  REQUIRE(ok.value() == 1);
  REQUIRE(calls == 0);

  auto bad = lanxfer::or_else(IntResult::error(TestError::kSecond), on_error);
  REQUIRE(bad.get_error() == TestError::kSecond);
  REQUIRE(calls == 1);
  REQUIRE(seen == TestError::kSecond);
}

// ============================================================================
// optional<T> tests
// ============================================================================

TEST_CASE("optional empty", "[vocabulary][optional]") {
  lanxfer::optional<int> o;
  REQUIRE(!o.has_value());
  REQUIRE(!static_cast<bool>(o));
}

TEST_CASE("optional with value", "[vocabulary][optional]") {
  lanxfer::optional<int> o(42);
  REQUIRE(o.has_value());
  REQUIRE(o.value() == 42);
}

TEST_CASE("optional value_or and reset", "[vocabulary][optional]") {
  lanxfer::optional<std::string> empty;
  REQUIRE(empty.value_or(std::string("none")) == "none");

  lanxfer::optional<std::string> full(std::string("set"));
  REQUIRE(full.value_or(std::string("none")) == "set");
  full.reset();
  REQUIRE(!full.has_value());
}

// ============================================================================
// ScopeGuard
// ============================================================================

TEST_CASE("ScopeGuard runs on scope exit", "[vocabulary][scope_guard]") {
  int counter = 0;
  {
    LANXFER_SCOPE_EXIT(++counter);
    REQUIRE(counter == 0);
  }
  REQUIRE(counter == 1);
}

TEST_CASE("ScopeGuard release skips the callable", "[vocabulary][scope_guard]") {
  int counter = 0;
  {
    auto guard = lanxfer::MakeScopeGuard([&counter]() { ++counter; });
    guard.release();
  }
  REQUIRE(counter == 0);
}
