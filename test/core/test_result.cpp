#include <catch2/catch_test_macros.hpp>

#include <kingraph/core/result.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace kingraph;

// ===========================================================================
// Ok / Err
// ===========================================================================

TEST_CASE("Result: Ok holds the value", "[result]") {
    auto r = Result<int, Error>::Ok(7);
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 7);
}

TEST_CASE("Result: Err holds the error", "[result]") {
    auto r = Result<int, Error>::Err(Error::NotFound("Traverse", "I-1"));
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error().category == ErrorCategory::NotFound);
}

TEST_CASE("Result: ValueOr falls back on Err", "[result]") {
    auto ok = Result<std::string, Error>::Ok("jane");
    auto err = Result<std::string, Error>::Err(Error{});
    CHECK(ok.ValueOr("none") == "jane");
    CHECK(err.ValueOr("none") == "none");
}

TEST_CASE("Result: move-only value can be taken out", "[result]") {
    auto r = Result<std::unique_ptr<int>, Error>::Ok(std::make_unique<int>(3));
    auto owned = std::move(r).Value();
    REQUIRE(owned != nullptr);
    CHECK(*owned == 3);
}

// ===========================================================================
// AndThen / Map
// ===========================================================================

TEST_CASE("Result: Map transforms the value", "[result]") {
    auto r = Result<std::vector<int>, Error>::Ok({1, 2, 3});
    auto size = r.Map([](const std::vector<int>& v) { return v.size(); });
    REQUIRE(size.IsOk());
    CHECK(size.Value() == 3);
}

TEST_CASE("Result: Map passes an Err through", "[result]") {
    auto r = Result<int, Error>::Err(Error::NotFound("GetNode", "x"));
    auto mapped = r.Map([](int v) { return v * 2; });
    REQUIRE(mapped.IsErr());
    CHECK(mapped.Error().subject == "x");
}

TEST_CASE("Result: AndThen stops at the first Err", "[result]") {
    bool second_called = false;
    auto r = Result<int, Error>::Ok(1)
                 .AndThen([](int) {
                     return Result<int, Error>::Err(Error::InvalidConfig("a.yaml", "bad"));
                 })
                 .AndThen([&](int v) {
                     second_called = true;
                     return Result<int, Error>::Ok(v);
                 });
    REQUIRE(r.IsErr());
    CHECK_FALSE(second_called);
    CHECK(r.Error().message == "bad");
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, Error>::Ok();
    auto err = Result<void, Error>::Err(Error::InvalidConfig("", "broken"));
    CHECK(ok.IsOk());
    REQUIRE(err.IsErr());
    CHECK(err.Error().message == "broken");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: NotFound names the identity key", "[error]") {
    auto e = Error::NotFound("Traverse", "I-42");
    CHECK(e.operation == "Traverse");
    CHECK(e.subject == "I-42");
    CHECK(e.category == ErrorCategory::NotFound);
    CHECK(e.message.find("I-42") != std::string::npos);
    CHECK(e.CategoryName() == "not_found");
}

TEST_CASE("Error: InvalidConfig is attributed to the loader", "[error]") {
    auto e = Error::InvalidConfig("kingraph.yaml", "unknown log level");
    CHECK(e.operation == "ConfigLoader");
    CHECK(e.category == ErrorCategory::InvalidConfig);
    CHECK(e.CategoryName() == "invalid_config");
}

TEST_CASE("Error: ToString with and without subject", "[error]") {
    Error with_subject{"Rebuild", "vault", "store offline", ErrorCategory::Internal};
    Error without_subject{"Rebuild", "", "store offline", ErrorCategory::Internal};
    CHECK(with_subject.ToString() == "Rebuild [vault]: store offline");
    CHECK(without_subject.ToString() == "Rebuild: store offline");
}

TEST_CASE("Error: default category is Internal", "[error]") {
    Error e;
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.CategoryName() == "internal");
}

TEST_CASE("Error: equality includes category", "[error]") {
    Error a{"op", "s", "m", ErrorCategory::NotFound};
    Error b{"op", "s", "m", ErrorCategory::InvalidConfig};
    CHECK(a != b);
    b.category = ErrorCategory::NotFound;
    CHECK(a == b);
}
