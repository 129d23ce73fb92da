/**
 * @file TestError.cpp
 * @brief Unit tests for pxv::core::Error, Expected and the PXV_TRY macros.
 */

#include <catch2/catch_test_macros.hpp>

#include <pxv/core/Expected.hpp>

#include <string>

namespace pxv::core {

namespace {

Expected<int> half(int value)
{
    if (value % 2 != 0)
    {
        return makeError(ErrorCode::kInvalidArgument, "odd value " + std::to_string(value));
    }
    return value / 2;
}

Expected<int> quarter(int value)
{
    const int h = PXV_TRY(half(value));
    return PXV_TRY(half(h));
}

Expected<void> requireEven(int value)
{
    PXV_TRY_VOID(half(value).transform([](int) {}));
    return {};
}

} // anonymous namespace

TEST_CASE("makeError carries code, message and origin", "[core][error]")
{
    auto result = half(3);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == ErrorCode::kInvalidArgument);
    REQUIRE(result.error().message() == "odd value 3");
    REQUIRE(std::string{result.error().location().file_name()}.find("TestError.cpp") != std::string::npos);
}

TEST_CASE("PXV_TRY propagates the first error", "[core][error]")
{
    REQUIRE(quarter(8).value() == 2);

    auto odd = quarter(6);
    REQUIRE_FALSE(odd.has_value());
    REQUIRE(odd.error().message() == "odd value 3");
}

TEST_CASE("PXV_TRY_VOID returns early on failure", "[core][error]")
{
    REQUIRE(requireEven(4).has_value());
    REQUIRE(requireEven(5).error().code() == ErrorCode::kInvalidArgument);
}

TEST_CASE("Error codes have stable names", "[core][error]")
{
    REQUIRE(toString(ErrorCode::kOutOfBounds) == "OutOfBounds");
    REQUIRE(toString(ErrorCode::kInsufficientResource) == "InsufficientResource");
    REQUIRE(toString(ErrorCode::kNotFound) == "NotFound");
    REQUIRE(toString(ErrorCode::kUnknownAction) == "UnknownAction");
    REQUIRE(toString(ErrorCode::kInvariantViolation) == "InvariantViolation");
}

} // namespace pxv::core
