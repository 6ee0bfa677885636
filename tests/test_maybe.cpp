#include "core/types/monad/maybe.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>

using namespace nvec;

TEST(Maybe, MapThenMatchOnJust)
{
    const auto result = Maybe<int>::just(5)
                            .map([](int x) { return x * 2; })
                            .match([](int x) { return x; }, [] { return -1; });
    EXPECT_EQ(result, 10);
}

TEST(Maybe, MapThenMatchOnNone)
{
    bool called       = false;
    const auto result = Maybe<int>::none()
                            .map([&called](int x) {
                                called = true;
                                return x * 2;
                            })
                            .match([](int x) { return x; }, [] { return -1; });
    EXPECT_EQ(result, -1);
    EXPECT_FALSE(called);
}

TEST(Maybe, JustOfAbsentValueIsNone)
{
    int* null_ptr = nullptr;
    EXPECT_FALSE(Maybe<int*>::just(null_ptr).has_value());
    EXPECT_FALSE(Maybe<int*>::just(nullptr).has_value());
    EXPECT_FALSE(
        Maybe<std::optional<int>>::just(std::optional<int>{}).has_value()
    );
    EXPECT_FALSE(
        Maybe<std::shared_ptr<int>>::just(std::shared_ptr<int>{}).has_value()
    );
    EXPECT_EQ(
        Maybe<int*>::just(null_ptr).error_code(),
        ErrorCode::ABSENT_VALUE
    );

    int value = 3;
    EXPECT_TRUE(Maybe<int*>::just(&value).has_value());
    EXPECT_TRUE(Maybe<std::optional<int>>::just(std::optional<int>{0})
                    .has_value());
}

TEST(Maybe, ZeroAndEmptyStringAreNotAbsent)
{
    EXPECT_TRUE(Maybe<int>::just(0).has_value());
    EXPECT_TRUE(Maybe<std::string>::just(std::string{}).has_value());
    EXPECT_TRUE(Maybe<double>::from(0.0).has_value());
}

TEST(Maybe, MapToAbsentResultBecomesNone)
{
    int value         = 1;
    const auto result = Maybe<int>::just(value).map([](int) -> int* {
        return nullptr;
    });
    EXPECT_FALSE(result.has_value());
}

TEST(Maybe, FlatMapReturnsInnerMaybe)
{
    const auto half = [](int x) {
        return x % 2 == 0 ? Maybe<int>::just(x / 2) : Maybe<int>::none();
    };

    EXPECT_EQ(Maybe<int>::just(8).flat_map(half).value(), 4);
    EXPECT_FALSE(Maybe<int>::just(3).flat_map(half).has_value());

    bool called     = false;
    const auto none = Maybe<int>::none().flat_map([&called](int x) {
        called = true;
        return Maybe<int>::just(x);
    });
    EXPECT_FALSE(none.has_value());
    EXPECT_FALSE(called);
}

TEST(Maybe, MatchRunsExactlyOneHandler)
{
    int just_calls = 0;
    int none_calls = 0;
    const auto on_just = [&](const std::string& s) {
        ++just_calls;
        return s.size();
    };
    const auto on_none = [&]() -> std::size_t {
        ++none_calls;
        return 0;
    };

    EXPECT_EQ(Maybe<std::string>::just("abc").match(on_just, on_none), 3u);
    EXPECT_EQ(Maybe<std::string>::none().match(on_just, on_none), 0u);
    EXPECT_EQ(just_calls, 1);
    EXPECT_EQ(none_calls, 1);
}

TEST(Maybe, UnwrapAndEquality)
{
    EXPECT_EQ(Maybe<int>::none().unwrap_or(7), 7);
    EXPECT_EQ(Maybe<int>::just(2).unwrap_or(7), 2);
    EXPECT_EQ(Maybe<int>::none().unwrap_or_else([] { return 9; }), 9);
    EXPECT_EQ(Maybe<int>::none().or_else([] { return 4; }).value(), 4);

    EXPECT_EQ(just(1), Maybe<int>::just(1));
    EXPECT_NE(just(1), none<int>());
    EXPECT_EQ(none<int>(), Maybe<int>::none());
}

TEST(Maybe, NoneKeepsErrorCodeThroughMap)
{
    const Maybe<int> failed{nothing_t{ErrorCode::INDEX_OUT_OF_RANGE}};
    const auto mapped = failed.map([](int x) { return x + 1.0; });
    EXPECT_FALSE(mapped.has_value());
    EXPECT_EQ(mapped.error_code(), ErrorCode::INDEX_OUT_OF_RANGE);
}
