/*
 * test_coercion.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_coercion.cpp
 * @brief Tests for client field coercion helpers
 */

#include <gtest/gtest.h>
#include "gateway/coercion.hpp"
#include "gateway/exception.hpp"

#include <limits>

using namespace typhon::gateway;
using json = nlohmann::json;

// =============================================================================
// Text Helpers
// =============================================================================

TEST(CoercionTextTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(coerce::trim("  a b \t\r\n"), "a b");
    EXPECT_EQ(coerce::trim("   "), "");
    EXPECT_EQ(coerce::trim(""), "");
}

TEST(CoercionTextTest, CaseConversion) {
    EXPECT_EQ(coerce::toLower("ReAd"), "read");
    EXPECT_EQ(coerce::toUpper("debug"), "DEBUG");
}

TEST(CoercionTextTest, StringifyScalars) {
    EXPECT_EQ(coerce::stringify(json("abc")), "abc");
    EXPECT_EQ(coerce::stringify(json(nullptr)), "");
    EXPECT_EQ(coerce::stringify(json(true)), "true");
    EXPECT_EQ(coerce::stringify(json(42)), "42");
    EXPECT_EQ(coerce::stringify(json::array({1, 2})), "[1,2]");
}

// =============================================================================
// toBool
// =============================================================================

TEST(CoercionBoolTest, NullYieldsDefault) {
    EXPECT_TRUE(coerce::toBool(json(nullptr), true));
    EXPECT_FALSE(coerce::toBool(json(nullptr), false));
}

TEST(CoercionBoolTest, BooleansPassThrough) {
    EXPECT_TRUE(coerce::toBool(json(true), false));
    EXPECT_FALSE(coerce::toBool(json(false), true));
}

TEST(CoercionBoolTest, NumbersAreTrueWhenNonZero) {
    EXPECT_TRUE(coerce::toBool(json(2), false));
    EXPECT_TRUE(coerce::toBool(json(-1), false));
    EXPECT_TRUE(coerce::toBool(json(0.5), false));
    EXPECT_FALSE(coerce::toBool(json(0), true));
    EXPECT_FALSE(coerce::toBool(json(0.0), true));
}

TEST(CoercionBoolTest, TruthyWordsIgnoreCaseAndWhitespace) {
    for (const auto* word : {"1", "true", "YES", " On ", "True\n"}) {
        EXPECT_TRUE(coerce::toBool(json(word), false)) << word;
    }
}

TEST(CoercionBoolTest, OtherStringsAreFalse) {
    for (const auto* word : {"0", "false", "no", "off", "", "maybe"}) {
        EXPECT_FALSE(coerce::toBool(json(word), true)) << word;
    }
}

TEST(CoercionBoolTest, ContainersYieldDefault) {
    EXPECT_TRUE(coerce::toBool(json::array({1}), true));
    EXPECT_FALSE(coerce::toBool(json::object(), false));
}

// =============================================================================
// toInt / toOptionalInt
// =============================================================================

TEST(CoercionIntTest, IntegersPassThrough) {
    EXPECT_EQ(coerce::toInt(json(7), 1), 7);
    EXPECT_EQ(coerce::toInt(json(-3), 1), -3);
}

TEST(CoercionIntTest, FloatsTruncateTowardZero) {
    EXPECT_EQ(coerce::toInt(json(2.9), 0), 2);
    EXPECT_EQ(coerce::toInt(json(-2.9), 0), -2);
}

TEST(CoercionIntTest, NumericStringsParse) {
    EXPECT_EQ(coerce::toInt(json(" 42 "), 0), 42);
    EXPECT_EQ(coerce::toInt(json("+8"), 0), 8);
    EXPECT_EQ(coerce::toInt(json("-15"), 0), -15);
}

TEST(CoercionIntTest, UnparsableValuesYieldDefault) {
    EXPECT_EQ(coerce::toInt(json("abc"), 90), 90);
    EXPECT_EQ(coerce::toInt(json("4.5"), 90), 90);
    EXPECT_EQ(coerce::toInt(json(""), 90), 90);
    EXPECT_EQ(coerce::toInt(json("   "), 90), 90);
    EXPECT_EQ(coerce::toInt(json("+-3"), 90), 90);
    EXPECT_EQ(coerce::toInt(json(nullptr), 90), 90);
    EXPECT_EQ(coerce::toInt(json::array(), 90), 90);
    EXPECT_EQ(coerce::toInt(json(true), 90), 90);
}

TEST(CoercionIntTest, OutOfRangeYieldsDefault) {
    EXPECT_EQ(coerce::toInt(json("99999999999999999999999"), 5), 5);
    EXPECT_EQ(coerce::toInt(json(std::numeric_limits<std::uint64_t>::max()), 5),
              5);
    EXPECT_EQ(coerce::toInt(json(1e300), 5), 5);
}

TEST(CoercionIntTest, OptionalIntIsAbsentWhenUnparsable) {
    EXPECT_FALSE(coerce::toOptionalInt(json(nullptr)).has_value());
    EXPECT_FALSE(coerce::toOptionalInt(json("")).has_value());
    EXPECT_FALSE(coerce::toOptionalInt(json("x")).has_value());
    ASSERT_TRUE(coerce::toOptionalInt(json("120")).has_value());
    EXPECT_EQ(*coerce::toOptionalInt(json("120")), 120);
}

// =============================================================================
// parseList
// =============================================================================

TEST(CoercionListTest, NullIsEmpty) {
    EXPECT_TRUE(coerce::parseList(json(nullptr)).empty());
}

TEST(CoercionListTest, SplitsOnCommasAndAllLineEndings) {
    auto items = coerce::parseList(json("a, b\r\nc\rd\n\n,e"));
    EXPECT_EQ(items, (std::vector<std::string>{"a", "b", "c", "d", "e"}));
}

TEST(CoercionListTest, ArrayElementsAreStringifiedAndFiltered) {
    auto items = coerce::parseList(json::array({" x ", "", 3, "  ", true}));
    EXPECT_EQ(items, (std::vector<std::string>{"x", "3", "true"}));
}

TEST(CoercionListTest, ArrayElementsAreNotSplit) {
    auto items = coerce::parseList(json::array({"a,b"}));
    EXPECT_EQ(items, (std::vector<std::string>{"a,b"}));
}

TEST(CoercionListTest, OtherScalarsBecomeSingleton) {
    EXPECT_EQ(coerce::parseList(json(12)), (std::vector<std::string>{"12"}));
}

TEST(CoercionListTest, IsIdempotentOnItsOwnOutput) {
    const std::vector<json> inputs = {
        json(" a ,b\r\n\r\n c ,\n,d\r"),
        json(",,\n\r"),
        json::array({"  padded  ", "", "x,y", " \t", 7, false, "z\n"}),
        json(3.5),
        json(nullptr),
    };
    for (const auto& input : inputs) {
        auto first = coerce::parseList(input);
        EXPECT_EQ(coerce::parseList(json(first)), first) << input.dump();
        for (const auto& item : first) {
            EXPECT_FALSE(item.empty()) << input.dump();
            EXPECT_EQ(coerce::trim(item), item) << input.dump();
        }
    }
}

// =============================================================================
// parseScope
// =============================================================================

TEST(CoercionScopeTest, EmptyValuesAreAbsent) {
    EXPECT_FALSE(coerce::parseScope(json(nullptr)).has_value());
    EXPECT_FALSE(coerce::parseScope(json("")).has_value());
    EXPECT_FALSE(coerce::parseScope(json("  \n")).has_value());
}

TEST(CoercionScopeTest, ObjectPassesThrough) {
    json scope = {{"x", 1}, {"nested", {{"y", "z"}}}};
    auto parsed = coerce::parseScope(scope);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, scope);
}

TEST(CoercionScopeTest, JsonTextIsParsed) {
    auto parsed = coerce::parseScope(json(R"({"a": [1, 2]})"));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ((*parsed)["a"], json::array({1, 2}));
}

TEST(CoercionScopeTest, InvalidJsonTextIsRejected) {
    try {
        (void)coerce::parseScope(json("{not json"));
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), "local_scope");
        EXPECT_EQ(e.message().rfind("local_scope must be valid JSON", 0), 0u);
    }
}

TEST(CoercionScopeTest, NonObjectJsonTextIsRejected) {
    try {
        (void)coerce::parseScope(json("[1,2]"));
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.message(), "local_scope must be a JSON object.");
    }
}

TEST(CoercionScopeTest, OtherTypesAreRejected) {
    EXPECT_THROW((void)coerce::parseScope(json(5)), ValidationError);
    EXPECT_THROW((void)coerce::parseScope(json::array()), ValidationError);
    EXPECT_THROW((void)coerce::parseScope(json(false)), ValidationError);
}
