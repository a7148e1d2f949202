/**
 * JsonPointerTest
 * Tests for pointer-path lookups
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

#include "regexmap/json/JsonPointer.h"

using namespace regexmap::json;

namespace {

const char *INPUT = R"(
{
    "dedup_key": "6fcb9fe530c24613ed1df3e51c0e86addd794251f49ec6cd77fd4381cc0e0ac2",
    "description": "First: bk Second: 4 Third: 13 Fourth: Jack, tr Sec  [Encased string - (data)]",
    "title": "23-20670 Abby Lynn Hardy",
    "count": 42,
    "ratio": 45.67,
    "active": true,
    "missing": null,
    "items": [10, {"id": "x"}, "last"],
    "name": {
        "first": "Abby",
        "last": "Hardy",
        "ssn": "123-45-6789"
    },
    "a/b": "slash",
    "m~n": "tilde"
}
)";

}  // namespace

class JsonPointerTest : public ::testing::Test {
  protected:
    void SetUp() override { document_ = nlohmann::json::parse(INPUT); }

    nlohmann::json document_;
};

TEST_F(JsonPointerTest, ReadsStringsVerbatim) {
    EXPECT_EQ(readField(document_, "/description"),
              "First: bk Second: 4 Third: 13 Fourth: Jack, tr Sec  "
              "[Encased string - (data)]");
    EXPECT_EQ(readField(document_, "/name/last"), "Hardy");
    EXPECT_EQ(readField(document_, "/items/2"), "last");
}

TEST_F(JsonPointerTest, ReadsOtherValuesAsJsonText) {
    EXPECT_EQ(readField(document_, "/count"), "42");
    EXPECT_EQ(readField(document_, "/ratio"), "45.67");
    EXPECT_EQ(readField(document_, "/active"), "true");
    EXPECT_EQ(readField(document_, "/missing"), "null");
    EXPECT_EQ(readField(document_, "/items/1"), R"({"id":"x"})");

    // Nested tree
    nlohmann::json expected = nlohmann::json::parse(
        R"({"first": "Abby", "last": "Hardy", "ssn": "123-45-6789"})");
    EXPECT_EQ(readField(document_, "/name"), expected.dump());
}

TEST_F(JsonPointerTest, EmptyPathIsWholeDocument) {
    EXPECT_EQ(readField(document_, ""), document_.dump());
    EXPECT_EQ(resolvePointer(document_, ""), &document_);
}

TEST_F(JsonPointerTest, UnresolvedPathsReadAsEmpty) {
    EXPECT_EQ(readField(document_, "/invalid"), "");
    EXPECT_EQ(readField(document_, "/name/middle"), "");
    // Through a scalar
    EXPECT_EQ(readField(document_, "/name/first/x"), "");
    // Missing leading separator
    EXPECT_EQ(readField(document_, "name"), "");
    EXPECT_EQ(resolvePointer(document_, "name/first"), nullptr);
}

TEST_F(JsonPointerTest, ArrayIndexRules) {
    EXPECT_EQ(readField(document_, "/items/0"), "10");
    EXPECT_EQ(readField(document_, "/items/1/id"), "x");
    EXPECT_EQ(readField(document_, "/items/3"), "");
    EXPECT_EQ(readField(document_, "/items/01"), "");
    EXPECT_EQ(readField(document_, "/items/+1"), "");
    EXPECT_EQ(readField(document_, "/items/-"), "");
    EXPECT_EQ(readField(document_, "/items/first"), "");
    EXPECT_EQ(readField(document_, "/items/99999999999999999999999"), "");
}

TEST_F(JsonPointerTest, EscapedSegments) {
    EXPECT_EQ(readField(document_, "/a~1b"), "slash");
    EXPECT_EQ(readField(document_, "/m~0n"), "tilde");
    EXPECT_EQ(unescapeToken("~01"), "~1");
    EXPECT_EQ(unescapeToken("plain"), "plain");
}

TEST_F(JsonPointerTest, MutableResolutionWritesThrough) {
    nlohmann::json *ssn = resolvePointer(document_, "/name/ssn");
    ASSERT_NE(ssn, nullptr);
    *ssn = "redacted";
    EXPECT_EQ(document_["name"]["ssn"], "redacted");

    EXPECT_EQ(resolvePointer(document_, "/name/none"), nullptr);
}

TEST(JsonPointerScalarTest, ScalarRoot) {
    nlohmann::json document = "text";
    EXPECT_EQ(readField(document, ""), "text");
    EXPECT_EQ(readField(document, "/root"), "");
}
