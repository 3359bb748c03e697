/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/base/PropertiesException.hpp"
#include "ordprops/properties/OrderedPropertiesBuilder.hpp"
#include "ordprops/properties/OrderedPropertiesConfig.hpp"
#include "ordprops/util/logging.hpp"

#include <fmt/format.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <tuple>

//-------------------------------------------------------------------------

using namespace ordprops;

using namespace testing;

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

namespace
{

const fs::path s_dataDir{ORDPROPS_TEST_DATA_DIR};

OrderedPropertiesConfig configFromString(const char* xml)
{
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_string(xml);
    EXPECT_TRUE(result) << result.description();
    return OrderedPropertiesConfig::fromXML(doc.child("OrderedProperties"));
}

std::vector<std::string> keysAfterSetting(
    OrderedProperties props, std::initializer_list<const char*> keys)
{
    for (const char* key : keys) {
        props.setProperty(key, "v");
    }
    return props.propertyNames();
}

}  // namespace

//-------------------------------------------------------------------------

struct KeyOrderingTestParams
{
    const char* ordering;
    KeyOrdering expected;
    std::vector<std::string> expectedKeys;
};

void PrintTo(const KeyOrderingTestParams& params, std::ostream* os)
{
    *os << params.ordering;
}

struct KeyOrderingTest : TestWithParam<KeyOrderingTestParams>
{};

TEST_P(KeyOrderingTest, SelectsComparator)
{
    const auto& params = GetParam();

    const auto config = configFromString(
        fmt::format(R"(<OrderedProperties ordering="{}"/>)", params.ordering).c_str());

    EXPECT_EQ(config.ordering, params.expected);
    EXPECT_FALSE(config.suppressDate);
    EXPECT_EQ(
        keysAfterSetting(
            OrderedPropertiesBuilder::fromConfig(config).build(), {"b", "C", "a", "B"}),
        params.expectedKeys);
}

INSTANTIATE_TEST_SUITE_P(
    OrderedPropertiesConfig,
    KeyOrderingTest,
    Values(
        KeyOrderingTestParams{"insertion", KeyOrdering::insertion, {"b", "C", "a", "B"}},
        KeyOrderingTestParams{"natural", KeyOrdering::natural, {"B", "C", "a", "b"}},
        KeyOrderingTestParams{"reverse", KeyOrdering::reverse, {"b", "a", "C", "B"}},
        KeyOrderingTestParams{"caseInsensitive", KeyOrdering::caseInsensitive, {"a", "b", "C"}},
        KeyOrderingTestParams{"bogus", KeyOrdering::insertion, {"b", "C", "a", "B"}}));

//-------------------------------------------------------------------------

TEST(OrderedPropertiesConfigTest, MissingAttributesFallBackToDefaults)
{
    const auto config = configFromString("<OrderedProperties/>");

    EXPECT_EQ(config.ordering, KeyOrdering::insertion);
    EXPECT_FALSE(config.suppressDate);
    EXPECT_FALSE(makeComparator(config.ordering).has_value());
}

//-------------------------------------------------------------------------

TEST(OrderedPropertiesConfigTest, OrderingFallbackIsLoggedNotPrinted)
{
    util::setLogLevel(spdlog::level::warn);

    internal::CaptureStdout();
    internal::CaptureStderr();
    const auto config = configFromString(R"(<OrderedProperties ordering="sideways"/>)");
    const std::string out = internal::GetCapturedStdout();
    const std::string err = internal::GetCapturedStderr();

    EXPECT_EQ(config.ordering, KeyOrdering::insertion);
    EXPECT_THAT(out, IsEmpty());
    EXPECT_THAT(err, HasSubstr("falling back to 'insertion'"));
    EXPECT_THAT(err, HasSubstr("[ordprops]"));
}

//-------------------------------------------------------------------------

TEST(OrderedPropertiesConfigTest, ReadsSuppressDate)
{
    const auto config = configFromString(R"(<OrderedProperties suppressDate="true"/>)");

    EXPECT_TRUE(config.suppressDate);
    EXPECT_TRUE(OrderedPropertiesBuilder::fromConfig(config).build().suppressesDate());
}

//-------------------------------------------------------------------------

TEST(OrderedPropertiesConfigTest, LoadsFromFile)
{
    const auto config = OrderedPropertiesConfig::fromFile(s_dataDir / "ordering-natural.xml");

    EXPECT_EQ(config.ordering, KeyOrdering::natural);
    EXPECT_TRUE(config.suppressDate);
}

//-------------------------------------------------------------------------

TEST(OrderedPropertiesConfigTest, FileErrorsAreFormatErrors)
{
    EXPECT_THROW(
        std::ignore = OrderedPropertiesConfig::fromFile(s_dataDir / "does-not-exist.xml"),
        FormatError);
    EXPECT_THAT(
        [] { std::ignore = OrderedPropertiesConfig::fromFile(s_dataDir / "no-config-element.xml"); },
        ThrowsMessage<FormatError>(HasSubstr("<OrderedProperties>")));
}

//-------------------------------------------------------------------------
