#include <gtest/gtest.h>
#include "core/registry/country_registry.hpp"
#include "core/registry/format.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>

using namespace ibangen;
using namespace ibangen::core;

TEST(FormatDescriptorTest, ParsesFullNotation) {
    auto format = FormatDescriptor::parse("NL2!n4!a10!n", 4, "NL");
    ASSERT_TRUE(format.is_ok());

    FieldList bank = {{4, CharClass::Letter}};
    FieldList account = {{10, CharClass::Digit}};
    EXPECT_EQ(format.value().bank_code, bank);
    EXPECT_EQ(format.value().account_number, account);
}

TEST(FormatDescriptorTest, ParsesBbanOnlyNotation) {
    auto format = FormatDescriptor::parse("5!n5!n11!c2!n", 10, "FR");
    ASSERT_TRUE(format.is_ok());

    EXPECT_EQ(to_notation(format.value().bank_code), "5!n5!n");
    EXPECT_EQ(to_notation(format.value().account_number), "11!c2!n");
}

TEST(FormatDescriptorTest, SplitsFieldCrossingBankBoundary) {
    auto format = FormatDescriptor::parse("4!a6!n8!n", 7, "GB");
    ASSERT_TRUE(format.is_ok());

    EXPECT_EQ(to_notation(format.value().bank_code), "4!a3!n");
    EXPECT_EQ(to_notation(format.value().account_number), "3!n8!n");
}

TEST(FormatDescriptorTest, RejectsMalformedNotation) {
    const char* bad[] = {"", "NL2!n", "4a10!n", "4!x10!n", "4!", "!a", "0!n4!n", "123!n"};
    for (const char* notation : bad) {
        auto format = FormatDescriptor::parse(notation, 0, "NL");
        ASSERT_TRUE(format.is_err()) << notation;
        EXPECT_EQ(format.error().code(), ErrorCode::InvalidFormat) << notation;
    }
}

TEST(FormatDescriptorTest, RejectsForeignCountryPrefix) {
    auto format = FormatDescriptor::parse("DE2!n8!n10!n", 8, "PL");
    ASSERT_TRUE(format.is_err());
    EXPECT_EQ(format.error().code(), ErrorCode::InvalidFormat);
    EXPECT_NE(format.error().details().find("'DE'"), std::string::npos);

    auto registry = CountryRegistry::from_json(nlohmann::json::parse(
        R"({"countries": [{"code": "PL", "name": "Poland", "length": 22, "format": "DE2!n8!n10!n",
            "bank_code_length": 8, "account_number_length": 10}]})"));
    ASSERT_TRUE(registry.is_err());
    EXPECT_EQ(registry.error().code(), ErrorCode::InvalidFormat);
    ASSERT_TRUE(registry.error().country_code().has_value());
    EXPECT_EQ(*registry.error().country_code(), "PL");
}

TEST(FormatDescriptorTest, RejectsBankLengthBeyondBban) {
    auto format = FormatDescriptor::parse("4!a10!n", 15, "NL");
    ASSERT_TRUE(format.is_err());
    EXPECT_EQ(format.error().code(), ErrorCode::InvalidFormat);
}

TEST(FormatDescriptorTest, MatchesFields) {
    FieldList fields = {{1, CharClass::Letter}, {2, CharClass::Digit}, {2, CharClass::Alphanumeric}};

    EXPECT_TRUE(matches_fields("X12A9", fields));
    EXPECT_TRUE(matches_fields("Q00ZZ", fields));
    EXPECT_FALSE(matches_fields("112A9", fields));   // letter field holds a digit
    EXPECT_FALSE(matches_fields("XA2A9", fields));   // digit field holds a letter
    EXPECT_FALSE(matches_fields("x12A9", fields));   // lower case
    EXPECT_FALSE(matches_fields("X12A", fields));    // too short
    EXPECT_FALSE(matches_fields("X12A9Z", fields));  // too long
}

TEST(CountryRegistryTest, BuiltinTableOrder) {
    const auto& registry = CountryRegistry::builtin();

    std::vector<std::string> expected = {"NL", "DE", "FR", "GB", "ES", "IT", "BE", "CH", "AT", "DK"};
    EXPECT_EQ(registry.list_supported_codes(), expected);
    EXPECT_EQ(registry.size(), expected.size());
}

TEST(CountryRegistryTest, BuiltinProfilesSatisfyInvariants) {
    const auto& registry = CountryRegistry::builtin();

    for (const auto& code : registry.list_supported_codes()) {
        const CountryProfile* profile = registry.find(code);
        ASSERT_NE(profile, nullptr) << code;

        EXPECT_EQ(profile->code, code);
        EXPECT_FALSE(profile->display_name.empty());
        EXPECT_EQ(4 + profile->bank_code_length + profile->account_number_length,
                  profile->total_length) << code;
        EXPECT_EQ(field_length(profile->format.bank_code), profile->bank_code_length) << code;
        EXPECT_EQ(field_length(profile->format.account_number), profile->account_number_length) << code;
        EXPECT_FALSE(profile->sample_bank_codes.empty()) << code;

        for (const auto& sample : profile->sample_bank_codes) {
            EXPECT_TRUE(matches_fields(sample, profile->format.bank_code)) << code << " " << sample;
        }
    }
}

TEST(CountryRegistryTest, BuiltinProfileDetails) {
    const auto& registry = CountryRegistry::builtin();

    auto fr = registry.lookup("FR");
    ASSERT_TRUE(fr.is_ok());
    EXPECT_EQ(fr.value().display_name, "France");
    EXPECT_EQ(fr.value().total_length, 27u);
    EXPECT_EQ(to_notation(fr.value().format.account_number), "11!c2!n");

    auto it = registry.lookup("IT");
    ASSERT_TRUE(it.is_ok());
    EXPECT_EQ(to_notation(it.value().format.bank_code), "1!a5!n5!n");
    EXPECT_EQ(to_notation(it.value().format.account_number), "12!c");

    auto gb = registry.lookup("GB");
    ASSERT_TRUE(gb.is_ok());
    EXPECT_EQ(gb.value().display_name, "United Kingdom");
    EXPECT_EQ(to_notation(gb.value().format.bank_code), "4!a6!n");
}

TEST(CountryRegistryTest, NormalizesCodes) {
    EXPECT_EQ(CountryRegistry::normalize_code(" nl "), "NL");
    EXPECT_EQ(CountryRegistry::normalize_code("\tDe\n"), "DE");
    EXPECT_EQ(CountryRegistry::normalize_code("   "), "");
    EXPECT_EQ(CountryRegistry::normalize_code(""), "");

    // Non-ASCII whitespace and byte order marks around the code
    EXPECT_EQ(CountryRegistry::normalize_code("\xC2\xA0nl\xE3\x80\x80"), "NL");
    EXPECT_EQ(CountryRegistry::normalize_code("\xEF\xBB\xBF" "de"), "DE");
    EXPECT_EQ(CountryRegistry::normalize_code("fr\xE2\x80\xAF\r\n"), "FR");
    EXPECT_EQ(CountryRegistry::normalize_code("\xE2\x80\x80\xC2\xA0"), "");
    EXPECT_EQ(CountryRegistry::normalize_code("N\xC2\xA0L"), "N\xC2\xA0L");

    const auto& registry = CountryRegistry::builtin();
    EXPECT_TRUE(registry.contains(" nl "));
    EXPECT_TRUE(registry.contains("ch"));
    EXPECT_FALSE(registry.contains("N L"));
}

TEST(CountryRegistryTest, UnsupportedCountryListsCodes) {
    const auto& registry = CountryRegistry::builtin();

    auto result = registry.lookup("zz");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::UnsupportedCountry);
    EXPECT_FALSE(result.error().is_internal());
    ASSERT_TRUE(result.error().country_code().has_value());
    EXPECT_EQ(*result.error().country_code(), "ZZ");
    EXPECT_NE(result.error().message().find("NL, DE, FR, GB, ES, IT, BE, CH, AT, DK"),
              std::string::npos);

    EXPECT_EQ(registry.find("ZZ"), nullptr);
}

TEST(CountryRegistryTest, CreateRejectsLengthMismatch) {
    auto registry = CountryRegistry::create({
        {"NL", "Netherlands", 19, 4, 10, "NL2!n4!a10!n", {}},
    });
    ASSERT_TRUE(registry.is_err());
    EXPECT_EQ(registry.error().code(), ErrorCode::InvalidProfile);
    ASSERT_TRUE(registry.error().country_code().has_value());
    EXPECT_EQ(*registry.error().country_code(), "NL");
}

TEST(CountryRegistryTest, CreateRejectsFormatDisagreeingWithLengths) {
    auto registry = CountryRegistry::create({
        {"NL", "Netherlands", 18, 4, 10, "NL2!n4!a9!n", {}},
    });
    ASSERT_TRUE(registry.is_err());
    EXPECT_EQ(registry.error().code(), ErrorCode::InvalidProfile);
}

TEST(CountryRegistryTest, CreateRejectsMalformedSample) {
    auto registry = CountryRegistry::create({
        {"NL", "Netherlands", 18, 4, 10, "NL2!n4!a10!n", {"ABNA", "1234"}},
    });
    ASSERT_TRUE(registry.is_err());
    EXPECT_EQ(registry.error().code(), ErrorCode::InvalidProfile);
    EXPECT_NE(registry.error().message().find("1234"), std::string::npos);
}

TEST(CountryRegistryTest, CreateRejectsBadCodes) {
    auto lower = CountryRegistry::create({{"nl", "Netherlands", 18, 4, 10, "4!a10!n", {}}});
    ASSERT_TRUE(lower.is_err());
    EXPECT_EQ(lower.error().code(), ErrorCode::InvalidProfile);

    auto duplicate = CountryRegistry::create({
        {"NL", "Netherlands", 18, 4, 10, "4!a10!n", {}},
        {"NL", "Nederland", 18, 4, 10, "4!a10!n", {}},
    });
    ASSERT_TRUE(duplicate.is_err());
    EXPECT_EQ(duplicate.error().code(), ErrorCode::InvalidProfile);
}

TEST(CountryRegistryTest, CreateReportsInvalidFormatWithCountry) {
    auto registry = CountryRegistry::create({
        {"DE", "Germany", 22, 8, 10, "DE2!n8n10!n", {}},
    });
    ASSERT_TRUE(registry.is_err());
    EXPECT_EQ(registry.error().code(), ErrorCode::InvalidFormat);
    ASSERT_TRUE(registry.error().country_code().has_value());
    EXPECT_EQ(*registry.error().country_code(), "DE");
}

TEST(CountryRegistryTest, FromJson) {
    auto document = nlohmann::json::parse(R"({
        "countries": [
            {"code": "PL", "name": "Poland", "length": 28, "format": "PL2!n8!n16!n",
             "bank_code_length": 8, "account_number_length": 16},
            {"code": "NO", "name": "Norway", "length": 15, "format": "4!n6!n1!n",
             "bank_code_length": 4, "account_number_length": 7,
             "sample_bank_codes": ["8601"]}
        ]
    })");

    auto registry = CountryRegistry::from_json(document);
    ASSERT_TRUE(registry.is_ok()) << registry.error().to_string();

    std::vector<std::string> expected = {"PL", "NO"};
    EXPECT_EQ(registry.value().list_supported_codes(), expected);

    const CountryProfile* pl = registry.value().find("pl");
    ASSERT_NE(pl, nullptr);
    EXPECT_TRUE(pl->sample_bank_codes.empty());
    EXPECT_EQ(pl->total_length, 28u);

    const CountryProfile* no = registry.value().find("NO");
    ASSERT_NE(no, nullptr);
    EXPECT_EQ(no->sample_bank_codes, std::vector<std::string>{"8601"});
}

TEST(CountryRegistryTest, FromJsonRejectsMissingKeys) {
    auto missing_array = CountryRegistry::from_json(nlohmann::json::parse(R"({"countries": 3})"));
    ASSERT_TRUE(missing_array.is_err());
    EXPECT_EQ(missing_array.error().code(), ErrorCode::ConfigLoadFailed);

    auto missing_key = CountryRegistry::from_json(nlohmann::json::parse(
        R"({"countries": [{"code": "PL", "name": "Poland", "length": 28}]})"));
    ASSERT_TRUE(missing_key.is_err());
    EXPECT_EQ(missing_key.error().code(), ErrorCode::ConfigLoadFailed);

    auto wrong_type = CountryRegistry::from_json(nlohmann::json::parse(
        R"({"countries": [{"code": "PL", "name": "Poland", "length": "28", "format": "8!n16!n",
            "bank_code_length": 8, "account_number_length": 16}]})"));
    ASSERT_TRUE(wrong_type.is_err());
    EXPECT_EQ(wrong_type.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(CountryRegistryTest, LoadFromFile) {
    const std::string path = "./test_countries.json";
    {
        std::ofstream file(path);
        file << R"({"countries": [{"code": "AT", "name": "Austria", "length": 20,
                   "format": "AT2!n5!n11!n", "bank_code_length": 5,
                   "account_number_length": 11, "sample_bank_codes": ["19043"]}]})";
    }

    auto registry = CountryRegistry::load_from_file(path);
    std::remove(path.c_str());

    ASSERT_TRUE(registry.is_ok()) << registry.error().to_string();
    EXPECT_TRUE(registry.value().contains("AT"));
    EXPECT_FALSE(registry.value().contains("NL"));

    auto missing = CountryRegistry::load_from_file("./does_not_exist.json");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigLoadFailed);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
