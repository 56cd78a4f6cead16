#include "country_registry.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>

namespace ibangen::core {

namespace {
    Result<void> profile_error(const std::string& code, const std::string& message) {
        Error error(ErrorCode::InvalidProfile, message);
        error.with_country(code);
        return Result<void>::Err(error);
    }

    Result<void> validate_definition(const CountryDefinition& def, CountryProfile& profile) {
        if (def.code.size() != constants::COUNTRY_CODE_LENGTH
            || !std::all_of(def.code.begin(), def.code.end(),
                            [](char c) { return c >= 'A' && c <= 'Z'; })) {
            return profile_error(def.code, "Country code must be two uppercase letters");
        }
        if (def.display_name.empty()) {
            return profile_error(def.code, "Display name is empty");
        }
        if (constants::IBAN_PREFIX_LENGTH + def.bank_code_length + def.account_number_length
            != def.total_length) {
            return profile_error(def.code, fmt::format(
                "Length {} does not equal 4 + bank code length {} + account number length {}",
                def.total_length, def.bank_code_length, def.account_number_length));
        }
        if (def.total_length > constants::IBAN_MAX_LENGTH) {
            return profile_error(def.code, fmt::format(
                "Length {} exceeds the IBAN maximum of {}", def.total_length,
                constants::IBAN_MAX_LENGTH));
        }

        auto format = FormatDescriptor::parse(def.format_notation, def.bank_code_length, def.code);
        if (format.is_err()) {
            Error error = format.error();
            error.with_country(def.code);
            return Result<void>::Err(error);
        }
        const FormatDescriptor& descriptor = format.value();

        if (field_length(descriptor.account_number) != def.account_number_length) {
            return profile_error(def.code, fmt::format(
                "Format '{}' describes {} account number characters, expected {}",
                def.format_notation, field_length(descriptor.account_number),
                def.account_number_length));
        }

        for (const auto& sample : def.sample_bank_codes) {
            if (!matches_fields(sample, descriptor.bank_code)) {
                return profile_error(def.code, fmt::format(
                    "Sample bank code '{}' does not match format {}",
                    sample, to_notation(descriptor.bank_code)));
            }
        }

        profile.code = def.code;
        profile.display_name = def.display_name;
        profile.total_length = def.total_length;
        profile.bank_code_length = def.bank_code_length;
        profile.account_number_length = def.account_number_length;
        profile.format_notation = def.format_notation;
        profile.format = descriptor;
        profile.sample_bank_codes = def.sample_bank_codes;
        return Result<void>::Ok();
    }

    // UTF-8 encodings of the Unicode White_Space characters beyond ASCII,
    // plus the byte order mark
    const char* const UNICODE_SPACES[] = {
        "\xC2\x85",       // U+0085 next line
        "\xC2\xA0",       // U+00A0 no-break space
        "\xE1\x9A\x80",   // U+1680 ogham space mark
        "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83",
        "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
        "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",  // U+2000..U+200A
        "\xE2\x80\xA8",   // U+2028 line separator
        "\xE2\x80\xA9",   // U+2029 paragraph separator
        "\xE2\x80\xAF",   // U+202F narrow no-break space
        "\xE2\x81\x9F",   // U+205F medium mathematical space
        "\xE3\x80\x80",   // U+3000 ideographic space
        "\xEF\xBB\xBF",   // U+FEFF byte order mark
    };

    bool is_ascii_space(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
    }

    // Width of the whitespace character starting at pos, 0 if none
    size_t leading_space_width(const std::string& text, size_t pos, size_t end) {
        if (is_ascii_space(text[pos])) {
            return 1;
        }
        for (const char* space : UNICODE_SPACES) {
            size_t width = std::strlen(space);
            if (end - pos >= width && text.compare(pos, width, space) == 0) {
                return width;
            }
        }
        return 0;
    }

    // Width of the whitespace character ending just before end, 0 if none
    size_t trailing_space_width(const std::string& text, size_t begin, size_t end) {
        if (is_ascii_space(text[end - 1])) {
            return 1;
        }
        for (const char* space : UNICODE_SPACES) {
            size_t width = std::strlen(space);
            if (end - begin >= width && text.compare(end - width, width, space) == 0) {
                return width;
            }
        }
        return 0;
    }
}

const std::vector<CountryDefinition>& CountryRegistry::builtin_definitions() {
    static const std::vector<CountryDefinition> definitions = {
        {"NL", "Netherlands", 18, 4, 10, "NL2!n4!a10!n",
         {"ABNA", "INGB", "RABO", "TRIO"}},
        {"DE", "Germany", 22, 8, 10, "DE2!n8!n10!n",
         {"10010010", "20070024", "37040044", "50010517"}},
        {"FR", "France", 27, 10, 13, "FR2!n5!n5!n11!c2!n",
         {"2004100005", "3000200009", "1027800002"}},
        {"GB", "United Kingdom", 22, 10, 8, "GB2!n4!a6!n8!n",
         {"ABBY060001", "BARC200000", "HBUK400003", "LOYD309634"}},
        {"ES", "Spain", 24, 8, 12, "ES2!n4!n4!n1!n1!n10!n",
         {"21000418", "00720301", "01820200", "21000001"}},
        {"IT", "Italy", 27, 11, 12, "IT2!n1!a5!n5!n12!c",
         {"X0542811101", "A0306901691", "U0301503200", "C0301503400"}},
        {"BE", "Belgium", 16, 3, 9, "BE2!n3!n7!n2!n",
         {"539", "096", "001", "068"}},
        {"CH", "Switzerland", 21, 5, 12, "CH2!n5!n12!c",
         {"00762", "08390", "00230", "00254"}},
        {"AT", "Austria", 20, 5, 11, "AT2!n5!n11!n",
         {"19043", "32000", "20111", "14000"}},
        {"DK", "Denmark", 18, 4, 10, "DK2!n4!n9!n1!n",
         {"0040", "5301", "9570", "7311"}},
    };
    return definitions;
}

const CountryRegistry& CountryRegistry::builtin() {
    static const CountryRegistry registry = create(builtin_definitions()).value();
    return registry;
}

Result<CountryRegistry> CountryRegistry::create(const std::vector<CountryDefinition>& definitions) {
    CountryRegistry registry;

    for (const auto& def : definitions) {
        CountryProfile profile;
        IBANGEN_TRY(Result<CountryRegistry>, validate_definition(def, profile));

        if (registry.profiles_.count(def.code) != 0) {
            Error error(ErrorCode::InvalidProfile, "Duplicate country code");
            error.with_country(def.code);
            return Result<CountryRegistry>::Err(error);
        }

        registry.codes_.push_back(def.code);
        registry.profiles_.emplace(def.code, std::move(profile));
    }

    IBANGEN_LOG_DEBUG("Country registry created with {} countries", registry.size());
    return Result<CountryRegistry>::Ok(std::move(registry));
}

Result<CountryRegistry> CountryRegistry::from_json(const nlohmann::json& document) {
    if (!document.is_object() || !document.contains("countries")
        || !document["countries"].is_array()) {
        return Result<CountryRegistry>::Err(ErrorCode::ConfigLoadFailed,
            "Country table must be an object with a \"countries\" array");
    }

    std::vector<CountryDefinition> definitions;
    for (const auto& entry : document["countries"]) {
        try {
            CountryDefinition def;
            def.code = entry.at("code").get<std::string>();
            def.display_name = entry.at("name").get<std::string>();
            def.total_length = entry.at("length").get<size_t>();
            def.bank_code_length = entry.at("bank_code_length").get<size_t>();
            def.account_number_length = entry.at("account_number_length").get<size_t>();
            def.format_notation = entry.at("format").get<std::string>();
            if (entry.contains("sample_bank_codes")) {
                def.sample_bank_codes =
                    entry.at("sample_bank_codes").get<std::vector<std::string>>();
            }
            definitions.push_back(std::move(def));
        } catch (const nlohmann::json::exception& e) {
            return Result<CountryRegistry>::Err(
                Error(ErrorCode::ConfigLoadFailed, "Invalid country entry", e.what()));
        }
    }

    return create(definitions);
}

Result<CountryRegistry> CountryRegistry::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<CountryRegistry>::Err(ErrorCode::ConfigLoadFailed,
            "Failed to open country table: " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        return Result<CountryRegistry>::Err(
            Error(ErrorCode::ConfigLoadFailed, "Failed to parse country table: " + path, e.what()));
    }

    IBANGEN_LOG_INFO("Loading country table from {}", path);
    return from_json(document);
}

std::string CountryRegistry::normalize_code(const std::string& code) {
    size_t begin = 0;
    size_t end = code.size();

    while (begin < end) {
        size_t width = leading_space_width(code, begin, end);
        if (width == 0) {
            break;
        }
        begin += width;
    }
    while (end > begin) {
        size_t width = trailing_space_width(code, begin, end);
        if (width == 0) {
            break;
        }
        end -= width;
    }

    std::string normalized = code.substr(begin, end - begin);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return normalized;
}

Result<CountryProfile> CountryRegistry::lookup(const std::string& code) const {
    const CountryProfile* profile = find(code);
    if (profile == nullptr) {
        std::string normalized = normalize_code(code);
        Error error(ErrorCode::UnsupportedCountry,
                    "Country code '" + normalized + "' is not supported. Supported codes: "
                        + supported_codes_string());
        error.with_country(normalized);
        return Result<CountryProfile>::Err(error);
    }
    return Result<CountryProfile>::Ok(*profile);
}

const CountryProfile* CountryRegistry::find(const std::string& code) const {
    auto it = profiles_.find(normalize_code(code));
    if (it == profiles_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string CountryRegistry::supported_codes_string() const {
    std::string result;
    for (const auto& code : codes_) {
        if (!result.empty()) {
            result += ", ";
        }
        result += code;
    }
    return result;
}

} // namespace ibangen::core
