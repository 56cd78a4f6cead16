#pragma once

#include "ibangen/common.hpp"
#include "ibangen/error.hpp"
#include "core/registry/format.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace ibangen::core {

/**
 * Structural metadata of one country's IBAN
 */
struct CountryProfile {
    std::string code;                           // ISO 3166-1 alpha-2
    std::string display_name;
    size_t total_length = 0;                    // Full IBAN length
    size_t bank_code_length = 0;
    size_t account_number_length = 0;
    std::string format_notation;                // SWIFT notation, e.g. "NL2!n4!a10!n"
    FormatDescriptor format;                    // Derived from format_notation
    std::vector<std::string> sample_bank_codes; // May be empty
};

/**
 * Definition of a profile before validation
 */
struct CountryDefinition {
    std::string code;
    std::string display_name;
    size_t total_length;
    size_t bank_code_length;
    size_t account_number_length;
    std::string format_notation;
    std::vector<std::string> sample_bank_codes;
};

/**
 * Read-only table of supported countries
 *
 * Built once and shared by reference; nothing mutates a registry after
 * construction, so concurrent readers need no locking.
 */
class CountryRegistry {
public:
    /**
     * Built-in table, constructed on first use
     */
    static const CountryRegistry& builtin();

    /**
     * Definitions of the built-in table, in enumeration order
     */
    static const std::vector<CountryDefinition>& builtin_definitions();

    /**
     * Validate definitions and build a registry
     * @return InvalidProfile / InvalidFormat naming the offending country
     */
    static Result<CountryRegistry> create(const std::vector<CountryDefinition>& definitions);

    /**
     * Build from {"countries": [{"code", "name", "length", "format",
     * "bank_code_length", "account_number_length", "sample_bank_codes"}]}
     */
    static Result<CountryRegistry> from_json(const nlohmann::json& document);

    /**
     * Build from a JSON file (see from_json)
     */
    static Result<CountryRegistry> load_from_file(const std::string& path);

    /**
     * Trim surrounding whitespace and upper-case
     */
    static std::string normalize_code(const std::string& code);

    /**
     * Profile for code (normalized first)
     * @return UnsupportedCountry listing the supported codes
     */
    Result<CountryProfile> lookup(const std::string& code) const;

    /**
     * Profile for code (normalized first), nullptr if unsupported
     */
    const CountryProfile* find(const std::string& code) const;

    bool contains(const std::string& code) const { return find(code) != nullptr; }

    /**
     * Supported codes in table order
     */
    const std::vector<std::string>& list_supported_codes() const { return codes_; }

    size_t size() const { return profiles_.size(); }

    /**
     * Comma-separated list of supported codes
     */
    std::string supported_codes_string() const;

private:
    CountryRegistry() = default;

    std::vector<std::string> codes_;
    std::map<std::string, CountryProfile> profiles_;
};

} // namespace ibangen::core
