#pragma once

#include "ibangen/common.hpp"
#include "ibangen/error.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ibangen::core {

/**
 * Character class of a BBAN field (SWIFT registry notation)
 */
enum class CharClass : uint8_t {
    Digit,          // n
    Letter,         // a
    Alphanumeric    // c
};

struct FieldSpec {
    size_t count;
    CharClass kind;

    bool operator==(const FieldSpec& other) const {
        return count == other.count && kind == other.kind;
    }
};

using FieldList = std::vector<FieldSpec>;

/**
 * Field-shape descriptor of a country's bank code and account number
 */
struct FormatDescriptor {
    FieldList bank_code;
    FieldList account_number;

    /**
     * Parse SWIFT notation such as "NL2!n4!a10!n" or "4!a10!n"
     *
     * A leading "<CC>2!n" (country code and check digits) is skipped and
     * must name country_code. The BBAN fields are split after
     * bank_code_length characters; a field crossing that boundary is split
     * in two.
     *
     * @param notation SWIFT format notation
     * @param bank_code_length Width of the bank code part
     * @param country_code Country the notation belongs to
     * @return Descriptor, or InvalidFormat
     */
    static Result<FormatDescriptor> parse(const std::string& notation,
                                          size_t bank_code_length,
                                          const std::string& country_code);
};

/**
 * Total number of characters described by fields
 */
size_t field_length(const FieldList& fields);

/**
 * Check that value has exactly the shape described by fields
 */
bool matches_fields(const std::string& value, const FieldList& fields);

/**
 * Whether c belongs to kind (uppercase letters only)
 */
bool char_matches(char c, CharClass kind);

/**
 * Notation letter for kind ('n', 'a' or 'c')
 */
char char_class_symbol(CharClass kind);

/**
 * Render fields back to notation, e.g. "4!a6!n"
 */
std::string to_notation(const FieldList& fields);

} // namespace ibangen::core
