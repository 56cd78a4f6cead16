#include "format.hpp"
#include <spdlog/fmt/fmt.h>

namespace ibangen::core {

namespace {
    bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
    bool is_digit(char c) { return c >= '0' && c <= '9'; }

    Result<FormatDescriptor> format_error(const std::string& notation, const std::string& reason) {
        return Result<FormatDescriptor>::Err(
            Error(ErrorCode::InvalidFormat, "Invalid format '" + notation + "'", reason));
    }
}

Result<FormatDescriptor> FormatDescriptor::parse(const std::string& notation,
                                                 size_t bank_code_length,
                                                 const std::string& country_code) {
    size_t pos = 0;

    // Skip "<CC>2!n"
    if (notation.size() >= 5 && is_upper(notation[0]) && is_upper(notation[1])
        && notation.compare(2, 3, "2!n") == 0) {
        if (notation.compare(0, 2, country_code) != 0) {
            return format_error(notation,
                fmt::format("country prefix '{}' does not match {}",
                            notation.substr(0, 2), country_code));
        }
        pos = 5;
    }

    FieldList bban;
    while (pos < notation.size()) {
        size_t count = 0;
        size_t digits = 0;
        while (pos < notation.size() && is_digit(notation[pos])) {
            count = count * 10 + static_cast<size_t>(notation[pos] - '0');
            ++pos;
            if (++digits > 2) {
                return format_error(notation, "field length too large");
            }
        }
        if (digits == 0 || count == 0) {
            return format_error(notation, fmt::format("expected field length at offset {}", pos));
        }
        if (pos >= notation.size() || notation[pos] != '!') {
            return format_error(notation, "only fixed-length fields ('!') are supported");
        }
        ++pos;
        if (pos >= notation.size()) {
            return format_error(notation, "missing character class");
        }

        CharClass kind;
        switch (notation[pos]) {
            case 'n': kind = CharClass::Digit; break;
            case 'a': kind = CharClass::Letter; break;
            case 'c': kind = CharClass::Alphanumeric; break;
            default:
                return format_error(notation,
                    fmt::format("unknown character class '{}'", notation[pos]));
        }
        ++pos;
        bban.push_back(FieldSpec{count, kind});
    }

    if (bban.empty()) {
        return format_error(notation, "no BBAN fields");
    }

    FormatDescriptor descriptor;
    size_t remaining = bank_code_length;
    for (const auto& field : bban) {
        if (remaining == 0) {
            descriptor.account_number.push_back(field);
        } else if (field.count <= remaining) {
            descriptor.bank_code.push_back(field);
            remaining -= field.count;
        } else {
            descriptor.bank_code.push_back(FieldSpec{remaining, field.kind});
            descriptor.account_number.push_back(FieldSpec{field.count - remaining, field.kind});
            remaining = 0;
        }
    }

    if (remaining > 0) {
        return format_error(notation,
            fmt::format("bank code length {} exceeds BBAN length {}",
                        bank_code_length, field_length(bban)));
    }

    return Result<FormatDescriptor>::Ok(std::move(descriptor));
}

size_t field_length(const FieldList& fields) {
    size_t total = 0;
    for (const auto& field : fields) {
        total += field.count;
    }
    return total;
}

bool char_matches(char c, CharClass kind) {
    switch (kind) {
        case CharClass::Digit: return is_digit(c);
        case CharClass::Letter: return is_upper(c);
        case CharClass::Alphanumeric: return is_digit(c) || is_upper(c);
    }
    return false;
}

bool matches_fields(const std::string& value, const FieldList& fields) {
    if (value.size() != field_length(fields)) {
        return false;
    }

    size_t pos = 0;
    for (const auto& field : fields) {
        for (size_t i = 0; i < field.count; ++i, ++pos) {
            if (!char_matches(value[pos], field.kind)) {
                return false;
            }
        }
    }
    return true;
}

char char_class_symbol(CharClass kind) {
    switch (kind) {
        case CharClass::Digit: return 'n';
        case CharClass::Letter: return 'a';
        case CharClass::Alphanumeric: return 'c';
    }
    return '?';
}

std::string to_notation(const FieldList& fields) {
    std::string result;
    for (const auto& field : fields) {
        result += std::to_string(field.count);
        result += '!';
        result += char_class_symbol(field.kind);
    }
    return result;
}

} // namespace ibangen::core
