#include "checksum.hpp"
#include "utils/logger.hpp"

namespace ibangen::core {

namespace {
    Result<std::string> invalid_character(char c, size_t position) {
        return Result<std::string>::Err(Error(
            ErrorCode::InvalidCharacter,
            fmt::format("Invalid character '{}' in IBAN calculation", c),
            fmt::format("position {}", position)));
    }
}

Result<std::string> Checksum::transliterate(const std::string& text) {
    std::string numeral;
    numeral.reserve(text.size() * 2);

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c >= '0' && c <= '9') {
            numeral += c;
        } else if (c >= 'A' && c <= 'Z') {
            numeral += std::to_string(c - 'A' + 10);
        } else {
            return invalid_character(c, i);
        }
    }
    return Result<std::string>::Ok(std::move(numeral));
}

Result<uint32_t> Checksum::mod97(const std::string& numeral) {
    uint32_t remainder = 0;
    for (size_t i = 0; i < numeral.size(); ++i) {
        char c = numeral[i];
        if (c < '0' || c > '9') {
            return Result<uint32_t>::Err(invalid_character(c, i).error());
        }
        remainder = (remainder * 10 + static_cast<uint32_t>(c - '0')) % constants::CHECKSUM_MODULUS;
    }
    return Result<uint32_t>::Ok(remainder);
}

Result<std::string> Checksum::calculate_check_digits(
    const std::string& country_code,
    const std::string& bank_code,
    const std::string& account_number
) {
    // Country code and placeholder check digits move to the end
    std::string rearranged = bank_code + account_number + country_code + "00";

    auto numeral = transliterate(rearranged);
    if (numeral.is_err()) {
        Error error = numeral.error();
        error.with_country(country_code);
        return Result<std::string>::Err(error);
    }

    auto remainder = mod97(numeral.value());
    if (remainder.is_err()) {
        return Result<std::string>::Err(remainder.error());
    }

    uint32_t check = constants::CHECKSUM_BASE - remainder.value();
    return Result<std::string>::Ok(fmt::format("{:02d}", check));
}

bool Checksum::verify(const std::string& iban) {
    if (iban.size() < constants::IBAN_MIN_LENGTH) {
        return false;
    }

    std::string country_code = iban.substr(0, constants::COUNTRY_CODE_LENGTH);
    std::string embedded = iban.substr(constants::COUNTRY_CODE_LENGTH, constants::CHECK_DIGITS_LENGTH);
    std::string bban = iban.substr(constants::IBAN_PREFIX_LENGTH);

    auto expected = calculate_check_digits(country_code, bban, "");
    if (expected.is_err()) {
        IBANGEN_LOG_DEBUG("Checksum verification failed: {}", expected.error().to_string());
        return false;
    }
    return expected.value() == embedded;
}

} // namespace ibangen::core
