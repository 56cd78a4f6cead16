#pragma once

#include "ibangen/common.hpp"
#include "ibangen/error.hpp"
#include <cstdint>
#include <string>

namespace ibangen::core {

/**
 * ISO 7064 mod-97-10 check digits as used by IBAN
 *
 * The rearranged string "<bank code><account number><country code>00" is transliterated
 * (digits unchanged, A=10 ... Z=35) into a decimal numeral whose remainder
 * modulo 97 gives the check digits as 98 - remainder. The numeral is reduced
 * digit by digit, so its length is not limited by any integer width.
 */
class Checksum {
public:
    /**
     * Transliterate to a decimal numeral
     * @return InvalidCharacter for anything outside [0-9A-Z]
     */
    static Result<std::string> transliterate(const std::string& text);

    /**
     * Remainder of a decimal numeral modulo 97
     * @return InvalidCharacter for non-digits
     */
    static Result<uint32_t> mod97(const std::string& numeral);

    /**
     * Check digits for the given components, always two characters ("02".."98")
     */
    static Result<std::string> calculate_check_digits(
        const std::string& country_code,
        const std::string& bank_code,
        const std::string& account_number
    );

    /**
     * Re-derive the check digits of a compact, upper-case IBAN and compare
     * them with the embedded ones
     */
    static bool verify(const std::string& iban);
};

} // namespace ibangen::core
