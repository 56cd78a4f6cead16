#pragma once

#include "ibangen/common.hpp"
#include "ibangen/error.hpp"
#include "core/registry/country_registry.hpp"
#include "crypto/random.hpp"
#include <string>

namespace ibangen::core {

/**
 * Produces the bank code and account number of an IBAN
 *
 * A country with sample bank codes gets one of its samples; otherwise the
 * bank code is synthesized from the format descriptor, like the account
 * number always is.
 */
class ComponentGenerator {
public:
    explicit ComponentGenerator(const crypto::SecureRandom& random)
        : random_(random) {}

    Result<std::string> generate_bank_code(const CountryProfile& profile) const;

    /**
     * @return Exactly profile.account_number_length characters
     */
    Result<std::string> generate_account_number(const CountryProfile& profile) const;

    /**
     * Concatenate one random run per field, using the field's alphabet
     */
    Result<std::string> synthesize(const FieldList& fields) const;

    static const std::string& alphabet_for(CharClass kind);

private:
    crypto::SecureRandom random_;
};

} // namespace ibangen::core
