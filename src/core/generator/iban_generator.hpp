#pragma once

#include "ibangen/common.hpp"
#include "ibangen/error.hpp"
#include "core/registry/country_registry.hpp"
#include "core/components/component_generator.hpp"
#include "crypto/random.hpp"
#include <string>
#include <vector>

namespace ibangen::core {

/**
 * IBAN generation engine
 *
 * generate_iban() runs a single pass: normalize and look up the country,
 * generate bank code and account number, compute the check digits,
 * assemble, then self-verify the result's structure. Failures after the
 * lookup are engine defects and come back as InternalGenerationFault with
 * the cause in the error details.
 *
 * The generator holds no mutable state; one instance may be shared by
 * several threads.
 */
class IbanGenerator {
public:
    explicit IbanGenerator(
        const CountryRegistry& registry = CountryRegistry::builtin(),
        const crypto::SecureRandom& random = crypto::SecureRandom()
    );

    /**
     * Generate a random, checksum-valid IBAN
     * @param country_code Two-letter code, case and surrounding whitespace ignored
     * @return IBAN, UnsupportedCountry or InternalGenerationFault
     */
    Result<std::string> generate_iban(const std::string& country_code) const;

    /**
     * Generate count independent IBANs; the first failure aborts the batch
     * @return InvalidArgument if count exceeds constants::MAX_BATCH_SIZE
     */
    Result<std::vector<std::string>> generate_batch(const std::string& country_code, size_t count) const;

    /**
     * Supported country codes in table order
     */
    std::vector<std::string> list_supported_codes() const;

    Result<CountryProfile> get_country_profile(const std::string& country_code) const;

    /**
     * Validate an IBAN: structure, registered length and shape for known
     * countries, and check digits. Spaces are ignored, letters may be
     * lower case.
     */
    bool validate_iban(const std::string& iban) const;

    /**
     * Group into blocks of four separated by spaces (presentation only)
     */
    static std::string format_iban(const std::string& iban);

    /**
     * Remove whitespace and upper-case
     */
    static std::string compact(const std::string& iban);

    const CountryRegistry& registry() const { return registry_; }

private:
    Result<std::string> assemble(const CountryProfile& profile) const;

    static Result<void> self_verify(const std::string& iban, const CountryProfile& profile);

    static Error internal_fault(const std::string& country_code, const Error& cause);

    const CountryRegistry& registry_;
    ComponentGenerator components_;
};

} // namespace ibangen::core
