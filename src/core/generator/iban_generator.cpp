#include "iban_generator.hpp"
#include "core/checksum/checksum.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <new>

namespace ibangen::core {

namespace {
    bool is_digit(char c) { return c >= '0' && c <= '9'; }
    bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
}

IbanGenerator::IbanGenerator(const CountryRegistry& registry, const crypto::SecureRandom& random)
    : registry_(registry)
    , components_(random)
{}

Result<std::string> IbanGenerator::generate_iban(const std::string& country_code) const {
    std::string code = CountryRegistry::normalize_code(country_code);

    const CountryProfile* profile = registry_.find(code);
    if (profile == nullptr) {
        auto lookup = registry_.lookup(code);
        IBANGEN_LOG_WARN("Rejected generation request: {}", lookup.error().message());
        return Result<std::string>::Err(lookup.error());
    }

    try {
        auto iban = assemble(*profile);
        if (iban.is_err()) {
            Error fault = internal_fault(code, iban.error());
            IBANGEN_LOG_ERROR("IBAN generation failed: {}", fault.to_string());
            return Result<std::string>::Err(fault);
        }

        IBANGEN_LOG_DEBUG("Generated IBAN for {}: {}", code, iban.value());
        return iban;
    } catch (const std::exception& e) {
        Error fault(ErrorCode::InternalGenerationFault,
                    "Unexpected error during IBAN generation", e.what());
        fault.with_country(code);
        IBANGEN_LOG_ERROR("IBAN generation failed: {}", fault.to_string());
        return Result<std::string>::Err(fault);
    }
}

Result<std::vector<std::string>> IbanGenerator::generate_batch(
    const std::string& country_code,
    size_t count
) const {
    if (count > constants::MAX_BATCH_SIZE) {
        return Result<std::vector<std::string>>::Err(ErrorCode::InvalidArgument, fmt::format(
            "Batch size {} exceeds the maximum of {}", count, constants::MAX_BATCH_SIZE));
    }

    std::vector<std::string> ibans;
    try {
        ibans.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            auto iban = generate_iban(country_code);
            if (iban.is_err()) {
                return Result<std::vector<std::string>>::Err(iban.error());
            }
            ibans.push_back(std::move(iban.value()));
        }
    } catch (const std::bad_alloc& e) {
        Error fault(ErrorCode::InternalGenerationFault,
                    fmt::format("Out of memory after {} of {} IBANs", ibans.size(), count), e.what());
        fault.with_country(CountryRegistry::normalize_code(country_code));
        IBANGEN_LOG_ERROR("Batch generation failed: {}", fault.to_string());
        return Result<std::vector<std::string>>::Err(fault);
    }
    return Result<std::vector<std::string>>::Ok(std::move(ibans));
}

std::vector<std::string> IbanGenerator::list_supported_codes() const {
    return registry_.list_supported_codes();
}

Result<CountryProfile> IbanGenerator::get_country_profile(const std::string& country_code) const {
    return registry_.lookup(country_code);
}

bool IbanGenerator::validate_iban(const std::string& iban) const {
    std::string candidate = compact(iban);

    if (candidate.size() < constants::IBAN_MIN_LENGTH || candidate.size() > constants::IBAN_MAX_LENGTH) {
        return false;
    }
    if (!is_upper(candidate[0]) || !is_upper(candidate[1])) {
        return false;
    }
    if (!is_digit(candidate[2]) || !is_digit(candidate[3])) {
        return false;
    }
    if (!std::all_of(candidate.begin() + constants::IBAN_PREFIX_LENGTH, candidate.end(),
                     [](char c) { return is_digit(c) || is_upper(c); })) {
        return false;
    }

    const CountryProfile* profile = registry_.find(candidate.substr(0, constants::COUNTRY_CODE_LENGTH));
    if (profile != nullptr) {
        if (candidate.size() != profile->total_length) {
            return false;
        }
        std::string bank_code = candidate.substr(constants::IBAN_PREFIX_LENGTH, profile->bank_code_length);
        std::string account_number = candidate.substr(constants::IBAN_PREFIX_LENGTH + profile->bank_code_length);
        if (!matches_fields(bank_code, profile->format.bank_code)
            || !matches_fields(account_number, profile->format.account_number)) {
            return false;
        }
    }

    return Checksum::verify(candidate);
}

std::string IbanGenerator::format_iban(const std::string& iban) {
    std::string compacted;
    for (char c : iban) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compacted += c;
        }
    }

    std::string result;
    result.reserve(compacted.size() + compacted.size() / constants::FORMAT_GROUP_SIZE);
    for (size_t i = 0; i < compacted.size(); ++i) {
        if (i > 0 && i % constants::FORMAT_GROUP_SIZE == 0) {
            result += ' ';
        }
        result += compacted[i];
    }
    return result;
}

std::string IbanGenerator::compact(const std::string& iban) {
    std::string result;
    result.reserve(iban.size());
    for (char c : iban) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

Result<std::string> IbanGenerator::assemble(const CountryProfile& profile) const {
    auto bank_code = components_.generate_bank_code(profile);
    if (bank_code.is_err()) {
        return bank_code;
    }

    auto account_number = components_.generate_account_number(profile);
    if (account_number.is_err()) {
        return account_number;
    }

    auto check_digits = Checksum::calculate_check_digits(
        profile.code, bank_code.value(), account_number.value());
    if (check_digits.is_err()) {
        return check_digits;
    }

    std::string iban = profile.code + check_digits.value() + bank_code.value() + account_number.value();
    IBANGEN_TRY(Result<std::string>, self_verify(iban, profile));

    return Result<std::string>::Ok(std::move(iban));
}

Result<void> IbanGenerator::self_verify(const std::string& iban, const CountryProfile& profile) {
    if (iban.size() != profile.total_length) {
        return Result<void>::Err(ErrorCode::InternalGenerationFault, fmt::format(
            "Generated IBAN has incorrect length. Expected {}, got {}",
            profile.total_length, iban.size()));
    }
    if (iban.compare(0, constants::COUNTRY_CODE_LENGTH, profile.code) != 0) {
        return Result<void>::Err(ErrorCode::InternalGenerationFault,
            "Generated IBAN does not start with country code " + profile.code);
    }
    if (!is_digit(iban[2]) || !is_digit(iban[3])) {
        return Result<void>::Err(ErrorCode::InternalGenerationFault,
            "Invalid check digits: " + iban.substr(2, 2));
    }
    return Result<void>::Ok();
}

Error IbanGenerator::internal_fault(const std::string& country_code, const Error& cause) {
    if (cause.code() == ErrorCode::InternalGenerationFault) {
        Error fault = cause;
        fault.with_country(country_code);
        return fault;
    }

    Error fault(ErrorCode::InternalGenerationFault, "IBAN generation failed", cause.to_string());
    fault.with_country(country_code);
    return fault;
}

} // namespace ibangen::core
