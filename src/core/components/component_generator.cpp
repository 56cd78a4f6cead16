#include "component_generator.hpp"

namespace ibangen::core {

const std::string& ComponentGenerator::alphabet_for(CharClass kind) {
    switch (kind) {
        case CharClass::Digit: return alphabet::DIGITS;
        case CharClass::Letter: return alphabet::LETTERS;
        case CharClass::Alphanumeric: return alphabet::ALPHANUMERIC;
    }
    return alphabet::ALPHANUMERIC;
}

Result<std::string> ComponentGenerator::generate_bank_code(const CountryProfile& profile) const {
    const auto& samples = profile.sample_bank_codes;
    if (samples.empty()) {
        return synthesize(profile.format.bank_code);
    }

    auto index = random_.uniform_int(0, static_cast<int64_t>(samples.size()) - 1);
    if (index.is_err()) {
        return Result<std::string>::Err(index.error());
    }
    return Result<std::string>::Ok(samples[static_cast<size_t>(index.value())]);
}

Result<std::string> ComponentGenerator::generate_account_number(const CountryProfile& profile) const {
    return synthesize(profile.format.account_number);
}

Result<std::string> ComponentGenerator::synthesize(const FieldList& fields) const {
    std::string result;
    result.reserve(field_length(fields));

    for (const auto& field : fields) {
        auto run = random_.random_string(static_cast<int64_t>(field.count), alphabet_for(field.kind));
        if (run.is_err()) {
            return run;
        }
        result += run.value();
    }
    return Result<std::string>::Ok(std::move(result));
}

} // namespace ibangen::core
