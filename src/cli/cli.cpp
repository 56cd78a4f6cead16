#include "cli.hpp"
#include "core/generator/iban_generator.hpp"
#include "core/registry/country_registry.hpp"
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "ibangen/error.hpp"
#include <filesystem>
#include <iostream>

namespace ibangen::cli {

namespace {

void print_countries(const core::IbanGenerator& generator, bool as_json, std::ostream& out) {
    utils::json countries = utils::json::array();

    for (const auto& code : generator.list_supported_codes()) {
        const auto* profile = generator.registry().find(code);
        if (as_json) {
            countries.push_back({
                {"code", profile->code},
                {"name", profile->display_name},
                {"length", profile->total_length},
                {"format", profile->format_notation}
            });
        } else {
            out << profile->code << "  " << profile->display_name
                << " (" << profile->total_length << " characters, "
                << profile->format_notation << ")" << std::endl;
        }
    }

    if (as_json) {
        out << countries.dump(2) << std::endl;
    }
}

// Count from the config file, if set; nullopt with error filled when invalid
std::optional<size_t> configured_count(const utils::Config& config, std::string& error) {
    if (!config.has("count")) {
        return size_t{1};
    }
    auto count = config.get<int64_t>("count");
    if (!count || *count < 1 || static_cast<uint64_t>(*count) > constants::MAX_BATCH_SIZE) {
        error = fmt::format("Config key 'count' must be an integer between 1 and {}",
                            constants::MAX_BATCH_SIZE);
        return std::nullopt;
    }
    return static_cast<size_t>(*count);
}

} // namespace

void print_usage(std::ostream& out) {
    out << "Usage: ibangen [options] [COUNTRY]\n"
        << "Generate checksum-valid test IBANs.\n\n"
        << "  -c, --config PATH      JSON config file (default: ibangen.conf if present)\n"
        << "  -n, --count N          number of IBANs to generate (1.." << constants::MAX_BATCH_SIZE
        << ", default 1)\n"
        << "  -g, --grouped          print in 4-character groups\n"
        << "  -j, --json             print results as a JSON array\n"
        << "  -l, --list             list supported countries\n"
        << "  -v, --validate IBAN    validate an IBAN (exit status 0 if valid)\n"
        << "  -h, --help             show this help\n";
}

std::optional<size_t> parse_count(const std::string& value) {
    if (value.empty() || value.size() > 7) {
        return std::nullopt;
    }

    size_t count = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        count = count * 10 + static_cast<size_t>(c - '0');
    }

    if (count == 0 || count > constants::MAX_BATCH_SIZE) {
        return std::nullopt;
    }
    return count;
}

std::optional<Options> parse_arguments(const std::vector<std::string>& args, std::string& error) {
    Options options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto next_value = [&](std::string& out) -> bool {
            if (i + 1 >= args.size()) {
                error = "Missing value for " + arg;
                return false;
            }
            out = args[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-c" || arg == "--config") {
            if (!next_value(options.config_path)) return std::nullopt;
            options.config_explicit = true;
        } else if (arg == "-n" || arg == "--count") {
            std::string value;
            if (!next_value(value)) return std::nullopt;
            options.count = parse_count(value);
            if (!options.count) {
                error = fmt::format("Invalid count: {} (expected 1..{})", value,
                                    constants::MAX_BATCH_SIZE);
                return std::nullopt;
            }
        } else if (arg == "-g" || arg == "--grouped") {
            options.grouped = true;
        } else if (arg == "-j" || arg == "--json") {
            options.json = true;
        } else if (arg == "-l" || arg == "--list") {
            options.list = true;
        } else if (arg == "-v" || arg == "--validate") {
            std::string value;
            if (!next_value(value)) return std::nullopt;
            options.validate = value;
        } else if (!arg.empty() && arg[0] == '-') {
            error = "Unknown option: " + arg;
            return std::nullopt;
        } else if (!options.country) {
            options.country = arg;
        } else {
            error = "Unexpected argument: " + arg;
            return std::nullopt;
        }
    }
    return options;
}

int run(const Options& options, std::ostream& out, std::ostream& err) {
    if (options.help) {
        print_usage(out);
        return EXIT_OK;
    }

    try {
        // Load configuration (or use defaults if file doesn't exist)
        utils::Config config;
        if (options.config_explicit || std::filesystem::exists(options.config_path)) {
            config = utils::Config::load_from_file(options.config_path);
        }

        // Initialize logging
        auto log_level = config.get_or<std::string>("log_level", "warn");
        auto log_to_file = config.get_or<bool>("log_to_file", false);
        utils::Logger::init(log_level, log_to_file);

        IBANGEN_LOG_INFO("ibangen v{}", IBANGEN_VERSION_STRING);

        // Country table: built-in unless the config names a file
        std::optional<core::CountryRegistry> custom_registry;
        auto countries_file = config.get<std::string>("countries_file");
        if (countries_file) {
            auto loaded = core::CountryRegistry::load_from_file(*countries_file);
            if (loaded.is_err()) {
                err << "ibangen: " << loaded.error().to_string() << std::endl;
                return EXIT_USAGE;
            }
            custom_registry = std::move(loaded.value());
        }
        const core::CountryRegistry& registry =
            custom_registry ? *custom_registry : core::CountryRegistry::builtin();

        core::IbanGenerator generator(registry);

        if (options.list) {
            print_countries(generator, options.json, out);
            return EXIT_OK;
        }

        if (options.validate) {
            bool valid = generator.validate_iban(*options.validate);
            out << core::IbanGenerator::format_iban(core::IbanGenerator::compact(*options.validate))
                << (valid ? ": valid" : ": invalid") << std::endl;
            return valid ? EXIT_OK : EXIT_FAILED;
        }

        std::string country = options.country.value_or(
            config.get_or<std::string>("default_country", "NL"));
        bool grouped = options.grouped || config.get_or<bool>("grouped", false);

        std::optional<size_t> count = options.count;
        if (!count) {
            std::string count_error;
            count = configured_count(config, count_error);
            if (!count) {
                err << "ibangen: " << count_error << std::endl;
                return EXIT_USAGE;
            }
        }

        auto batch = generator.generate_batch(country, *count);
        if (batch.is_err()) {
            const auto& error = batch.error();
            err << "ibangen: " << error.to_string() << std::endl;
            if (error.is_internal()) {
                IBANGEN_LOG_CRITICAL("Generator defect, please report: {}", error.to_string());
            }
            return EXIT_FAILED;
        }

        std::vector<std::string> output;
        for (const auto& iban : batch.value()) {
            output.push_back(grouped ? core::IbanGenerator::format_iban(iban) : iban);
        }

        if (options.json) {
            out << utils::json(output).dump(2) << std::endl;
        } else {
            for (const auto& iban : output) {
                out << iban << std::endl;
            }
        }

        IBANGEN_LOG_INFO("Generated {} IBAN(s) for {}", output.size(), country);
        return EXIT_OK;

    } catch (const IbanException& e) {
        err << "ibangen: " << e.error().to_string() << std::endl;
        return EXIT_FAILED;
    } catch (const std::exception& e) {
        err << "ibangen: " << e.what() << std::endl;
        return EXIT_USAGE;
    }
}

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    std::string parse_error;
    auto options = parse_arguments(args, parse_error);
    if (!options) {
        err << "ibangen: " << parse_error << std::endl;
        print_usage(err);
        return EXIT_USAGE;
    }
    return run(*options, out, err);
}

} // namespace ibangen::cli
