#pragma once

#include "ibangen/common.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace ibangen::cli {

// Process exit statuses
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;   // invalid IBAN or generation error
constexpr int EXIT_USAGE = 2;    // bad arguments or configuration

/**
 * Parsed command line
 */
struct Options {
    std::string config_path = "ibangen.conf";
    bool config_explicit = false;
    std::optional<std::string> country;
    std::optional<size_t> count;
    bool grouped = false;
    bool json = false;
    bool list = false;
    std::optional<std::string> validate;
    bool help = false;
};

/**
 * Parse arguments (without the program name)
 * @param error Set to the reason when parsing fails
 * @return Options, or nullopt on a usage error
 */
std::optional<Options> parse_arguments(const std::vector<std::string>& args, std::string& error);

/**
 * Parse a batch count: decimal digits only, 1..constants::MAX_BATCH_SIZE
 */
std::optional<size_t> parse_count(const std::string& value);

void print_usage(std::ostream& out);

/**
 * Execute a parsed command line
 * Results go to out, diagnostics to err.
 * @return EXIT_OK, EXIT_FAILED or EXIT_USAGE
 */
int run(const Options& options, std::ostream& out, std::ostream& err);

/**
 * parse_arguments() followed by run()
 */
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace ibangen::cli
