#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

// ibangen version
#define IBANGEN_VERSION_STRING "0.1.0"

// Utility macros
#define IBANGEN_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define IBANGEN_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define IBANGEN_DISALLOW_COPY_AND_MOVE(TypeName) \
    IBANGEN_DISALLOW_COPY(TypeName); \
    IBANGEN_DISALLOW_MOVE(TypeName)

// Constants
namespace ibangen {
namespace constants {

// IBAN structure
constexpr size_t COUNTRY_CODE_LENGTH = 2;
constexpr size_t CHECK_DIGITS_LENGTH = 2;
constexpr size_t IBAN_PREFIX_LENGTH = COUNTRY_CODE_LENGTH + CHECK_DIGITS_LENGTH;
constexpr size_t IBAN_MIN_LENGTH = IBAN_PREFIX_LENGTH + 1;
constexpr size_t IBAN_MAX_LENGTH = 34;  // ISO 13616

// ISO 7064 mod-97-10
constexpr uint32_t CHECKSUM_MODULUS = 97;
constexpr uint32_t CHECKSUM_BASE = 98;

// Presentation
constexpr size_t FORMAT_GROUP_SIZE = 4;

// Random sampling
constexpr size_t MAX_RANDOM_BYTES = 8;

// Largest number of IBANs produced by one batch request
constexpr size_t MAX_BATCH_SIZE = 1000000;

} // namespace constants
} // namespace ibangen

// Core types
namespace ibangen {

using byte = uint8_t;

// Alphabets used by the component generators
namespace alphabet {
inline const std::string DIGITS = "0123456789";
inline const std::string LETTERS = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
inline const std::string ALPHANUMERIC = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
} // namespace alphabet

} // namespace ibangen
