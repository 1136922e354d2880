/**
 * @file Identifiers.hpp
 * @brief Id, hash and timestamp helpers shared by every layer.
 */

#pragma once

#include <string>
#include "domain/Entities.hpp"

namespace psyche::domain {

/** @brief Returns a random RFC 4122 version 4 identifier (lower-case, hyphenated). */
std::string GenerateId();

/** @brief Content hash used for dedup keys and decision snapshots. */
std::string ComputeHash(const std::string& text);

long long ToMillis(Timestamp ts);
Timestamp FromMillis(long long ms);

/** @brief Lower-cases ASCII letters only. */
std::string ToLower(std::string text);

/** @brief Strips leading and trailing whitespace. */
std::string Trim(const std::string& text);

} // namespace psyche::domain
