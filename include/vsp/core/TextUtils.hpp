/**
 * TextUtils.hpp - Utterance normalization, hashing and frame encoding helpers
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace vsp::core {

/// Lower-cases, trims, collapses inner whitespace and strips trailing
/// sentence punctuation so "Find organic milk." and "find organic milk"
/// compare equal.
std::string normalizeUtterance(const std::string& text);

/// 64-bit FNV-1a.
uint64_t hashText(const std::string& text);

/// True when the trimmed text ends in '.', '!' or '?'.
bool endsWithTerminalPunctuation(const std::string& text);

std::string trim(const std::string& text);

/// Joins two transcript fragments with a single space.
std::string joinFragments(const std::string& head, const std::string& tail);

std::string base64Encode(const uint8_t* data, size_t size);
std::vector<uint8_t> base64Decode(const std::string& encoded);

} // namespace vsp::core
