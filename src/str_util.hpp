#pragma once
/*
 * String helpers
 *
 * Purpose: ASCII whitespace trim/split, lower-casing and prefix tests used by
 *          parser, ranker and rc loader.
 * Note: byte oriented; command names are treated as opaque UTF-8.
 */
#include <string>
#include <vector>

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::vector<std::string> split_ws(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
bool istarts_with(const std::string& s, const std::string& prefix);
bool contains(const std::string& s, const std::string& needle);
bool is_space(char c);

// Locale independent decimal number (std::from_chars syntax, optional leading
// '+'). Returns false unless all of s is consumed. Magnitudes beyond double
// come back as +-HUGE_VAL, or as a signed zero for negative exponents.
bool parse_number(const std::string& s, double& out);
