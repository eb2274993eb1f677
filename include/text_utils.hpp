#pragma once

#include <string>

/**
 * Strip leading and trailing whitespace (spaces, tabs, CR, LF, ...).
 */
std::string trim(const std::string &text);

// ASCII lowercase, for header names, content types and file extensions
std::string toLower(std::string text);

bool endsWithIgnoreCase(const std::string &text, const std::string &suffix);
