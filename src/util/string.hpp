#pragma once

#include <string>
#include <vector>

#include "util/error.hpp"

typedef std::vector<std::string> TTuple;

TError StringToInt64(const std::string &str, int64_t &value);

TTuple SplitString(const std::string &str, const char sep, int max = 0);

/* Splits by any run of whitespace, drops empty tokens */
TTuple SplitWords(const std::string &str);

std::string StringTrim(const std::string& s, const std::string &what = " \t\n");
bool StringEndsWith(const std::string &str, const std::string &suffix);

bool StringIsUtf8(const std::string &str);

/* Length and prefix in characters, broken sequences count bytewise */
size_t StringLength(const std::string &str);
std::string StringPrefix(const std::string &str, size_t length);
std::string StringPadRight(const std::string &str, size_t width);
