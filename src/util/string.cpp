#include <sstream>
#include <cctype>
#include <climits>
#include <cstdint>
#include <cstdlib>

#include "util/string.hpp"

TError StringToInt64(const std::string &str, int64_t &value) {
    const char *ptr = str.c_str();
    char *end;

    errno = 0;
    value = strtoll(ptr, &end, 10);
    if (errno || end == ptr)
        return TError(EError::InvalidValue, errno, "Bad int64 value: " + str);
    while (isspace(*end))
        end++;
    if (*end)
        return TError(EError::InvalidValue, "Bad int64 value: " + str);
    return OK;
}

TTuple SplitString(const std::string &str, const char sep, int max) {
    std::vector<std::string> tokens;
    std::istringstream ss(str);
    std::string tok;

    while(std::getline(ss, tok, sep)) {
        if (max && !--max) {
            std::string rem;
            std::getline(ss, rem);
            if (rem.length()) {
                tok += sep;
                tok += rem;
            }
        }
        tokens.push_back(tok);
    }

    return tokens;
}

TTuple SplitWords(const std::string &str) {
    TTuple words;
    size_t i = 0, len = str.length();

    while (i < len) {
        while (i < len && isspace((unsigned char)str[i]))
            i++;
        size_t start = i;
        while (i < len && !isspace((unsigned char)str[i]))
            i++;
        if (i > start)
            words.push_back(str.substr(start, i - start));
    }

    return words;
}

std::string StringTrim(const std::string& s, const std::string &what) {
    std::size_t first = s.find_first_not_of(what);
    std::size_t last  = s.find_last_not_of(what);

    if (first == std::string::npos || last == std::string::npos)
        return "";

    return s.substr(first, last - first + 1);
}

bool StringEndsWith(const std::string &str, const std::string &sfx) {
    if (str.length() < sfx.length())
        return false;

    return !str.compare(str.length() - sfx.length(), sfx.length(), sfx);
}

/* Length of sequence started by this byte, 0 for invalid lead byte */
static int Utf8SeqLen(unsigned char c) {
    if (c < 0x80)
        return 1;
    if ((c >> 5) == 0x6)
        return c < 0xC2 ? 0 : 2;
    if ((c >> 4) == 0xE)
        return 3;
    if ((c >> 3) == 0x1E)
        return c > 0xF4 ? 0 : 4;
    return 0;
}

/* Length of valid sequence at offset or 0 */
static int Utf8Valid(const std::string &str, size_t off) {
    unsigned char c = str[off];
    int len = Utf8SeqLen(c);

    if (!len || off + len > str.length())
        return 0;

    for (int i = 1; i < len; i++)
        if (((unsigned char)str[off + i] >> 6) != 0x2)
            return 0;

    unsigned char c1 = len > 1 ? str[off + 1] : 0;

    /* overlong forms, surrogates, above U+10FFFF */
    if (c == 0xE0 && c1 < 0xA0)
        return 0;
    if (c == 0xED && c1 > 0x9F)
        return 0;
    if (c == 0xF0 && c1 < 0x90)
        return 0;
    if (c == 0xF4 && c1 > 0x8F)
        return 0;

    return len;
}

bool StringIsUtf8(const std::string &str) {
    for (size_t off = 0; off < str.length(); ) {
        int len = Utf8Valid(str, off);
        if (!len)
            return false;
        off += len;
    }
    return true;
}

size_t StringLength(const std::string &str) {
    size_t length = 0;

    for (size_t off = 0; off < str.length(); length++) {
        int len = Utf8Valid(str, off);
        off += len ? len : 1;
    }

    return length;
}

std::string StringPrefix(const std::string &str, size_t length) {
    size_t off = 0;

    while (length-- && off < str.length()) {
        int len = Utf8Valid(str, off);
        off += len ? len : 1;
    }

    return str.substr(0, off);
}

std::string StringPadRight(const std::string &str, size_t width) {
    size_t length = StringLength(str);

    if (length >= width)
        return str;

    return str + std::string(width - length, ' ');
}
