#pragma once

#include <iostream>
#include <string>

#include "util/path.hpp"

namespace test {
    void ExpectReturn(int ret, int exp, int line, const char *func);
    void ExpectError(const TError &ret, EError exp, int line, const char *func);

    void _ExpectEq(size_t ret, size_t exp, size_t line, const char *func);
    void _ExpectEq(const std::string &ret, const std::string &exp, size_t line, const char *func);
    void _ExpectNeq(size_t ret, size_t exp, size_t line, const char *func);
    void _ExpectNeq(const std::string &ret, const std::string &exp, size_t line, const char *func);

    /* Removed at destruction */
    class TTempFile {
        TTempFile(const TTempFile&) = delete;
        TTempFile& operator=(const TTempFile&) = delete;
    public:
        TPath Path;
        explicit TTempFile(const std::string &text);
        ~TTempFile();
    };
}

#define Expect(ret) ExpectReturn(ret, true, __LINE__, __func__)

#define ExpectSuccess(ret) ExpectError(ret, EError::Success, __LINE__, __func__)
#define ExpectFailure(ret, exp) ExpectError(ret, exp, __LINE__, __func__)

#define ExpectEq(ret, exp) _ExpectEq(ret, exp, __LINE__, __func__)
#define ExpectNeq(ret, exp) _ExpectNeq(ret, exp, __LINE__, __func__)
