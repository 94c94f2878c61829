#include <sstream>

#include "test.hpp"

namespace test {

void ExpectReturn(int ret, int exp, int line, const char *func) {
    if (ret == exp)
        return;
    throw std::string("Got " + std::to_string(ret) + ", but expected " + std::to_string(exp) + " at " + func + ":" + std::to_string(line));
}

void ExpectError(const TError &ret, EError exp, int line, const char *func) {
    std::stringstream ss;

    if (ret == exp)
        return;

    ss << "Got " << ret << ", but expected " << TError::ErrorName(exp) << " at " << func << ":" << line;

    throw ss.str();
}

void _ExpectEq(size_t ret, size_t exp, size_t line, const char *func) {
    if (ret != exp)
        throw std::string("Got " + std::to_string(ret) + ", but expected " + std::to_string(exp) + " at " + func + ":" + std::to_string(line));
}

void _ExpectEq(const std::string &ret, const std::string &exp, size_t line, const char *func) {
    if (ret != exp)
        throw std::string("Got '" + ret + "', but expected '" + exp + "' at " + func + ":" + std::to_string(line));
}

void _ExpectNeq(size_t ret, size_t exp, size_t line, const char *func) {
    if (ret == exp)
        throw std::string("Got " + std::to_string(ret) + ", but expected != " + std::to_string(exp) + " at " + func + ":" + std::to_string(line));
}

void _ExpectNeq(const std::string &ret, const std::string &exp, size_t line, const char *func) {
    if (ret == exp)
        throw std::string("Got '" + ret + "', but expected != '" + exp + "' at " + func + ":" + std::to_string(line));
}

TTempFile::TTempFile(const std::string &text) : Path("/tmp/lsaccounts-test.XXXXXX") {
    TFile file;
    TError error = file.CreateTemporary(Path);
    if (!error)
        error = file.WriteAll(text);
    if (error)
        throw std::string("Cannot create temporary file: " + error.ToString());
}

TTempFile::~TTempFile() {
    (void)Path.Unlink();
}

}
