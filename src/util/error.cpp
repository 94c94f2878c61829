#include <cstring>

#include "util/error.hpp"

const TError OK;

std::string TError::ErrorName(EError error) {
    return lsa::EError_Name(error);
}

std::string TError::Message() const {
    if (!Errno)
        return Text;
    return fmt::format("{}: {}", Text, strerror(Errno));
}

std::string TError::ToString() const {
    if (Text.empty() && !Errno)
        return ErrorName(Error);
    return fmt::format("{}: {}", ErrorName(Error), Message());
}
