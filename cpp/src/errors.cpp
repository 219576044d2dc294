// cpp/src/errors.cpp
#include "errors.h"

#include <cstring>

std::string systemErrorText(const std::string& context, int err) {
    return context + ": " + std::strerror(err);
}
