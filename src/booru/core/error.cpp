// Copyright (c) 2026 changcheng967. All rights reserved.

#include <booru/core/error.hpp>

namespace booru::core {

std::string Error::message() const {
    std::string out;

    for (auto it = context_.rbegin(); it != context_.rend(); ++it) {
        out += *it;
        out += ": ";
    }

    out += code_.message();
    if (!detail_.empty()) {
        out += " (";
        out += detail_;
        out += ")";
    }
    if (cause_) {
        out += ": ";
        out += cause_.message();
    }
    return out;
}

} // namespace booru::core
