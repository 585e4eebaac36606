#include "core/Version.hpp"

#include <cstdio>

namespace fmodpp {

std::string Version::to_string() const {
    char text[16];
    std::snprintf(text, sizeof(text), "%u.%02u.%02u", static_cast<unsigned>(product),
                  static_cast<unsigned>(major), static_cast<unsigned>(minor));
    return text;
}

} // namespace fmodpp
