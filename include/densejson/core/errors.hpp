#pragma once

#include "densejson/core/value.hpp"

#include <string>

namespace densejson::core {

// A value could not be classified for rendering, or a container was required.
struct TypeError {
    std::string type_name;
    std::string message;
};

// Path resolution stopped at `failed_at` with `remainder` left unconsumed.
struct PathError {
    std::string remainder;
    Value failed_at;
    std::string message;
};

struct AttributeError {
    std::string name;
    std::string message;
};

} // namespace densejson::core
