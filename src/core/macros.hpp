#pragma once

#include <iostream>
#include <stdexcept>
#include <string>

namespace wl {
    namespace core {

        // should never be called error
#define SHOULD_NEVER_BE_CALLED() \
    throw std::runtime_error(std::string("This feature should never be called! \n") + \
    "in function: " + __func__ + "\n" \
    "in line: " + std::to_string(__LINE__) + "\n" \
    "in file: " __FILE__)

    }
}
