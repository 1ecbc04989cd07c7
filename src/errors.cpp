#include "errors.hpp"
#include <cstdlib>
#include <iostream>

namespace robot
{

    void fatal(const std::string &msg)
    {
        std::cerr << msg << "\n";
        std::exit(EXIT_FAILURE);
    }

} // namespace robot
