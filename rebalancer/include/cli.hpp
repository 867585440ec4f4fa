#pragma once

#include <istream>
#include <ostream>

class Cli {
public:
    // Reads one JSON request from `in`, writes the result (or an error
    // document) to `out` and diagnostics to `err`. Returns the exit code.
    static int run(std::istream& in, std::ostream& out, std::ostream& err);
};
