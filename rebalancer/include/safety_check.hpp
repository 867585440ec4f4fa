#pragma once

#include "types.hpp"
#include <vector>
#include <string>

class SafetyCheck {
public:
    struct Result {
        bool valid;
        std::string reason;
    };

    // Last gate before trades leave the process
    static Result validate(const std::vector<Trade>& trades);
};
