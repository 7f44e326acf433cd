#pragma once

#include <iostream>

// Compile with -DDEBUG=1 to trace planner decisions on stderr
#if DEBUG
    #define DBG(x) do { std::cerr << x << std::endl; } while (0)
#else
    #define DBG(x) do {} while (0)
#endif
