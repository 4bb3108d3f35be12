#pragma once
#include <string>

namespace launcher {
enum class Status : int {
    Initialized,
    Started,
    Terminated,
};

struct LaunchParams {
    std::string workdir; // empty keeps the current directory
    // PR_SET_PDEATHSIG follows the thread calling start(), not the process
    bool        die_on_parent_exit = false;
};

struct Result {
    enum class ExitReason : int {
        Exit,
        Signal,
    };

    ExitReason reason;
    int        code;
};
} // namespace launcher
