#pragma once

#include "types.hpp"
#include "config.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace todo::cli
{

    inline constexpr int kExitOk = 0;
    inline constexpr int kExitInvalid = 1; // malformed input, date or config
    inline constexpr int kExitOutput = 2;  // rendered item could not be written

    /** Parse the command line, run the pipeline once and return the exit status */
    int run(int argc, char *argv[]);

    /** Process one item and render it to `out`. Diagnostics go to the logger. */
    int run_pipeline(const std::string &input, const AppConfig &cfg, std::ostream &out);

    int exit_code_for(ErrorCode code);

    /**
     * Rewrite single-dash long options (-add, -add=..., -config) to their
     * double-dash form so both spellings are accepted. Arguments from "--" or
     * the first positional argument onward are dropped.
     */
    std::vector<std::string> normalize_args(int argc, char *argv[]);

} // namespace todo::cli
