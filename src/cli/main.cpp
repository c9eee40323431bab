// File: src/cli/main.cpp
//
// Entry point for the itemrec_batch executable

#include "cli/batch_runner.hpp"
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    itemrec::BatchRunner runner;
    return runner.Run(args);
}
