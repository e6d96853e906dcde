#pragma once

#include <filesystem>
#include <string>
#include <vector>

struct ProcessResult {
    // Exit status, or -1 if the child was killed by a signal.
    int exit_code = -1;
    // Interleaved stdout and stderr.
    std::string output;

    bool succeeded() const { return exit_code == 0; }
};

// Runs args[0] (PATH lookup applies) with the given working directory and waits for it.
// A program that cannot be executed exits with status 127. Throws VpkgException(Io)
// if the child cannot be spawned at all.
ProcessResult run_process(const std::vector<std::string>& args, const std::filesystem::path& cwd);
