// src/api/cli.hpp

#pragma once

#include <iosfwd>
#include <string>

#include "../config/classifier_config.hpp"

struct CommandLine {
    ClassifierConfig config;
    std::string train_file;
    std::string test_file;
    bool show_help = false;
};

// A --config file is applied first wherever it appears, the other flags
// override its values. Throws std::invalid_argument on an unknown or
// incomplete option.
CommandLine parseArguments(int argc, const char* const argv[]);

void printUsage(std::ostream& out, const std::string& program_name);

// Results go to `out`, progress and errors to `err`. Returns the exit code.
int runCli(int argc, const char* const argv[], std::ostream& out, std::ostream& err);
