#pragma once
#include <filesystem>
#include <string>
#include <sys/types.h>

class supervisor;

struct launch_request
{
    std::string command;
    std::string base_name;      // empty: "<kind>-<program>"
    std::string kind = "bash";
    bool log_output = true;
};

struct launch_result
{
    std::string name;
    pid_t pid = 0;
    std::filesystem::path log_file;
};

// "<kind>-<basename of the first word, at most 10 chars>"
std::string default_base_name(const std::string& kind, const std::string& command);

// Starts `/bin/sh -c command` with output captured to
// <log_dir>/<kind>/<timestamp>_<name>.log and registers it as <base>-<pid>.
// Throws process_error when the process cannot be started and
// duplicate_name_error when the name is taken.
launch_result launch_shell(supervisor& sv, const launch_request& req);
