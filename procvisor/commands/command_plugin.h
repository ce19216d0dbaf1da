#pragma once
#include <memory>
#include <string>
#include <vector>

#include "arg_schema.h"
#include "../daemon/command_registry.h"

// A compiled-in command: same contract as a Lua plugin, registered through
// the same path after the built-ins.
struct command_plugin
{
    std::string name;
    std::string help;
    std::shared_ptr<const arg_schema> schema;
    command_handler handler;
};

std::vector<command_plugin> bash_plugins();
std::vector<command_plugin> runner_plugins();
std::vector<command_plugin> pid_plugins();
std::vector<command_plugin> session_plugins();

// All of the above, in registration order.
std::vector<command_plugin> compiled_plugins();

// Parses args against the plugin's schema, turning usage errors into the
// standard "Invalid arguments" failure.
parsed_command parse_plugin_args(const arg_schema& schema, const std::vector<std::string>& args);
