#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

// Root of the supervisor's error taxonomy. Every boundary that contains
// failures (dispatch, connection, plugin load, config load) catches this.
class procvisor_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Malformed frame, out-of-bounds length, peer closed mid-read, socket timeout.
class protocol_error : public procvisor_error
{
public:
    using procvisor_error::procvisor_error;
};

// Peer hung up before sending a single byte: nothing to answer.
class peer_closed_error : public protocol_error
{
public:
    using protocol_error::protocol_error;
};

class dispatch_error : public procvisor_error
{
public:
    using procvisor_error::procvisor_error;
};

class unknown_command_error : public dispatch_error
{
public:
    explicit unknown_command_error(std::string_view name)
        : dispatch_error("Unknown command: " + std::string(name)) {}
};

class duplicate_name_error : public procvisor_error
{
public:
    explicit duplicate_name_error(std::string_view name)
        : procvisor_error("Process name already registered: " + std::string(name)) {}
};

class not_found_error : public procvisor_error
{
public:
    explicit not_found_error(std::string_view name)
        : procvisor_error("Process \"" + std::string(name) + "\" not found") {}
};

// Spawn failure, lost handle, signal delivery failure.
class process_error : public procvisor_error
{
public:
    using procvisor_error::procvisor_error;
};

class plugin_load_error : public procvisor_error
{
public:
    using procvisor_error::procvisor_error;
};

class config_error : public procvisor_error
{
public:
    using procvisor_error::procvisor_error;
};

// Command-line style argument errors raised by plugin argument parsing.
class usage_error : public procvisor_error
{
public:
    using procvisor_error::procvisor_error;
};
