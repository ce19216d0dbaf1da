#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

struct arg_spec
{
    std::string name;          // "command" for positionals, "--name" for options
    std::string short_name;    // "-n", may be empty
    std::string help;
    std::string default_value;
    bool positional = false;
    bool required = false;     // positionals only
    bool flag = false;         // option without a value

    // Lookup key: the long name without leading dashes.
    std::string key() const;
};

struct parsed_value
{
    uint32_t hash;
    std::string key;
    std::string value;
};

struct parsed_command
{
    std::vector<parsed_value> values;

    bool has(std::string_view key) const;
    bool flag(std::string_view key) const { return has(key); }
    std::optional<std::string> get(std::string_view key) const;
    std::string value_or(std::string_view key, std::string fallback) const;
    // Throws usage_error when the value is not an integer.
    long long get_int(std::string_view key, long long fallback) const;
};

// Declarative description of a command's arguments, used both to parse the
// raw argument list and to render detailed help.
class arg_schema
{
public:
    arg_schema(std::string prog, std::string description);

    arg_schema& positional(std::string name, std::string help, bool required = true);
    arg_schema& option(std::string name, std::string short_name, std::string help,
                       std::string default_value = {});
    arg_schema& flag(std::string name, std::string short_name, std::string help);

    // Throws usage_error on unknown options, missing values or missing positionals.
    parsed_command parse(const std::vector<std::string>& args) const;

    std::string usage() const;
    std::string render() const;
    nlohmann::json to_json() const;

    const std::string& prog() const { return m_prog; }
    const std::vector<arg_spec>& specs() const { return m_specs; }

private:
    const arg_spec* find_option(std::string_view token) const;

    std::string m_prog;
    std::string m_description;
    std::vector<arg_spec> m_specs;
};
