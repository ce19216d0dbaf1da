#include "arg_schema.h"
#include "../shared/errors.h"
#include "../shared/string_util.h"

#include <charconv>

std::string arg_spec::key() const
{
    size_t start = name.find_first_not_of('-');
    return start == std::string::npos ? name : name.substr(start);
}

bool parsed_command::has(std::string_view key) const
{
    uint32_t h = fnv1a(key);
    for (const auto& v : values)
    {
        if (v.hash == h && v.key == key)
            return true;
    }
    return false;
}

std::optional<std::string> parsed_command::get(std::string_view key) const
{
    uint32_t h = fnv1a(key);
    for (const auto& v : values)
    {
        if (v.hash == h && v.key == key)
            return v.value;
    }
    return std::nullopt;
}

std::string parsed_command::value_or(std::string_view key, std::string fallback) const
{
    auto v = get(key);
    return v ? *v : std::move(fallback);
}

long long parsed_command::get_int(std::string_view key, long long fallback) const
{
    auto v = get(key);
    if (!v || v->empty())
        return fallback;

    long long n = 0;
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), n);
    if (ec != std::errc() || ptr != v->data() + v->size())
        throw usage_error("argument --" + std::string(key) + ": invalid int value: '" + *v + "'");
    return n;
}

arg_schema::arg_schema(std::string prog, std::string description)
    : m_prog(std::move(prog)), m_description(std::move(description))
{
}

arg_schema& arg_schema::positional(std::string name, std::string help, bool required)
{
    arg_spec s;
    s.name = std::move(name);
    s.help = std::move(help);
    s.positional = true;
    s.required = required;
    m_specs.push_back(std::move(s));
    return *this;
}

arg_schema& arg_schema::option(std::string name, std::string short_name, std::string help,
                               std::string default_value)
{
    arg_spec s;
    s.name = std::move(name);
    s.short_name = std::move(short_name);
    s.help = std::move(help);
    s.default_value = std::move(default_value);
    m_specs.push_back(std::move(s));
    return *this;
}

arg_schema& arg_schema::flag(std::string name, std::string short_name, std::string help)
{
    arg_spec s;
    s.name = std::move(name);
    s.short_name = std::move(short_name);
    s.help = std::move(help);
    s.flag = true;
    m_specs.push_back(std::move(s));
    return *this;
}

const arg_spec* arg_schema::find_option(std::string_view token) const
{
    for (const auto& s : m_specs)
    {
        if (s.positional)
            continue;
        if (token == s.name || (!s.short_name.empty() && token == s.short_name))
            return &s;
    }
    return nullptr;
}

static bool looks_like_option(std::string_view token)
{
    if (token.size() < 2 || token[0] != '-')
        return false;
    // negative numbers are values
    return !(token[1] >= '0' && token[1] <= '9');
}

parsed_command arg_schema::parse(const std::vector<std::string>& args) const
{
    parsed_command out;
    std::vector<std::string> positionals;
    std::vector<std::string> unknown;
    bool options_done = false;

    auto store = [&out](const arg_spec& s, std::string value)
    {
        std::string key = s.key();
        uint32_t h = fnv1a(key);
        for (auto& v : out.values)
        {
            if (v.hash == h && v.key == key)
            {
                v.value = std::move(value);
                return;
            }
        }
        out.values.push_back({h, std::move(key), std::move(value)});
    };

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& tok = args[i];

        if (options_done || !looks_like_option(tok))
        {
            positionals.push_back(tok);
            continue;
        }

        if (tok == "--")
        {
            options_done = true;
            continue;
        }

        std::string_view name = tok;
        std::optional<std::string> inline_value;
        if (auto eq = name.find('='); eq != std::string_view::npos && name.rfind("--", 0) == 0)
        {
            inline_value = std::string(name.substr(eq + 1));
            name = name.substr(0, eq);
        }

        const arg_spec* spec = find_option(name);
        if (!spec)
        {
            unknown.push_back(tok);
            continue;
        }

        if (spec->flag)
        {
            if (inline_value)
                throw usage_error("argument " + spec->name + ": ignored explicit argument '" + *inline_value + "'");
            store(*spec, "1");
            continue;
        }

        if (inline_value)
        {
            store(*spec, std::move(*inline_value));
        }
        else
        {
            if (i + 1 >= args.size() || looks_like_option(args[i + 1]))
                throw usage_error("argument " + spec->name + ": expected one argument");
            store(*spec, args[++i]);
        }
    }

    std::vector<std::string> missing;
    size_t next = 0;
    for (const auto& s : m_specs)
    {
        if (!s.positional)
            continue;
        if (next < positionals.size())
            store(s, positionals[next++]);
        else if (s.required)
            missing.push_back(s.name);
    }
    for (; next < positionals.size(); ++next)
        unknown.push_back(positionals[next]);

    if (!missing.empty())
        throw usage_error("the following arguments are required: " + join(missing, ", "));
    if (!unknown.empty())
        throw usage_error("unrecognized arguments: " + join(unknown, " "));

    for (const auto& s : m_specs)
    {
        if (!s.positional && !s.flag && !s.default_value.empty() && !out.has(s.key()))
            store(s, s.default_value);
    }

    return out;
}

static std::string metavar(const arg_spec& s)
{
    std::string m = s.key();
    for (char& c : m)
    {
        if (c == '-')
            c = '_';
        else if (c >= 'a' && c <= 'z')
            c = static_cast<char>(c - 32);
    }
    return m;
}

std::string arg_schema::usage() const
{
    std::string out = "usage: " + m_prog;
    for (const auto& s : m_specs)
    {
        if (s.positional)
            continue;
        out += " [" + (s.short_name.empty() ? s.name : s.short_name);
        if (!s.flag)
            out += " " + metavar(s);
        out += "]";
    }
    for (const auto& s : m_specs)
    {
        if (!s.positional)
            continue;
        out += s.required ? " " + s.name : " [" + s.name + "]";
    }
    return out;
}

std::string arg_schema::render() const
{
    constexpr size_t column = 24;

    auto line = [](std::string left, const std::string& help)
    {
        std::string l = "  " + std::move(left);
        if (l.size() + 2 > column)
            return l + "\n" + std::string(column, ' ') + help + "\n";
        l.resize(column, ' ');
        return l + help + "\n";
    };

    std::string out = usage() + "\n";
    if (!m_description.empty())
        out += "\n" + m_description + "\n";

    bool any_positional = false;
    for (const auto& s : m_specs)
    {
        if (!s.positional)
            continue;
        if (!any_positional)
            out += "\npositional arguments:\n";
        any_positional = true;
        out += line(s.name, s.help);
    }

    bool any_option = false;
    for (const auto& s : m_specs)
    {
        if (s.positional)
            continue;
        if (!any_option)
            out += "\noptions:\n";
        any_option = true;

        std::string left;
        if (!s.short_name.empty())
            left = s.short_name + (s.flag ? "" : " " + metavar(s)) + ", ";
        left += s.name;
        if (!s.flag)
            left += " " + metavar(s);
        out += line(std::move(left), s.help);
    }

    return out;
}

nlohmann::json arg_schema::to_json() const
{
    nlohmann::json args = nlohmann::json::array();
    for (const auto& s : m_specs)
    {
        nlohmann::json a = {{"name", s.name}, {"help", s.help}, {"positional", s.positional}};
        if (!s.short_name.empty())
            a["short"] = s.short_name;
        if (s.positional)
            a["required"] = s.required;
        else
            a["flag"] = s.flag;
        if (!s.default_value.empty())
            a["default"] = s.default_value;
        args.push_back(std::move(a));
    }
    return {{"prog", m_prog}, {"description", m_description}, {"arguments", std::move(args)}};
}
