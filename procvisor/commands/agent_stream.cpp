#include "agent_stream.h"
#include "../shared/string_util.h"

namespace {

template <typename T>
T number_or(const nlohmann::json& obj, const char* key, T fallback)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number())
        return fallback;
    return it->get<T>();
}

std::string string_or(const nlohmann::json& obj, const char* key, std::string fallback)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return fallback;
    return it->get<std::string>();
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
        s.remove_suffix(1);
    while (!s.empty() && s.front() == ' ')
        s.remove_prefix(1);
    return s;
}

}

bool stream_stats::feed(std::string_view line)
{
    line = trim(line);
    if (line.empty())
        return false;

    auto data = nlohmann::json::parse(line, nullptr, false);
    if (data.is_discarded() || !data.is_object())
    {
        stderr_lines.emplace_back(line);
        return false;
    }

    if (session_id.empty())
        session_id = string_or(data, "session_id", "");

    std::string type = string_or(data, "type", "");
    switch (fnv1a(type))
    {
        case fnv1a("system"):
        {
            if (string_or(data, "subtype", "") != "init")
                break;
            auto tools = data.find("tools");
            if (tools != data.end() && tools->is_array())
            {
                tools_available.clear();
                for (const auto& t : *tools)
                {
                    if (t.is_string())
                        tools_available.push_back(t.get<std::string>());
                }
            }
            break;
        }
        case fnv1a("assistant"):
        {
            auto msg_it = data.find("message");
            if (msg_it == data.end() || !msg_it->is_object())
                break;
            const auto& message = *msg_it;

            if (model.empty())
                model = string_or(message, "model", "");

            auto content = message.find("content");
            if (content != message.end() && content->is_array())
            {
                for (const auto& item : *content)
                {
                    if (item.is_object() && string_or(item, "type", "") == "tool_use")
                        ++tool_counts[string_or(item, "name", "unknown")];
                }
            }

            auto usage = message.find("usage");
            if (usage != message.end() && usage->is_object())
            {
                input_tokens += number_or<uint64_t>(*usage, "input_tokens", 0);
                input_tokens += number_or<uint64_t>(*usage, "cache_creation_input_tokens", 0);
                input_tokens += number_or<uint64_t>(*usage, "cache_read_input_tokens", 0);
                output_tokens += number_or<uint64_t>(*usage, "output_tokens", 0);
            }
            break;
        }
        case fnv1a("result"):
        {
            finished = true;
            status = string_or(data, "subtype", "unknown");
            result = string_or(data, "result", "");
            cost_usd = number_or<double>(data, "cost_usd", 0.0);
            total_cost = number_or<double>(data, "total_cost", 0.0);
            duration_ms = number_or<uint64_t>(data, "duration_ms", 0);
            duration_api_ms = number_or<uint64_t>(data, "duration_api_ms", 0);
            num_turns = number_or<uint64_t>(data, "num_turns", 0);
            auto err = data.find("is_error");
            is_error = err != data.end() && err->is_boolean() && err->get<bool>();
            break;
        }
        default:
            break;
    }

    return true;
}

nlohmann::json stream_stats::metadata_patch() const
{
    nlohmann::json patch = {
        {"tool_counts", tool_counts},
        {"total_tokens", total_tokens()},
        {"total_input_tokens", input_tokens},
        {"total_output_tokens", output_tokens},
        {"cost_usd", cost_usd},
        {"is_error", is_error}
    };
    if (!model.empty())
        patch["model"] = model;
    if (!session_id.empty())
        patch["session_id"] = session_id;
    if (finished)
        patch["status"] = status;
    return patch;
}

nlohmann::json stream_stats::to_json() const
{
    nlohmann::json out = metadata_patch();
    out["tools_available"] = tools_available;
    if (finished)
    {
        out["result"] = result;
        out["total_cost"] = total_cost;
        out["duration_ms"] = duration_ms;
        out["duration_api_ms"] = duration_api_ms;
        out["num_turns"] = num_turns;
    }
    if (!stderr_lines.empty())
        out["stderr"] = join(stderr_lines, "\n");
    return out;
}

std::string with_thousands(uint64_t n)
{
    std::string digits = std::to_string(n);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);

    for (size_t i = 0; i < digits.size(); ++i)
    {
        if (i > 0 && (digits.size() - i) % 3 == 0)
            out += ',';
        out += digits[i];
    }
    return out;
}

std::string format_tool_counts(const nlohmann::json& counts)
{
    if (!counts.is_object() || counts.empty())
        return "none";

    // json objects iterate in key order
    std::vector<std::string> items;
    for (auto it = counts.begin(); it != counts.end(); ++it)
    {
        if (it.value().is_number_integer())
            items.push_back(std::to_string(it.value().get<int64_t>()) + " " + it.key());
    }
    return items.empty() ? "none" : join(items, ", ");
}

std::string describe_stream_line(std::string_view line)
{
    line = trim(line);

    auto data = nlohmann::json::parse(line, nullptr, false);
    if (data.is_discarded() || !data.is_object())
    {
        if (line.size() > 80)
            return std::string(line.substr(0, 80)) + "...";
        return std::string(line);
    }

    std::string type = string_or(data, "type", "unknown");
    switch (fnv1a(type))
    {
        case fnv1a("assistant"):
        {
            auto msg = data.find("message");
            if (msg == data.end() || !msg->is_object())
                break;
            auto content = msg->find("content");
            if (content == msg->end() || !content->is_array() || content->empty() ||
                !content->front().is_object())
                break;

            const auto& first = content->front();
            std::string kind = string_or(first, "type", "");
            if (kind == "tool_use")
                return "[tool: " + string_or(first, "name", "unknown") + "]";
            if (kind == "text")
            {
                std::string text = string_or(first, "text", "");
                if (text.size() >= 80)
                    return "[text: " + text.substr(0, 80) + "...]";
                return "[text: " + text + "]";
            }
            break;
        }
        case fnv1a("user"):
            return "[tool result]";
        case fnv1a("result"):
            return "[" + string_or(data, "subtype", "result") + "]";
        default:
            break;
    }

    return "[" + type + "]";
}
