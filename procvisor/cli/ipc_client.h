#pragma once
#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "../shared/wire_codec.h"

// True if something accepts connections on the socket.
bool socket_accepts(const std::filesystem::path& socket_path);

// Sends one framed request and reads the response.
// Returns 0 with the response filled in, or -1 with error set when the
// daemon could not be reached or answered with garbage.
int ipc_send(const std::filesystem::path& socket_path, const request& req,
             nlohmann::json& response, std::string& error,
             std::chrono::milliseconds timeout = std::chrono::seconds(60));
