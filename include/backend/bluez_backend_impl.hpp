// include/backend/bluez_backend_impl.hpp
#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "agent/pairing_agent.hpp"
#include "backend/bluez_backend.hpp"
#include "util/constants.hpp"

struct sd_bus;

namespace backend
{
struct BluezBackend::Impl
{
    sd_bus *bus = nullptr;

    // serialize all sd-bus access
    std::mutex bus_mu;

    // refreshed on every snapshot, guarded by paths_mu
    mutable std::mutex                           paths_mu;
    std::unordered_map<std::string, std::string> paths;  // "AA:BB:.." -> object path
    std::vector<std::string>                     adapters;

    std::chrono::seconds pair_timeout{0};  // 0 => wait for BlueZ
    bool                 interactive = false;
    std::string          adapter_filter;  // "" => all adapters

    agent::StreamPrompt stdio_prompt;
    agent::Prompt      *prompt = &stdio_prompt;
};
}  // namespace backend
