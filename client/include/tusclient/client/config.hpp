#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tusclient::client
{

    struct ClientConfig
    {
        std::optional<std::string> creation_url;
        // Sent on every request after Tus-Resumable; may override protocol headers.
        std::map<std::string, std::string> headers;
        std::chrono::milliseconds connect_timeout{5000};
        bool cookies_enabled{};
        bool remove_fingerprint_on_success{};
        std::optional<std::filesystem::path> log_path;
    };

    void from_json(const nlohmann::json &json, ClientConfig &config);
    void to_json(nlohmann::json &json, const ClientConfig &config);

    ClientConfig load_config(const std::filesystem::path &path);

} // namespace tusclient::client
