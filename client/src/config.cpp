#include "tusclient/client/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

namespace tusclient::client
{

    namespace
    {

        template <typename T>
        std::optional<T> read_key(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return std::nullopt;
            }
            try
            {
                return it->get<T>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw std::runtime_error(std::string("Invalid value for '") + key + "': " + ex.what());
            }
        }

    } // namespace

    void from_json(const nlohmann::json &json, ClientConfig &config)
    {
        if (!json.is_object())
        {
            throw std::runtime_error("Client configuration must be a JSON object");
        }
        if (auto url = read_key<std::string>(json, "creation_url"))
        {
            config.creation_url = std::move(*url);
        }
        if (auto headers = read_key<std::map<std::string, std::string>>(json, "headers"))
        {
            config.headers = std::move(*headers);
        }
        if (auto timeout = read_key<std::int64_t>(json, "connect_timeout_ms"))
        {
            if (*timeout < 0)
            {
                throw std::runtime_error("Invalid value for 'connect_timeout_ms': must not be negative");
            }
            config.connect_timeout = std::chrono::milliseconds{*timeout};
        }
        config.cookies_enabled = read_key<bool>(json, "cookies").value_or(config.cookies_enabled);
        config.remove_fingerprint_on_success =
            read_key<bool>(json, "remove_fingerprint_on_success").value_or(config.remove_fingerprint_on_success);
        if (auto log = read_key<std::string>(json, "log"))
        {
            config.log_path = std::filesystem::path(*log);
        }
    }

    void to_json(nlohmann::json &json, const ClientConfig &config)
    {
        json = {
            {"headers", config.headers},
            {"connect_timeout_ms", config.connect_timeout.count()},
            {"cookies", config.cookies_enabled},
            {"remove_fingerprint_on_success", config.remove_fingerprint_on_success},
        };
        if (config.creation_url)
        {
            json["creation_url"] = *config.creation_url;
        }
        if (config.log_path)
        {
            json["log"] = config.log_path->generic_string();
        }
    }

    ClientConfig load_config(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open client configuration: " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw std::runtime_error("Malformed client configuration " + path.string() + ": " + ex.what());
        }
        return json.get<ClientConfig>();
    }

} // namespace tusclient::client
