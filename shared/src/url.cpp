#include "tusclient/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace tusclient::http
{

    namespace
    {

        struct Components
        {
            std::optional<std::string> scheme;
            std::optional<std::string> authority;
            std::string path;
            std::optional<std::string> query;
            std::optional<std::string> fragment;
        };

        bool is_scheme_char(char ch, bool first)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalpha(c))
            {
                return true;
            }
            return !first && (std::isdigit(c) || ch == '+' || ch == '-' || ch == '.');
        }

        Components split_components(std::string_view text)
        {
            Components parts;

            if (const auto hash = text.find('#'); hash != std::string_view::npos)
            {
                parts.fragment = std::string(text.substr(hash + 1));
                text = text.substr(0, hash);
            }
            if (const auto question = text.find('?'); question != std::string_view::npos)
            {
                parts.query = std::string(text.substr(question + 1));
                text = text.substr(0, question);
            }

            const auto colon = text.find(':');
            const auto slash = text.find('/');
            if (colon != std::string_view::npos && colon > 0 && (slash == std::string_view::npos || colon < slash))
            {
                const auto candidate = text.substr(0, colon);
                bool valid = true;
                for (std::size_t i = 0; i < candidate.size(); ++i)
                {
                    valid = valid && is_scheme_char(candidate[i], i == 0);
                }
                if (valid)
                {
                    std::string scheme(candidate);
                    std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c)
                                   { return static_cast<char>(std::tolower(c)); });
                    parts.scheme = std::move(scheme);
                    text = text.substr(colon + 1);
                }
            }

            if (text.starts_with("//"))
            {
                text.remove_prefix(2);
                const auto end = text.find('/');
                parts.authority = std::string(text.substr(0, end));
                text = end == std::string_view::npos ? std::string_view{} : text.substr(end);
            }
            parts.path = std::string(text);
            return parts;
        }

        std::string recompose(const Components &parts)
        {
            std::string out;
            if (parts.scheme)
            {
                out += *parts.scheme;
                out += ':';
            }
            if (parts.authority)
            {
                out += "//";
                out += *parts.authority;
            }
            out += parts.path;
            if (parts.query)
            {
                out += '?';
                out += *parts.query;
            }
            if (parts.fragment)
            {
                out += '#';
                out += *parts.fragment;
            }
            return out;
        }

        std::string merge_paths(const Components &base, const std::string &reference_path)
        {
            if (base.authority && base.path.empty())
            {
                return "/" + reference_path;
            }
            const auto last_slash = base.path.rfind('/');
            if (last_slash == std::string::npos)
            {
                return reference_path;
            }
            return base.path.substr(0, last_slash + 1) + reference_path;
        }

        void drop_last_segment(std::string &output)
        {
            const auto last_slash = output.rfind('/');
            output.erase(last_slash == std::string::npos ? 0 : last_slash);
        }

    } // namespace

    std::string Url::host_header() const
    {
        const bool default_port = (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
        const bool ipv6 = host.find(':') != std::string::npos;
        std::string header = ipv6 ? "[" + host + "]" : host;
        if (!default_port)
        {
            header += ':' + std::to_string(port);
        }
        return header;
    }

    std::optional<Url> parse_url(std::string_view text)
    {
        const auto parts = split_components(text);
        if (!parts.scheme || !parts.authority || (*parts.scheme != "http" && *parts.scheme != "https"))
        {
            return std::nullopt;
        }

        Url url;
        url.scheme = *parts.scheme;
        url.port = url.scheme == "https" ? 443 : 80;

        std::string_view authority = *parts.authority;
        if (const auto at = authority.rfind('@'); at != std::string_view::npos)
        {
            authority.remove_prefix(at + 1);
        }

        std::string_view port_text;
        if (authority.starts_with('['))
        {
            const auto close = authority.find(']');
            if (close == std::string_view::npos)
            {
                return std::nullopt;
            }
            url.host = std::string(authority.substr(1, close - 1));
            const auto rest = authority.substr(close + 1);
            if (rest.starts_with(':'))
            {
                port_text = rest.substr(1);
            }
            else if (!rest.empty())
            {
                return std::nullopt;
            }
        }
        else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos)
        {
            url.host = std::string(authority.substr(0, colon));
            port_text = authority.substr(colon + 1);
        }
        else
        {
            url.host = std::string(authority);
        }

        if (url.host.empty())
        {
            return std::nullopt;
        }
        if (!port_text.empty())
        {
            std::uint16_t port = 0;
            const auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
            if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || port == 0)
            {
                return std::nullopt;
            }
            url.port = port;
        }

        url.target = parts.path.empty() ? "/" : parts.path;
        if (parts.query)
        {
            url.target += '?' + *parts.query;
        }
        return url;
    }

    std::optional<std::string> resolve_url(std::string_view base, std::string_view reference)
    {
        auto ref = split_components(reference);
        if (ref.scheme)
        {
            ref.path = remove_dot_segments(ref.path);
            return recompose(ref);
        }

        const auto base_parts = split_components(base);
        if (!base_parts.scheme)
        {
            return std::nullopt;
        }

        Components target;
        target.scheme = base_parts.scheme;
        target.fragment = ref.fragment;
        if (ref.authority)
        {
            target.authority = ref.authority;
            target.path = remove_dot_segments(ref.path);
            target.query = ref.query;
            return recompose(target);
        }

        target.authority = base_parts.authority;
        if (ref.path.empty())
        {
            target.path = base_parts.path;
            target.query = ref.query ? ref.query : base_parts.query;
        }
        else
        {
            target.path = ref.path.starts_with('/') ? remove_dot_segments(ref.path)
                                                    : remove_dot_segments(merge_paths(base_parts, ref.path));
            target.query = ref.query;
        }
        return recompose(target);
    }

    std::string remove_dot_segments(std::string_view path)
    {
        std::string input(path);
        std::string output;
        while (!input.empty())
        {
            if (input.starts_with("../"))
            {
                input.erase(0, 3);
            }
            else if (input.starts_with("./"))
            {
                input.erase(0, 2);
            }
            else if (input.starts_with("/./"))
            {
                input.erase(0, 2);
            }
            else if (input == "/.")
            {
                input = "/";
            }
            else if (input.starts_with("/../"))
            {
                input.erase(0, 3);
                drop_last_segment(output);
            }
            else if (input == "/..")
            {
                input = "/";
                drop_last_segment(output);
            }
            else if (input == "." || input == "..")
            {
                input.clear();
            }
            else
            {
                const auto next = input.find('/', input.starts_with('/') ? 1 : 0);
                output += input.substr(0, next);
                input.erase(0, next);
            }
        }
        return output;
    }

} // namespace tusclient::http
