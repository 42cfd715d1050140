#include "tusclient/protocol.hpp"

#include <charconv>
#include <stdexcept>

#include "tusclient/encoding/base64.hpp"

namespace tusclient::protocol
{

    namespace
    {

        std::string_view trim(std::string_view input) noexcept
        {
            const auto begin = input.find_first_not_of(" \t");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = input.find_last_not_of(" \t");
            return input.substr(begin, end - begin + 1);
        }

    } // namespace

    std::optional<std::uint64_t> parse_offset(std::string_view value) noexcept
    {
        const auto text = trim(value);
        if (text.empty())
        {
            return std::nullopt;
        }
        std::uint64_t offset = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), offset);
        if (ec != std::errc{} || ptr != text.data() + text.size())
        {
            return std::nullopt;
        }
        return offset;
    }

    std::string encode_metadata(const Metadata &metadata)
    {
        std::string header;
        for (const auto &[key, value] : metadata)
        {
            if (key.empty() || key.find_first_of(" ,") != std::string::npos)
            {
                throw std::invalid_argument("Invalid upload metadata key: '" + key + "'");
            }
            if (!header.empty())
            {
                header += ',';
            }
            header += key;
            if (!value.empty())
            {
                header += ' ';
                header += encoding::encode_base64(value);
            }
        }
        return header;
    }

    std::optional<Metadata> decode_metadata(std::string_view header)
    {
        Metadata metadata;
        while (!header.empty())
        {
            const auto comma = header.find(',');
            const auto pair = trim(header.substr(0, comma));
            header = comma == std::string_view::npos ? std::string_view{} : header.substr(comma + 1);
            if (pair.empty())
            {
                continue;
            }

            const auto space = pair.find(' ');
            const auto key = pair.substr(0, space);
            std::string value;
            if (space != std::string_view::npos)
            {
                const auto bytes = encoding::decode_base64(trim(pair.substr(space + 1)));
                if (!bytes)
                {
                    return std::nullopt;
                }
                value.assign(reinterpret_cast<const char *>(bytes->data()), bytes->size());
            }
            metadata[std::string(key)] = std::move(value);
        }
        return metadata;
    }

} // namespace tusclient::protocol
