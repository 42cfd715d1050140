#include "tusclient/encoding/base64.hpp"

#include <array>
#include <cstdint>

namespace tusclient::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        consteval auto make_decode_table()
        {
            std::array<std::int8_t, 256> table{};
            table.fill(-1);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::size_t i = 0;
        for (; i + 3 <= data.size(); i += 3)
        {
            const auto group = (static_cast<std::uint32_t>(data[i]) << 16) |
                               (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                               static_cast<std::uint32_t>(data[i + 2]);
            output.push_back(kAlphabet[(group >> 18) & 0x3Fu]);
            output.push_back(kAlphabet[(group >> 12) & 0x3Fu]);
            output.push_back(kAlphabet[(group >> 6) & 0x3Fu]);
            output.push_back(kAlphabet[group & 0x3Fu]);
        }

        const auto remaining = data.size() - i;
        if (remaining > 0)
        {
            std::uint32_t group = static_cast<std::uint32_t>(data[i]) << 16;
            if (remaining == 2)
            {
                group |= static_cast<std::uint32_t>(data[i + 1]) << 8;
            }
            output.push_back(kAlphabet[(group >> 18) & 0x3Fu]);
            output.push_back(kAlphabet[(group >> 12) & 0x3Fu]);
            output.push_back(remaining == 2 ? kAlphabet[(group >> 6) & 0x3Fu] : '=');
            output.push_back('=');
        }

        return output;
    }

    std::string encode_base64(std::string_view text)
    {
        return encode_base64(std::as_bytes(std::span<const char>(text.data(), text.size())));
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        while (!input.empty() && input.back() == '=')
        {
            input.remove_suffix(1);
        }
        if (input.size() % 4 == 1)
        {
            return std::nullopt;
        }

        std::vector<std::byte> output;
        output.reserve((input.size() * 3) / 4);

        std::uint32_t accumulator = 0;
        int bits_collected = 0;
        for (const char ch : input)
        {
            const int value = kDecodeTable[static_cast<unsigned char>(ch)];
            if (value < 0)
            {
                return std::nullopt;
            }
            accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
            bits_collected += 6;
            if (bits_collected >= 8)
            {
                bits_collected -= 8;
                output.push_back(static_cast<std::byte>((accumulator >> bits_collected) & 0xFFu));
            }
        }

        return output;
    }

} // namespace tusclient::encoding
