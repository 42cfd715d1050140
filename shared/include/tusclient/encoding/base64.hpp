#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tusclient::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    std::string encode_base64(std::string_view text);

    // Padding is optional on input; any character outside the alphabet fails the decode.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace tusclient::encoding
