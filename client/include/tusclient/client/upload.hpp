#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>

#include "tusclient/protocol.hpp"

namespace tusclient::client
{

    // Caller-owned description of one logical upload. The client never derives the
    // fingerprint; it must stay stable across restarts for resuming to work.
    struct Upload
    {
        std::string fingerprint;
        std::uint64_t size{};
        std::string encoded_metadata;
        std::shared_ptr<std::istream> input;

        void set_metadata(const protocol::Metadata &metadata);

        // Opens the file and fingerprints it by content hash and size.
        static Upload from_file(const std::filesystem::path &path, const protocol::Metadata &metadata = {});
    };

} // namespace tusclient::client
