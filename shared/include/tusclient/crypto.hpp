/**
 * tusclient - Content hashing used to derive upload fingerprints (libsodium).
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

namespace tusclient::crypto
{

    void ensure_sodium_init();

    std::string hash_text(std::string_view text);

    // Hashes from the current read position to end of stream.
    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // "<blake2b hex>-<size>"; stable across restarts and renames of the file.
    std::string file_fingerprint(const std::filesystem::path &path);

} // namespace tusclient::crypto
