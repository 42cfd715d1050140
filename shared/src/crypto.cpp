#include "tusclient/crypto.hpp"

#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace tusclient::crypto
{

    namespace
    {

        using Digest = std::array<unsigned char, crypto_generichash_BYTES>;

        std::string to_hex(const Digest &digest)
        {
            std::string hex(digest.size() * 2 + 1, '\0');
            sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
            hex.pop_back();
            return hex;
        }

        class StreamingHash
        {
        public:
            StreamingHash()
            {
                ensure_sodium_init();
                if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
                {
                    throw std::runtime_error("crypto_generichash_init failed");
                }
            }

            void update(const unsigned char *data, std::size_t size)
            {
                if (crypto_generichash_update(&state_, data, size) != 0)
                {
                    throw std::runtime_error("crypto_generichash_update failed");
                }
            }

            std::string final_hex()
            {
                Digest digest{};
                if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
                {
                    throw std::runtime_error("crypto_generichash_final failed");
                }
                return to_hex(digest);
            }

        private:
            crypto_generichash_state state_{};
        };

    } // namespace

    void ensure_sodium_init()
    {
        static std::once_flag flag;
        std::call_once(flag, []()
                       {
                           if (sodium_init() < 0)
                           {
                               throw std::runtime_error("libsodium initialization failed");
                           } });
    }

    std::string hash_text(std::string_view text)
    {
        StreamingHash hash;
        hash.update(reinterpret_cast<const unsigned char *>(text.data()), text.size());
        return hash.final_hex();
    }

    std::string hash_stream(std::istream &input)
    {
        StreamingHash hash;
        std::vector<unsigned char> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                hash.update(buffer.data(), read_count);
            }
        }
        return hash.final_hex();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    std::string file_fingerprint(const std::filesystem::path &path)
    {
        const auto size = std::filesystem::file_size(path);
        return hash_file(path) + "-" + std::to_string(size);
    }

} // namespace tusclient::crypto
