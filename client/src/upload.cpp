#include "tusclient/client/upload.hpp"

#include <fstream>
#include <stdexcept>

#include "tusclient/crypto.hpp"

namespace tusclient::client
{

    void Upload::set_metadata(const protocol::Metadata &metadata)
    {
        encoded_metadata = protocol::encode_metadata(metadata);
    }

    Upload Upload::from_file(const std::filesystem::path &path, const protocol::Metadata &metadata)
    {
        if (!std::filesystem::is_regular_file(path))
        {
            throw std::runtime_error("Not a regular file: " + path.string());
        }

        auto input = std::make_shared<std::ifstream>(path, std::ios::binary);
        if (!input->is_open())
        {
            throw std::runtime_error("Could not open file for upload: " + path.string());
        }

        Upload upload;
        upload.fingerprint = crypto::file_fingerprint(path);
        upload.size = std::filesystem::file_size(path);
        upload.input = std::move(input);
        upload.set_metadata(metadata);
        return upload;
    }

} // namespace tusclient::client
