#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "tusclient/client/status.hpp"
#include "tusclient/client/upload.hpp"

namespace tusclient::client
{

    class UploadClient;

    struct ChunkResult
    {
        Status status;
        std::size_t bytes_sent{};
    };

    // Sends the bytes of one upload as PATCH requests starting at the resolved offset.
    // Every request goes through UploadClient::send, so session cookies are replayed and
    // refreshed on each chunk. Failures are returned, never retried.
    class Uploader
    {
    public:
        static constexpr std::size_t kDefaultChunkSize = 2 * 1024 * 1024;

        Uploader(UploadClient &client, Upload upload, UploadHandle handle);

        void set_chunk_size(std::size_t bytes);
        std::size_t chunk_size() const noexcept { return chunk_size_; }

        std::uint64_t offset() const noexcept { return offset_; }
        const std::string &url() const noexcept { return url_; }
        bool done() const noexcept { return offset_ >= upload_.size; }

        // bytes_sent is 0 once the upload is complete.
        ChunkResult upload_chunk();

        Status upload_remaining();

        // Releases the byte source and reports completion to the client when every byte
        // has been accepted.
        void finish();

    private:
        UploadClient &client_;
        Upload upload_;
        std::string url_;
        std::uint64_t offset_{};
        std::size_t chunk_size_{kDefaultChunkSize};
    };

} // namespace tusclient::client
