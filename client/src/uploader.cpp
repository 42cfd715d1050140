#include "tusclient/client/uploader.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "tusclient/client/upload_client.hpp"
#include "tusclient/protocol.hpp"

namespace tusclient::client
{

    Uploader::Uploader(UploadClient &client, Upload upload, UploadHandle handle)
        : client_(client),
          upload_(std::move(upload)),
          url_(std::move(handle.url)),
          offset_(handle.offset) {}

    void Uploader::set_chunk_size(std::size_t bytes)
    {
        if (bytes == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
        chunk_size_ = bytes;
    }

    ChunkResult Uploader::upload_chunk()
    {
        if (done())
        {
            return ChunkResult{};
        }
        if (!upload_.input)
        {
            return ChunkResult{Status::failure(ErrorCode::SourceUnreadable, "upload has no byte source"), 0};
        }

        const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size_, upload_.size - offset_));
        std::string body(wanted, '\0');
        auto &input = *upload_.input;
        input.clear();
        input.seekg(static_cast<std::streamoff>(offset_));
        input.read(body.data(), static_cast<std::streamsize>(wanted));
        const auto read_count = static_cast<std::size_t>(input.gcount());
        if (read_count == 0)
        {
            return ChunkResult{Status::failure(ErrorCode::SourceUnreadable,
                                               "byte source ended at " + std::to_string(offset_) + " of " +
                                                   std::to_string(upload_.size)),
                               0};
        }
        body.resize(read_count);

        http::HttpRequest request;
        request.method = "PATCH";
        request.url = url_;
        request.headers.emplace_back(protocol::kUploadOffset, std::to_string(offset_));
        request.headers.emplace_back(protocol::kContentType, protocol::kOffsetOctetStream);
        request.body = std::move(body);

        http::HttpResponse response;
        try
        {
            response = client_.send(upload_.fingerprint, std::move(request));
        }
        catch (const TransportError &ex)
        {
            return ChunkResult{Status::failure(ErrorCode::TransportFailure, ex.what()), 0};
        }

        if (!http::is_success(response.status))
        {
            auto message = "unexpected status code (" + std::to_string(response.status) + ") while uploading chunk";
            return ChunkResult{Status::failure(ErrorCode::ProtocolViolation, std::move(message), std::move(response)),
                               0};
        }

        const auto header = http::header_value(response.headers, protocol::kUploadOffset);
        std::optional<std::uint64_t> server_offset;
        if (header)
        {
            server_offset = protocol::parse_offset(*header);
        }
        const auto expected = offset_ + read_count;
        if (!server_offset || *server_offset != expected)
        {
            return ChunkResult{Status::failure(ErrorCode::ProtocolViolation,
                                               "response to PATCH carries offset '" + header.value_or("") +
                                                   "', expected " + std::to_string(expected),
                                               std::move(response)),
                               0};
        }

        offset_ = expected;
        return ChunkResult{Status{}, read_count};
    }

    Status Uploader::upload_remaining()
    {
        while (!done())
        {
            auto result = upload_chunk();
            if (!result.status.ok())
            {
                client_.logger().warn("upload", upload_.fingerprint, " stopped at ", offset_, ": ",
                                      result.status.message);
                return std::move(result.status);
            }
        }
        return Status{};
    }

    void Uploader::finish()
    {
        upload_.input.reset();
        if (done())
        {
            client_.upload_finished(upload_);
            client_.logger().log("upload", upload_.fingerprint, " complete at ", url_);
        }
    }

} // namespace tusclient::client
