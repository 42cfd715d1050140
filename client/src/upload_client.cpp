#include "tusclient/client/upload_client.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

#include "tusclient/cookie.hpp"
#include "tusclient/protocol.hpp"
#include "tusclient/url.hpp"

namespace tusclient::client
{

    namespace
    {

        Resolution resolved(std::string url, std::uint64_t offset)
        {
            return Resolution{Status{}, UploadHandle{std::move(url), offset}};
        }

        std::string unexpected_status(int status, const std::string &action)
        {
            return "unexpected status code (" + std::to_string(status) + ") while " + action;
        }

    } // namespace

    UploadClient::UploadClient(std::shared_ptr<HttpTransport> transport, Logger logger)
        : transport_(std::move(transport)),
          logger_(std::move(logger))
    {
        if (!transport_)
        {
            throw std::invalid_argument("UploadClient requires a transport");
        }
    }

    UploadClient::UploadClient(const ClientConfig &config, std::shared_ptr<HttpTransport> transport)
        : UploadClient(std::move(transport), Logger(config.log_path))
    {
        creation_url_ = config.creation_url;
        headers_ = config.headers;
        connect_timeout_ = config.connect_timeout;
        cookies_enabled_ = config.cookies_enabled;
        remove_on_success_ = config.remove_fingerprint_on_success;
    }

    void UploadClient::set_creation_url(std::optional<std::string> url)
    {
        creation_url_ = std::move(url);
    }

    void UploadClient::enable_resuming(std::shared_ptr<SessionStore> store)
    {
        if (!store)
        {
            throw std::invalid_argument("enable_resuming requires a session store");
        }
        store_ = std::move(store);
    }

    void UploadClient::disable_resuming() noexcept
    {
        store_.reset();
    }

    Resolution UploadClient::create_upload(const Upload &upload)
    {
        if (!creation_url_ || creation_url_->empty())
        {
            return fail("create", Status::failure(ErrorCode::MissingCreationUrl, "no upload creation URL set"));
        }

        http::HttpRequest request;
        request.method = "POST";
        request.url = *creation_url_;
        if (!upload.encoded_metadata.empty())
        {
            request.headers.emplace_back(protocol::kUploadMetadata, upload.encoded_metadata);
        }
        request.headers.emplace_back(protocol::kUploadLength, std::to_string(upload.size));

        http::HttpResponse response;
        try
        {
            response = send(upload.fingerprint, std::move(request));
        }
        catch (const TransportError &ex)
        {
            return fail("create", Status::failure(ErrorCode::TransportFailure, ex.what()));
        }

        if (!http::is_success(response.status))
        {
            auto message = unexpected_status(response.status, "creating upload");
            return fail("create", Status::failure(ErrorCode::ProtocolViolation, std::move(message), std::move(response)));
        }

        const auto location = http::header_value(response.headers, protocol::kLocation);
        if (!location || location->empty())
        {
            return fail("create", Status::failure(ErrorCode::ProtocolViolation,
                                                  "missing upload URL in response for creating upload",
                                                  std::move(response)));
        }

        // Relative to where the response came from, not the creation URL: the POST may have
        // been redirected.
        auto upload_url = http::resolve_url(response.final_url, *location);
        if (!upload_url)
        {
            return fail("create", Status::failure(ErrorCode::ProtocolViolation,
                                                  "cannot resolve upload URL '" + *location + "'",
                                                  std::move(response)));
        }

        store_session(upload.fingerprint, *upload_url, response);
        logger_.log("create", upload.fingerprint, " -> ", *upload_url);
        return resolved(std::move(*upload_url), 0);
    }

    Resolution UploadClient::resume_upload(const Upload &upload)
    {
        if (!store_)
        {
            return fail("resume", Status::failure(ErrorCode::ResumingDisabled, "resuming not enabled for this client"));
        }

        const auto entry = store_->get(upload.fingerprint);
        if (!entry || entry->location().empty())
        {
            return fail("resume", Status::failure(ErrorCode::FingerprintNotFound,
                                                  "fingerprint not in storage: " + upload.fingerprint));
        }

        return begin_or_resume_upload_from_url(upload, entry->location());
    }

    Resolution UploadClient::begin_or_resume_upload_from_url(const Upload &upload, const std::string &url)
    {
        http::HttpRequest request;
        request.method = "HEAD";
        request.url = url;

        http::HttpResponse response;
        try
        {
            response = send(upload.fingerprint, std::move(request));
        }
        catch (const TransportError &ex)
        {
            return fail("resume", Status::failure(ErrorCode::TransportFailure, ex.what()));
        }

        if (!http::is_success(response.status))
        {
            auto message = unexpected_status(response.status, "resuming upload");
            return fail("resume", Status::failure(ErrorCode::ProtocolViolation, std::move(message), std::move(response)));
        }

        const auto offset_header = http::header_value(response.headers, protocol::kUploadOffset);
        if (!offset_header || offset_header->empty())
        {
            return fail("resume", Status::failure(ErrorCode::ProtocolViolation,
                                                  "missing upload offset in response for resuming upload",
                                                  std::move(response)));
        }
        const auto offset = protocol::parse_offset(*offset_header);
        if (!offset)
        {
            return fail("resume", Status::failure(ErrorCode::ProtocolViolation,
                                                  "invalid upload offset '" + *offset_header + "'",
                                                  std::move(response)));
        }

        store_session(upload.fingerprint, url, response);
        logger_.log("resume", upload.fingerprint, " at ", url, " offset ", *offset);
        return resolved(url, *offset);
    }

    Resolution UploadClient::resume_or_create_upload(const Upload &upload)
    {
        auto attempt = resume_upload(upload);
        if (attempt.ok() || !should_create_after_resume(attempt.status))
        {
            return attempt;
        }
        logger_.log("resume", "creating new upload for ", upload.fingerprint, " after ",
                    to_string(attempt.status.code));
        return create_upload(upload);
    }

    void UploadClient::prepare_request(const std::string &fingerprint, http::HttpRequest &request) const
    {
        http::HeaderList prepared;
        prepared.emplace_back(protocol::kTusResumable, protocol::kTusVersion);
        for (const auto &[name, value] : headers_)
        {
            prepared.emplace_back(name, value);
        }
        if (tracks_cookies())
        {
            if (const auto entry = store_->get(fingerprint))
            {
                if (auto cookie = serialize_cookie_header(entry->cookies()))
                {
                    prepared.emplace_back(protocol::kCookie, std::move(*cookie));
                }
            }
        }
        prepared.insert(prepared.end(), std::make_move_iterator(request.headers.begin()),
                        std::make_move_iterator(request.headers.end()));
        request.headers = std::move(prepared);
    }

    void UploadClient::capture_cookies(const std::string &fingerprint, const http::HttpResponse &response)
    {
        if (!tracks_cookies())
        {
            return;
        }
        const auto values = http::header_values(response.headers, protocol::kSetCookie);
        if (values.empty())
        {
            return;
        }
        const auto cookies = parse_set_cookie(values);
        if (!cookies.empty())
        {
            store_->update_cookies(fingerprint, cookies);
        }
    }

    http::HttpResponse UploadClient::send(const std::string &fingerprint, http::HttpRequest request)
    {
        prepare_request(fingerprint, request);

        TransportOptions options;
        options.connect_timeout = connect_timeout_;
        options.follow_redirects = strict_post_redirect();

        auto response = transport_->send(request, options);
        if (response.final_url.empty())
        {
            response.final_url = request.url;
        }
        capture_cookies(fingerprint, response);
        return response;
    }

    void UploadClient::upload_finished(const Upload &upload)
    {
        if (store_ && remove_on_success_)
        {
            store_->remove(upload.fingerprint);
            logger_.log("finish", "forgot session for ", upload.fingerprint);
        }
    }

    void UploadClient::store_session(const std::string &fingerprint, const std::string &url,
                                     const http::HttpResponse &response)
    {
        if (!store_)
        {
            return;
        }
        CookieSet cookies;
        if (cookies_enabled_)
        {
            cookies = parse_set_cookie(http::header_values(response.headers, protocol::kSetCookie));
        }
        if (const auto existing = store_->get(fingerprint))
        {
            cookies = merge_cookies(existing->cookies(), cookies);
        }
        store_->set(fingerprint, SessionEntry(url, std::move(cookies)));
    }

    Resolution UploadClient::fail(const std::string &operation, Status status)
    {
        logger_.warn(operation, to_string(status.code), ": ", status.message);
        return Resolution{std::move(status), std::nullopt};
    }

} // namespace tusclient::client
