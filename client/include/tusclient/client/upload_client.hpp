/**
 * tusclient - Creates and resumes tus uploads and keeps their sessions in a SessionStore.
 */
#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "tusclient/client/config.hpp"
#include "tusclient/client/logger.hpp"
#include "tusclient/client/session_store.hpp"
#include "tusclient/client/status.hpp"
#include "tusclient/client/transport.hpp"
#include "tusclient/client/upload.hpp"
#include "tusclient/http.hpp"

namespace tusclient::client
{

    class UploadClient
    {
    public:
        explicit UploadClient(std::shared_ptr<HttpTransport> transport, Logger logger = Logger());
        UploadClient(const ClientConfig &config, std::shared_ptr<HttpTransport> transport);

        // Needed by create_upload and resume_or_create_upload only.
        void set_creation_url(std::optional<std::string> url);
        const std::optional<std::string> &creation_url() const noexcept { return creation_url_; }

        // Throws std::invalid_argument for a null store.
        void enable_resuming(std::shared_ptr<SessionStore> store);
        void disable_resuming() noexcept;
        bool resuming_enabled() const noexcept { return store_ != nullptr; }

        void enable_cookies() noexcept { cookies_enabled_ = true; }
        void disable_cookies() noexcept { cookies_enabled_ = false; }
        bool cookies_enabled() const noexcept { return cookies_enabled_; }

        void enable_remove_fingerprint_on_success() noexcept { remove_on_success_ = true; }
        void disable_remove_fingerprint_on_success() noexcept { remove_on_success_ = false; }
        bool remove_fingerprint_on_success_enabled() const noexcept { return remove_on_success_; }

        // Custom headers may collide with Tus-* headers; they are sent as given.
        void set_headers(std::map<std::string, std::string> headers) { headers_ = std::move(headers); }
        const std::map<std::string, std::string> &headers() const noexcept { return headers_; }

        void set_connect_timeout(std::chrono::milliseconds timeout) noexcept { connect_timeout_ = timeout; }
        std::chrono::milliseconds connect_timeout() const noexcept { return connect_timeout_; }

        // POST to the creation URL. The returned Location is resolved against the URL the
        // response came from, which differs from the creation URL after a redirect.
        Resolution create_upload(const Upload &upload);

        // Looks the fingerprint up in the store and probes the stored location.
        Resolution resume_upload(const Upload &upload);

        // Probes an upload created elsewhere; no creation URL required.
        Resolution begin_or_resume_upload_from_url(const Upload &upload, const std::string &url);

        Resolution resume_or_create_upload(const Upload &upload);

        // Tus-Resumable, then custom headers, then the session's Cookie header.
        void prepare_request(const std::string &fingerprint, http::HttpRequest &request) const;

        // Merges Set-Cookie values into the stored session, if any.
        void capture_cookies(const std::string &fingerprint, const http::HttpResponse &response);

        // prepare_request, transport round trip, capture_cookies. Throws TransportError.
        http::HttpResponse send(const std::string &fingerprint, http::HttpRequest request);

        // Called by the Uploader once every byte has been accepted.
        void upload_finished(const Upload &upload);

        Logger &logger() noexcept { return logger_; }

    private:
        bool tracks_cookies() const noexcept { return store_ && cookies_enabled_; }
        void store_session(const std::string &fingerprint, const std::string &url, const http::HttpResponse &response);
        Resolution fail(const std::string &operation, Status status);

        std::shared_ptr<HttpTransport> transport_;
        Logger logger_;
        std::optional<std::string> creation_url_;
        std::shared_ptr<SessionStore> store_;
        bool cookies_enabled_{false};
        bool remove_on_success_{false};
        std::map<std::string, std::string> headers_;
        std::chrono::milliseconds connect_timeout_{5000};
    };

} // namespace tusclient::client
