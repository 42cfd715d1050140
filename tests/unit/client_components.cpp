#include <cassert>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tusclient/client/config.hpp"
#include "tusclient/client/memory_session_store.hpp"
#include "tusclient/client/upload_client.hpp"
#include "tusclient/client/uploader.hpp"
#include "tusclient/protocol.hpp"

using namespace tusclient;
using namespace tusclient::client;

namespace
{

    class FakeTransport : public HttpTransport
    {
    public:
        void reply(int status, http::HeaderList headers = {}, std::string final_url = {})
        {
            http::HttpResponse response;
            response.status = status;
            response.headers = std::move(headers);
            response.final_url = std::move(final_url);
            replies_.push_back(Reply{std::move(response), false});
        }

        void fail_next()
        {
            replies_.push_back(Reply{http::HttpResponse{}, true});
        }

        http::HttpResponse send(const http::HttpRequest &request, const TransportOptions &options) override
        {
            requests.push_back(request);
            last_options = options;
            if (replies_.empty())
            {
                throw TransportError("no reply queued for " + request.method + " " + request.url);
            }
            auto next = std::move(replies_.front());
            replies_.pop_front();
            if (next.fail)
            {
                throw TransportError("connection refused");
            }
            return next.response;
        }

        std::vector<http::HttpRequest> requests;
        TransportOptions last_options;

    private:
        struct Reply
        {
            http::HttpResponse response;
            bool fail{};
        };

        std::deque<Reply> replies_;
    };

    struct Fixture
    {
        std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
        std::shared_ptr<MemorySessionStore> store = std::make_shared<MemorySessionStore>();
        UploadClient client{transport};

        Fixture()
        {
            client.set_creation_url("https://host/files/");
            client.enable_resuming(store);
        }
    };

    Upload make_upload(const std::string &fingerprint, const std::string &content = "hello world")
    {
        Upload upload;
        upload.fingerprint = fingerprint;
        upload.size = content.size();
        upload.input = std::make_shared<std::istringstream>(content);
        return upload;
    }

    std::optional<std::string> request_header(const http::HttpRequest &request, std::string_view name)
    {
        return http::header_value(request.headers, name);
    }

    void test_memory_store_contract()
    {
        MemorySessionStore store;
        const SessionEntry entry("https://tusd.tusdemo.net/files/hello");
        store.set("foo", entry);
        assert(store.get("foo") == entry);

        const SessionEntry replacement("https://tusd.tusdemo.net/files/other");
        store.set("foo", replacement);
        assert(store.get("foo")->location() == replacement.location());

        store.remove("foo");
        assert(!store.get("foo"));
        store.remove("foo");
        assert(!store.get("never-stored"));
        assert(store.size() == 0);
    }

    void test_memory_store_update_cookies()
    {
        MemorySessionStore store;
        store.update_cookies("absent", parse_set_cookie({"a=1"}));
        assert(!store.get("absent"));
        assert(store.size() == 0);

        const auto prior = parse_set_cookie({"a=1", "b=2"});
        store.set("foo", SessionEntry("https://host/files/1", prior));
        const auto added = parse_set_cookie({"c=3"});
        store.update_cookies("foo", added);

        const auto entry = store.get("foo");
        assert(entry);
        assert(entry->location() == "https://host/files/1");
        for (const auto &cookie : prior)
        {
            assert(entry->cookies().count(cookie) == 1);
        }
        for (const auto &cookie : added)
        {
            assert(entry->cookies().count(cookie) == 1);
        }
        assert(entry->cookies().size() == 3);
    }

    void test_session_entry_is_immutable_on_merge()
    {
        const SessionEntry original("https://host/files/1", parse_set_cookie({"a=1"}));
        const auto merged = original.merged_with(parse_set_cookie({"a=2", "b=3"}));
        assert(original.cookies().size() == 1);
        assert(original.cookies().begin()->value == "1");
        assert(merged.cookies().size() == 2);
        assert(merged.cookies().begin()->value == "2");
        assert(merged.location() == original.location());
    }

    void test_session_entry_json()
    {
        const auto cookies = parse_set_cookie({"sid=abc; Path=/; Max-Age=600; HttpOnly", "lb=n1"});
        const SessionEntry entry("https://host/files/42", cookies);
        const nlohmann::json json = entry;
        assert(json.at("location") == "https://host/files/42");
        assert(json.at("cookies").size() == 2);

        auto decoded = json.get<SessionEntry>();
        assert(decoded.location() == entry.location());
        assert(decoded.cookies().size() == 2);
        const auto sid = decoded.cookies().find(*entry.cookies().rbegin());
        assert(sid != decoded.cookies().end() && sid->http_only && sid->expires);

        const SessionEntry lasting("https://host/files/43",
                                   parse_set_cookie({"lb=node1; Expires=Fri, 31 Dec 9999 23:59:59 GMT"}));
        const auto reloaded = nlohmann::json(lasting).get<SessionEntry>();
        assert(serialize_cookie_header(reloaded.cookies()) == "lb=node1");

        const auto stored = nlohmann::json::parse(R"({
            "location": "https://host/files/44",
            "cookies": [{"name": "sid", "value": "s1", "expires": 253402300799}]
        })");
        assert(serialize_cookie_header(stored.get<SessionEntry>().cookies()) == "sid=s1");
    }

    void test_config_loading()
    {
        const auto json = nlohmann::json::parse(R"({
            "creation_url": "https://host/files/",
            "headers": {"Authorization": "Bearer t"},
            "connect_timeout_ms": 1500,
            "cookies": true,
            "remove_fingerprint_on_success": true,
            "unknown": 1
        })");
        const auto config = json.get<ClientConfig>();
        assert(config.creation_url == "https://host/files/");
        assert(config.headers.at("Authorization") == "Bearer t");
        assert(config.connect_timeout == std::chrono::milliseconds{1500});
        assert(config.cookies_enabled);
        assert(config.remove_fingerprint_on_success);
        assert(!config.log_path);

        auto logged = config;
        logged.log_path = std::filesystem::path("logs/tus.log");
        const nlohmann::json written = logged;
        assert(!written.contains("unknown"));
        assert(written.at("connect_timeout_ms") == 1500);
        assert(written.at("log") == "logs/tus.log");
        const auto reread = written.get<ClientConfig>();
        assert(reread.creation_url == config.creation_url);
        assert(reread.headers == config.headers);
        assert(reread.connect_timeout == config.connect_timeout);
        assert(reread.cookies_enabled && reread.remove_fingerprint_on_success);
        assert(reread.log_path == logged.log_path);

        const auto defaults = nlohmann::json::object().get<ClientConfig>();
        assert(!defaults.creation_url);
        assert(defaults.connect_timeout == std::chrono::milliseconds{5000});

        bool threw = false;
        try
        {
            nlohmann::json{{"cookies", "yes"}}.get<ClientConfig>();
        }
        catch (const std::runtime_error &ex)
        {
            threw = std::string(ex.what()).find("cookies") != std::string::npos;
        }
        assert(threw);

        const auto path = std::filesystem::temp_directory_path() / "tusclient_config_test.json";
        {
            std::ofstream out(path);
            out << json.dump();
        }
        const auto loaded = load_config(path);
        assert(loaded.creation_url == config.creation_url);
        std::filesystem::remove(path);

        auto transport = std::make_shared<FakeTransport>();
        UploadClient client(loaded, transport);
        assert(client.creation_url() == "https://host/files/");
        assert(client.cookies_enabled());
        assert(client.remove_fingerprint_on_success_enabled());
        assert(client.connect_timeout() == std::chrono::milliseconds{1500});
        assert(!client.resuming_enabled());
    }

    void test_create_then_resume_same_url()
    {
        Fixture f;
        f.transport->reply(201, {{"Location", "https://host/files/hello"}});
        auto upload = make_upload("foo");
        upload.set_metadata({{"filename", "hello.txt"}});

        const auto created = f.client.create_upload(upload);
        assert(created.ok());
        assert(created.handle->url == "https://host/files/hello");
        assert(created.handle->offset == 0);
        assert(f.store->get("foo")->location() == "https://host/files/hello");

        const auto &post = f.transport->requests.at(0);
        assert(post.method == "POST");
        assert(post.url == "https://host/files/");
        assert(post.headers.front().first == "Tus-Resumable");
        assert(post.headers.front().second == "1.0.0");
        assert(request_header(post, "Upload-Length") == "11");
        assert(request_header(post, "Upload-Metadata") == "filename aGVsbG8udHh0");

        f.transport->reply(200, {{"Upload-Offset", "5"}});
        const auto resumed = f.client.resume_upload(upload);
        assert(resumed.ok());
        assert(resumed.handle->offset == 5);
        const auto &head = f.transport->requests.at(1);
        assert(head.method == "HEAD");
        assert(head.url == "https://host/files/hello");
        assert(request_header(head, "Tus-Resumable") == "1.0.0");
    }

    void test_create_without_metadata_omits_header()
    {
        Fixture f;
        f.transport->reply(201, {{"location", "/files/1"}});
        const auto result = f.client.create_upload(make_upload("plain"));
        assert(result.ok());
        assert(!request_header(f.transport->requests.at(0), "Upload-Metadata"));
    }

    void test_create_resolves_location_against_final_url()
    {
        Fixture f;
        f.client.set_creation_url("http://a.example/files");
        f.transport->reply(201, {{"Location", "/files/abc"}}, "http://b.example/v2/upload/");
        auto result = f.client.create_upload(make_upload("redirected"));
        assert(result.ok());
        assert(result.handle->url == "http://b.example/files/abc");

        f.transport->reply(201, {{"Location", "abc"}}, "http://b.example/v2/upload/");
        result = f.client.create_upload(make_upload("relative"));
        assert(result.handle->url == "http://b.example/v2/upload/abc");

        // Without a redirect the creation URL is the base.
        f.transport->reply(201, {{"Location", "abc"}});
        result = f.client.create_upload(make_upload("direct"));
        assert(result.handle->url == "http://a.example/abc");
    }

    void test_create_failures()
    {
        Fixture f;
        f.client.set_creation_url(std::nullopt);
        auto result = f.client.create_upload(make_upload("x"));
        assert(result.status.code == ErrorCode::MissingCreationUrl);
        assert(f.transport->requests.empty());

        f.client.set_creation_url("https://host/files/");
        f.transport->reply(500);
        result = f.client.create_upload(make_upload("x"));
        assert(!result.ok());
        assert(result.status.code == ErrorCode::ProtocolViolation);
        assert(result.status.http_status() == 500);
        assert(!f.store->get("x"));

        f.transport->reply(201);
        result = f.client.create_upload(make_upload("x"));
        assert(result.status.code == ErrorCode::ProtocolViolation);
        assert(result.status.http_status() == 201);

        f.transport->reply(201, {{"Location", ""}});
        result = f.client.create_upload(make_upload("x"));
        assert(result.status.code == ErrorCode::ProtocolViolation);

        f.transport->fail_next();
        result = f.client.create_upload(make_upload("x"));
        assert(result.status.code == ErrorCode::TransportFailure);
        assert(!result.status.response);
    }

    void test_resume_preconditions()
    {
        auto transport = std::make_shared<FakeTransport>();
        UploadClient client(transport);
        auto result = client.resume_upload(make_upload("foo"));
        assert(result.status.code == ErrorCode::ResumingDisabled);

        client.enable_resuming(std::make_shared<MemorySessionStore>());
        result = client.resume_upload(make_upload("foo"));
        assert(result.status.code == ErrorCode::FingerprintNotFound);
        assert(transport->requests.empty());

        Fixture f;
        f.store->set("blank", SessionEntry(""));
        result = f.client.resume_upload(make_upload("blank"));
        assert(result.status.code == ErrorCode::FingerprintNotFound);
        assert(f.transport->requests.empty());

        bool threw = false;
        try
        {
            f.client.enable_resuming(nullptr);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_begin_from_url_validates_offset()
    {
        Fixture f;
        const std::string url = "https://vimeo.example/upload/77";

        f.transport->reply(200);
        assert(f.client.begin_or_resume_upload_from_url(make_upload("v"), url).status.code ==
               ErrorCode::ProtocolViolation);

        f.transport->reply(200, {{"Upload-Offset", "abc"}});
        assert(f.client.begin_or_resume_upload_from_url(make_upload("v"), url).status.code ==
               ErrorCode::ProtocolViolation);

        f.transport->reply(200, {{"Upload-Offset", "-1"}});
        assert(f.client.begin_or_resume_upload_from_url(make_upload("v"), url).status.code ==
               ErrorCode::ProtocolViolation);

        f.transport->reply(423, {{"Upload-Offset", "3"}});
        const auto locked = f.client.begin_or_resume_upload_from_url(make_upload("v"), url);
        assert(locked.status.code == ErrorCode::ProtocolViolation);
        assert(locked.status.http_status() == 423);
        assert(!f.store->get("v"));

        f.transport->reply(204, {{"Upload-Offset", "1024"}});
        const auto ok = f.client.begin_or_resume_upload_from_url(make_upload("v"), url);
        assert(ok.ok());
        assert(ok.handle->offset == 1024);
        assert(ok.handle->url == url);
        assert(f.store->get("v")->location() == url);

        auto transport = std::make_shared<FakeTransport>();
        UploadClient stateless(transport);
        transport->reply(200, {{"Upload-Offset", "0"}});
        assert(stateless.begin_or_resume_upload_from_url(make_upload("v"), url).ok());
    }

    void test_resume_or_create_fallbacks()
    {
        {
            Fixture f;
            f.transport->reply(201, {{"Location", "https://host/files/new"}});
            const auto result = f.client.resume_or_create_upload(make_upload("unknown"));
            assert(result.ok());
            assert(result.handle->url == "https://host/files/new");
            assert(f.transport->requests.size() == 1);
            assert(f.transport->requests[0].method == "POST");
        }
        {
            Fixture f;
            f.store->set("stale", SessionEntry("https://host/files/expired"));
            f.transport->reply(404);
            f.transport->reply(201, {{"Location", "https://host/files/fresh"}});
            const auto result = f.client.resume_or_create_upload(make_upload("stale"));
            assert(result.ok());
            assert(result.handle->url == "https://host/files/fresh");
            assert(result.handle->offset == 0);
            assert(f.transport->requests.size() == 2);
            assert(f.transport->requests[0].method == "HEAD");
            assert(f.transport->requests[1].method == "POST");
            assert(f.store->get("stale")->location() == "https://host/files/fresh");
        }
        {
            Fixture f;
            f.store->set("broken", SessionEntry("https://host/files/broken"));
            f.transport->reply(500);
            const auto result = f.client.resume_or_create_upload(make_upload("broken"));
            assert(result.status.code == ErrorCode::ProtocolViolation);
            assert(result.status.http_status() == 500);
            assert(f.transport->requests.size() == 1);
        }
        {
            Fixture f;
            f.store->set("offline", SessionEntry("https://host/files/offline"));
            f.transport->fail_next();
            const auto result = f.client.resume_or_create_upload(make_upload("offline"));
            assert(result.status.code == ErrorCode::TransportFailure);
            assert(f.transport->requests.size() == 1);
        }
        {
            auto transport = std::make_shared<FakeTransport>();
            UploadClient client(transport);
            client.set_creation_url("https://host/files/");
            transport->reply(201, {{"Location", "/files/7"}});
            const auto result = client.resume_or_create_upload(make_upload("no-store"));
            assert(result.ok());
            assert(result.handle->url == "https://host/files/7");
        }
    }

    void test_fallback_decision()
    {
        assert(should_create_after_resume(Status::failure(ErrorCode::FingerprintNotFound, "")));
        assert(should_create_after_resume(Status::failure(ErrorCode::ResumingDisabled, "")));

        http::HttpResponse not_found;
        not_found.status = 404;
        assert(should_create_after_resume(Status::failure(ErrorCode::ProtocolViolation, "", not_found)));

        http::HttpResponse gone;
        gone.status = 410;
        assert(!should_create_after_resume(Status::failure(ErrorCode::ProtocolViolation, "", gone)));
        assert(!should_create_after_resume(Status::failure(ErrorCode::ProtocolViolation, "")));
        assert(!should_create_after_resume(Status::failure(ErrorCode::TransportFailure, "")));
        assert(!should_create_after_resume(Status::failure(ErrorCode::MissingCreationUrl, "")));
        assert(!should_create_after_resume(Status{}));
    }

    void test_request_header_order()
    {
        Fixture f;
        f.client.enable_cookies();
        f.client.set_headers({{"Authorization", "Bearer t"}, {"Tus-Resumable", "0.2.2"}});
        f.store->set("foo", SessionEntry("https://host/files/1", parse_set_cookie({"sid=1"})));

        http::HttpRequest request;
        request.headers.emplace_back("Upload-Offset", "0");
        f.client.prepare_request("foo", request);

        assert(request.headers.size() == 5);
        assert(request.headers[0] == std::make_pair(std::string("Tus-Resumable"), std::string("1.0.0")));
        assert(request.headers[1].first == "Authorization");
        // Custom headers are not filtered, even when they shadow protocol headers.
        assert(request.headers[2] == std::make_pair(std::string("Tus-Resumable"), std::string("0.2.2")));
        assert(request.headers[3] == std::make_pair(std::string("Cookie"), std::string("sid=1")));
        assert(request.headers[4].first == "Upload-Offset");
    }

    void test_cookie_capture_and_replay()
    {
        Fixture f;
        f.client.enable_cookies();
        f.transport->reply(201, {{"Location", "https://host/files/c"},
                                 {"Set-Cookie", "b=2; Path=/"},
                                 {"Set-Cookie", "not a cookie"},
                                 {"set-cookie", "a=1"}});
        const auto upload = make_upload("cookie");
        assert(f.client.create_upload(upload).ok());
        assert(!request_header(f.transport->requests[0], "Cookie"));
        assert(f.store->get("cookie")->cookies().size() == 2);

        f.transport->reply(200, {{"Upload-Offset", "3"}, {"Set-Cookie", "c=3"}, {"Set-Cookie", "a=9"}});
        assert(f.client.resume_upload(upload).ok());
        assert(request_header(f.transport->requests[1], "Cookie") == "a=1; b=2");

        const auto entry = f.store->get("cookie");
        assert(entry->cookies().size() == 3);
        assert(serialize_cookie_header(entry->cookies()) == "a=9; b=2; c=3");

        f.transport->reply(200, {{"Upload-Offset", "3"}});
        assert(f.client.resume_upload(upload).ok());
        assert(request_header(f.transport->requests[2], "Cookie") == "a=9; b=2; c=3");
    }

    void test_cookies_ignored_when_disabled()
    {
        Fixture f;
        f.transport->reply(201, {{"Location", "https://host/files/c"}, {"Set-Cookie", "a=1"}});
        const auto upload = make_upload("nocookie");
        assert(f.client.create_upload(upload).ok());
        assert(f.store->get("nocookie")->cookies().empty());

        f.store->set("nocookie", SessionEntry("https://host/files/c", parse_set_cookie({"a=1"})));
        f.transport->reply(200, {{"Upload-Offset", "0"}});
        assert(f.client.resume_upload(upload).ok());
        assert(!request_header(f.transport->requests[1], "Cookie"));
    }

    void test_expired_cookies_not_replayed()
    {
        Fixture f;
        f.client.enable_cookies();
        f.store->set("exp", SessionEntry("https://host/files/e", parse_set_cookie({"old=1; Max-Age=0"})));
        f.transport->reply(200, {{"Upload-Offset", "0"}});
        assert(f.client.resume_upload(make_upload("exp")).ok());
        assert(!request_header(f.transport->requests[0], "Cookie"));
    }

    void test_redirect_switch_reaches_transport()
    {
        Fixture f;
        f.client.set_connect_timeout(std::chrono::milliseconds{250});
        f.transport->reply(201, {{"Location", "/files/1"}});
        assert(f.client.create_upload(make_upload("r")).ok());
        assert(!f.transport->last_options.follow_redirects);
        assert(f.transport->last_options.connect_timeout == std::chrono::milliseconds{250});

        set_strict_post_redirect(true);
        f.transport->reply(201, {{"Location", "/files/2"}});
        assert(f.client.create_upload(make_upload("r")).ok());
        assert(f.transport->last_options.follow_redirects);
        set_strict_post_redirect(false);
    }

    void test_upload_finished_hook()
    {
        Fixture f;
        f.store->set("done", SessionEntry("https://host/files/d"));
        f.client.upload_finished(make_upload("done"));
        assert(f.store->get("done"));

        f.client.enable_remove_fingerprint_on_success();
        f.client.upload_finished(make_upload("done"));
        assert(!f.store->get("done"));

        f.client.disable_resuming();
        f.client.upload_finished(make_upload("done"));
    }

    void test_uploader_transfers_from_offset()
    {
        Fixture f;
        f.client.enable_remove_fingerprint_on_success();
        f.client.enable_cookies();
        const auto upload = make_upload("up", "hello world");
        f.store->set("up", SessionEntry("https://host/files/up", parse_set_cookie({"sid=s"})));

        f.transport->reply(200, {{"Upload-Offset", "3"}});
        const auto resumed = f.client.resume_upload(upload);
        assert(resumed.ok());

        Uploader uploader(f.client, upload, *resumed.handle);
        uploader.set_chunk_size(4);
        f.transport->reply(204, {{"Upload-Offset", "7"}});
        f.transport->reply(204, {{"Upload-Offset", "11"}, {"Set-Cookie", "lb=2"}});
        const auto status = uploader.upload_remaining();
        assert(status.ok());
        assert(uploader.done());
        assert(uploader.offset() == 11);

        const auto &first = f.transport->requests.at(1);
        assert(first.method == "PATCH");
        assert(first.url == "https://host/files/up");
        assert(first.body == "lo w");
        assert(request_header(first, "Upload-Offset") == "3");
        assert(request_header(first, "Content-Type") == "application/offset+octet-stream");
        assert(request_header(first, "Cookie") == "sid=s");
        const auto &second = f.transport->requests.at(2);
        assert(second.body == "orld");
        assert(request_header(second, "Upload-Offset") == "7");
        assert(f.store->get("up")->cookies().size() == 2);

        assert(uploader.upload_chunk().bytes_sent == 0);
        uploader.finish();
        assert(!f.store->get("up"));
    }

    void test_uploader_reports_offset_mismatch()
    {
        Fixture f;
        const auto upload = make_upload("mismatch", "abcdef");
        f.store->set("mismatch", SessionEntry("https://host/files/m"));
        Uploader uploader(f.client, upload, UploadHandle{"https://host/files/m", 0});
        uploader.set_chunk_size(3);

        f.transport->reply(204, {{"Upload-Offset", "2"}});
        auto result = uploader.upload_chunk();
        assert(result.status.code == ErrorCode::ProtocolViolation);
        assert(uploader.offset() == 0);

        f.transport->reply(409);
        result = uploader.upload_chunk();
        assert(result.status.http_status() == 409);

        f.transport->fail_next();
        assert(uploader.upload_remaining().code == ErrorCode::TransportFailure);

        uploader.finish();
        f.client.enable_remove_fingerprint_on_success();
        assert(f.store->get("mismatch"));

        bool threw = false;
        try
        {
            uploader.set_chunk_size(0);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_uploader_short_source()
    {
        Fixture f;
        auto upload = make_upload("short", "abc");
        upload.size = 10;
        Uploader uploader(f.client, upload, UploadHandle{"https://host/files/s", 3});
        const auto result = uploader.upload_chunk();
        assert(result.status.code == ErrorCode::SourceUnreadable);
        assert(f.transport->requests.empty());

        upload.input.reset();
        Uploader sourceless(f.client, upload, UploadHandle{"https://host/files/s", 0});
        assert(sourceless.upload_chunk().status.code == ErrorCode::SourceUnreadable);
    }

    void test_upload_from_file()
    {
        const auto path = std::filesystem::temp_directory_path() / "tusclient_upload_test.bin";
        {
            std::ofstream out(path, std::ios::binary);
            out << "0123456789";
        }
        const auto upload = Upload::from_file(path, {{"filename", "hello.txt"}});
        assert(upload.size == 10);
        assert(upload.fingerprint.ends_with("-10"));
        assert(upload.fingerprint == Upload::from_file(path).fingerprint);
        assert(upload.encoded_metadata == "filename aGVsbG8udHh0");
        assert(upload.input);
        std::filesystem::remove(path);

        bool threw = false;
        try
        {
            Upload::from_file(path);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

} // namespace

void run_client_component_tests()
{
    test_memory_store_contract();
    test_memory_store_update_cookies();
    test_session_entry_is_immutable_on_merge();
    test_session_entry_json();
    test_config_loading();
    test_create_then_resume_same_url();
    test_create_without_metadata_omits_header();
    test_create_resolves_location_against_final_url();
    test_create_failures();
    test_resume_preconditions();
    test_begin_from_url_validates_offset();
    test_resume_or_create_fallbacks();
    test_fallback_decision();
    test_request_header_order();
    test_cookie_capture_and_replay();
    test_cookies_ignored_when_disabled();
    test_expired_cookies_not_replayed();
    test_redirect_switch_reaches_transport();
    test_upload_finished_hook();
    test_uploader_transfers_from_offset();
    test_uploader_reports_offset_mismatch();
    test_uploader_short_source();
    test_upload_from_file();
}
