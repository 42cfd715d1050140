#include "tusclient/client/asio_transport.hpp"

#include <asio/buffers_iterator.hpp>
#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/streambuf.hpp>
#include <asio/write.hpp>

#include <charconv>
#include <cstddef>
#include <istream>
#include <string>

namespace tusclient::client
{

    namespace
    {

        using asio::ip::tcp;

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::string serialize_request(const http::Url &url, const http::HttpRequest &request)
        {
            std::string out = request.method + " " + url.target + " HTTP/1.1\r\n";
            out += "Host: " + url.host_header() + "\r\n";
            for (const auto &[name, value] : request.headers)
            {
                out += name + ": " + value + "\r\n";
            }
            const bool needs_length = !request.body.empty() || request.method == "POST" ||
                                      request.method == "PUT" || request.method == "PATCH";
            if (needs_length && !http::header_value(request.headers, "Content-Length"))
            {
                out += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
            }
            out += "Connection: close\r\n\r\n";
            out += request.body;
            return out;
        }

        class ResponseReader
        {
        public:
            ResponseReader(tcp::socket &socket, asio::streambuf &buffer)
                : socket_(socket),
                  buffer_(buffer) {}

            std::string read_line()
            {
                std::error_code ec;
                asio::read_until(socket_, buffer_, "\r\n", ec);
                if (ec)
                {
                    throw TransportError("Connection closed while reading response: " + ec.message());
                }
                std::istream stream(&buffer_);
                std::string line;
                std::getline(stream, line);
                if (!line.empty() && line.back() == '\r')
                {
                    line.pop_back();
                }
                return line;
            }

            std::string read_exactly(std::size_t size)
            {
                if (buffer_.size() < size)
                {
                    std::error_code ec;
                    asio::read(socket_, buffer_, asio::transfer_exactly(size - buffer_.size()), ec);
                    if (ec)
                    {
                        throw TransportError("Response body truncated: " + ec.message());
                    }
                }
                return take(size);
            }

            std::string read_to_eof()
            {
                std::error_code ec;
                asio::read(socket_, buffer_, asio::transfer_all(), ec);
                if (ec && ec != asio::error::eof)
                {
                    throw TransportError("Failed reading response body: " + ec.message());
                }
                return take(buffer_.size());
            }

            std::string read_chunked()
            {
                std::string body;
                for (;;)
                {
                    const auto line = read_line();
                    const auto size_text = trim(line.substr(0, line.find(';')));
                    std::size_t size = 0;
                    const auto [ptr, ec] =
                        std::from_chars(size_text.data(), size_text.data() + size_text.size(), size, 16);
                    if (size_text.empty() || ec != std::errc{} || ptr != size_text.data() + size_text.size())
                    {
                        throw TransportError("Malformed chunk size '" + line + "'");
                    }
                    if (size == 0)
                    {
                        while (!read_line().empty())
                        {
                        }
                        return body;
                    }
                    body += read_exactly(size);
                    if (!read_line().empty())
                    {
                        throw TransportError("Missing CRLF after response chunk");
                    }
                }
            }

        private:
            std::string take(std::size_t size)
            {
                const auto begin = asio::buffers_begin(buffer_.data());
                std::string data(begin, begin + static_cast<std::ptrdiff_t>(size));
                buffer_.consume(size);
                return data;
            }

            tcp::socket &socket_;
            asio::streambuf &buffer_;
        };

        http::HttpResponse parse_head(ResponseReader &reader)
        {
            http::HttpResponse response;
            const auto status_line = reader.read_line();
            if (!status_line.starts_with("HTTP/1."))
            {
                throw TransportError("Malformed status line '" + status_line + "'");
            }
            const auto first_space = status_line.find(' ');
            const auto code_text = status_line.substr(first_space + 1, 3);
            const auto [ptr, ec] = std::from_chars(code_text.data(), code_text.data() + code_text.size(),
                                                   response.status);
            if (first_space == std::string::npos || ec != std::errc{} || ptr != code_text.data() + code_text.size())
            {
                throw TransportError("Malformed status line '" + status_line + "'");
            }
            if (status_line.size() > first_space + 5)
            {
                response.reason = status_line.substr(first_space + 5);
            }

            for (auto line = reader.read_line(); !line.empty(); line = reader.read_line())
            {
                const auto colon = line.find(':');
                if (colon == std::string::npos)
                {
                    throw TransportError("Malformed header line '" + line + "'");
                }
                response.headers.emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
            }
            return response;
        }

        void connect_with_timeout(asio::io_context &io, tcp::socket &socket, const http::Url &url,
                                  std::chrono::milliseconds timeout)
        {
            tcp::resolver resolver(io);
            std::error_code result = asio::error::would_block;
            bool abandoned = false;
            resolver.async_resolve(url.host, std::to_string(url.port),
                                   [&](const std::error_code &ec, const tcp::resolver::results_type &endpoints)
                                   {
                                       if (ec || abandoned)
                                       {
                                           result = ec;
                                           return;
                                       }
                                       asio::async_connect(socket, endpoints,
                                                           [&](const std::error_code &connect_ec, const tcp::endpoint &)
                                                           { result = connect_ec; });
                                   });
            io.run_for(timeout);
            if (result == asio::error::would_block)
            {
                abandoned = true;
                resolver.cancel();
                std::error_code ignored;
                socket.close(ignored);
                io.restart();
                io.run();
                throw TransportError("Timed out connecting to " + url.host_header());
            }
            if (result)
            {
                throw TransportError("Failed to connect to " + url.host_header() + ": " + result.message());
            }
        }

    } // namespace

    http::HttpResponse AsioTransport::send(const http::HttpRequest &request, const TransportOptions &options)
    {
        http::HttpRequest current = request;
        http::HeaderList hop_cookies;
        for (int hop = 0;; ++hop)
        {
            const auto url = http::parse_url(current.url);
            if (!url)
            {
                throw TransportError("Invalid request URL '" + current.url + "'");
            }

            auto response = exchange(*url, current, options.connect_timeout);
            response.final_url = current.url;
            // Cookies set by earlier hops come first so the final response wins on a key collision.
            response.headers.insert(response.headers.begin(), hop_cookies.begin(), hop_cookies.end());
            if (!options.follow_redirects || !http::is_redirect(response.status))
            {
                return response;
            }

            const auto location = http::header_value(response.headers, "Location");
            if (!location)
            {
                return response;
            }
            hop_cookies.clear();
            for (const auto &[name, value] : response.headers)
            {
                if (http::iequals(name, "Set-Cookie"))
                {
                    hop_cookies.emplace_back(name, value);
                }
            }
            if (hop + 1 >= kMaxRedirects)
            {
                throw TransportError("Too many redirects starting at " + request.url);
            }
            auto next = http::resolve_url(current.url, *location);
            if (!next)
            {
                throw TransportError("Cannot follow redirect to '" + *location + "'");
            }
            current.url = std::move(*next);
        }
    }

    http::HttpResponse AsioTransport::exchange(const http::Url &url, const http::HttpRequest &request,
                                               std::chrono::milliseconds connect_timeout)
    {
        if (url.scheme != "http")
        {
            throw TransportError("Unsupported URL scheme '" + url.scheme + "'");
        }

        asio::io_context io;
        tcp::socket socket(io);
        connect_with_timeout(io, socket, url, connect_timeout);

        std::error_code ec;
        asio::write(socket, asio::buffer(serialize_request(url, request)), ec);
        if (ec)
        {
            throw TransportError("Failed to send request to " + url.host_header() + ": " + ec.message());
        }

        asio::streambuf buffer;
        ResponseReader reader(socket, buffer);
        auto response = parse_head(reader);

        const bool bodiless = request.method == "HEAD" || response.status / 100 == 1 || response.status == 204 ||
                              response.status == 304;
        if (bodiless)
        {
            return response;
        }

        const auto encoding = http::header_value(response.headers, "Transfer-Encoding");
        if (encoding && encoding->find("chunked") != std::string::npos)
        {
            response.body = reader.read_chunked();
        }
        else if (const auto length = http::header_value(response.headers, "Content-Length"))
        {
            std::size_t size = 0;
            const auto [ptr, parse_ec] = std::from_chars(length->data(), length->data() + length->size(), size);
            if (parse_ec != std::errc{} || ptr != length->data() + length->size())
            {
                throw TransportError("Malformed Content-Length '" + *length + "'");
            }
            response.body = reader.read_exactly(size);
        }
        else
        {
            response.body = reader.read_to_eof();
        }
        return response;
    }

} // namespace tusclient::client
