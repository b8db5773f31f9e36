// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fmt/format.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "mirrorfetch/util/string.hpp"

#include "loopback_server.hpp"

namespace mirrorfetchtests
{
    namespace
    {
        constexpr std::size_t max_request_size = 64 * 1024;

        bool send_all(int fd, std::string_view data)
        {
            std::size_t sent = 0;
            while (sent < data.size())
            {
                const auto ret = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
                if (ret <= 0)
                {
                    return false;
                }
                sent += static_cast<std::size_t>(ret);
            }
            return true;
        }

        // Reads up to the blank line ending the headers, the requests sent by the
        // tests have no body.
        std::optional<std::string> read_head(int fd)
        {
            std::string content;
            char buf[4096];
            while (content.find("\r\n\r\n") == std::string::npos)
            {
                if (content.size() > max_request_size)
                {
                    return std::nullopt;
                }
                const auto ret = ::recv(fd, buf, sizeof(buf), 0);
                if (ret <= 0)
                {
                    return std::nullopt;
                }
                content.append(buf, static_cast<std::size_t>(ret));
            }
            return content;
        }

        std::optional<RecordedRequest> parse_head(std::string_view head)
        {
            RecordedRequest req;
            std::size_t pos = head.find("\r\n");
            const std::string_view request_line = head.substr(0, pos);
            const auto first_space = request_line.find(' ');
            const auto second_space = request_line.find(' ', first_space + 1);
            if (first_space == std::string_view::npos || second_space == std::string_view::npos)
            {
                return std::nullopt;
            }
            req.method = std::string(request_line.substr(0, first_space));
            req.path = std::string(request_line.substr(first_space + 1, second_space - first_space - 1));

            while (pos != std::string_view::npos)
            {
                const std::size_t start = pos + 2;
                pos = head.find("\r\n", start);
                const std::string_view line = head.substr(start, pos - start);
                if (line.empty())
                {
                    break;
                }
                const auto colon = line.find(':');
                if (colon == std::string_view::npos)
                {
                    continue;
                }
                // http headers are case insensitive
                req.headers[mirrorfetch::util::to_lower(line.substr(0, colon))] = std::string(
                    mirrorfetch::util::strip(line.substr(colon + 1))
                );
            }
            return req;
        }

        // Offset of a "bytes=<offset>-" range.
        std::optional<std::size_t> range_start(const RecordedRequest& req)
        {
            const auto it = req.headers.find("range");
            if (it == req.headers.end())
            {
                return std::nullopt;
            }
            std::string_view value = it->second;
            constexpr std::string_view prefix = "bytes=";
            if (value.substr(0, prefix.size()) != prefix || value.back() != '-')
            {
                return std::nullopt;
            }
            value.remove_prefix(prefix.size());
            value.remove_suffix(1);
            return mirrorfetch::util::parse_size(value);
        }
    }

    LoopbackServer::LoopbackServer()
    {
        m_socket = ::socket(AF_INET, SOCK_STREAM, 0);
        if (m_socket < 0)
        {
            throw server_error(fmt::format("Could not open socket: {}", std::strerror(errno)));
        }

        int optval = 1;
        ::setsockopt(m_socket, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

        struct sockaddr_in addr = {};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;

        socklen_t addr_len = sizeof(addr);
        if (::bind(m_socket, reinterpret_cast<struct sockaddr*>(&addr), addr_len) != 0
            || ::listen(m_socket, 16) != 0
            || ::getsockname(m_socket, reinterpret_cast<struct sockaddr*>(&addr), &addr_len) != 0)
        {
            const std::string error = std::strerror(errno);
            ::close(m_socket);
            throw server_error(fmt::format("Could not listen on the loopback interface: {}", error));
        }
        m_port = ntohs(addr.sin_port);
        m_thread = std::thread([this]() { main_loop(); });
    }

    LoopbackServer::~LoopbackServer()
    {
        m_stop = true;
        if (m_thread.joinable())
        {
            m_thread.join();
        }
        ::close(m_socket);
    }

    std::string LoopbackServer::url(std::string_view prefix) const
    {
        return fmt::format("http://127.0.0.1:{}/{}", m_port, prefix);
    }

    void LoopbackServer::script(const std::string& path, std::vector<ScriptedResponse> responses)
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        m_scripts[path] = std::move(responses);
        m_served[path] = 0;
    }

    void LoopbackServer::serve(const std::string& path, std::string content)
    {
        ScriptedResponse res;
        res.body = std::move(content);
        script(path, { std::move(res) });
    }

    std::vector<RecordedRequest> LoopbackServer::requests(const std::string& path) const
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<RecordedRequest> res;
        for (const auto& req : m_requests)
        {
            if (req.path == path)
            {
                res.push_back(req);
            }
        }
        return res;
    }

    void LoopbackServer::main_loop()
    {
        while (!m_stop)
        {
            struct pollfd fds[1];
            fds[0].fd = m_socket;
            fds[0].events = POLLIN;
            fds[0].revents = 0;
            if (::poll(fds, 1, 50) <= 0 || (fds[0].revents & POLLIN) == 0)
            {
                continue;
            }

            const int client = ::accept(m_socket, nullptr, nullptr);
            if (client < 0)
            {
                continue;
            }
            handle_connection(client);
            ::close(client);
        }
    }

    void LoopbackServer::handle_connection(int fd)
    {
        const auto head = read_head(fd);
        if (!head.has_value())
        {
            return;
        }
        const auto req = parse_head(head.value());
        if (!req.has_value())
        {
            send_all(fd, "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
            return;
        }

        ScriptedResponse res = next_response(req.value());
        if (res.status == 200 && res.honor_range)
        {
            if (const auto start = range_start(req.value()); start.has_value())
            {
                const std::size_t total = res.body.size();
                if (start.value() >= total)
                {
                    res.status = 416;
                    res.reason = "Range Not Satisfiable";
                    res.headers.emplace_back("Content-Range", fmt::format("bytes */{}", total));
                    res.body.clear();
                }
                else
                {
                    res.status = 206;
                    res.reason = "Partial Content";
                    res.headers.emplace_back(
                        "Content-Range",
                        fmt::format("bytes {}-{}/{}", start.value(), total - 1, total)
                    );
                    res.body = res.body.substr(start.value());
                }
            }
        }

        std::string out = fmt::format("HTTP/1.1 {} {}\r\n", res.status, res.reason);
        for (const auto& [key, value] : res.headers)
        {
            out += fmt::format("{}: {}\r\n", key, value);
        }
        out += fmt::format("Content-Length: {}\r\nConnection: close\r\n\r\n", res.body.size());
        if (!send_all(fd, out) || req->method == "HEAD")
        {
            return;
        }

        std::string_view body = res.body;
        if (res.cut_after.has_value())
        {
            body = body.substr(0, res.cut_after.value());
        }
        send_all(fd, body);
    }

    ScriptedResponse LoopbackServer::next_response(const RecordedRequest& request)
    {
        const std::lock_guard<std::mutex> lock(m_mutex);
        m_requests.push_back(request);

        const auto it = m_scripts.find(request.path);
        if (it == m_scripts.end() || it->second.empty())
        {
            ScriptedResponse not_found;
            not_found.status = 404;
            not_found.reason = "Not Found";
            not_found.body = "Not found";
            return not_found;
        }
        std::size_t& served = m_served[request.path];
        const std::size_t index = std::min(served, it->second.size() - 1);
        ++served;
        return it->second[index];
    }
}
