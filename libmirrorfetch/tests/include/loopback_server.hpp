// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef LIBMIRRORFETCHTESTS_LOOPBACK_SERVER_HPP
#define LIBMIRRORFETCHTESTS_LOOPBACK_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace mirrorfetchtests
{
    struct ScriptedResponse
    {
        int status = 200;
        std::string reason = "OK";
        std::vector<std::pair<std::string, std::string>> headers = {};
        std::string body = "";
        // A ranged request on a 200 gets a 206 with the requested slice of ``body``.
        bool honor_range = true;
        // The connection is closed after this many body bytes, the announced length is kept.
        std::optional<std::size_t> cut_after = std::nullopt;
    };

    struct RecordedRequest
    {
        std::string method;
        std::string path;
        // Lower case keys
        std::map<std::string, std::string> headers;
    };

    class server_error : public std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    /**
     * HTTP/1.1 server listening on 127.0.0.1, on a port picked by the system.
     *
     * Each path answers with its scripted responses in order, the last one being
     * repeated. Unknown paths get a 404. The connection is closed after every response.
     */
    class LoopbackServer
    {
    public:

        LoopbackServer();
        ~LoopbackServer();

        LoopbackServer(const LoopbackServer&) = delete;
        LoopbackServer& operator=(const LoopbackServer&) = delete;

        /// ``http://127.0.0.1:<port>/<prefix>``
        std::string url(std::string_view prefix = "") const;

        void script(const std::string& path, std::vector<ScriptedResponse> responses);
        void serve(const std::string& path, std::string content);

        std::vector<RecordedRequest> requests(const std::string& path) const;

    private:

        void main_loop();
        void handle_connection(int fd);
        ScriptedResponse next_response(const RecordedRequest& request);

        int m_socket = -1;
        std::uint16_t m_port = 0;
        std::atomic<bool> m_stop = false;
        mutable std::mutex m_mutex;
        std::map<std::string, std::vector<ScriptedResponse>> m_scripts;
        std::map<std::string, std::size_t> m_served;
        std::vector<RecordedRequest> m_requests;
        std::thread m_thread;
    };
}

#endif
