// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <utility>

#include <catch2/catch_all.hpp>

#include "mirrorfetch/core/util.hpp"

#include "../src/download/curl.hpp"

#include "mirrorfetchtests.hpp"

namespace mirrorfetch::download
{
    namespace
    {
        TEST_CASE("proxy_match", "[mirrorfetch::download]")
        {
            const curl::proxy_map_type proxies = {
                { "https://mirror.example.org", "https-host-proxy" },
                { "http", "http-proxy" },
                { "all://archive.example.org", "all-host-proxy" },
                { "all", "fallback-proxy" },
            };

            CHECK(curl::proxy_match("https://mirror.example.org/files/1.txt", proxies) == "https-host-proxy");
            CHECK(curl::proxy_match("http://mirror.example.org/files/1.txt", proxies) == "http-proxy");
            CHECK(curl::proxy_match("https://archive.example.org/a", proxies) == "all-host-proxy");
            CHECK(curl::proxy_match("ftp://other.example.org/a", proxies) == "fallback-proxy");
            CHECK_FALSE(curl::proxy_match("https://mirror.example.org", {}).has_value());
        }

        TEST_CASE("CURLHandle on a file URL", "[mirrorfetch::download]")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto mirror = mirrorfetchtests::make_file_mirror(
                tmp_dir.path(),
                "local",
                { { "files/1.txt", "0123456789" } }
            );
            RemoteFetchParams params;

            CURLHandle handle;
            handle.configure_handle(mirror.build_url("files/1.txt"), params);
            handle.set_opt(CURLOPT_NOBODY, 1L);
            REQUIRE(handle.perform() == CURLE_OK);
            // No HTTP status for file URLs
            CHECK(handle.get_info<int>(CURLINFO_RESPONSE_CODE).value_or(-1) == 0);

            SECTION("A moved handle keeps working")
            {
                CURLHandle other = std::move(handle);
                other.reset_handle();
                other.configure_handle(mirror.build_url("files/missing.txt"), params);
                other.set_opt(CURLOPT_NOBODY, 1L);
                CHECK(other.perform() == CURLE_FILE_COULDNT_READ_FILE);
                CHECK_FALSE(other.error_details().empty());
            }
        }
    }
}
