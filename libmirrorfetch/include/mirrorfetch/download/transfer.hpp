// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_DOWNLOAD_TRANSFER_HPP
#define MIRRORFETCH_DOWNLOAD_TRANSFER_HPP

#include <optional>
#include <stop_token>
#include <string>

#include "mirrorfetch/download/parameters.hpp"
#include "mirrorfetch/download/request.hpp"

namespace mirrorfetch::download
{
    /**
     * Performs one resumable transfer of ``request.url`` into ``request.filename``.
     *
     * An existing partial file smaller than the expected size is resumed with a
     * range request, a larger one is discarded. A destination already holding
     * the expected number of bytes completes without any network request.
     * The body is streamed to disk chunk by chunk.
     *
     * When a resumed transfer is rejected by the server (range not satisfiable,
     * resource changed) the partial file is dropped and the transfer starts
     * over from byte zero once.
     */
    TransferOutcome transfer(
        const TransferRequest& request,
        const RemoteFetchParams& params,
        std::stop_token stop_token = {}
    );

    TransferOutcome transfer(
        const std::string& url,
        const fs::path& destination,
        std::optional<std::size_t> expected_size,
        const RemoteFetchParams& params,
        std::stop_token stop_token = {}
    );
}

#endif
