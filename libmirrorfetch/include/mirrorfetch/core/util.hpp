// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_CORE_UTIL_HPP
#define MIRRORFETCH_CORE_UTIL_HPP

#include <filesystem>
#include <fstream>
#include <optional>

namespace mirrorfetch
{
    namespace fs = std::filesystem;

    std::ofstream
    open_ofstream(const fs::path& path, std::ios::openmode mode = std::ios::out | std::ios::binary);

    std::ifstream
    open_ifstream(const fs::path& path, std::ios::openmode mode = std::ios::in | std::ios::binary);

    /**
     * Size of the regular file at ``path``, or nothing if there is no such file.
     * Never throws.
     */
    std::optional<std::size_t> regular_file_size(const fs::path& path) noexcept;

    class TemporaryDirectory
    {
    public:

        TemporaryDirectory();
        ~TemporaryDirectory();

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = default;

        const fs::path& path() const;
        operator fs::path();

    private:

        fs::path m_path;
    };
}

#endif
