// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>

#ifndef _WIN32
#include <stdlib.h>
#else
#include <io.h>
#endif

#include "mirrorfetch/core/logging.hpp"
#include "mirrorfetch/core/util.hpp"

namespace mirrorfetch
{
    std::ofstream open_ofstream(const fs::path& path, std::ios::openmode mode)
    {
        std::ofstream outfile(path, mode);

        if (!outfile.good())
        {
            LOG_ERROR << "Error opening for writing " << path << ": " << std::strerror(errno);
        }

        return outfile;
    }

    std::ifstream open_ifstream(const fs::path& path, std::ios::openmode mode)
    {
        std::ifstream infile(path, mode);
        if (!infile.good())
        {
            LOG_ERROR << "Error opening for reading " << path << ": " << std::strerror(errno);
        }

        return infile;
    }

    std::optional<std::size_t> regular_file_size(const fs::path& path) noexcept
    {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec) || ec)
        {
            return std::nullopt;
        }
        const auto size = fs::file_size(path, ec);
        if (ec)
        {
            return std::nullopt;
        }
        return static_cast<std::size_t>(size);
    }

    /**********************
     * TemporaryDirectory *
     **********************/

    TemporaryDirectory::TemporaryDirectory()
    {
        bool success = false;
#ifndef _WIN32
        std::string template_path = fs::temp_directory_path() / "mirrorfetchXXXXXX";
        char* pth = mkdtemp(template_path.data());
        success = (pth != nullptr);
#else
        std::string template_path = (fs::temp_directory_path() / "mirrorfetchXXXXXX").string();
        // include \0 terminator
        success = _mktemp_s(template_path.data(), template_path.size() + 1) == 0
                  && fs::create_directory(template_path);
#endif
        if (!success)
        {
            throw std::runtime_error("Could not create temporary directory!");
        }
        m_path = template_path;
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
        if (ec)
        {
            LOG_WARNING << "Could not remove temporary directory " << m_path << ": "
                        << ec.message();
        }
    }

    const fs::path& TemporaryDirectory::path() const
    {
        return m_path;
    }

    TemporaryDirectory::operator fs::path()
    {
        return m_path;
    }
}
