// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>
#include <unistd.h>

#include "spell/core/output.hpp"
#include "spell/core/util.hpp"

namespace spell
{
    TemporaryDirectory::TemporaryDirectory()
    {
        std::string template_path = fs::temp_directory_path() / "spelldXXXXXX";
        char* pth = ::mkdtemp(template_path.data());
        if (pth == nullptr)
        {
            throw std::runtime_error("Could not create temporary directory!");
        }
        m_path = pth;
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
        if (ec)
        {
            LOG_WARNING << "Could not remove temporary directory " << m_path << ": " << ec.message();
        }
    }

    const fs::path& TemporaryDirectory::path() const
    {
        return m_path;
    }

    TemporaryDirectory::operator fs::path() const
    {
        return m_path;
    }

    TemporaryFile::TemporaryFile(const std::string& prefix, const std::optional<fs::path>& dir)
    {
        std::string template_path = dir.value_or(fs::temp_directory_path()) / (prefix + "XXXXXX");
        const int fd = ::mkstemp(template_path.data());
        if (fd == -1)
        {
            throw std::runtime_error("Could not create temporary file!");
        }
        ::close(fd);
        m_path = template_path;
    }

    TemporaryFile::~TemporaryFile()
    {
        std::error_code ec;
        fs::remove(m_path, ec);
    }

    const fs::path& TemporaryFile::path() const
    {
        return m_path;
    }

    TemporaryFile::operator fs::path() const
    {
        return m_path;
    }

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

    std::string read_contents(const fs::path& path)
    {
        auto infile = open_ifstream(path);
        if (!infile.good())
        {
            throw std::runtime_error(fmt::format("Could not read file '{}'", path.string()));
        }
        std::stringstream buffer;
        buffer << infile.rdbuf();
        return buffer.str();
    }

    void reset_directory(const fs::path& path)
    {
        if (fs::exists(fs::symlink_status(path)))
        {
            LOG_DEBUG << "Removing existing directory " << path;
            fs::remove_all(path);
        }
        fs::create_directories(path);
    }
}
