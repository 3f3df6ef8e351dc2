/* This file is part of Ledger Turbo project
 * Copyright (c) 2025 Ledger Turbo developers
 * This code is distributed under the license specified in the LICENSE file */

#include <fstream>
#include <lt/file.hpp>
#include <lt/logger.hpp>

namespace ledger_turbo::file {
    uint8_vector read(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary | std::ios::ate };
        if (!is)
            throw error_sys(fmt::format("failed to open {} for reading", path));
        const auto sz = is.tellg();
        if (sz < 0)
            throw error_sys(fmt::format("failed to determine the size of {}", path));
        uint8_vector data(static_cast<size_t>(sz));
        is.seekg(0);
        if (!is.read(reinterpret_cast<char *>(data.data()), sz))
            throw error_sys(fmt::format("failed to read {} bytes from {}", data.size(), path));
        return data;
    }

    void write(const std::string &path, const buffer &data)
    {
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os)
            throw error_sys(fmt::format("failed to open {} for writing", path));
        if (!os.write(reinterpret_cast<const char *>(data.data()), data.size()))
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }

    tmp::tmp(const std::string &name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        if (!std::filesystem::remove(_path, ec) && ec)
            logger::warn("failed to remove a temporary file {}: {}", _path, ec.message());
    }
}
