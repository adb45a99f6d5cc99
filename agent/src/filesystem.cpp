#include "capydeploy/agent/filesystem.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>

#include "capydeploy/protocol_error.hpp"

namespace capydeploy::agent::fs
{

    namespace
    {
        [[noreturn]] void throw_io_error(int error_number, const std::string &what, const std::filesystem::path &path)
        {
            const std::error_code ec(error_number, std::generic_category());
            const auto code = classify_error_code(ec, ErrorCode::UploadFailed);
            throw ProtocolError(code, what + " " + path.generic_string(),
                                std::make_exception_ptr(std::system_error(ec)));
        }
    } // namespace

    std::filesystem::path resolve_within(const std::filesystem::path &base, std::string_view requested)
    {
        if (requested.empty())
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "empty file path");
        }
        const std::filesystem::path relative(requested);
        if (relative.has_root_path())
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "absolute file path not allowed: " + relative.generic_string());
        }

        std::filesystem::path sanitized = base;
        bool has_component = false;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw ProtocolError(ErrorCode::InvalidRequest, "path traversal detected: " + relative.generic_string());
            }
            sanitized /= part;
            has_component = true;
        }
        if (!has_component)
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "file path names no file");
        }
        return sanitized;
    }

    void require_plain_name(std::string_view name, std::string_view what)
    {
        if (name.empty() || name == "." || name == ".." || name.find('/') != std::string_view::npos ||
            name.find('\\') != std::string_view::npos)
        {
            throw ProtocolError(ErrorCode::InvalidRequest, "invalid " + std::string(what) + ": " + std::string(name));
        }
    }

    void write_at(const std::filesystem::path &path, std::uint64_t offset, std::span<const std::byte> data)
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            throw_io_error(ec.value(), "cannot create directory for", path);
        }

        std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
        if (!file.is_open())
        {
            // First chunk for this file.
            file.open(path, std::ios::binary | std::ios::out | std::ios::app);
            file.close();
            file.open(path, std::ios::binary | std::ios::in | std::ios::out);
        }
        if (!file.is_open())
        {
            throw_io_error(errno != 0 ? errno : EIO, "cannot open", path);
        }

        file.seekp(static_cast<std::streamoff>(offset));
        file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file)
        {
            throw_io_error(errno != 0 ? errno : EIO, "write failed for", path);
        }
    }

    void replace_tree(const std::filesystem::path &from, const std::filesystem::path &to)
    {
        std::filesystem::create_directories(to.parent_path());
        if (std::filesystem::exists(to))
        {
            std::filesystem::remove_all(to);
        }
        std::filesystem::rename(from, to);
    }

    bool remove_tree(const std::filesystem::path &path, std::error_code &ec) noexcept
    {
        std::filesystem::remove_all(path, ec);
        return !ec;
    }

} // namespace capydeploy::agent::fs
