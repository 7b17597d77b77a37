/**
 * @file private_file.cpp
 * @brief Owner-only file helpers.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/security/private_file.hpp"
#include "gatelink/utils/logger.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace gatelink {
namespace security {

namespace fs = std::filesystem;

bool ensurePrivateDirectory(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            LOG_ERROR("Security", "Cannot create {}: {}", dir.string(), ec.message());
            return false;
        }
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec) {
            LOG_WARN("Security", "Cannot restrict permissions of {}: {}", dir.string(), ec.message());
        }
    }
    return fs::is_directory(dir, ec);
}

bool writePrivateFile(const fs::path& path, const std::string& contents) {
    const fs::path tmp = path.string() + ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        LOG_ERROR("Security", "Cannot open {} for writing", tmp.string());
        return false;
    }

    size_t offset = 0;
    bool ok = true;
    while (offset < contents.size()) {
        ssize_t n = ::write(fd, contents.data() + offset, contents.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ok = false;
            break;
        }
        offset += static_cast<size_t>(n);
    }
    if (ok && ::fsync(fd) != 0) {
        ok = false;
    }
    if (::close(fd) != 0) {
        ok = false;
    }

    std::error_code ec;
    if (ok) {
        fs::rename(tmp, path, ec);
        ok = !ec;
    }
    if (!ok) {
        LOG_ERROR("Security", "Failed to write {}", path.string());
        fs::remove(tmp, ec);
    }
    return ok;
}

std::optional<std::string> readPrivateFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

}  // namespace security
}  // namespace gatelink
