/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "ElevatedActions.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Steadfast::Core::IO {

namespace {
    ElevationResponse failure(int err, const std::string& what, const std::string& path) {
        ElevationResponse resp;
        resp.success = false;
        resp.errorNumber = err;
        resp.message = what + " '" + path + "': " + std::strerror(err);
        return resp;
    }

    // chown and chmod go through an O_NOFOLLOW descriptor whose inode must match the lstat
    ElevationResponse grant(const std::string& path, uint32_t grantee) {
        struct stat before{};
        if (::lstat(path.c_str(), &before) != 0) {
            return failure(errno, "stat", path);
        }
        if (S_ISLNK(before.st_mode)) {
            return failure(ELOOP, "refusing to grant through symbolic link", path);
        }
        if (!S_ISREG(before.st_mode) && !S_ISDIR(before.st_mode)) {
            return failure(EINVAL, "refusing to grant special file", path);
        }

        int fd = ::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            return failure(errno, "open", path);
        }
        auto result = [&]() -> ElevationResponse {
            struct stat st{};
            if (::fstat(fd, &st) != 0) {
                return failure(errno, "stat", path);
            }
            if (st.st_dev != before.st_dev || st.st_ino != before.st_ino) {
                return failure(EAGAIN, "path changed while granting", path);
            }
            if (st.st_uid != grantee && ::fchown(fd, static_cast<uid_t>(grantee), static_cast<gid_t>(-1)) != 0) {
                return failure(errno, "chown", path);
            }

            mode_t mode = st.st_mode & 07777;
            mode |= S_IRUSR | S_IWUSR;
            if (S_ISDIR(st.st_mode) || (mode & (S_IXUSR | S_IXGRP | S_IXOTH))) {
                mode |= S_IXUSR;
            }
            if (::fchmod(fd, mode) != 0) {
                return failure(errno, "chmod", path);
            }

            ElevationResponse resp;
            resp.success = true;
            resp.message = "granted " + path;
            return resp;
        }();
        ::close(fd);
        return result;
    }
}

ElevationResponse executeElevatedRequest(const ElevationRequest& request, uint32_t grantee) {
    if (request.path.empty()) {
        return failure(EINVAL, "empty path", request.path);
    }

    switch (request.action) {
        case ElevationAction::GrantAccess: {
            std::string target = request.path;
            struct stat st{};
            if (::lstat(target.c_str(), &st) != 0 && errno == ENOENT) {
                auto parent = std::filesystem::path(target).parent_path();
                if (!parent.empty()) target = parent.string();
            }
            return grant(target, grantee);
        }
        case ElevationAction::EnsureDirectory: {
            std::error_code ec;
            std::filesystem::create_directories(request.path, ec);
            if (ec) {
                return failure(ec.value(), "create directories", request.path);
            }
            return grant(request.path, grantee);
        }
    }
    return failure(EINVAL, "unknown action", request.path);
}

} // namespace Steadfast::Core::IO
