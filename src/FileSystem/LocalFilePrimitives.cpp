/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "LocalFilePrimitives.h"
#include "ErrorClassifier.h"
#include <algorithm>
#include <cerrno>
#include <filesystem>

#include <dirent.h>    // opendir(), readdir()
#include <fcntl.h>     // open(), utimensat()
#include <sys/stat.h>  // stat(), chmod(), mkdir()
#include <unistd.h>    // close(), read(), write(), fsync(), readlink()

namespace Steadfast::Core::IO {

namespace {
    FileErrorInfo success() { return {}; }

    FileErrorInfo lastError(const std::string& path) {
        return makeOsError(errno, path);
    }

    timespec toTimespec(std::chrono::system_clock::time_point tp) {
        auto since = tp.time_since_epoch();
        // floor keeps tv_nsec non-negative for times before the epoch
        auto secs = std::chrono::floor<std::chrono::seconds>(since);
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since - secs);
        timespec ts{};
        ts.tv_sec = static_cast<time_t>(secs.count());
        ts.tv_nsec = static_cast<long>(nanos.count());
        return ts;
    }

    void fillMetadata(const std::string& path, const struct ::stat& st, FileMetadata& out) {
        out.path = path;
        out.exists = true;
        out.isDirectory = S_ISDIR(st.st_mode);
        out.isRegularFile = S_ISREG(st.st_mode);
        out.isSymlink = S_ISLNK(st.st_mode);
        out.size = out.isRegularFile || out.isSymlink ? static_cast<uintmax_t>(st.st_size) : 0;
        out.mode = static_cast<uint32_t>(st.st_mode & 07777);
        out.device = static_cast<uint64_t>(st.st_dev);
        out.inode = static_cast<uint64_t>(st.st_ino);
        out.linkCount = static_cast<uint64_t>(st.st_nlink);
        out.ownerId = static_cast<uint32_t>(st.st_uid);
        out.lastModified = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
    }

    // Closes fd, keeping the first error seen
    FileErrorInfo closeChecked(int fd, const std::string& path, FileErrorInfo prior) {
        if (::close(fd) != 0 && prior.ok()) {
            return lastError(path);
        }
        return prior;
    }
}

FileErrorInfo LocalFilePrimitives::stat(const std::string& path, FileMetadata& out) {
    struct ::stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return lastError(path);
    }
    fillMetadata(path, st, out);
    return success();
}

FileErrorInfo LocalFilePrimitives::lstat(const std::string& path, FileMetadata& out) {
    struct ::stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        return lastError(path);
    }
    fillMetadata(path, st, out);
    return success();
}

FileErrorInfo LocalFilePrimitives::readFile(const std::string& path, std::vector<std::byte>& out) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return lastError(path);
    }

    struct ::stat st{};
    if (::fstat(fd, &st) == 0 && S_ISDIR(st.st_mode)) {
        ::close(fd);
        return makeOsError(EISDIR, path);
    }

    out.clear();
    if (st.st_size > 0) {
        out.reserve(static_cast<size_t>(st.st_size));
    }

    std::byte buffer[64 * 1024];
    for (;;) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = lastError(path);
            ::close(fd);
            return err;
        }
        if (n == 0) break;
        out.insert(out.end(), buffer, buffer + n);
    }
    return closeChecked(fd, path, success());
}

FileErrorInfo LocalFilePrimitives::writeFile(const std::string& path, std::span<const std::byte> data,
                                             const WriteOptions& options, uint64_t& written) {
    written = 0;
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (options.append ? O_APPEND : O_TRUNC);
    int fd = ::open(path.c_str(), flags, static_cast<mode_t>(options.mode));
    if (fd < 0) {
        return lastError(path);
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = lastError(path);
            ::close(fd);
            return err;
        }
        offset += static_cast<size_t>(n);
    }
    written = offset;

    if (options.fsync) {
#if defined(__linux__)
        int rc = ::fdatasync(fd);
#else
        int rc = ::fsync(fd);
#endif
        if (rc != 0) {
            auto err = lastError(path);
            ::close(fd);
            return err;
        }
    }
    return closeChecked(fd, path, success());
}

FileErrorInfo LocalFilePrimitives::copyFile(const std::string& src, const std::string& dst, const CopyOptions& options) {
    namespace fs = std::filesystem;
    std::error_code ec;
    auto copyOpts = options.overwriteExisting ? fs::copy_options::overwrite_existing : fs::copy_options::none;

    struct ::stat srcStat{};
    if (::stat(src.c_str(), &srcStat) != 0) {
        return lastError(src);
    }
    if (S_ISDIR(srcStat.st_mode)) {
        fs::copy(src, dst, copyOpts | fs::copy_options::recursive, ec);
    } else {
        fs::copy_file(src, dst, copyOpts, ec);
    }
    if (ec) {
        return makeOsError(ec, dst);
    }

    if (options.preserveAttributes && !S_ISDIR(srcStat.st_mode)) {
        if (::chmod(dst.c_str(), srcStat.st_mode & 07777) != 0) {
            return lastError(dst);
        }
        timespec times[2] = {srcStat.st_atim, srcStat.st_mtim};
        if (::utimensat(AT_FDCWD, dst.c_str(), times, 0) != 0) {
            return lastError(dst);
        }
    }
    return success();
}

FileErrorInfo LocalFilePrimitives::move(const std::string& src, const std::string& dst, bool overwriteExisting) {
    if (!overwriteExisting) {
        struct ::stat st{};
        if (::lstat(dst.c_str(), &st) == 0) {
            return makeOsError(EEXIST, dst);
        }
    }
    if (::rename(src.c_str(), dst.c_str()) == 0) {
        return success();
    }
    int saved = errno;
    if (saved != EXDEV) {
        return makeOsError(saved, saved == ENOENT ? src : dst);
    }

    // Different devices: copy then remove the source
    CopyOptions copyOptions;
    copyOptions.overwriteExisting = overwriteExisting;
    auto copied = copyFile(src, dst, copyOptions);
    if (!copied.ok()) {
        return copied;
    }
    return removeAll(src);
}

FileErrorInfo LocalFilePrimitives::rename(const std::string& src, const std::string& dst) {
    if (::rename(src.c_str(), dst.c_str()) != 0) {
        // Report the source when it is missing, otherwise the destination
        int saved = errno;
        return makeOsError(saved, saved == ENOENT ? src : dst);
    }
    return success();
}

FileErrorInfo LocalFilePrimitives::removeAll(const std::string& path) {
    struct ::stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        return lastError(path);
    }
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return makeOsError(ec, path);
    }
    return success();
}

FileErrorInfo LocalFilePrimitives::unlink(const std::string& path) {
    if (::unlink(path.c_str()) != 0) {
        return lastError(path);
    }
    return success();
}

FileErrorInfo LocalFilePrimitives::rmdir(const std::string& path) {
    if (::rmdir(path.c_str()) != 0) {
        return lastError(path);
    }
    return success();
}

FileErrorInfo LocalFilePrimitives::mkdir(const std::string& path, uint32_t mode) {
    if (::mkdir(path.c_str(), static_cast<mode_t>(mode)) != 0) {
        return lastError(path);
    }
    return success();
}

FileErrorInfo LocalFilePrimitives::createDirectories(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return makeOsError(ec, path);
    }
    return success();
}

FileErrorInfo LocalFilePrimitives::readDirectory(const std::string& path, std::vector<std::string>& names) {
    DIR* dir = ::opendir(path.c_str());
    if (!dir) {
        return lastError(path);
    }
    names.clear();
    errno = 0;
    while (dirent* entry = ::readdir(dir)) {
        std::string name = entry->d_name;
        if (name != "." && name != "..") {
            names.push_back(std::move(name));
        }
        errno = 0;
    }
    int readErr = errno;
    ::closedir(dir);
    if (readErr != 0) {
        return makeOsError(readErr, path);
    }
    std::sort(names.begin(), names.end());
    return success();
}

FileErrorInfo LocalFilePrimitives::link(const std::string& existing, const std::string& newPath) {
    if (::link(existing.c_str(), newPath.c_str()) != 0) {
        int saved = errno;
        return makeOsError(saved, saved == ENOENT ? existing : newPath);
    }
    return success();
}

FileErrorInfo LocalFilePrimitives::symlink(const std::string& target, const std::string& linkPath) {
    if (::symlink(target.c_str(), linkPath.c_str()) != 0) {
        return lastError(linkPath);
    }
    return success();
}

FileErrorInfo LocalFilePrimitives::readLink(const std::string& path, std::string& target) {
    std::vector<char> buffer(256);
    for (;;) {
        ssize_t n = ::readlink(path.c_str(), buffer.data(), buffer.size());
        if (n < 0) {
            return lastError(path);
        }
        if (static_cast<size_t>(n) < buffer.size()) {
            target.assign(buffer.data(), static_cast<size_t>(n));
            return success();
        }
        // Possibly truncated, grow and retry
        buffer.resize(buffer.size() * 2);
    }
}

FileErrorInfo LocalFilePrimitives::chmod(const std::string& path, uint32_t mode) {
    if (::chmod(path.c_str(), static_cast<mode_t>(mode)) != 0) {
        return lastError(path);
    }
    return success();
}

FileErrorInfo LocalFilePrimitives::utimes(const std::string& path,
                                          std::chrono::system_clock::time_point accessed,
                                          std::chrono::system_clock::time_point modified) {
    timespec times[2] = {toTimespec(accessed), toTimespec(modified)};
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        return lastError(path);
    }
    return success();
}

} // namespace Steadfast::Core::IO
