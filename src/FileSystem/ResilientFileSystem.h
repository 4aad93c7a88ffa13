/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */

/**
 * @file ResilientFileSystem.h
 * @brief File operations that survive transient locking and missing privileges
 *
 * ResilientFileSystem is the only surface application code should use to touch the disk.
 * Each operation runs asynchronously on a WorkContractGroup and wraps one primitive in a
 * recovery loop:
 *
 *   invoke primitive -> classify failure -> ignore | delay | prompt | elevate -> invoke again
 *
 * Deletes are idempotent, mkdir/ensureDir tolerate spurious EEXIST, rmdir retries a fixed
 * number of times on contention, and busy/protected paths are handed to the injected
 * IRecoveryPrompt. Failures that leave the layer keep their original code and carry the
 * call site captured when the operation was invoked.
 *
 * @code
 * WorkService service(WorkService::Config{});
 * WorkContractGroup group(256, "io");
 * service.addWorkContractGroup(&group);
 * service.start();
 *
 * ResilientFileSystem fs(&group);
 * auto h = fs.rename("settings.json.tmp", "settings.json");
 * h.wait();
 * if (!h.succeeded()) std::cerr << h.errorInfo().trace << "\n";
 * @endcode
 *
 * The file system must outlive every operation it has issued.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include "../Concurrency/WorkContractGroup.h"
#include "ElevationMessages.h"
#include "ElevationProtocol.h"
#include "ErrorClassifier.h"
#include "ErrorContext.h"
#include "FileOperationHandle.h"
#include "IFilePrimitives.h"
#include "RecoveryPrompts.h"

namespace Steadfast::Core::IO {

class ResilientFileSystem {
public:
    struct Config {
        uint32_t rmdirMaxAttempts;                       // total rmdir invocations under contention
        std::chrono::milliseconds rmdirRetryDelay;       // spacing between rmdir invocations
        uint32_t unattendedRetryLimit;                   // retries granted by a non-interactive prompt
        std::chrono::milliseconds unattendedRetryDelay;  // spacing between unattended retries
        std::string canaryName;                          // probe file used by ensureDirWritable

        Config()
            : rmdirMaxAttempts(3)
            , rmdirRetryDelay(std::chrono::milliseconds(100))
            , unattendedRetryLimit(3)
            , unattendedRetryDelay(std::chrono::milliseconds(100))
            , canaryName("__steadfast_canary") {}
    };

    /**
     * @brief Collaborators; null members fall back to LocalFilePrimitives, NonInteractivePrompt
     *        and an ElevationService using pkexec
     */
    struct Dependencies {
        std::shared_ptr<IFilePrimitives> primitives;
        std::shared_ptr<IRecoveryPrompt> prompt;
        std::shared_ptr<IElevationService> elevation;
    };

    explicit ResilientFileSystem(Concurrency::WorkContractGroup* group, Config cfg = {}, Dependencies deps = {});

    // Metadata
    FileOperationHandle stat(std::string path, std::source_location loc = std::source_location::current()) const;
    FileOperationHandle lstat(std::string path, std::source_location loc = std::source_location::current()) const;

    // Contents
    FileOperationHandle readFile(std::string path, std::source_location loc = std::source_location::current()) const;
    /**
     * @brief Writes bytes to a file; the data is copied before the call returns
     */
    FileOperationHandle writeFile(std::string path, std::span<const std::byte> data, WriteOptions options = {},
                                  std::source_location loc = std::source_location::current()) const;
    FileOperationHandle writeFile(std::string path, std::string_view text, WriteOptions options = {},
                                  std::source_location loc = std::source_location::current()) const;

    /**
     * @brief Copies src to dst after making sure both are not the same file
     *
     * Fails with FileError::SameFile without touching either file when src and dst share a
     * device and inode, unless options.skipSelfCopyCheck is set.
     */
    FileOperationHandle copy(std::string src, std::string dst, CopyOptions options = {},
                             std::source_location loc = std::source_location::current()) const;
    FileOperationHandle move(std::string src, std::string dst, bool overwriteExisting = true,
                             std::source_location loc = std::source_location::current()) const;
    /**
     * @brief Renames src to dst
     * @note AccessDenied onto an existing directory fails immediately instead of prompting
     */
    FileOperationHandle rename(std::string src, std::string dst,
                               std::source_location loc = std::source_location::current()) const;

    // Removal; a missing target counts as success
    FileOperationHandle remove(std::string path, std::source_location loc = std::source_location::current()) const;
    FileOperationHandle unlink(std::string path, std::source_location loc = std::source_location::current()) const;
    /**
     * @brief Removes an empty directory, retrying on contention
     *
     * Busy, AccessDenied and unrecognised errors are retried without prompting up to
     * Config::rmdirMaxAttempts invocations, Config::rmdirRetryDelay apart.
     */
    FileOperationHandle rmdir(std::string path, std::source_location loc = std::source_location::current()) const;

    // Directories; an existing directory counts as success
    FileOperationHandle mkdir(std::string path, uint32_t mode = 0755,
                              std::source_location loc = std::source_location::current()) const;
    FileOperationHandle ensureDir(std::string path, std::source_location loc = std::source_location::current()) const;
    /**
     * @brief Creates the directory if needed and proves it is writable with a canary file
     *
     * Granting permission here runs an elevated EnsureDirectory action for the directory.
     */
    FileOperationHandle ensureDirWritable(std::string path, std::source_location loc = std::source_location::current()) const;
    FileOperationHandle readDir(std::string path, std::source_location loc = std::source_location::current()) const;

    // Links
    FileOperationHandle link(std::string existing, std::string newPath,
                             std::source_location loc = std::source_location::current()) const;
    FileOperationHandle symlink(std::string target, std::string linkPath,
                                std::source_location loc = std::source_location::current()) const;
    FileOperationHandle readLink(std::string path, std::source_location loc = std::source_location::current()) const;

    // Attributes
    FileOperationHandle chmod(std::string path, uint32_t mode,
                              std::source_location loc = std::source_location::current()) const;
    FileOperationHandle utimes(std::string path,
                               std::chrono::system_clock::time_point accessed,
                               std::chrono::system_clock::time_point modified,
                               std::source_location loc = std::source_location::current()) const;

    const Config& config() const noexcept { return _cfg; }
    IFilePrimitives& primitives() const noexcept { return *_primitives; }
    IRecoveryPrompt& prompt() const noexcept { return *_prompt; }
    IElevationService& elevation() const noexcept { return *_elevation; }

private:
    using OpState = FileOperationHandle::OpState;
    using Primitive = std::function<FileErrorInfo(OpState&)>;

    struct OperationSpec {
        OperationKind kind;
        std::string path;                       // reported and prompted when the primitive gives none
        std::string destination;                // rename/move/copy/link target
        ElevationAction grantAction = ElevationAction::GrantAccess;
    };

    FileOperationHandle submit(ErrorContext ctx, std::string path,
                               std::function<void(OpState&, const ErrorContext&)> body) const;
    FileOperationHandle run(OperationSpec spec, std::source_location loc, Primitive primitive) const;

    // The recovery loop; returns the final outcome of the primitive (None when it succeeded or was tolerated)
    FileErrorInfo runWithRecovery(const OperationSpec& spec, OpState& state, const Primitive& primitive) const;
    FileErrorInfo elevateFor(ElevationAction action, const std::string& failingPath) const;
    std::string grantTargetFor(const std::string& failingPath) const;
    void finish(OpState& state, FileErrorInfo error, const ErrorContext& ctx) const;

    Concurrency::WorkContractGroup* _group;
    Config _cfg;
    std::shared_ptr<IFilePrimitives> _primitives;
    std::shared_ptr<IRecoveryPrompt> _prompt;
    std::shared_ptr<IElevationService> _elevation;
};

} // namespace Steadfast::Core::IO
