/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Steadfast Core project.
 */
#include "ResilientFileSystem.h"
#include <filesystem>
#include <format>
#include <thread>
#include <unistd.h>
#include "../Logging/Logger.h"
#include "LocalFilePrimitives.h"
#include "SelfCopyGuard.h"

namespace Steadfast::Core::IO {

using Concurrency::ScheduleResult;

ResilientFileSystem::ResilientFileSystem(Concurrency::WorkContractGroup* group, Config cfg, Dependencies deps)
    : _group(group)
    , _cfg(std::move(cfg))
    , _primitives(std::move(deps.primitives))
    , _prompt(std::move(deps.prompt))
    , _elevation(std::move(deps.elevation)) {
    if (!_primitives) _primitives = std::make_shared<LocalFilePrimitives>();
    if (!_prompt) _prompt = std::make_shared<NonInteractivePrompt>();
    if (!_elevation) _elevation = std::make_shared<ElevationService>();
}

// Submit helper
FileOperationHandle ResilientFileSystem::submit(ErrorContext ctx, std::string path,
                                                std::function<void(OpState&, const ErrorContext&)> body) const {
    auto st = std::make_shared<OpState>();

    if (!_group) {
        FileErrorInfo err;
        err.code = FileError::IOError;
        err.message = "No work group to run the operation";
        err.path = path;
        finish(*st, std::move(err), ctx);
        return FileOperationHandle{std::move(st)};
    }

    auto work = [this, st, ctx, p = path, body = std::move(body)]() {
        st->st.store(FileOpStatus::Running, std::memory_order_release);
        try {
            body(*st, ctx);
        } catch (const std::filesystem::filesystem_error& fe) {
            if (!st->isComplete.load(std::memory_order_acquire)) {
                finish(*st, makeOsError(fe.code(), p, fe.what()), ctx);
            }
        } catch (const std::exception& e) {
            if (!st->isComplete.load(std::memory_order_acquire)) {
                FileErrorInfo err;
                err.code = FileError::Unknown;
                err.message = e.what();
                err.path = p;
                finish(*st, std::move(err), ctx);
            }
        } catch (...) {
            if (!st->isComplete.load(std::memory_order_acquire)) {
                FileErrorInfo err;
                err.code = FileError::Unknown;
                err.message = "Unknown error occurred during file operation";
                err.path = p;
                finish(*st, std::move(err), ctx);
            }
        }
        // A body that returns without completing counts as success
        if (!st->isComplete.load(std::memory_order_acquire)) {
            st->complete(FileOpStatus::Complete);
        }
    };

    auto handle = _group->createContract(std::move(work));
    // wait() may run this operation itself, but never another operation's contract
    st->progress = [grp = _group, handle]() { grp->executeContract(handle); };
    if (!handle.valid() || handle.schedule() != ScheduleResult::Scheduled) {
        handle.release();
        FileErrorInfo err;
        err.code = FileError::IOError;
        err.message = "Work group '" + _group->name() + "' refused the operation";
        err.path = std::move(path);
        finish(*st, std::move(err), ctx);
    }
    return FileOperationHandle{std::move(st)};
}

FileOperationHandle ResilientFileSystem::run(OperationSpec spec, std::source_location loc, Primitive primitive) const {
    ErrorContext ctx(operationKindName(spec.kind), loc);
    std::string path = spec.path;
    return submit(std::move(ctx), std::move(path),
        [this, spec = std::move(spec), primitive = std::move(primitive)](OpState& s, const ErrorContext& c) {
            finish(s, runWithRecovery(spec, s, primitive), c);
        });
}

FileErrorInfo ResilientFileSystem::runWithRecovery(const OperationSpec& spec, OpState& state,
                                                   const Primitive& primitive) const {
    ClassifyContext cctx;
    cctx.rmdirBudget.maxAttempts = _cfg.rmdirMaxAttempts;
    cctx.rmdirBudget.delay = _cfg.rmdirRetryDelay;
    uint32_t unattendedRetries = 0;

    for (uint32_t attempt = 1;; ++attempt) {
        state.attempts.fetch_add(1, std::memory_order_relaxed);
        FileErrorInfo err = primitive(state);
        if (err.ok()) {
            return err;
        }
        if (err.path.empty()) {
            err.path = spec.path;
        }

        cctx.attempt = attempt;
        cctx.destinationIsDirectory = false;
        if (spec.kind == OperationKind::Rename && err.code == FileError::AccessDenied) {
            FileMetadata dst;
            auto statErr = _primitives->stat(spec.destination, dst);
            cctx.destinationIsDirectory = statErr.ok() && dst.isDirectory;
        }

        const RecoveryDecision decision = classify(err, spec.kind, cctx);
        STEADFAST_LOG_DEBUG_CAT("ResilientFileSystem",
            std::format("{} '{}' attempt {}: {} -> {}", operationKindName(spec.kind), err.path, attempt,
                        fileErrorToString(err.code), recoveryActionName(decision.action)));

        switch (decision.action) {
            case RecoveryDecision::Action::Ignore:
                return {};

            case RecoveryDecision::Action::Fail:
                return err;

            case RecoveryDecision::Action::RetryAfterDelay:
                std::this_thread::sleep_for(decision.delay);
                continue;

            case RecoveryDecision::Action::RetryAfterElevation: {
                auto elevationErr = elevateFor(spec.grantAction, err.path);
                if (!elevationErr.ok()) return elevationErr;
                continue;
            }

            case RecoveryDecision::Action::RetryAfterUserChoice:
                break;
        }

        // Nobody can answer: retry a bounded number of times, then report the original error
        const bool interactive = _prompt->isInteractive();
        if (!interactive && unattendedRetries >= _cfg.unattendedRetryLimit) {
            return err;
        }

        bool canceled = false;
        if (decision.prompt == PromptKind::Busy) {
            canceled = _prompt->confirmBusyRetry(err.path) == BusyChoice::Cancel;
        } else {
            auto choice = _prompt->confirmAccessDenied(err.path);
            if (choice == AccessDeniedChoice::Cancel) {
                canceled = true;
            } else if (choice == AccessDeniedChoice::GrantPermission) {
                auto elevationErr = elevateFor(spec.grantAction, err.path);
                if (!elevationErr.ok()) return elevationErr;
            }
        }

        if (canceled) {
            FileErrorInfo cancel;
            cancel.code = FileError::UserCanceled;
            cancel.message = "Canceled by user after: " + err.message;
            cancel.systemError = err.systemError;
            cancel.path = err.path;
            return cancel;
        }

        if (!interactive) {
            ++unattendedRetries;
            std::this_thread::sleep_for(_cfg.unattendedRetryDelay);
        }
    }
}

std::string ResilientFileSystem::grantTargetFor(const std::string& failingPath) const {
    FileMetadata meta;
    auto err = _primitives->lstat(failingPath, meta);
    if (err.code == FileError::FileNotFound) {
        auto parent = std::filesystem::path(failingPath).parent_path();
        if (!parent.empty()) return parent.string();
    }
    return failingPath;
}

FileErrorInfo ResilientFileSystem::elevateFor(ElevationAction action, const std::string& failingPath) const {
    ElevationRequest request;
    request.action = action;
    request.path = action == ElevationAction::GrantAccess ? grantTargetFor(failingPath) : failingPath;
    request.userId = static_cast<uint32_t>(::getuid());

    ElevationOutcome outcome = _elevation->elevate(request);
    return outcome.error;
}

void ResilientFileSystem::finish(OpState& state, FileErrorInfo error, const ErrorContext& ctx) const {
    if (error.ok()) {
        state.complete(FileOpStatus::Complete);
        return;
    }
    ctx.enrich(error);
    STEADFAST_LOG_WARNING_CAT("ResilientFileSystem", error.trace);
    const bool canceled = error.code == FileError::UserCanceled || error.code == FileError::ElevationRejected;
    state.setError(std::move(error));
    state.complete(canceled ? FileOpStatus::Canceled : FileOpStatus::Failed);
}

FileOperationHandle ResilientFileSystem::stat(std::string path, std::source_location loc) const {
    OperationSpec spec{OperationKind::Stat, path};
    return run(std::move(spec), loc, [this, path](OpState& s) {
        FileMetadata meta;
        auto err = _primitives->stat(path, meta);
        if (err.ok()) s.metadata = std::move(meta);
        return err;
    });
}

FileOperationHandle ResilientFileSystem::lstat(std::string path, std::source_location loc) const {
    OperationSpec spec{OperationKind::Lstat, path};
    return run(std::move(spec), loc, [this, path](OpState& s) {
        FileMetadata meta;
        auto err = _primitives->lstat(path, meta);
        if (err.ok()) s.metadata = std::move(meta);
        return err;
    });
}

FileOperationHandle ResilientFileSystem::readFile(std::string path, std::source_location loc) const {
    OperationSpec spec{OperationKind::ReadFile, path};
    return run(std::move(spec), loc, [this, path](OpState& s) {
        s.bytes.clear();
        return _primitives->readFile(path, s.bytes);
    });
}

FileOperationHandle ResilientFileSystem::writeFile(std::string path, std::span<const std::byte> data,
                                                   WriteOptions options, std::source_location loc) const {
    auto owned = std::make_shared<std::vector<std::byte>>(data.begin(), data.end());
    OperationSpec spec{OperationKind::WriteFile, path};
    return run(std::move(spec), loc, [this, path, owned, options](OpState& s) {
        s.wrote = 0;
        return _primitives->writeFile(path, std::span<const std::byte>(owned->data(), owned->size()),
                                      options, s.wrote);
    });
}

FileOperationHandle ResilientFileSystem::writeFile(std::string path, std::string_view text,
                                                   WriteOptions options, std::source_location loc) const {
    auto bytes = std::as_bytes(std::span<const char>(text.data(), text.size()));
    return writeFile(std::move(path), bytes, options, loc);
}

FileOperationHandle ResilientFileSystem::copy(std::string src, std::string dst, CopyOptions options,
                                              std::source_location loc) const {
    ErrorContext ctx(operationKindName(OperationKind::Copy), loc);
    OperationSpec spec{OperationKind::Copy, src, dst};
    return submit(std::move(ctx), src,
        [this, spec = std::move(spec), options](OpState& s, const ErrorContext& c) {
            if (!options.skipSelfCopyCheck) {
                auto guard = checkNotSelfCopy(*_primitives, spec.path, spec.destination);
                if (!guard.ok()) {
                    finish(s, std::move(guard), c);
                    return;
                }
            }
            auto err = runWithRecovery(spec, s, [this, &spec, options](OpState&) {
                return _primitives->copyFile(spec.path, spec.destination, options);
            });
            finish(s, std::move(err), c);
        });
}

FileOperationHandle ResilientFileSystem::move(std::string src, std::string dst, bool overwriteExisting,
                                              std::source_location loc) const {
    OperationSpec spec{OperationKind::Move, src, dst};
    return run(std::move(spec), loc, [this, src, dst, overwriteExisting](OpState&) {
        return _primitives->move(src, dst, overwriteExisting);
    });
}

FileOperationHandle ResilientFileSystem::rename(std::string src, std::string dst, std::source_location loc) const {
    OperationSpec spec{OperationKind::Rename, src, dst};
    return run(std::move(spec), loc, [this, src, dst](OpState&) {
        return _primitives->rename(src, dst);
    });
}

FileOperationHandle ResilientFileSystem::remove(std::string path, std::source_location loc) const {
    OperationSpec spec{OperationKind::Remove, path};
    return run(std::move(spec), loc, [this, path](OpState&) {
        return _primitives->removeAll(path);
    });
}

FileOperationHandle ResilientFileSystem::unlink(std::string path, std::source_location loc) const {
    OperationSpec spec{OperationKind::Unlink, path};
    return run(std::move(spec), loc, [this, path](OpState&) {
        return _primitives->unlink(path);
    });
}

FileOperationHandle ResilientFileSystem::rmdir(std::string path, std::source_location loc) const {
    OperationSpec spec{OperationKind::Rmdir, path};
    return run(std::move(spec), loc, [this, path](OpState&) {
        return _primitives->rmdir(path);
    });
}

FileOperationHandle ResilientFileSystem::mkdir(std::string path, uint32_t mode, std::source_location loc) const {
    OperationSpec spec{OperationKind::Mkdir, path};
    return run(std::move(spec), loc, [this, path, mode](OpState&) {
        return _primitives->mkdir(path, mode);
    });
}

FileOperationHandle ResilientFileSystem::ensureDir(std::string path, std::source_location loc) const {
    OperationSpec spec{OperationKind::EnsureDir, path};
    return run(std::move(spec), loc, [this, path](OpState&) {
        return _primitives->createDirectories(path);
    });
}

FileOperationHandle ResilientFileSystem::ensureDirWritable(std::string path, std::source_location loc) const {
    OperationSpec spec{OperationKind::EnsureDirWritable, path, {}, ElevationAction::EnsureDirectory};
    std::string canary = (std::filesystem::path(path) / _cfg.canaryName).string();
    return run(std::move(spec), loc, [this, path, canary](OpState&) {
        auto err = _primitives->createDirectories(path);
        if (!err.ok()) return err;

        uint64_t written = 0;
        err = _primitives->writeFile(canary, {}, WriteOptions{}, written);
        if (!err.ok()) {
            // Grant and retry against the directory, not the probe
            if (err.path == canary) err.path = path;
            return err;
        }

        err = _primitives->unlink(canary);
        if (err.code == FileError::FileNotFound) return FileErrorInfo{};
        return err;
    });
}

FileOperationHandle ResilientFileSystem::readDir(std::string path, std::source_location loc) const {
    OperationSpec spec{OperationKind::ReadDir, path};
    return run(std::move(spec), loc, [this, path](OpState& s) {
        s.directoryEntries.clear();
        return _primitives->readDirectory(path, s.directoryEntries);
    });
}

FileOperationHandle ResilientFileSystem::link(std::string existing, std::string newPath,
                                              std::source_location loc) const {
    OperationSpec spec{OperationKind::Link, existing, newPath};
    return run(std::move(spec), loc, [this, existing, newPath](OpState&) {
        return _primitives->link(existing, newPath);
    });
}

FileOperationHandle ResilientFileSystem::symlink(std::string target, std::string linkPath,
                                                 std::source_location loc) const {
    OperationSpec spec{OperationKind::Symlink, linkPath, target};
    return run(std::move(spec), loc, [this, target, linkPath](OpState&) {
        return _primitives->symlink(target, linkPath);
    });
}

FileOperationHandle ResilientFileSystem::readLink(std::string path, std::source_location loc) const {
    OperationSpec spec{OperationKind::ReadLink, path};
    return run(std::move(spec), loc, [this, path](OpState& s) {
        s.text.clear();
        return _primitives->readLink(path, s.text);
    });
}

FileOperationHandle ResilientFileSystem::chmod(std::string path, uint32_t mode, std::source_location loc) const {
    OperationSpec spec{OperationKind::Chmod, path};
    return run(std::move(spec), loc, [this, path, mode](OpState&) {
        return _primitives->chmod(path, mode);
    });
}

FileOperationHandle ResilientFileSystem::utimes(std::string path,
                                                std::chrono::system_clock::time_point accessed,
                                                std::chrono::system_clock::time_point modified,
                                                std::source_location loc) const {
    OperationSpec spec{OperationKind::Utimes, path};
    return run(std::move(spec), loc, [this, path, accessed, modified](OpState&) {
        return _primitives->utimes(path, accessed, modified);
    });
}

} // namespace Steadfast::Core::IO
