#include <gtest/gtest.h>
#include <atomic>
#include <cerrno>
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

#include "FSTestHelpers.h"
#include "FileSystem/ElevatedActions.h"
#include "FileSystem/ElevationChannel.h"
#include "FileSystem/ElevationProtocol.h"

using namespace Steadfast::Core::IO;
using steadfast::test_helpers::ScopedTempDir;
using steadfast::test_helpers::writeText;
namespace fs = std::filesystem;

namespace {

// Runs the "helper" on a thread inside the test process
class ThreadProcess : public IElevatedProcess {
public:
    explicit ThreadProcess(std::function<int()> body)
        : _thread([this, body = std::move(body)] {
              int code = body();
              std::lock_guard<std::mutex> lock(_mutex);
              _code = code;
          }) {}

    ~ThreadProcess() override {
        if (_thread.joinable()) _thread.join();
    }

    std::optional<int> tryWait() override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _code;
    }

    int wait() override {
        if (_thread.joinable()) _thread.join();
        std::lock_guard<std::mutex> lock(_mutex);
        return _code.value_or(-1);
    }

    void terminate() override {}

private:
    std::mutex _mutex;
    std::optional<int> _code;
    std::thread _thread;
};

class ThreadLauncher : public IElevationLauncher {
public:
    using Behavior = std::function<int(const std::string& channelPath)>;

    explicit ThreadLauncher(Behavior behavior, std::set<int> rejectionCodes = {})
        : _behavior(std::move(behavior)), _rejections(std::move(rejectionCodes)) {}

    std::unique_ptr<IElevatedProcess> launch(const std::string& channelPath, std::error_code& ec) override {
        ec.clear();
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _channels.push_back(channelPath);
        }
        return std::make_unique<ThreadProcess>([b = _behavior, channelPath] { return b(channelPath); });
    }

    bool isRejection(int exitCode) const override { return _rejections.count(exitCode) > 0; }
    std::string name() const override { return "thread"; }

    std::vector<std::string> channels() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _channels;
    }

private:
    Behavior _behavior;
    std::set<int> _rejections;
    mutable std::mutex _mutex;
    std::vector<std::string> _channels;
};

class FailingLauncher : public IElevationLauncher {
public:
    std::unique_ptr<IElevatedProcess> launch(const std::string&, std::error_code& ec) override {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return nullptr;
    }
    bool isRejection(int) const override { return false; }
    std::string name() const override { return "failing"; }
};

// Connects, answers one request with `handler`, exits 0
int serveOnce(const std::string& channel, const std::function<ElevationResponse(const ElevationRequest&)>& handler) {
    std::error_code ec;
    auto fd = connectChannel(channel, ec);
    if (!fd.valid()) return 3;
    try {
        MessageHeader header;
        std::string payload;
        if (!recvMessage(fd.get(), header, payload)) return 3;
        auto request = decodeRequest(payload);
        if (!request) return 3;
        sendMessage(fd.get(), ElevationMessageType::Response, encodeResponse(handler(*request)));
    } catch (const ChannelError&) {
        return 3;
    }
    return 0;
}

ElevationConfig testConfig(const ScopedTempDir& tmp) {
    ElevationConfig cfg;
    cfg.channelDirectory = tmp.path();
    cfg.pollInterval = std::chrono::milliseconds(10);
    return cfg;
}

ElevationRequest grantRequest(const std::string& path) {
    ElevationRequest req;
    req.action = ElevationAction::GrantAccess;
    req.path = path;
    req.userId = static_cast<uint32_t>(::getuid());
    return req;
}

// In-process stand-in for the helper: the channel owner is this process
ElevationResponse grantAsSelf(const ElevationRequest& request) {
    return executeElevatedRequest(request, static_cast<uint32_t>(::getuid()));
}

using S = ElevationState;

} // namespace

TEST(ElevationSession, HelperGrantCompletesSuccessfully) {
    ScopedTempDir tmp;
    auto file = tmp.join("locked.txt");
    writeText(file, "x");
    fs::permissions(file, fs::perms::owner_read, fs::perm_options::replace);

    ThreadLauncher launcher([](const std::string& ch) { return serveOnce(ch, grantAsSelf); });
    auto cfg = testConfig(tmp);
    ElevationSession session("abc123", grantRequest(file.string()), launcher, cfg);

    auto outcome = session.run();

    EXPECT_TRUE(outcome.succeeded()) << outcome.error.message;
    EXPECT_EQ(outcome.finalState, S::Completed);
    EXPECT_EQ(outcome.sessionId, "abc123");
    EXPECT_EQ(session.transitions(),
              (std::vector<S>{S::ChannelListening, S::ElevatedProcessRequested, S::Connected, S::Completed}));
    auto perms = fs::status(file).permissions();
    EXPECT_NE(perms & fs::perms::owner_write, fs::perms::none);
    EXPECT_FALSE(fs::exists(ChannelListener::pathFor(tmp.path(), "abc123")));
}

TEST(ElevationSession, HelperSeesSessionIdAndRequest) {
    ScopedTempDir tmp;
    std::mutex mutex;
    std::optional<ElevationRequest> seen;
    ThreadLauncher launcher([&](const std::string& ch) {
        return serveOnce(ch, [&](const ElevationRequest& r) {
            std::lock_guard<std::mutex> lock(mutex);
            seen = r;
            return ElevationResponse{true, 0, "ok"};
        });
    });
    auto cfg = testConfig(tmp);
    ElevationSession session("feedface", grantRequest("/some/where"), launcher, cfg);

    auto outcome = session.run();
    ASSERT_TRUE(outcome.succeeded());
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->sessionId, "feedface");
    EXPECT_EQ(seen->path, "/some/where");
    EXPECT_EQ(launcher.channels().at(0), ChannelListener::pathFor(tmp.path(), "feedface"));
}

TEST(ElevationSession, HelperReportedFailureKeepsOsError) {
    ScopedTempDir tmp;
    ThreadLauncher launcher([](const std::string& ch) {
        return serveOnce(ch, [](const ElevationRequest&) {
            return ElevationResponse{false, EPERM, "chown '/x': Operation not permitted"};
        });
    });
    auto cfg = testConfig(tmp);
    ElevationSession session("s1", grantRequest("/x"), launcher, cfg);

    auto outcome = session.run();

    EXPECT_EQ(outcome.finalState, S::Completed);
    EXPECT_EQ(outcome.error.code, FileError::AccessDenied);
    EXPECT_EQ(outcome.error.message, "chown '/x': Operation not permitted");
    EXPECT_EQ(outcome.error.path, "/x");
}

TEST(ElevationSession, OsRejectionBeforeConnectIsCanceled) {
    ScopedTempDir tmp;
    ThreadLauncher launcher([](const std::string&) { return 126; }, {126, 127});
    auto cfg = testConfig(tmp);
    ElevationSession session("s2", grantRequest("/x"), launcher, cfg);

    auto outcome = session.run();

    EXPECT_EQ(outcome.finalState, S::Canceled);
    EXPECT_EQ(outcome.error.code, FileError::ElevationRejected);
    EXPECT_EQ(session.transitions(),
              (std::vector<S>{S::ChannelListening, S::ElevatedProcessRequested, S::Canceled}));
}

TEST(ElevationSession, CleanExitWithoutConnectCountsAsSuccess) {
    ScopedTempDir tmp;
    ThreadLauncher launcher([](const std::string&) { return 0; });
    auto cfg = testConfig(tmp);
    ElevationSession session("s3", grantRequest("/x"), launcher, cfg);

    auto outcome = session.run();

    EXPECT_EQ(outcome.finalState, S::Disconnected);
    EXPECT_TRUE(outcome.succeeded());
}

TEST(ElevationSession, FailedExitWithoutConnectIsChannelError) {
    ScopedTempDir tmp;
    ThreadLauncher launcher([](const std::string&) { return 3; });
    auto cfg = testConfig(tmp);
    ElevationSession session("s4", grantRequest("/x"), launcher, cfg);

    auto outcome = session.run();

    EXPECT_EQ(outcome.finalState, S::Disconnected);
    EXPECT_EQ(outcome.error.code, FileError::ElevationChannelError);
    EXPECT_NE(outcome.error.message.find("code 3"), std::string::npos);
}

TEST(ElevationSession, HangUpAfterRequestFollowsExitCode) {
    ScopedTempDir tmp;
    auto hangUp = [](int exitCode) {
        return [exitCode](const std::string& ch) {
            std::error_code ec;
            auto fd = connectChannel(ch, ec);
            if (!fd.valid()) return 99;
            MessageHeader header;
            std::string payload;
            try {
                recvMessage(fd.get(), header, payload);
            } catch (const ChannelError&) {
                return 98;
            }
            return exitCode;
        };
    };
    auto cfg = testConfig(tmp);

    ThreadLauncher clean(hangUp(0));
    ElevationSession cleanSession("s5", grantRequest("/x"), clean, cfg);
    auto cleanOutcome = cleanSession.run();
    EXPECT_EQ(cleanOutcome.finalState, S::Disconnected);
    EXPECT_TRUE(cleanOutcome.succeeded());
    EXPECT_EQ(cleanSession.transitions(),
              (std::vector<S>{S::ChannelListening, S::ElevatedProcessRequested, S::Connected, S::Disconnected}));

    ThreadLauncher dirty(hangUp(4));
    ElevationSession dirtySession("s6", grantRequest("/x"), dirty, cfg);
    auto dirtyOutcome = dirtySession.run();
    EXPECT_EQ(dirtyOutcome.finalState, S::Disconnected);
    EXPECT_EQ(dirtyOutcome.error.code, FileError::ElevationChannelError);
}

TEST(ElevationSession, GarbageReplyIsChannelError) {
    ScopedTempDir tmp;
    ThreadLauncher launcher([](const std::string& ch) {
        std::error_code ec;
        auto fd = connectChannel(ch, ec);
        if (!fd.valid()) return 99;
        try {
            MessageHeader header;
            std::string payload;
            recvMessage(fd.get(), header, payload);
            const std::string junk(kElevationHeaderSize, 'z');
            sendAll(fd.get(), junk.data(), junk.size());
        } catch (const ChannelError&) {
            return 98;
        }
        return 0;
    });
    auto cfg = testConfig(tmp);
    ElevationSession session("s7", grantRequest("/x"), launcher, cfg);

    auto outcome = session.run();

    EXPECT_EQ(outcome.finalState, S::Disconnected);
    EXPECT_EQ(outcome.error.code, FileError::ElevationChannelError);
}

TEST(ElevationSession, LaunchFailureIsChannelError) {
    ScopedTempDir tmp;
    FailingLauncher launcher;
    auto cfg = testConfig(tmp);
    ElevationSession session("s8", grantRequest("/x"), launcher, cfg);

    auto outcome = session.run();

    EXPECT_EQ(outcome.error.code, FileError::ElevationChannelError);
    EXPECT_EQ(session.transitions(), (std::vector<S>{S::ChannelListening, S::Disconnected}));
    EXPECT_FALSE(fs::exists(ChannelListener::pathFor(tmp.path(), "s8")));
}

TEST(ElevationSession, ConnectTimeoutGivesUp) {
    ScopedTempDir tmp;
    ThreadLauncher launcher([](const std::string&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return 0;
    });
    auto cfg = testConfig(tmp);
    cfg.connectTimeout = std::chrono::milliseconds(50);
    ElevationSession session("s9", grantRequest("/x"), launcher, cfg);

    auto outcome = session.run();

    EXPECT_EQ(outcome.finalState, S::Disconnected);
    EXPECT_EQ(outcome.error.code, FileError::ElevationChannelError);
    EXPECT_NE(outcome.error.message.find("did not connect"), std::string::npos);
}

TEST(ElevationService, ConcurrentSessionsUseDistinctChannels) {
    ScopedTempDir tmp;
    std::mutex mutex;
    std::vector<std::string> sessionIds;
    auto launcher = std::make_shared<ThreadLauncher>([&](const std::string& ch) {
        return serveOnce(ch, [&](const ElevationRequest& r) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            std::lock_guard<std::mutex> lock(mutex);
            sessionIds.push_back(r.sessionId);
            return ElevationResponse{true, 0, "ok"};
        });
    });
    ElevationService service(testConfig(tmp), launcher);

    std::vector<std::thread> callers;
    std::atomic<int> succeeded{0};
    for (int i = 0; i < 6; ++i) {
        callers.emplace_back([&service, &succeeded, i] {
            auto outcome = service.elevate(grantRequest("/path/" + std::to_string(i)));
            if (outcome.succeeded()) succeeded.fetch_add(1);
        });
    }
    for (auto& t : callers) t.join();

    EXPECT_EQ(succeeded.load(), 6);
    EXPECT_EQ(service.activeSessionCount(), 0u);
    auto channels = launcher->channels();
    EXPECT_EQ(std::set<std::string>(channels.begin(), channels.end()).size(), 6u);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(std::set<std::string>(sessionIds.begin(), sessionIds.end()).size(), 6u);
}

TEST(ElevationService, SessionIdsAreHex) {
    auto id = ElevationService::generateSessionId();
    ASSERT_EQ(id.size(), 16u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(id, ElevationService::generateSessionId());
}

TEST(ElevationLaunchers, PkexecDismissalCodesAreRejections) {
    PkexecLauncher pkexec("/usr/libexec/steadfast-elevated");
    EXPECT_TRUE(pkexec.isRejection(126));
    EXPECT_TRUE(pkexec.isRejection(127));
    EXPECT_FALSE(pkexec.isRejection(0));
    EXPECT_FALSE(pkexec.isRejection(3));
    EXPECT_EQ(pkexec.name(), "pkexec");

    ProcessLauncher plain("/usr/libexec/steadfast-elevated");
    EXPECT_FALSE(plain.isRejection(126));
}

TEST(ElevationLaunchers, MissingExecutableFailsToLaunch) {
    ScopedTempDir tmp;
    ProcessLauncher launcher(tmp.join("no-such-helper").string());
    std::error_code ec;
    auto process = launcher.launch(tmp.join("unused.sock").string(), ec);
    EXPECT_TRUE(process == nullptr);
    EXPECT_EQ(ec.value(), ENOENT);
}

TEST(ElevationLaunchers, PkexecWithUnusableHelperIsAChannelErrorNotARejection) {
    ScopedTempDir tmp;
    auto notExecutable = tmp.join("helper.txt");
    writeText(notExecutable, "#!/bin/sh\n");
    fs::permissions(notExecutable, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);

    for (const auto& helper : {tmp.join("no-such-helper").string(), notExecutable.string()}) {
        auto launcher = std::make_shared<PkexecLauncher>(helper);
        std::error_code ec;
        auto process = launcher->launch(tmp.join("unused.sock").string(), ec);
        EXPECT_TRUE(process == nullptr) << helper;
        EXPECT_EQ(ec, std::make_error_code(std::errc::no_such_file_or_directory)) << helper;

        ElevationService service(testConfig(tmp), launcher);
        auto outcome = service.elevate(grantRequest(tmp.join("target.txt").string()));
        EXPECT_FALSE(outcome.succeeded());
        EXPECT_EQ(outcome.error.code, FileError::ElevationChannelError) << helper;
    }
}

TEST(ElevationLaunchers, ResolveExecutableChecksPathAndPermissions) {
    ScopedTempDir tmp;
    auto script = tmp.join("tool.sh");
    writeText(script, "#!/bin/sh\n");
    fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);

    EXPECT_EQ(resolveExecutable(script.string()), script.string());
    EXPECT_FALSE(resolveExecutable(tmp.join("absent").string()).has_value());
    EXPECT_FALSE(resolveExecutable(tmp.path().string()).has_value());
    EXPECT_FALSE(resolveExecutable("").has_value());

    auto sh = resolveExecutable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(fs::path(*sh).is_absolute());
}

TEST(ElevatedActions, GrantUsesTheVerifiedUserNotTheClaimedOne) {
    ScopedTempDir tmp;
    auto file = tmp.join("claimed.txt");
    writeText(file, "x");
    fs::permissions(file, fs::perms::owner_read, fs::perm_options::replace);

    auto req = grantRequest(file.string());
    req.userId = static_cast<uint32_t>(::getuid()) + 4242;
    auto response = executeElevatedRequest(req, static_cast<uint32_t>(::getuid()));

    EXPECT_TRUE(response.success) << response.message;
    struct stat st{};
    ASSERT_EQ(::stat(file.c_str(), &st), 0);
    EXPECT_EQ(st.st_uid, ::getuid());
    EXPECT_NE(fs::status(file).permissions() & fs::perms::owner_write, fs::perms::none);
}

TEST(ElevatedActions, RefusesSymbolicLinks) {
    ScopedTempDir tmp;
    auto target = tmp.join("real.txt");
    auto link = tmp.join("link.txt");
    writeText(target, "x");
    fs::permissions(target, fs::perms::owner_read, fs::perm_options::replace);
    fs::create_symlink(target, link);

    auto response = executeElevatedRequest(grantRequest(link.string()), static_cast<uint32_t>(::getuid()));

    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.errorNumber, ELOOP);
    EXPECT_EQ(fs::status(target).permissions() & fs::perms::all, fs::perms::owner_read);
}

TEST(ElevationChannel, PeerUserIdReportsTheConnectedProcess) {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    UniqueFd a(fds[0]);
    UniqueFd b(fds[1]);

    std::error_code ec;
    auto uid = peerUserId(a.get(), ec);
    ASSERT_TRUE(uid.has_value()) << ec.message();
    EXPECT_EQ(*uid, static_cast<uint32_t>(::getuid()));

    EXPECT_FALSE(peerUserId(-1, ec).has_value());
    EXPECT_TRUE(ec);
}

#ifdef STEADFAST_ELEVATED_HELPER_PATH
TEST(ElevatedHelperProcess, RealHelperGrantsAccess) {
    ScopedTempDir tmp;
    auto file = tmp.join("locked.txt");
    writeText(file, "x");
    fs::permissions(file, fs::perms::owner_read, fs::perm_options::replace);

    ElevationService service(testConfig(tmp), std::make_shared<ProcessLauncher>(STEADFAST_ELEVATED_HELPER_PATH));
    auto outcome = service.elevate(grantRequest(file.string()));

    EXPECT_TRUE(outcome.succeeded()) << outcome.error.message;
    EXPECT_EQ(outcome.finalState, S::Completed);
    EXPECT_NE(fs::status(file).permissions() & fs::perms::owner_write, fs::perms::none);
}

TEST(ElevatedHelperProcess, RealHelperCreatesDirectory) {
    ScopedTempDir tmp;
    auto dir = tmp.join("made/by/helper");

    ElevationService service(testConfig(tmp), std::make_shared<ProcessLauncher>(STEADFAST_ELEVATED_HELPER_PATH));
    ElevationRequest req = grantRequest(dir.string());
    req.action = ElevationAction::EnsureDirectory;
    auto outcome = service.elevate(req);

    EXPECT_TRUE(outcome.succeeded()) << outcome.error.message;
    EXPECT_TRUE(fs::is_directory(dir));
}

TEST(ElevatedHelperProcess, RealHelperIgnoresClaimedUserId) {
    ScopedTempDir tmp;
    auto file = tmp.join("claimed.txt");
    writeText(file, "x");
    fs::permissions(file, fs::perms::owner_read, fs::perm_options::replace);

    auto req = grantRequest(file.string());
    req.userId = static_cast<uint32_t>(::getuid()) + 4242;
    ElevationService service(testConfig(tmp), std::make_shared<ProcessLauncher>(STEADFAST_ELEVATED_HELPER_PATH));
    auto outcome = service.elevate(req);

    EXPECT_TRUE(outcome.succeeded()) << outcome.error.message;
    struct stat st{};
    ASSERT_EQ(::stat(file.c_str(), &st), 0);
    EXPECT_EQ(st.st_uid, ::getuid());
}

TEST(ElevatedHelperProcess, HelperReportsMissingTarget) {
    ScopedTempDir tmp;
    ElevationService service(testConfig(tmp), std::make_shared<ProcessLauncher>(STEADFAST_ELEVATED_HELPER_PATH));
    auto outcome = service.elevate(grantRequest(tmp.join("gone/deeper/file.txt").string()));

    EXPECT_EQ(outcome.finalState, S::Completed);
    EXPECT_EQ(outcome.error.code, FileError::FileNotFound);
}
#endif
