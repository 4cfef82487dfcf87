// Integration test for Connection over the real libssh2 transport against a
// test SFTP server. The test is skipped (exit code 77) unless the required
// ASYNC_SFTP_IT_* env vars exist.
#include "asyncsftp/Connection.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace asyncsftp;

namespace {

constexpr int kSkipExitCode = 77;
constexpr auto kOperationTimeout = std::chrono::seconds(60);

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

// Turns one asynchronous call into a blocking one for the test's main flow.
struct Waiter {
    std::promise<void> done;
    std::optional<Error> error;
    std::vector<RemoteEntry> entries;
    RemoteEntry entry;

    SuccessCB onDone() {
        return [this] { done.set_value(); };
    }
    FailureCB onError() {
        return [this](const Error &e) {
            error = e;
            done.set_value();
        };
    }
    ListSuccessCB onList() {
        return [this](const std::vector<RemoteEntry> &v) {
            entries = v;
            done.set_value();
        };
    }
    EntrySuccessCB onEntry() {
        return [this](const RemoteEntry &e) {
            entry = e;
            done.set_value();
        };
    }
    TransferSuccessCB onTransfer() {
        return [this](const RemoteEntry &e, Clock::time_point,
                      Clock::time_point) {
            entry = e;
            done.set_value();
        };
    }

    // false on failure or timeout; err holds the reason
    bool wait(std::string &err) {
        if (done.get_future().wait_for(kOperationTimeout) !=
            std::future_status::ready) {
            err = "timed out";
            return false;
        }
        if (error) {
            err = error->describe();
            return false;
        }
        return true;
    }
};

bool listContainsName(const std::vector<RemoteEntry> &entries,
                      const std::string &name) {
    return std::any_of(
        entries.begin(), entries.end(),
        [&name](const RemoteEntry &e) { return e.name() == name; });
}

} // namespace

int main() {
    const auto host = envValue("ASYNC_SFTP_IT_SFTP_HOST");
    const auto user = envValue("ASYNC_SFTP_IT_SFTP_USER");
    const auto pass = envValue("ASYNC_SFTP_IT_SFTP_PASS");
    const std::string remoteBase =
        envValue("ASYNC_SFTP_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() || !pass.has_value()) {
        std::cout << "[SKIP] asyncsftp_sftp_integration_tests requires env "
                     "vars: ASYNC_SFTP_IT_SFTP_HOST, ASYNC_SFTP_IT_SFTP_USER "
                     "and ASYNC_SFTP_IT_SFTP_PASS\n";
        return kSkipExitCode;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("ASYNC_SFTP_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] ASYNC_SFTP_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    const std::string token = uniqueToken();
    const std::string remoteSuiteDir =
        joinRemotePath(remoteBase, "asyncsftp-it-" + token);
    const std::string remoteSrc = joinRemotePath(remoteSuiteDir, "payload.bin");
    const std::string remoteMoved =
        joinRemotePath(remoteSuiteDir, "payload-moved.bin");

    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("asyncsftp-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }
    const fs::path localSrc = localTmpRoot / "payload.bin";
    const fs::path localDst = localTmpRoot / "payload-downloaded.bin";
    // several chunks, last one partial
    std::string payload = "asyncsftp integration payload\n";
    while (payload.size() < 200000)
        payload += payload;
    payload.resize(200001);
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[FAIL] could not create source file\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        out << payload;
    }

    Connection conn(*host, port, *user, *pass);
    std::string err;

    {
        Waiter w;
        conn.connect(w.onDone(), w.onError());
        t.check(w.wait(err), "connect should succeed: " + err);
        t.check(conn.isConnected(), "isConnected after connect");
    }
    if (t.failures == 0) {
        Waiter w;
        conn.makeDirectory(remoteSuiteDir, w.onEntry(), w.onError());
        t.check(w.wait(err), "makeDirectory should succeed: " + err);
        t.check(w.entry.isDirectory(), "new entry should be a directory");
    }
    if (t.failures == 0) {
        Waiter w;
        std::uint64_t lastDone = 0;
        conn.uploadFile(
            localSrc.string(), remoteSrc,
            [&lastDone](std::uint64_t done, std::uint64_t) {
                lastDone = done;
                return true;
            },
            w.onTransfer(), w.onError());
        t.check(w.wait(err), "upload should succeed: " + err);
        t.check(w.entry.size() == payload.size(),
                "upload should report the payload size");
        t.check(lastDone == payload.size(),
                "upload progress should end at the payload size");
    }
    if (t.failures == 0) {
        Waiter w;
        conn.statItem(remoteSrc, w.onEntry(), w.onError());
        t.check(w.wait(err), "statItem(remoteSrc) should succeed: " + err);
        t.check(w.entry.isRegularFile(), "stat should report a file");
        t.check(w.entry.size() == payload.size(),
                "remote file size should match payload size");
    }
    if (t.failures == 0) {
        Waiter w;
        conn.listFilesInDirectory(remoteSuiteDir, w.onList(), w.onError());
        t.check(w.wait(err), "list(remoteSuiteDir) should succeed: " + err);
        t.check(listContainsName(w.entries, "payload.bin"),
                "list should include payload.bin");
        t.check(!listContainsName(w.entries, ".") &&
                    !listContainsName(w.entries, ".."),
                "list should skip '.' and '..'");
    }
    if (t.failures == 0) {
        Waiter w;
        conn.downloadFile(remoteSrc, localDst.string(), nullptr,
                          w.onTransfer(), w.onError());
        t.check(w.wait(err), "download should succeed: " + err);
        std::string downloaded;
        t.check(readFile(localDst, downloaded),
                "downloaded file should be readable");
        t.check(downloaded == payload,
                "downloaded content should match uploaded payload");
    }
    if (t.failures == 0) {
        Waiter w;
        conn.renameOrMoveItem(remoteSrc, remoteMoved, w.onEntry(),
                              w.onError());
        t.check(w.wait(err), "rename should succeed: " + err);
        t.check(w.entry.name() == "payload-moved.bin",
                "rename should report the new name");
        Waiter gone;
        conn.statItem(remoteSrc, gone.onEntry(), gone.onError());
        t.check(!gone.wait(err), "old path should not exist after rename");
    }
    if (t.failures == 0) {
        Waiter rm;
        conn.removeFile(remoteMoved, rm.onDone(), rm.onError());
        t.check(rm.wait(err), "removeFile should succeed: " + err);
        Waiter rd;
        conn.removeDirectory(remoteSuiteDir, rd.onDone(), rd.onError());
        t.check(rd.wait(err), "removeDirectory should succeed: " + err);
    }

    // Best-effort cleanup regardless of test result.
    if (conn.isConnected()) {
        std::string cleanupErr;
        Waiter a;
        conn.removeFile(remoteSrc, a.onDone(), a.onError());
        a.wait(cleanupErr);
        Waiter b;
        conn.removeFile(remoteMoved, b.onDone(), b.onError());
        b.wait(cleanupErr);
        Waiter c;
        conn.removeDirectory(remoteSuiteDir, c.onDone(), c.onError());
        c.wait(cleanupErr);
    }
    conn.disconnect();
    t.check(!conn.isConnected(), "disconnect should close the session");
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] asyncsftp_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
