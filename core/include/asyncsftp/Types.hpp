// Basic types shared between the connection engine, transports and callers:
// remote metadata snapshots, connection options and callback signatures.
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace asyncsftp {

struct Error;

// Stat-like attribute set as reported by the SFTP subsystem. Each has_*
// flag says whether the server supplied the matching fields.
struct FileAttributes {
    bool          has_size = false;
    bool          has_uidgid = false;
    bool          has_permissions = false;
    bool          has_times = false;
    std::uint64_t size = 0;   // bytes
    std::uint32_t uid = 0;
    std::uint32_t gid = 0;
    std::uint32_t permissions = 0; // POSIX bits (permissions/type)
    std::uint64_t atime = 0;  // epoch (seconds)
    std::uint64_t mtime = 0;  // epoch (seconds)
};

// POSIX type bits as carried in SFTP permissions.
constexpr std::uint32_t kModeTypeMask = 0170000;
constexpr std::uint32_t kModeDirectory = 0040000;
constexpr std::uint32_t kModeRegular = 0100000;
constexpr std::uint32_t kModeSymlink = 0120000;

// Immutable snapshot of a remote file or directory.
class RemoteEntry {
public:
    RemoteEntry() = default;
    RemoteEntry(std::string path, const FileAttributes &attrs);

    const std::string &path() const { return path_; }
    const std::string &name() const { return name_; }
    std::uint64_t size() const { return size_; }
    std::uint64_t modificationTime() const { return mtime_; }
    std::uint32_t permissions() const { return permissions_; }
    std::uint32_t uid() const { return uid_; }
    std::uint32_t gid() const { return gid_; }

    bool isDirectory() const {
        return (permissions_ & kModeTypeMask) == kModeDirectory;
    }
    bool isRegularFile() const {
        return (permissions_ & kModeTypeMask) == kModeRegular;
    }
    bool isSymlink() const {
        return (permissions_ & kModeTypeMask) == kModeSymlink;
    }

    // Listing order: by absolute path.
    bool operator<(const RemoteEntry &other) const {
        return path_ < other.path_;
    }

private:
    std::string path_;
    std::string name_;
    std::uint64_t size_ = 0;
    std::uint64_t mtime_ = 0;
    std::uint32_t permissions_ = 0;
    std::uint32_t uid_ = 0;
    std::uint32_t gid_ = 0;
};

// Remote path helpers (always '/' separated).
std::string joinRemotePath(const std::string &base, const std::string &name);
std::string remoteBaseName(const std::string &path);

enum class SessionState {
    Disconnected,
    Connecting,
    Authenticating,
    Ready,
    Cancelling
};

const char *sessionStateName(SessionState state);

struct ConnectionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::string password;

    // Upper bound of a single readiness wait; the wait is retried after it.
    std::chrono::milliseconds wait_timeout{10000};
    // Transfer chunk size and how many chunks may sit between the contexts.
    std::size_t chunk_size = 32 * 1024;
    std::size_t max_chunks_in_flight = 8;
    // Threads of the general-purpose context completions are delivered on.
    std::size_t callback_threads = 2;
    // SSH keepalive interval in seconds (0 disables).
    int keepalive_interval_s = 30;
};

using Clock = std::chrono::system_clock;

using SuccessCB = std::function<void()>;
using FailureCB = std::function<void(const Error &)>;
using ListSuccessCB = std::function<void(const std::vector<RemoteEntry> &)>;
using EntrySuccessCB = std::function<void(const RemoteEntry &)>;
// Return false to stop the transfer.
using ProgressCB =
    std::function<bool(std::uint64_t /*done*/, std::uint64_t /*total*/)>;
using TransferSuccessCB = std::function<void(
    const RemoteEntry &, Clock::time_point /*start*/,
    Clock::time_point /*finish*/)>;

} // namespace asyncsftp
