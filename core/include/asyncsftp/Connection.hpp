// Asynchronous SFTP connection. Every public call returns immediately; the
// work runs on the connection's session context and its result is delivered
// to exactly one of the supplied callbacks on the general-purpose callback
// context. Failures detected before any work is scheduled (bad arguments,
// wrong state) are reported on the calling thread before the call returns.
#pragma once
#include "Error.hpp"
#include "RetryLoop.hpp"
#include "SerialQueue.hpp"
#include "Transport.hpp"
#include "Types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace asyncsftp {

class Connection {
public:
    Connection(std::string host, std::string username, std::string password);
    Connection(std::string host, std::uint16_t port, std::string username,
               std::string password);
    // A null transport selects libssh2.
    explicit Connection(ConnectionOptions options,
                        std::unique_ptr<Transport> transport = nullptr);
    // Disconnects, then lets every queued operation resolve.
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Connect with the credentials given at construction.
    void connect(SuccessCB onSuccess, FailureCB onFailure);
    // Connect with these credentials; they replace the configured ones.
    void connect(const std::string &host, std::uint16_t port,
                 const std::string &username, const std::string &password,
                 SuccessCB onSuccess, FailureCB onFailure);
    // Blocks until the session is torn down, except when called from a
    // progress callback, where teardown runs after the current transfer.
    void disconnect();
    bool isConnected() const { return socketOpen_.load(); }
    SessionState state() const { return state_.load(); }

    void listFilesInDirectory(const std::string &path, ListSuccessCB onSuccess,
                              FailureCB onFailure);
    void makeDirectory(const std::string &path, EntrySuccessCB onSuccess,
                       FailureCB onFailure);
    void renameOrMoveItem(const std::string &oldPath,
                          const std::string &newPath, EntrySuccessCB onSuccess,
                          FailureCB onFailure);
    void removeFile(const std::string &path, SuccessCB onSuccess,
                    FailureCB onFailure);
    void removeDirectory(const std::string &path, SuccessCB onSuccess,
                         FailureCB onFailure);
    void statItem(const std::string &path, EntrySuccessCB onSuccess,
                  FailureCB onFailure);

    // The progress callback runs on the session context after every chunk;
    // returning false cancels the transfer.
    void downloadFile(const std::string &remotePath,
                      const std::string &localPath, ProgressCB progress,
                      TransferSuccessCB onSuccess, FailureCB onFailure);
    void uploadFile(const std::string &localPath,
                    const std::string &remotePath, ProgressCB progress,
                    TransferSuccessCB onSuccess, FailureCB onFailure);
    // Flags every transfer issued and not yet resolved.
    void cancelTransfer();

private:
    struct PendingOperation {
        SuccessCB onSuccess;
        FailureCB onFailure;
    };

    struct TransferJob {
        enum class Direction { Download, Upload };

        Direction direction = Direction::Download;
        std::string remotePath;
        std::string localPath;
        std::uint64_t total = 0;
        std::uint64_t transferred = 0;
        Clock::time_point start;
        std::atomic<bool> cancelled{false};
        ProgressCB progress;
        TransferSuccessCB onSuccess;
        FailureCB onFailure;
    };
    using JobPtr = std::shared_ptr<TransferJob>;

    // connect / disconnect (session context)
    void startConnect(ConnectionOptions opt, SuccessCB onSuccess,
                      FailureCB onFailure);
    void runConnect(unsigned epoch, const ConnectionOptions &opt);
    int authenticate(unsigned epoch, const ConnectionOptions &opt,
                     std::string &method);
    void resolveConnect(const std::optional<Error> &failure);
    void teardownSession();
    bool sessionUsable(unsigned epoch) const;

    // transfers (session context)
    void issueTransfer(const JobPtr &job);
    void runDownload(const JobPtr &job, unsigned epoch);
    void runUpload(const JobPtr &job, unsigned epoch);
    void finishTransfer(const JobPtr &job, const Error &error);
    void finishTransfer(const JobPtr &job, const RemoteEntry &entry,
                        Clock::time_point finish);
    void unregisterTransfer(const JobPtr &job);

    // result delivery
    bool requireReady(const FailureCB &onFailure);
    void failInline(const FailureCB &onFailure, const Error &error);
    void deliverFailure(const FailureCB &onFailure, const Error &error);
    void deliver(WorkerPool::Task task);
    Error remoteError(ErrorCode code, const std::string &what, long rc);
    static Error notConnectedError();

    // Uninterruptible retry on the session transport.
    template <class Op> auto retry(Op &&op) -> decltype(op()) {
        return retryWhileBlocked(*transport_, options_.wait_timeout,
                                 std::forward<Op>(op));
    }

    ConnectionOptions options_;
    std::unique_ptr<Transport> transport_;

    std::mutex mutex_; // guards options_, pending_, transfers_
    std::optional<PendingOperation> pending_;
    std::vector<JobPtr> transfers_;

    std::atomic<SessionState> state_{SessionState::Disconnected};
    std::atomic<bool> socketOpen_{false};
    // Bumped by disconnect(); work issued under an older value is stale.
    std::atomic<unsigned> epoch_{0};

    WorkerPool callbacks_;
    SerialQueue disk_;
    SerialQueue session_;
};

} // namespace asyncsftp
