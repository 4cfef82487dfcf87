// Transfer pipeline: the session context moves chunks over the wire while
// the disk context streams them to or from the local file through a
// ChunkPipe. Both sides meet again before the remote handle is closed.
#include "asyncsftp/ChunkPipe.hpp"
#include "asyncsftp/Connection.hpp"
#include "asyncsftp/Log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <future>
#include <optional>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace asyncsftp {

namespace {

Error cancelledError() {
    return Error(ErrorCode::CancelledByUser, "Cancelled by user.");
}

Error localError(ErrorCode code, const std::string &what, int err) {
    return Error(code, what + ": " + std::strerror(err), err);
}

int errnoOr(int fallback) { return errno != 0 ? errno : fallback; }

} // namespace

void Connection::downloadFile(const std::string &remotePath,
                              const std::string &localPath,
                              ProgressCB progress, TransferSuccessCB onSuccess,
                              FailureCB onFailure) {
    if (remotePath.empty() || localPath.empty()) {
        failInline(onFailure,
                   Error(ErrorCode::InvalidArguments,
                         remotePath.empty() ? "Remote path not specified"
                                            : "Local path not specified"));
        return;
    }
    if (!requireReady(onFailure))
        return;
    auto job = std::make_shared<TransferJob>();
    job->direction = TransferJob::Direction::Download;
    job->remotePath = remotePath;
    job->localPath = localPath;
    job->progress = std::move(progress);
    job->onSuccess = std::move(onSuccess);
    job->onFailure = std::move(onFailure);
    issueTransfer(job);
}

void Connection::uploadFile(const std::string &localPath,
                            const std::string &remotePath, ProgressCB progress,
                            TransferSuccessCB onSuccess, FailureCB onFailure) {
    if (remotePath.empty() || localPath.empty()) {
        failInline(onFailure,
                   Error(ErrorCode::InvalidArguments,
                         remotePath.empty() ? "Remote path not specified"
                                            : "Local path not specified"));
        return;
    }
    if (!requireReady(onFailure))
        return;
    auto job = std::make_shared<TransferJob>();
    job->direction = TransferJob::Direction::Upload;
    job->remotePath = remotePath;
    job->localPath = localPath;
    job->progress = std::move(progress);
    job->onSuccess = std::move(onSuccess);
    job->onFailure = std::move(onFailure);
    issueTransfer(job);
}

void Connection::cancelTransfer() {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto &job : transfers_)
        job->cancelled = true;
    LOGI("cancel requested for %zu transfer(s)", transfers_.size());
}

void Connection::issueTransfer(const JobPtr &job) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        transfers_.push_back(job);
    }
    const unsigned epoch = epoch_.load();
    if (job->direction == TransferJob::Direction::Download)
        session_.async([this, job, epoch] { runDownload(job, epoch); });
    else
        session_.async([this, job, epoch] { runUpload(job, epoch); });
}

void Connection::unregisterTransfer(const JobPtr &job) {
    std::lock_guard<std::mutex> lk(mutex_);
    transfers_.erase(std::remove(transfers_.begin(), transfers_.end(), job),
                     transfers_.end());
}

void Connection::finishTransfer(const JobPtr &job, const Error &error) {
    unregisterTransfer(job);
    deliverFailure(job->onFailure, error);
}

void Connection::finishTransfer(const JobPtr &job, const RemoteEntry &entry,
                                Clock::time_point finish) {
    unregisterTransfer(job);
    LOGI("transfer of %s finished: %llu bytes", job->remotePath.c_str(),
         static_cast<unsigned long long>(job->transferred));
    TransferSuccessCB cb = job->onSuccess;
    const Clock::time_point start = job->start;
    deliver([cb, entry, start, finish] {
        if (cb)
            cb(entry, start, finish);
    });
}

// ---- download ----

void Connection::runDownload(const JobPtr &job, unsigned epoch) {
    if (!sessionUsable(epoch)) {
        finishTransfer(job, notConnectedError());
        return;
    }
    if (job->cancelled) {
        finishTransfer(job, cancelledError());
        return;
    }
    auto stop = [&job] { return job->cancelled.load(); };
    const std::string &local = job->localPath;

    // create the local file if it does not exist, then it must be writable
    bool created = false;
    if (::access(local.c_str(), F_OK) != 0) {
        if (FILE *f = std::fopen(local.c_str(), "wb")) {
            std::fclose(f);
            created = true;
        }
    }
    if (::access(local.c_str(), W_OK) != 0) {
        finishTransfer(job, localError(ErrorCode::UnableToOpenLocalFileForWriting,
                                       "Local file is not writable",
                                       errnoOr(EACCES)));
        return;
    }
    auto dropCreated = [&] {
        if (created)
            std::remove(local.c_str());
    };

    std::unique_ptr<SftpHandle> handle;
    int rc = retryWhileBlocked(*transport_, options_.wait_timeout, stop, [&] {
        return transport_->openFile(job->remotePath, OpenMode::Read, 0, handle);
    });
    if (rc == kRetryInterrupted) {
        dropCreated();
        finishTransfer(job, cancelledError());
        return;
    }
    if (rc != 0) {
        Error error = remoteError(ErrorCode::UnableToOpenFile,
                                  "Unable to open file for reading", rc);
        dropCreated();
        finishTransfer(job, error);
        return;
    }

    FileAttributes attrs;
    rc = retryWhileBlocked(*transport_, options_.wait_timeout, stop, [&] {
        return transport_->fstat(*handle, attrs);
    });
    if (rc != 0) {
        Error error = rc == kRetryInterrupted
                          ? cancelledError()
                          : remoteError(ErrorCode::UnableToStatFile,
                                        "Unable to stat file", rc);
        if (retry([&] { return transport_->closeHandle(*handle); }) != 0)
            LOGW("close of %s failed", job->remotePath.c_str());
        dropCreated();
        finishTransfer(job, error);
        return;
    }
    job->total = attrs.has_size ? attrs.size : 0;

    FILE *lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        const int err = errnoOr(EIO);
        if (retry([&] { return transport_->closeHandle(*handle); }) != 0)
            LOGW("close of %s failed", job->remotePath.c_str());
        dropCreated();
        finishTransfer(job, localError(ErrorCode::UnableToOpenLocalFileForWriting,
                                       "Unable to open " + local, err));
        return;
    }

    // disk side: drain the pipe into the local file
    ChunkPipe pipe(options_.max_chunks_in_flight);
    std::promise<int> writerDone;
    std::future<int> writerResult = writerDone.get_future();
    disk_.async([lf, &pipe, &writerDone] {
        int err = 0;
        ChunkPipe::Chunk chunk;
        while (pipe.pop(chunk)) {
            if (std::fwrite(chunk.data(), 1, chunk.size(), lf) != chunk.size()) {
                err = errnoOr(EIO);
                pipe.abort();
                break;
            }
        }
        if (std::fflush(lf) != 0 && err == 0)
            err = errnoOr(EIO);
        if (std::fclose(lf) != 0 && err == 0)
            err = errnoOr(EIO);
        writerDone.set_value(err);
    });

    LOGI("download %s -> %s (%llu bytes)", job->remotePath.c_str(),
         local.c_str(), static_cast<unsigned long long>(job->total));
    job->start = Clock::now();
    std::vector<char> buf(options_.chunk_size > 0 ? options_.chunk_size
                                                  : 32 * 1024);
    bool cancelled = false;
    bool localFailed = false;
    ssize_t n = 0;
    for (;;) {
        n = retryWhileBlocked(*transport_, options_.wait_timeout, stop, [&] {
            return transport_->read(*handle, buf.data(), buf.size());
        });
        if (n == kRetryInterrupted) {
            cancelled = true;
            break;
        }
        if (n <= 0)
            break;
        if (!pipe.push(ChunkPipe::Chunk(buf.begin(), buf.begin() + n))) {
            localFailed = true;
            break;
        }
        job->transferred += static_cast<std::uint64_t>(n);
        if (job->cancelled ||
            (job->progress && !job->progress(job->transferred, job->total))) {
            cancelled = true;
            break;
        }
    }
    std::optional<Error> readError;
    if (!cancelled && !localFailed && n < 0)
        readError = remoteError(ErrorCode::UnableToReadFile,
                                "Read file failed", static_cast<long>(n));

    if (cancelled || readError)
        pipe.abort();
    else
        pipe.close();
    // rendezvous: the local file is flushed and closed past this point
    const int writeErr = writerResult.get();
    const Clock::time_point finish = Clock::now();

    const int closeRc = retry([&] { return transport_->closeHandle(*handle); });

    if (cancelled) {
        if (std::remove(local.c_str()) != 0)
            LOGW("unable to delete unfinished file %s: %s", local.c_str(),
                 std::strerror(errno));
        LOGI("download of %s cancelled", job->remotePath.c_str());
        finishTransfer(job, cancelledError());
        return;
    }
    if (localFailed || writeErr != 0) {
        finishTransfer(job, localError(ErrorCode::UnableToWriteLocalFile,
                                       "Write local file failed",
                                       writeErr != 0 ? writeErr : EIO));
        return;
    }
    if (readError) {
        finishTransfer(job, *readError);
        return;
    }
    if (closeRc != 0) {
        finishTransfer(job, remoteError(ErrorCode::UnableToCloseFile,
                                        "Close file handle failed", closeRc));
        return;
    }
    finishTransfer(job, RemoteEntry(job->remotePath, attrs), finish);
}

// ---- upload ----

void Connection::runUpload(const JobPtr &job, unsigned epoch) {
    if (!sessionUsable(epoch)) {
        finishTransfer(job, notConnectedError());
        return;
    }
    if (job->cancelled) {
        finishTransfer(job, cancelledError());
        return;
    }
    auto stop = [&job] { return job->cancelled.load(); };
    const std::string &local = job->localPath;

    struct stat st {};
    if (::access(local.c_str(), R_OK) != 0) {
        finishTransfer(job,
                       localError(ErrorCode::UnableToOpenLocalFileForReading,
                                  "Local file is not readable", errnoOr(EACCES)));
        return;
    }
    if (::stat(local.c_str(), &st) != 0 || S_ISDIR(st.st_mode)) {
        finishTransfer(job,
                       localError(ErrorCode::UnableToOpenLocalFileForReading,
                                  "Unable to get attributes of local file",
                                  S_ISDIR(st.st_mode) ? EISDIR : errnoOr(EIO)));
        return;
    }
    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        finishTransfer(job,
                       localError(ErrorCode::UnableToOpenLocalFileForReading,
                                  "Unable to open " + local, errnoOr(EIO)));
        return;
    }

    std::unique_ptr<SftpHandle> handle;
    int rc = retryWhileBlocked(*transport_, options_.wait_timeout, stop, [&] {
        return transport_->openFile(job->remotePath, OpenMode::WriteTruncate,
                                    0644, handle);
    });
    if (rc != 0) {
        Error error = rc == kRetryInterrupted
                          ? cancelledError()
                          : remoteError(ErrorCode::UnableToOpenFile,
                                        "Unable to open file for writing", rc);
        std::fclose(lf);
        finishTransfer(job, error);
        return;
    }
    job->total = static_cast<std::uint64_t>(st.st_size);

    // disk side: fill the pipe from the local file
    ChunkPipe pipe(options_.max_chunks_in_flight);
    std::promise<int> readerDone;
    std::future<int> readerResult = readerDone.get_future();
    const std::size_t chunkSize =
        options_.chunk_size > 0 ? options_.chunk_size : 32 * 1024;
    disk_.async([lf, &pipe, &readerDone, chunkSize] {
        int err = 0;
        for (;;) {
            ChunkPipe::Chunk chunk(chunkSize);
            const std::size_t got = std::fread(chunk.data(), 1, chunkSize, lf);
            if (got > 0) {
                chunk.resize(got);
                if (!pipe.push(std::move(chunk)))
                    break; // aborted by the session side
            }
            if (got < chunkSize) {
                if (std::ferror(lf))
                    err = errnoOr(EIO);
                break;
            }
        }
        std::fclose(lf);
        if (err != 0)
            pipe.abort();
        else
            pipe.close();
        readerDone.set_value(err);
    });

    LOGI("upload %s -> %s (%llu bytes)", local.c_str(),
         job->remotePath.c_str(), static_cast<unsigned long long>(job->total));
    job->start = Clock::now();
    bool cancelled = false;
    ssize_t w = 0;
    ChunkPipe::Chunk chunk;
    while (pipe.pop(chunk)) {
        std::size_t off = 0;
        while (off < chunk.size()) {
            w = retryWhileBlocked(*transport_, options_.wait_timeout, stop, [&] {
                return transport_->write(*handle, chunk.data() + off,
                                         chunk.size() - off);
            });
            if (w <= 0)
                break;
            off += static_cast<std::size_t>(w);
        }
        if (w == kRetryInterrupted) {
            cancelled = true;
            break;
        }
        if (w <= 0) {
            // no progress on a non-empty chunk is a failure too
            if (w == 0)
                w = kSftpProtocolError;
            break;
        }
        job->transferred += chunk.size();
        if (job->cancelled ||
            (job->progress && !job->progress(job->transferred, job->total))) {
            cancelled = true;
            break;
        }
    }
    std::optional<Error> writeError;
    if (!cancelled && w < 0)
        writeError = remoteError(ErrorCode::UnableToWriteFile,
                                 "Write file failed", static_cast<long>(w));
    const bool readerAborted = !cancelled && !writeError && pipe.aborted();
    if (cancelled || writeError)
        pipe.abort(); // releases a reader blocked on a full pipe
    const int readErr = readerResult.get();
    const Clock::time_point finish = Clock::now();

    FileAttributes attrs;
    int statRc = 0;
    if (!cancelled && !writeError && readErr == 0 && !readerAborted)
        statRc = retry([&] { return transport_->fstat(*handle, attrs); });
    std::optional<Error> statError;
    if (statRc != 0)
        statError = remoteError(ErrorCode::UnableToStatFile,
                                "Unable to stat file", statRc);
    const int closeRc = retry([&] { return transport_->closeHandle(*handle); });

    if (cancelled) {
        LOGI("upload to %s cancelled", job->remotePath.c_str());
        finishTransfer(job, cancelledError());
        return;
    }
    if (readErr != 0 || readerAborted) {
        finishTransfer(job, localError(ErrorCode::UnableToReadLocalFile,
                                       "Read local file failed",
                                       readErr != 0 ? readErr : EIO));
        return;
    }
    if (writeError) {
        finishTransfer(job, *writeError);
        return;
    }
    if (statError) {
        finishTransfer(job, *statError);
        return;
    }
    if (closeRc != 0) {
        finishTransfer(job, remoteError(ErrorCode::UnableToCloseFile,
                                        "Close file handle failed", closeRc));
        return;
    }
    finishTransfer(job, RemoteEntry(job->remotePath, attrs), finish);
}

} // namespace asyncsftp
