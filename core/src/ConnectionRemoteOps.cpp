// Directory and metadata operations: list, mkdir, rename, unlink, rmdir, stat.
#include "asyncsftp/Connection.hpp"
#include "asyncsftp/Log.hpp"

#include <algorithm>
#include <utility>

namespace asyncsftp {

void Connection::listFilesInDirectory(const std::string &path,
                                      ListSuccessCB onSuccess,
                                      FailureCB onFailure) {
    if (path.empty()) {
        failInline(onFailure, Error(ErrorCode::InvalidArguments,
                                    "Directory path is empty"));
        return;
    }
    if (!requireReady(onFailure))
        return;
    const unsigned epoch = epoch_.load();
    session_.async([this, epoch, path, onSuccess, onFailure] {
        if (!sessionUsable(epoch)) {
            deliverFailure(onFailure, notConnectedError());
            return;
        }
        std::unique_ptr<SftpHandle> dir;
        int rc = retry([&] { return transport_->openDirectory(path, dir); });
        if (rc != 0) {
            deliverFailure(onFailure,
                           remoteError(ErrorCode::UnableToOpenDirectory,
                                       "Unable to open directory " + path, rc));
            return;
        }

        std::vector<RemoteEntry> entries;
        std::string name;
        FileAttributes attrs;
        while ((rc = retry([&] {
                    return transport_->readDirectory(*dir, name, attrs);
                })) > 0) {
            if (name == "." || name == "..")
                continue;
            entries.emplace_back(joinRemotePath(path, name), attrs);
        }
        // capture the read error before the close replaces it
        std::optional<Error> readError;
        if (rc < 0)
            readError = remoteError(ErrorCode::UnableToReadDirectory,
                                    "Read directory failed", rc);

        const int closeRc = retry([&] { return transport_->closeHandle(*dir); });
        if (readError) {
            deliverFailure(onFailure, *readError);
            return;
        }
        if (closeRc != 0) {
            deliverFailure(onFailure,
                           remoteError(ErrorCode::UnableToCloseDirectory,
                                       "Close directory handle failed",
                                       closeRc));
            return;
        }

        std::sort(entries.begin(), entries.end());
        LOGD("listed %s: %zu entries", path.c_str(), entries.size());
        deliver([onSuccess, entries] {
            if (onSuccess)
                onSuccess(entries);
        });
    });
}

void Connection::makeDirectory(const std::string &path,
                               EntrySuccessCB onSuccess, FailureCB onFailure) {
    if (path.empty()) {
        failInline(onFailure, Error(ErrorCode::InvalidArguments,
                                    "Directory name is empty"));
        return;
    }
    if (!requireReady(onFailure))
        return;
    const unsigned epoch = epoch_.load();
    session_.async([this, epoch, path, onSuccess, onFailure] {
        if (!sessionUsable(epoch)) {
            deliverFailure(onFailure, notConnectedError());
            return;
        }
        int rc = retry([&] { return transport_->mkdir(path, 0755); });
        if (rc != 0) {
            deliverFailure(onFailure,
                           remoteError(ErrorCode::UnableToMakeDirectory,
                                       "Unable to make directory " + path, rc));
            return;
        }
        FileAttributes attrs;
        rc = retry([&] { return transport_->stat(path, attrs); });
        if (rc != 0) {
            deliverFailure(onFailure,
                           remoteError(ErrorCode::UnableToStatFile,
                                       "Unable to stat newly created directory",
                                       rc));
            return;
        }
        RemoteEntry entry(path, attrs);
        LOGI("created directory %s", path.c_str());
        deliver([onSuccess, entry] {
            if (onSuccess)
                onSuccess(entry);
        });
    });
}

void Connection::renameOrMoveItem(const std::string &oldPath,
                                  const std::string &newPath,
                                  EntrySuccessCB onSuccess,
                                  FailureCB onFailure) {
    if (oldPath.empty() || newPath.empty()) {
        failInline(onFailure, Error(ErrorCode::InvalidArguments,
                                    "Renaming path is empty"));
        return;
    }
    if (!requireReady(onFailure))
        return;
    const unsigned epoch = epoch_.load();
    session_.async([this, epoch, oldPath, newPath, onSuccess, onFailure] {
        if (!sessionUsable(epoch)) {
            deliverFailure(onFailure, notConnectedError());
            return;
        }
        int rc = retry([&] { return transport_->rename(oldPath, newPath); });
        if (rc != 0) {
            deliverFailure(onFailure,
                           remoteError(ErrorCode::UnableToRename,
                                       "Unable to rename " + oldPath, rc));
            return;
        }
        FileAttributes attrs;
        rc = retry([&] { return transport_->stat(newPath, attrs); });
        if (rc != 0) {
            deliverFailure(onFailure,
                           remoteError(ErrorCode::UnableToStatFile,
                                       "Unable to stat newly renamed item", rc));
            return;
        }
        RemoteEntry entry(newPath, attrs);
        LOGI("renamed %s -> %s", oldPath.c_str(), newPath.c_str());
        deliver([onSuccess, entry] {
            if (onSuccess)
                onSuccess(entry);
        });
    });
}

void Connection::removeFile(const std::string &path, SuccessCB onSuccess,
                            FailureCB onFailure) {
    if (path.empty()) {
        failInline(onFailure, Error(ErrorCode::InvalidArguments,
                                    "Path to remove is empty"));
        return;
    }
    if (!requireReady(onFailure))
        return;
    const unsigned epoch = epoch_.load();
    session_.async([this, epoch, path, onSuccess, onFailure] {
        if (!sessionUsable(epoch)) {
            deliverFailure(onFailure, notConnectedError());
            return;
        }
        const int rc = retry([&] { return transport_->unlink(path); });
        if (rc != 0) {
            deliverFailure(onFailure,
                           remoteError(ErrorCode::UnableToRemoveFile,
                                       "Unable to remove file " + path, rc));
            return;
        }
        LOGI("removed %s", path.c_str());
        deliver([onSuccess] {
            if (onSuccess)
                onSuccess();
        });
    });
}

void Connection::removeDirectory(const std::string &path, SuccessCB onSuccess,
                                 FailureCB onFailure) {
    if (path.empty()) {
        failInline(onFailure, Error(ErrorCode::InvalidArguments,
                                    "Path to remove is empty"));
        return;
    }
    if (!requireReady(onFailure))
        return;
    const unsigned epoch = epoch_.load();
    session_.async([this, epoch, path, onSuccess, onFailure] {
        if (!sessionUsable(epoch)) {
            deliverFailure(onFailure, notConnectedError());
            return;
        }
        const int rc = retry([&] { return transport_->rmdir(path); });
        if (rc != 0) {
            deliverFailure(onFailure,
                           remoteError(ErrorCode::UnableToRemoveDirectory,
                                       "Unable to remove directory " + path,
                                       rc));
            return;
        }
        LOGI("removed directory %s", path.c_str());
        deliver([onSuccess] {
            if (onSuccess)
                onSuccess();
        });
    });
}

void Connection::statItem(const std::string &path, EntrySuccessCB onSuccess,
                          FailureCB onFailure) {
    if (path.empty()) {
        failInline(onFailure,
                   Error(ErrorCode::InvalidArguments, "Path to stat is empty"));
        return;
    }
    if (!requireReady(onFailure))
        return;
    const unsigned epoch = epoch_.load();
    session_.async([this, epoch, path, onSuccess, onFailure] {
        if (!sessionUsable(epoch)) {
            deliverFailure(onFailure, notConnectedError());
            return;
        }
        FileAttributes attrs;
        const int rc = retry([&] { return transport_->stat(path, attrs); });
        if (rc != 0) {
            deliverFailure(onFailure,
                           remoteError(ErrorCode::UnableToStatFile,
                                       "Unable to stat " + path, rc));
            return;
        }
        RemoteEntry entry(path, attrs);
        deliver([onSuccess, entry] {
            if (onSuccess)
                onSuccess(entry);
        });
    });
}

} // namespace asyncsftp
