// Structured failure reported through every FailureCB.
#pragma once
#include <optional>
#include <string>
#include <utility>

namespace asyncsftp {

enum class ErrorCode {
    Unknown = 1,
    OperationInProgress,
    InvalidArguments,
    AlreadyConnected,
    UnableToConnect,
    UnableToInitializeSession,
    HandshakeFailed,
    AuthenticationFailed,
    NotConnected,
    UnableToInitializeSFTP,
    UnableToOpenDirectory,
    UnableToCloseDirectory,
    UnableToOpenFile,
    UnableToCloseFile,
    UnableToOpenLocalFileForWriting,
    UnableToReadDirectory,
    UnableToReadFile,
    UnableToStatFile,
    CancelledByUser,
    UnableToOpenLocalFileForReading,
    UnableToWriteFile,
    UnableToMakeDirectory,
    UnableToRename,
    UnableToRemoveFile,
    UnableToRemoveDirectory,
    UnableToWriteLocalFile,
    UnableToReadLocalFile
};

// Coarse taxonomy every ErrorCode belongs to.
enum class ErrorCategory {
    Argument,
    State,
    Transport,
    SftpProtocol,
    LocalIO,
    UserCancelled
};

struct Error {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    // libssh2 code, SFTP status or errno, when the failure has one.
    std::optional<long> underlying;

    Error() = default;
    Error(ErrorCode c, std::string msg, std::optional<long> under = {})
        : code(c), message(std::move(msg)), underlying(under) {}

    ErrorCategory category() const;
    // "<CodeName>: message [underlying=N]"
    std::string describe() const;
};

ErrorCategory errorCategoryOf(ErrorCode code);
const char *errorCodeName(ErrorCode code);
const char *errorCategoryName(ErrorCategory category);

} // namespace asyncsftp
