// Error taxonomy mapping and printable names.
#include "asyncsftp/Error.hpp"

namespace asyncsftp {

ErrorCategory errorCategoryOf(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidArguments:
        return ErrorCategory::Argument;
    case ErrorCode::OperationInProgress:
    case ErrorCode::AlreadyConnected:
    case ErrorCode::NotConnected:
        return ErrorCategory::State;
    case ErrorCode::UnableToConnect:
    case ErrorCode::UnableToInitializeSession:
    case ErrorCode::HandshakeFailed:
    case ErrorCode::AuthenticationFailed:
    case ErrorCode::UnableToInitializeSFTP:
    case ErrorCode::Unknown:
        return ErrorCategory::Transport;
    case ErrorCode::UnableToOpenDirectory:
    case ErrorCode::UnableToCloseDirectory:
    case ErrorCode::UnableToOpenFile:
    case ErrorCode::UnableToCloseFile:
    case ErrorCode::UnableToReadDirectory:
    case ErrorCode::UnableToReadFile:
    case ErrorCode::UnableToStatFile:
    case ErrorCode::UnableToWriteFile:
    case ErrorCode::UnableToMakeDirectory:
    case ErrorCode::UnableToRename:
    case ErrorCode::UnableToRemoveFile:
    case ErrorCode::UnableToRemoveDirectory:
        return ErrorCategory::SftpProtocol;
    case ErrorCode::UnableToOpenLocalFileForWriting:
    case ErrorCode::UnableToOpenLocalFileForReading:
    case ErrorCode::UnableToWriteLocalFile:
    case ErrorCode::UnableToReadLocalFile:
        return ErrorCategory::LocalIO;
    case ErrorCode::CancelledByUser:
        return ErrorCategory::UserCancelled;
    }
    return ErrorCategory::Transport;
}

const char *errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::Unknown:
        return "Unknown";
    case ErrorCode::OperationInProgress:
        return "OperationInProgress";
    case ErrorCode::InvalidArguments:
        return "InvalidArguments";
    case ErrorCode::AlreadyConnected:
        return "AlreadyConnected";
    case ErrorCode::UnableToConnect:
        return "UnableToConnect";
    case ErrorCode::UnableToInitializeSession:
        return "UnableToInitializeSession";
    case ErrorCode::HandshakeFailed:
        return "HandshakeFailed";
    case ErrorCode::AuthenticationFailed:
        return "AuthenticationFailed";
    case ErrorCode::NotConnected:
        return "NotConnected";
    case ErrorCode::UnableToInitializeSFTP:
        return "UnableToInitializeSFTP";
    case ErrorCode::UnableToOpenDirectory:
        return "UnableToOpenDirectory";
    case ErrorCode::UnableToCloseDirectory:
        return "UnableToCloseDirectory";
    case ErrorCode::UnableToOpenFile:
        return "UnableToOpenFile";
    case ErrorCode::UnableToCloseFile:
        return "UnableToCloseFile";
    case ErrorCode::UnableToOpenLocalFileForWriting:
        return "UnableToOpenLocalFileForWriting";
    case ErrorCode::UnableToReadDirectory:
        return "UnableToReadDirectory";
    case ErrorCode::UnableToReadFile:
        return "UnableToReadFile";
    case ErrorCode::UnableToStatFile:
        return "UnableToStatFile";
    case ErrorCode::CancelledByUser:
        return "CancelledByUser";
    case ErrorCode::UnableToOpenLocalFileForReading:
        return "UnableToOpenLocalFileForReading";
    case ErrorCode::UnableToWriteFile:
        return "UnableToWriteFile";
    case ErrorCode::UnableToMakeDirectory:
        return "UnableToMakeDirectory";
    case ErrorCode::UnableToRename:
        return "UnableToRename";
    case ErrorCode::UnableToRemoveFile:
        return "UnableToRemoveFile";
    case ErrorCode::UnableToRemoveDirectory:
        return "UnableToRemoveDirectory";
    case ErrorCode::UnableToWriteLocalFile:
        return "UnableToWriteLocalFile";
    case ErrorCode::UnableToReadLocalFile:
        return "UnableToReadLocalFile";
    }
    return "Unknown";
}

const char *errorCategoryName(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::Argument:
        return "ArgumentError";
    case ErrorCategory::State:
        return "StateError";
    case ErrorCategory::Transport:
        return "TransportError";
    case ErrorCategory::SftpProtocol:
        return "SFTPProtocolError";
    case ErrorCategory::LocalIO:
        return "LocalIOError";
    case ErrorCategory::UserCancelled:
        return "UserCancelled";
    }
    return "Unknown";
}

ErrorCategory Error::category() const { return errorCategoryOf(code); }

std::string Error::describe() const {
    std::string out = std::string(errorCodeName(code)) + ": " + message;
    if (underlying.has_value())
        out += " [underlying=" + std::to_string(*underlying) + "]";
    return out;
}

} // namespace asyncsftp
