// Abstract transport engine: secure channel + SFTP primitives over one
// non-blocking socket. Concrete engines (libssh2, mock) implement this so the
// connection engine stays decoupled from the wire library.
//
// Every primitive returns >= 0 on success, kWouldBlock when it cannot make
// progress without blocking (wait with waitSocket() and call it again), or a
// negative engine error code. None of these are thread-safe; a Connection
// only calls them from its session context.
#pragma once
#include "Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>

namespace asyncsftp {

// Result codes share their values with libssh2.
constexpr int kWouldBlock = -37;        // LIBSSH2_ERROR_EAGAIN
constexpr int kSocketSendError = -7;    // LIBSSH2_ERROR_SOCKET_SEND
constexpr int kKexFailure = -5;         // LIBSSH2_ERROR_KEX_FAILURE
constexpr int kSocketDisconnect = -13;  // LIBSSH2_ERROR_SOCKET_DISCONNECT
constexpr int kMethodNone = -17;        // LIBSSH2_ERROR_METHOD_NONE
constexpr int kAuthenticationFailed = -18; // LIBSSH2_ERROR_AUTHENTICATION_FAILED
constexpr int kSftpProtocolError = -31; // LIBSSH2_ERROR_SFTP_PROTOCOL
constexpr int kSocketRecvError = -43;   // LIBSSH2_ERROR_SOCKET_RECV

// SFTP status codes (sftpLastError()).
constexpr unsigned long kFxOk = 0;
constexpr unsigned long kFxNoSuchFile = 2;
constexpr unsigned long kFxPermissionDenied = 3;
constexpr unsigned long kFxFailure = 4;
constexpr unsigned long kFxFileAlreadyExists = 11;
constexpr unsigned long kFxDirNotEmpty = 18;

enum class OpenMode {
    Read,          // existing file, read only
    WriteTruncate  // create or truncate, write only
};

// An open remote file or directory. Owned by the caller; close it with
// Transport::closeHandle() before releasing it.
class SftpHandle {
public:
    virtual ~SftpHandle() = default;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Blocking TCP connect, then the descriptor is switched to non-blocking.
    virtual bool openSocket(const std::string &host, std::uint16_t port,
                            std::string &err) = 0;
    virtual void closeSocket() = 0;
    virtual bool socketOpen() const = 0;

    // Park until the socket is ready in the direction(s) the engine is
    // blocked on. Returns > 0 ready, 0 on timeout, < 0 on wait failure.
    virtual int waitSocket(std::chrono::milliseconds timeout) = 0;

    // Session handle lifecycle. freeSession() also drops a live SFTP
    // subsystem, so the pair is always torn down together.
    virtual bool createSession(int keepalive_interval_s) = 0;
    virtual void freeSession() = 0;
    virtual bool hasSession() const = 0;

    virtual int handshake() = 0;
    // SHA-256 of the server host key as "SHA256:AA:BB:..", empty if unknown.
    virtual std::string hostKeyFingerprint() = 0;
    // Comma separated list such as "publickey,password".
    virtual int authMethods(const std::string &user, std::string &methods) = 0;
    virtual int authPassword(const std::string &user,
                             const std::string &password) = 0;
    // Answers the first prompt with the password.
    virtual int authKeyboardInteractive(const std::string &user,
                                        const std::string &password) = 0;
    virtual bool authenticated() = 0;
    virtual int sessionLastError(std::string &message) = 0;

    // SFTP subsystem lifecycle.
    virtual int sftpInit() = 0;
    virtual int sftpShutdown() = 0;
    virtual bool hasSftp() const = 0;
    virtual unsigned long sftpLastError() = 0;

    virtual int openDirectory(const std::string &path,
                              std::unique_ptr<SftpHandle> &out) = 0;
    // > 0 one entry was read (value is the name length), 0 end of directory.
    virtual int readDirectory(SftpHandle &dir, std::string &name,
                              FileAttributes &attrs) = 0;
    virtual int openFile(const std::string &path, OpenMode mode,
                         std::uint32_t permissions,
                         std::unique_ptr<SftpHandle> &out) = 0;
    virtual ssize_t read(SftpHandle &file, char *buf, std::size_t len) = 0;
    virtual ssize_t write(SftpHandle &file, const char *buf,
                          std::size_t len) = 0;
    virtual int fstat(SftpHandle &file, FileAttributes &attrs) = 0;
    virtual int closeHandle(SftpHandle &handle) = 0;

    virtual int stat(const std::string &path, FileAttributes &attrs) = 0;
    virtual int mkdir(const std::string &path, std::uint32_t permissions) = 0;
    virtual int rmdir(const std::string &path) = 0;
    virtual int rename(const std::string &from, const std::string &to) = 0;
    virtual int unlink(const std::string &path) = 0;
};

} // namespace asyncsftp
