// Transport implementation using libssh2 for SSH/SFTP over a non-blocking
// TCP socket. Encapsulates the socket, the SSH session and the SFTP channel.
#pragma once
#include "Transport.hpp"

#include <string>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace asyncsftp {

class Libssh2Transport : public Transport {
public:
    Libssh2Transport();
    ~Libssh2Transport() override;

    Libssh2Transport(const Libssh2Transport &) = delete;
    Libssh2Transport &operator=(const Libssh2Transport &) = delete;

    bool openSocket(const std::string &host, std::uint16_t port,
                    std::string &err) override;
    void closeSocket() override;
    bool socketOpen() const override { return sock_ != -1; }
    int waitSocket(std::chrono::milliseconds timeout) override;

    bool createSession(int keepalive_interval_s) override;
    void freeSession() override;
    bool hasSession() const override { return session_ != nullptr; }

    int handshake() override;
    std::string hostKeyFingerprint() override;
    int authMethods(const std::string &user, std::string &methods) override;
    int authPassword(const std::string &user,
                     const std::string &password) override;
    int authKeyboardInteractive(const std::string &user,
                                const std::string &password) override;
    bool authenticated() override;
    int sessionLastError(std::string &message) override;

    int sftpInit() override;
    int sftpShutdown() override;
    bool hasSftp() const override { return sftp_ != nullptr; }
    unsigned long sftpLastError() override;

    int openDirectory(const std::string &path,
                      std::unique_ptr<SftpHandle> &out) override;
    int readDirectory(SftpHandle &dir, std::string &name,
                      FileAttributes &attrs) override;
    int openFile(const std::string &path, OpenMode mode,
                 std::uint32_t permissions,
                 std::unique_ptr<SftpHandle> &out) override;
    ssize_t read(SftpHandle &file, char *buf, std::size_t len) override;
    ssize_t write(SftpHandle &file, const char *buf,
                  std::size_t len) override;
    int fstat(SftpHandle &file, FileAttributes &attrs) override;
    int closeHandle(SftpHandle &handle) override;

    int stat(const std::string &path, FileAttributes &attrs) override;
    int mkdir(const std::string &path, std::uint32_t permissions) override;
    int rmdir(const std::string &path) override;
    int rename(const std::string &from, const std::string &to) override;
    int unlink(const std::string &path) override;

    // Read by the keyboard-interactive callback through the session abstract.
    const std::string &kbdintPassword() const { return kbdintPassword_; }

private:
    int sock_ = -1;
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;
    std::string kbdintPassword_;

    // libssh2 reports would-block for pointer-returning calls through errno.
    int lastSessionErrno() const;
};

} // namespace asyncsftp
