// In-memory transport used by tests and for offline development. Behaves like
// a small SFTP server and can be told to answer "would block", to fail at
// specific points, or to stall readiness waits.
#pragma once
#include "Transport.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace asyncsftp {

class MockTransport : public Transport {
public:
    struct Node {
        bool is_dir = false;
        std::string data;
        std::uint32_t mode = 0644; // permission bits only
        std::uint64_t mtime = 0;
        std::uint32_t uid = 1000;
        std::uint32_t gid = 1000;
    };

    // Server side state. Shared with the test, which configures it and
    // inspects it from its own thread; lock mu before touching any field.
    struct Server {
        Server();

        std::mutex mu;
        std::map<std::string, Node> nodes; // absolute path -> node

        // Accounts and auth
        std::string user = "tester";
        std::string password = "secret";
        std::string auth_methods = "publickey,password,keyboard-interactive";
        int kbdint_prompts = 1;

        // Failure injection
        bool refuse_connections = false;
        bool fail_session_init = false;
        int handshake_error = 0;
        int sftp_init_error = 0;
        std::string fail_readdir_path; // readdir fails after "." and ".."
        std::string fail_read_path;
        std::uint64_t fail_read_after = 0;
        std::string fail_write_path;
        std::uint64_t fail_write_after = 0;
        bool fail_close = false;
        std::size_t max_write = 0; // > 0: writes are partial

        // Every primitive answers kWouldBlock this many times before working.
        int would_block = 0;
        // Each readiness wait sleeps this long before reporting ready.
        std::chrono::milliseconds wait_delay{0};
        // Readiness waits report a dead socket.
        bool fail_waits = false;

        // Counters
        std::size_t socket_opens = 0;
        std::size_t socket_closes = 0;
        std::size_t readiness_waits = 0;
        std::size_t sessions_freed = 0;
        std::size_t sftp_shutdowns = 0;
        std::size_t open_handles = 0;
        std::string last_auth_method;

        // Helpers (caller holds mu)
        void addDirectory(const std::string &path, std::uint32_t mode = 0755);
        void addFile(const std::string &path, const std::string &data,
                     std::uint32_t mode = 0644);
        bool exists(const std::string &path) const;
        std::vector<std::string> children(const std::string &dir) const;
    };

    explicit MockTransport(
        std::shared_ptr<Server> server = std::make_shared<Server>());
    ~MockTransport() override;

    const std::shared_ptr<Server> &server() const { return server_; }

    bool openSocket(const std::string &host, std::uint16_t port,
                    std::string &err) override;
    void closeSocket() override;
    bool socketOpen() const override { return socketOpen_; }
    int waitSocket(std::chrono::milliseconds timeout) override;

    bool createSession(int keepalive_interval_s) override;
    void freeSession() override;
    bool hasSession() const override { return session_; }

    int handshake() override;
    std::string hostKeyFingerprint() override;
    int authMethods(const std::string &user, std::string &methods) override;
    int authPassword(const std::string &user,
                     const std::string &password) override;
    int authKeyboardInteractive(const std::string &user,
                                const std::string &password) override;
    bool authenticated() override { return authenticated_; }
    int sessionLastError(std::string &message) override;

    int sftpInit() override;
    int sftpShutdown() override;
    bool hasSftp() const override { return sftp_; }
    unsigned long sftpLastError() override { return lastFx_; }

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

private:
    std::shared_ptr<Server> server_;
    bool socketOpen_ = false;
    bool session_ = false;
    bool handshaken_ = false;
    bool authenticated_ = false;
    bool sftp_ = false;
    int blockLeft_ = -1;
    unsigned long lastFx_ = kFxOk;
    int lastError_ = 0;
    std::string lastErrorMsg_;

    // true while the current primitive must still answer kWouldBlock
    bool shouldBlock();
    int fail(int code, const std::string &msg);
    int sftpFail(unsigned long fx);
};

} // namespace asyncsftp
