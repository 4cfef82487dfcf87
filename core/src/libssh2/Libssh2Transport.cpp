// libssh2 backend: manages the TCP socket, the non-blocking SSH session and
// the SFTP channel. Every call may return LIBSSH2_ERROR_EAGAIN; callers wait
// with waitSocket() and retry.
#include "asyncsftp/Libssh2Transport.hpp"
#include "asyncsftp/Log.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace asyncsftp {

static_assert(kWouldBlock == LIBSSH2_ERROR_EAGAIN, "would-block sentinel");
static_assert(kSftpProtocolError == LIBSSH2_ERROR_SFTP_PROTOCOL,
              "sftp protocol error code");
static_assert(kSocketDisconnect == LIBSSH2_ERROR_SOCKET_DISCONNECT,
              "socket disconnect code");
static_assert(kMethodNone == LIBSSH2_ERROR_METHOD_NONE, "method none code");
static_assert(kFxNoSuchFile == LIBSSH2_FX_NO_SUCH_FILE, "sftp status");

namespace {

// libssh2 global initialization (once per process)
std::once_flag g_libssh2_once;

class Libssh2Handle : public SftpHandle {
public:
    explicit Libssh2Handle(LIBSSH2_SFTP_HANDLE *h) : h_(h) {}
    LIBSSH2_SFTP_HANDLE *get() const { return h_; }
    void release() { h_ = nullptr; }

private:
    // Handles never closed are reclaimed by libssh2_sftp_shutdown().
    LIBSSH2_SFTP_HANDLE *h_;
};

LIBSSH2_SFTP_HANDLE *rawHandle(SftpHandle &h) {
    return static_cast<Libssh2Handle &>(h).get();
}

void toAttributes(const LIBSSH2_SFTP_ATTRIBUTES &a, FileAttributes &out) {
    out = FileAttributes{};
    if (a.flags & LIBSSH2_SFTP_ATTR_SIZE) {
        out.has_size = true;
        out.size = a.filesize;
    }
    if (a.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        out.has_uidgid = true;
        out.uid = static_cast<std::uint32_t>(a.uid);
        out.gid = static_cast<std::uint32_t>(a.gid);
    }
    if (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        out.has_permissions = true;
        out.permissions = static_cast<std::uint32_t>(a.permissions);
    }
    if (a.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
        out.has_times = true;
        out.atime = a.atime;
        out.mtime = a.mtime;
    }
}

// keyboard-interactive: the password answers the first prompt only.
void kbdintFirstPromptCallback(const char *name, int name_len,
                               const char *instruction, int instruction_len,
                               int num_prompts,
                               const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                               LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                               void **abstract) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    (void)prompts;
    if (!abstract || !*abstract || num_prompts <= 0)
        return;
    const auto *self = static_cast<const Libssh2Transport *>(*abstract);
    const std::string &pass = self->kbdintPassword();
    if (num_prompts > 1) {
        LOGW("keyboard-interactive asked %d prompts; only the first is "
             "answered",
             num_prompts);
    }
    // libssh2 frees the response text with its allocator (malloc by default).
    char *buf = static_cast<char *>(std::malloc(pass.size() + 1));
    if (!buf)
        return;
    std::memcpy(buf, pass.data(), pass.size());
    buf[pass.size()] = '\0';
    responses[0].text = buf;
    responses[0].length = static_cast<unsigned int>(pass.size());
}

} // namespace

Libssh2Transport::Libssh2Transport() {
    std::call_once(g_libssh2_once, [] {
        const int rc = libssh2_init(0);
        if (rc != 0)
            LOGE("libssh2_init failed: %d", rc);
    });
}

Libssh2Transport::~Libssh2Transport() {
    freeSession();
    closeSocket();
}

bool Libssh2Transport::openSocket(const std::string &host, std::uint16_t port,
                                  std::string &err) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    int lastErrno = 0;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            lastErrno = errno;
            continue;
        }
        // TCP keepalive
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            const int flags = ::fcntl(s, F_GETFL, 0);
            if (flags == -1 || ::fcntl(s, F_SETFL, flags | O_NONBLOCK) == -1) {
                lastErrno = errno;
                ::close(s);
                continue;
            }
            sock_ = s;
            ::freeaddrinfo(res);
            return true;
        }
        lastErrno = errno;
        ::close(s);
    }
    ::freeaddrinfo(res);
    err = "Unable to connect to " + host + ":" + std::to_string(port);
    if (lastErrno != 0)
        err += std::string(": ") + std::strerror(lastErrno);
    return false;
}

void Libssh2Transport::closeSocket() {
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
}

int Libssh2Transport::waitSocket(std::chrono::milliseconds timeout) {
    if (sock_ == -1)
        return -1;
    const int dir = session_ ? libssh2_session_block_directions(session_) : 0;
    struct pollfd pfd {};
    pfd.fd = sock_;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)
        pfd.events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND)
        pfd.events |= POLLOUT;
    // Not blocked in any direction: retry right away.
    if (pfd.events == 0)
        return 1;
    int rc;
    do {
        rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);
    return rc;
}

bool Libssh2Transport::createSession(int keepalive_interval_s) {
    if (session_)
        return true;
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, this);
    if (!session_)
        return false;
    libssh2_session_set_blocking(session_, 0);
    if (keepalive_interval_s > 0)
        libssh2_keepalive_config(session_, 1,
                                 static_cast<unsigned>(keepalive_interval_s));
    return true;
}

void Libssh2Transport::freeSession() {
    const auto drainWait = std::chrono::milliseconds(1000);
    if (sftp_) {
        while (libssh2_sftp_shutdown(sftp_) == LIBSSH2_ERROR_EAGAIN &&
               waitSocket(drainWait) > 0) {
        }
        sftp_ = nullptr;
    }
    if (session_) {
        while (libssh2_session_disconnect(session_, "bye") ==
                   LIBSSH2_ERROR_EAGAIN &&
               waitSocket(drainWait) > 0) {
        }
        // timed out waits are retried; only a dead socket ends the free
        int rc;
        while ((rc = libssh2_session_free(session_)) == LIBSSH2_ERROR_EAGAIN &&
               waitSocket(drainWait) >= 0) {
        }
        if (rc == LIBSSH2_ERROR_EAGAIN)
            LOGW("libssh2 session not freed, socket lost during teardown");
        session_ = nullptr;
    }
}

int Libssh2Transport::lastSessionErrno() const {
    return session_ ? libssh2_session_last_errno(session_)
                    : LIBSSH2_ERROR_BAD_USE;
}

int Libssh2Transport::handshake() {
    if (!session_)
        return LIBSSH2_ERROR_BAD_USE;
    return libssh2_session_handshake(session_, sock_);
}

std::string Libssh2Transport::hostKeyFingerprint() {
    if (!session_)
        return {};
    const unsigned char *h = reinterpret_cast<const unsigned char *>(
        libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
    if (!h)
        return {};
    std::ostringstream oss;
    oss << "SHA256:";
    for (int i = 0; i < 32; ++i) {
        if (i)
            oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

int Libssh2Transport::authMethods(const std::string &user,
                                  std::string &methods) {
    if (!session_)
        return LIBSSH2_ERROR_BAD_USE;
    char *list = libssh2_userauth_list(session_, user.c_str(),
                                       static_cast<unsigned>(user.size()));
    if (list) {
        methods.assign(list);
        return 0;
    }
    const int rc = lastSessionErrno();
    if (rc == LIBSSH2_ERROR_EAGAIN)
        return rc;
    // "none" authentication was accepted by the server.
    if (libssh2_userauth_authenticated(session_)) {
        methods.clear();
        return 0;
    }
    return rc != 0 ? rc : LIBSSH2_ERROR_METHOD_NONE;
}

int Libssh2Transport::authPassword(const std::string &user,
                                   const std::string &password) {
    if (!session_)
        return LIBSSH2_ERROR_BAD_USE;
    return libssh2_userauth_password(session_, user.c_str(), password.c_str());
}

int Libssh2Transport::authKeyboardInteractive(const std::string &user,
                                              const std::string &password) {
    if (!session_)
        return LIBSSH2_ERROR_BAD_USE;
    kbdintPassword_ = password;
    const int rc = libssh2_userauth_keyboard_interactive(
        session_, user.c_str(), kbdintFirstPromptCallback);
    if (rc != LIBSSH2_ERROR_EAGAIN)
        kbdintPassword_.clear();
    return rc;
}

bool Libssh2Transport::authenticated() {
    return session_ && libssh2_userauth_authenticated(session_) != 0;
}

int Libssh2Transport::sessionLastError(std::string &message) {
    message.clear();
    if (!session_)
        return 0;
    char *msg = nullptr;
    int len = 0;
    const int code = libssh2_session_last_error(session_, &msg, &len, 0);
    if (msg && len > 0)
        message.assign(msg, static_cast<std::size_t>(len));
    return code;
}

int Libssh2Transport::sftpInit() {
    if (sftp_)
        return 0;
    if (!session_)
        return LIBSSH2_ERROR_BAD_USE;
    sftp_ = libssh2_sftp_init(session_);
    if (sftp_)
        return 0;
    const int rc = lastSessionErrno();
    return rc != 0 ? rc : LIBSSH2_ERROR_SFTP_PROTOCOL;
}

int Libssh2Transport::sftpShutdown() {
    if (!sftp_)
        return 0;
    const int rc = libssh2_sftp_shutdown(sftp_);
    if (rc != LIBSSH2_ERROR_EAGAIN)
        sftp_ = nullptr;
    return rc;
}

unsigned long Libssh2Transport::sftpLastError() {
    return sftp_ ? libssh2_sftp_last_error(sftp_) : kFxFailure;
}

int Libssh2Transport::openDirectory(const std::string &path,
                                    std::unique_ptr<SftpHandle> &out) {
    if (!sftp_)
        return LIBSSH2_ERROR_BAD_USE;
    LIBSSH2_SFTP_HANDLE *h =
        libssh2_sftp_open_ex(sftp_, path.c_str(),
                             static_cast<unsigned>(path.size()), 0, 0,
                             LIBSSH2_SFTP_OPENDIR);
    if (h) {
        out = std::make_unique<Libssh2Handle>(h);
        return 0;
    }
    const int rc = lastSessionErrno();
    return rc != 0 ? rc : LIBSSH2_ERROR_SFTP_PROTOCOL;
}

int Libssh2Transport::readDirectory(SftpHandle &dir, std::string &name,
                                    FileAttributes &attrs) {
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES a;
    std::memset(&a, 0, sizeof(a));
    const int rc = libssh2_sftp_readdir_ex(rawHandle(dir), filename,
                                           sizeof(filename), longentry,
                                           sizeof(longentry), &a);
    if (rc > 0) {
        name.assign(filename, static_cast<std::size_t>(rc));
        toAttributes(a, attrs);
    }
    return rc;
}

int Libssh2Transport::openFile(const std::string &path, OpenMode mode,
                               std::uint32_t permissions,
                               std::unique_ptr<SftpHandle> &out) {
    if (!sftp_)
        return LIBSSH2_ERROR_BAD_USE;
    const unsigned long flags =
        mode == OpenMode::Read
            ? LIBSSH2_FXF_READ
            : (LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC);
    LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_open_ex(
        sftp_, path.c_str(), static_cast<unsigned>(path.size()), flags,
        static_cast<long>(permissions), LIBSSH2_SFTP_OPENFILE);
    if (h) {
        out = std::make_unique<Libssh2Handle>(h);
        return 0;
    }
    const int rc = lastSessionErrno();
    return rc != 0 ? rc : LIBSSH2_ERROR_SFTP_PROTOCOL;
}

ssize_t Libssh2Transport::read(SftpHandle &file, char *buf, std::size_t len) {
    return libssh2_sftp_read(rawHandle(file), buf, len);
}

ssize_t Libssh2Transport::write(SftpHandle &file, const char *buf,
                                std::size_t len) {
    return libssh2_sftp_write(rawHandle(file), buf, len);
}

int Libssh2Transport::fstat(SftpHandle &file, FileAttributes &attrs) {
    LIBSSH2_SFTP_ATTRIBUTES a{};
    const int rc = libssh2_sftp_fstat_ex(rawHandle(file), &a, 0);
    if (rc == 0)
        toAttributes(a, attrs);
    return rc;
}

int Libssh2Transport::closeHandle(SftpHandle &handle) {
    auto &h = static_cast<Libssh2Handle &>(handle);
    if (!h.get())
        return 0;
    const int rc = libssh2_sftp_close_handle(h.get());
    if (rc != LIBSSH2_ERROR_EAGAIN)
        h.release();
    return rc;
}

int Libssh2Transport::stat(const std::string &path, FileAttributes &attrs) {
    if (!sftp_)
        return LIBSSH2_ERROR_BAD_USE;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    const int rc =
        libssh2_sftp_stat_ex(sftp_, path.c_str(),
                             static_cast<unsigned>(path.size()),
                             LIBSSH2_SFTP_STAT, &a);
    if (rc == 0)
        toAttributes(a, attrs);
    return rc;
}

int Libssh2Transport::mkdir(const std::string &path,
                            std::uint32_t permissions) {
    if (!sftp_)
        return LIBSSH2_ERROR_BAD_USE;
    return libssh2_sftp_mkdir_ex(sftp_, path.c_str(),
                                 static_cast<unsigned>(path.size()),
                                 static_cast<long>(permissions));
}

int Libssh2Transport::rmdir(const std::string &path) {
    if (!sftp_)
        return LIBSSH2_ERROR_BAD_USE;
    return libssh2_sftp_rmdir_ex(sftp_, path.c_str(),
                                 static_cast<unsigned>(path.size()));
}

int Libssh2Transport::rename(const std::string &from, const std::string &to) {
    if (!sftp_)
        return LIBSSH2_ERROR_BAD_USE;
    const long flags = LIBSSH2_SFTP_RENAME_OVERWRITE |
                       LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    return libssh2_sftp_rename_ex(sftp_, from.c_str(),
                                  static_cast<unsigned>(from.size()),
                                  to.c_str(), static_cast<unsigned>(to.size()),
                                  flags);
}

int Libssh2Transport::unlink(const std::string &path) {
    if (!sftp_)
        return LIBSSH2_ERROR_BAD_USE;
    return libssh2_sftp_unlink_ex(sftp_, path.c_str(),
                                  static_cast<unsigned>(path.size()));
}

} // namespace asyncsftp
