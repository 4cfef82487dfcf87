#include "asyncsftp/MockTransport.hpp"

#include <algorithm>
#include <cstring>
#include <ctime>
#include <thread>
#include <utility>

namespace asyncsftp {

namespace {

struct MockHandle : public SftpHandle {
    std::string path;
    bool dir = false;
    bool writable = false;
    bool open = true;
    std::vector<std::string> names; // directory snapshot
    std::size_t next = 0;
    std::uint64_t offset = 0;
};

std::string normalize(const std::string &path) {
    std::string p = path.empty() ? "/" : path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    return p;
}

std::string parentOf(const std::string &path) {
    const auto pos = path.rfind('/');
    if (pos == std::string::npos || pos == 0)
        return "/";
    return path.substr(0, pos);
}

std::uint64_t nowSeconds() {
    return static_cast<std::uint64_t>(std::time(nullptr));
}

FileAttributes attrsOf(const MockTransport::Node &n) {
    FileAttributes a;
    a.has_size = true;
    a.size = n.is_dir ? 0 : n.data.size();
    a.has_uidgid = true;
    a.uid = n.uid;
    a.gid = n.gid;
    a.has_permissions = true;
    a.permissions = (n.is_dir ? kModeDirectory : kModeRegular) | n.mode;
    a.has_times = true;
    a.atime = n.mtime;
    a.mtime = n.mtime;
    return a;
}

} // namespace

// ---- Server ----

MockTransport::Server::Server() {
    Node root;
    root.is_dir = true;
    root.mode = 0755;
    root.mtime = nowSeconds();
    nodes["/"] = root;
}

void MockTransport::Server::addDirectory(const std::string &path,
                                         std::uint32_t mode) {
    Node n;
    n.is_dir = true;
    n.mode = mode;
    n.mtime = nowSeconds();
    nodes[normalize(path)] = n;
}

void MockTransport::Server::addFile(const std::string &path,
                                    const std::string &data,
                                    std::uint32_t mode) {
    Node n;
    n.data = data;
    n.mode = mode;
    n.mtime = nowSeconds();
    nodes[normalize(path)] = n;
}

bool MockTransport::Server::exists(const std::string &path) const {
    return nodes.count(normalize(path)) != 0;
}

std::vector<std::string>
MockTransport::Server::children(const std::string &dir) const {
    const std::string d = normalize(dir);
    std::vector<std::string> out;
    for (const auto &kv : nodes) {
        if (kv.first != "/" && parentOf(kv.first) == d)
            out.push_back(remoteBaseName(kv.first));
    }
    return out;
}

// ---- Transport ----

MockTransport::MockTransport(std::shared_ptr<Server> server)
    : server_(std::move(server)) {}

MockTransport::~MockTransport() {
    freeSession();
    closeSocket();
}

bool MockTransport::shouldBlock() {
    if (blockLeft_ < 0) {
        std::lock_guard<std::mutex> lk(server_->mu);
        blockLeft_ = server_->would_block;
    }
    if (blockLeft_ > 0) {
        --blockLeft_;
        return true;
    }
    blockLeft_ = -1;
    return false;
}

int MockTransport::fail(int code, const std::string &msg) {
    lastError_ = code;
    lastErrorMsg_ = msg;
    return code;
}

int MockTransport::sftpFail(unsigned long fx) {
    lastFx_ = fx;
    return fail(kSftpProtocolError, "SFTP protocol error");
}

bool MockTransport::openSocket(const std::string &host, std::uint16_t port,
                               std::string &err) {
    std::lock_guard<std::mutex> lk(server_->mu);
    if (server_->refuse_connections) {
        err = "Unable to connect to " + host + ":" + std::to_string(port) +
              ": Connection refused";
        return false;
    }
    ++server_->socket_opens;
    socketOpen_ = true;
    return true;
}

void MockTransport::closeSocket() {
    if (!socketOpen_)
        return;
    socketOpen_ = false;
    std::lock_guard<std::mutex> lk(server_->mu);
    ++server_->socket_closes;
}

int MockTransport::waitSocket(std::chrono::milliseconds timeout) {
    (void)timeout;
    if (!socketOpen_)
        return -1;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lk(server_->mu);
        ++server_->readiness_waits;
        if (server_->fail_waits)
            return -1;
        delay = server_->wait_delay;
    }
    if (delay.count() > 0)
        std::this_thread::sleep_for(delay);
    return 1;
}

bool MockTransport::createSession(int keepalive_interval_s) {
    (void)keepalive_interval_s;
    std::lock_guard<std::mutex> lk(server_->mu);
    if (server_->fail_session_init)
        return false;
    session_ = true;
    return true;
}

void MockTransport::freeSession() {
    if (!session_)
        return;
    std::lock_guard<std::mutex> lk(server_->mu);
    if (sftp_) {
        sftp_ = false;
        ++server_->sftp_shutdowns;
    }
    session_ = false;
    handshaken_ = false;
    authenticated_ = false;
    ++server_->sessions_freed;
}

int MockTransport::handshake() {
    if (!session_ || !socketOpen_)
        return fail(kSocketDisconnect, "Socket disconnected");
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    if (server_->handshake_error != 0)
        return fail(server_->handshake_error, "Unable to exchange keys");
    handshaken_ = true;
    return 0;
}

std::string MockTransport::hostKeyFingerprint() {
    if (!handshaken_)
        return {};
    return "SHA256:4D:4F:43:4B:00:11:22:33:44:55:66:77:88:99:AA:BB:CC:DD:EE:"
           "FF:01:23:45:67:89:AB:CD:EF:FE:DC:BA:98";
}

int MockTransport::authMethods(const std::string &user, std::string &methods) {
    (void)user;
    if (!handshaken_)
        return fail(kSocketDisconnect, "Handshake not completed");
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    methods = server_->auth_methods;
    return 0;
}

int MockTransport::authPassword(const std::string &user,
                                const std::string &password) {
    if (!handshaken_)
        return fail(kSocketDisconnect, "Handshake not completed");
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    server_->last_auth_method = "password";
    if (user != server_->user || password != server_->password)
        return fail(kAuthenticationFailed,
                    "Authentication failed (username/password)");
    authenticated_ = true;
    return 0;
}

int MockTransport::authKeyboardInteractive(const std::string &user,
                                           const std::string &password) {
    if (!handshaken_)
        return fail(kSocketDisconnect, "Handshake not completed");
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    server_->last_auth_method = "keyboard-interactive";
    // Only the first prompt gets the password; the rest are left empty.
    if (server_->kbdint_prompts != 1 || user != server_->user ||
        password != server_->password)
        return fail(kAuthenticationFailed,
                    "Authentication failed (keyboard-interactive)");
    authenticated_ = true;
    return 0;
}

int MockTransport::sessionLastError(std::string &message) {
    message = lastErrorMsg_;
    return lastError_;
}

int MockTransport::sftpInit() {
    if (!authenticated_)
        return fail(kSocketDisconnect, "Not authenticated");
    if (sftp_)
        return 0;
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    if (server_->sftp_init_error != 0)
        return fail(server_->sftp_init_error, "Unable to startup SFTP");
    sftp_ = true;
    lastFx_ = kFxOk;
    return 0;
}

int MockTransport::sftpShutdown() {
    if (!sftp_)
        return 0;
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    sftp_ = false;
    ++server_->sftp_shutdowns;
    return 0;
}

int MockTransport::openDirectory(const std::string &path,
                                 std::unique_ptr<SftpHandle> &out) {
    if (!sftp_)
        return fail(kSocketDisconnect, "SFTP not initialized");
    if (shouldBlock())
        return kWouldBlock;
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(server_->mu);
    auto it = server_->nodes.find(p);
    if (it == server_->nodes.end())
        return sftpFail(kFxNoSuchFile);
    if (!it->second.is_dir)
        return sftpFail(kFxFailure);
    auto h = std::make_unique<MockHandle>();
    h->path = p;
    h->dir = true;
    h->names = {".", ".."};
    // Servers return entries in no particular order.
    auto kids = server_->children(p);
    h->names.insert(h->names.end(), kids.rbegin(), kids.rend());
    ++server_->open_handles;
    out = std::move(h);
    return 0;
}

int MockTransport::readDirectory(SftpHandle &dir, std::string &name,
                                 FileAttributes &attrs) {
    auto &h = static_cast<MockHandle &>(dir);
    if (!h.open || !h.dir)
        return sftpFail(kFxFailure);
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    if (h.next >= 2 && !server_->fail_readdir_path.empty() &&
        h.path == normalize(server_->fail_readdir_path))
        return sftpFail(kFxFailure);
    while (h.next < h.names.size()) {
        const std::string &n = h.names[h.next++];
        std::string full;
        if (n == ".")
            full = h.path;
        else if (n == "..")
            full = parentOf(h.path);
        else
            full = joinRemotePath(h.path, n);
        auto it = server_->nodes.find(full);
        // removed since the snapshot
        if (it == server_->nodes.end())
            continue;
        name = n;
        attrs = attrsOf(it->second);
        return static_cast<int>(n.size());
    }
    return 0;
}

int MockTransport::openFile(const std::string &path, OpenMode mode,
                            std::uint32_t permissions,
                            std::unique_ptr<SftpHandle> &out) {
    if (!sftp_)
        return fail(kSocketDisconnect, "SFTP not initialized");
    if (shouldBlock())
        return kWouldBlock;
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(server_->mu);
    auto it = server_->nodes.find(p);
    if (mode == OpenMode::Read) {
        if (it == server_->nodes.end())
            return sftpFail(kFxNoSuchFile);
        if (it->second.is_dir)
            return sftpFail(kFxFailure);
    } else {
        auto parent = server_->nodes.find(parentOf(p));
        if (parent == server_->nodes.end() || !parent->second.is_dir)
            return sftpFail(kFxNoSuchFile);
        if (it != server_->nodes.end() && it->second.is_dir)
            return sftpFail(kFxFailure);
        Node &n = server_->nodes[p];
        n.data.clear();
        n.mode = permissions & 07777;
        n.mtime = nowSeconds();
    }
    auto h = std::make_unique<MockHandle>();
    h->path = p;
    h->writable = mode == OpenMode::WriteTruncate;
    ++server_->open_handles;
    out = std::move(h);
    return 0;
}

ssize_t MockTransport::read(SftpHandle &file, char *buf, std::size_t len) {
    auto &h = static_cast<MockHandle &>(file);
    if (!h.open || h.dir)
        return sftpFail(kFxFailure);
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    auto it = server_->nodes.find(h.path);
    if (it == server_->nodes.end())
        return sftpFail(kFxNoSuchFile);
    const std::string &data = it->second.data;
    std::uint64_t limit = data.size();
    const bool failing = !server_->fail_read_path.empty() &&
                         h.path == normalize(server_->fail_read_path);
    if (failing) {
        if (h.offset >= server_->fail_read_after)
            return sftpFail(kFxFailure);
        limit = std::min<std::uint64_t>(limit, server_->fail_read_after);
    }
    if (h.offset >= limit)
        return 0;
    const std::size_t n =
        static_cast<std::size_t>(std::min<std::uint64_t>(len, limit - h.offset));
    std::memcpy(buf, data.data() + h.offset, n);
    h.offset += n;
    return static_cast<ssize_t>(n);
}

ssize_t MockTransport::write(SftpHandle &file, const char *buf,
                             std::size_t len) {
    auto &h = static_cast<MockHandle &>(file);
    if (!h.open || !h.writable)
        return sftpFail(kFxPermissionDenied);
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    auto it = server_->nodes.find(h.path);
    if (it == server_->nodes.end())
        return sftpFail(kFxNoSuchFile);
    std::size_t n = len;
    if (server_->max_write > 0)
        n = std::min(n, server_->max_write);
    if (!server_->fail_write_path.empty() &&
        h.path == normalize(server_->fail_write_path)) {
        if (h.offset >= server_->fail_write_after)
            return sftpFail(kFxFailure);
        n = static_cast<std::size_t>(std::min<std::uint64_t>(
            n, server_->fail_write_after - h.offset));
    }
    std::string &data = it->second.data;
    if (data.size() < h.offset + n)
        data.resize(static_cast<std::size_t>(h.offset + n));
    std::memcpy(&data[static_cast<std::size_t>(h.offset)], buf, n);
    h.offset += n;
    it->second.mtime = nowSeconds();
    return static_cast<ssize_t>(n);
}

int MockTransport::fstat(SftpHandle &file, FileAttributes &attrs) {
    auto &h = static_cast<MockHandle &>(file);
    if (!h.open)
        return sftpFail(kFxFailure);
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    auto it = server_->nodes.find(h.path);
    if (it == server_->nodes.end())
        return sftpFail(kFxNoSuchFile);
    attrs = attrsOf(it->second);
    return 0;
}

int MockTransport::closeHandle(SftpHandle &handle) {
    auto &h = static_cast<MockHandle &>(handle);
    if (!h.open)
        return 0;
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    h.open = false;
    --server_->open_handles;
    if (server_->fail_close)
        return sftpFail(kFxFailure);
    return 0;
}

int MockTransport::stat(const std::string &path, FileAttributes &attrs) {
    if (!sftp_)
        return fail(kSocketDisconnect, "SFTP not initialized");
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    auto it = server_->nodes.find(normalize(path));
    if (it == server_->nodes.end())
        return sftpFail(kFxNoSuchFile);
    attrs = attrsOf(it->second);
    return 0;
}

int MockTransport::mkdir(const std::string &path, std::uint32_t permissions) {
    if (!sftp_)
        return fail(kSocketDisconnect, "SFTP not initialized");
    if (shouldBlock())
        return kWouldBlock;
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(server_->mu);
    if (server_->nodes.count(p))
        return sftpFail(kFxFileAlreadyExists);
    auto parent = server_->nodes.find(parentOf(p));
    if (parent == server_->nodes.end() || !parent->second.is_dir)
        return sftpFail(kFxNoSuchFile);
    server_->addDirectory(p, permissions & 07777);
    return 0;
}

int MockTransport::rmdir(const std::string &path) {
    if (!sftp_)
        return fail(kSocketDisconnect, "SFTP not initialized");
    if (shouldBlock())
        return kWouldBlock;
    const std::string p = normalize(path);
    std::lock_guard<std::mutex> lk(server_->mu);
    auto it = server_->nodes.find(p);
    if (it == server_->nodes.end())
        return sftpFail(kFxNoSuchFile);
    if (!it->second.is_dir || p == "/")
        return sftpFail(kFxFailure);
    if (!server_->children(p).empty())
        return sftpFail(kFxDirNotEmpty);
    server_->nodes.erase(it);
    return 0;
}

int MockTransport::rename(const std::string &from, const std::string &to) {
    if (!sftp_)
        return fail(kSocketDisconnect, "SFTP not initialized");
    if (shouldBlock())
        return kWouldBlock;
    const std::string src = normalize(from);
    const std::string dst = normalize(to);
    std::lock_guard<std::mutex> lk(server_->mu);
    auto it = server_->nodes.find(src);
    if (it == server_->nodes.end())
        return sftpFail(kFxNoSuchFile);
    if (src == "/" || dst.compare(0, src.size() + 1, src + "/") == 0)
        return sftpFail(kFxFailure);
    auto parent = server_->nodes.find(parentOf(dst));
    if (parent == server_->nodes.end() || !parent->second.is_dir)
        return sftpFail(kFxNoSuchFile);
    if (src == dst)
        return 0;
    auto existing = server_->nodes.find(dst);
    if (existing != server_->nodes.end()) {
        if (existing->second.is_dir && !server_->children(dst).empty())
            return sftpFail(kFxDirNotEmpty);
        server_->nodes.erase(existing);
    }
    // Move the node and everything below it.
    std::map<std::string, Node> moved;
    const std::string prefix = src + "/";
    for (auto n = server_->nodes.begin(); n != server_->nodes.end();) {
        if (n->first == src) {
            moved[dst] = n->second;
            n = server_->nodes.erase(n);
        } else if (n->first.compare(0, prefix.size(), prefix) == 0) {
            moved[dst + n->first.substr(src.size())] = n->second;
            n = server_->nodes.erase(n);
        } else {
            ++n;
        }
    }
    server_->nodes.insert(moved.begin(), moved.end());
    return 0;
}

int MockTransport::unlink(const std::string &path) {
    if (!sftp_)
        return fail(kSocketDisconnect, "SFTP not initialized");
    if (shouldBlock())
        return kWouldBlock;
    std::lock_guard<std::mutex> lk(server_->mu);
    auto it = server_->nodes.find(normalize(path));
    if (it == server_->nodes.end())
        return sftpFail(kFxNoSuchFile);
    if (it->second.is_dir)
        return sftpFail(kFxFailure);
    server_->nodes.erase(it);
    return 0;
}

} // namespace asyncsftp
