// Connection lifecycle: construction, connect/authenticate state machine,
// teardown and result delivery.
#include "asyncsftp/Connection.hpp"
#include "asyncsftp/Libssh2Transport.hpp"
#include "asyncsftp/Log.hpp"
#include "asyncsftp/RuntimeLogging.hpp"

#include <algorithm>
#include <utility>

namespace asyncsftp {

namespace {

bool methodOffered(const std::string &methods, const std::string &method) {
    std::size_t pos = 0;
    while (pos <= methods.size()) {
        std::size_t comma = methods.find(',', pos);
        if (comma == std::string::npos)
            comma = methods.size();
        if (methods.compare(pos, comma - pos, method) == 0 &&
            comma - pos == method.size())
            return true;
        pos = comma + 1;
    }
    return false;
}

const char *sftpStatusText(unsigned long fx) {
    switch (fx) {
    case kFxOk:
        return "OK";
    case kFxNoSuchFile:
        return "No such file";
    case kFxPermissionDenied:
        return "Permission denied";
    case kFxFailure:
        return "Failure";
    case kFxFileAlreadyExists:
        return "File already exists";
    case kFxDirNotEmpty:
        return "Directory not empty";
    default:
        return "SFTP error";
    }
}

// A failed readiness wait means the peer is gone.
long engineCode(int rc) {
    return rc == kRetryWaitFailed ? static_cast<long>(kSocketDisconnect)
                                  : static_cast<long>(rc);
}

} // namespace

Connection::Connection(std::string host, std::string username,
                       std::string password)
    : Connection(std::move(host), 22, std::move(username),
                 std::move(password)) {}

Connection::Connection(std::string host, std::uint16_t port,
                       std::string username, std::string password)
    : Connection(
          [&] {
              ConnectionOptions o;
              o.host = std::move(host);
              o.port = port;
              o.username = std::move(username);
              o.password = std::move(password);
              return o;
          }(),
          nullptr) {}

Connection::Connection(ConnectionOptions options,
                       std::unique_ptr<Transport> transport)
    : options_(std::move(options)), transport_(std::move(transport)),
      callbacks_(options_.callback_threads, "asyncsftp.callbacks"),
      disk_("asyncsftp.disk"), session_("asyncsftp.session") {
    if (!transport_)
        transport_ = std::make_unique<Libssh2Transport>();
}

Connection::~Connection() {
    disconnect();
    // session first: its tasks post to the disk and callback contexts
    session_.shutdown();
    disk_.shutdown();
    callbacks_.shutdown();
}

// ---- connect ----

void Connection::connect(SuccessCB onSuccess, FailureCB onFailure) {
    ConnectionOptions opt;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        opt = options_;
    }
    startConnect(std::move(opt), std::move(onSuccess), std::move(onFailure));
}

void Connection::connect(const std::string &host, std::uint16_t port,
                         const std::string &username,
                         const std::string &password, SuccessCB onSuccess,
                         FailureCB onFailure) {
    ConnectionOptions opt;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        opt = options_;
    }
    opt.host = host;
    opt.port = port;
    opt.username = username;
    opt.password = password;
    startConnect(std::move(opt), std::move(onSuccess), std::move(onFailure));
}

void Connection::startConnect(ConnectionOptions opt, SuccessCB onSuccess,
                              FailureCB onFailure) {
    std::unique_lock<std::mutex> lk(mutex_);
    if (pending_) {
        lk.unlock();
        failInline(onFailure,
                   Error(ErrorCode::OperationInProgress, "Operation in progress"));
        return;
    }
    if (opt.host.empty() || opt.username.empty() || opt.password.empty() ||
        opt.port == 0) {
        lk.unlock();
        failInline(onFailure,
                   Error(ErrorCode::InvalidArguments, "Invalid arguments"));
        return;
    }
    if (socketOpen_.load() || state_.load() != SessionState::Disconnected) {
        lk.unlock();
        failInline(onFailure,
                   Error(ErrorCode::AlreadyConnected, "Already connected"));
        return;
    }
    options_.host = opt.host;
    options_.port = opt.port;
    options_.username = opt.username;
    options_.password = opt.password;
    pending_ = PendingOperation{std::move(onSuccess), std::move(onFailure)};
    state_ = SessionState::Connecting;
    const unsigned epoch = epoch_.load();
    lk.unlock();

    if (sensitiveLoggingEnabled())
        LOGD("connect %s@%s:%u password='%s'", opt.username.c_str(),
             opt.host.c_str(), static_cast<unsigned>(opt.port),
             opt.password.c_str());
    else
        LOGI("connect %s@%s:%u", opt.username.c_str(), opt.host.c_str(),
             static_cast<unsigned>(opt.port));

    session_.async([this, epoch, opt] { runConnect(epoch, opt); });
}

void Connection::runConnect(unsigned epoch, const ConnectionOptions &opt) {
    auto stale = [this, epoch] { return epoch_.load() != epoch; };
    auto abandon = [this](const Error &error) {
        teardownSession();
        resolveConnect(error);
    };
    if (stale()) {
        abandon(Error(ErrorCode::NotConnected, "Disconnected while connecting"));
        return;
    }

    std::string err;
    if (!transport_->openSocket(opt.host, opt.port, err)) {
        state_ = SessionState::Disconnected;
        resolveConnect(
            Error(ErrorCode::UnableToConnect, "Unable to connect: " + err));
        return;
    }
    socketOpen_ = true;

    if (!transport_->createSession(opt.keepalive_interval_s)) {
        abandon(Error(ErrorCode::UnableToInitializeSession,
                      "Unable to initialize libssh2 session"));
        return;
    }

    int rc = retryWhileBlocked(*transport_, opt.wait_timeout, stale,
                               [this] { return transport_->handshake(); });
    if (rc == kRetryInterrupted) {
        abandon(Error(ErrorCode::NotConnected, "Disconnected while connecting"));
        return;
    }
    if (rc != 0) {
        abandon(Error(ErrorCode::HandshakeFailed,
                      "Handshake failed with code " +
                          std::to_string(engineCode(rc)),
                      engineCode(rc)));
        return;
    }
    const std::string fingerprint = transport_->hostKeyFingerprint();
    LOGW("host key of %s not verified (%s)", opt.host.c_str(),
         fingerprint.empty() ? "no fingerprint" : fingerprint.c_str());

    state_ = SessionState::Authenticating;
    std::string method;
    rc = authenticate(epoch, opt, method);
    if (rc == kRetryInterrupted) {
        abandon(Error(ErrorCode::NotConnected, "Disconnected while connecting"));
        return;
    }
    if (rc == kMethodNone) {
        abandon(Error(ErrorCode::AuthenticationFailed,
                      "No supported authentication method", rc));
        return;
    }
    if (rc != 0) {
        abandon(Error(ErrorCode::AuthenticationFailed,
                      "Authentication failed with code " +
                          std::to_string(engineCode(rc)),
                      engineCode(rc)));
        return;
    }
    LOGI("authenticated as %s (%s)", opt.username.c_str(), method.c_str());

    rc = retryWhileBlocked(*transport_, opt.wait_timeout, stale,
                           [this] { return transport_->sftpInit(); });
    if (rc == kRetryInterrupted) {
        abandon(Error(ErrorCode::NotConnected, "Disconnected while connecting"));
        return;
    }
    if (rc != 0) {
        std::string msg;
        transport_->sessionLastError(msg);
        abandon(Error(ErrorCode::UnableToInitializeSFTP,
                      "Unable to initialize sftp: " +
                          (msg.empty() ? std::string("libssh2 error") : msg),
                      engineCode(rc)));
        return;
    }
    if (stale()) {
        abandon(Error(ErrorCode::NotConnected, "Disconnected while connecting"));
        return;
    }

    state_ = SessionState::Ready;
    LOGI("connected to %s:%u", opt.host.c_str(),
         static_cast<unsigned>(opt.port));
    resolveConnect(std::nullopt);
}

int Connection::authenticate(unsigned epoch, const ConnectionOptions &opt,
                             std::string &method) {
    auto stale = [this, epoch] { return epoch_.load() != epoch; };
    std::string methods;
    int rc = retryWhileBlocked(*transport_, opt.wait_timeout, stale, [&] {
        return transport_->authMethods(opt.username, methods);
    });
    if (rc != 0)
        return rc;
    LOGD("auth methods offered: %s", methods.c_str());

    // "none" was accepted while listing methods
    if (transport_->authenticated()) {
        method = "none";
        return 0;
    }
    if (methodOffered(methods, "password")) {
        method = "password";
        return retryWhileBlocked(*transport_, opt.wait_timeout, stale, [&] {
            return transport_->authPassword(opt.username, opt.password);
        });
    }
    if (methodOffered(methods, "keyboard-interactive")) {
        method = "keyboard-interactive";
        return retryWhileBlocked(*transport_, opt.wait_timeout, stale, [&] {
            return transport_->authKeyboardInteractive(opt.username,
                                                       opt.password);
        });
    }
    LOGW("no supported auth method in '%s'", methods.c_str());
    return kMethodNone;
}

void Connection::resolveConnect(const std::optional<Error> &failure) {
    std::optional<PendingOperation> pending;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        pending.swap(pending_);
    }
    if (!pending)
        return;
    if (failure) {
        deliverFailure(pending->onFailure, *failure);
        return;
    }
    SuccessCB cb = std::move(pending->onSuccess);
    deliver([cb] {
        if (cb)
            cb();
    });
}

// ---- disconnect ----

void Connection::disconnect() {
    ++epoch_;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto &job : transfers_)
            job->cancelled = true;
    }
    SessionState expected = SessionState::Ready;
    state_.compare_exchange_strong(expected, SessionState::Cancelling);

    if (session_.isCurrent()) {
        LOGD("disconnect from the session context, deferring teardown");
        session_.async([this] { teardownSession(); });
        return;
    }
    session_.sync([this] { teardownSession(); });
}

void Connection::teardownSession() {
    const bool hadSocket = transport_->socketOpen();
    if (transport_->hasSftp()) {
        const int rc = retry([this] { return transport_->sftpShutdown(); });
        if (rc != 0)
            LOGW("sftp shutdown failed: %d", rc);
    }
    // session before socket
    transport_->freeSession();
    transport_->closeSocket();
    socketOpen_ = false;
    state_ = SessionState::Disconnected;
    if (hadSocket)
        LOGI("disconnected");
}

bool Connection::sessionUsable(unsigned epoch) const {
    return state_.load() == SessionState::Ready && epoch_.load() == epoch;
}

// ---- delivery ----

bool Connection::requireReady(const FailureCB &onFailure) {
    if (state_.load() == SessionState::Ready)
        return true;
    failInline(onFailure, notConnectedError());
    return false;
}

void Connection::failInline(const FailureCB &onFailure, const Error &error) {
    LOGW("%s", error.describe().c_str());
    if (onFailure)
        onFailure(error);
}

void Connection::deliverFailure(const FailureCB &onFailure,
                                const Error &error) {
    LOGW("%s", error.describe().c_str());
    deliver([onFailure, error] {
        if (onFailure)
            onFailure(error);
    });
}

void Connection::deliver(WorkerPool::Task task) {
    callbacks_.async(std::move(task));
}

Error Connection::notConnectedError() {
    return Error(ErrorCode::NotConnected, "Socket not connected");
}

Error Connection::remoteError(ErrorCode code, const std::string &what,
                              long rc) {
    if (rc == kRetryWaitFailed)
        return Error(code, what + ": connection lost", kSocketDisconnect);
    if (rc == kSftpProtocolError) {
        const unsigned long fx = transport_->sftpLastError();
        return Error(code,
                     what + ": SFTP status " + std::to_string(fx) + " (" +
                         sftpStatusText(fx) + ")",
                     static_cast<long>(fx));
    }
    std::string msg;
    transport_->sessionLastError(msg);
    std::string text = what + ": libssh2 error " + std::to_string(rc);
    if (!msg.empty())
        text += " (" + msg + ")";
    return Error(code, text, rc);
}

} // namespace asyncsftp
