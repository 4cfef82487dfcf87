// RemoteEntry construction and remote path helpers.
#include "asyncsftp/Types.hpp"

#include <utility>

namespace asyncsftp {

RemoteEntry::RemoteEntry(std::string path, const FileAttributes &attrs)
    : path_(std::move(path)), name_(remoteBaseName(path_)) {
    if (attrs.has_size)
        size_ = attrs.size;
    if (attrs.has_times)
        mtime_ = attrs.mtime;
    if (attrs.has_permissions)
        permissions_ = attrs.permissions;
    if (attrs.has_uidgid) {
        uid_ = attrs.uid;
        gid_ = attrs.gid;
    }
}

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

std::string remoteBaseName(const std::string &path) {
    std::size_t end = path.size();
    while (end > 1 && path[end - 1] == '/')
        --end;
    if (end == 1 && path[0] == '/')
        return "/";
    const std::size_t slash = path.rfind('/', end - 1);
    if (slash == std::string::npos)
        return path.substr(0, end);
    return path.substr(slash + 1, end - slash - 1);
}

const char *sessionStateName(SessionState state) {
    switch (state) {
    case SessionState::Disconnected:
        return "Disconnected";
    case SessionState::Connecting:
        return "Connecting";
    case SessionState::Authenticating:
        return "Authenticating";
    case SessionState::Ready:
        return "Ready";
    case SessionState::Cancelling:
        return "Cancelling";
    }
    return "Unknown";
}

} // namespace asyncsftp
