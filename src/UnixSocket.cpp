#include "kovak/UnixSocket.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>

namespace kovak {

std::optional<std::string> sendSocketRequest(const std::string& path,
                                             const std::string& request,
                                             bool expectReply,
                                             int timeoutSeconds) {
    struct sockaddr_un addr{};
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) return std::nullopt;

    int sock = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock == -1) return std::nullopt;

    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    struct timeval tv{timeoutSeconds, 0};
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1) {
        close(sock);
        return std::nullopt;
    }

    size_t sent = 0;
    while (sent < request.size()) {
        ssize_t n = send(sock, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            close(sock);
            return std::nullopt;
        }
        sent += static_cast<size_t>(n);
    }

    std::string reply;
    if (expectReply) {
        char buf[4096];
        ssize_t n;
        while ((n = recv(sock, buf, sizeof(buf), 0)) > 0) {
            reply.append(buf, static_cast<size_t>(n));
        }
    }

    close(sock);
    return reply;
}

} // namespace kovak
