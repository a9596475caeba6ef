#include "EventLoop.hpp"
#include "../protocol/RESPEncoder.hpp"
#include "../protocol/RESPParser.hpp"
#include "../utils/Logger.hpp"
#include "../utils/time.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <string_view>
#include <sys/socket.h>
#include <unistd.h>

namespace {

bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0)
        return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

}  // namespace

EventLoop::EventLoop(int serverFd)
    : server_fd(serverFd),
      str(),
      handler(str, *this)
{
}

EventLoop::~EventLoop() {
    for (auto& entry : connections) {
        ::close(entry.first);
    }
}

void EventLoop::run() {
    while (pollOnce(pollTimeout())) {
    }
}

/*
 * One reactor iteration: poll, serve ready sockets, fire due timers,
 * resume connections that got a deferred reply, drop closed ones.
 * Returns false on a poll() failure other than EINTR.
 */
bool EventLoop::pollOnce(int timeout_ms) {
    std::vector<pollfd> fds;
    fds.reserve(connections.size() + 1);
    fds.push_back(pollfd{server_fd, POLLIN, 0});

    for (const auto& entry : connections) {
        short events = POLLIN;
        if (!entry.second.out.empty())
            events |= POLLOUT;
        fds.push_back(pollfd{entry.first, events, 0});
    }

    int activity = ::poll(fds.data(), fds.size(), timeout_ms);
    if (activity < 0) {
        if (errno == EINTR)
            return true;
        Logger::error(std::string("poll error: ") + std::strerror(errno));
        return false;
    }

    if (server_fd >= 0 && (fds[0].revents & POLLIN))
        acceptClients();

    for (size_t i = 1; i < fds.size(); ++i) {
        if (fds[i].revents == 0)
            continue;

        auto it = connections.find(fds[i].fd);
        if (it == connections.end())
            continue;

        Connection& conn = it->second;

        if (fds[i].revents & (POLLIN | POLLHUP | POLLERR))
            readFrom(conn);

        if (!conn.closing && (fds[i].revents & POLLOUT))
            flush(conn);
    }

    handler.processTimers(current_time_ms());
    resumeParked();
    closeFinished();

    return true;
}

int EventLoop::pollTimeout() const {
    if (!resumed.empty())
        return 0;

    auto next = handler.millisUntilNextTimer(current_time_ms());
    if (!next)
        return -1;
    if (*next > static_cast<uint64_t>(INT_MAX))
        return INT_MAX;
    return static_cast<int>(*next);
}

void EventLoop::acceptClients() {
    while (true) {
        sockaddr_in client_addr{};
        socklen_t len = sizeof(client_addr);
        int fd = ::accept(server_fd, reinterpret_cast<sockaddr*>(&client_addr), &len);
        if (fd < 0) {
            if (errno == EINTR)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                Logger::error(std::string("accept error: ") + std::strerror(errno));
            return;
        }

        if (!setNonBlocking(fd)) {
            Logger::error(std::string("fcntl error: ") + std::strerror(errno));
            ::close(fd);
            continue;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        Logger::debug("client connected: fd=" + std::to_string(fd) + " from " + ip + ":" +
                      std::to_string(ntohs(client_addr.sin_port)));

        adopt(fd);
    }
}

void EventLoop::adopt(int fd) {
    Connection conn;
    conn.fd = fd;
    connections.emplace(fd, std::move(conn));
}

std::size_t EventLoop::connectionCount() const {
    return connections.size();
}

void EventLoop::readFrom(Connection& conn) {
    char buffer[4096];
    bool eof = false;

    while (true) {
        ssize_t bytes = ::read(conn.fd, buffer, sizeof(buffer));
        if (bytes > 0) {
            conn.in.append(buffer, static_cast<size_t>(bytes));
            continue;
        }

        if (bytes == 0) {
            eof = true;
            break;
        }

        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            break;

        Logger::error("read error on fd=" + std::to_string(conn.fd) + ": " + std::strerror(errno));
        markClosing(conn);
        return;
    }

    // frames that arrived together with the FIN are still answered
    processInput(conn);
    flush(conn);

    if (eof) {
        Logger::debug("client disconnected: fd=" + std::to_string(conn.fd));
        markClosing(conn);
    }
}

/*
 * Dispatches complete frames in arrival order until the buffer runs
 * dry or a command parks the connection. Consumed bytes are dropped
 * from the input buffer once, after the loop.
 */
void EventLoop::processInput(Connection& conn) {
    std::vector<std::string> args;
    std::size_t offset = 0;

    while (!conn.blocked && !conn.closing) {
        size_t consumed = 0;
        std::string err;

        std::string_view pending(conn.in);
        pending.remove_prefix(offset);

        auto status = RESPParser::parseCommand(pending, args, consumed, err);

        if (status == RESPParser::ParseStatus::INCOMPLETE)
            break;

        if (status == RESPParser::ParseStatus::ERROR) {
            Logger::warn("protocol error from fd=" + std::to_string(conn.fd) + ": " + err);
            conn.out += RESPEncoder::error("ERR Protocol error: " + err);
            conn.in.clear();
            offset = 0;
            flush(conn);
            markClosing(conn);
            break;
        }

        offset += consumed;

        ExecResult result = handler.execute(args, conn.fd);
        if (result.blocked) {
            conn.blocked = true;
            break;
        }

        conn.out += result.reply;
    }

    conn.in.erase(0, offset);
}

void EventLoop::flush(Connection& conn) {
    while (!conn.out.empty()) {
        ssize_t n = ::send(conn.fd, conn.out.data(), conn.out.size(), MSG_NOSIGNAL);
        if (n > 0) {
            conn.out.erase(0, static_cast<size_t>(n));
            continue;
        }

        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            return;

        Logger::error("write error on fd=" + std::to_string(conn.fd) + ": " + std::strerror(errno));
        markClosing(conn);
        return;
    }
}

/*
 * The waiter of a closing connection is dropped right away so that a
 * push never hands an element to a socket that is going away.
 */
void EventLoop::markClosing(Connection& conn) {
    if (conn.closing)
        return;
    conn.closing = true;
    handler.dropClient(conn.fd);
}

void EventLoop::deliver(int client_fd, const std::string& payload) {
    auto it = connections.find(client_fd);
    if (it == connections.end() || it->second.closing)
        return;

    Connection& conn = it->second;
    conn.out += payload;
    conn.blocked = false;
    resumed.push_back(client_fd);
}

void EventLoop::resumeParked() {
    while (!resumed.empty()) {
        std::vector<int> batch;
        batch.swap(resumed);

        for (int fd : batch) {
            auto it = connections.find(fd);
            if (it == connections.end())
                continue;

            processInput(it->second);
            if (!it->second.closing)
                flush(it->second);
        }
    }
}

void EventLoop::closeFinished() {
    for (auto it = connections.begin(); it != connections.end(); ) {
        if (it->second.closing) {
            ::close(it->first);
            it = connections.erase(it);
        } else {
            ++it;
        }
    }
}
