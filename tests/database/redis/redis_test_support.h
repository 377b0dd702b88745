#pragma once

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <string>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <sw/redis++/redis++.h>

#include "database/redis/redis_config.h"

namespace flakeid::test {

inline constexpr const char* kRedisTestHost = "127.0.0.1";
inline constexpr std::uint16_t kRedisTestPort = 6379;

inline database::redis::RedisConfig LocalRedisConfig() {
    database::redis::RedisConfig config;
    config.cluster_mode = false;
    config.pool_size = 1;
    config.endpoints = {database::redis::RedisEndpoint{}};
    config.endpoints.front().host = kRedisTestHost;
    config.endpoints.front().port = kRedisTestPort;
    config.connect_timeout = std::chrono::milliseconds(200);
    config.socket_timeout = std::chrono::milliseconds(200);
    return config;
}

// Direct connection for inspecting keys the code under test wrote.
inline sw::redis::Redis AdminConnection() {
    sw::redis::ConnectionOptions options;
    options.host = kRedisTestHost;
    options.port = kRedisTestPort;
    options.socket_timeout = std::chrono::milliseconds(200);
    return sw::redis::Redis(options);
}

inline std::string UniqueKey(const std::string& suffix) {
    static std::atomic<std::uint64_t> counter{0};
    const auto now =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now()
                                                                  .time_since_epoch())
            .count();
    return "flakeid_test:" + suffix + ":" + std::to_string(now) + ":" + std::to_string(counter++);
}

// Non-blocking connect with a 200 ms budget, so suites skip quickly without a server.
inline bool CanReach(const std::string& host, std::uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return false;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        return false;
    }
    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc == 0) {
        ::close(fd);
        return true;
    }
    if (errno != EINPROGRESS) {
        ::close(fd);
        return false;
    }
    fd_set write_set;
    FD_ZERO(&write_set);
    FD_SET(fd, &write_set);
    timeval tv{};
    tv.tv_sec = 0;
    tv.tv_usec = 200 * 1000;
    rc = ::select(fd + 1, nullptr, &write_set, nullptr, &tv);
    if (rc <= 0) {
        ::close(fd);
        return false;
    }
    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        ::close(fd);
        return false;
    }
    ::close(fd);
    return err == 0;
}

}  // namespace flakeid::test
