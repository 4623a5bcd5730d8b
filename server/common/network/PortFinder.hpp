#pragma once

#include "common/utils/AppException.hpp"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

/**
 * @brief 空闲端口查找（仅启动阶段使用）
 *
 * 按升序逐个尝试绑定 [start, end]，返回第一个可绑定的端口。
 * 探测 socket 绑定成功后立即关闭，由 Drogon 随后正式监听。
 */
class PortFinder {
public:
    /**
     * @brief 查找空闲端口
     * @throws NoFreePortError 范围内没有可绑定的端口
     */
    static uint16_t findFreePort(const std::string& host, int start, int end) {
        LOG_INFO << "[PortFinder] Searching for free port in range " << start << "-" << end;

        for (int port = std::max(start, 1); port <= std::min(end, 65535); ++port) {
            std::string error;
            if (tryBind(host, static_cast<uint16_t>(port), error)) {
                LOG_INFO << "[PortFinder] Found free port: " << port;
                return static_cast<uint16_t>(port);
            }
            LOG_DEBUG << "[PortFinder] Port " << port << " is not available: " << error;
        }

        throw NoFreePortError(start, end);
    }

    /**
     * @brief 尝试在 host:port 上绑定（SO_REUSEADDR），成功后立即释放
     */
    static bool tryBind(const std::string& host, uint16_t port, std::string& error) {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

        addrinfo* resolved = nullptr;
        auto service = std::to_string(port);
        int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &resolved);
        if (rc != 0 || !resolved) {
            error = std::string("cannot resolve host '") + host + "': " + ::gai_strerror(rc);
            return false;
        }
        std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(resolved, &::freeaddrinfo);

        int fd = ::socket(resolved->ai_family, resolved->ai_socktype, resolved->ai_protocol);
        if (fd < 0) {
            error = std::strerror(errno);
            return false;
        }

        int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        bool bound = ::bind(fd, resolved->ai_addr, resolved->ai_addrlen) == 0;
        if (!bound) {
            error = std::strerror(errno);
        }
        ::close(fd);
        return bound;
    }
};
