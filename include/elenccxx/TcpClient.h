// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ByteSource.h"
#include "Errors.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace elenc
{

/// TCP client for the encoder controller. Owns the socket.
class TcpClient : public ByteSource
{
public:
    TcpClient(std::string address, uint16_t port, bool verbose = false)
    : address_(std::move(address)), port_(port), verbose_(verbose)
    {}

    ~TcpClient() override { close(); }

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    /**
     * Connect to the peer, then wait `settle` before the first read so the
     * controller can start streaming. Throws StreamError on failure.
     */
    void connect(std::chrono::milliseconds settle = std::chrono::milliseconds(0))
    {
        if (sockfd_ >= 0)
        {
            if (verbose_) std::cerr << "[TCP] Already connected." << std::endl;
            return;
        }

        struct sockaddr_in addr = {};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port_);
        if (inet_pton(AF_INET, address_.c_str(), &addr.sin_addr) != 1)
            throw StreamError("Invalid peer address: " + address_);

        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
            throw StreamError(std::string("Error creating socket: ") + std::strerror(errno));

        if (::connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0)
        {
            int err = errno;
            ::close(fd);
            throw StreamError("Cannot connect to " + endpoint() + ": " + std::strerror(err));
        }

        sockfd_ = fd;
        if (verbose_) std::cerr << "[TCP] Connected to " << endpoint() << std::endl;

        if (settle.count() > 0) std::this_thread::sleep_for(settle);
    }

    void close()
    {
        if (sockfd_ >= 0)
        {
            ::close(sockfd_);
            sockfd_ = -1;
            if (verbose_) std::cerr << "[TCP] Connection closed." << std::endl;
        }
    }

    bool connected() const override { return sockfd_ >= 0; }

    std::optional<size_t> read(uint8_t* buffer, size_t max_len) override
    {
        if (sockfd_ < 0)
            throw NotConnectedError("Not connected.");

        ssize_t n = ::recv(sockfd_, buffer, max_len, 0);
        if (n < 0)
        {
            if (errno == EINTR) return std::nullopt;
            throw StreamError(std::string("Receive failed: ") + std::strerror(errno));
        }
        return static_cast<size_t>(n);
    }

    std::string endpoint() const { return address_ + ":" + std::to_string(port_); }

private:
    std::string address_;
    uint16_t port_;
    bool verbose_;
    int sockfd_ = -1;
};

} // namespace elenc
