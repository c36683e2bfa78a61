/**
 * @file GsmtapUdpSource.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Live GSMTAP-SIM capture implementation
 * @version 0.1
 * @date 2026-03-08
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include "SimTrace/Source/GsmtapUdpSource.h"
#include "SimTrace/Source/GsmtapParser.h"
#include "SimTrace/BufferSizes.h"
#include "Utils/Logging.h"

using namespace simtrace;
using namespace error;

// ==============================================================================
// Initialization and Teardown
// ==============================================================================

GsmtapUdpSource::GsmtapUdpSource(const etl::string<64>& bindIp, uint16_t bindPort)
    : bindIp(bindIp)
    , bindPort(bindPort)
    , socketFd(-1)
{
}

GsmtapUdpSource::~GsmtapUdpSource()
{
    close();
}

// ==============================================================================
// Open and Close
// ==============================================================================

etl::expected<void, Error> GsmtapUdpSource::open()
{
    if (socketFd >= 0)
    {
        return {};
    }

    sockaddr_in address = {};
    address.sin_family = AF_INET;
    address.sin_port = htons(bindPort);
    if (inet_pton(AF_INET, bindIp.c_str(), &address.sin_addr) != 1)
    {
        LOG_ERROR("Invalid bind address %s", bindIp.c_str());
        return etl::unexpected(Error::fromSource(SourceError::BindFailed));
    }

    const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0)
    {
        LOG_ERROR("Cannot create UDP socket: %s", std::strerror(errno));
        return etl::unexpected(Error::fromSource(SourceError::SocketError));
    }

    int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0)
    {
        LOG_WARN("SO_REUSEADDR failed: %s", std::strerror(errno));
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0)
    {
        LOG_ERROR("Cannot bind %s:%u: %s", bindIp.c_str(), static_cast<unsigned>(bindPort), std::strerror(errno));
        ::close(fd);
        return etl::unexpected(Error::fromSource(SourceError::BindFailed));
    }

    socketFd = fd;
    LOG_INFO("Listening for GSMTAP on %s:%u", bindIp.c_str(), static_cast<unsigned>(bindPort));
    return {};
}

void GsmtapUdpSource::close()
{
    if (socketFd >= 0)
    {
        ::close(socketFd);
        socketFd = -1;
        LOG_DEBUG("GSMTAP socket closed");
    }
}

// ==============================================================================
// Read
// ==============================================================================

etl::expected<SourceEvent, Error> GsmtapUdpSource::readNext()
{
    if (socketFd < 0)
    {
        return etl::unexpected(Error::fromSource(SourceError::NotOpen));
    }

    uint8_t datagram[buffer::PACKET_MAX];

    while (true)
    {
        const ssize_t received = ::recv(socketFd, datagram, sizeof(datagram), 0);
        if (received < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            LOG_ERROR("Receiving from GSMTAP socket failed: %s", std::strerror(errno));
            return etl::unexpected(Error::fromSource(SourceError::ReadFailed));
        }

        auto event = gsmtap::parse(datagram, static_cast<size_t>(received));
        if (!event)
        {
            LOG_WARN("Skipping GSMTAP datagram of %d bytes: %s",
                     static_cast<int>(received), event.error().toString().c_str());
            continue;
        }

        if (event.value().has_value())
        {
            return event.value().value();
        }
    }
}
