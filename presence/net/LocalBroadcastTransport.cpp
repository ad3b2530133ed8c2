#include "presence/net/LocalBroadcastTransport.hpp"

#include <cerrno>
#include <cstring>

#include "presence/core/Log.hpp"

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#ifdef _MSC_VER
#pragma comment(lib, "ws2_32.lib")
#endif
using SocketLength = int;
using NativeSocket = SOCKET;
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
using SocketLength = socklen_t;
using NativeSocket = int;
#endif

namespace presence::net
{
namespace
{
constexpr const char* kTag = "LocalBroadcast";
constexpr const char* kHeaderPrefix = "PRESENCE|";

#ifdef _WIN32
void CloseNativeSocket(int socketFd)
{
    if (socketFd >= 0)
    {
        closesocket(static_cast<SOCKET>(socketFd));
    }
}
#else
void CloseNativeSocket(int socketFd)
{
    if (socketFd >= 0)
    {
        close(socketFd);
    }
}
#endif

std::string LastSocketError()
{
#ifdef _WIN32
    return "WSA error " + std::to_string(WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}
} // namespace

std::unique_ptr<LocalBroadcastTransport> LocalBroadcastTransport::Open(
    const core::LocalBroadcastSettings& settings,
    const std::string& roomKey,
    const std::string& originId,
    std::string* outError
)
{
    if (!settings.enabled)
    {
        if (outError != nullptr)
        {
            *outError = "Local broadcast disabled by configuration.";
        }
        return nullptr;
    }

    std::unique_ptr<LocalBroadcastTransport> transport(new LocalBroadcastTransport(settings, roomKey, originId));
    if (!transport->OpenSocket(outError))
    {
        return nullptr;
    }
    return transport;
}

LocalBroadcastTransport::LocalBroadcastTransport(
    core::LocalBroadcastSettings settings,
    const std::string& roomKey,
    std::string originId
)
    : TransportProvider(roomKey)
    , m_settings(std::move(settings))
    , m_originId(std::move(originId))
{
}

LocalBroadcastTransport::~LocalBroadcastTransport()
{
    std::lock_guard<std::mutex> lock(m_socketMutex);
    CloseSocket();
}

bool LocalBroadcastTransport::Send(const std::string& payload)
{
    const std::string datagram = BuildDatagram(RoomKey(), m_originId, payload);
    if (datagram.size() > kMaxDatagramBytes)
    {
        core::Log::Warn(kTag, "Payload too large for a datagram (" + std::to_string(datagram.size()) + " bytes).");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_socketMutex);
    if (m_socket < 0)
    {
        return false;
    }

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(m_settings.port);
    address.sin_addr.s_addr = m_groupAddress;

    const int sent = sendto(
        static_cast<NativeSocket>(m_socket),
        datagram.data(),
        static_cast<int>(datagram.size()),
        0,
        reinterpret_cast<sockaddr*>(&address),
        sizeof(address)
    );

    return sent >= 0;
}

void LocalBroadcastTransport::CollectIncoming(std::vector<std::string>& outPayloads)
{
    std::lock_guard<std::mutex> lock(m_socketMutex);
    if (m_socket < 0)
    {
        return;
    }

    std::vector<char> buffer(kMaxDatagramBytes + 1);
    while (true)
    {
        sockaddr_in from{};
        SocketLength fromLength = sizeof(from);
        const int received = recvfrom(
            static_cast<NativeSocket>(m_socket),
            buffer.data(),
            static_cast<int>(buffer.size() - 1),
            0,
            reinterpret_cast<sockaddr*>(&from),
            &fromLength
        );

        if (received <= 0)
        {
            break;
        }

        const std::string datagram(buffer.data(), static_cast<std::size_t>(received));
        std::string roomKey;
        std::string originId;
        std::string payload;
        if (!ParseDatagram(datagram, roomKey, originId, payload))
        {
            continue;
        }

        // Own datagrams come back through multicast loopback.
        if (roomKey != RoomKey() || originId == m_originId)
        {
            continue;
        }

        outPayloads.push_back(std::move(payload));
    }
}

std::string LocalBroadcastTransport::BuildDatagram(
    const std::string& roomKey,
    const std::string& originId,
    const std::string& payload
)
{
    return std::string(kHeaderPrefix) + "room=" + roomKey + "|origin=" + originId + "\n" + payload;
}

bool LocalBroadcastTransport::ParseDatagram(
    const std::string& datagram,
    std::string& outRoomKey,
    std::string& outOriginId,
    std::string& outPayload
)
{
    if (datagram.rfind(kHeaderPrefix, 0) != 0)
    {
        return false;
    }

    const std::size_t newline = datagram.find('\n');
    if (newline == std::string::npos)
    {
        return false;
    }

    const std::string header = datagram.substr(0, newline);
    outRoomKey = ParseField(header, "room");
    outOriginId = ParseField(header, "origin");
    if (outRoomKey.empty() || outOriginId.empty())
    {
        return false;
    }

    outPayload = datagram.substr(newline + 1);
    return true;
}

std::string LocalBroadcastTransport::ParseField(const std::string& header, const std::string& key)
{
    const std::string token = "|" + key + "=";
    const std::size_t begin = header.find(token);
    if (begin == std::string::npos)
    {
        return {};
    }

    const std::size_t valueStart = begin + token.size();
    std::size_t valueEnd = header.find('|', valueStart);
    if (valueEnd == std::string::npos)
    {
        valueEnd = header.size();
    }

    return header.substr(valueStart, valueEnd - valueStart);
}

bool LocalBroadcastTransport::OpenSocket(std::string* outError)
{
    auto fail = [&](const std::string& what, int socketFd) {
        if (outError != nullptr)
        {
            *outError = what + ": " + LastSocketError();
        }
        CloseNativeSocket(socketFd);
#ifdef _WIN32
        if (m_wsaInitialized)
        {
            WSACleanup();
            m_wsaInitialized = false;
        }
#endif
        return false;
    };

#ifdef _WIN32
    WSADATA wsaData{};
    if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0)
    {
        if (outError != nullptr)
        {
            *outError = "WSAStartup failed.";
        }
        return false;
    }
    m_wsaInitialized = true;
#endif

    in_addr group{};
    if (inet_pton(AF_INET, m_settings.group.c_str(), &group) != 1 || !IN_MULTICAST(ntohl(group.s_addr)))
    {
        return fail("Invalid multicast group " + m_settings.group, -1);
    }
    m_groupAddress = group.s_addr;

    const int socketFd = static_cast<int>(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (socketFd < 0)
    {
        return fail("Socket creation failed", -1);
    }

    int opt = 1;
    setsockopt(socketFd, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt), sizeof(opt));
#ifdef SO_REUSEPORT
    setsockopt(socketFd, SOL_SOCKET, SO_REUSEPORT, reinterpret_cast<const char*>(&opt), sizeof(opt));
#endif

#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(static_cast<SOCKET>(socketFd), FIONBIO, &mode);
#else
    const int flags = fcntl(socketFd, F_GETFL, 0);
    fcntl(socketFd, F_SETFL, flags | O_NONBLOCK);
#endif

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(m_settings.port);
    address.sin_addr.s_addr = htonl(INADDR_ANY);

    if (bind(static_cast<NativeSocket>(socketFd), reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0)
    {
        return fail("Bind to port " + std::to_string(m_settings.port) + " failed", socketFd);
    }

    ip_mreq membership{};
    membership.imr_multiaddr = group;
    membership.imr_interface.s_addr = htonl(INADDR_ANY);
    if (setsockopt(socketFd, IPPROTO_IP, IP_ADD_MEMBERSHIP, reinterpret_cast<const char*>(&membership), sizeof(membership)) < 0)
    {
        return fail("Joining multicast group failed", socketFd);
    }

    // Zero TTL keeps datagrams on this host; loopback delivers them to the other local listeners.
    const unsigned char ttl = 0;
    const unsigned char loop = 1;
    setsockopt(socketFd, IPPROTO_IP, IP_MULTICAST_TTL, reinterpret_cast<const char*>(&ttl), sizeof(ttl));
    if (setsockopt(socketFd, IPPROTO_IP, IP_MULTICAST_LOOP, reinterpret_cast<const char*>(&loop), sizeof(loop)) < 0)
    {
        return fail("Enabling multicast loopback failed", socketFd);
    }

    m_socket = socketFd;
    core::Log::Debug(kTag, "Listening on " + m_settings.group + ":" + std::to_string(m_settings.port) + " for " + RoomKey());
    return true;
}

void LocalBroadcastTransport::CloseSocket()
{
    if (m_socket >= 0)
    {
        CloseNativeSocket(m_socket);
        m_socket = -1;
    }

#ifdef _WIN32
    if (m_wsaInitialized)
    {
        WSACleanup();
        m_wsaInitialized = false;
    }
#endif
}
} // namespace presence::net
