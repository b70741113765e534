/***********************************************************************
 *   Copyright © 2021 by Andrey Afletdinov <public.irkutsk@gmail.com>  *
 *                                                                     *
 *   Part of the RDSM: Remote Desktop Session Manager                  *
 *                                                                     *
 *   This program is free software;                                    *
 *   you can redistribute it and/or modify it under the terms of the   *
 *   GNU Affero General Public License as published by the             *
 *   Free Software Foundation; either version 3 of the License, or     *
 *   (at your option) any later version.                               *
 *                                                                     *
 *   This program is distributed in the hope that it will be useful,   *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of    *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.              *
 *   See the GNU Affero General Public License for more details.       *
 *                                                                     *
 *   You should have received a copy of the                            *
 *   GNU Affero General Public License along with this program;        *
 *   if not, write to the Free Software Foundation, Inc.,              *
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.         *
 **********************************************************************/

#include <poll.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

#include <array>
#include <memory>
#include <cerrno>
#include <cinttypes>
#include <cstring>
#include <algorithm>

#include "gnutls/gnutls.h"
#include "gnutls/crypto.h"

#include "rdsm_tools.h"
#include "rdsm_sockets.h"
#include "rdsm_application.h"

namespace RDSM
{
    /* NetworkStream */
    bool NetworkStream::hasInput(int fd, int timeoutMS /* 1ms */)
    {
        if(0 > fd)
        {
            return false;
        }

        struct pollfd fds = {};
        fds.fd = fd;
        fds.events = POLLIN;

        int ret = 0;

        // restart after signals
        do
        {
            ret = poll(& fds, 1, timeoutMS);
        }
        while(0 > ret && errno == EINTR);

        if(0 > ret)
        {
            Application::error("%s: %s failed, error: %s, code: %d", __FUNCTION__, "poll", strerror(errno), errno);
            throw network_error(NS_FuncName);
        }

        // hangup and error are reported as input, the next recv gets the real state
        return 0 < ret && (fds.revents & (POLLIN | POLLHUP | POLLERR));
    }

    size_t NetworkStream::hasData(int fd)
    {
        int count = 0;

        if(0 <= fd && 0 > ioctl(fd, FIONREAD, & count))
        {
            Application::error("%s: %s failed, error: %s, code: %d", __FUNCTION__, "ioctl", strerror(errno), errno);
            throw network_error(NS_FuncName);
        }

        return std::max(count, 0);
    }

    NetworkStream & NetworkStream::sendInt8(uint8_t val)
    {
        sendRaw(& val, 1);
        return *this;
    }

    NetworkStream & NetworkStream::sendZero(size_t length)
    {
        const std::array<uint8_t, 64> zero = {};

        while(length)
        {
            auto len = std::min(length, zero.size());
            sendRaw(zero.data(), len);
            length -= len;
        }

        return *this;
    }

    NetworkStream & NetworkStream::sendData(const std::vector<uint8_t> & buf)
    {
        if(! buf.empty())
        {
            sendRaw(buf.data(), buf.size());
        }

        return *this;
    }

    NetworkStream & NetworkStream::sendString(std::string_view str)
    {
        if(! str.empty())
        {
            sendRaw(str.data(), str.size());
        }

        return *this;
    }

    uint8_t NetworkStream::recvInt8(void) const
    {
        uint8_t val = 0;
        recvRaw(& val, 1);
        return val;
    }

    void NetworkStream::recvSkip(size_t length) const
    {
        std::array<uint8_t, 1024> sink;

        while(length)
        {
            auto len = std::min(length, sink.size());
            recvRaw(sink.data(), len);
            length -= len;
        }
    }

    std::vector<uint8_t> NetworkStream::recvData(size_t length) const
    {
        std::vector<uint8_t> res(length);
        recvData(res.data(), res.size());
        return res;
    }

    void NetworkStream::recvData(void* ptr, size_t len) const
    {
        if(len)
        {
            recvRaw(ptr, len);
        }
    }

    std::string NetworkStream::recvString(size_t length) const
    {
        std::string res(length, 0);
        recvData(res.data(), res.size());
        return res;
    }

    void NetworkStream::recvFrom(int fd, void* ptr, ssize_t len, int timeoutMS)
    {
        auto buf = static_cast<uint8_t*>(ptr);
        ssize_t done = 0;

        while(done < len)
        {
            if(0 < timeoutMS && ! hasInput(fd, timeoutMS))
            {
                Application::warning("%s: %s, timeout: %dms", __FUNCTION__, "read timeout", timeoutMS);
                throw network_error("read timeout");
            }

            ssize_t real = recv(fd, buf + done, len - done, 0);

            if(0 < real)
            {
                done += real;
                continue;
            }

            if(0 == real)
            {
                Application::debug(DebugType::Sock, "%s: %s, fd: %d", __FUNCTION__, "end stream", fd);
                throw network_error("end stream");
            }

            if(errno != EAGAIN && errno != EINTR)
            {
                Application::error("%s: %s failed, error: %s, code: %d", __FUNCTION__, "recv", strerror(errno), errno);
                throw network_error(NS_FuncName);
            }
        }
    }

    void NetworkStream::sendTo(int fd, const void* ptr, ssize_t len)
    {
        auto buf = static_cast<const uint8_t*>(ptr);
        ssize_t done = 0;

        while(done < len)
        {
            // peer reset must not raise SIGPIPE
            ssize_t real = send(fd, buf + done, len - done, MSG_NOSIGNAL);

            if(0 < real)
            {
                done += real;
                continue;
            }

            if(0 == real)
            {
                Application::debug(DebugType::Sock, "%s: %s, fd: %d", __FUNCTION__, "end stream", fd);
                throw network_error("end stream");
            }

            if(errno != EAGAIN && errno != EINTR)
            {
                Application::error("%s: %s failed, error: %s, code: %d", __FUNCTION__, "send", strerror(errno), errno);
                throw network_error(NS_FuncName);
            }
        }
    }

    /* SocketStream */
    SocketStream::SocketStream(int fd) : sock(fd)
    {
    }

    SocketStream::~SocketStream()
    {
        reset();
    }

    void SocketStream::shutdown(void)
    {
        if(0 <= sock)
        {
            ::shutdown(sock, SHUT_RDWR);
        }
    }

    void SocketStream::reset(void)
    {
        if(0 <= sock)
        {
            ::shutdown(sock, SHUT_RDWR);
            close(sock);
            sock = -1;
        }
    }

    bool SocketStream::hasInput(void) const
    {
        return NetworkStream::hasInput(sock);
    }

    bool SocketStream::waitInput(int timeoutMS) const
    {
        return NetworkStream::hasInput(sock, timeoutMS);
    }

    size_t SocketStream::hasData(void) const
    {
        return NetworkStream::hasData(sock);
    }

    void SocketStream::recvRaw(void* ptr, size_t len) const
    {
        recvFrom(sock, ptr, len, recvTimeout);
        bytesIn += len;
    }

    void SocketStream::sendRaw(const void* ptr, size_t len)
    {
        sendTo(sock, ptr, len);
        bytesOut += len;
    }

    /* TCPSocket */
    static bool ipv4Address(const std::string & addr, uint16_t port, struct sockaddr_in & res)
    {
        std::memset(& res, 0, sizeof(res));

        res.sin_family = AF_INET;
        res.sin_port = htons(port);

        if(addr == "any")
        {
            res.sin_addr.s_addr = htonl(INADDR_ANY);
            return true;
        }

        return 1 == inet_pton(AF_INET, addr.c_str(), & res.sin_addr);
    }

    int TCPSocket::listen(std::string_view ipaddr, uint16_t port, int conn)
    {
        const std::string addr{ipaddr.begin(), ipaddr.end()};
        struct sockaddr_in sockaddr;

        if(! ipv4Address(addr, port, sockaddr))
        {
            Application::error("%s: invalid address: `%s'", __FUNCTION__, addr.c_str());
            return -1;
        }

        int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);

        if(0 > fd)
        {
            Application::error("%s: %s failed, error: %s, code: %d", __FUNCTION__, "socket", strerror(errno), errno);
            return -1;
        }

        int reuse = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, & reuse, sizeof(reuse));

        if(0 != bind(fd, reinterpret_cast<struct sockaddr*>(& sockaddr), sizeof(sockaddr)) || 0 != ::listen(fd, conn))
        {
            int err = errno;
            Application::error("%s: %s failed, error: %s, code: %d, addr: `%s', port: %" PRIu16, __FUNCTION__, "bind/listen", strerror(err), err, addr.c_str(), port);
            close(fd);
            errno = err;
            return -1;
        }

        Application::debug(DebugType::Sock, "%s: fd: %d, addr: `%s', port: %" PRIu16, __FUNCTION__, fd, addr.c_str(), localPort(fd));
        return fd;
    }

    int TCPSocket::accept(int fd)
    {
        int sock = -1;

        do
        {
            sock = ::accept4(fd, nullptr, nullptr, SOCK_CLOEXEC);
        }
        while(0 > sock && errno == EINTR);

        if(0 > sock)
        {
            // listener shutdown also ends here
            Application::debug(DebugType::Sock, "%s: %s failed, error: %s", __FUNCTION__, "accept", strerror(errno));
            return -1;
        }

        Application::debug(DebugType::Sock, "%s: client fd: %d", __FUNCTION__, sock);
        return sock;
    }

    uint16_t TCPSocket::localPort(int fd)
    {
        struct sockaddr_in sockaddr = {};
        socklen_t socklen = sizeof(sockaddr);

        if(0 != getsockname(fd, reinterpret_cast<struct sockaddr*>(& sockaddr), & socklen))
        {
            Application::error("%s: %s failed, error: %s, code: %d", __FUNCTION__, "getsockname", strerror(errno), errno);
            return 0;
        }

        return ntohs(sockaddr.sin_port);
    }

    std::list<std::string> TCPSocket::resolvHostname2(std::string_view hostname)
    {
        const std::string name{hostname.begin(), hostname.end()};
        std::list<std::string> res;

        struct addrinfo hints = {};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* info = nullptr;

        if(int err = getaddrinfo(name.c_str(), nullptr, & hints, & info))
        {
            Application::error("%s: error: %s, hostname: `%s'", __FUNCTION__, gai_strerror(err), name.c_str());
            return res;
        }

        std::unique_ptr<struct addrinfo, void(*)(struct addrinfo*)> guard{ info, freeaddrinfo };
        char buf[INET_ADDRSTRLEN];

        for(auto it = info; it; it = it->ai_next)
        {
            auto sin = reinterpret_cast<const struct sockaddr_in*>(it->ai_addr);

            if(inet_ntop(AF_INET, & sin->sin_addr, buf, sizeof(buf)))
            {
                // one entry per address, not per socket type
                if(std::find(res.begin(), res.end(), buf) == res.end())
                {
                    res.emplace_back(buf);
                }
            }
        }

        Application::debug(DebugType::Sock, "%s: hostname: `%s', addresses: %lu", __FUNCTION__, name.c_str(), res.size());
        return res;
    }

    std::string TCPSocket::resolvHostname(std::string_view hostname)
    {
        auto list = resolvHostname2(hostname);
        return list.empty() ? "" : list.front();
    }

    int TCPSocket::connect(std::string_view ipaddr, uint16_t port, int timeoutMS)
    {
        const std::string addr{ipaddr.begin(), ipaddr.end()};
        struct sockaddr_in sockaddr;

        if(! ipv4Address(addr, port, sockaddr))
        {
            Application::error("%s: invalid address: `%s'", __FUNCTION__, addr.c_str());
            errno = EINVAL;
            return -1;
        }

        int sock = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);

        if(0 > sock)
        {
            int err = errno;
            Application::error("%s: %s failed, error: %s, code: %d", __FUNCTION__, "socket", strerror(err), err);
            errno = err;
            return -1;
        }

        Application::debug(DebugType::Sock, "%s: addr: `%s', port: %" PRIu16 ", timeout: %dms", __FUNCTION__, addr.c_str(), port, timeoutMS);

        int flags = fcntl(sock, F_GETFL, 0);

        // non blocking connect bounded by poll
        if(0 < timeoutMS)
        {
            fcntl(sock, F_SETFL, flags | O_NONBLOCK);
        }

        int err = 0;

        if(0 != ::connect(sock, reinterpret_cast<struct sockaddr*>(& sockaddr), sizeof(sockaddr)))
        {
            err = errno;
        }

        if(err == EINPROGRESS)
        {
            struct pollfd fds = {};
            fds.fd = sock;
            fds.events = POLLOUT;

            int ret = poll(& fds, 1, timeoutMS);

            if(0 == ret)
            {
                err = ETIMEDOUT;
            }
            else if(0 > ret)
            {
                err = errno;
            }
            else
            {
                socklen_t errlen = sizeof(err);
                getsockopt(sock, SOL_SOCKET, SO_ERROR, & err, & errlen);
            }
        }

        if(err)
        {
            Application::error("%s: %s failed, error: %s, code: %d, addr: `%s', port: %" PRIu16, __FUNCTION__, "connect", strerror(err), err, addr.c_str(), port);
            close(sock);
            errno = err;
            return -1;
        }

        fcntl(sock, F_SETFL, flags);

        Application::debug(DebugType::Sock, "%s: connected, fd: %d", __FUNCTION__, sock);
        return sock;
    }

    /* TLS */
    namespace TLS
    {
        std::vector<uint8_t> encryptDES(const std::vector<uint8_t> & data, std::string_view str)
        {
            gnutls_cipher_hd_t ctx;
            std::vector<uint8_t> res(data);
            std::array<uint8_t, 8> _key = {0,0,0,0,0,0,0,0};
            std::array<uint8_t, 8> _iv = {0,0,0,0,0,0,0,0};
            std::copy_n(reinterpret_cast<const uint8_t*>(str.data()), std::min(str.size(), _key.size()), _key.begin());
            gnutls_datum_t key = { _key.data(), static_cast<unsigned int>(_key.size()) };
            gnutls_datum_t iv = { _iv.data(), static_cast<unsigned int>(_iv.size()) };

            // Reverse the order of bits in the byte
            for(auto & val : _key)
                if(val) { val = ((val * 0x0202020202ULL & 0x010884422010ULL) % 1023) & 0xfe; }

            size_t offset = 0;

            // ecb mode: every block with a fresh zero iv
            while(offset < res.size())
            {
                if(int ret = gnutls_cipher_init(& ctx, GNUTLS_CIPHER_DES_CBC, & key, & iv))
                {
                    Application::error("%s: %s error: %s", __FUNCTION__, "gnutls_cipher_init", gnutls_strerror(ret));
                    throw gnutls_error(NS_FuncName);
                }

                if(int ret = gnutls_cipher_encrypt(ctx, res.data() + offset, std::min(_key.size(), res.size() - offset)))
                {
                    gnutls_cipher_deinit(ctx);
                    Application::error("%s: %s error: %s", __FUNCTION__, "gnutls_cipher_encrypt", gnutls_strerror(ret));
                    throw gnutls_error(NS_FuncName);
                }

                gnutls_cipher_deinit(ctx);
                offset += _key.size();
            }

            return res;
        }

        static std::vector<uint8_t> cryptAES128(const std::vector<uint8_t> & data, const std::vector<uint8_t> & secret, bool encrypt)
        {
            const size_t blockSize = 16;

            if(secret.size() != blockSize || data.size() % blockSize)
            {
                Application::error("%s: invalid size, key: %lu, data: %lu", __FUNCTION__, secret.size(), data.size());
                throw gnutls_error(NS_FuncName);
            }

            gnutls_cipher_hd_t ctx;
            std::vector<uint8_t> res(data);
            std::array<uint8_t, blockSize> _iv;
            _iv.fill(0);

            gnutls_datum_t key = { const_cast<uint8_t*>(secret.data()), static_cast<unsigned int>(secret.size()) };
            gnutls_datum_t iv = { _iv.data(), static_cast<unsigned int>(_iv.size()) };

            if(int ret = gnutls_cipher_init(& ctx, GNUTLS_CIPHER_AES_128_CBC, & key, & iv))
            {
                Application::error("%s: %s error: %s", __FUNCTION__, "gnutls_cipher_init", gnutls_strerror(ret));
                throw gnutls_error(NS_FuncName);
            }

            // ecb mode: zero iv before every block
            for(size_t offset = 0; offset < res.size(); offset += blockSize)
            {
                gnutls_cipher_set_iv(ctx, _iv.data(), _iv.size());

                int ret = encrypt ?
                          gnutls_cipher_encrypt(ctx, res.data() + offset, blockSize) :
                          gnutls_cipher_decrypt(ctx, res.data() + offset, blockSize);

                if(ret)
                {
                    gnutls_cipher_deinit(ctx);
                    Application::error("%s: %s error: %s", __FUNCTION__, (encrypt ? "gnutls_cipher_encrypt" : "gnutls_cipher_decrypt"), gnutls_strerror(ret));
                    throw gnutls_error(NS_FuncName);
                }
            }

            gnutls_cipher_deinit(ctx);
            return res;
        }

        std::vector<uint8_t> encryptAES128(const std::vector<uint8_t> & data, const std::vector<uint8_t> & key)
        {
            return cryptAES128(data, key, true);
        }

        std::vector<uint8_t> decryptAES128(const std::vector<uint8_t> & data, const std::vector<uint8_t> & key)
        {
            return cryptAES128(data, key, false);
        }

        std::vector<uint8_t> hashMD5(const std::vector<uint8_t> & data)
        {
            std::vector<uint8_t> res(gnutls_hash_get_len(GNUTLS_DIG_MD5), 0);

            if(int ret = gnutls_hash_fast(GNUTLS_DIG_MD5, data.data(), data.size(), res.data()))
            {
                Application::error("%s: %s error: %s", __FUNCTION__, "gnutls_hash_fast", gnutls_strerror(ret));
                throw gnutls_error(NS_FuncName);
            }

            return res;
        }

        std::vector<uint8_t> randomKey(size_t keysz)
        {
            std::vector<uint8_t> res(keysz);

            if(int ret = gnutls_rnd(GNUTLS_RND_KEY, res.data(), res.size()))
            {
                Application::error("%s: %s error: %s", __FUNCTION__, "gnutls_rnd", gnutls_strerror(ret));
                throw gnutls_error(NS_FuncName);
            }

            return res;
        }
    }
}
