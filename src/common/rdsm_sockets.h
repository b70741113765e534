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

#ifndef _RDSM_SOCKETS_
#define _RDSM_SOCKETS_

#include <list>
#include <atomic>
#include <vector>
#include <string>
#include <cstdint>
#include <stdexcept>
#include <string_view>

#include <sys/types.h>

#include "rdsm_streambuf.h"

#define RDSM_SOCKETS_VERSION 20240610

namespace RDSM
{
    struct network_error : public std::runtime_error
    {
        explicit network_error(const std::string & what) : std::runtime_error(what){}
        explicit network_error(const char* what) : std::runtime_error(what){}
    };

    /// @brief: network stream interface
    class NetworkStream : protected ByteOrderInterface
    {
    protected:
        inline void             getRaw(void* ptr, size_t len) const override { recvRaw(ptr, len); };
        inline void             putRaw(const void* ptr, size_t len) override { sendRaw(ptr, len); };

    public:
        NetworkStream() = default;
        virtual ~NetworkStream() = default;

        static bool             hasInput(int fd, int timeoutMS = 1);
        static size_t           hasData(int fd);

        inline NetworkStream &  sendIntBE16(uint16_t x) { putIntBE16(x); return *this; }
        inline NetworkStream &  sendIntBE32(uint32_t x) { putIntBE32(x); return *this; }

        NetworkStream &         sendInt8(uint8_t);
        NetworkStream &         sendZero(size_t);
        NetworkStream &         sendData(const std::vector<uint8_t> &);
        NetworkStream &         sendString(std::string_view);

        virtual void            sendFlush(void) {}
        virtual void            sendRaw(const void*, size_t) = 0;

        virtual bool            hasInput(void) const = 0;
        virtual size_t          hasData(void) const = 0;
        /// @brief: wait for input up to timeout
        virtual bool            waitInput(int timeoutMS) const = 0;

        inline uint16_t         recvIntBE16(void) const { return getIntBE16(); }
        inline uint32_t         recvIntBE32(void) const { return getIntBE32(); }

        uint8_t                 recvInt8(void) const;
        void                    recvSkip(size_t) const;
        std::vector<uint8_t>    recvData(size_t) const;
        void                    recvData(void* ptr, size_t len) const;
        std::string             recvString(size_t) const;

        virtual void            recvRaw(void*, size_t) const = 0;

        static void             sendTo(int fd, const void*, ssize_t);
        static void             recvFrom(int fd, void*, ssize_t, int timeoutMS = 0);
    };

    /// @brief: socket stream, owner of the descriptor
    class SocketStream : public NetworkStream
    {
    protected:
        int                     sock = -1;
        int                     recvTimeout = 0;

        mutable std::atomic<uint64_t> bytesIn{0};
        std::atomic<uint64_t>   bytesOut{0};

    public:
        explicit SocketStream(int fd);
        ~SocketStream();

        SocketStream(const SocketStream &) = delete;
        SocketStream & operator=(const SocketStream &) = delete;

        int                     socket(void) const { return sock; }

        /// @brief: close both directions, the descriptor stays owned until reset
        void                    shutdown(void);
        void                    reset(void);

        /// @brief: 0 means blocking reads without limit
        void                    setRecvTimeout(int ms) { recvTimeout = ms; }
        int                     recvTimeoutMS(void) const { return recvTimeout; }

        uint64_t                totalBytesIn(void) const { return bytesIn.load(); }
        uint64_t                totalBytesOut(void) const { return bytesOut.load(); }

        bool                    hasInput(void) const override;
        size_t                  hasData(void) const override;
        bool                    waitInput(int timeoutMS) const override;

        void                    sendRaw(const void*, size_t) override;
        void                    recvRaw(void*, size_t) const override;
    };

    namespace TCPSocket
    {
        std::string             resolvHostname(std::string_view hostname);
        std::list<std::string>  resolvHostname2(std::string_view hostname);

        /// @brief: connect to ipv4 address, return descriptor or -1 with errno preserved
        int                     connect(std::string_view ipaddr, uint16_t port, int timeoutMS = 0);
        int                     listen(std::string_view ipaddr, uint16_t port, int conn = 5);
        int                     accept(int fd);
        uint16_t                localPort(int fd);
    }

    struct gnutls_error : public std::runtime_error
    {
        explicit gnutls_error(const std::string & what) : std::runtime_error(what){}
        explicit gnutls_error(const char* what) : std::runtime_error(what){}
    };

    /// crypto primitives, gnutls backend
    namespace TLS
    {
        std::vector<uint8_t>    randomKey(size_t);

        std::vector<uint8_t>    encryptDES(const std::vector<uint8_t> & crypt, std::string_view key);

        std::vector<uint8_t>    encryptAES128(const std::vector<uint8_t> & data, const std::vector<uint8_t> & key);
        std::vector<uint8_t>    decryptAES128(const std::vector<uint8_t> & data, const std::vector<uint8_t> & key);

        std::vector<uint8_t>    hashMD5(const std::vector<uint8_t> &);
    }
}

#endif // _RDSM_SOCKETS_
