#ifndef _RDSM_TESTS_FAKE_SERVER_
#define _RDSM_TESTS_FAKE_SERVER_

#include <memory>
#include <thread>
#include <string>
#include <iostream>
#include <stdexcept>
#include <functional>
#include <string_view>

#include <unistd.h>
#include <sys/socket.h>

#include "rdsm_sockets.h"
#include "rdsm_librfb.h"

namespace RDSM
{
    namespace Test
    {
        /// connected local pair, server side scripts may be written ahead
        struct SocketPair
        {
            std::unique_ptr<SocketStream> client;
            std::unique_ptr<SocketStream> server;

            SocketPair()
            {
                int fds[2];

                if(0 != socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds))
                {
                    throw std::runtime_error("socketpair failed");
                }

                client = std::make_unique<SocketStream>(fds[0]);
                server = std::make_unique<SocketStream>(fds[1]);
            }
        };

        /// server side of an unauthenticated 3.8 handshake, returns the client shared flag
        inline int serverHandshakeNone(SocketStream & srv, uint16_t width, uint16_t height, std::string_view name)
        {
            srv.sendString("RFB 003.008\n").sendFlush();

            if(srv.recvString(12) != "RFB 003.008\n")
            {
                throw std::runtime_error("unexpected client version");
            }

            srv.sendInt8(1).sendInt8(RFB::SECURITY_TYPE_NONE).sendFlush();

            if(srv.recvInt8() != RFB::SECURITY_TYPE_NONE)
            {
                throw std::runtime_error("unexpected security type");
            }

            srv.sendIntBE32(RFB::SECURITY_RESULT_OK).sendFlush();
            int shared = srv.recvInt8();

            srv.sendIntBE16(width).sendIntBE16(height);
            srv.sendData(RFB::RGB888.toBinary());
            srv.sendIntBE32(name.size()).sendString(name).sendFlush();

            return shared;
        }

        /// server init followed by nothing, for pre-written scripts
        inline void serverInit(NetworkStream & srv, uint16_t width, uint16_t height, std::string_view name)
        {
            srv.sendIntBE16(width).sendIntBE16(height);
            srv.sendData(RFB::RGB888.toBinary());
            srv.sendIntBE32(name.size()).sendString(name).sendFlush();
        }

        /// read client messages until the client closes the connection
        inline void waitClientClose(SocketStream & srv)
        {
            try
            {
                while(true)
                {
                    srv.recvInt8();
                }
            }
            catch(const network_error &)
            {
                // client closed
            }
        }

        /// single connection loopback server, script runs on the accepted socket
        class FakeServer
        {
            int listenFd = -1;
            uint16_t port = 0;
            std::thread thread;

        public:
            explicit FakeServer(std::function<void(SocketStream &)> script)
            {
                listenFd = TCPSocket::listen("127.0.0.1", 0, 5);

                if(0 > listenFd)
                {
                    throw std::runtime_error("listen failed");
                }

                port = TCPSocket::localPort(listenFd);

                thread = std::thread([this, script]()
                {
                    int fd = TCPSocket::accept(this->listenFd);

                    if(0 > fd)
                    {
                        return;
                    }

                    SocketStream sock(fd);

                    try
                    {
                        script(sock);
                    }
                    catch(const std::exception & err)
                    {
                        std::cerr << "fake server: " << err.what() << std::endl;
                    }
                });
            }

            ~FakeServer()
            {
                // wake a pending accept
                ::shutdown(listenFd, SHUT_RDWR);

                if(thread.joinable())
                {
                    thread.join();
                }

                ::close(listenFd);
            }

            uint16_t localPort(void) const
            {
                return port;
            }
        };
    }
}

#endif // _RDSM_TESTS_FAKE_SERVER_
