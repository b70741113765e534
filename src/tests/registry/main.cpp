#include <list>
#include <mutex>
#include <chrono>
#include <thread>
#include <vector>
#include <iostream>
#include <cassert>
#include <stdexcept>

#include "rdsm_sockets.h"
#include "librfb_registry.h"
#include "../common/rfb_fake_server.h"

using namespace RDSM;
using namespace std::chrono_literals;

template<typename Func>
ErrorCode catchCode(Func func)
{
    try
    {
        func();
    }
    catch(const rfb_error & err)
    {
        return err.code;
    }

    throw std::runtime_error("rfb_error expected");
}

template<typename Pred>
bool waitFor(Pred pred)
{
    auto end = std::chrono::steady_clock::now() + 3s;

    while(! pred())
    {
        if(std::chrono::steady_clock::now() > end)
        {
            return false;
        }

        std::this_thread::sleep_for(10ms);
    }

    return true;
}

RFB::SessionConfig localConfig(const Test::FakeServer & srv)
{
    RFB::SessionConfig config;
    config.host = "127.0.0.1";
    config.port = srv.localPort();
    config.encodings = { "Raw" };
    config.connectTimeoutSec = 3;
    return config;
}

/// skip SetEncodings and the full FramebufferUpdateRequest
void recvInitialMessages(SocketStream & sock)
{
    if(sock.recvInt8() != RFB::CLIENT_SET_ENCODINGS)
    {
        throw std::runtime_error("set encodings expected");
    }

    sock.recvSkip(1);
    sock.recvSkip(4 * sock.recvIntBE16());

    if(sock.recvInt8() != RFB::CLIENT_REQUEST_FB_UPDATE || sock.recvInt8() != 0)
    {
        throw std::runtime_error("full update request expected");
    }

    sock.recvSkip(8);
}

void testFrameEvents(void)
{
    std::cout << "== test frame events" << std::endl;

    Test::FakeServer srv([](SocketStream & sock)
    {
        Test::serverHandshakeNone(sock, 16, 16, "frames");

        // three raw rects 1x1, 32 bpp
        sock.sendInt8(RFB::SERVER_FB_UPDATE).sendZero(1).sendIntBE16(3);

        for(uint16_t ii = 0; ii < 3; ++ii)
        {
            sock.sendIntBE16(ii).sendIntBE16(0).sendIntBE16(1).sendIntBE16(1).sendIntBE32(RFB::ENCODING_RAW);
            sock.sendInt8(0x11 * ii).sendInt8(0x22).sendInt8(0x33).sendInt8(0);
        }

        sock.sendFlush();
        Test::waitClientClose(sock);
    });

    RFB::SessionRegistry registry;
    auto id = registry.connect(localConfig(srv));

    std::cout << "test ::connect: ";
    assert(id.size() == 36);
    assert(registry.sessionCount() == 1);
    assert(registry.isConnected(id));

    auto info = registry.getSessionInfo(id);
    assert(info.serverName == "frames");
    assert(info.version == "3.8");
    assert(info.width == 16 && info.height == 16);
    std::cout << "passed" << std::endl;

    std::cout << "test ::drainEvents connected: ";
    assert(waitFor([&]{ return registry.pendingEvents(id) >= 4; }));
    auto events = registry.drainEvents(id, 1);
    assert(events.size() == 1);
    assert(events.front().type == RFB::EventType::Connected);
    std::cout << "passed" << std::endl;

    std::cout << "test ::drainEvents bounded: ";
    events = registry.drainEvents(id, 2);
    assert(events.size() == 2);
    assert(events.front().type == RFB::EventType::FrameUpdate);
    assert(events.front().rect.x == 0);
    assert(events.back().rect.x == 1);
    assert(events.back().rect.payload == std::vector<uint8_t>({ 0x11, 0x22, 0x33, 0 }));

    events = registry.drainEvents(id, 10);
    assert(events.size() == 1);
    assert(events.front().rect.x == 2);
    assert(events.front().rect.encoding == RFB::ENCODING_RAW);
    assert(registry.drainEvents(id, 10).empty());
    std::cout << "passed" << std::endl;

    std::cout << "test ::getSessionStats: ";
    auto stats = registry.getSessionStats(id);
    assert(stats.connected);
    assert(stats.frameCount >= 1);
    assert(stats.bytesRecv > 0 && stats.bytesSent > 0);
    std::cout << "passed" << std::endl;

    std::cout << "test ::connect duplicate: ";
    assert(catchCode([&]{ registry.connect(localConfig(srv)); }) == ErrorCode::AlreadyConnected);
    assert(registry.sessionCount() == 1);
    assert(registry.listSessions().size() == 1);
    std::cout << "passed" << std::endl;

    std::cout << "test ::disconnectAll: ";
    auto ids = registry.disconnectAll();
    assert(ids.size() == 1 && ids.front() == id);
    assert(registry.sessionCount() == 0);
    std::cout << "passed" << std::endl;
}

void testLifecycle(void)
{
    std::cout << "== test session lifecycle" << std::endl;

    Test::FakeServer srv1([](SocketStream & sock)
    {
        Test::serverHandshakeNone(sock, 32, 32, "first");
        Test::waitClientClose(sock);
    });

    Test::FakeServer srv2([](SocketStream & sock)
    {
        Test::serverHandshakeNone(sock, 32, 32, "second");
        Test::waitClientClose(sock);
    });

    RFB::SessionRegistry registry;
    auto config = localConfig(srv1);
    config.label = "lifecycle";
    config.password = "secret";

    auto id = registry.connect(config);

    std::cout << "test ::unknown id: ";
    assert(catchCode([&]{ registry.drainEvents("00000000-0000-4000-8000-000000000000", 1); }) == ErrorCode::SessionNotFound);
    assert(catchCode([&]{ registry.disconnect("unknown"); }) == ErrorCode::SessionNotFound);
    assert(catchCode([&]{ registry.removeSession("unknown"); }) == ErrorCode::SessionNotFound);
    assert(! registry.isConnected("unknown"));
    std::cout << "passed" << std::endl;

    std::cout << "test ::disconnect idempotent: ";
    assert(registry.getSessionInfo(id).label == "lifecycle");
    registry.disconnect(id);
    registry.disconnect(id);
    assert(! registry.isConnected(id));
    assert(registry.sessionCount() == 1);
    std::cout << "passed" << std::endl;

    std::cout << "test ::command after disconnect: ";
    assert(catchCode([&]{ registry.sendKeyEvent(id, true, 0xff0d); }) == ErrorCode::ChannelClosed);
    assert(catchCode([&]{ registry.requestUpdate(id, true); }) == ErrorCode::ChannelClosed);
    std::cout << "passed" << std::endl;

    std::cout << "test ::disconnected event: ";
    assert(waitFor([&]
    {
        for(auto & evt : registry.drainEvents(id, 0))
        {
            if(evt.type == RFB::EventType::Disconnected)
            {
                return true;
            }
        }

        return false;
    }));
    std::cout << "passed" << std::endl;

    std::cout << "test ::pruneDisconnected: ";
    auto pruned = registry.pruneDisconnected();
    assert(pruned.size() == 1 && pruned.front() == id);
    assert(registry.pruneDisconnected().empty());
    assert(registry.sessionCount() == 0);
    assert(catchCode([&]{ registry.getSessionInfo(id); }) == ErrorCode::SessionNotFound);
    std::cout << "passed" << std::endl;

    std::cout << "test ::reconnect: ";
    auto id2 = registry.connect(localConfig(srv2));
    assert(id2 != id);
    assert(registry.getSessionInfo(id2).serverName == "second");
    registry.disconnectAndRemove(id2);
    assert(registry.sessionCount() == 0);
    std::cout << "passed" << std::endl;
}

void testServerClose(void)
{
    std::cout << "== test server close" << std::endl;

    Test::FakeServer srv([](SocketStream & sock)
    {
        Test::serverHandshakeNone(sock, 8, 8, "closing");
        recvInitialMessages(sock);
        sock.shutdown();
    });

    RFB::SessionRegistry registry;
    auto id = registry.connect(localConfig(srv));

    std::cout << "test ::connected flag: ";
    assert(waitFor([&]{ return ! registry.isConnected(id); }));
    assert(! registry.getSessionStats(id).connected);
    std::cout << "passed" << std::endl;

    std::cout << "test ::terminal event last: ";
    std::list<RFB::SessionEvent> events;

    assert(waitFor([&]
    {
        events.splice(events.end(), registry.drainEvents(id, 0));
        return ! events.empty() && events.back().type == RFB::EventType::Disconnected;
    }));

    assert(events.size() >= 2);
    assert(events.front().type == RFB::EventType::Connected);
    assert(events.back().type == RFB::EventType::Disconnected);
    std::cout << "passed" << std::endl;
}

void testCommandWire(void)
{
    std::cout << "== test command wire" << std::endl;

    std::mutex lock;
    std::vector<uint8_t> keyMessage;
    std::vector<uint8_t> pointerMessage;
    std::vector<uint8_t> viewOnlyMessage;

    if(true)
    {
        Test::FakeServer srv([&](SocketStream & sock)
        {
            Test::serverHandshakeNone(sock, 64, 48, "input");
            recvInitialMessages(sock);

            auto key = sock.recvData(8);
            auto pointer = sock.recvData(6);

            if(true)
            {
                std::scoped_lock guard{ lock };
                keyMessage = key;
                pointerMessage = pointer;
            }

            Test::waitClientClose(sock);
        });

        RFB::SessionRegistry registry;
        auto id = registry.connect(localConfig(srv));

        registry.sendKeyEvent(id, true, 0xff0d);
        registry.sendPointerEvent(id, 0x01, 0x0102, 0x0304);

        assert(waitFor([&]{ std::scoped_lock guard{ lock }; return pointerMessage.size() == 6; }));
        registry.disconnectAll();
    }

    std::cout << "test ::key event: ";
    assert(keyMessage == std::vector<uint8_t>({ 4, 1, 0, 0, 0, 0, 0xff, 0x0d }));
    std::cout << "passed" << std::endl;

    std::cout << "test ::pointer event: ";
    assert(pointerMessage == std::vector<uint8_t>({ 5, 1, 1, 2, 3, 4 }));
    std::cout << "passed" << std::endl;

    if(true)
    {
        Test::FakeServer srv([&](SocketStream & sock)
        {
            Test::serverHandshakeNone(sock, 64, 48, "view");
            recvInitialMessages(sock);

            // input is dropped, the update request comes first
            auto msg = sock.recvData(10);

            if(true)
            {
                std::scoped_lock guard{ lock };
                viewOnlyMessage = msg;
            }

            Test::waitClientClose(sock);
        });

        RFB::SessionRegistry registry;
        auto config = localConfig(srv);
        config.viewOnly = true;

        auto id = registry.connect(config);

        registry.sendKeyEvent(id, true, 0x61);
        registry.sendClipboard(id, "dropped");
        registry.requestUpdate(id, true);

        assert(waitFor([&]{ std::scoped_lock guard{ lock }; return viewOnlyMessage.size() == 10; }));
        assert(registry.getSessionInfo(id).viewOnly);
        registry.disconnectAll();
    }

    std::cout << "test ::view only: ";
    assert(viewOnlyMessage == std::vector<uint8_t>({ 3, 1, 0, 0, 0, 0, 0, 64, 0, 48 }));
    std::cout << "passed" << std::endl;
}

void testResize(void)
{
    std::cout << "== test resize" << std::endl;

    Test::FakeServer srv([](SocketStream & sock)
    {
        Test::serverHandshakeNone(sock, 64, 48, "resize");

        sock.sendInt8(RFB::SERVER_FB_UPDATE).sendZero(1).sendIntBE16(1);
        sock.sendIntBE16(0).sendIntBE16(0).sendIntBE16(100).sendIntBE16(80);
        sock.sendIntBE32(static_cast<uint32_t>(RFB::ENCODING_DESKTOP_SIZE)).sendFlush();

        Test::waitClientClose(sock);
    });

    RFB::SessionRegistry registry;
    auto id = registry.connect(localConfig(srv));

    std::cout << "test ::resize event: ";
    std::list<RFB::SessionEvent> events;

    assert(waitFor([&]
    {
        events.splice(events.end(), registry.drainEvents(id, 0));
        return ! events.empty() && events.back().type == RFB::EventType::Resize;
    }));

    assert(events.back().width == 100 && events.back().height == 80);
    std::cout << "passed" << std::endl;

    std::cout << "test ::getSessionInfo size: ";
    auto info = registry.getSessionInfo(id);
    assert(info.width == 100 && info.height == 80);
    assert(info.frameCount == 0);
    std::cout << "passed" << std::endl;

    registry.disconnectAll();
}

int main(int argc, char** argv)
{
    testFrameEvents();
    testLifecycle();
    testServerClose();
    testResize();
    testCommandWire();

    return 0;
}
