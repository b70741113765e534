#include <list>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <iostream>
#include <cassert>

#include "rdsm_sockets.h"
#include "librfb_session.h"
#include "../common/rfb_fake_server.h"

using namespace RDSM;
using namespace std::chrono_literals;

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

void sendRectHeader(NetworkStream & srv, uint16_t x, uint16_t y, uint16_t width, uint16_t height, int encoding)
{
    srv.sendIntBE16(x).sendIntBE16(y).sendIntBE16(width).sendIntBE16(height);
    srv.sendIntBE32(static_cast<uint32_t>(encoding));
}

std::unique_ptr<RFB::SessionActor> startActor(Test::SocketPair & pair, const RFB::ActorOptions & opts = RFB::ActorOptions())
{
    RFB::SessionInit init;
    init.pixelFormat = RFB::RGB888;
    init.width = 64;
    init.height = 48;

    auto actor = std::make_unique<RFB::SessionActor>(std::move(pair.client), init, opts);
    actor->start();

    return actor;
}

/// events up to and including Disconnected
std::vector<RFB::SessionEvent> collectEvents(RFB::SessionActor & actor)
{
    std::vector<RFB::SessionEvent> res;

    waitFor([&]
    {
        for(auto & evt : actor.drainEvents(100))
        {
            res.emplace_back(std::move(evt));
        }

        return ! res.empty() && res.back().type == RFB::EventType::Disconnected;
    });

    return res;
}

void testReadLoop(void)
{
    std::cout << "== test read loop" << std::endl;

    Test::SocketPair pair;
    auto & srv = *pair.server;

    srv.sendInt8(RFB::SERVER_BELL);
    srv.sendInt8(RFB::SERVER_CUT_TEXT).sendZero(3).sendIntBE32(5).sendString("hello");
    // one colour map entry
    srv.sendInt8(RFB::SERVER_SET_COLOURMAP).sendZero(1).sendIntBE16(0).sendIntBE16(1);
    srv.sendIntBE16(0xffff).sendIntBE16(0).sendIntBE16(0x8000);

    // four rects announced, LastRect ends the update after three
    srv.sendInt8(RFB::SERVER_FB_UPDATE).sendZero(1).sendIntBE16(4);

    // rre: one subrect
    sendRectHeader(srv, 0, 0, 8, 8, RFB::ENCODING_RRE);
    srv.sendIntBE32(1).sendInt8(0x10).sendInt8(0x20).sendInt8(0x30).sendInt8(0);
    srv.sendInt8(0xff).sendZero(3).sendIntBE16(1).sendIntBE16(2).sendIntBE16(3).sendIntBE16(4);

    // hextile 20x20: four tiles, the first with background and one coloured subrect
    sendRectHeader(srv, 8, 8, 20, 20, RFB::ENCODING_HEXTILE);
    srv.sendInt8(RFB::HEXTILE_BACKGROUND | RFB::HEXTILE_SUBRECTS | RFB::HEXTILE_COLOURED);
    srv.sendInt8(1).sendInt8(2).sendInt8(3).sendInt8(0);
    srv.sendInt8(1);
    srv.sendInt8(9).sendInt8(8).sendInt8(7).sendInt8(0).sendInt8(0x11).sendInt8(0x33);
    srv.sendInt8(0).sendInt8(0).sendInt8(0);

    sendRectHeader(srv, 0, 0, 0, 0, RFB::ENCODING_LAST_RECT);

    // unknown message type
    srv.sendInt8(0x99).sendFlush();

    auto actor = startActor(pair);
    auto events = collectEvents(*actor);

    std::cout << "test ::event order: ";
    assert(events.size() == 7);
    assert(events[0].type == RFB::EventType::Connected);
    assert(events[1].type == RFB::EventType::Bell);
    assert(events[2].type == RFB::EventType::ServerClipboard);
    assert(events[3].type == RFB::EventType::FrameUpdate);
    assert(events[4].type == RFB::EventType::FrameUpdate);
    assert(events[5].type == RFB::EventType::Error);
    assert(events[6].type == RFB::EventType::Disconnected);
    std::cout << "passed" << std::endl;

    std::cout << "test ::server cut text: ";
    assert(events[2].text == "hello");
    std::cout << "passed" << std::endl;

    std::cout << "test ::rre payload: ";
    assert(events[3].rect.encoding == RFB::ENCODING_RRE);
    assert(events[3].rect.width == 8 && events[3].rect.height == 8);
    assert(events[3].rect.payload == std::vector<uint8_t>({ 0, 0, 0, 1, 0x10, 0x20, 0x30, 0, 0xff, 0, 0, 0, 0, 1, 0, 2, 0, 3, 0, 4 }));
    std::cout << "passed" << std::endl;

    std::cout << "test ::hextile payload: ";
    assert(events[4].rect.encoding == RFB::ENCODING_HEXTILE);
    assert(events[4].rect.x == 8 && events[4].rect.width == 20);
    assert(events[4].rect.payload.size() == 15);
    assert(events[4].rect.payload.front() == (RFB::HEXTILE_BACKGROUND | RFB::HEXTILE_SUBRECTS | RFB::HEXTILE_COLOURED));
    std::cout << "passed" << std::endl;

    std::cout << "test ::unknown message: ";
    assert(events[5].text.find("unknown server message") != std::string::npos);

    auto st = actor->status();
    assert(! st.connected);
    assert(! actor->isRunning());
    assert(st.colourMapSize == 1);
    assert(st.frameCount == 2);
    std::cout << "passed" << std::endl;
}

void testRectFraming(void)
{
    std::cout << "== test rect framing" << std::endl;

    Test::SocketPair pair;
    auto & srv = *pair.server;

    srv.sendInt8(RFB::SERVER_FB_UPDATE).sendZero(1).sendIntBE16(6);

    sendRectHeader(srv, 0, 0, 8, 8, RFB::ENCODING_COPYRECT);
    srv.sendIntBE16(1).sendIntBE16(2);

    // corre: two subrects of pixel and four bytes
    sendRectHeader(srv, 0, 0, 8, 8, RFB::ENCODING_CORRE);
    srv.sendIntBE32(2).sendZero(4);
    srv.sendZero(8).sendZero(8);

    // zrle: length prefixed
    sendRectHeader(srv, 0, 0, 8, 8, RFB::ENCODING_ZRLE);
    srv.sendIntBE32(3).sendInt8(1).sendInt8(2).sendInt8(3);

    // cursor 2x2: pixels and one mask byte per row
    sendRectHeader(srv, 1, 1, 2, 2, RFB::ENCODING_RICH_CURSOR);
    srv.sendZero(16).sendInt8(0xc0).sendInt8(0xc0);

    sendRectHeader(srv, 0, 0, 100, 80, RFB::ENCODING_DESKTOP_SIZE);

    // one screen
    sendRectHeader(srv, 0, 0, 120, 90, RFB::ENCODING_EXT_DESKTOP_SIZE);
    srv.sendInt8(1).sendZero(3).sendZero(16);
    srv.sendFlush();

    auto actor = startActor(pair);
    assert(waitFor([&]{ return actor->pendingEvents() >= 7; }));

    auto drained = actor->drainEvents(100);
    std::vector<RFB::SessionEvent> events(drained.begin(), drained.end());

    std::cout << "test ::copyrect payload: ";
    assert(events.size() == 7);
    assert(events[0].type == RFB::EventType::Connected);
    assert(events[1].type == RFB::EventType::FrameUpdate);
    assert(events[1].rect.payload == std::vector<uint8_t>({ 0, 1, 0, 2 }));
    std::cout << "passed" << std::endl;

    std::cout << "test ::corre payload: ";
    assert(events[2].rect.encoding == RFB::ENCODING_CORRE);
    assert(events[2].rect.payload.size() == 24);
    std::cout << "passed" << std::endl;

    std::cout << "test ::zrle payload: ";
    assert(events[3].rect.encoding == RFB::ENCODING_ZRLE);
    assert(events[3].rect.payload == std::vector<uint8_t>({ 0, 0, 0, 3, 1, 2, 3 }));
    std::cout << "passed" << std::endl;

    std::cout << "test ::cursor payload: ";
    assert(events[4].rect.encoding == RFB::ENCODING_RICH_CURSOR);
    assert(events[4].rect.payload.size() == 18);
    assert(events[4].rect.payload.back() == 0xc0);
    std::cout << "passed" << std::endl;

    std::cout << "test ::resize events: ";
    assert(events[5].type == RFB::EventType::Resize);
    assert(events[5].width == 100 && events[5].height == 80);
    assert(events[6].type == RFB::EventType::Resize);
    assert(events[6].width == 120 && events[6].height == 90);

    auto st = actor->status();
    assert(st.width == 120 && st.height == 90);
    assert(st.frameCount == 4);
    assert(st.connected);
    std::cout << "passed" << std::endl;

    std::cout << "test ::shutdown: ";
    actor->shutdown();
    assert(waitFor([&]{ return ! actor->isRunning(); }));

    auto rest = collectEvents(*actor);
    assert(! rest.empty() && rest.back().type == RFB::EventType::Disconnected);
    std::cout << "passed" << std::endl;
}

void testPayloadLimits(void)
{
    std::cout << "== test payload limits" << std::endl;

    std::cout << "test ::raw too large: ";
    if(true)
    {
        Test::SocketPair pair;
        pair.server->sendInt8(RFB::SERVER_FB_UPDATE).sendZero(1).sendIntBE16(1);
        sendRectHeader(*pair.server, 0, 0, 0xffff, 0xffff, RFB::ENCODING_RAW);
        pair.server->sendFlush();

        auto actor = startActor(pair);
        auto events = collectEvents(*actor);

        assert(events.size() == 3);
        assert(events[1].type == RFB::EventType::Error);
        assert(events[1].text == "payload length too large");
    }
    std::cout << "passed" << std::endl;

    std::cout << "test ::rre subrects too large: ";
    if(true)
    {
        Test::SocketPair pair;
        pair.server->sendInt8(RFB::SERVER_FB_UPDATE).sendZero(1).sendIntBE16(1);
        sendRectHeader(*pair.server, 0, 0, 8, 8, RFB::ENCODING_RRE);
        pair.server->sendIntBE32(0xffffffff).sendZero(4).sendFlush();

        auto actor = startActor(pair);
        auto events = collectEvents(*actor);

        assert(events.size() == 3);
        assert(events[1].type == RFB::EventType::Error);
        assert(events[1].text == "payload length too large");
    }
    std::cout << "passed" << std::endl;

    std::cout << "test ::zrle length too large: ";
    if(true)
    {
        Test::SocketPair pair;
        pair.server->sendInt8(RFB::SERVER_FB_UPDATE).sendZero(1).sendIntBE16(1);
        sendRectHeader(*pair.server, 0, 0, 8, 8, RFB::ENCODING_ZRLE);
        pair.server->sendIntBE32(0x7fffffff).sendFlush();

        auto actor = startActor(pair);
        auto events = collectEvents(*actor);

        assert(events.size() == 3);
        assert(events[1].type == RFB::EventType::Error);
    }
    std::cout << "passed" << std::endl;
}

void testCommandWire(void)
{
    std::cout << "== test command wire" << std::endl;

    Test::SocketPair pair;
    auto srv = std::move(pair.server);

    RFB::ActorOptions opts;
    opts.encodings = { RFB::ENCODING_RAW, RFB::ENCODING_HEXTILE };

    auto actor = startActor(pair, opts);

    std::cout << "test ::initial set encodings: ";
    assert(srv->recvData(12) == std::vector<uint8_t>({ 2, 0, 0, 2, 0, 0, 0, 0, 0, 0, 0, 5 }));
    std::cout << "passed" << std::endl;

    std::cout << "test ::initial update request: ";
    assert(srv->recvData(10) == std::vector<uint8_t>({ 3, 0, 0, 0, 0, 0, 0, 64, 0, 48 }));
    std::cout << "passed" << std::endl;

    const RFB::PixelFormat rgb565(16, 16, false, true, 31, 63, 31, 11, 5, 0);

    actor->submit(RFB::SessionCommand::clientClipboard("abc"));
    actor->submit(RFB::SessionCommand::setPixelFormat(rgb565));
    actor->submit(RFB::SessionCommand::setEncodings({ RFB::ENCODING_ZRLE, RFB::ENCODING_DESKTOP_SIZE }));

    std::cout << "test ::client cut text: ";
    assert(srv->recvData(11) == std::vector<uint8_t>({ 6, 0, 0, 0, 0, 0, 0, 3, 'a', 'b', 'c' }));
    std::cout << "passed" << std::endl;

    std::cout << "test ::set pixel format: ";
    std::vector<uint8_t> format = { 0, 0, 0, 0 };
    auto wire = rgb565.toBinary();
    format.insert(format.end(), wire.begin(), wire.end());

    assert(srv->recvData(20) == format);
    assert(actor->status().pixelFormat == rgb565);
    std::cout << "passed" << std::endl;

    std::cout << "test ::set encodings: ";
    assert(srv->recvData(12) == std::vector<uint8_t>({ 2, 0, 0, 2, 0, 0, 0, 16, 0xff, 0xff, 0xff, 0x21 }));
    std::cout << "passed" << std::endl;

    actor->shutdown();
}

int main(int argc, char** argv)
{
    testReadLoop();
    testRectFraming();
    testPayloadLimits();
    testCommandWire();

    return 0;
}
