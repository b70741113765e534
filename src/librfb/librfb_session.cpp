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

#include <algorithm>
#include <cinttypes>

#include "rdsm_tools.h"
#include "rdsm_application.h"
#include "librfb_session.h"

using namespace std::chrono_literals;

namespace RDSM
{
    // sanity limit for rectangle data, length prefixed or computed from the header
    const size_t PAYLOAD_LENGTH_LIMIT = 64 * 1024 * 1024;

    static size_t checkPayloadLength(size_t len, const char* func)
    {
        if(len > PAYLOAD_LENGTH_LIMIT)
        {
            Application::error("%s: payload length too large: %lu", func, len);
            throw rfb_error(ErrorCode::ProtocolError, "payload length too large");
        }

        return len;
    }

    /* SessionCommand */
    RFB::SessionCommand RFB::SessionCommand::keyEvent(bool down, uint32_t key)
    {
        SessionCommand cmd;
        cmd.type = CommandType::KeyEvent;
        cmd.down = down;
        cmd.key = key;
        return cmd;
    }

    RFB::SessionCommand RFB::SessionCommand::pointerEvent(uint8_t buttons, uint16_t posx, uint16_t posy)
    {
        SessionCommand cmd;
        cmd.type = CommandType::PointerEvent;
        cmd.buttons = buttons;
        cmd.posx = posx;
        cmd.posy = posy;
        return cmd;
    }

    RFB::SessionCommand RFB::SessionCommand::clientClipboard(std::string_view text)
    {
        SessionCommand cmd;
        cmd.type = CommandType::SetClientClipboard;
        cmd.text.assign(text.begin(), text.end());
        return cmd;
    }

    RFB::SessionCommand RFB::SessionCommand::requestUpdate(bool incremental)
    {
        SessionCommand cmd;
        cmd.type = CommandType::RequestUpdate;
        cmd.incremental = incremental;
        return cmd;
    }

    RFB::SessionCommand RFB::SessionCommand::setPixelFormat(const PixelFormat & pf)
    {
        SessionCommand cmd;
        cmd.type = CommandType::SetPixelFormat;
        cmd.pixelFormat = pf;
        return cmd;
    }

    RFB::SessionCommand RFB::SessionCommand::setEncodings(const std::vector<int> & encodings)
    {
        SessionCommand cmd;
        cmd.type = CommandType::SetEncodings;
        cmd.encodings = encodings;
        return cmd;
    }

    RFB::SessionCommand RFB::SessionCommand::shutdown(void)
    {
        return SessionCommand();
    }

    const char* RFB::eventTypeName(const EventType & type)
    {
        switch(type)
        {
            case EventType::Connected:
                return "Connected";

            case EventType::FrameUpdate:
                return "FrameUpdate";

            case EventType::ServerClipboard:
                return "ServerClipboard";

            case EventType::Bell:
                return "Bell";

            case EventType::Resize:
                return "Resize";

            case EventType::Error:
                return "Error";

            case EventType::Disconnected:
                return "Disconnected";
        }

        return "Unknown";
    }

    /* SessionActor */
    RFB::SessionActor::SessionActor(std::unique_ptr<SocketStream> sock, const SessionInit & init, const ActorOptions & actorOpts)
        : socket(std::move(sock)), opts(actorOpts)
    {
        if(! socket)
        {
            Application::error("%s: %s", __FUNCTION__, "socket is null");
            throw rfb_error(ErrorCode::ConnectionError, NS_FuncName);
        }

        state.width = init.width;
        state.height = init.height;
        state.pixelFormat = init.pixelFormat;
        state.connectedAt = std::chrono::system_clock::now();
        state.lastActivity = state.connectedAt;
    }

    RFB::SessionActor::~SessionActor()
    {
        stopLoops();

        if(reader.joinable())
        {
            reader.join();
        }

        if(writer.joinable())
        {
            writer.join();
        }
    }

    void RFB::SessionActor::start(void)
    {
        if(running || stopped)
        {
            Application::error("%s: %s", __FUNCTION__, "actor already started");
            throw rfb_error(ErrorCode::ChannelClosed, NS_FuncName);
        }

        // reads are bounded by the poll in the reader loop
        socket->setRecvTimeout(0);

        {
            std::scoped_lock guard{ statusLock };
            state.connected = true;
        }

        running = true;
        pushEvent(SessionEvent(EventType::Connected));

        reader = std::thread([this]()
        {
            this->readerLoop();
        });

        writer = std::thread([this]()
        {
            this->writerLoop();
        });
    }

    void RFB::SessionActor::stopLoops(void)
    {
        // waiters check the flag under their own locks
        {
            std::scoped_lock guard{ cmdLock, evtLock };
            running = false;
        }

        socket->shutdown();

        {
            std::scoped_lock guard{ statusLock };
            state.connected = false;
        }

        cmdCond.notify_all();
        evtCond.notify_all();
    }

    void RFB::SessionActor::touchActivity(void)
    {
        std::scoped_lock guard{ statusLock };
        state.lastActivity = std::chrono::system_clock::now();
    }

    void RFB::SessionActor::pushEvent(SessionEvent && evt)
    {
        std::unique_lock<std::mutex> lock{ evtLock };

        // the reader waits for the consumer, terminal events always pass
        if(! evt.isTerminal())
        {
            evtCond.wait(lock, [this]()
            {
                return this->events.size() < EVENT_QUEUE_CAPACITY || ! this->running;
            });
        }

        Application::trace(DebugType::Session, "%s: event: %s, queue: %lu", __FUNCTION__, eventTypeName(evt.type), events.size());
        events.emplace_back(std::move(evt));
    }

    std::list<RFB::SessionEvent> RFB::SessionActor::drainEvents(size_t max)
    {
        std::list<SessionEvent> res;

        {
            std::scoped_lock guard{ evtLock };

            while(res.size() < max && ! events.empty())
            {
                res.emplace_back(std::move(events.front()));
                events.pop_front();
            }
        }

        evtCond.notify_all();
        return res;
    }

    size_t RFB::SessionActor::pendingEvents(void) const
    {
        std::scoped_lock guard{ evtLock };
        return events.size();
    }

    RFB::SessionStatus RFB::SessionActor::status(void) const
    {
        SessionStatus res;

        {
            std::scoped_lock guard{ statusLock };
            res = state;
        }

        res.bytesSent = socket->totalBytesOut();
        res.bytesRecv = socket->totalBytesIn();

        return res;
    }

    void RFB::SessionActor::submit(SessionCommand && cmd)
    {
        if(stopped || ! running)
        {
            Application::warning("%s: %s", __FUNCTION__, "actor stopped");
            throw rfb_error(ErrorCode::ChannelClosed, "session actor stopped");
        }

        std::unique_lock<std::mutex> lock{ cmdLock };

        bool ready = cmdCond.wait_for(lock, 1s, [this]()
        {
            return this->commands.size() < COMMAND_QUEUE_CAPACITY || ! this->running;
        });

        if(! ready || ! running)
        {
            Application::warning("%s: %s", __FUNCTION__, ready ? "actor stopped" : "command queue full");
            throw rfb_error(ErrorCode::ChannelClosed, ready ? "session actor stopped" : "command queue full");
        }

        commands.emplace_back(std::move(cmd));
        lock.unlock();

        cmdCond.notify_all();
    }

    void RFB::SessionActor::shutdown(void)
    {
        if(stopped.exchange(true))
        {
            return;
        }

        Application::debug(DebugType::Session, "%s: %s", __FUNCTION__, "shutdown requested");

        {
            std::scoped_lock guard{ statusLock };
            state.connected = false;
        }

        if(! running)
        {
            return;
        }

        // the queue capacity does not apply to shutdown
        {
            std::scoped_lock guard{ cmdLock };
            commands.emplace_back(SessionCommand::shutdown());
        }

        cmdCond.notify_all();
    }

    void RFB::SessionActor::writerLoop(void)
    {
        try
        {
            sendInitialMessages();

            auto keepalive = std::chrono::steady_clock::now();

            while(running)
            {
                SessionCommand cmd;
                bool hasCommand = false;

                {
                    std::unique_lock<std::mutex> lock{ cmdLock };

                    cmdCond.wait_for(lock, 100ms, [this]()
                    {
                        return ! this->commands.empty() || ! this->running;
                    });

                    if(! commands.empty())
                    {
                        cmd = std::move(commands.front());
                        commands.pop_front();
                        hasCommand = true;
                    }
                }

                // room for waiting submitters
                cmdCond.notify_all();

                if(hasCommand)
                {
                    if(cmd.type == CommandType::Shutdown)
                    {
                        Application::debug(DebugType::Session, "%s: %s", __FUNCTION__, "shutdown");
                        stopLoops();
                        break;
                    }

                    sendCommand(cmd);
                }

                if(0 < opts.keepaliveIntervalSec)
                {
                    auto now = std::chrono::steady_clock::now();

                    if(std::chrono::seconds(opts.keepaliveIntervalSec) <= now - keepalive)
                    {
                        Application::trace(DebugType::Session, "%s: %s", __FUNCTION__, "keepalive");
                        sendFrameBufferUpdateReq(true, 0, 0, 1, 1);
                        keepalive = now;
                    }
                }
            }
        }
        catch(const std::exception & err)
        {
            if(running)
            {
                Application::error("%s: exception: %s", __FUNCTION__, err.what());

                SessionEvent evt(EventType::Error);
                evt.text = err.what();
                pushEvent(std::move(evt));

                stopLoops();
            }
        }
    }

    void RFB::SessionActor::readerLoop(void)
    {
        try
        {
            while(running)
            {
                if(! socket->waitInput(100))
                {
                    continue;
                }

                int msgType = socket->recvInt8();
                touchActivity();

                switch(msgType)
                {
                    case SERVER_FB_UPDATE:
                        recvFBUpdateEvent();
                        break;

                    case SERVER_SET_COLOURMAP:
                        recvColourMapEvent();
                        break;

                    case SERVER_BELL:
                        recvBellEvent();
                        break;

                    case SERVER_CUT_TEXT:
                        recvCutTextEvent();
                        break;

                    default:
                        Application::error("%s: unknown message: 0x%02x", __FUNCTION__, msgType);
                        throw rfb_error(ErrorCode::ProtocolError, Tools::joinToString("unknown server message: ", msgType));
                }
            }
        }
        catch(const std::exception & err)
        {
            // expected after shutdown, the socket is closed under the read
            if(running)
            {
                Application::error("%s: exception: %s", __FUNCTION__, err.what());

                SessionEvent evt(EventType::Error);
                evt.text = err.what();
                pushEvent(std::move(evt));
            }
        }

        stopLoops();
        pushEvent(SessionEvent(EventType::Disconnected));

        Application::info("%s: %s", __FUNCTION__, "session disconnected");
    }

    void RFB::SessionActor::sendInitialMessages(void)
    {
        if(opts.usePixelFormat)
        {
            sendCommand(SessionCommand::setPixelFormat(opts.pixelFormat));
        }

        sendCommand(SessionCommand::setEncodings(opts.encodings));
        sendCommand(SessionCommand::requestUpdate(false));
    }

    void RFB::SessionActor::sendFrameBufferUpdateReq(bool incr, uint16_t x, uint16_t y, uint16_t width, uint16_t height)
    {
        Application::debug(DebugType::Session, "%s: region [%" PRIu16 ", %" PRIu16 ", %" PRIu16 ", %" PRIu16 "], incremental: %d",
                           __FUNCTION__, x, y, width, height, (int) incr);

        StreamBuf sb(10);
        sb.writeInt8(CLIENT_REQUEST_FB_UPDATE).writeInt8(incr ? 1 : 0);
        sb.writeIntBE16(x).writeIntBE16(y).writeIntBE16(width).writeIntBE16(height);

        socket->sendData(sb.rawbuf()).sendFlush();
    }

    void RFB::SessionActor::sendCommand(const SessionCommand & cmd)
    {
        if(opts.viewOnly && (cmd.type == CommandType::KeyEvent ||
                             cmd.type == CommandType::PointerEvent || cmd.type == CommandType::SetClientClipboard))
        {
            Application::trace(DebugType::Session, "%s: %s", __FUNCTION__, "view only, input skipped");
            return;
        }

        StreamBuf sb(32);

        switch(cmd.type)
        {
            case CommandType::KeyEvent:
                Application::debug(DebugType::Session, "%s: keysym: 0x%08" PRIx32 ", pressed: %d", __FUNCTION__, cmd.key, (int) cmd.down);
                sb.writeInt8(CLIENT_EVENT_KEY).writeInt8(cmd.down ? 1 : 0).fill(2, 0).writeIntBE32(cmd.key);
                break;

            case CommandType::PointerEvent:
                Application::debug(DebugType::Session, "%s: pointer: [%" PRIu16 ", %" PRIu16 "], buttons: 0x%02" PRIx8,
                                   __FUNCTION__, cmd.posx, cmd.posy, cmd.buttons);
                sb.writeInt8(CLIENT_EVENT_POINTER).writeInt8(cmd.buttons).writeIntBE16(cmd.posx).writeIntBE16(cmd.posy);
                break;

            case CommandType::SetClientClipboard:
                Application::debug(DebugType::Session, "%s: clipboard length: %lu", __FUNCTION__, cmd.text.size());
                sb.writeInt8(CLIENT_CUT_TEXT).fill(3, 0).writeLengthString(cmd.text);
                break;

            case CommandType::RequestUpdate:
            {
                auto st = status();
                sendFrameBufferUpdateReq(cmd.incremental, 0, 0, st.width, st.height);
                return;
            }

            case CommandType::SetPixelFormat:
            {
                Application::debug(DebugType::Session, "%s: pixel format: %s", __FUNCTION__, cmd.pixelFormat.toString().c_str());
                sb.writeInt8(CLIENT_SET_PIXEL_FORMAT).fill(3, 0).write(cmd.pixelFormat.toBinary());

                std::scoped_lock guard{ statusLock };
                state.pixelFormat = cmd.pixelFormat;
                break;
            }

            case CommandType::SetEncodings:
                for(auto type : cmd.encodings)
                {
                    Application::debug(DebugType::Session, "%s: %s", __FUNCTION__, encodingName(type));
                }

                sb.writeInt8(CLIENT_SET_ENCODINGS).fill(1, 0).writeIntBE16(cmd.encodings.size());

                for(auto type : cmd.encodings)
                {
                    sb.writeIntBE32(type);
                }

                break;

            case CommandType::Shutdown:
                return;
        }

        socket->sendData(sb.rawbuf()).sendFlush();
    }

    void RFB::SessionActor::recvFBUpdateEvent(void)
    {
        // padding
        socket->recvSkip(1);
        auto numRects = socket->recvIntBE16();

        size_t bpp = 4;

        {
            std::scoped_lock guard{ statusLock };
            bpp = state.pixelFormat.bytesPerPixel();
        }

        Application::debug(DebugType::Session, "%s: num rects: %" PRIu16, __FUNCTION__, numRects);

        while(0 < numRects--)
        {
            FrameRect rect;
            rect.x = socket->recvIntBE16();
            rect.y = socket->recvIntBE16();
            rect.width = socket->recvIntBE16();
            rect.height = socket->recvIntBE16();
            rect.encoding = static_cast<int32_t>(socket->recvIntBE32());

            Application::debug(DebugType::Session, "%s: region [%" PRIu16 ", %" PRIu16 ", %" PRIu16 ", %" PRIu16 "], encoding: %s",
                               __FUNCTION__, rect.x, rect.y, rect.width, rect.height, encodingName(rect.encoding));

            if(rect.encoding == ENCODING_LAST_RECT)
            {
                break;
            }

            if(rect.encoding == ENCODING_DESKTOP_SIZE || rect.encoding == ENCODING_EXT_DESKTOP_SIZE)
            {
                if(rect.encoding == ENCODING_EXT_DESKTOP_SIZE)
                {
                    auto screens = socket->recvInt8();
                    // padding, screens
                    socket->recvSkip(3 + 16 * static_cast<size_t>(screens));
                }

                Application::info("%s: display resized, new size: [%" PRIu16 ", %" PRIu16 "]", __FUNCTION__, rect.width, rect.height);

                {
                    std::scoped_lock guard{ statusLock };
                    state.width = rect.width;
                    state.height = rect.height;
                }

                SessionEvent evt(EventType::Resize);
                evt.width = rect.width;
                evt.height = rect.height;
                pushEvent(std::move(evt));
                continue;
            }

            rect.payload = recvRectPayload(rect, bpp);

            {
                std::scoped_lock guard{ statusLock };
                state.frameCount++;
            }

            SessionEvent evt(EventType::FrameUpdate);
            evt.rect = std::move(rect);
            pushEvent(std::move(evt));
        }
    }

    std::vector<uint8_t> RFB::SessionActor::recvRectPayload(const FrameRect & rect, size_t bpp)
    {
        const size_t pixels = static_cast<size_t>(rect.width) * rect.height;

        switch(rect.encoding)
        {
            case ENCODING_RAW:
                return socket->recvData(checkPayloadLength(pixels * bpp, __FUNCTION__));

            case ENCODING_COPYRECT:
                return socket->recvData(4);

            case ENCODING_RRE:
            case ENCODING_CORRE:
            {
                // subrects count, background pixel
                BinaryBuf buf = socket->recvData(4 + bpp);
                size_t subRects = StreamBuf(buf).readIntBE32();
                size_t subSize = bpp + (rect.encoding == ENCODING_CORRE ? 4 : 8);

                return buf.append(socket->recvData(checkPayloadLength(subRects * subSize, __FUNCTION__)));
            }

            case ENCODING_HEXTILE:
            {
                // tiles never exceed the raw size plus a header byte each
                checkPayloadLength(pixels * bpp, __FUNCTION__);

                BinaryBuf buf;
                recvHextilePayload(buf, rect, bpp);
                return std::move(buf);
            }

            case ENCODING_ZLIB:
            case ENCODING_TRLE:
            case ENCODING_ZRLE:
            {
                size_t len = checkPayloadLength(socket->recvIntBE32(), __FUNCTION__);

                StreamBuf sb(4 + len);
                sb.writeIntBE32(len);

                auto data = socket->recvData(len);
                return BinaryBuf(sb.rawbuf()).append(data);
            }

            case ENCODING_RICH_CURSOR:
                // pixels and bitmask
                return socket->recvData(checkPayloadLength(pixels * bpp + ((rect.width + 7) / 8) * static_cast<size_t>(rect.height), __FUNCTION__));

            default:
                break;
        }

        Application::error("%s: unsupported encoding: %s (%d)", __FUNCTION__, encodingName(rect.encoding), rect.encoding);
        throw rfb_error(ErrorCode::ProtocolError, Tools::joinToString("unsupported encoding: ", encodingName(rect.encoding)));
    }

    void RFB::SessionActor::recvHextilePayload(BinaryBuf & buf, const FrameRect & rect, size_t bpp)
    {
        for(size_t ty = 0; ty < rect.height; ty += 16)
        {
            for(size_t tx = 0; tx < rect.width; tx += 16)
            {
                size_t tw = std::min<size_t>(16, rect.width - tx);
                size_t th = std::min<size_t>(16, rect.height - ty);

                auto flag = socket->recvInt8();
                buf.push_back(flag);

                if(flag & HEXTILE_RAW)
                {
                    buf.append(socket->recvData(tw * th * bpp));
                    continue;
                }

                if(flag & HEXTILE_BACKGROUND)
                {
                    buf.append(socket->recvData(bpp));
                }

                if(flag & HEXTILE_FOREGROUND)
                {
                    buf.append(socket->recvData(bpp));
                }

                if(flag & HEXTILE_SUBRECTS)
                {
                    size_t subRects = socket->recvInt8();
                    buf.push_back(subRects);

                    // coloured subrect: pixel, xy, wh
                    size_t subSize = (flag & HEXTILE_COLOURED) ? bpp + 2 : 2;
                    buf.append(socket->recvData(subRects * subSize));
                }
            }
        }
    }

    void RFB::SessionActor::recvColourMapEvent(void)
    {
        // padding
        socket->recvSkip(1);
        auto firstColour = socket->recvIntBE16();
        auto numColours = socket->recvIntBE16();

        Application::debug(DebugType::Session, "%s: num colours: %" PRIu16 ", first colour: %" PRIu16, __FUNCTION__, numColours, firstColour);

        std::vector<Color> colours(numColours);

        for(auto & col : colours)
        {
            col.r = socket->recvIntBE16();
            col.g = socket->recvIntBE16();
            col.b = socket->recvIntBE16();
        }

        std::scoped_lock guard{ statusLock };

        if(colourMap.size() < static_cast<size_t>(firstColour) + numColours)
        {
            colourMap.resize(static_cast<size_t>(firstColour) + numColours);
        }

        std::copy(colours.begin(), colours.end(), colourMap.begin() + firstColour);
        state.colourMapSize = colourMap.size();
    }

    void RFB::SessionActor::recvBellEvent(void)
    {
        Application::debug(DebugType::Session, "%s: message", __FUNCTION__);
        pushEvent(SessionEvent(EventType::Bell));
    }

    void RFB::SessionActor::recvCutTextEvent(void)
    {
        // padding
        socket->recvSkip(3);
        size_t length = socket->recvIntBE32();

        Application::debug(DebugType::Session, "%s: length: %lu", __FUNCTION__, length);

        if(length > STRING_LENGTH_LIMIT)
        {
            Application::error("%s: cut text length too large: %lu", __FUNCTION__, length);
            throw rfb_error(ErrorCode::ProtocolError, "cut text length too large");
        }

        SessionEvent evt(EventType::ServerClipboard);
        evt.text = socket->recvString(length);
        pushEvent(std::move(evt));
    }
}
