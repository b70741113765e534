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

#ifndef _LIBRFB_SESSION_
#define _LIBRFB_SESSION_

#include <list>
#include <deque>
#include <mutex>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <cstdint>
#include <condition_variable>

#include "rdsm_sockets.h"
#include "rdsm_librfb.h"
#include "librfb_handshake.h"

namespace RDSM
{
    namespace RFB
    {
        const size_t COMMAND_QUEUE_CAPACITY = 256;
        const size_t EVENT_QUEUE_CAPACITY = 512;

        enum class CommandType { KeyEvent, PointerEvent, SetClientClipboard, RequestUpdate, SetPixelFormat, SetEncodings, Shutdown };

        struct SessionCommand
        {
            CommandType type = CommandType::Shutdown;

            uint32_t key = 0;
            bool down = false;

            uint8_t buttons = 0;
            uint16_t posx = 0;
            uint16_t posy = 0;

            bool incremental = true;

            std::string text;
            PixelFormat pixelFormat;
            std::vector<int> encodings;

            static SessionCommand keyEvent(bool down, uint32_t key);
            static SessionCommand pointerEvent(uint8_t buttons, uint16_t posx, uint16_t posy);
            static SessionCommand clientClipboard(std::string_view text);
            static SessionCommand requestUpdate(bool incremental);
            static SessionCommand setPixelFormat(const PixelFormat &);
            static SessionCommand setEncodings(const std::vector<int> &);
            static SessionCommand shutdown(void);
        };

        struct FrameRect
        {
            uint16_t x = 0;
            uint16_t y = 0;
            uint16_t width = 0;
            uint16_t height = 0;
            int encoding = ENCODING_RAW;

            /// encoded payload, not decoded
            std::vector<uint8_t> payload;
        };

        enum class EventType { Connected, FrameUpdate, ServerClipboard, Bell, Resize, Error, Disconnected };

        const char* eventTypeName(const EventType &);

        struct SessionEvent
        {
            EventType type = EventType::Disconnected;

            FrameRect rect;
            std::string text;

            uint16_t width = 0;
            uint16_t height = 0;

            SessionEvent() = default;
            explicit SessionEvent(const EventType & evt) : type(evt) {}

            bool isTerminal(void) const { return type == EventType::Error || type == EventType::Disconnected; }
        };

        struct Color
        {
            uint16_t r = 0;
            uint16_t g = 0;
            uint16_t b = 0;
        };

        struct SessionStatus
        {
            std::chrono::system_clock::time_point connectedAt;
            std::chrono::system_clock::time_point lastActivity;

            PixelFormat pixelFormat;

            uint64_t bytesSent = 0;
            uint64_t bytesRecv = 0;
            uint64_t frameCount = 0;

            size_t colourMapSize = 0;

            uint16_t width = 0;
            uint16_t height = 0;

            bool connected = false;
        };

        struct ActorOptions
        {
            std::vector<int> encodings;
            PixelFormat pixelFormat;

            int keepaliveIntervalSec = 0;

            bool usePixelFormat = false;
            bool viewOnly = false;
        };

        /// @brief: exclusive owner of one connected socket,
        /// reader thread produces events, writer thread consumes commands
        class SessionActor
        {
            std::unique_ptr<SocketStream> socket;
            ActorOptions opts;

            mutable std::mutex statusLock;
            SessionStatus state;
            std::vector<Color> colourMap;

            std::mutex cmdLock;
            std::condition_variable cmdCond;
            std::deque<SessionCommand> commands;

            mutable std::mutex evtLock;
            std::condition_variable evtCond;
            std::deque<SessionEvent> events;

            std::atomic<bool> running{false};
            std::atomic<bool> stopped{false};

            std::thread reader;
            std::thread writer;

        protected:
            void            readerLoop(void);
            void            writerLoop(void);

            void            pushEvent(SessionEvent &&);
            void            stopLoops(void);
            void            touchActivity(void);

            void            sendInitialMessages(void);
            void            sendCommand(const SessionCommand &);
            void            sendFrameBufferUpdateReq(bool incr, uint16_t x, uint16_t y, uint16_t width, uint16_t height);

            void            recvFBUpdateEvent(void);
            void            recvColourMapEvent(void);
            void            recvBellEvent(void);
            void            recvCutTextEvent(void);

            std::vector<uint8_t> recvRectPayload(const FrameRect &, size_t bpp);
            void            recvHextilePayload(BinaryBuf &, const FrameRect &, size_t bpp);

        public:
            SessionActor(std::unique_ptr<SocketStream> sock, const SessionInit &, const ActorOptions &);
            ~SessionActor();

            SessionActor(const SessionActor &) = delete;
            SessionActor & operator=(const SessionActor &) = delete;

            void            start(void);

            /// @brief: queue command, throw rfb_error ChannelClosed if the actor has stopped or the queue stays full
            void            submit(SessionCommand &&);

            /// @brief: request stop, safe to call repeatedly
            void            shutdown(void);

            /// @brief: non blocking pop of up to max events
            std::list<SessionEvent> drainEvents(size_t max);
            size_t          pendingEvents(void) const;

            SessionStatus   status(void) const;
            bool            isRunning(void) const { return running; }
        };
    }
}

#endif // _LIBRFB_SESSION_
