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

#ifndef _LIBRFB_REGISTRY_
#define _LIBRFB_REGISTRY_

#include <map>
#include <list>
#include <mutex>
#include <memory>
#include <string>
#include <cstdint>
#include <string_view>

#include "rdsm_librfb.h"
#include "librfb_session.h"

namespace RDSM
{
    namespace RFB
    {
        /// drain limit when the caller passes zero
        const size_t DRAIN_EVENTS_DEFAULT = 1000;

        struct SessionInfo
        {
            std::string id;
            std::string host;
            std::string label;
            std::string username;

            std::string version;
            std::string securityType;
            std::string serverName;
            std::string pixelFormat;

            std::string connectedAt;
            std::string lastActivity;

            uint64_t bytesSent = 0;
            uint64_t bytesRecv = 0;
            uint64_t frameCount = 0;

            uint16_t port = 0;
            uint16_t width = 0;
            uint16_t height = 0;

            bool connected = false;
            bool viewOnly = false;
        };

        struct SessionStats
        {
            uint64_t bytesSent = 0;
            uint64_t bytesRecv = 0;
            uint64_t frameCount = 0;
            uint64_t uptimeSec = 0;
            bool connected = false;
        };

        /// @brief: owner of all sessions, map guarded only for lookup, insert and remove
        class SessionRegistry
        {
            struct SessionEntry
            {
                std::string id;
                SessionConfig config;
                SessionInit init;
                std::unique_ptr<SessionActor> actor;
            };

            using SessionPtr = std::shared_ptr<SessionEntry>;

            mutable std::mutex lock;
            std::map<std::string, SessionPtr, std::less<>> sessions;

        protected:
            SessionPtr      findSession(std::string_view id) const;
            bool            hasConnectedSession(std::string_view host, uint16_t port) const;

            static std::unique_ptr<SocketStream> openTransport(const SessionConfig &);
            static std::string generateId(void);

        public:
            SessionRegistry() = default;
            ~SessionRegistry();

            SessionRegistry(const SessionRegistry &) = delete;
            SessionRegistry & operator=(const SessionRegistry &) = delete;

            /// @brief: handshake and start actor, throw rfb_error
            std::string     connect(const SessionConfig &);

            void            disconnect(std::string_view id);
            void            removeSession(std::string_view id);
            void            disconnectAndRemove(std::string_view id);
            std::list<std::string> disconnectAll(void);

            void            sendKeyEvent(std::string_view id, bool down, uint32_t key);
            void            sendPointerEvent(std::string_view id, uint8_t buttons, uint16_t posx, uint16_t posy);
            void            sendClipboard(std::string_view id, std::string_view text);
            void            requestUpdate(std::string_view id, bool incremental);
            void            setPixelFormat(std::string_view id, const PixelFormat &);
            void            setEncodings(std::string_view id, const std::list<std::string> & names);

            SessionInfo     getSessionInfo(std::string_view id) const;
            SessionStats    getSessionStats(std::string_view id) const;
            std::list<SessionInfo> listSessions(void) const;

            std::list<SessionEvent> drainEvents(std::string_view id, size_t max);
            std::list<SessionEvent> collectFrameEvents(std::string_view id, size_t max);
            size_t          pendingEvents(std::string_view id) const;

            std::list<std::string> pruneDisconnected(void);

            size_t          sessionCount(void) const;
            bool            isConnected(std::string_view id) const;
        };
    }
}

#endif // _LIBRFB_REGISTRY_
