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

#include <cerrno>
#include <cstring>
#include <utility>
#include <cinttypes>

#include "rdsm_tools.h"
#include "rdsm_sockets.h"
#include "rdsm_application.h"
#include "librfb_registry.h"

namespace RDSM
{
    RFB::SessionRegistry::~SessionRegistry()
    {
        disconnectAll();
    }

    RFB::SessionRegistry::SessionPtr RFB::SessionRegistry::findSession(std::string_view id) const
    {
        std::scoped_lock guard{ lock };
        auto it = sessions.find(id);

        if(it == sessions.end())
        {
            Application::warning("%s: session not found, id: %.*s", __FUNCTION__, (int) id.size(), id.data());
            throw rfb_error(ErrorCode::SessionNotFound, Tools::joinToString("session not found: ", id));
        }

        return it->second;
    }

    bool RFB::SessionRegistry::hasConnectedSession(std::string_view host, uint16_t port) const
    {
        for(auto & [id, entry] : sessions)
        {
            if(entry->config.port == port && entry->config.host == host &&
                entry->actor->status().connected)
            {
                return true;
            }
        }

        return false;
    }

    std::string RFB::SessionRegistry::generateId(void)
    {
        return Tools::uuid4String(TLS::randomKey(16));
    }

    std::unique_ptr<SocketStream> RFB::SessionRegistry::openTransport(const SessionConfig & config)
    {
        auto ipaddr = TCPSocket::resolvHostname(config.host);

        if(ipaddr.empty())
        {
            Application::error("%s: resolve failed, host: `%s'", __FUNCTION__, config.host.c_str());
            throw rfb_error(ErrorCode::ConnectionError, Tools::joinToString("dns resolution failed: ", config.host));
        }

        int fd = TCPSocket::connect(ipaddr, config.port, config.connectTimeoutSec * 1000);

        if(0 > fd)
        {
            int err = errno;
            throw rfb_error(ErrorCode::ConnectionError, Tools::joinToString("tcp connect failed: ", strerror(err)));
        }

        auto sock = std::make_unique<SocketStream>(fd);
        sock->setRecvTimeout(config.connectTimeoutSec * 1000);

        return sock;
    }

    std::string RFB::SessionRegistry::connect(const SessionConfig & config)
    {
        {
            std::scoped_lock guard{ lock };

            if(hasConnectedSession(config.host, config.port))
            {
                Application::error("%s: already connected, host: `%s', port: %" PRIu16, __FUNCTION__, config.host.c_str(), config.port);
                throw rfb_error(ErrorCode::AlreadyConnected, Tools::joinToString("already connected: ", config.host, ":", config.port));
            }
        }

        Application::info("%s: connect to host: `%s', port: %" PRIu16, __FUNCTION__, config.host.c_str(), config.port);

        auto sock = openTransport(config);

        HandshakeOptions hopts;
        hopts.allowedSecurity = config.allowedSecurity;
        hopts.shared = config.shared;

        auto init = negotiate(*sock, Credentials{config.username, config.password}, hopts);
        init.bytesSent = sock->totalBytesOut();
        init.bytesRecv = sock->totalBytesIn();

        ActorOptions aopts;
        aopts.encodings = resolveEncodings(config.encodings, config.localCursor);
        aopts.pixelFormat = config.pixelFormat;
        aopts.usePixelFormat = config.usePixelFormat;
        aopts.keepaliveIntervalSec = config.keepaliveIntervalSec;
        aopts.viewOnly = config.viewOnly;

        auto entry = std::make_shared<SessionEntry>();
        entry->config = config;
        entry->init = init;
        entry->actor = std::make_unique<SessionActor>(std::move(sock), init, aopts);

        // credentials stay with the caller
        entry->config.password.clear();

        std::scoped_lock guard{ lock };

        // another connect to the same endpoint could finish while this one was negotiating
        if(hasConnectedSession(config.host, config.port))
        {
            Application::error("%s: already connected, host: `%s', port: %" PRIu16, __FUNCTION__, config.host.c_str(), config.port);
            throw rfb_error(ErrorCode::AlreadyConnected, Tools::joinToString("already connected: ", config.host, ":", config.port));
        }

        do
        {
            entry->id = generateId();
        }
        while(sessions.count(entry->id));

        entry->actor->start();
        sessions.emplace(entry->id, entry);

        Application::notice("%s: session started, id: %s, server: `%s', security: %s", __FUNCTION__,
                            entry->id.c_str(), init.serverName.c_str(), securityTypeName(init.securityType));

        return entry->id;
    }

    void RFB::SessionRegistry::disconnect(std::string_view id)
    {
        auto entry = findSession(id);

        Application::info("%s: id: %s", __FUNCTION__, entry->id.c_str());
        entry->actor->shutdown();
    }

    void RFB::SessionRegistry::removeSession(std::string_view id)
    {
        SessionPtr entry;

        {
            std::scoped_lock guard{ lock };
            auto it = sessions.find(id);

            if(it == sessions.end())
            {
                Application::warning("%s: session not found, id: %.*s", __FUNCTION__, (int) id.size(), id.data());
                throw rfb_error(ErrorCode::SessionNotFound, Tools::joinToString("session not found: ", id));
            }

            entry = std::move(it->second);
            sessions.erase(it);
        }

        Application::info("%s: id: %s", __FUNCTION__, entry->id.c_str());
        // actor threads are joined here, outside the map lock
    }

    void RFB::SessionRegistry::disconnectAndRemove(std::string_view id)
    {
        // shutdown of a stopped actor is a no-op
        disconnect(id);
        removeSession(id);
    }

    std::list<std::string> RFB::SessionRegistry::disconnectAll(void)
    {
        std::map<std::string, SessionPtr, std::less<>> entries;

        {
            std::scoped_lock guard{ lock };
            entries.swap(sessions);
        }

        std::list<std::string> res;

        for(auto & [id, entry] : entries)
        {
            entry->actor->shutdown();
            res.push_back(id);
        }

        if(res.size())
        {
            Application::info("%s: sessions: %lu", __FUNCTION__, res.size());
        }

        return res;
    }

    void RFB::SessionRegistry::sendKeyEvent(std::string_view id, bool down, uint32_t key)
    {
        findSession(id)->actor->submit(SessionCommand::keyEvent(down, key));
    }

    void RFB::SessionRegistry::sendPointerEvent(std::string_view id, uint8_t buttons, uint16_t posx, uint16_t posy)
    {
        findSession(id)->actor->submit(SessionCommand::pointerEvent(buttons, posx, posy));
    }

    void RFB::SessionRegistry::sendClipboard(std::string_view id, std::string_view text)
    {
        findSession(id)->actor->submit(SessionCommand::clientClipboard(text));
    }

    void RFB::SessionRegistry::requestUpdate(std::string_view id, bool incremental)
    {
        findSession(id)->actor->submit(SessionCommand::requestUpdate(incremental));
    }

    void RFB::SessionRegistry::setPixelFormat(std::string_view id, const PixelFormat & pf)
    {
        findSession(id)->actor->submit(SessionCommand::setPixelFormat(pf));
    }

    void RFB::SessionRegistry::setEncodings(std::string_view id, const std::list<std::string> & names)
    {
        auto entry = findSession(id);
        entry->actor->submit(SessionCommand::setEncodings(resolveEncodings(names, entry->config.localCursor)));
    }

    RFB::SessionInfo RFB::SessionRegistry::getSessionInfo(std::string_view id) const
    {
        auto entry = findSession(id);
        auto status = entry->actor->status();

        SessionInfo info;

        info.id = entry->id;
        info.host = entry->config.host;
        info.port = entry->config.port;
        info.label = entry->config.label;
        info.username = entry->config.username;
        info.viewOnly = entry->config.viewOnly;

        info.version = entry->init.version.toString();
        info.securityType = securityTypeName(entry->init.securityType);
        info.serverName = entry->init.serverName;

        info.connected = status.connected;
        info.width = status.width;
        info.height = status.height;
        info.pixelFormat = status.pixelFormat.toString();
        info.connectedAt = Tools::timeToIso8601(status.connectedAt);
        info.lastActivity = Tools::timeToIso8601(status.lastActivity);

        info.bytesSent = status.bytesSent;
        info.bytesRecv = status.bytesRecv;
        info.frameCount = status.frameCount;

        return info;
    }

    RFB::SessionStats RFB::SessionRegistry::getSessionStats(std::string_view id) const
    {
        auto status = findSession(id)->actor->status();
        auto uptime = std::chrono::system_clock::now() - status.connectedAt;

        SessionStats stats;

        stats.bytesSent = status.bytesSent;
        stats.bytesRecv = status.bytesRecv;
        stats.frameCount = status.frameCount;
        stats.uptimeSec = std::chrono::duration_cast<std::chrono::seconds>(uptime).count();
        stats.connected = status.connected;

        return stats;
    }

    std::list<RFB::SessionInfo> RFB::SessionRegistry::listSessions(void) const
    {
        std::list<std::string> ids;

        {
            std::scoped_lock guard{ lock };

            for(auto & [id, entry] : sessions)
            {
                ids.push_back(id);
            }
        }

        std::list<SessionInfo> res;

        for(auto & id : ids)
        {
            try
            {
                res.emplace_back(getSessionInfo(id));
            }
            catch(const rfb_error & err)
            {
                // removed meanwhile
                Application::debug(DebugType::Registry, "%s: skip session: %s, error: %s", __FUNCTION__, id.c_str(), err.what());
            }
        }

        return res;
    }

    std::list<RFB::SessionEvent> RFB::SessionRegistry::drainEvents(std::string_view id, size_t max)
    {
        return findSession(id)->actor->drainEvents(max ? max : DRAIN_EVENTS_DEFAULT);
    }

    std::list<RFB::SessionEvent> RFB::SessionRegistry::collectFrameEvents(std::string_view id, size_t max)
    {
        auto events = drainEvents(id, max);

        events.remove_if([](auto & evt)
        {
            return evt.type != EventType::FrameUpdate;
        });

        return events;
    }

    size_t RFB::SessionRegistry::pendingEvents(std::string_view id) const
    {
        return findSession(id)->actor->pendingEvents();
    }

    std::list<std::string> RFB::SessionRegistry::pruneDisconnected(void)
    {
        std::list<SessionPtr> removed;
        std::list<std::string> res;

        {
            std::scoped_lock guard{ lock };

            for(auto it = sessions.begin(); it != sessions.end();)
            {
                if(it->second->actor->status().connected)
                {
                    ++it;
                    continue;
                }

                res.push_back(it->first);
                removed.emplace_back(std::move(it->second));
                it = sessions.erase(it);
            }
        }

        if(res.size())
        {
            Application::info("%s: removed sessions: %lu", __FUNCTION__, res.size());
        }

        return res;
    }

    size_t RFB::SessionRegistry::sessionCount(void) const
    {
        std::scoped_lock guard{ lock };
        return sessions.size();
    }

    bool RFB::SessionRegistry::isConnected(std::string_view id) const
    {
        std::scoped_lock guard{ lock };
        auto it = sessions.find(id);

        return it != sessions.end() && it->second->actor->status().connected;
    }
}
