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

#include <chrono>
#include <thread>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include "rdsm_tools.h"
#include "librfb_registry.h"
#include "rdsm_session.h"

using namespace std::chrono_literals;

namespace RDSM
{
    void sessionHelp(const char* prog)
    {
        std::cout << "version: " << RDSM_SESSION_VERSION << std::endl;
        std::cout << "usage: " << prog << " --host <localhost> [--port 5900] [--username <user>] [--password <pass>] [--label <name>]" <<
                  " [--encodings <zrle,hextile,copyrect,raw>] [--security <30,2,1>] [--seconds 10] [--keepalive 0 (sec)] [--timeout 15 (sec)]" <<
                  " [--view-only] [--exclusive] [--no-cursor] [--debug] [--trace] [--debug-types <rfb,session,registry>] [--syslog] [--logfile <file>]" << std::endl;
        std::cout << "environment: RDSM_PASSWORD used when --password is not given" << std::endl;
    }

    RdsmSession::RdsmSession(int argc, const char** argv)
        : Application("rdsm_session")
    {
        Application::setDebug(DebugTarget::Console, DebugLevel::Info);
        config.host.assign("localhost");

        for(int it = 1; it < argc; ++it)
        {
            if(0 == std::strcmp(argv[it], "--help") || 0 == std::strcmp(argv[it], "-h"))
            {
                sessionHelp(argv[0]);
                throw 0;
            }
            else if(0 == std::strcmp(argv[it], "--host") && it + 1 < argc)
            {
                config.host.assign(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--port") && it + 1 < argc)
            {
                config.port = std::stoi(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--username") && it + 1 < argc)
            {
                config.username.assign(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--password") && it + 1 < argc)
            {
                config.password.assign(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--label") && it + 1 < argc)
            {
                config.label.assign(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--encodings") && it + 1 < argc)
            {
                config.encodings = Tools::split(argv[it + 1], ',');
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--security") && it + 1 < argc)
            {
                config.allowedSecurity = Tools::splitToInts(argv[it + 1], ',');
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--seconds") && it + 1 < argc)
            {
                seconds = std::stoi(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--keepalive") && it + 1 < argc)
            {
                config.keepaliveIntervalSec = std::stoi(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--timeout") && it + 1 < argc)
            {
                config.connectTimeoutSec = std::stoi(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--debug-types") && it + 1 < argc)
            {
                Application::setDebugTypes(Tools::split(argv[it + 1], ','));
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--logfile") && it + 1 < argc)
            {
                Application::setDebugTargetFile(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--view-only"))
            {
                config.viewOnly = true;
            }
            else if(0 == std::strcmp(argv[it], "--exclusive"))
            {
                config.shared = false;
            }
            else if(0 == std::strcmp(argv[it], "--no-cursor"))
            {
                config.localCursor = false;
            }
            else if(0 == std::strcmp(argv[it], "--syslog"))
            {
                Application::setDebugTarget(DebugTarget::Syslog);
            }
            else if(0 == std::strcmp(argv[it], "--debug"))
            {
                Application::setDebugLevel(DebugLevel::Debug);
            }
            else if(0 == std::strcmp(argv[it], "--trace"))
            {
                Application::setDebugLevel(DebugLevel::Trace);
            }
            else
            {
                std::cerr << "unknown argument: " << argv[it] << std::endl;
                sessionHelp(argv[0]);
                throw 1;
            }
        }

        if(config.password.empty())
        {
            if(auto env = std::getenv("RDSM_PASSWORD"))
            {
                config.password.assign(env);
            }
        }
    }

    void printEvent(const RFB::SessionEvent & evt)
    {
        std::cout << "event: " << RFB::eventTypeName(evt.type);

        switch(evt.type)
        {
            case RFB::EventType::FrameUpdate:
                std::cout << " [" << evt.rect.x << ", " << evt.rect.y << ", " << evt.rect.width << ", " << evt.rect.height <<
                          "], encoding: " << RFB::encodingName(evt.rect.encoding) << ", payload: " << evt.rect.payload.size();
                break;

            case RFB::EventType::Resize:
                std::cout << " [" << evt.width << ", " << evt.height << "]";
                break;

            case RFB::EventType::ServerClipboard:
                std::cout << ", length: " << evt.text.size();
                break;

            case RFB::EventType::Error:
                std::cout << ", message: " << evt.text;
                break;

            default:
                break;
        }

        std::cout << std::endl;
    }

    int RdsmSession::start(void)
    {
        RFB::SessionRegistry registry;
        std::string id;

        try
        {
            id = registry.connect(config);
        }
        catch(const rfb_error & err)
        {
            std::cerr << "connect failed: " << errorCodeName(err.code) << ", " << err.what() << std::endl;
            return 1;
        }

        auto info = registry.getSessionInfo(id);

        std::cout << "session: " << info.id << ", server: `" << info.serverName << "', version: " << info.version <<
                  ", security: " << info.securityType << ", size: " << info.width << "x" << info.height <<
                  ", format: " << info.pixelFormat << std::endl;

        auto finish = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
        bool disconnected = false;

        while(! disconnected && std::chrono::steady_clock::now() < finish)
        {
            for(auto & evt : registry.drainEvents(id, 0))
            {
                printEvent(evt);

                if(evt.type == RFB::EventType::Disconnected)
                {
                    disconnected = true;
                }
            }

            if(! disconnected)
            {
                try
                {
                    registry.requestUpdate(id, true);
                }
                catch(const rfb_error & err)
                {
                    // the final events are still queued
                    Application::warning("%s: request update failed: %s", __FUNCTION__, err.what());
                }

                std::this_thread::sleep_for(1s);
            }
        }

        auto stats = registry.getSessionStats(id);

        std::cout << "stats: bytes sent: " << stats.bytesSent << ", bytes received: " << stats.bytesRecv <<
                  ", frames: " << stats.frameCount << ", uptime: " << stats.uptimeSec << "s" <<
                  ", connected: " << (stats.connected ? "yes" : "no") << std::endl;

        registry.disconnectAll();
        return disconnected ? 1 : 0;
    }
}

int main(int argc, const char** argv)
{
    int res = 0;

    try
    {
        RDSM::RdsmSession app(argc, argv);
        res = app.start();
    }
    catch(const std::exception & err)
    {
        RDSM::Application::error("%s: exception: %s", __FUNCTION__, err.what());
        RDSM::Application::info("program: %s", "terminate...");
        res = 1;
    }
    catch(int val)
    {
        res = val;
    }

    return res;
}
