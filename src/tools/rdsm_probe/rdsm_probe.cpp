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

#include <cstdlib>
#include <cstring>
#include <iostream>

#include "rdsm_tools.h"
#include "rdsm_librfb.h"
#include "librfb_diagnostic.h"
#include "rdsm_probe.h"

namespace RDSM
{
    void probeHelp(const char* prog)
    {
        std::cout << "version: " << RDSM_PROBE_VERSION << std::endl;
        std::cout << "usage: " << prog << " --host <localhost> [--port 5900] [--username <user>] [--password <pass>] [--timeout 5000 (ms)]" <<
                  " [--debug] [--trace] [--debug-types <rfb,sock,auth,diag>] [--syslog] [--logfile <file>]" << std::endl;
        std::cout << "environment: RDSM_PASSWORD used when --password is not given" << std::endl;
    }

    RdsmProbe::RdsmProbe(int argc, const char** argv)
        : Application("rdsm_probe")
    {
        Application::setDebug(DebugTarget::Console, DebugLevel::None);

        for(int it = 1; it < argc; ++it)
        {
            if(0 == std::strcmp(argv[it], "--help") || 0 == std::strcmp(argv[it], "-h"))
            {
                probeHelp(argv[0]);
                throw 0;
            }
            else if(0 == std::strcmp(argv[it], "--host") && it + 1 < argc)
            {
                host.assign(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--port") && it + 1 < argc)
            {
                port = std::stoi(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--username") && it + 1 < argc)
            {
                username.assign(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--password") && it + 1 < argc)
            {
                password.assign(argv[it + 1]);
                it = it + 1;
            }
            else if(0 == std::strcmp(argv[it], "--timeout") && it + 1 < argc)
            {
                timeout = std::stoi(argv[it + 1]);
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
                probeHelp(argv[0]);
                throw 1;
            }
        }

        if(password.empty())
        {
            if(auto env = std::getenv("RDSM_PASSWORD"))
            {
                password.assign(env);
            }
        }
    }

    int RdsmProbe::start(void)
    {
        RFB::DiagnosticOptions opts;
        opts.connectTimeoutMS = timeout;
        opts.readTimeoutMS = timeout;

        auto report = RFB::diagnose(host, port, RFB::Credentials{username, password}, opts);

        std::cout << "host: " << report.host << ", port: " << report.port <<
                  ", address: " << (report.resolvedIp.empty() ? "-" : report.resolvedIp) <<
                  ", protocol: " << report.protocol << std::endl;

        for(auto & step : report.steps)
        {
            std::cout << "[" << RFB::stepStatusName(step.status) << "] " << step.name << ": " <<
                      step.message << " (" << step.durationMS << "ms)" << std::endl;

            if(! step.detail.empty())
            {
                std::cout << "    " << step.detail << std::endl;
            }
        }

        std::cout << "summary: " << report.summary << std::endl;

        if(! report.rootCause.empty())
        {
            std::cout << "root cause: " << report.rootCause << std::endl;
        }

        return report.isSuccess() ? 0 : 1;
    }
}

int main(int argc, const char** argv)
{
    int res = 0;

    try
    {
        RDSM::RdsmProbe app(argc, argv);
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
