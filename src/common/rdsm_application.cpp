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


#include <syslog.h>
#include <sys/time.h>

#include <ctime>
#include <cstdio>
#include <memory>
#include <clocale>
#include <iterator>
#include <algorithm>

#ifdef RDSM_WITH_SYSTEMD
#include <systemd/sd-journal.h>
#endif

#include "rdsm_tools.h"
#include "rdsm_application.h"

namespace RDSM
{
    struct DebugTypeName
    {
        uint32_t type;
        const char* name;
    };

    const DebugTypeName debugTypeNames[] =
    {
        { DebugType::Rfb, "rfb" }, { DebugType::Sock, "sock" }, { DebugType::Tls, "tls" },
        { DebugType::Auth, "auth" }, { DebugType::Session, "session" }, { DebugType::Registry, "registry" },
        { DebugType::Diag, "diag" }, { DebugType::App, "app" }
    };

    struct SyslogFacility
    {
        const char* name;
        int facility;
    };

    const SyslogFacility syslogFacilities[] =
    {
        { "user", LOG_USER }, { "daemon", LOG_DAEMON },
        { "local0", LOG_LOCAL0 }, { "local1", LOG_LOCAL1 }, { "local2", LOG_LOCAL2 }, { "local3", LOG_LOCAL3 },
        { "local4", LOG_LOCAL4 }, { "local5", LOG_LOCAL5 }, { "local6", LOG_LOCAL6 }, { "local7", LOG_LOCAL7 }
    };

    // logger state, guarded by appLoggingLock for the file handle
    std::unique_ptr<FILE, int(*)(FILE*)> appLoggingFd{ nullptr, fclose };
    std::mutex appLoggingLock;

    DebugTarget appDebugTarget = DebugTarget::Console;
    DebugLevel appDebugLevel = DebugLevel::Info;
    uint32_t appDebugTypes = DebugType::All;

    std::string appIdent{"rdsm"};
    int appFacility = LOG_USER;

    const char* debugTypeName(uint32_t type)
    {
        for(auto & val : debugTypeNames)
        {
            if(val.type == type)
            {
                return val.name;
            }
        }

        return "all";
    }

    const std::string & Application::ident(void)
    {
        return appIdent;
    }

    void Application::setDebugSyslogFacility(std::string_view name)
    {
        auto it = std::find_if(std::begin(syslogFacilities), std::end(syslogFacilities), [&](auto & val)
        {
            return name == val.name;
        });

        if(it == std::end(syslogFacilities))
        {
            Application::warning("%s: unknown facility: `%.*s'", __FUNCTION__, (int) name.size(), name.data());
            return;
        }

        appFacility = it->facility;

        if(isDebugTarget(DebugTarget::Syslog))
        {
            ::closelog();
            ::openlog(appIdent.c_str(), LOG_PID, appFacility);
        }
    }

    bool Application::isDebugTarget(const DebugTarget & tgt)
    {
        return appDebugTarget == tgt;
    }

    bool Application::isDebugTypes(uint32_t vals)
    {
        return appDebugTypes & vals;
    }

    void Application::setDebug(const DebugTarget & tgt, const DebugLevel & lvl)
    {
        setDebugTarget(tgt);
        setDebugLevel(lvl);
    }

    void Application::setDebugTypes(const std::list<std::string> & names)
    {
        uint32_t types = 0;

        for(auto & name : names)
        {
            auto lname = Tools::lower(name);

            if(lname == "all")
            {
                types = DebugType::All;
                continue;
            }

            auto it = std::find_if(std::begin(debugTypeNames), std::end(debugTypeNames), [&](auto & val)
            {
                return lname == val.name;
            });

            if(it == std::end(debugTypeNames))
            {
                Application::warning("%s: unknown debug type: `%s'", __FUNCTION__, lname.c_str());
                continue;
            }

            types |= it->type;
        }

        appDebugTypes = types;
    }

    void Application::setDebugTarget(const DebugTarget & tgt)
    {
        if(tgt == appDebugTarget)
        {
            return;
        }

        if(appDebugTarget == DebugTarget::Syslog)
        {
            ::closelog();
        }
        else if(appDebugTarget == DebugTarget::SyslogFile)
        {
            const std::scoped_lock guard{ appLoggingLock };
            appLoggingFd.reset();
        }

        if(tgt == DebugTarget::Syslog)
        {
            ::openlog(appIdent.c_str(), LOG_PID, appFacility);
        }

        appDebugTarget = tgt;
    }

    void Application::setDebugTarget(std::string_view tgt)
    {
        if(tgt == "console")
        {
            setDebugTarget(DebugTarget::Console);
        }
        else if(tgt == "syslog")
        {
            setDebugTarget(DebugTarget::Syslog);
        }
        else
        {
            setDebugTarget(DebugTarget::Quiet);
        }
    }

    void Application::setDebugTargetFile(const std::filesystem::path & file)
    {
        if(file.empty())
        {
            return;
        }

        std::unique_ptr<FILE, int(*)(FILE*)> fd{ std::fopen(file.c_str(), "a"), fclose };

        if(! fd)
        {
            Application::error("%s: open failed, file: `%s'", __FUNCTION__, file.c_str());
            return;
        }

        setDebugTarget(DebugTarget::Console);

        const std::scoped_lock guard{ appLoggingLock };
        appLoggingFd = std::move(fd);
        appDebugTarget = DebugTarget::SyslogFile;
    }

    bool Application::isDebugLevel(const DebugLevel & lvl)
    {
        // levels are ordered, a higher level includes the lower ones
        return lvl != DebugLevel::None && static_cast<int>(lvl) <= static_cast<int>(appDebugLevel);
    }

    void Application::setDebugLevel(const DebugLevel & lvl)
    {
        appDebugLevel = lvl;
    }

    void Application::setDebugLevel(std::string_view lvl)
    {
        if(lvl == "info")
        {
            setDebugLevel(DebugLevel::Info);
        }
        else if(lvl == "debug")
        {
            setDebugLevel(DebugLevel::Debug);
        }
        else if(lvl == "trace")
        {
            setDebugLevel(DebugLevel::Trace);
        }
        else
        {
            setDebugLevel(DebugLevel::None);
        }
    }

    Application::Application(std::string_view sid)
    {
        std::setlocale(LC_ALL, "");
        std::setlocale(LC_NUMERIC, "C");

        appIdent.assign(sid.begin(), sid.end());
    }

    Application::~Application()
    {
        setDebugTarget(DebugTarget::Console);
    }

    void writeLogLine(int priority, const char* tag, const char* format, va_list args)
    {
        if(appDebugTarget == DebugTarget::Syslog)
        {
#ifdef RDSM_WITH_SYSTEMD
            sd_journal_printv(priority, format, args);
#else
            vsyslog(priority, format, args);
#endif
            return;
        }

        if(appDebugTarget == DebugTarget::Quiet)
        {
            return;
        }

        const std::scoped_lock guard{ appLoggingLock };

        if(appLoggingFd)
        {
            // file lines carry time and ident, console lines do not
            struct timeval tv;
            struct tm tt;

            gettimeofday(& tv, nullptr);
            localtime_r(& tv.tv_sec, & tt);

            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", & tt);

            std::fprintf(appLoggingFd.get(), "%s.%03d %s[%s] ", buf, static_cast<int>(tv.tv_usec / 1000), appIdent.c_str(), tag);
            std::vfprintf(appLoggingFd.get(), format, args);
            std::fputc('\n', appLoggingFd.get());
            std::fflush(appLoggingFd.get());
        }
        else
        {
            std::fprintf(stderr, "[%s] ", tag);
            std::vfprintf(stderr, format, args);
            std::fputc('\n', stderr);

            if(priority <= LOG_WARNING)
            {
                std::fflush(stderr);
            }
        }
    }

    void Application::info(const char* format, ...)
    {
        if(isDebugLevel(DebugLevel::Info))
        {
            va_list args;
            va_start(args, format);
            writeLogLine(LOG_INFO, "info", format, args);
            va_end(args);
        }
    }

    void Application::notice(const char* format, ...)
    {
        va_list args;
        va_start(args, format);
        writeLogLine(LOG_NOTICE, "notice", format, args);
        va_end(args);
    }

    void Application::warning(const char* format, ...)
    {
        if(isDebugLevel(DebugLevel::Info))
        {
            va_list args;
            va_start(args, format);
            writeLogLine(LOG_WARNING, "warning", format, args);
            va_end(args);
        }
    }

    void Application::error(const char* format, ...)
    {
        va_list args;
        va_start(args, format);
        writeLogLine(LOG_ERR, "error", format, args);
        va_end(args);
    }

    void Application::vdebug(uint32_t subsys, const char* format, va_list args)
    {
        char tag[32];
        std::snprintf(tag, sizeof(tag), "debug:%s", debugTypeName(subsys));

        writeLogLine(LOG_DEBUG, tag, format, args);
    }

    void Application::debug(uint32_t subsys, const char* format, ...)
    {
        if((subsys & appDebugTypes) && isDebugLevel(DebugLevel::Debug))
        {
            va_list args;
            va_start(args, format);
            vdebug(subsys, format, args);
            va_end(args);
        }
    }

    void Application::vtrace(uint32_t subsys, const char* format, va_list args)
    {
        char tag[32];
        std::snprintf(tag, sizeof(tag), "trace:%s", debugTypeName(subsys));

        writeLogLine(LOG_DEBUG, tag, format, args);
    }

    void Application::trace(uint32_t subsys, const char* format, ...)
    {
        if((subsys & appDebugTypes) && isDebugLevel(DebugLevel::Trace))
        {
            va_list args;
            va_start(args, format);
            vtrace(subsys, format, args);
            va_end(args);
        }
    }
}
