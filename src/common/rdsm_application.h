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

#ifndef _RDSM_APPLICATION_
#define _RDSM_APPLICATION_

#include <list>
#include <mutex>
#include <string>
#include <cstdarg>
#include <cstdint>
#include <filesystem>
#include <string_view>

namespace RDSM
{
    enum class DebugTarget { Quiet, Console, Syslog, SyslogFile };
    enum class DebugLevel { None, Info, Debug, Trace };

    enum DebugType : uint32_t
    {
        All = 0xFFFFFFFF,
        Rfb = 1u << 31,
        Sock = 1u << 30,
        Tls = 1u << 29,
        Auth = 1u << 28,
        Session = 1u << 27,
        Registry = 1u << 26,
        Diag = 1u << 25,
        App = 1u << 24
    };

    /// @brief: lower case subsystem name, "session", or "all"
    const char* debugTypeName(uint32_t);

    class Application
    {
    public:
        explicit Application(std::string_view ident);
        virtual ~Application();

        Application(Application &) = delete;
        Application & operator= (const Application &) = delete;

        static void info(const char* format, ...);
        static void notice(const char* format, ...);
        static void warning(const char* format, ...);
        static void error(const char* format, ...);
        static void vdebug(uint32_t subsys, const char* format, va_list args);
        static void debug(uint32_t subsys, const char* format, ...);
        static void vtrace(uint32_t subsys, const char* format, va_list args);
        static void trace(uint32_t subsys, const char* format, ...);

        static void setDebug(const DebugTarget &, const DebugLevel &);

        static void setDebugTarget(const DebugTarget &);
        static void setDebugTarget(std::string_view target);
        static void setDebugTargetFile(const std::filesystem::path & file);
        static bool isDebugTarget(const DebugTarget &);

        static void setDebugLevel(const DebugLevel &);
        static void setDebugLevel(std::string_view level);
        static bool isDebugLevel(const DebugLevel &);

        static void setDebugTypes(const std::list<std::string> &);
        static bool isDebugTypes(uint32_t vals);

        static void setDebugSyslogFacility(std::string_view name);

        static const std::string & ident(void);

        virtual int start(void) = 0;
    };
}

#endif // _RDSM_APPLICATION_
