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


#include <ctime>
#include <cctype>
#include <iomanip>
#include <stdexcept>

#include "rdsm_tools.h"

namespace RDSM
{
    std::string Tools::prettyFuncName(std::string_view name)
    {
        // drop arguments and return type
        auto args = name.find('(');

        if(args != std::string_view::npos)
        {
            name = name.substr(0, args);
        }

        auto space = name.rfind(' ');

        if(space != std::string_view::npos)
        {
            name = name.substr(space + 1);
        }

        return std::string(name);
    }

    std::string_view Tools::trim(std::string_view str)
    {
        while(! str.empty() && std::isspace(static_cast<unsigned char>(str.front())))
        {
            str.remove_prefix(1);
        }

        while(! str.empty() && std::isspace(static_cast<unsigned char>(str.back())))
        {
            str.remove_suffix(1);
        }

        return str;
    }

    std::list<std::string> Tools::split(std::string_view str, char sep)
    {
        std::list<std::string> res;

        while(true)
        {
            auto pos = str.find(sep);
            auto item = trim(str.substr(0, pos));

            if(! item.empty())
            {
                res.emplace_back(item);
            }

            if(pos == std::string_view::npos)
            {
                break;
            }

            str.remove_prefix(pos + 1);
        }

        return res;
    }

    std::list<int> Tools::splitToInts(std::string_view str, char sep)
    {
        std::list<int> res;

        for(auto & item : split(str, sep))
        {
            size_t end = 0;
            int val = std::stoi(item, & end, 0);

            if(end != item.size())
            {
                throw std::invalid_argument(joinToString("not a number: ", item));
            }

            res.push_back(val);
        }

        return res;
    }

    std::string Tools::lower(std::string_view str)
    {
        std::string res;
        res.reserve(str.size());

        for(auto ch : str)
        {
            res.push_back(std::tolower(static_cast<unsigned char>(ch)));
        }

        return res;
    }

    std::string Tools::buffer2hexstring(const uint8_t* ptr, size_t len, std::string_view sep, bool prefix)
    {
        const char* digits = "0123456789ABCDEF";
        std::string res;

        res.reserve(len * (2 + sep.size() + (prefix ? 2 : 0)));

        for(size_t it = 0; it < len; ++it)
        {
            if(it)
            {
                res.append(sep);
            }

            if(prefix)
            {
                res.append("0x");
            }

            res.push_back(digits[ptr[it] >> 4]);
            res.push_back(digits[ptr[it] & 0x0F]);
        }

        return res;
    }

    std::string Tools::uuid4String(std::vector<uint8_t> buf)
    {
        if(buf.size() != 16)
        {
            throw std::invalid_argument(joinToString("uuid needs 16 bytes, got: ", buf.size()));
        }

        // version 4, variant 1
        buf[6] = (buf[6] & 0x0F) | 0x40;
        buf[8] = (buf[8] & 0x3F) | 0x80;

        auto hex = lower(buffer2hexstring(buf.data(), buf.size(), "", false));

        return joinToString(hex.substr(0, 8), "-", hex.substr(8, 4), "-",
                            hex.substr(12, 4), "-", hex.substr(16, 4), "-", hex.substr(20));
    }

    std::string Tools::timeToIso8601(const std::chrono::system_clock::time_point & tp)
    {
        time_t ts = std::chrono::system_clock::to_time_t(tp);
        struct tm tt = {};

        ::gmtime_r(& ts, & tt);

        std::ostringstream os;
        os << std::put_time(& tt, "%Y-%m-%dT%H:%M:%SZ");
        return os.str();
    }
}
