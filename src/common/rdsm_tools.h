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


#ifndef _RDSM_TOOLS_
#define _RDSM_TOOLS_

#include <list>
#include <chrono>
#include <string>
#include <vector>
#include <cstdint>
#include <sstream>
#include <iterator>
#include <string_view>

namespace RDSM
{
    namespace Tools
    {
        /// @brief: "RDSM::RFB::SessionActor::start" from __PRETTY_FUNCTION__
        std::string prettyFuncName(std::string_view);

        /// @brief: split by char, items are trimmed, empty items dropped
        std::list<std::string> split(std::string_view str, char sep);

        /// @brief: split by char and convert to numbers, throw std::invalid_argument
        std::list<int> splitToInts(std::string_view str, char sep);

        std::string_view trim(std::string_view);
        std::string lower(std::string_view);

        inline bool startsWith(std::string_view str, std::string_view pred)
        {
            return str.size() >= pred.size() && 0 == str.compare(0, pred.size(), pred);
        }

        template<typename... Args>
        std::string joinToString(Args... args)
        {
            std::ostringstream os;
            (os << ... << args);
            return os.str();
        }

        template<typename Iterator>
        std::string join(Iterator first, Iterator last, std::string_view sep)
        {
            std::ostringstream os;

            for(auto it = first; it != last; ++it)
            {
                if(it != first)
                {
                    os << sep;
                }

                os << *it;
            }

            return os.str();
        }

        template<typename Container>
        std::string join(const Container & cont, std::string_view sep)
        {
            return join(std::begin(cont), std::end(cont), sep);
        }

        /// @brief: upper case hex digits, two per byte
        std::string buffer2hexstring(const uint8_t* ptr, size_t len, std::string_view sep = ",", bool prefix = true);

        template<typename Iterator>
        std::string buffer2hexstring(Iterator first, Iterator last, std::string_view sep = ",", bool prefix = true)
        {
            std::vector<uint8_t> buf(first, last);
            return buffer2hexstring(buf.data(), buf.size(), sep, prefix);
        }

        /// @brief: 16 random bytes as uuid version 4 string, "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx"
        std::string uuid4String(std::vector<uint8_t> rand16);

        /// @brief: format time point as ISO-8601 UTC, "2024-01-31T12:00:00Z"
        std::string timeToIso8601(const std::chrono::system_clock::time_point &);

        inline uint64_t elapsedMS(const std::chrono::steady_clock::time_point & tp)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - tp).count();
        }
    }
}

#define NS_FuncName RDSM::Tools::prettyFuncName(__PRETTY_FUNCTION__)

#endif // _RDSM_TOOLS_
