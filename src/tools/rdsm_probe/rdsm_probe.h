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

#ifndef _RDSM_PROBE_
#define _RDSM_PROBE_

#include <string>
#include <cstdint>

#include "rdsm_application.h"

#define RDSM_PROBE_VERSION 20240610

namespace RDSM
{
    class RdsmProbe : public Application
    {
        std::string             host{"localhost"};
        std::string             username;
        std::string             password;
        uint16_t                port = 5900;
        int                     timeout = 5000;

    public:
        RdsmProbe(int argc, const char** argv);

        int                     start(void) override;
    };
}

#endif // _RDSM_PROBE_
