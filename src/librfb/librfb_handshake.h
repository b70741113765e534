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

#ifndef _LIBRFB_HANDSHAKE_
#define _LIBRFB_HANDSHAKE_

#include <list>
#include <string>
#include <vector>
#include <cstdint>

#include "rdsm_sockets.h"
#include "rdsm_librfb.h"
#include "librfb_security.h"

namespace RDSM
{
    namespace RFB
    {
        /// fixed client preference, highest first
        const int SECURITY_PRIORITY[] = { SECURITY_TYPE_ARD, SECURITY_TYPE_VNC, SECURITY_TYPE_NONE };

        struct HandshakeOptions
        {
            std::list<int> allowedSecurity;
            /// legacy 3.3 servers may omit the vnc auth result
            int securityResultTimeoutMS = 3000;
            bool shared = true;
        };

        /// result of init exchange
        struct SessionInit
        {
            ProtocolVersion version;
            PixelFormat pixelFormat;
            std::string serverName;
            /// transport counters at the end of handshake
            uint64_t bytesSent = 0;
            uint64_t bytesRecv = 0;
            int securityType = SECURITY_TYPE_INVALID;
            uint16_t width = 0;
            uint16_t height = 0;
        };

        /// @brief: first of priority list present in offered and allowed, or SECURITY_TYPE_INVALID
        int selectSecurityType(const std::vector<uint8_t> & offered, const std::list<int> & allowed);

        /// @brief: read u32 length and text, ProtocolError over limit
        std::string recvReason(const NetworkStream &);

        /// @brief: version exchange, security, authentication, init exchange
        /// throw rfb_error
        SessionInit negotiate(NetworkStream &, const Credentials &, const HandshakeOptions &);
    }
}

#endif // _LIBRFB_HANDSHAKE_
