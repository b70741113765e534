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

#ifndef _LIBRFB_SECURITY_
#define _LIBRFB_SECURITY_

#include <string>
#include <vector>
#include <cstdint>
#include <string_view>

#include "rdsm_sockets.h"
#include "rdsm_librfb.h"

namespace RDSM
{
    namespace RFB
    {
        struct Credentials
        {
            std::string username;
            std::string password;

            bool empty(void) const { return username.empty() && password.empty(); }
        };

        namespace Security
        {
            const size_t VNC_CHALLENGE_SIZE = 16;

            const size_t ARD_KEY_LENGTH_MIN = 128;
            const size_t ARD_KEY_LENGTH_MAX = 1024;
            const size_t ARD_CREDENTIAL_FIELD = 64;

            /// @brief: diffie-hellman parameters sent by ard server
            struct ArdParams
            {
                uint16_t generator = 0;
                std::vector<uint8_t> prime;
                std::vector<uint8_t> peerKey;
            };

            /// @brief: client answer, public key and encrypted credentials
            struct ArdResponse
            {
                std::vector<uint8_t> publicKey;
                std::vector<uint8_t> credentials;
            };

            /// @brief: des-ecb of challenge with bit reversed password key
            std::vector<uint8_t> vncAuthResponse(const std::vector<uint8_t> & challenge, std::string_view password);

            ArdParams recvArdParams(const NetworkStream &);

            /// @brief: fixed 128 bytes block, username and password null padded to 64 bytes
            std::vector<uint8_t> ardCredentialBlock(std::string_view username, std::string_view password);

            /// @brief: base^exp mod mod, big endian, left padded to len
            std::vector<uint8_t> powMod(const std::vector<uint8_t> & base, const std::vector<uint8_t> & exp,
                                        const std::vector<uint8_t> & mod, size_t len);

            /// @brief: compute the public key, shared secret and encrypted block for given private key
            ArdResponse ardAuthResponse(const ArdParams &, const Credentials &, const std::vector<uint8_t> & privateKey);

            /// @brief: run the sub protocol for the selected type, throw rfb_error on failure
            void authenticate(int type, NetworkStream &, const Credentials &);
        }
    }
}

#endif // _LIBRFB_SECURITY_
