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

#include <algorithm>
#include <cinttypes>

#include "rdsm_tools.h"
#include "rdsm_application.h"
#include "librfb_handshake.h"

namespace RDSM
{
    int RFB::selectSecurityType(const std::vector<uint8_t> & offered, const std::list<int> & allowed)
    {
        for(auto type : SECURITY_PRIORITY)
        {
            if(! allowed.empty() && std::find(allowed.begin(), allowed.end(), type) == allowed.end())
            {
                continue;
            }

            if(std::find(offered.begin(), offered.end(), type) != offered.end())
            {
                return type;
            }
        }

        return SECURITY_TYPE_INVALID;
    }

    std::string RFB::recvReason(const NetworkStream & stream)
    {
        size_t len = stream.recvIntBE32();

        if(len > STRING_LENGTH_LIMIT)
        {
            Application::error("%s: reason length too large: %lu", __FUNCTION__, len);
            throw rfb_error(ErrorCode::ProtocolError, "reason length too large");
        }

        return stream.recvString(len);
    }

    static void securityResult(const NetworkStream & stream, const RFB::ProtocolVersion & version)
    {
        auto res = stream.recvIntBE32();

        Application::debug(DebugType::Rfb, "%s: security result: %" PRIu32, __FUNCTION__, res);

        if(res == RFB::SECURITY_RESULT_OK)
        {
            return;
        }

        // the reason string exists since 3.8
        auto reason = version.minorVer >= 8 ? RFB::recvReason(stream) : std::string("authentication failed");

        Application::error("%s: security result failed, reason: `%s'", __FUNCTION__, reason.c_str());
        throw rfb_error(ErrorCode::AuthenticationFailed, reason);
    }

    static RFB::SessionInit negotiateStages(NetworkStream & stream, const RFB::Credentials & creds, const RFB::HandshakeOptions & opts)
    {
        RFB::SessionInit init;

        // version exchange
        auto server = RFB::parseVersion(stream.recvString(12));
        init.version = RFB::selectVersion(server);

        Application::debug(DebugType::Rfb, "%s: server version: %s, client version: %s", __FUNCTION__,
                           server.toString().c_str(), init.version.toString().c_str());

        stream.sendString(init.version.toWire()).sendFlush();

        // security type selection
        if(init.version.minorVer == 3)
        {
            init.securityType = stream.recvIntBE32();

            if(init.securityType == RFB::SECURITY_TYPE_INVALID)
            {
                auto reason = RFB::recvReason(stream);
                Application::error("%s: server rejected connection, reason: `%s'", __FUNCTION__, reason.c_str());
                throw rfb_error(ErrorCode::AuthNegotiationFailed, reason);
            }

            if(! opts.allowedSecurity.empty() &&
                std::find(opts.allowedSecurity.begin(), opts.allowedSecurity.end(), init.securityType) == opts.allowedSecurity.end())
            {
                Application::error("%s: server security type not allowed: %d", __FUNCTION__, init.securityType);
                throw rfb_error(ErrorCode::AuthNegotiationFailed, "security type not allowed");
            }
        }
        else
        {
            auto counts = stream.recvInt8();

            if(counts == 0)
            {
                auto reason = RFB::recvReason(stream);
                Application::error("%s: server rejected connection, reason: `%s'", __FUNCTION__, reason.c_str());
                throw rfb_error(ErrorCode::AuthNegotiationFailed, reason);
            }

            auto offered = stream.recvData(counts);
            std::list<int> types(offered.begin(), offered.end());

            Application::debug(DebugType::Rfb, "%s: server security types: [%s]", __FUNCTION__,
                               Tools::join(types.begin(), types.end(), ",").c_str());

            init.securityType = RFB::selectSecurityType(offered, opts.allowedSecurity);

            if(init.securityType == RFB::SECURITY_TYPE_INVALID)
            {
                Application::error("%s: %s", __FUNCTION__, "no matching security type");
                throw rfb_error(ErrorCode::AuthNegotiationFailed, "no matching security type");
            }

            stream.sendInt8(init.securityType).sendFlush();
        }

        Application::debug(DebugType::Rfb, "%s: security type: %d (%s)", __FUNCTION__,
                           init.securityType, RFB::securityTypeName(init.securityType));

        // authentication
        RFB::Security::authenticate(init.securityType, stream, creds);

        // security result, always on 3.7 and 3.8, on 3.3 for authenticated types only
        if(init.version.minorVer >= 7 || init.securityType != RFB::SECURITY_TYPE_NONE)
        {
            if(init.version.minorVer == 3 && ! stream.waitInput(opts.securityResultTimeoutMS))
            {
                Application::error("%s: %s, timeout: %dms", __FUNCTION__, "security result missing", opts.securityResultTimeoutMS);
                throw rfb_error(ErrorCode::AuthenticationFailed, "security result missing");
            }

            securityResult(stream, init.version);
        }

        // client init
        stream.sendInt8(opts.shared ? 1 : 0).sendFlush();

        // server init
        init.width = stream.recvIntBE16();
        init.height = stream.recvIntBE16();
        init.pixelFormat = RFB::PixelFormat::fromBinary(stream.recvData(RFB::PixelFormat::WireSize));

        size_t nameLen = stream.recvIntBE32();

        if(nameLen > RFB::STRING_LENGTH_LIMIT)
        {
            Application::error("%s: name length too large: %lu", __FUNCTION__, nameLen);
            throw rfb_error(ErrorCode::ProtocolError, "name length too large");
        }

        init.serverName = stream.recvString(nameLen);

        Application::info("%s: server: `%s', size: %" PRIu16 "x%" PRIu16 ", format: %s", __FUNCTION__,
                          init.serverName.c_str(), init.width, init.height, init.pixelFormat.toString().c_str());

        return init;
    }

    RFB::SessionInit RFB::negotiate(NetworkStream & stream, const Credentials & creds, const HandshakeOptions & opts)
    {
        try
        {
            return negotiateStages(stream, creds, opts);
        }
        catch(const network_error & err)
        {
            Application::error("%s: network error: %s", __FUNCTION__, err.what());
            throw rfb_error(ErrorCode::ConnectionError, err.what());
        }
        catch(const gnutls_error & err)
        {
            Application::error("%s: crypto error: %s", __FUNCTION__, err.what());
            throw rfb_error(ErrorCode::AuthenticationFailed, err.what());
        }
    }
}
