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

#include <cctype>
#include <cstdio>
#include <sstream>
#include <algorithm>

#include "rdsm_tools.h"
#include "rdsm_librfb.h"
#include "rdsm_application.h"

namespace RDSM
{
    const char* errorCodeName(const ErrorCode & code)
    {
        switch(code)
        {
            case ErrorCode::ConnectionError:
                return "ConnectionError";

            case ErrorCode::ProtocolError:
                return "ProtocolError";

            case ErrorCode::AuthNegotiationFailed:
                return "AuthNegotiationFailed";

            case ErrorCode::AuthenticationFailed:
                return "AuthenticationFailed";

            case ErrorCode::UnsupportedSecurityType:
                return "UnsupportedSecurityType";

            case ErrorCode::AlreadyConnected:
                return "AlreadyConnected";

            case ErrorCode::SessionNotFound:
                return "SessionNotFound";

            case ErrorCode::ChannelClosed:
                return "ChannelClosed";
        }

        return "Unknown";
    }

    RFB::SecurityType RFB::securityType(int code)
    {
        switch(code)
        {
            case SECURITY_TYPE_NONE:
                return SecurityType::None;

            case SECURITY_TYPE_VNC:
                return SecurityType::VncAuth;

            case SECURITY_TYPE_ARD:
                return SecurityType::ArdAuth;

            case SECURITY_TYPE_TLS:
                return SecurityType::Tls;

            case SECURITY_TYPE_VENCRYPT:
                return SecurityType::VeNCrypt;

            case SECURITY_TYPE_APPLE_EXT:
                return SecurityType::AppleExtended;

            default:
                break;
        }

        return SecurityType::Unknown;
    }

    const char* RFB::securityTypeName(int code)
    {
        switch(securityType(code))
        {
            case SecurityType::None:
                return "None";

            case SecurityType::VncAuth:
                return "VNC";

            case SecurityType::ArdAuth:
                return "ARD";

            case SecurityType::Tls:
                return "TLS";

            case SecurityType::VeNCrypt:
                return "VeNCrypt";

            case SecurityType::AppleExtended:
                return "Apple Extended";

            case SecurityType::Unknown:
                break;
        }

        return "Unknown";
    }

    const char* RFB::securityTypeDescription(int code)
    {
        switch(securityType(code))
        {
            case SecurityType::None:
                return "No Authentication";

            case SecurityType::VncAuth:
                return "VNC Authentication";

            case SecurityType::ArdAuth:
                return "Apple Remote Desktop (DH+AES)";

            case SecurityType::Tls:
                return "TLS";

            case SecurityType::VeNCrypt:
                return "VeNCrypt";

            case SecurityType::AppleExtended:
                return "Apple Extended Authentication";

            case SecurityType::Unknown:
                break;
        }

        return "Unknown";
    }

    const char* RFB::encodingName(int type)
    {
        switch(type)
        {
            case ENCODING_RAW:
                return "Raw";

            case ENCODING_COPYRECT:
                return "CopyRect";

            case ENCODING_RRE:
                return "RRE";

            case ENCODING_CORRE:
                return "CoRRE";

            case ENCODING_HEXTILE:
                return "Hextile";

            case ENCODING_ZLIB:
                return "Zlib";

            case ENCODING_TIGHT:
                return "Tight";

            case ENCODING_TRLE:
                return "TRLE";

            case ENCODING_ZRLE:
                return "ZRLE";

            case ENCODING_DESKTOP_SIZE:
                return "DesktopSize";

            case ENCODING_EXT_DESKTOP_SIZE:
                return "ExtendedDesktopSize";

            case ENCODING_LAST_RECT:
                return "LastRect";

            case ENCODING_RICH_CURSOR:
                return "Cursor";

            case ENCODING_CONTINUOUS_UPDATES:
                return "ContinuousUpdates";

            default:
                break;
        }

        return "unknown";
    }

    bool RFB::encodingFromName(std::string_view name, int & type)
    {
        auto slower = Tools::lower(name);

        for(auto enc : { ENCODING_RAW, ENCODING_COPYRECT, ENCODING_RRE, ENCODING_CORRE, ENCODING_HEXTILE,
                         ENCODING_ZLIB, ENCODING_TIGHT, ENCODING_TRLE, ENCODING_ZRLE })
        {
            if(slower == Tools::lower(encodingName(enc)))
            {
                type = enc;
                return true;
            }
        }

        return false;
    }

    std::vector<int> RFB::resolveEncodings(const std::list<std::string> & names, bool localCursor)
    {
        std::vector<int> res;
        res.reserve(names.size() + 5);

        for(const auto & name : names)
        {
            int type = 0;

            if(! encodingFromName(name, type))
            {
                Application::warning("%s: unknown encoding: `%s'", __FUNCTION__, name.c_str());
                continue;
            }

            if(std::find(res.begin(), res.end(), type) == res.end())
            {
                res.push_back(type);
            }
        }

        if(std::find(res.begin(), res.end(), ENCODING_COPYRECT) == res.end())
        {
            res.push_back(ENCODING_COPYRECT);
        }

        if(localCursor)
        {
            res.push_back(ENCODING_RICH_CURSOR);
        }

        res.push_back(ENCODING_DESKTOP_SIZE);
        res.push_back(ENCODING_EXT_DESKTOP_SIZE);
        res.push_back(ENCODING_LAST_RECT);

        return res;
    }

    /* PixelFormat */
    const RFB::PixelFormat RFB::RGB888;

    RFB::PixelFormat::PixelFormat(uint8_t bpp, uint8_t dep, bool be, bool tc, uint16_t rmax, uint16_t gmax, uint16_t bmax, uint8_t rshift, uint8_t gshift, uint8_t bshift)
        : bitsPerPixel(bpp), depth(dep), bigEndian(be), trueColor(tc), redMax(rmax), greenMax(gmax), blueMax(bmax),
          redShift(rshift), greenShift(gshift), blueShift(bshift)
    {
    }

    bool RFB::PixelFormat::operator== (const PixelFormat & pf) const
    {
        return bitsPerPixel == pf.bitsPerPixel && depth == pf.depth &&
               bigEndian == pf.bigEndian && trueColor == pf.trueColor &&
               redMax == pf.redMax && greenMax == pf.greenMax && blueMax == pf.blueMax &&
               redShift == pf.redShift && greenShift == pf.greenShift && blueShift == pf.blueShift;
    }

    std::string RFB::PixelFormat::toString(void) const
    {
        std::ostringstream os;

        if(trueColor)
        {
            os << static_cast<int>(bitsPerPixel) << "bpp depth=" << static_cast<int>(depth) <<
               " R:" << redMax << "/" << static_cast<int>(redShift) <<
               " G:" << greenMax << "/" << static_cast<int>(greenShift) <<
               " B:" << blueMax << "/" << static_cast<int>(blueShift) <<
               " " << (bigEndian ? "BE" : "LE");
        }
        else
        {
            os << static_cast<int>(bitsPerPixel) << "bpp depth=" << static_cast<int>(depth) << " colour-mapped";
        }

        return os.str();
    }

    BinaryBuf RFB::PixelFormat::toBinary(void) const
    {
        StreamBuf sb(WireSize);

        sb.writeInt8(bitsPerPixel).writeInt8(depth).
            writeInt8(bigEndian ? 1 : 0).writeInt8(trueColor ? 1 : 0).
            writeIntBE16(redMax).writeIntBE16(greenMax).writeIntBE16(blueMax).
            writeInt8(redShift).writeInt8(greenShift).writeInt8(blueShift).
            fill(3, 0);

        return sb.rawbuf();
    }

    RFB::PixelFormat RFB::PixelFormat::fromBinary(const std::vector<uint8_t> & buf)
    {
        if(buf.size() != WireSize)
        {
            Application::error("%s: invalid size: %lu", __FUNCTION__, buf.size());
            throw rfb_error(ErrorCode::ProtocolError, "invalid pixel format length");
        }

        StreamBuf sb(buf);
        PixelFormat pf;

        pf.bitsPerPixel = sb.readInt8();
        pf.depth = sb.readInt8();
        pf.bigEndian = sb.readInt8();
        pf.trueColor = sb.readInt8();
        pf.redMax = sb.readIntBE16();
        pf.greenMax = sb.readIntBE16();
        pf.blueMax = sb.readIntBE16();
        pf.redShift = sb.readInt8();
        pf.greenShift = sb.readInt8();
        pf.blueShift = sb.readInt8();

        return pf;
    }

    /* ProtocolVersion */
    std::string RFB::ProtocolVersion::toString(void) const
    {
        return Tools::joinToString(majorVer, ".", minorVer);
    }

    std::string RFB::ProtocolVersion::toWire(void) const
    {
        char buf[16] = {0};
        std::snprintf(buf, sizeof(buf), "RFB %03d.%03d\n", majorVer, minorVer);
        return std::string(buf, 12);
    }

    RFB::ProtocolVersion RFB::parseVersion(std::string_view str)
    {
        auto isDigits = [](std::string_view sv)
        {
            return std::all_of(sv.begin(), sv.end(), [](char ch){ return std::isdigit(static_cast<unsigned char>(ch)); });
        };

        if(str.size() != 12 || ! Tools::startsWith(str, "RFB ") || str[7] != '.' || str[11] != '\n' ||
           ! isDigits(str.substr(4, 3)) || ! isDigits(str.substr(8, 3)))
        {
            Application::error("%s: invalid version string: `%s'", __FUNCTION__,
                               Tools::buffer2hexstring(str.begin(), str.end()).c_str());
            throw rfb_error(ErrorCode::ProtocolError, "invalid protocol version");
        }

        ProtocolVersion res;
        res.majorVer = std::stoi(std::string(str.substr(4, 3)));
        res.minorVer = std::stoi(std::string(str.substr(8, 3)));

        return res;
    }

    RFB::ProtocolVersion RFB::selectVersion(const ProtocolVersion & server)
    {
        if(server.majorVer > 3 || (server.majorVer == 3 && server.minorVer >= 8))
        {
            return ProtocolVersion{3, 8};
        }

        if(server.majorVer == 3 && server.minorVer == 7)
        {
            return ProtocolVersion{3, 7};
        }

        if(server.majorVer == 3 && server.minorVer >= 3)
        {
            return ProtocolVersion{3, 3};
        }

        Application::error("%s: unsupported server version: %s", __FUNCTION__, server.toString().c_str());
        throw rfb_error(ErrorCode::ProtocolError, "unsupported protocol version");
    }
}
