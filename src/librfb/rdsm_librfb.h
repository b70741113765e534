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

#ifndef _RDSM_LIBRFB_
#define _RDSM_LIBRFB_

#include <list>
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <string_view>

#include "rdsm_streambuf.h"

namespace RDSM
{
    enum class ErrorCode
    {
        ConnectionError,
        ProtocolError,
        AuthNegotiationFailed,
        AuthenticationFailed,
        UnsupportedSecurityType,
        AlreadyConnected,
        SessionNotFound,
        ChannelClosed
    };

    const char* errorCodeName(const ErrorCode &);

    struct rfb_error : public std::runtime_error
    {
        ErrorCode code;

        rfb_error(const ErrorCode & err, const std::string & what) : std::runtime_error(what), code(err) {}
        rfb_error(const ErrorCode & err, const char* what) : std::runtime_error(what), code(err) {}
    };

    namespace RFB
    {
        // RFB protocol constant
        const int VERSION_MAJOR = 3;
        const int VERSION_MINOR = 8;

        const int SECURITY_TYPE_INVALID = 0;
        const int SECURITY_TYPE_NONE = 1;
        const int SECURITY_TYPE_VNC = 2;
        const int SECURITY_TYPE_TLS = 18;
        const int SECURITY_TYPE_VENCRYPT = 19;
        const int SECURITY_TYPE_ARD = 30;
        const int SECURITY_TYPE_APPLE_EXT = 35;

        const int SECURITY_RESULT_OK = 0;
        const int SECURITY_RESULT_ERR = 1;

        const int CLIENT_SET_PIXEL_FORMAT = 0;
        const int CLIENT_SET_ENCODINGS = 2;
        const int CLIENT_REQUEST_FB_UPDATE = 3;
        const int CLIENT_EVENT_KEY = 4;
        const int CLIENT_EVENT_POINTER = 5;
        const int CLIENT_CUT_TEXT = 6;

        const int SERVER_FB_UPDATE = 0;
        const int SERVER_SET_COLOURMAP = 1;
        const int SERVER_BELL = 2;
        const int SERVER_CUT_TEXT = 3;

        // RFB protocol constants
        const int ENCODING_RAW = 0;
        const int ENCODING_COPYRECT = 1;
        const int ENCODING_RRE = 2;
        const int ENCODING_CORRE = 4;
        const int ENCODING_HEXTILE = 5;
        const int ENCODING_ZLIB = 6;
        const int ENCODING_TIGHT = 7;
        const int ENCODING_TRLE = 15;
        const int ENCODING_ZRLE = 16;

        // hextile constants
        const int HEXTILE_RAW = 1;
        const int HEXTILE_BACKGROUND = 2;
        const int HEXTILE_FOREGROUND = 4;
        const int HEXTILE_SUBRECTS = 8;
        const int HEXTILE_COLOURED = 16;

        // pseudo encodings
        const int ENCODING_DESKTOP_SIZE = -223;
        const int ENCODING_LAST_RECT = -224;
        const int ENCODING_RICH_CURSOR = -239;
        const int ENCODING_EXT_DESKTOP_SIZE = -308;
        const int ENCODING_CONTINUOUS_UPDATES = -313;

        // sanity limit for server strings: reason, name, cut text
        const size_t STRING_LENGTH_LIMIT = 1024 * 1024;

        enum class SecurityType { None, VncAuth, ArdAuth, Tls, VeNCrypt, AppleExtended, Unknown };

        SecurityType securityType(int code);

        /// @brief: short name, "VNC", "ARD", "Unknown"
        const char* securityTypeName(int code);
        /// @brief: long name, "VNC Authentication"
        const char* securityTypeDescription(int code);

        const char* encodingName(int type);
        /// @brief: case insensitive lookup, return false for unknown name
        bool encodingFromName(std::string_view name, int & type);

        /// @brief: client encodings list from names, with pseudo encodings appended
        std::vector<int> resolveEncodings(const std::list<std::string> & names, bool localCursor);

        struct PixelFormat
        {
            uint8_t bitsPerPixel = 32;
            uint8_t depth = 24;
            bool bigEndian = false;
            bool trueColor = true;
            uint16_t redMax = 255;
            uint16_t greenMax = 255;
            uint16_t blueMax = 255;
            uint8_t redShift = 16;
            uint8_t greenShift = 8;
            uint8_t blueShift = 0;

            PixelFormat() = default;
            PixelFormat(uint8_t bpp, uint8_t dep, bool be, bool tc, uint16_t rmax, uint16_t gmax, uint16_t bmax, uint8_t rshift, uint8_t gshift, uint8_t bshift);

            bool operator== (const PixelFormat &) const;
            bool operator!= (const PixelFormat & pf) const { return ! (*this == pf); }

            size_t bytesPerPixel(void) const { return (bitsPerPixel + 7) >> 3; }
            std::string toString(void) const;

            /// @brief: fixed 16 bytes wire form
            BinaryBuf toBinary(void) const;
            static PixelFormat fromBinary(const std::vector<uint8_t> &);

            static const size_t WireSize = 16;
        };

        extern const PixelFormat RGB888;

        struct ProtocolVersion
        {
            int majorVer = 0;
            int minorVer = 0;

            /// @brief: "3.8"
            std::string toString(void) const;
            /// @brief: wire form "RFB 003.008\n"
            std::string toWire(void) const;
        };

        /// @brief: parse 12 bytes "RFB xxx.yyy\n", throw rfb_error ProtocolError
        ProtocolVersion parseVersion(std::string_view);

        /// @brief: highest supported version not greater than server version
        ProtocolVersion selectVersion(const ProtocolVersion & server);

        struct SessionConfig
        {
            std::string host;
            uint16_t port = 5900;
            std::string label;
            std::string username;
            std::string password;

            std::list<std::string> encodings{"ZRLE", "Hextile", "CopyRect", "Raw"};
            std::list<int> allowedSecurity;
            PixelFormat pixelFormat;

            int connectTimeoutSec = 15;
            int keepaliveIntervalSec = 0;

            bool shared = true;
            bool viewOnly = false;
            bool localCursor = true;
            bool usePixelFormat = false;
        };
    }
}

#endif // _RDSM_LIBRFB_
