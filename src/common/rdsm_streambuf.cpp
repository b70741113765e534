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

#include "rdsm_tools.h"
#include "rdsm_streambuf.h"
#include "rdsm_application.h"

namespace RDSM
{
    /* BinaryBuf */
    BinaryBuf & BinaryBuf::append(const uint8_t* ptr, size_t len)
    {
        if(ptr && len)
        {
            insert(end(), ptr, ptr + len);
        }

        return *this;
    }

    BinaryBuf & BinaryBuf::append(const std::vector<uint8_t> & buf)
    {
        return append(buf.data(), buf.size());
    }

    BinaryBuf & BinaryBuf::append(std::string_view str)
    {
        return append(reinterpret_cast<const uint8_t*>(str.data()), str.size());
    }

    std::string BinaryBuf::hexString(std::string_view sep, bool prefix) const
    {
        return Tools::buffer2hexstring(data(), size(), sep, prefix);
    }

    std::string BinaryBuf::toString(void) const
    {
        return std::string(begin(), end());
    }

    /* ByteOrderInterface */
    uint8_t ByteOrderInterface::getInt8(void) const
    {
        uint8_t v = 0;
        getRaw(& v, 1);
        return v;
    }

    uint16_t ByteOrderInterface::getIntBE16(void) const
    {
        uint8_t v[2];
        getRaw(v, sizeof(v));
        return (static_cast<uint16_t>(v[0]) << 8) | v[1];
    }

    uint32_t ByteOrderInterface::getIntBE32(void) const
    {
        uint8_t v[4];
        getRaw(v, sizeof(v));
        return (static_cast<uint32_t>(v[0]) << 24) | (static_cast<uint32_t>(v[1]) << 16) |
               (static_cast<uint32_t>(v[2]) << 8) | v[3];
    }

    void ByteOrderInterface::putInt8(uint8_t v)
    {
        putRaw(& v, 1);
    }

    void ByteOrderInterface::putIntBE16(uint16_t x)
    {
        const uint8_t v[2] = { static_cast<uint8_t>(x >> 8), static_cast<uint8_t>(x) };
        putRaw(v, sizeof(v));
    }

    void ByteOrderInterface::putIntBE32(uint32_t x)
    {
        const uint8_t v[4] = { static_cast<uint8_t>(x >> 24), static_cast<uint8_t>(x >> 16),
                               static_cast<uint8_t>(x >> 8), static_cast<uint8_t>(x) };
        putRaw(v, sizeof(v));
    }

    /* StreamBuf */
    StreamBuf::StreamBuf(size_t reserve)
    {
        vec.reserve(reserve);
    }

    StreamBuf::StreamBuf(const std::vector<uint8_t> & buf) : vec(buf)
    {
    }

    void StreamBuf::checkLength(size_t len, const char* func) const
    {
        if(len > last())
        {
            Application::error("%s: buffer underflow, last: %lu, len: %lu", func, last(), len);
            throw streambuf_error(NS_FuncName);
        }
    }

    void StreamBuf::getRaw(void* ptr, size_t len) const
    {
        checkLength(len, __FUNCTION__);

        std::copy_n(vec.begin() + pos, len, static_cast<uint8_t*>(ptr));
        pos += len;
    }

    void StreamBuf::putRaw(const void* ptr, size_t len)
    {
        vec.append(static_cast<const uint8_t*>(ptr), len);
    }

    StreamBuf & StreamBuf::write(const uint8_t* ptr, size_t len)
    {
        vec.append(ptr, len);
        return *this;
    }

    StreamBuf & StreamBuf::write(const std::vector<uint8_t> & buf)
    {
        vec.append(buf);
        return *this;
    }

    StreamBuf & StreamBuf::write(std::string_view str)
    {
        vec.append(str);
        return *this;
    }

    StreamBuf & StreamBuf::fill(size_t len, uint8_t val)
    {
        vec.resize(vec.size() + len, val);
        return *this;
    }

    StreamBuf & StreamBuf::writeLengthString(std::string_view str)
    {
        writeIntBE32(str.size());
        return write(str);
    }

    BinaryBuf StreamBuf::read(size_t len) const
    {
        if(0 == len)
        {
            len = last();
        }

        checkLength(len, __FUNCTION__);

        auto it = vec.begin() + pos;
        pos += len;

        return BinaryBuf(it, it + len);
    }

    void StreamBuf::skip(size_t len) const
    {
        checkLength(len, __FUNCTION__);
        pos += len;
    }
}
