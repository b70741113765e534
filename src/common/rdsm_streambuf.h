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


#ifndef _RDSM_STREAMBUF_
#define _RDSM_STREAMBUF_

#include <vector>
#include <string>
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace RDSM
{
    /// @brief: byte vector with append chaining
    struct BinaryBuf : std::vector<uint8_t>
    {
        BinaryBuf() = default;

        explicit BinaryBuf(size_t len, uint8_t val = 0) : std::vector<uint8_t>(len, val) {}
        BinaryBuf(const_iterator it1, const_iterator it2) : std::vector<uint8_t>(it1, it2) {}
        BinaryBuf(const uint8_t* ptr, size_t len) : std::vector<uint8_t>(ptr, ptr + len) {}
        BinaryBuf(const std::vector<uint8_t> & v) : std::vector<uint8_t>(v) {}
        BinaryBuf(std::vector<uint8_t> && v) noexcept : std::vector<uint8_t>(std::move(v)) {}

        BinaryBuf &     append(const uint8_t*, size_t);
        BinaryBuf &     append(const std::vector<uint8_t> &);
        BinaryBuf &     append(std::string_view);

        std::string     hexString(std::string_view sep = ", ", bool prefix = true) const;
        std::string     toString(void) const;
    };

    /// @brief: network byte order codec over raw get/put, RFB has no little endian fields
    class ByteOrderInterface
    {
    protected:
        virtual void    getRaw(void* ptr, size_t len) const = 0;
        virtual void    putRaw(const void* ptr, size_t len) = 0;

    public:
        virtual ~ByteOrderInterface() = default;

        uint8_t         getInt8(void) const;
        uint16_t        getIntBE16(void) const;
        uint32_t        getIntBE32(void) const;

        void            putInt8(uint8_t);
        void            putIntBE16(uint16_t);
        void            putIntBE32(uint32_t);
    };

    struct streambuf_error : public std::runtime_error
    {
        explicit streambuf_error(const std::string & what) : std::runtime_error(what){}
        explicit streambuf_error(const char* what) : std::runtime_error(what){}
    };

    /// @brief: memory buffer with read cursor, builds and parses fixed wire messages
    class StreamBuf : protected ByteOrderInterface
    {
        BinaryBuf       vec;
        mutable size_t  pos = 0;

    protected:
        void            getRaw(void* ptr, size_t len) const override;
        void            putRaw(const void* ptr, size_t len) override;

        void            checkLength(size_t len, const char* func) const;

    public:
        explicit StreamBuf(size_t reserve = 64);
        explicit StreamBuf(const std::vector<uint8_t> &);

        inline uint8_t  readInt8(void) const { return getInt8(); }
        inline uint16_t readIntBE16(void) const { return getIntBE16(); }
        inline uint32_t readIntBE32(void) const { return getIntBE32(); }
        /// encoding types are signed on the wire
        inline int32_t  readIntBE32s(void) const { return static_cast<int32_t>(getIntBE32()); }

        inline StreamBuf & writeInt8(uint8_t v) { putInt8(v); return *this; }
        inline StreamBuf & writeIntBE16(uint16_t v) { putIntBE16(v); return *this; }
        inline StreamBuf & writeIntBE32(uint32_t v) { putIntBE32(v); return *this; }

        StreamBuf &     write(const uint8_t*, size_t);
        StreamBuf &     write(const std::vector<uint8_t> &);
        StreamBuf &     write(std::string_view);
        StreamBuf &     fill(size_t, uint8_t);

        /// @brief: u32 length followed by text, as RFB strings
        StreamBuf &     writeLengthString(std::string_view);

        /// @brief: read len bytes, all remaining if zero
        BinaryBuf       read(size_t = 0) const;
        void            skip(size_t) const;

        size_t          last(void) const { return vec.size() - pos; }
        size_t          tell(void) const { return pos; }

        const BinaryBuf & rawbuf(void) const { return vec; }
    };
}

#endif // _RDSM_STREAMBUF_
