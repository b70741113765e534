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

#include <gmp.h>

#include <algorithm>
#include <cinttypes>

#include "rdsm_tools.h"
#include "rdsm_application.h"
#include "librfb_security.h"

namespace RDSM
{
    /// gmp integer owner
    struct BigNum
    {
        mpz_t val;

        BigNum() { mpz_init(val); }
        explicit BigNum(const std::vector<uint8_t> & buf)
        {
            mpz_init(val);
            mpz_import(val, buf.size(), 1, 1, 1, 0, buf.data());
        }

        ~BigNum() { mpz_clear(val); }

        BigNum(const BigNum &) = delete;
        BigNum & operator=(const BigNum &) = delete;

        std::vector<uint8_t> toBuffer(size_t len) const
        {
            size_t count = (mpz_sizeinbase(val, 2) + 7) / 8;

            if(count > len)
            {
                Application::error("%s: number too large, bytes: %lu, limit: %lu", __FUNCTION__, count, len);
                throw rfb_error(ErrorCode::ProtocolError, NS_FuncName);
            }

            std::vector<uint8_t> res(len, 0);

            if(0 != mpz_sgn(val))
            {
                mpz_export(res.data() + (len - count), & count, 1, 1, 1, 0, val);
            }

            return res;
        }
    };

    std::vector<uint8_t> RFB::Security::vncAuthResponse(const std::vector<uint8_t> & challenge, std::string_view password)
    {
        if(challenge.size() != VNC_CHALLENGE_SIZE)
        {
            Application::error("%s: invalid challenge size: %lu", __FUNCTION__, challenge.size());
            throw rfb_error(ErrorCode::ProtocolError, NS_FuncName);
        }

        return TLS::encryptDES(challenge, password);
    }

    RFB::Security::ArdParams RFB::Security::recvArdParams(const NetworkStream & stream)
    {
        ArdParams params;

        params.generator = stream.recvIntBE16();
        size_t keyLength = stream.recvIntBE16();

        Application::debug(DebugType::Auth, "%s: generator: %" PRIu16 ", key length: %lu", __FUNCTION__, params.generator, keyLength);

        if(keyLength < ARD_KEY_LENGTH_MIN || keyLength > ARD_KEY_LENGTH_MAX)
        {
            Application::error("%s: invalid key length: %lu", __FUNCTION__, keyLength);
            throw rfb_error(ErrorCode::ProtocolError, "invalid dh key length");
        }

        params.prime = stream.recvData(keyLength);
        params.peerKey = stream.recvData(keyLength);

        return params;
    }

    std::vector<uint8_t> RFB::Security::ardCredentialBlock(std::string_view username, std::string_view password)
    {
        if(username.size() >= ARD_CREDENTIAL_FIELD || password.size() >= ARD_CREDENTIAL_FIELD)
        {
            Application::error("%s: %s", __FUNCTION__, "username or password too long");
            throw rfb_error(ErrorCode::AuthenticationFailed, "username or password too long");
        }

        std::vector<uint8_t> res(ARD_CREDENTIAL_FIELD * 2, 0);

        std::copy(username.begin(), username.end(), res.begin());
        std::copy(password.begin(), password.end(), res.begin() + ARD_CREDENTIAL_FIELD);

        return res;
    }

    std::vector<uint8_t> RFB::Security::powMod(const std::vector<uint8_t> & base, const std::vector<uint8_t> & exp,
            const std::vector<uint8_t> & mod, size_t len)
    {
        BigNum b(base), e(exp), m(mod);

        if(0 == mpz_sgn(m.val))
        {
            Application::error("%s: %s", __FUNCTION__, "zero modulus");
            throw rfb_error(ErrorCode::ProtocolError, "invalid dh modulus");
        }

        BigNum res;
        mpz_powm(res.val, b.val, e.val, m.val);

        return res.toBuffer(len);
    }

    RFB::Security::ArdResponse RFB::Security::ardAuthResponse(const ArdParams & params, const Credentials & creds, const std::vector<uint8_t> & privateKey)
    {
        const size_t keyLength = params.prime.size();

        if(keyLength == 0 || params.peerKey.size() != keyLength)
        {
            Application::error("%s: invalid params, prime: %lu, peer key: %lu", __FUNCTION__, keyLength, params.peerKey.size());
            throw rfb_error(ErrorCode::ProtocolError, "invalid dh params");
        }

        auto block = ardCredentialBlock(creds.username, creds.password);
        const std::vector<uint8_t> generator = { static_cast<uint8_t>(params.generator >> 8), static_cast<uint8_t>(params.generator) };

        ArdResponse res;
        res.publicKey = powMod(generator, privateKey, params.prime, keyLength);

        auto shared = powMod(params.peerKey, privateKey, params.prime, keyLength);
        auto secret = TLS::hashMD5(shared);

        res.credentials = TLS::encryptAES128(block, secret);

        std::fill(block.begin(), block.end(), 0);
        std::fill(shared.begin(), shared.end(), 0);

        return res;
    }

    void RFB::Security::authenticate(int type, NetworkStream & stream, const Credentials & creds)
    {
        switch(securityType(type))
        {
            case SecurityType::None:
                Application::debug(DebugType::Auth, "%s: %s", __FUNCTION__, "no authentication");
                return;

            case SecurityType::VncAuth:
            {
                auto challenge = stream.recvData(VNC_CHALLENGE_SIZE);
                Application::debug(DebugType::Auth, "%s: vnc challenge: %s", __FUNCTION__, Tools::buffer2hexstring(challenge.data(), challenge.size()).c_str());

                auto response = vncAuthResponse(challenge, creds.password);
                stream.sendData(response).sendFlush();
                return;
            }

            case SecurityType::ArdAuth:
            {
                if(creds.username.empty())
                {
                    Application::error("%s: %s", __FUNCTION__, "ard authentication requires username");
                    throw rfb_error(ErrorCode::AuthenticationFailed, "username required");
                }

                auto params = recvArdParams(stream);
                auto privateKey = TLS::randomKey(params.prime.size());
                auto response = ardAuthResponse(params, creds, privateKey);

                std::fill(privateKey.begin(), privateKey.end(), 0);

                Application::debug(DebugType::Auth, "%s: send public key: %lu bytes, credentials: %lu bytes", __FUNCTION__,
                                   response.publicKey.size(), response.credentials.size());

                stream.sendData(response.publicKey).sendData(response.credentials).sendFlush();
                return;
            }

            case SecurityType::Tls:
            case SecurityType::VeNCrypt:
            case SecurityType::AppleExtended:
            case SecurityType::Unknown:
                break;
        }

        Application::error("%s: unsupported security type: %d (%s)", __FUNCTION__, type, securityTypeName(type));
        throw rfb_error(ErrorCode::UnsupportedSecurityType, Tools::joinToString("unsupported security type: ", type));
    }
}
