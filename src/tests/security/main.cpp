#include <exception>
#include <iostream>
#include <cassert>
#include <algorithm>

#include "rdsm_tools.h"
#include "rdsm_sockets.h"
#include "librfb_security.h"
#include "../common/rfb_fake_server.h"

using namespace RDSM;

// 1024 bit modp group from rfc 2409
const char* modpPrime =
    "FFFFFFFFFFFFFFFFC90FDAA22168C234C4C6628B80DC1CD129024E088A67CC74020BBEA63B139B22514A08798E3404DD"
    "EF9519B3CD3A431B302B0A6DF25F14374FE1356D6D51C245E485B576625E7EC6F44C42E9A637ED6B0BFF5CB6F406B7ED"
    "EE386BFB5A899FA5AE9F24117C4B1FE649286651ECE65381FFFFFFFFFFFFFFFF";

std::vector<uint8_t> fromHex(std::string_view str)
{
    std::vector<uint8_t> res;

    for(size_t pos = 0; pos + 1 < str.size(); pos += 2)
    {
        res.push_back(std::stoi(std::string(str.substr(pos, 2)), nullptr, 16));
    }

    return res;
}

template<typename Func>
ErrorCode catchCode(Func func)
{
    try
    {
        func();
    }
    catch(const rfb_error & err)
    {
        return err.code;
    }

    throw std::runtime_error("rfb_error expected");
}

void testVncAuth(void)
{
    std::cout << "== test VncAuth" << std::endl;

    std::vector<uint8_t> challenge(16);
    for(size_t it = 0; it < challenge.size(); ++it)
        challenge[it] = it;

    const auto golden = fromHex("9c22b4f2088c3465a1562c4b9d6edb04");

    std::cout << "test ::vncAuthResponse golden: ";
    assert(RFB::Security::vncAuthResponse(challenge, "abc") == golden);
    std::cout << "passed" << std::endl;

    std::cout << "test ::vncAuthResponse truncate: ";
    assert(RFB::Security::vncAuthResponse(challenge, "password") == RFB::Security::vncAuthResponse(challenge, "password-too-long"));
    assert(RFB::Security::vncAuthResponse(challenge, "abc") != RFB::Security::vncAuthResponse(challenge, "abd"));
    std::cout << "passed" << std::endl;

    std::cout << "test ::vncAuthResponse challenge size: ";
    assert(catchCode([]{ RFB::Security::vncAuthResponse(std::vector<uint8_t>(15, 0), "abc"); }) == ErrorCode::ProtocolError);
    std::cout << "passed" << std::endl;

    std::cout << "test ::authenticate vnc: ";
    Test::SocketPair pair;
    pair.server->sendData(challenge).sendFlush();

    RFB::Security::authenticate(RFB::SECURITY_TYPE_VNC, *pair.client, RFB::Credentials{"", "abc"});

    assert(pair.server->recvData(16) == golden);
    assert(pair.client->totalBytesOut() == 16);
    std::cout << "passed" << std::endl;
}

void testArdAuth(void)
{
    std::cout << "== test ArdAuth" << std::endl;

    const auto prime = fromHex(modpPrime);
    assert(prime.size() == 128);

    std::cout << "test ::ardCredentialBlock: ";
    auto block = RFB::Security::ardCredentialBlock("admin", "secret");
    assert(block.size() == 128);
    assert(std::string(block.begin(), block.begin() + 5) == "admin");
    assert(std::all_of(block.begin() + 5, block.begin() + 64, [](uint8_t v){ return v == 0; }));
    assert(std::string(block.begin() + 64, block.begin() + 70) == "secret");
    assert(std::all_of(block.begin() + 70, block.end(), [](uint8_t v){ return v == 0; }));

    assert(catchCode([]{ RFB::Security::ardCredentialBlock(std::string(64, 'u'), "p"); }) == ErrorCode::AuthenticationFailed);
    assert(catchCode([]{ RFB::Security::ardCredentialBlock("u", std::string(64, 'p')); }) == ErrorCode::AuthenticationFailed);
    std::cout << "passed" << std::endl;

    std::cout << "test ::powMod: ";
    assert(RFB::Security::powMod({ 3 }, { 4 }, { 0x0b }, 2) == std::vector<uint8_t>({ 0x00, 0x04 }));
    assert(catchCode([]{ RFB::Security::powMod({ 3 }, { 4 }, { 0 }, 1); }) == ErrorCode::ProtocolError);
    std::cout << "passed" << std::endl;

    // server side key pair
    auto serverPrivate = TLS::randomKey(prime.size());
    auto serverPublic = RFB::Security::powMod({ 2 }, serverPrivate, prime, prime.size());

    std::cout << "test ::ardAuthResponse shared secret: ";
    RFB::Security::ArdParams params;
    params.generator = 2;
    params.prime = prime;
    params.peerKey = serverPublic;

    auto response = RFB::Security::ardAuthResponse(params, RFB::Credentials{"admin", "secret"}, TLS::randomKey(prime.size()));
    assert(response.publicKey.size() == 128);
    assert(response.credentials.size() == 128);

    auto shared = RFB::Security::powMod(response.publicKey, serverPrivate, prime, prime.size());
    auto plain = TLS::decryptAES128(response.credentials, TLS::hashMD5(shared));
    assert(plain == block);
    std::cout << "passed" << std::endl;

    std::cout << "test ::authenticate ard: ";
    Test::SocketPair pair;
    pair.server->sendIntBE16(2).sendIntBE16(prime.size()).sendData(prime).sendData(serverPublic).sendFlush();

    RFB::Security::authenticate(RFB::SECURITY_TYPE_ARD, *pair.client, RFB::Credentials{"admin", "secret"});

    // public key first, then the encrypted block
    auto clientPublic = pair.server->recvData(128);
    auto credentials = pair.server->recvData(128);
    shared = RFB::Security::powMod(clientPublic, serverPrivate, prime, prime.size());
    assert(TLS::decryptAES128(credentials, TLS::hashMD5(shared)) == block);
    std::cout << "passed" << std::endl;

    std::cout << "test ::authenticate ard username required: ";
    assert(catchCode([&]{ RFB::Security::authenticate(RFB::SECURITY_TYPE_ARD, *pair.client, RFB::Credentials{"", "secret"}); }) ==
           ErrorCode::AuthenticationFailed);
    std::cout << "passed" << std::endl;

    std::cout << "test ::recvArdParams key length: ";
    pair.server->sendIntBE16(2).sendIntBE16(64).sendFlush();
    assert(catchCode([&]{ RFB::Security::recvArdParams(*pair.client); }) == ErrorCode::ProtocolError);
    std::cout << "passed" << std::endl;
}

void testUnsupported(void)
{
    std::cout << "== test unsupported" << std::endl;

    Test::SocketPair pair;

    std::cout << "test ::authenticate unsupported: ";
    for(auto type : { RFB::SECURITY_TYPE_TLS, RFB::SECURITY_TYPE_VENCRYPT, RFB::SECURITY_TYPE_APPLE_EXT, 77 })
    {
        assert(catchCode([&]{ RFB::Security::authenticate(type, *pair.client, RFB::Credentials{"user", "pass"}); }) ==
               ErrorCode::UnsupportedSecurityType);
    }

    assert(pair.client->totalBytesOut() == 0);
    std::cout << "passed" << std::endl;

    std::cout << "test ::authenticate none: ";
    RFB::Security::authenticate(RFB::SECURITY_TYPE_NONE, *pair.client, RFB::Credentials{});
    assert(pair.client->totalBytesOut() == 0 && pair.client->totalBytesIn() == 0);
    std::cout << "passed" << std::endl;
}

int main(int argc, char** argv)
{
    testVncAuth();
    testArdAuth();
    testUnsupported();

    return 0;
}
