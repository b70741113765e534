#include <iostream>
#include <cassert>
#include <stdexcept>

#include <unistd.h>

#include "rdsm_tools.h"
#include "rdsm_sockets.h"
#include "librfb_diagnostic.h"
#include "../common/rfb_fake_server.h"

using namespace RDSM;

const RFB::DiagnosticStep & findStep(const RFB::DiagnosticReport & report, const std::string & name)
{
    for(auto & step : report.steps)
    {
        if(step.name == name)
        {
            return step;
        }
    }

    throw std::runtime_error(Tools::joinToString("step not found: ", name));
}

void testRefused(void)
{
    std::cout << "== test connection refused" << std::endl;

    int fd = TCPSocket::listen("127.0.0.1", 0, 1);
    assert(0 <= fd);

    auto port = TCPSocket::localPort(fd);
    ::close(fd);

    auto report = RFB::diagnose("127.0.0.1", port, RFB::Credentials{});

    std::cout << "test ::steps: ";
    assert(report.steps.size() == 2);
    assert(report.steps.front().name == "DNS Resolution");
    assert(report.steps.front().status == RFB::StepStatus::Pass);
    assert(report.steps.back().name == "TCP Connect");
    assert(report.steps.back().status == RFB::StepStatus::Fail);
    assert(report.resolvedIp == "127.0.0.1");
    std::cout << "passed" << std::endl;

    std::cout << "test ::root cause: ";
    assert(! report.isSuccess());
    assert(report.countSteps(RFB::StepStatus::Fail) == 1);
    assert(report.rootCause == report.steps.back().detail);
    assert(Tools::startsWith(report.rootCause, "Connection refused"));
    assert(Tools::startsWith(report.summary, "1/2 passed, 1 failed: [TCP Connect]"));
    std::cout << "passed" << std::endl;
}

void testArdOffer(void)
{
    std::cout << "== test ard offer" << std::endl;

    Test::FakeServer srv([](SocketStream & sock)
    {
        sock.sendString("RFB 003.008\n").sendFlush();
        sock.recvString(12);
        sock.sendInt8(2).sendInt8(RFB::SECURITY_TYPE_VNC).sendInt8(RFB::SECURITY_TYPE_ARD).sendFlush();

        if(sock.recvInt8() != RFB::SECURITY_TYPE_ARD)
        {
            throw std::runtime_error("ard expected");
        }

        Test::waitClientClose(sock);
    });

    RFB::DiagnosticOptions opts;
    opts.peekTimeoutMS = 100;

    auto report = RFB::diagnose("127.0.0.1", srv.localPort(), RFB::Credentials{}, opts);

    std::cout << "test ::protocol: ";
    assert(report.protocol == "ard");
    assert(report.port == srv.localPort());
    std::cout << "passed" << std::endl;

    std::cout << "test ::security detail: ";
    auto & security = findStep(report, "Security Type Negotiation");
    assert(security.status == RFB::StepStatus::Pass);
    assert(security.detail == "Available: [2 (VNC), 30 (ARD)], Selected: 30 (ARD)");
    std::cout << "passed" << std::endl;

    std::cout << "test ::auth skipped: ";
    assert(report.steps.size() == 6);
    assert(findStep(report, "Authentication").status == RFB::StepStatus::Skip);
    assert(report.steps.back().name == "Server Capabilities");
    assert(report.steps.back().status == RFB::StepStatus::Pass);
    assert(report.isSuccess());
    assert(report.rootCause.empty());
    assert(Tools::startsWith(report.summary, "5/6 passed, 1 skipped"));
    std::cout << "passed" << std::endl;
}

void testVncChallenge(void)
{
    std::cout << "== test vnc challenge" << std::endl;

    Test::FakeServer srv([](SocketStream & sock)
    {
        sock.sendString("RFB 003.008\n").sendFlush();
        sock.recvString(12);
        sock.sendInt8(1).sendInt8(RFB::SECURITY_TYPE_VNC).sendFlush();
        sock.recvInt8();
        sock.sendZero(16).sendFlush();

        Test::waitClientClose(sock);
    });

    RFB::DiagnosticOptions opts;
    opts.peekTimeoutMS = 100;

    RFB::Credentials creds;
    creds.password = "secret";

    auto report = RFB::diagnose("localhost", srv.localPort(), creds, opts);

    std::cout << "test ::all passed: ";
    assert(report.protocol == "rfb");
    assert(report.steps.size() == 6);
    assert(report.countSteps(RFB::StepStatus::Pass) == 6);
    assert(Tools::startsWith(report.summary, "All 6 diagnostic steps passed"));
    assert(findStep(report, "Authentication").message == "VNC authentication available (challenge received)");
    std::cout << "passed" << std::endl;
}

void testRejected(void)
{
    std::cout << "== test server rejected" << std::endl;

    Test::FakeServer srv([](SocketStream & sock)
    {
        sock.sendString("RFB 003.008\n").sendFlush();
        sock.recvString(12);
        sock.sendInt8(0).sendIntBE32(11).sendString("maintenance").sendFlush();

        Test::waitClientClose(sock);
    });

    auto report = RFB::diagnose("127.0.0.1", srv.localPort(), RFB::Credentials{});

    std::cout << "test ::security failed: ";
    assert(report.steps.size() == 4);
    assert(report.steps.back().status == RFB::StepStatus::Fail);
    assert(report.steps.back().message == "Server rejected: maintenance");
    assert(report.rootCause == "Server rejected: maintenance");
    std::cout << "passed" << std::endl;
}

void testNotRfb(void)
{
    std::cout << "== test not rfb" << std::endl;

    Test::FakeServer srv([](SocketStream & sock)
    {
        sock.sendString("SSH-2.0-xyz\n").sendFlush();
        Test::waitClientClose(sock);
    });

    auto report = RFB::diagnose("127.0.0.1", srv.localPort(), RFB::Credentials{});

    std::cout << "test ::version failed: ";
    assert(report.steps.size() == 3);
    assert(report.steps.back().name == "RFB Version Handshake");
    assert(report.steps.back().status == RFB::StepStatus::Fail);
    assert(Tools::startsWith(report.summary, "2/3 passed, 1 failed: [RFB Version Handshake]"));
    std::cout << "passed" << std::endl;
}

int main(int argc, char** argv)
{
    testRefused();
    testArdOffer();
    testVncChallenge();
    testRejected();
    testNotRfb();

    return 0;
}
