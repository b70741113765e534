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

#include <memory>
#include <chrono>
#include <cstring>
#include <algorithm>
#include <cinttypes>

#include "rdsm_tools.h"
#include "rdsm_sockets.h"
#include "rdsm_application.h"
#include "librfb_handshake.h"
#include "librfb_diagnostic.h"

namespace RDSM
{
    const char* RFB::stepStatusName(const StepStatus & status)
    {
        switch(status)
        {
            case StepStatus::Pass:
                return "pass";

            case StepStatus::Fail:
                return "fail";

            case StepStatus::Skip:
                break;
        }

        return "skip";
    }

    size_t RFB::DiagnosticReport::countSteps(const StepStatus & status) const
    {
        return std::count_if(steps.begin(), steps.end(), [&](auto & step)
        {
            return step.status == status;
        });
    }

    static std::string securityTypeLabel(int type)
    {
        return Tools::joinToString(type, " (", RFB::securityTypeName(type), ")");
    }

    /// one probe run, every phase records exactly one step
    class DiagnosticProbe
    {
        RFB::DiagnosticReport report;
        RFB::DiagnosticOptions opts;

        std::unique_ptr<SocketStream> sock;
        std::chrono::steady_clock::time_point started;

        RFB::ProtocolVersion version;
        int securityType = RFB::SECURITY_TYPE_INVALID;

    protected:
        bool addStep(const char* name, const RFB::StepStatus & status, std::string message, std::string detail,
                     const std::chrono::steady_clock::time_point & tp)
        {
            RFB::DiagnosticStep step;
            step.name.assign(name);
            step.status = status;
            step.message = std::move(message);
            step.detail = std::move(detail);
            step.durationMS = Tools::elapsedMS(tp);

            Application::debug(DebugType::Diag, "%s: step: `%s', status: %s, message: `%s'", __FUNCTION__,
                               step.name.c_str(), RFB::stepStatusName(step.status), step.message.c_str());

            report.steps.emplace_back(std::move(step));
            return status != RFB::StepStatus::Fail;
        }

    public:
        DiagnosticProbe(std::string_view host, uint16_t port, const RFB::DiagnosticOptions & dopts)
            : opts(dopts), started(std::chrono::steady_clock::now())
        {
            report.host.assign(host.begin(), host.end());
            report.port = port;
        }

        bool probeDns(void)
        {
            const char* name = "DNS Resolution";
            auto tp = std::chrono::steady_clock::now();

            try
            {
                auto addrs = TCPSocket::resolvHostname2(report.host);

                if(addrs.empty())
                {
                    return addStep(name, RFB::StepStatus::Fail, Tools::joinToString("DNS lookup failed for ", report.host),
                                   "Check hostname spelling, DNS server, and network connectivity", tp);
                }

                report.resolvedIp = addrs.front();

                auto message = Tools::joinToString(report.host, " resolved to ", report.resolvedIp,
                                                   " (", addrs.size(), (addrs.size() > 1 ? " addresses)" : " address)"));
                auto detail = addrs.size() > 1 ? Tools::joinToString("All resolved addresses: ", Tools::join(addrs, ", ")) : std::string();

                return addStep(name, RFB::StepStatus::Pass, std::move(message), std::move(detail), tp);
            }
            catch(const std::exception & err)
            {
                return addStep(name, RFB::StepStatus::Fail, Tools::joinToString("DNS lookup failed: ", err.what()), "", tp);
            }
        }

        bool probeTcp(void)
        {
            const char* name = "TCP Connect";
            auto tp = std::chrono::steady_clock::now();

            int fd = TCPSocket::connect(report.resolvedIp, report.port, opts.connectTimeoutMS);

            if(0 > fd)
            {
                int err = errno;
                const char* detail = "Check firewall rules, VPN connectivity, and that the service is running";

                if(err == ECONNREFUSED)
                {
                    detail = "Connection refused: the service may not be running or is on a different port";
                }
                else if(err == ETIMEDOUT)
                {
                    detail = "Connection timed out: the port may be firewalled or the host is unreachable";
                }

                return addStep(name, RFB::StepStatus::Fail, Tools::joinToString("TCP connect failed: ", strerror(err)), detail, tp);
            }

            sock = std::make_unique<SocketStream>(fd);
            sock->setRecvTimeout(opts.readTimeoutMS);

            auto ms = Tools::elapsedMS(tp);
            return addStep(name, RFB::StepStatus::Pass,
                           Tools::joinToString("Connected to ", report.resolvedIp, ":", report.port, " in ", ms, "ms"), "", tp);
        }

        bool probeVersion(void)
        {
            const char* name = "RFB Version Handshake";
            auto tp = std::chrono::steady_clock::now();

            try
            {
                auto server = RFB::parseVersion(sock->recvString(12));
                version = RFB::selectVersion(server);

                sock->sendString(version.toWire()).sendFlush();

                return addStep(name, RFB::StepStatus::Pass, "RFB version handshake completed",
                               Tools::joinToString("Server version: ", server.toString(), ", client version: ", version.toString()), tp);
            }
            catch(const std::exception & err)
            {
                return addStep(name, RFB::StepStatus::Fail, Tools::joinToString("Version handshake failed: ", err.what()), "", tp);
            }
        }

        bool probeSecurity(void)
        {
            const char* name = "Security Type Negotiation";
            auto tp = std::chrono::steady_clock::now();

            try
            {
                std::vector<uint8_t> offered;

                if(version.minorVer == 3)
                {
                    securityType = sock->recvIntBE32();

                    if(securityType == RFB::SECURITY_TYPE_INVALID)
                    {
                        return addStep(name, RFB::StepStatus::Fail, Tools::joinToString("Server rejected: ", RFB::recvReason(*sock)), "", tp);
                    }

                    offered.push_back(securityType);
                }
                else
                {
                    auto counts = sock->recvInt8();

                    if(counts == 0)
                    {
                        return addStep(name, RFB::StepStatus::Fail, Tools::joinToString("Server rejected: ", RFB::recvReason(*sock)), "", tp);
                    }

                    offered = sock->recvData(counts);
                    securityType = RFB::selectSecurityType(offered, {});
                }

                if(std::find(offered.begin(), offered.end(), RFB::SECURITY_TYPE_ARD) != offered.end())
                {
                    report.protocol.assign("ard");
                }

                std::list<std::string> labels;

                for(auto type : offered)
                {
                    labels.emplace_back(securityTypeLabel(type));
                }

                auto available = Tools::joinToString("Available: [", Tools::join(labels, ", "), "]");

                if(securityType == RFB::SECURITY_TYPE_INVALID)
                {
                    return addStep(name, RFB::StepStatus::Fail, "No supported security type offered", std::move(available), tp);
                }

                if(version.minorVer != 3)
                {
                    sock->sendInt8(securityType).sendFlush();
                }

                return addStep(name, RFB::StepStatus::Pass, "Security type negotiated",
                               Tools::joinToString(available, ", Selected: ", securityTypeLabel(securityType)), tp);
            }
            catch(const std::exception & err)
            {
                return addStep(name, RFB::StepStatus::Fail, Tools::joinToString("Security negotiation failed: ", err.what()), "", tp);
            }
        }

        bool probeAuthentication(const RFB::Credentials & creds)
        {
            const char* name = "Authentication";
            auto tp = std::chrono::steady_clock::now();

            if(creds.empty())
            {
                return addStep(name, RFB::StepStatus::Skip, "Skipped (no credentials provided)", "", tp);
            }

            try
            {
                switch(securityType)
                {
                    case RFB::SECURITY_TYPE_NONE:
                        return addStep(name, RFB::StepStatus::Pass, "No authentication required", "", tp);

                    case RFB::SECURITY_TYPE_VNC:
                        sock->recvSkip(RFB::Security::VNC_CHALLENGE_SIZE);
                        return addStep(name, RFB::StepStatus::Pass, "VNC authentication available (challenge received)", "", tp);

                    case RFB::SECURITY_TYPE_ARD:
                    {
                        auto params = RFB::Security::recvArdParams(*sock);
                        return addStep(name, RFB::StepStatus::Pass,
                                       Tools::joinToString("ARD DH+AES authentication available (generator=", params.generator,
                                                           ", key_len=", params.prime.size(), ")"), "", tp);
                    }

                    default:
                        break;
                }

                return addStep(name, RFB::StepStatus::Fail,
                               Tools::joinToString("Unsupported security type: ", securityTypeLabel(securityType)), "", tp);
            }
            catch(const std::exception & err)
            {
                return addStep(name, RFB::StepStatus::Fail, Tools::joinToString("Authentication probe failed: ", err.what()), "", tp);
            }
        }

        bool probeCapabilities(void)
        {
            const char* name = "Server Capabilities";
            auto tp = std::chrono::steady_clock::now();

            try
            {
                std::string detail{"ARD/VNC server reachable"};

                if(sock->waitInput(opts.peekTimeoutMS))
                {
                    if(auto pending = sock->hasData())
                    {
                        detail.append("; ").append(std::to_string(pending)).append(" bytes of pending data available");
                    }
                }

                return addStep(name, RFB::StepStatus::Pass, "Server capabilities probed", std::move(detail), tp);
            }
            catch(const std::exception & err)
            {
                return addStep(name, RFB::StepStatus::Fail, Tools::joinToString("Capability probe failed: ", err.what()), "", tp);
            }
        }

        RFB::DiagnosticReport finish(void)
        {
            sock.reset();
            report.durationMS = Tools::elapsedMS(started);

            auto total = report.steps.size();
            auto passed = report.countSteps(RFB::StepStatus::Pass);
            auto skipped = report.countSteps(RFB::StepStatus::Skip);

            std::list<std::string> failed;

            for(auto & step : report.steps)
            {
                if(step.status == RFB::StepStatus::Fail)
                {
                    failed.push_back(step.name);

                    if(report.rootCause.empty())
                    {
                        report.rootCause = step.detail.empty() ? step.message : step.detail;
                    }
                }
            }

            if(failed.size())
            {
                report.summary = Tools::joinToString(passed, "/", total, " passed, ", failed.size(), " failed: [",
                                                     Tools::join(failed, ", "), "] (", report.durationMS, "ms total)");
            }
            else if(skipped)
            {
                report.summary = Tools::joinToString(passed, "/", total, " passed, ", skipped, " skipped (", report.durationMS, "ms total)");
            }
            else
            {
                report.summary = Tools::joinToString("All ", total, " diagnostic steps passed (", report.durationMS, "ms total)");
            }

            Application::info("%s: host: %s, port: %" PRIu16 ", %s", __FUNCTION__, report.host.c_str(), report.port, report.summary.c_str());

            return std::move(report);
        }
    };

    RFB::DiagnosticReport RFB::diagnose(std::string_view host, uint16_t port, const Credentials & creds, const DiagnosticOptions & opts)
    {
        DiagnosticProbe probe(host, port, opts);

        // each phase needs the previous one
        if(probe.probeDns() && probe.probeTcp() && probe.probeVersion() &&
            probe.probeSecurity() && probe.probeAuthentication(creds))
        {
            probe.probeCapabilities();
        }

        return probe.finish();
    }
}
