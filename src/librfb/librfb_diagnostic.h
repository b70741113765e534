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

#ifndef _LIBRFB_DIAGNOSTIC_
#define _LIBRFB_DIAGNOSTIC_

#include <list>
#include <string>
#include <cstdint>
#include <string_view>

#include "librfb_security.h"

namespace RDSM
{
    namespace RFB
    {
        enum class StepStatus { Pass, Fail, Skip };

        /// @brief: "pass", "fail", "skip"
        const char* stepStatusName(const StepStatus &);

        struct DiagnosticStep
        {
            std::string name;
            std::string message;
            std::string detail;
            uint64_t durationMS = 0;
            StepStatus status = StepStatus::Skip;
        };

        struct DiagnosticReport
        {
            std::string host;
            std::string protocol{"rfb"};
            std::string resolvedIp;
            std::string summary;
            std::string rootCause;

            std::list<DiagnosticStep> steps;
            uint64_t durationMS = 0;
            uint16_t port = 0;

            size_t      countSteps(const StepStatus &) const;
            bool        isSuccess(void) const { return 0 == countSteps(StepStatus::Fail); }
        };

        struct DiagnosticOptions
        {
            int connectTimeoutMS = 5000;
            int readTimeoutMS = 5000;
            int peekTimeoutMS = 500;
        };

        /// @brief: run the handshake phases on a disposable connection, never throws
        DiagnosticReport diagnose(std::string_view host, uint16_t port, const Credentials & creds, const DiagnosticOptions & opts = DiagnosticOptions());
    }
}

#endif // _LIBRFB_DIAGNOSTIC_
