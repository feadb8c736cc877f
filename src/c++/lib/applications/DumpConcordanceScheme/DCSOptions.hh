//
// GTConcord - Genotype Concordance Scheme Library
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file

#pragma once

#include "common/Program.hh"
#include "concordance/GenotypeConcordanceSchemeFactory.hh"

#include <string>


struct DCSOptions
{
    SCHEME_POLICY::index_t
    getSchemePolicy() const
    {
        return (isMissingAsNoCall ? SCHEME_POLICY::MISSING_AS_NO_CALL : SCHEME_POLICY::DEFAULT);
    }

    bool isMissingAsNoCall = false;

    std::string truthStateLabel;
    std::string callStateLabel;

    /// if true, report only the (truthState,callState) scheme cell
    bool isSingleCell = false;
    TRUTH_STATE::index_t truthState = TRUTH_STATE::MISSING;
    CALL_STATE::index_t callState = CALL_STATE::MISSING;
};


void
parseDCSOptions(
    const gtconcord::Program& prog,
    int argc, char* argv[],
    DCSOptions& opt);
