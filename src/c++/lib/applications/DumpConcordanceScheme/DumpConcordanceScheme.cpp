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

#include "DumpConcordanceScheme.hh"
#include "DCSOptions.hh"

#include "concordance/GenotypeConcordanceSchemeFactory.hh"
#include "gtc_util/log.hh"

#include <iostream>



void
writeConcordanceSchemeTable(
    const GenotypeConcordanceScheme& scheme,
    std::ostream& os)
{
    static const char sep('\t');

    os << "CALL_STATE";
    for (unsigned truthIndex(0); truthIndex<TRUTH_STATE::SIZE; ++truthIndex)
    {
        os << sep << TRUTH_STATE::get_label(static_cast<TRUTH_STATE::index_t>(truthIndex));
    }
    os << "\n";

    for (unsigned callIndex(0); callIndex<CALL_STATE::SIZE; ++callIndex)
    {
        const CALL_STATE::index_t callState(static_cast<CALL_STATE::index_t>(callIndex));
        os << CALL_STATE::get_label(callState);
        for (unsigned truthIndex(0); truthIndex<TRUTH_STATE::SIZE; ++truthIndex)
        {
            os << sep << scheme.getContingencyStateString(static_cast<TRUTH_STATE::index_t>(truthIndex), callState);
        }
        os << "\n";
    }
}



static
void
runDCS(const DCSOptions& opt)
{
    const SCHEME_POLICY::index_t policy(opt.getSchemePolicy());
    const std::shared_ptr<const GenotypeConcordanceScheme> schemePtr(getValidatedGenotypeConcordanceScheme(policy));

    log_os << "INFO: validated genotype concordance scheme '" << SCHEME_POLICY::get_label(policy)
           << "' with " << schemePtr->size() << " tuples\n";

    std::ostream& ros(std::cout);
    if (opt.isSingleCell)
    {
        ros << schemePtr->getContingencyStateString(opt.truthState, opt.callState) << "\n";
    }
    else
    {
        writeConcordanceSchemeTable(*schemePtr, ros);
    }
}



void
DumpConcordanceScheme::
runInternal(int argc, char* argv[]) const
{
    DCSOptions opt;

    parseDCSOptions(*this,argc,argv,opt);
    runDCS(opt);
}
