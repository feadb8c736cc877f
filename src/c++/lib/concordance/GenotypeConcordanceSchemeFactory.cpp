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

#include "GenotypeConcordanceSchemeFactory.hh"
#include "GA4GHScheme.hh"

#include "common/Exceptions.hh"

#include <sstream>



namespace SCHEME_POLICY
{

const char*
get_label(const index_t i)
{
    switch (i)
    {
    case DEFAULT:
        return "default";
    case MISSING_AS_NO_CALL:
        return "missing-as-no-call";
    case SIZE:
        break;
    }

    std::ostringstream oss;
    oss << "Invalid SCHEME_POLICY value: " << static_cast<int>(i);
    BOOST_THROW_EXCEPTION(gtconcord::common::GeneralException(oss.str()));
}

}



GenotypeConcordanceScheme
getGenotypeConcordanceScheme(const SCHEME_POLICY::index_t policy)
{
    GenotypeConcordanceScheme scheme;
    switch (policy)
    {
    case SCHEME_POLICY::DEFAULT:
        addGA4GHSchemeRows(scheme);
        break;
    case SCHEME_POLICY::MISSING_AS_NO_CALL:
        addGA4GHSchemeWithMissingAsNoCallRows(scheme);
        break;
    default:
    {
        std::ostringstream oss;
        oss << "Can't build genotype concordance scheme for policy value: " << static_cast<int>(policy);
        BOOST_THROW_EXCEPTION(gtconcord::common::GeneralException(oss.str()));
    }
    }
    return scheme;
}



GenotypeConcordanceScheme
getGenotypeConcordanceScheme(const bool isMissingAsNoCall)
{
    return getGenotypeConcordanceScheme(isMissingAsNoCall ?
                                        SCHEME_POLICY::MISSING_AS_NO_CALL :
                                        SCHEME_POLICY::DEFAULT);
}



std::shared_ptr<const GenotypeConcordanceScheme>
getValidatedGenotypeConcordanceScheme(const SCHEME_POLICY::index_t policy)
{
    std::shared_ptr<GenotypeConcordanceScheme> schemePtr(
        std::make_shared<GenotypeConcordanceScheme>(getGenotypeConcordanceScheme(policy)));
    schemePtr->validateScheme();
    return schemePtr;
}
