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
/// \brief Select and build a genotype concordance scheme variant
///

#pragma once

#include "GenotypeConcordanceScheme.hh"

#include <memory>


namespace SCHEME_POLICY
{
enum index_t
{
    DEFAULT,
    MISSING_AS_NO_CALL,
    SIZE
};

const char*
get_label(const index_t i);
}


/// \return a populated but not yet validated scheme of the requested variant
GenotypeConcordanceScheme
getGenotypeConcordanceScheme(const SCHEME_POLICY::index_t policy);


/// \param isMissingAsNoCall if true select SCHEME_POLICY::MISSING_AS_NO_CALL, else SCHEME_POLICY::DEFAULT
GenotypeConcordanceScheme
getGenotypeConcordanceScheme(const bool isMissingAsNoCall);


/// \return a validated, read-only scheme of the requested variant
///
/// This is the access path for comparison code: the const view can not be
/// modified after validation.
std::shared_ptr<const GenotypeConcordanceScheme>
getValidatedGenotypeConcordanceScheme(const SCHEME_POLICY::index_t policy);
