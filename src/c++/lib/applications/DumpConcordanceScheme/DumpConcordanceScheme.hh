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

#include <iosfwd>


class GenotypeConcordanceScheme;


/// print a genotype concordance scheme as a tab-delimited table, one row per call state
void
writeConcordanceSchemeTable(
    const GenotypeConcordanceScheme& scheme,
    std::ostream& os);


/// \brief print the contents of a validated genotype concordance scheme
///
struct DumpConcordanceScheme : public gtconcord::Program
{
    const char*
    name() const override
    {
        return "DumpConcordanceScheme";
    }

    void
    runInternal(int argc, char* argv[]) const override;
};
