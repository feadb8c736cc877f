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
/// \brief Utilities shared by program option parsers
///

#pragma once

#include "common/Program.hh"

#include "boost/program_options.hpp"

#include <iosfwd>


/// write program usage to \p os and exit
///
/// if \p xmessage is not null it is reported as a command-line error and the
/// program exits with an error status
void
usage(
    std::ostream& os,
    const gtconcord::Program& prog,
    const boost::program_options::options_description& visible,
    const char* friendlyName,
    const char* usageSuffix,
    const char* xmessage);
