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

#include "common/Program.hh"
#include "common/Exceptions.hh"
#include "common/config.h"

#include "gtc_util/log.hh"

#include <cstdlib>

#include <iostream>



namespace gtconcord
{

const char*
Program::
version() const
{
    return GTCONCORD_VERSION;
}



const char*
Program::
compiler() const
{
    return GTCONCORD_CXX_COMPILER_NAME " " GTCONCORD_CXX_COMPILER_VERSION;
}



const char*
Program::
buildTime() const
{
    return GTCONCORD_BUILD_TIME;
}



void
Program::
post_catch(
    int argc,
    char* argv[],
    std::ostream& os) const
{
    os << "...caught in program.run()\n";
    os << "\tcmdline:";
    for (int i(0); i<argc; ++i)
    {
        os << ' ' << argv[i];
    }
    os << "\n\tversion: " << version() << "\n" << std::flush;
    exit(EXIT_FAILURE);
}



int
Program::
run(int argc, char* argv[]) const
{
    try
    {
        std::ios_base::sync_with_stdio(false);
        runInternal(argc,argv);
    }
    catch (const gtconcord::common::ExceptionData& e)
    {
        log_os << "FATAL_ERROR: " << name() << " EXCEPTION: "
               << e.getContext() << "\n";
        post_catch(argc,argv,log_os);
    }
    catch (const std::exception& e)
    {
        log_os << "FATAL_ERROR: " << name() << " EXCEPTION: " << e.what() << "\n";
        post_catch(argc,argv,log_os);
    }
    catch (...)
    {
        log_os << "FATAL_ERROR: " << name() << " UNKNOWN EXCEPTION\n";
        post_catch(argc,argv,log_os);
    }
    return EXIT_SUCCESS;
}

}
