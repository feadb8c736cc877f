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

#include "DCSOptions.hh"

#include "common/ProgramUtil.hh"
#include "gtc_util/log.hh"

#include "boost/program_options.hpp"

#include <iostream>
#include <sstream>



static
void
usage(
    std::ostream& os,
    const gtconcord::Program& prog,
    const boost::program_options::options_description& visible,
    const char* msg = nullptr)
{
    usage(os, prog, visible, "print a genotype concordance scheme table", "", msg);
}



void
parseDCSOptions(
    const gtconcord::Program& prog,
    int argc, char* argv[],
    DCSOptions& opt)
{
    namespace po = boost::program_options;
    po::options_description req("configuration");
    req.add_options()
    ("missing-as-no-call", po::value(&opt.isMissingAsNoCall)->zero_tokens(),
     "select the scheme which treats a missing truth genotype as a no-call (default: missing truth is compared as hom-ref)")
    ("truth-state", po::value(&opt.truthStateLabel),
     "truth state of a single scheme cell to print, requires call-state")
    ("call-state", po::value(&opt.callStateLabel),
     "call state of a single scheme cell to print, requires truth-state")
    ;

    po::options_description help("help");
    help.add_options()
    ("help,h","print this message");

    po::options_description visible("options");
    visible.add(req).add(help);

    bool po_parse_fail(false);
    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, visible), vm);
        po::notify(vm);
    }
    catch (const boost::program_options::error& e)
    {
        log_os << "\nERROR: Exception thrown by option parser: " << e.what() << "\n";
        po_parse_fail=true;
    }

    if ((vm.count("help")) || po_parse_fail)
    {
        usage(log_os,prog,visible);
    }

    // fast check of config state:
    const bool isTruthState(! opt.truthStateLabel.empty());
    const bool isCallState(! opt.callStateLabel.empty());
    if (isTruthState != isCallState)
    {
        usage(log_os,prog,visible,"truth-state and call-state must be specified together");
    }

    opt.isSingleCell = isTruthState;
    if (! opt.isSingleCell) return;

    if (! TRUTH_STATE::parse_label(opt.truthStateLabel, opt.truthState))
    {
        std::ostringstream oss;
        oss << "Unknown truth state: '" << opt.truthStateLabel << "'";
        usage(log_os,prog,visible,oss.str().c_str());
    }

    if (! CALL_STATE::parse_label(opt.callStateLabel, opt.callState))
    {
        std::ostringstream oss;
        oss << "Unknown call state: '" << opt.callStateLabel << "'";
        usage(log_os,prog,visible,oss.str().c_str());
    }
}
