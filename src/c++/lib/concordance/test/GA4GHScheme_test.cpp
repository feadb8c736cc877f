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


#include "boost/test/unit_test.hpp"

#include "GA4GHScheme.hh"

#include <cstddef>
#include <set>


typedef std::set<CONTINGENCY_STATE::index_t> ContingencyStateSet;


static
ContingencyStateSet
getStateSet(
    const GenotypeConcordanceScheme& scheme,
    const TRUTH_STATE::index_t truthState,
    const CALL_STATE::index_t callState)
{
    const ContingencyStateArray* statesPtr(scheme.getConcordanceStateArray(truthState, callState));
    BOOST_REQUIRE(statesPtr != nullptr);
    return GenotypeConcordanceScheme::getContingencyStateSet(*statesPtr);
}


/// expected rendering of one call state row, truth columns ordered as in truthColumns
struct ExpectedSchemeRow
{
    CALL_STATE::index_t callState;
    const char* cells[TRUTH_STATE::SIZE];
};


static const TRUTH_STATE::index_t truthColumns[TRUTH_STATE::SIZE] =
{
    TRUTH_STATE::MISSING, TRUTH_STATE::HOM_REF, TRUTH_STATE::HET_REF_VAR1, TRUTH_STATE::HET_VAR1_VAR2,
    TRUTH_STATE::HOM_VAR1, TRUTH_STATE::NO_CALL, TRUTH_STATE::LOW_GQ, TRUTH_STATE::LOW_DP,
    TRUTH_STATE::VC_FILTERED, TRUTH_STATE::GT_FILTERED, TRUTH_STATE::IS_MIXED
};


/// full GA4GH table with a missing truth genotype treated as a no-call
static const ExpectedSchemeRow missingAsNoCallTable[CALL_STATE::SIZE] =
{
    /**                             MISSING  HOM_REF  HET_REF_VAR1 HET_VAR1_VAR2 HOM_VAR1    NO_CALL  LOW_GQ   LOW_DP   VC_FILT  GT_FILT  IS_MIXED **/
    {CALL_STATE::MISSING,       {"TN",    "TN",    "TN,FN",     "FN",         "FN",       "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY"}},
    {CALL_STATE::HOM_REF,       {"EMPTY", "TN",    "TN,FN",     "FN",         "FN",       "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY"}},
    {CALL_STATE::HET_REF_VAR1,  {"EMPTY", "FP,TN", "TP,TN",     "TP,FN",      "TP,FN",    "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY"}},
    {CALL_STATE::HET_REF_VAR2,  {"NA",    "NA",    "FP,TN,FN",  "NA",         "FP,FN",    "NA",    "NA",    "NA",    "NA",    "NA",    "NA"}},
    {CALL_STATE::HET_REF_VAR3,  {"NA",    "NA",    "NA",        "FP,FN",      "NA",       "NA",    "NA",    "NA",    "NA",    "NA",    "NA"}},
    {CALL_STATE::HET_VAR1_VAR2, {"EMPTY", "FP",    "TP,FP",     "TP",         "TP,FP,FN", "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY"}},
    {CALL_STATE::HET_VAR1_VAR3, {"NA",    "NA",    "NA",        "TP,FP,FN",   "NA",       "NA",    "NA",    "NA",    "NA",    "NA",    "NA"}},
    {CALL_STATE::HET_VAR3_VAR4, {"NA",    "FP",    "FP,FN",     "FP,FN",      "FP,FN",    "NA",    "NA",    "NA",    "NA",    "NA",    "NA"}},
    {CALL_STATE::HOM_VAR1,      {"EMPTY", "FP",    "TP,FP",     "TP,FN",      "TP",       "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY"}},
    {CALL_STATE::HOM_VAR2,      {"NA",    "NA",    "FP,FN",     "TP,FN",      "FP,FN",    "NA",    "NA",    "NA",    "NA",    "NA",    "NA"}},
    {CALL_STATE::HOM_VAR3,      {"NA",    "NA",    "NA",        "FP,FN",      "NA",       "NA",    "NA",    "NA",    "NA",    "NA",    "NA"}},
    {CALL_STATE::NO_CALL,       {"EMPTY", "EMPTY", "EMPTY",     "EMPTY",      "EMPTY",    "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY"}},
    {CALL_STATE::VC_FILTERED,   {"EMPTY", "TN",    "TN,FN",     "FN",         "FN",       "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY"}},
    {CALL_STATE::GT_FILTERED,   {"EMPTY", "TN",    "TN,FN",     "FN",         "FN",       "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY"}},
    {CALL_STATE::LOW_GQ,        {"EMPTY", "TN",    "TN,FN",     "FN",         "FN",       "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY"}},
    {CALL_STATE::LOW_DP,        {"EMPTY", "TN",    "TN,FN",     "FN",         "FN",       "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY"}},
    {CALL_STATE::IS_MIXED,      {"EMPTY", "EMPTY", "EMPTY",     "EMPTY",      "EMPTY",    "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY", "EMPTY"}}
};


/// compare every cell of scheme against the expected table, optionally skipping the MISSING truth column
static
void
checkSchemeTable(
    const GenotypeConcordanceScheme& scheme,
    const bool isSkipMissingTruth)
{
    std::set<CALL_STATE::index_t> seenCallStates;
    for (const ExpectedSchemeRow& row : missingAsNoCallTable)
    {
        seenCallStates.insert(row.callState);
        for (unsigned columnIndex(0); columnIndex<TRUTH_STATE::SIZE; ++columnIndex)
        {
            const TRUTH_STATE::index_t truthState(truthColumns[columnIndex]);
            if (isSkipMissingTruth && (truthState == TRUTH_STATE::MISSING)) continue;
            BOOST_TEST_CONTEXT("truth: " << TRUTH_STATE::get_label(truthState) << " call: " << CALL_STATE::get_label(row.callState))
            {
                BOOST_CHECK_EQUAL(scheme.getContingencyStateString(truthState, row.callState), row.cells[columnIndex]);
            }
        }
    }
    BOOST_REQUIRE_EQUAL(seenCallStates.size(), static_cast<std::size_t>(CALL_STATE::SIZE));
}


/// every cell is defined, non-empty and passes validation
static
void
checkSchemeIsComplete(GenotypeConcordanceScheme& scheme)
{
    for (unsigned truthIndex(0); truthIndex<TRUTH_STATE::SIZE; ++truthIndex)
    {
        for (unsigned callIndex(0); callIndex<CALL_STATE::SIZE; ++callIndex)
        {
            const ContingencyStateArray* statesPtr(
                scheme.getConcordanceStateArray(static_cast<TRUTH_STATE::index_t>(truthIndex),
                                                static_cast<CALL_STATE::index_t>(callIndex)));
            BOOST_REQUIRE(statesPtr != nullptr);
            BOOST_REQUIRE(! statesPtr->empty());
            BOOST_REQUIRE_EQUAL(GenotypeConcordanceScheme::getContingencyStateSet(*statesPtr).size(), statesPtr->size());
        }
    }

    BOOST_REQUIRE_EQUAL(scheme.size(), static_cast<std::size_t>(TRUTH_STATE::SIZE*CALL_STATE::SIZE));
    BOOST_REQUIRE_NO_THROW(scheme.validateScheme());
    BOOST_REQUIRE(scheme.isValidated());
}


BOOST_AUTO_TEST_SUITE( GA4GHScheme_test )


BOOST_AUTO_TEST_CASE( test_MissingAsNoCallIsComplete )
{
    GenotypeConcordanceScheme scheme;
    addGA4GHSchemeWithMissingAsNoCallRows(scheme);
    checkSchemeIsComplete(scheme);
}


BOOST_AUTO_TEST_CASE( test_DefaultIsComplete )
{
    GenotypeConcordanceScheme scheme;
    addGA4GHSchemeRows(scheme);
    checkSchemeIsComplete(scheme);
}


BOOST_AUTO_TEST_CASE( test_MissingAsNoCallScenarios )
{
    using namespace CONTINGENCY_STATE;

    GenotypeConcordanceScheme scheme;
    addGA4GHSchemeWithMissingAsNoCallRows(scheme);

    BOOST_REQUIRE(getStateSet(scheme, TRUTH_STATE::HOM_REF, CALL_STATE::HET_REF_VAR1) == ContingencyStateSet({FP, TN}));
    BOOST_REQUIRE(getStateSet(scheme, TRUTH_STATE::HET_REF_VAR1, CALL_STATE::MISSING) == ContingencyStateSet({TN, FN}));
    BOOST_REQUIRE(getStateSet(scheme, TRUTH_STATE::HOM_VAR1, CALL_STATE::HOM_VAR1) == ContingencyStateSet({TP}));
    BOOST_REQUIRE(getStateSet(scheme, TRUTH_STATE::HOM_VAR1, CALL_STATE::HET_VAR1_VAR2) == ContingencyStateSet({TP, FP, FN}));
    BOOST_REQUIRE(getStateSet(scheme, TRUTH_STATE::HET_VAR1_VAR2, CALL_STATE::HET_VAR1_VAR3) == ContingencyStateSet({TP, FP, FN}));
    BOOST_REQUIRE(getStateSet(scheme, TRUTH_STATE::HET_REF_VAR1, CALL_STATE::HET_REF_VAR2) == ContingencyStateSet({FP, TN, FN}));

    BOOST_REQUIRE(*scheme.getConcordanceStateArray(TRUTH_STATE::MISSING, CALL_STATE::HET_VAR1_VAR3) == CONTINGENCY_ARRAY::NA);
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, CALL_STATE::HET_VAR1_VAR3), "NA");

    for (unsigned truthIndex(0); truthIndex<TRUTH_STATE::SIZE; ++truthIndex)
    {
        const TRUTH_STATE::index_t truthState(static_cast<TRUTH_STATE::index_t>(truthIndex));
        BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(truthState, CALL_STATE::NO_CALL), "EMPTY");
        BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(truthState, CALL_STATE::IS_MIXED), "EMPTY");
    }
}


BOOST_AUTO_TEST_CASE( test_MissingAsNoCallStrings )
{
    GenotypeConcordanceScheme scheme;
    addGA4GHSchemeWithMissingAsNoCallRows(scheme);

    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, CALL_STATE::MISSING), "TN");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, CALL_STATE::HOM_VAR1), "EMPTY");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::HET_VAR1_VAR2, CALL_STATE::HET_REF_VAR1), "TP,FN");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::HOM_REF, CALL_STATE::HET_REF_VAR1), "FP,TN");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::HET_REF_VAR1, CALL_STATE::HET_REF_VAR2), "FP,TN,FN");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::HOM_REF, CALL_STATE::HET_VAR3_VAR4), "FP");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::LOW_GQ, CALL_STATE::HOM_REF), "EMPTY");
}


BOOST_AUTO_TEST_CASE( test_FilteredCallRowsMatch )
{
    static const CALL_STATE::index_t filteredCallStates[] = { CALL_STATE::GT_FILTERED, CALL_STATE::LOW_GQ, CALL_STATE::LOW_DP };

    GenotypeConcordanceScheme missingAsNoCallScheme;
    addGA4GHSchemeWithMissingAsNoCallRows(missingAsNoCallScheme);
    GenotypeConcordanceScheme defaultScheme;
    addGA4GHSchemeRows(defaultScheme);

    for (unsigned truthIndex(0); truthIndex<TRUTH_STATE::SIZE; ++truthIndex)
    {
        const TRUTH_STATE::index_t truthState(static_cast<TRUTH_STATE::index_t>(truthIndex));
        for (const CALL_STATE::index_t callState : filteredCallStates)
        {
            BOOST_REQUIRE(*missingAsNoCallScheme.getConcordanceStateArray(truthState, callState) ==
                          *missingAsNoCallScheme.getConcordanceStateArray(truthState, CALL_STATE::VC_FILTERED));
            BOOST_REQUIRE(*defaultScheme.getConcordanceStateArray(truthState, callState) ==
                          *defaultScheme.getConcordanceStateArray(truthState, CALL_STATE::VC_FILTERED));
        }
    }
}


BOOST_AUTO_TEST_CASE( test_VariantsDifferOnlyInMissingTruth )
{
    GenotypeConcordanceScheme missingAsNoCallScheme;
    addGA4GHSchemeWithMissingAsNoCallRows(missingAsNoCallScheme);
    GenotypeConcordanceScheme defaultScheme;
    addGA4GHSchemeRows(defaultScheme);

    unsigned missingColumnDiffCount(0);
    for (unsigned truthIndex(0); truthIndex<TRUTH_STATE::SIZE; ++truthIndex)
    {
        const TRUTH_STATE::index_t truthState(static_cast<TRUTH_STATE::index_t>(truthIndex));
        for (unsigned callIndex(0); callIndex<CALL_STATE::SIZE; ++callIndex)
        {
            const CALL_STATE::index_t callState(static_cast<CALL_STATE::index_t>(callIndex));
            const bool isSame(*missingAsNoCallScheme.getConcordanceStateArray(truthState, callState) ==
                              *defaultScheme.getConcordanceStateArray(truthState, callState));
            if (truthState == TRUTH_STATE::MISSING)
            {
                if (! isSame) missingColumnDiffCount++;
            }
            else
            {
                BOOST_REQUIRE(isSame);
            }
        }
    }
    BOOST_REQUIRE(missingColumnDiffCount > 0);
}


BOOST_AUTO_TEST_CASE( test_DefaultMissingTruthIsHomRef )
{
    using namespace CONTINGENCY_STATE;

    GenotypeConcordanceScheme scheme;
    addGA4GHSchemeRows(scheme);

    for (unsigned callIndex(0); callIndex<CALL_STATE::SIZE; ++callIndex)
    {
        const CALL_STATE::index_t callState(static_cast<CALL_STATE::index_t>(callIndex));
        BOOST_REQUIRE(*scheme.getConcordanceStateArray(TRUTH_STATE::MISSING, callState) ==
                      *scheme.getConcordanceStateArray(TRUTH_STATE::HOM_REF, callState));
    }

    BOOST_REQUIRE(getStateSet(scheme, TRUTH_STATE::MISSING, CALL_STATE::HOM_VAR1) == ContingencyStateSet({FP}));
    BOOST_REQUIRE(getStateSet(scheme, TRUTH_STATE::MISSING, CALL_STATE::HET_REF_VAR1) == ContingencyStateSet({FP, TN}));
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, CALL_STATE::NO_CALL), "EMPTY");
}


BOOST_AUTO_TEST_CASE( test_MissingAsNoCallFullTable )
{
    GenotypeConcordanceScheme scheme;
    addGA4GHSchemeWithMissingAsNoCallRows(scheme);
    checkSchemeTable(scheme, false);
}


BOOST_AUTO_TEST_CASE( test_DefaultFullTable )
{
    GenotypeConcordanceScheme scheme;
    addGA4GHSchemeRows(scheme);
    checkSchemeTable(scheme, true);

    // MISSING truth is scored as HOM_REF
    static const unsigned homRefColumn(1);
    BOOST_REQUIRE_EQUAL(truthColumns[homRefColumn], TRUTH_STATE::HOM_REF);
    for (const ExpectedSchemeRow& row : missingAsNoCallTable)
    {
        BOOST_TEST_CONTEXT("call: " << CALL_STATE::get_label(row.callState))
        {
            BOOST_CHECK_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, row.callState), row.cells[homRefColumn]);
        }
    }

    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, CALL_STATE::MISSING), "TN");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, CALL_STATE::HET_REF_VAR1), "FP,TN");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, CALL_STATE::HET_REF_VAR2), "NA");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, CALL_STATE::HET_VAR3_VAR4), "FP");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, CALL_STATE::HOM_VAR1), "FP");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, CALL_STATE::HOM_VAR2), "NA");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, CALL_STATE::VC_FILTERED), "TN");
    BOOST_REQUIRE_EQUAL(scheme.getContingencyStateString(TRUTH_STATE::MISSING, CALL_STATE::IS_MIXED), "EMPTY");
}


BOOST_AUTO_TEST_SUITE_END()
