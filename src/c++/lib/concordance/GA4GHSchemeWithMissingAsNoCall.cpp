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

#include "GA4GHScheme.hh"



void
addGA4GHSchemeWithMissingAsNoCallRows(GenotypeConcordanceScheme& scheme)
{
    using namespace CONTINGENCY_ARRAY;

    /**               ROW STATE                   MISSING   HOM_REF   HET_REF_VAR1  HET_VAR1_VAR2  HOM_VAR1  NO_CALL  LOW_GQ  LOW_DP  VC_FILTERED  GT_FILTERED  IS_MIXED **/
    scheme.addRow(CALL_STATE::MISSING,       {TN_ONLY,  TN_ONLY,  TN_FN,        FN_ONLY,       FN_ONLY,  EMPTY,   EMPTY,  EMPTY,  EMPTY,       EMPTY,       EMPTY});
    scheme.addRow(CALL_STATE::HOM_REF,       {EMPTY,    TN_ONLY,  TN_FN,        FN_ONLY,       FN_ONLY,  EMPTY,   EMPTY,  EMPTY,  EMPTY,       EMPTY,       EMPTY});
    scheme.addRow(CALL_STATE::HET_REF_VAR1,  {EMPTY,    FP_TN,    TP_TN,        TP_FN,         TP_FN,    EMPTY,   EMPTY,  EMPTY,  EMPTY,       EMPTY,       EMPTY});
    scheme.addRow(CALL_STATE::HET_REF_VAR2,  {NA,       NA,       FP_TN_FN,     NA,            FP_FN,    NA,      NA,     NA,     NA,          NA,          NA});
    scheme.addRow(CALL_STATE::HET_REF_VAR3,  {NA,       NA,       NA,           FP_FN,         NA,       NA,      NA,     NA,     NA,          NA,          NA});
    scheme.addRow(CALL_STATE::HET_VAR1_VAR2, {EMPTY,    FP_ONLY,  TP_FP,        TP_ONLY,       TP_FP_FN, EMPTY,   EMPTY,  EMPTY,  EMPTY,       EMPTY,       EMPTY});
    scheme.addRow(CALL_STATE::HET_VAR1_VAR3, {NA,       NA,       NA,           TP_FP_FN,      NA,       NA,      NA,     NA,     NA,          NA,          NA});
    scheme.addRow(CALL_STATE::HET_VAR3_VAR4, {NA,       FP_ONLY,  FP_FN,        FP_FN,         FP_FN,    NA,      NA,     NA,     NA,          NA,          NA});
    scheme.addRow(CALL_STATE::HOM_VAR1,      {EMPTY,    FP_ONLY,  TP_FP,        TP_FN,         TP_ONLY,  EMPTY,   EMPTY,  EMPTY,  EMPTY,       EMPTY,       EMPTY});
    scheme.addRow(CALL_STATE::HOM_VAR2,      {NA,       NA,       FP_FN,        TP_FN,         FP_FN,    NA,      NA,     NA,     NA,          NA,          NA});
    scheme.addRow(CALL_STATE::HOM_VAR3,      {NA,       NA,       NA,           FP_FN,         NA,       NA,      NA,     NA,     NA,          NA,          NA});
    scheme.addRow(CALL_STATE::NO_CALL,       {EMPTY,    EMPTY,    EMPTY,        EMPTY,         EMPTY,    EMPTY,   EMPTY,  EMPTY,  EMPTY,       EMPTY,       EMPTY});
    scheme.addRow(CALL_STATE::VC_FILTERED,   {EMPTY,    TN_ONLY,  TN_FN,        FN_ONLY,       FN_ONLY,  EMPTY,   EMPTY,  EMPTY,  EMPTY,       EMPTY,       EMPTY});
    scheme.addRow(CALL_STATE::GT_FILTERED,   {EMPTY,    TN_ONLY,  TN_FN,        FN_ONLY,       FN_ONLY,  EMPTY,   EMPTY,  EMPTY,  EMPTY,       EMPTY,       EMPTY});
    scheme.addRow(CALL_STATE::LOW_GQ,        {EMPTY,    TN_ONLY,  TN_FN,        FN_ONLY,       FN_ONLY,  EMPTY,   EMPTY,  EMPTY,  EMPTY,       EMPTY,       EMPTY});
    scheme.addRow(CALL_STATE::LOW_DP,        {EMPTY,    TN_ONLY,  TN_FN,        FN_ONLY,       FN_ONLY,  EMPTY,   EMPTY,  EMPTY,  EMPTY,       EMPTY,       EMPTY});
    scheme.addRow(CALL_STATE::IS_MIXED,      {EMPTY,    EMPTY,    EMPTY,        EMPTY,         EMPTY,    EMPTY,   EMPTY,  EMPTY,  EMPTY,       EMPTY,       EMPTY});
}
