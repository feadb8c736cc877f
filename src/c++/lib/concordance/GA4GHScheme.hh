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
/// \brief Genotype concordance scheme tables derived from the GA4GH Benchmarking
/// Work Group's proposed evaluation scheme
///
/// In general two sets of alleles are compared, so a single comparison can
/// produce zero or more contingency table values. For example, if the truth set
/// is a heterozygous call with both alleles non-reference (HET_VAR1_VAR2) and the
/// call set is a heterozygous call with both alleles non-reference with one of
/// the alternate alleles matching an alternate allele in the truth set, there is
/// a true positive from the matching alternate allele, a false positive from the
/// call set alternate allele not found in the truth set, and a false negative from
/// the truth set alternate allele not found in the call set.
///
/// A true negative is included wherever the reference allele is found in both
/// the truth set and the call set.
///
/// There is no HET_VAR2_VAR3 call state because VAR2/VAR3 are only symbolic, the
/// case is represented by HET_VAR3_VAR4.
///
/// NA marks tuples which the upstream genotype categorization can not produce.
///

#pragma once

#include "GenotypeConcordanceScheme.hh"


/// populate every row of the default GA4GH scheme
///
/// A MISSING truth genotype is compared as if it were HOM_REF.
void
addGA4GHSchemeRows(GenotypeConcordanceScheme& scheme);


/// populate every row of the GA4GH scheme variant where a MISSING truth
/// genotype carries no information unless the call is also MISSING
void
addGA4GHSchemeWithMissingAsNoCallRows(GenotypeConcordanceScheme& scheme);
