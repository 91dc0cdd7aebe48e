/**
 * Copyright (c) 2024 The ancillary authors
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef ancillary_regioncatalog_hpp_included_
#define ancillary_regioncatalog_hpp_included_

#include <vector>

#include <boost/filesystem/path.hpp>

#include "geo/srsdef.hpp"

#include "./types.hpp"
#include "./footprint.hpp"

namespace ancillary {

struct RegionCoverage {
    typedef std::vector<RegionCoverage> list;

    Region region;
    Footprint coverage;

    RegionCoverage(Region region, const Footprint &coverage)
        : region(region), coverage(coverage) {}
};

/** Ordered region coverage polygons, all in one CRS.
 */
struct RegionCatalog {
    geo::SrsDefinition srs;
    RegionCoverage::list regions;

    RegionCatalog(const geo::SrsDefinition &srs) : srs(srs) {}
};

/** Loads region catalog; region tag is read from tagField. Rows with
 *  unknown tags are skipped with a warning.
 */
RegionCatalog loadRegionCatalog(const boost::filesystem::path &path
                                , const std::string &tagField = "abbrev");

/** Selects source backing given AOI: first region (in catalog order) whose
 *  coverage contains the whole AOI, fallback region otherwise.
 */
Region selectSource(const AreaOfInterest &aoi, const RegionCatalog &catalog
                    , Region fallback = FallbackRegion);

} // namespace ancillary

#endif // ancillary_regioncatalog_hpp_included_
