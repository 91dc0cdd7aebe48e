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

#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./srs.hpp"
#include "./gdalsupport/ogrsupport.hpp"
#include "./regioncatalog.hpp"

namespace fs = boost::filesystem;

namespace ancillary {

RegionCatalog loadRegionCatalog(const fs::path &path
                                , const std::string &tagField)
{
    LOG(info2) << "Loading region catalog from " << path << ".";

    auto ds(ogr::openVectorDataset(path));
    auto layer(ogr::layer(ds));

    const auto *ref(layer->GetSpatialRef());
    if (!ref) {
        LOGTHROW(err2, CrsResolutionError)
            << "Region catalog " << path << " has no CRS.";
    }

    RegionCatalog catalog(fromReference(*ref));

    const auto field(layer->GetLayerDefn()->GetFieldIndex(tagField.c_str()));
    if (field < 0) {
        LOGTHROW(err2, FormatError)
            << "Region catalog " << path << " has no field <" << tagField
            << ">.";
    }

    layer->ResetReading();
    while (auto f = ogr::feature(layer->GetNextFeature())) {
        const std::string tag(f->GetFieldAsString(field));

        Region region;
        try {
            region = boost::lexical_cast<Region>(tag);
        } catch (const boost::bad_lexical_cast&) {
            LOG(warn2) << "Skipping region <" << tag << "> in " << path
                       << ": unknown region.";
            continue;
        }

        auto *g(f->GetGeometryRef());
        if (!g) {
            LOG(warn2) << "Skipping region <" << tag << "> in " << path
                       << ": no geometry.";
            continue;
        }

        catalog.regions.emplace_back
            (region, Footprint(ogr::geometry(g, true), catalog.srs));
    }

    return catalog;
}

Region selectSource(const AreaOfInterest &aoi, const RegionCatalog &catalog
                    , Region fallback)
{
    const auto area(reproject(aoi, catalog.srs));

    for (const auto &item : catalog.regions) {
        if (area.within(item.coverage)) {
            LOG(info3) << "AOI covered by region <" << item.region << ">.";
            return item.region;
        }
    }

    LOG(info3) << "AOI not covered by any region, using <" << fallback
               << ">.";
    return fallback;
}

} // namespace ancillary
