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

#include <gtest/gtest.h>

#include "ancillary/srs.hpp"
#include "ancillary/regioncatalog.hpp"

#include "./support.hpp"

using namespace ancillary;
using test::Feature;

namespace {

Feature region(const std::string &tag, double x0, double y0, double x1
               , double y1)
{
    return Feature({ { "abbrev", tag } }, math::Extents2(x0, y0, x1, y1));
}

RegionCatalog catalog(const test::TempDir &tmp
                      , const std::vector<Feature> &features)
{
    const auto path(tmp.path() / "regions.geojson");
    test::writeGeoJson(path, features);
    return loadRegionCatalog(path);
}

AreaOfInterest wgs84(double x0, double y0, double x1, double y1)
{
    return Footprint::fromExtents(math::Extents2(x0, y0, x1, y1), epsg(4326));
}

} // namespace

TEST(Selector, OutsideCoverageFallsBack)
{
    test::TempDir tmp;
    const auto c(catalog(tmp, { region("NL", 3.0, 50.5, 7.5, 53.7)
                              , region("DK", 8.0, 54.5, 13.0, 58.0) }));

    EXPECT_EQ(Region::srtm, selectSource(wgs84(20.0, 20.0, 20.1, 20.1), c));
}

TEST(Selector, InsideSingleRegion)
{
    test::TempDir tmp;
    const auto c(catalog(tmp, { region("NL", 3.0, 50.5, 7.5, 53.7)
                              , region("DK", 8.0, 54.5, 13.0, 58.0) }));

    EXPECT_EQ(Region::dk, selectSource(wgs84(10.0, 56.0, 10.1, 56.1), c));
    EXPECT_EQ(Region::nl, selectSource(wgs84(5.0, 52.0, 5.1, 52.1), c));
}

TEST(Selector, OverlappingRegionsFirstWins)
{
    test::TempDir tmp;
    const auto c(catalog(tmp, { region("DE_NRW", 0.0, 40.0, 10.0, 60.0)
                              , region("NL", 3.0, 50.5, 7.5, 53.7) }));

    EXPECT_EQ(Region::deNrw, selectSource(wgs84(5.0, 52.0, 5.1, 52.1), c));
}

TEST(Selector, PartialOverlapIsNotCoverage)
{
    test::TempDir tmp;
    const auto c(catalog(tmp, { region("NL", 3.0, 50.5, 7.5, 53.7) }));

    // crosses the eastern edge
    EXPECT_EQ(Region::srtm, selectSource(wgs84(7.4, 52.0, 7.6, 52.1), c));
}

TEST(Selector, UnknownTagsSkipped)
{
    test::TempDir tmp;
    const auto c(catalog(tmp, { region("XX", 0.0, 40.0, 10.0, 60.0)
                              , region("si", 13.3, 45.4, 16.6, 46.9)
                              , region("NL", 3.0, 50.5, 7.5, 53.7) }));

    ASSERT_EQ(2u, c.regions.size());
    EXPECT_EQ(Region::si, c.regions[0].region);
    EXPECT_EQ(Region::nl, selectSource(wgs84(5.0, 52.0, 5.1, 52.1), c));
}

TEST(Selector, AoiInProjectedCrs)
{
    test::TempDir tmp;
    const auto c(catalog(tmp, { region("NL", 3.0, 50.5, 7.5, 53.7) }));

    const auto aoi(Footprint::fromExtents
                   (math::Extents2(154000, 462000, 156000, 464000)
                    , epsg(28992)));
    EXPECT_EQ(Region::nl, selectSource(aoi, c));
}
