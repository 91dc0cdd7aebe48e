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

#include "ancillary/error.hpp"
#include "ancillary/srs.hpp"
#include "ancillary/footprint.hpp"

using namespace ancillary;

TEST(Srs, ParsesEpsgCode)
{
    const auto srs(parseSrs("EPSG:28992"));
    EXPECT_EQ(geo::SrsDefinition::Type::epsg, srs.type);
    EXPECT_EQ("28992", srs.srs);

    ASSERT_TRUE(bool(epsgCode(srs)));
    EXPECT_EQ(28992, *epsgCode(srs));
}

TEST(Srs, ParsesProj4AndWkt)
{
    const auto proj(parseSrs("+proj=utm +zone=33 +datum=WGS84 +units=m"
                             " +no_defs"));
    EXPECT_EQ(geo::SrsDefinition::Type::proj4, proj.type);

    const auto wkt(parseSrs(asWkt(epsg(4326))));
    EXPECT_EQ(geo::SrsDefinition::Type::wkt, wkt.type);
    EXPECT_TRUE(sameSrs(wkt, epsg(4326)));
}

TEST(Srs, RejectsGarbage)
{
    EXPECT_THROW(parseSrs("EPSG:abc"), CrsResolutionError);
    EXPECT_THROW(parseSrs("this is no CRS"), CrsResolutionError);
}

TEST(Srs, ExportsProj4)
{
    const auto proj4(asProj4(epsg(32633)));
    EXPECT_NE(std::string::npos, proj4.find("+proj=utm"));
    EXPECT_NE(std::string::npos, proj4.find("+zone=33"));
}

TEST(Footprint, ReprojectToSameCrsKeepsGeometry)
{
    const auto fp(Footprint::fromExtents(math::Extents2(1, 2, 3, 4)
                                         , epsg(32633)));
    const auto same(reproject(fp, parseSrs(asWkt(epsg(32633)))));

    // identical shape object, no transformation applied
    EXPECT_EQ(fp.shapePtr().get(), same.shapePtr().get());
}

TEST(Footprint, ReprojectKeepsGisAxisOrder)
{
    // Amersfoort, origin of the Dutch grid
    const auto fp(Footprint::fromExtents
                  (math::Extents2(154000, 462000, 156000, 464000)
                   , epsg(28992)));
    const auto wgs(reproject(fp, epsg(4326)).extents());

    // x is longitude
    EXPECT_GT(wgs.ll(0), 5.0);
    EXPECT_LT(wgs.ur(0), 6.0);
    EXPECT_GT(wgs.ll(1), 52.0);
    EXPECT_LT(wgs.ur(1), 53.0);
}

TEST(Footprint, PredicatesRequireSameCrs)
{
    const auto a(Footprint::fromExtents(math::Extents2(0, 0, 10, 10)
                                        , epsg(32633)));
    const auto b(Footprint::fromExtents(math::Extents2(5, 5, 15, 15)
                                        , epsg(32634)));
    EXPECT_THROW(a.intersects(b), CrsResolutionError);
    EXPECT_THROW(a.within(b), CrsResolutionError);

    const auto c(Footprint::fromExtents(math::Extents2(2, 2, 4, 4)
                                        , epsg(32633)));
    EXPECT_TRUE(c.within(a));
    EXPECT_FALSE(a.within(c));
    EXPECT_TRUE(a.intersects(c));
}

TEST(Footprint, FromWkt)
{
    const auto fp(Footprint::fromWkt("POLYGON ((0 0,0 5,10 5,10 0,0 0))"
                                     , epsg(32633)));
    const auto e(fp.extents());
    EXPECT_DOUBLE_EQ(0.0, e.ll(0));
    EXPECT_DOUBLE_EQ(10.0, e.ur(0));
    EXPECT_DOUBLE_EQ(5.0, e.ur(1));

    EXPECT_THROW(Footprint::fromWkt("POINT (1 2)", epsg(32633))
                 , FormatError);
    EXPECT_THROW(Footprint::fromWkt("POLYGON ((", epsg(32633))
                 , FormatError);
    EXPECT_THROW(Footprint::fromExtents(math::Extents2(1, 1, 1, 5)
                                        , epsg(32633))
                 , FormatError);
}
