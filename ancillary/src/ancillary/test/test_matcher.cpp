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

#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "ancillary/error.hpp"
#include "ancillary/srs.hpp"
#include "ancillary/tilecatalog.hpp"

#include "./support.hpp"

using namespace ancillary;

namespace {

const int Utm33(32633);

TileRecord tile(const std::string &id, double x0, double y0, double x1
                , double y1)
{
    return TileRecord(id, Footprint::fromExtents
                      (math::Extents2(x0, y0, x1, y1), epsg(Utm33))
                      , { { "left", std::to_string(long(x0)) }
                        , { "bottom", std::to_string(long(y0)) } });
}

AreaOfInterest utm(double x0, double y0, double x1, double y1)
{
    return Footprint::fromExtents(math::Extents2(x0, y0, x1, y1)
                                  , epsg(Utm33));
}

typedef std::vector<std::string> Ids;

} // namespace

TEST(Matcher, KeepsCatalogOrder)
{
    TileCatalog catalog(epsg(Utm33));
    catalog.records = { tile("c", 2000, 0, 3000, 1000)
                        , tile("a", 0, 0, 1000, 1000)
                        , tile("far", 9000, 9000, 10000, 10000)
                        , tile("b", 1000, 0, 2000, 1000) };

    EXPECT_EQ((Ids{ "c", "a", "b" })
              , ids(match(utm(500, 200, 2500, 800), catalog)));
}

TEST(Matcher, DuplicatesPreserved)
{
    TileCatalog catalog(epsg(Utm33));
    catalog.records = { tile("a", 0, 0, 1000, 1000)
                        , tile("a", 0, 0, 1000, 1000) };

    EXPECT_EQ((Ids{ "a", "a" }), ids(match(utm(10, 10, 20, 20), catalog)));
}

TEST(Matcher, EmptyResult)
{
    TileCatalog catalog(epsg(Utm33));
    catalog.records = { tile("a", 0, 0, 1000, 1000) };

    EXPECT_TRUE(match(utm(5000, 5000, 6000, 6000), catalog).empty());
}

TEST(Matcher, WithinPredicate)
{
    TileCatalog catalog(epsg(Utm33));
    catalog.records = { tile("a", 0, 0, 1000, 1000)
                        , tile("b", 1000, 0, 2000, 1000) };

    const auto aoi(utm(900, 100, 1100, 200));
    EXPECT_EQ((Ids{ "a", "b" }), ids(match(aoi, catalog)));
    EXPECT_TRUE(match(aoi, catalog, MatchOptions(Predicate::within))
                .empty());
    EXPECT_EQ((Ids{ "b" })
              , ids(match(utm(1100, 100, 1200, 200), catalog
                          , MatchOptions(Predicate::within))));
}

TEST(Matcher, MatchesEnvelopeOfReprojectedAoi)
{
    TileCatalog catalog(epsg(Utm33));
    catalog.records = { tile("a", 500000, 5500000, 501000, 5501000) };

    // the same square as seen from WGS84
    const auto wgs(reproject(utm(500100, 5500100, 500200, 5500200)
                             , epsg(4326)));
    EXPECT_EQ((Ids{ "a" }), ids(match(wgs, catalog)));
}

TEST(Matcher, GridNeighbours)
{
    TileCatalog catalog(epsg(Utm33));
    catalog.records = { tile("t_5_7", 5000, 7000, 6000, 8000)
                        , tile("t_9_9", 9000, 9000, 10000, 10000) };

    GridNeighbours n;
    n.leftField = "left";
    n.bottomField = "bottom";
    n.cellSize = 1000.0;
    n.nameField = "name";
    n.namer = [](long x, long y) {
        return str(boost::format("t_%d_%d") % x % y);
    };

    MatchOptions options;
    options.neighbours = n;

    const auto tiles(match(utm(5100, 7100, 5200, 7200), catalog, options));
    EXPECT_EQ((Ids{ "t_5_7", "t_6_7", "t_5_8", "t_6_8" }), ids(tiles));

    ASSERT_EQ(4u, tiles.size());
    EXPECT_EQ("t_6_8", tiles[3].attribute("name"));
    EXPECT_EQ("6000", tiles[3].attribute("left"));
    EXPECT_EQ("8000", tiles[3].attribute("bottom"));

    const auto e(tiles[3].footprint.extents());
    EXPECT_DOUBLE_EQ(6000.0, e.ll(0));
    EXPECT_DOUBLE_EQ(9000.0, e.ur(1));
}

TEST(Matcher, MissingAttribute)
{
    const auto t(tile("a", 0, 0, 1000, 1000));
    EXPECT_THROW(t.attribute("nonexistent"), FormatError);
}

TEST(Catalog, LoadsVectorDataset)
{
    test::TempDir tmp;
    const auto path(tmp.path() / "fishnet.geojson");
    test::writeGeoJson
        (path, { test::Feature({ { "Kaartblad", "25gn1" } }
                               , math::Extents2(120000, 480000
                                                , 125000, 486250))
                , test::Feature({ { "Kaartblad", "25gn2" } }
                                , math::Extents2(125000, 480000
                                                 , 130000, 486250)) }
         , 28992);

    const auto catalog(loadCatalog(path, "Kaartblad"));
    ASSERT_EQ(2u, catalog.records.size());
    EXPECT_EQ("25gn1", catalog.records[0].id);
    EXPECT_EQ("25gn2", catalog.records[1].attribute("Kaartblad"));
    EXPECT_EQ(28992, *epsgCode(catalog.srs));

    EXPECT_THROW(loadCatalog(path, "bladnr"), FormatError);
}

TEST(Catalog, FallsBackToBundledCopy)
{
    test::TempDir tmp;
    const auto bundled(tmp.path() / "bundled.geojson");
    test::writeGeoJson
        (bundled, { test::Feature({ { "upc", "e14a47" } }
                                  , math::Extents2(-99.5, 19.0
                                                   , -99.0, 19.5)) });

    const auto mirror(tmp.path() / "mirror");
    boost::filesystem::create_directories(mirror);
    LocalMirrorFetcher fetcher(mirror);

    // remote not present in the mirror
    const CatalogLocation location("http://example.com/fishnet.geojson"
                                   , bundled);
    const auto catalog(loadCatalog(location, "upc", fetcher, tmp.path()));
    ASSERT_EQ(1u, catalog.records.size());
    EXPECT_EQ("e14a47", catalog.records[0].id);

    // neither remote nor bundled copy
    const CatalogLocation nowhere("http://example.com/fishnet.geojson"
                                  , "");
    EXPECT_THROW(loadCatalog(nowhere, "upc", fetcher, tmp.path())
                 , CatalogUnavailableError);
}

TEST(Catalog, PrefersRemoteCopy)
{
    test::TempDir tmp;
    const auto mirror(tmp.path() / "mirror");
    boost::filesystem::create_directories(mirror);
    test::writeGeoJson
        (mirror / "fishnet.geojson"
         , { test::Feature({ { "upc", "remote" } }
                           , math::Extents2(-99.5, 19.0, -99.0, 19.5)) });

    const auto bundled(tmp.path() / "bundled.geojson");
    test::writeGeoJson
        (bundled, { test::Feature({ { "upc", "bundled" } }
                                  , math::Extents2(-99.5, 19.0
                                                   , -99.0, 19.5)) });

    LocalMirrorFetcher fetcher(mirror);
    const CatalogLocation location("http://example.com/fishnet.geojson"
                                   , bundled);

    const auto workdir(tmp.path() / "work");
    boost::filesystem::create_directories(workdir);
    const auto catalog(loadCatalog(location, "upc", fetcher, workdir));
    ASSERT_EQ(1u, catalog.records.size());
    EXPECT_EQ("remote", catalog.records[0].id);
}
