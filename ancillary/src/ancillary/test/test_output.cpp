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

#include <sstream>

#include <boost/filesystem.hpp>

#include "ancillary/srs.hpp"
#include "ancillary/output.hpp"

#include "./support.hpp"

namespace fs = boost::filesystem;

using namespace ancillary;

namespace {

RasterMosaic mosaic(const boost::optional<int> &code
                    , const boost::optional<double> &nodata)
{
    RasterMosaic m;
    m.array = test::ramp(3, 4);
    m.transform = test::northUp(1000.0, 2000.0, 0.5);
    if (code) { m.srs = epsg(*code); }
    m.nodata = nodata;
    return m;
}

} // namespace

TEST(Output, ProductFromMosaic)
{
    const auto p(product(mosaic(28992, -9999.0)));

    EXPECT_DOUBLE_EQ(1000.0, p.xMin);
    EXPECT_DOUBLE_EQ(2000.0, p.yMax);
    EXPECT_DOUBLE_EQ(0.5, p.xSize);
    EXPECT_DOUBLE_EQ(-0.5, p.ySize);
    EXPECT_EQ(4, p.width);
    EXPECT_EQ(3, p.height);

    ASSERT_TRUE(bool(p.crs.epsg));
    EXPECT_EQ(28992, *p.crs.epsg);
    EXPECT_NE(std::string::npos, p.crs.proj4.find("+proj=sterea"));
    EXPECT_FALSE(p.crsWkt.empty());

    ASSERT_TRUE(bool(p.nodata));
    EXPECT_EQ(-9999.0, *p.nodata);
}

TEST(Output, ProductWithoutCrs)
{
    const auto p(product(mosaic(boost::none, boost::none)));
    EXPECT_FALSE(bool(p.crs.epsg));
    EXPECT_TRUE(p.crs.proj4.empty());
    EXPECT_TRUE(p.crsWkt.empty());
    EXPECT_FALSE(bool(p.nodata));
}

TEST(Output, MetadataJson)
{
    AcquisitionResult result(Region::nl, mosaic(28992, -9999.0)
                             , { "Tile 25gn1 acquired." });
    const auto output(assemble(result));

    const auto json(asJson(output));
    EXPECT_EQ("NL", json["region"].asString());
    ASSERT_EQ(1u, json["status"].size());
    EXPECT_EQ("Tile 25gn1 acquired.", json["status"][0].asString());

    const auto &primary(json["primary"]);
    EXPECT_DOUBLE_EQ(1000.0, primary["xMin"].asDouble());
    EXPECT_DOUBLE_EQ(-0.5, primary["ySize"].asDouble());
    EXPECT_EQ(4, primary["width"].asInt());
    EXPECT_EQ(1, primary["bands"].asInt());
    EXPECT_EQ(28992, primary["crs"]["epsg"].asInt());
    EXPECT_EQ(-9999.0, primary["nodata"].asDouble());

    EXPECT_TRUE(json["secondary"].isNull());

    std::ostringstream os;
    saveMetadata(os, output);
    EXPECT_NE(std::string::npos, os.str().find("\"crsWkt\""));
}

TEST(Output, SavesFiles)
{
    test::TempDir tmp;

    AcquisitionResult result(Region::nl, mosaic(28992, -9999.0));
    result.secondary = mosaic(28992, boost::none);
    const auto output(assemble(result));

    const auto dir(tmp.path() / "out");
    save(dir, output);

    EXPECT_TRUE(fs::exists(dir / "metadata.json"));
    EXPECT_TRUE(fs::exists(dir / "intensity.tif"));

    const auto dtm(RasterTile::open(dir / "dtm.tif"));
    EXPECT_EQ(0, test::differences(output.primary.array, dtm.read()));
    EXPECT_DOUBLE_EQ(1000.0, dtm.transform()[0]);
    ASSERT_TRUE(bool(dtm.nodata()));
    EXPECT_EQ(28992, *epsgCode(*dtm.srs()));
}

TEST(Output, NoIntensityFile)
{
    test::TempDir tmp;

    const auto output(assemble(AcquisitionResult
                               (Region::srtm, mosaic(4326, boost::none))));
    save(tmp.path(), output);

    EXPECT_TRUE(fs::exists(tmp.path() / "dtm.tif"));
    EXPECT_FALSE(fs::exists(tmp.path() / "intensity.tif"));
}
