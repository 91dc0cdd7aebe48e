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

#include <algorithm>
#include <fstream>

#include <unistd.h>

#include <boost/filesystem.hpp>

#include <cpl_conv.h>

#include "ancillary/error.hpp"
#include "ancillary/srs.hpp"
#include "ancillary/raster.hpp"
#include "ancillary/source.hpp"
#include "ancillary/pipeline.hpp"
#include "ancillary/support/workdir.hpp"

#include "./support.hpp"

namespace fs = boost::filesystem;

using namespace ancillary;
using test::Feature;

namespace {

/** Produces intensity rasters without CRS, like blast2dem does.
 */
class FakePointCloud : public PointCloudProcessor {
public:
    FakePointCloud() : indexed(0) {}

    void index(const fs::path&) override { ++indexed; }

    fs::path intensity(const fs::path &dir, const math::Extents2 &bounds)
        override
    {
        this->bounds = bounds;

        const fs::path out(dir.string() + "_toIntensity");
        fs::create_directories(out);
        writeRaster("GTiff", out / "c_25gn1_intensity.tif"
                    , cv::Mat(100, 200, CV_8UC1, cv::Scalar(7))
                    , test::northUp(120000, 480050, 0.5), boost::none
                    , boost::none);
        return out;
    }

    int indexed;
    math::Extents2 bounds;
};

/** Mirror fetcher that leaves a directory it cannot remove in the
 *  destination directory (unless running as root).
 */
class LockingFetcher : public LocalMirrorFetcher {
public:
    LockingFetcher(const fs::path &root) : LocalMirrorFetcher(root) {}

    ~LockingFetcher() { unlock(); }

    void fetch(const Request &request, const fs::path &dst) override {
        if (locked_.empty()) {
            locked_ = dst.parent_path() / "locked";
            fs::create_directories(locked_);
            std::ofstream((locked_ / "file").string()) << "x";
            fs::permissions(locked_, fs::owner_read | fs::owner_exe);
        }
        LocalMirrorFetcher::fetch(request, dst);
    }

    void unlock() {
        boost::system::error_code ec;
        if (!locked_.empty()) {
            fs::permissions(locked_, fs::owner_all, ec);
        }
    }

    const fs::path& locked() const { return locked_; }

private:
    fs::path locked_;
};

struct Fixture {
    test::TempDir tmp;
    fs::path catalogs;
    fs::path mirror;
    Config config;

    Fixture()
        : catalogs(tmp.path() / "catalogs"), mirror(tmp.path() / "mirror")
    {
        fs::create_directories(catalogs);
        fs::create_directories(mirror);

        config.workRoot = tmp.path() / "work";
        config.runId = "run1";
        config.catalogRoot = catalogs;
        config.regionCatalog = catalogs / "regions.geojson";
        config.intensity = false;

        test::writeGeoJson(config.regionCatalog
                           , { Feature({ { "abbrev", "NL" } }
                                       , math::Extents2(3.0, 50.5
                                                        , 7.5, 53.7)) });
    }

    fs::path workdir() const {
        return config.workRoot / WorkDir::dirname(config.runId);
    }
};

} // namespace

TEST(Pipeline, SrtmFallback)
{
    Fixture f;

    // 1 x 1 degree tile at 0.01 degree
    test::writeGeoJson(f.catalogs / "srtm.geojson"
                       , { Feature({ { "tile_name", "N52E013" } }
                                   , math::Extents2(13.0, 52.0
                                                    , 14.0, 53.0)) });
    f.config.srtm.catalog = CatalogLocation
        (std::string(), f.catalogs / "srtm.geojson");
    f.config.srtm.catalog.srs = epsg(4326);
    f.config.srtm.dtmUrl = "http://mirror/SRTM1%sV3.tif";

    const auto pixels(test::ramp(100, 100));
    writeRaster("GTiff", f.mirror / "SRTM1N52E013V3.tif", pixels
                , test::northUp(13.0, 53.0, 0.01), epsg(4326), boost::none);

    const Services services(std::make_shared<LocalMirrorFetcher>(f.mirror)
                            , nullptr);
    Pipeline pipeline(f.config, services);

    const auto aoi(Footprint::fromExtents
                   (math::Extents2(13.2, 52.4, 13.5, 52.6), epsg(4326)));
    const auto output(pipeline.run(aoi));

    EXPECT_EQ(Region::srtm, output.region);
    EXPECT_FALSE(bool(output.secondary));

    const auto &p(output.primary);
    EXPECT_EQ(30, p.width);
    EXPECT_EQ(20, p.height);
    EXPECT_NEAR(13.2, p.xMin, 1e-9);
    EXPECT_NEAR(52.6, p.yMax, 1e-9);
    ASSERT_TRUE(bool(p.crs.epsg));
    EXPECT_EQ(4326, *p.crs.epsg);

    // passthrough of the tile window
    EXPECT_EQ(0, test::differences(pixels(cv::Rect(20, 40, 30, 20))
                                   , p.array));

    const auto &status(output.status);
    EXPECT_NE(status.end(), std::find(status.begin(), status.end()
                                      , "Tile N52E013 acquired."));

    EXPECT_EQ(Stage::cleanup, pipeline.stage());
    EXPECT_FALSE(fs::exists(f.workdir()));
}

TEST(Pipeline, UnreadableDownloadIsSkipped)
{
    Fixture f;

    test::writeGeoJson(f.catalogs / "srtm.geojson"
                       , { Feature({ { "tile_name", "N52E013" } }
                                   , math::Extents2(13.0, 52.0
                                                    , 14.0, 53.0))
                         , Feature({ { "tile_name", "N52E014" } }
                                   , math::Extents2(14.0, 52.0
                                                    , 15.0, 53.0)) });
    f.config.srtm.catalog = CatalogLocation
        (std::string(), f.catalogs / "srtm.geojson");
    f.config.srtm.dtmUrl = "http://mirror/SRTM1%sV3.tif";

    writeRaster("GTiff", f.mirror / "SRTM1N52E013V3.tif", test::ramp(100, 100)
                , test::northUp(13.0, 53.0, 0.01), epsg(4326), boost::none);

    // login page served instead of the tile
    {
        std::ofstream page((f.mirror / "SRTM1N52E014V3.tif").string());
        page << "<html><body>Sign in</body></html>\n";
    }

    const Services services(std::make_shared<LocalMirrorFetcher>(f.mirror)
                            , nullptr);
    Pipeline pipeline(f.config, services);

    const auto output(pipeline.run
                      (Footprint::fromExtents
                       (math::Extents2(13.8, 52.4, 14.2, 52.6)
                        , epsg(4326))));

    EXPECT_EQ(Region::srtm, output.region);
    EXPECT_EQ(20, output.primary.width);
    EXPECT_EQ(20, output.primary.height);

    const auto &status(output.status);
    EXPECT_NE(status.end()
              , std::find(status.begin(), status.end()
                          , "File SRTM1N52E014V3.tif skipped: "
                          "not a readable raster."));
    EXPECT_FALSE(fs::exists(f.workdir()));
}

TEST(Pipeline, CleanupFailureIsOnlyLogged)
{
    if (::geteuid() == 0) {
        GTEST_SKIP() << "Permissions do not restrict root.";
    }

    Fixture f;

    test::writeGeoJson(f.catalogs / "srtm.geojson"
                       , { Feature({ { "tile_name", "N52E013" } }
                                   , math::Extents2(13.0, 52.0
                                                    , 14.0, 53.0)) });
    f.config.srtm.catalog = CatalogLocation
        (std::string(), f.catalogs / "srtm.geojson");
    f.config.srtm.dtmUrl = "http://mirror/SRTM1%sV3.tif";

    const auto aoi(Footprint::fromExtents
                   (math::Extents2(13.2, 52.4, 13.5, 52.6), epsg(4326)));

    {
        // tile missing in mirror: the original error reaches the caller
        auto fetcher(std::make_shared<LockingFetcher>(f.mirror));
        Pipeline pipeline(f.config, Services(fetcher, nullptr));

        EXPECT_THROW(pipeline.run(aoi), NoDataAvailableError);
        EXPECT_TRUE(fs::exists(f.workdir()));
        EXPECT_EQ(Stage::cleanup, pipeline.stage());

        fetcher->unlock();
        fs::remove_all(f.workdir());
    }

    writeRaster("GTiff", f.mirror / "SRTM1N52E013V3.tif"
                , test::ramp(100, 100), test::northUp(13.0, 53.0, 0.01)
                , epsg(4326), boost::none);

    {
        // successful run still delivers its output
        auto fetcher(std::make_shared<LockingFetcher>(f.mirror));
        Pipeline pipeline(f.config, Services(fetcher, nullptr));

        const auto output(pipeline.run(aoi));
        EXPECT_EQ(30, output.primary.width);
        EXPECT_EQ(20, output.primary.height);
        EXPECT_TRUE(fs::exists(fetcher->locked()));

        fetcher->unlock();
    }
}

TEST(Pipeline, NoTileIsFatalAndCleansUp)
{
    Fixture f;

    test::writeGeoJson(f.catalogs / "srtm.geojson"
                       , { Feature({ { "tile_name", "N52E013" } }
                                   , math::Extents2(13.0, 52.0
                                                    , 14.0, 53.0)) });
    f.config.srtm.catalog = CatalogLocation
        (std::string(), f.catalogs / "srtm.geojson");
    f.config.srtm.dtmUrl = "http://mirror/SRTM1%sV3.tif";

    const Services services(std::make_shared<LocalMirrorFetcher>(f.mirror)
                            , nullptr);
    Pipeline pipeline(f.config, services);

    // outside the only catalog tile
    EXPECT_THROW(pipeline.run(Footprint::fromExtents
                              (math::Extents2(20.0, 20.0, 20.1, 20.1)
                               , epsg(4326)))
                 , NoDataAvailableError);
    EXPECT_FALSE(fs::exists(f.workdir()));

    // tile matched but missing in mirror: skipped, nothing to merge
    EXPECT_THROW(pipeline.run(Footprint::fromExtents
                              (math::Extents2(13.2, 52.4, 13.5, 52.6)
                               , epsg(4326)))
                 , NoDataAvailableError);
    EXPECT_FALSE(fs::exists(f.workdir()));
}

TEST(Pipeline, NetherlandsWithIntensity)
{
    Fixture f;
    f.config.intensity = true;

    test::writeGeoJson
        (f.catalogs / "ahn3.geojson"
         , { Feature({ { "Kaartblad", "25gn1" }
                     , { "AHN3_05m_DTM", "https://ahn/M_25GN1.zip" }
                     , { "AHN3_LAZ", "https://ahn/C_25GN1.LAZ" } }
                     , math::Extents2(120000, 480000, 120100, 480050)) }
         , 28992);
    f.config.nl.catalog = CatalogLocation
        (std::string(), f.catalogs / "ahn3.geojson");

    // zipped DTM with a hole inside the AOI
    cv::Mat pixels(100, 200, CV_32FC1, cv::Scalar(5.0));
    pixels.at<float>(30, 40) = -9999.f;
    const auto tif(f.tmp.path() / "M_25GN1.tif");
    writeRaster("GTiff", tif, pixels, test::northUp(120000, 480050, 0.5)
                , epsg(28992), -9999.0);
    ASSERT_EQ(0, ::CPLCopyFile(("/vsizip/" + (f.mirror / "M_25GN1.zip")
                                .string() + "/M_25GN1.tif").c_str()
                               , tif.c_str()));

    {
        std::ofstream laz((f.mirror / "C_25GN1.LAZ").string());
        laz << "LASF";
    }

    auto pc(std::make_shared<FakePointCloud>());
    const Services services(std::make_shared<LocalMirrorFetcher>(f.mirror)
                            , pc);
    Pipeline pipeline(f.config, services);

    const auto output(pipeline.run
                      (Footprint::fromExtents
                       (math::Extents2(120010, 480010, 120060, 480040)
                        , epsg(28992))));

    EXPECT_EQ(Region::nl, output.region);

    const auto &dtm(output.primary);
    EXPECT_EQ(100, dtm.width);
    EXPECT_EQ(60, dtm.height);
    EXPECT_DOUBLE_EQ(120010.0, dtm.xMin);
    EXPECT_DOUBLE_EQ(480040.0, dtm.yMax);

    // hole interpolated
    EXPECT_NEAR(5.0, dtm.array.at<float>(10, 20), 1e-3);

    EXPECT_EQ(1, pc->indexed);
    EXPECT_DOUBLE_EQ(120010.0, pc->bounds.ll(0));
    EXPECT_DOUBLE_EQ(480040.0, pc->bounds.ur(1));

    ASSERT_TRUE(bool(output.secondary));
    const auto &intensity(*output.secondary);
    EXPECT_EQ(100, intensity.width);
    EXPECT_EQ(60, intensity.height);
    ASSERT_TRUE(bool(intensity.crs.epsg));
    EXPECT_EQ(28992, *intensity.crs.epsg);
    EXPECT_EQ(7, intensity.array.at<unsigned char>(0, 0));

    EXPECT_FALSE(fs::exists(f.workdir()));
}

TEST(Pipeline, SloveniaFromLocalRepository)
{
    Fixture f;

    test::writeGeoJson(f.config.regionCatalog
                       , { Feature({ { "abbrev", "SI" } }
                                   , math::Extents2(13.3, 45.4
                                                    , 16.7, 46.9)) });

    test::writeGeoJson
        (f.catalogs / "si.geojson"
         , { Feature({ { "NAME", "462_101" }, { "BLOK", "b_35" } }
                     , math::Extents2(462000, 101000, 463000, 102000)) }
         , 3794);
    f.config.si.catalog = CatalogLocation
        (std::string(), f.catalogs / "si.geojson");

    // repository keeps rasters under the download name, without CRS
    const auto repository(f.tmp.path() / "repository");
    fs::create_directories(repository);
    writeRaster("GTiff", repository / "TM1_462_101.tif"
                , cv::Mat(100, 100, CV_32FC1, cv::Scalar(300.0))
                , test::northUp(462000, 102000, 10), boost::none
                , boost::none);
    f.config.si.localRepository = repository;

    const Services services(std::make_shared<LocalMirrorFetcher>(f.mirror)
                            , nullptr);
    Pipeline pipeline(f.config, services);

    const auto output(pipeline.run
                      (Footprint::fromExtents
                       (math::Extents2(462100, 101100, 462600, 101600)
                        , epsg(3794))));

    EXPECT_EQ(Region::si, output.region);

    const auto &dtm(output.primary);
    EXPECT_EQ(50, dtm.width);
    EXPECT_EQ(50, dtm.height);
    ASSERT_TRUE(bool(dtm.crs.epsg));
    EXPECT_EQ(3794, *dtm.crs.epsg);
    EXPECT_FLOAT_EQ(300.f, dtm.array.at<float>(25, 25));

    const auto &status(output.status);
    EXPECT_NE(status.end(), std::find(status.begin(), status.end()
                                      , "Tile 462_101 acquired."));
}

TEST(Pipeline, IntensityFailureDegrades)
{
    Fixture f;
    f.config.intensity = true;

    test::writeGeoJson
        (f.catalogs / "ahn3.geojson"
         , { Feature({ { "Kaartblad", "25gn1" }
                     , { "AHN3_05m_DTM", "https://ahn/M_25GN1.zip" }
                     , { "AHN3_LAZ", "https://ahn/C_25GN1.LAZ" } }
                     , math::Extents2(120000, 480000, 120100, 480050)) }
         , 28992);
    f.config.nl.catalog = CatalogLocation
        (std::string(), f.catalogs / "ahn3.geojson");

    const auto tif(f.tmp.path() / "M_25GN1.tif");
    writeRaster("GTiff", tif, cv::Mat(100, 200, CV_32FC1, cv::Scalar(5.0))
                , test::northUp(120000, 480050, 0.5), epsg(28992)
                , -9999.0);
    ASSERT_EQ(0, ::CPLCopyFile(("/vsizip/" + (f.mirror / "M_25GN1.zip")
                                .string() + "/M_25GN1.tif").c_str()
                               , tif.c_str()));

    // no LAZ in the mirror
    auto pc(std::make_shared<FakePointCloud>());
    const Services services(std::make_shared<LocalMirrorFetcher>(f.mirror)
                            , pc);
    Pipeline pipeline(f.config, services);

    const auto output(pipeline.run
                      (Footprint::fromExtents
                       (math::Extents2(120010, 480010, 120060, 480040)
                        , epsg(28992))));

    EXPECT_FALSE(bool(output.secondary));
    EXPECT_EQ(0, pc->indexed);
    EXPECT_EQ(100, output.primary.width);

    const auto &status(output.status);
    EXPECT_TRUE(std::any_of(status.begin(), status.end()
                            , [](const std::string &line) {
                                return line.find("Intensity not available")
                                    == 0;
                            }));

    EXPECT_FALSE(fs::exists(f.workdir()));
}

TEST(Source, UnsupportedDataType)
{
    Config config;
    const Services services(std::make_shared<LocalMirrorFetcher>("/")
                            , nullptr);

    const auto mx(Source::create(Region::mx, config, services));
    EXPECT_FALSE(mx->supports(DataType::laz));
    EXPECT_THROW(mx->tiles(DataType::laz
                           , Footprint::fromExtents
                           (math::Extents2(0, 0, 1, 1), epsg(4326))
                           , "/tmp")
                 , UnsupportedDataTypeError);

    const auto nl(Source::create(Region::nl, config, services));
    EXPECT_TRUE(nl->supports(DataType::laz));
    EXPECT_TRUE(nl->properties().fillNodata);
    ASSERT_TRUE(bool(nl->properties().pointCloudSrs));
    EXPECT_EQ(28992, *epsgCode(*nl->properties().pointCloudSrs));
}

TEST(Source, RequiresFetcher)
{
    Config config;
    EXPECT_THROW(Source::create(Region::srtm, config, Services())
                 , InvalidConfiguration);
}
