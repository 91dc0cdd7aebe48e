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

#include <cmath>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <opencv2/core/core.hpp>

#include <gdal_alg.h>
#include <gdal_priv.h>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"
#include "../srs.hpp"
#include "../raster.hpp"
#include "../support/glob.hpp"
#include "./rasterops.hpp"

namespace fs = boost::filesystem;
namespace ba = boost::algorithm;

namespace ancillary {

namespace {

/** Upper bound of converted grid size (samples).
 */
const double MaxGridSamples(2e8);

struct GridPoint {
    double x;
    double y;
    double z;
};

std::vector<GridPoint> loadGrid(const fs::path &path)
{
    std::ifstream f(path.string());
    if (!f) {
        LOGTHROW(err2, IOError) << "Unable to open grid " << path << ".";
    }

    std::vector<GridPoint> points;
    std::string line;
    for (int lineNo(1); std::getline(f, line); ++lineNo) {
        std::replace_if(line.begin(), line.end(), [](char c) {
                return (c == ',') || (c == ';') || (c == '\t'); }
            , ' ');
        ba::trim(line);
        if (line.empty()) { continue; }

        std::istringstream is(line);
        GridPoint p;
        if (!(is >> p.x >> p.y >> p.z)) {
            // header allowed only before data
            if (points.empty()) { continue; }
            LOGTHROW(err2, FormatError)
                << "Invalid grid point at " << path << ":" << lineNo << ".";
        }
        points.push_back(p);
    }

    if (points.empty()) {
        LOGTHROW(err2, FormatError) << "Grid " << path << " is empty.";
    }

    return points;
}

/** Smallest positive step between distinct coordinates.
 */
double resolution(std::vector<double> values, const fs::path &path
                  , const char *axis)
{
    std::sort(values.begin(), values.end());

    double step(0.0);
    for (std::size_t i(1); i < values.size(); ++i) {
        const auto d(values[i] - values[i - 1]);
        if ((d > 1e-9) && (!step || (d < step))) { step = d; }
    }

    if (!step) {
        LOGTHROW(err2, FormatError)
            << "Cannot determine " << axis << " resolution of grid "
            << path << ".";
    }
    return step;
}

} // namespace

void convertGrid(const fs::path &xyz, const fs::path &tif
                 , const GridConversion &conversion)
{
    LOG(info1) << "Converting grid " << xyz << " to " << tif << ".";

    const auto points(loadGrid(xyz));

    std::vector<double> xs, ys;
    xs.reserve(points.size());
    ys.reserve(points.size());
    for (const auto &p : points) {
        xs.push_back(p.x);
        ys.push_back(p.y);
    }

    const auto px(resolution(xs, xyz, "x"));
    const auto py(resolution(ys, xyz, "y"));

    const auto xMinMax(std::minmax_element(xs.begin(), xs.end()));
    const auto yMinMax(std::minmax_element(ys.begin(), ys.end()));
    const auto minX(*xMinMax.first);
    const auto maxX(*xMinMax.second);
    const auto minY(*yMinMax.first);
    const auto maxY(*yMinMax.second);

    const auto columns(std::round((maxX - minX) / px) + 1);
    const auto rows(std::round((maxY - minY) / py) + 1);
    if (columns * rows > MaxGridSamples) {
        LOGTHROW(err2, FormatError)
            << "Grid " << xyz << " would be " << columns << "x" << rows
            << " samples; points are not on a regular grid.";
    }

    const int width(columns);
    const int height(rows);

    cv::Mat grid(height, width, CV_32FC1
                 , cv::Scalar::all(conversion.nodata));
    for (const auto &p : points) {
        const int col(std::lround((p.x - minX) / px));
        const int row(std::lround((maxY - p.y) / py));
        grid.at<float>(row, col) = float(p.z);
    }

    GeoTransform transform{{}};
    switch (conversion.anchor) {
    case GridAnchor::lowerLeft:
        transform = {{ minX + conversion.xOffset, px, 0.0
                       , maxY + py, 0.0, -py }};
        break;

    case GridAnchor::center:
        transform = {{ minX + conversion.xOffset - px / 2.0, px, 0.0
                       , maxY + py / 2.0, 0.0, -py }};
        break;
    }

    writeRaster("GTiff", tif, grid, transform, conversion.srs
                , conversion.nodata, { "COMPRESS=LZW" });
}

Paths convertGrids(const fs::path &dir, const std::string &extension
                   , const GridConversion &conversion
                   , StatusLines &status)
{
    Paths out;
    for (const auto &input : globFiles(dir, extension)) {
        auto tif(input);
        tif.replace_extension(".tif");
        try {
            convertGrid(input, tif, conversion);
            out.push_back(tif);
        } catch (const CrsResolutionError&) {
            throw;
        } catch (const Error &e) {
            LOG(warn2) << "Grid " << input << " not converted: <"
                       << e.what() << ">.";
            status.push_back("Grid " + input.filename().string()
                             + " not converted: " + e.what());

            // do not leave partial output behind
            boost::system::error_code ec;
            fs::remove(tif, ec);
        }
    }

    LOG(info3) << "Converted " << out.size() << " grids to GeoTIFF.";
    return out;
}

fs::path fillNodata(const fs::path &dir)
{
    const fs::path out(dir.string() + "_fill");
    boost::system::error_code ec;
    fs::create_directories(out, ec);
    if (ec) {
        LOGTHROW(err2, IOError)
            << "Unable to create directory " << out << ": <"
            << ec.message() << ">.";
    }

    auto *driver(::GetGDALDriverManager()->GetDriverByName("GTiff"));
    if (!driver) {
        LOGTHROW(err2, IOError) << "GTiff driver not available.";
    }

    for (const auto &path : globFiles(dir, ".tif")) {
        LOG(info2) << "Filling nodata in " << path << ".";

        const auto src(RasterTile::open(path));
        const auto dstPath(out / path.filename());

        auto *ds(driver->CreateCopy(dstPath.c_str(), &src.dataset(), false
                                    , nullptr, nullptr, nullptr));
        if (!ds) {
            LOGTHROW(err2, IOError)
                << "Unable to create " << dstPath << ".";
        }
        RasterTile dst(ds, dstPath.string());

        for (int i(1); i <= dst.bands(); ++i) {
            auto *band(ds->GetRasterBand(i));
            if (::GDALFillNodata(band, nullptr, 500.0, 0, 1
                                 , nullptr, nullptr, nullptr) != CE_None)
            {
                LOGTHROW(err2, IOError)
                    << "Nodata interpolation failed in " << dstPath << ".";
            }

            if (!dst.nodata()) { continue; }

            // zero whatever interpolation could not reach
            const auto &size(dst.size());
            cv::Mat pixels(size.height, size.width, CV_64FC1);
            auto err(band->RasterIO(GF_Read, 0, 0, size.width, size.height
                                    , pixels.data, size.width, size.height
                                    , GDT_Float64, 0, 0, nullptr));
            if (err == CE_None) {
                const auto nodata(*dst.nodata());
                pixels.forEach<double>([&](double &v, const int*) {
                        if ((v == nodata)
                            || (std::isnan(nodata) && std::isnan(v)))
                        {
                            v = 0.0;
                        }
                    });
                err = band->RasterIO(GF_Write, 0, 0, size.width, size.height
                                     , pixels.data, size.width, size.height
                                     , GDT_Float64, 0, 0, nullptr);
            }
            if (err != CE_None) {
                LOGTHROW(err2, IOError)
                    << "Unable to zero remaining nodata in " << dstPath
                    << ".";
            }
        }
    }

    return out;
}

int assignSrs(const fs::path &dir, const geo::SrsDefinition &srs)
{
    const auto wkt(asWkt(srs));

    int assigned(0);
    for (const auto &path : globFiles(dir, ".tif")) {
        auto ds(static_cast< ::GDALDataset*>
                (::GDALOpenEx(path.c_str(), (GDAL_OF_RASTER | GDAL_OF_UPDATE)
                              , nullptr, nullptr, nullptr)));
        if (!ds) {
            LOGTHROW(err2, IOError)
                << "Unable to open " << path << " for update.";
        }
        RasterTile tile(ds, path.string());

        if (tile.srs()) { continue; }

        if (ds->SetProjection(wkt.c_str()) != CE_None) {
            LOGTHROW(err2, IOError)
                << "Unable to assign CRS to " << path << ".";
        }
        ++assigned;
        LOG(info1) << "Assigned CRS <" << srs.srs << "> to " << path << ".";
    }

    return assigned;
}

} // namespace ancillary
