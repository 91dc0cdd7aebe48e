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

#include <fstream>
#include <string>

#include <boost/filesystem.hpp>

#include "jsoncpp/io.hpp"

#include "ancillary/srs.hpp"

#include "./support.hpp"

namespace fs = boost::filesystem;

namespace ancillary { namespace test {

TempDir::TempDir()
    : path_(fs::temp_directory_path()
            / fs::unique_path("ancillary-test-%%%%-%%%%-%%%%"))
{
    fs::create_directories(path_);
}

TempDir::~TempDir()
{
    boost::system::error_code ec;
    fs::remove_all(path_, ec);
}

void writeGeoJson(const fs::path &path, const std::vector<Feature> &features
                  , int epsg)
{
    Json::Value collection(Json::objectValue);
    collection["type"] = "FeatureCollection";

    if (epsg != 4326) {
        auto &crs(collection["crs"] = Json::objectValue);
        crs["type"] = "name";
        crs["properties"]["name"] = "urn:ogc:def:crs:EPSG::"
            + std::to_string(epsg);
    }

    auto &jfeatures(collection["features"] = Json::arrayValue);
    for (const auto &feature : features) {
        auto &jfeature(jfeatures.append(Json::objectValue));
        jfeature["type"] = "Feature";

        auto &properties(jfeature["properties"] = Json::objectValue);
        for (const auto &p : feature.properties) {
            properties[p.first] = p.second;
        }

        auto &geometry(jfeature["geometry"] = Json::objectValue);
        geometry["type"] = "Polygon";
        auto &ring(geometry["coordinates"].append(Json::arrayValue));

        const auto &e(feature.extents);
        const auto point([&ring](double x, double y) {
                auto &p(ring.append(Json::arrayValue));
                p.append(x);
                p.append(y);
            });
        point(e.ll(0), e.ll(1));
        point(e.ur(0), e.ll(1));
        point(e.ur(0), e.ur(1));
        point(e.ll(0), e.ur(1));
        point(e.ll(0), e.ll(1));
    }

    std::ofstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);
    f.open(path.string(), std::ios_base::out | std::ios_base::trunc);
    f.precision(15);
    Json::write(f, collection);
    f.close();
}

GeoTransform northUp(double left, double top, double pixel)
{
    return {{ left, pixel, 0.0, top, 0.0, -pixel }};
}

RasterTile memTile(const std::string &name, const cv::Mat &pixels
                   , const GeoTransform &transform
                   , const boost::optional<int> &code
                   , const boost::optional<double> &nodata)
{
    boost::optional<geo::SrsDefinition> srs;
    if (code) { srs = epsg(*code); }
    return writeRaster("MEM", name, pixels, transform, srs, nodata);
}

cv::Mat ramp(int rows, int cols, float base)
{
    cv::Mat out(rows, cols, CV_32FC1);
    for (int j(0); j < rows; ++j) {
        for (int i(0); i < cols; ++i) {
            out.at<float>(j, i) = base + float(j * cols + i);
        }
    }
    return out;
}

int differences(const cv::Mat &a, const cv::Mat &b)
{
    if ((a.size() != b.size()) || (a.type() != b.type())) {
        return a.total() * a.channels() + 1;
    }

    cv::Mat diff;
    cv::compare(a.reshape(1), b.reshape(1), diff, cv::CMP_NE);
    return cv::countNonZero(diff);
}

} } // namespace ancillary::test
