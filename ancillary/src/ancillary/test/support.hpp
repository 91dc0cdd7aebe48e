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

#ifndef ancillary_test_support_hpp_included_
#define ancillary_test_support_hpp_included_

#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include <opencv2/core/core.hpp>

#include "math/geometry_core.hpp"

#include "ancillary/raster.hpp"

namespace ancillary { namespace test {

/** Scratch directory removed at scope exit.
 */
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const boost::filesystem::path& path() const { return path_; }

private:
    boost::filesystem::path path_;
};

/** Rectangular feature of a synthetic vector catalog.
 */
struct Feature {
    std::map<std::string, std::string> properties;
    math::Extents2 extents;

    Feature(const std::map<std::string, std::string> &properties
            , const math::Extents2 &extents)
        : properties(properties), extents(extents) {}
};

/** Writes features as GeoJSON feature collection. Non-WGS84 CRS is
 *  advertised by the legacy "crs" member.
 */
void writeGeoJson(const boost::filesystem::path &path
                  , const std::vector<Feature> &features
                  , int epsg = 4326);

/** North-up geotransform with square pixels.
 */
GeoTransform northUp(double left, double top, double pixel);

/** In-memory raster tile.
 */
RasterTile memTile(const std::string &name, const cv::Mat &pixels
                   , const GeoTransform &transform
                   , const boost::optional<int> &epsg
                   , const boost::optional<double> &nodata = boost::none);

/** Single band float raster filled with value of (row * width + col).
 */
cv::Mat ramp(int rows, int cols, float base = 0.f);

/** Number of samples that differ.
 */
int differences(const cv::Mat &a, const cv::Mat &b);

} } // namespace ancillary::test

#endif // ancillary_test_support_hpp_included_
