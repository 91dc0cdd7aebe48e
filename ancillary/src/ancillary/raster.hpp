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

#ifndef ancillary_raster_hpp_included_
#define ancillary_raster_hpp_included_

#include <array>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include <opencv2/core/core.hpp>

#include <gdal_priv.h>

#include "math/geometry_core.hpp"

#include "geo/srsdef.hpp"

namespace ancillary {

/** GDAL affine geotransform: x = t[0] + col * t[1] + row * t[2],
 *  y = t[3] + col * t[4] + row * t[5].
 */
typedef std::array<double, 6> GeoTransform;

/** Extents covered by size x transform.
 */
math::Extents2 extents(const GeoTransform &transform
                       , const math::Size2 &size);

/** Single raster dataset opened for reading. Owns the dataset.
 */
class RasterTile {
public:
    typedef std::vector<RasterTile> list;

    /** Opens raster file. Throws IOError.
     */
    static RasterTile open(const boost::filesystem::path &path);

    /** Takes ownership of opened dataset.
     */
    RasterTile(::GDALDataset *ds, const std::string &name);

    RasterTile(RasterTile&&) = default;
    RasterTile& operator=(RasterTile&&) = default;

    const std::string& name() const { return name_; }
    const math::Size2& size() const { return size_; }
    int bands() const { return bands_; }
    const GeoTransform& transform() const { return transform_; }
    const boost::optional<geo::SrsDefinition>& srs() const { return srs_; }
    const boost::optional<double>& nodata() const { return nodata_; }

    /** OpenCV depth of samples (CV_8U, CV_32F, ...).
     */
    int depth() const { return depth_; }

    /** OpenCV type of pixels (depth + bands as channels).
     */
    int type() const;

    math::Extents2 extents() const;

    /** Any rotation/shear term set.
     */
    bool rotated() const;

    /** Reads pixels in window, bands are interleaved as channels.
     */
    cv::Mat read(const cv::Rect &window) const;

    cv::Mat read() const;

    ::GDALDataset& dataset() const { return *ds_; }

private:
    struct Closer {
        void operator()(::GDALDataset *ds) const { ::GDALClose(ds); }
    };

    std::unique_ptr< ::GDALDataset, Closer> ds_;
    std::string name_;
    math::Size2 size_;
    int bands_;
    GeoTransform transform_;
    boost::optional<geo::SrsDefinition> srs_;
    boost::optional<double> nodata_;
    int depth_;
};

/** Creates dataset of given driver (GTiff, MEM, ...) from pixel array and
 *  returns it opened.
 */
RasterTile writeRaster(const std::string &driver
                       , const boost::filesystem::path &path
                       , const cv::Mat &pixels
                       , const GeoTransform &transform
                       , const boost::optional<geo::SrsDefinition> &srs
                       , const boost::optional<double> &nodata
                       , const std::vector<std::string> &options
                       = std::vector<std::string>());

/** Maps GDAL data type to OpenCV depth. Throws FormatError for types with
 *  no counterpart.
 */
int cvDepth(::GDALDataType type);

::GDALDataType gdalType(int cvDepth);

} // namespace ancillary

#endif // ancillary_raster_hpp_included_
