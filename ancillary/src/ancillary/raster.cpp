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

#include <initializer_list>
#include <memory>

#include <cpl_string.h>

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./srs.hpp"
#include "./raster.hpp"

namespace fs = boost::filesystem;

namespace ancillary {

namespace {

struct StringList {
    StringList(const std::vector<std::string> &values) : list() {
        for (const auto &value : values) {
            list = ::CSLAddString(list, value.c_str());
        }
    }
    ~StringList() { ::CSLDestroy(list); }

    StringList(const StringList&) = delete;
    StringList& operator=(const StringList&) = delete;

    char **list;
};

} // namespace

int cvDepth(::GDALDataType type)
{
    switch (type) {
    case GDT_Byte: return CV_8U;
    case GDT_UInt16: return CV_16U;
    case GDT_Int16: return CV_16S;
    case GDT_Int32: return CV_32S;
    case GDT_Float32: return CV_32F;
    case GDT_Float64: return CV_64F;
    default: break;
    }

    LOGTHROW(err2, FormatError)
        << "Unsupported raster data type <" << ::GDALGetDataTypeName(type)
        << ">.";
    throw;
}

::GDALDataType gdalType(int cvDepth)
{
    switch (cvDepth) {
    case CV_8U: return GDT_Byte;
    case CV_16U: return GDT_UInt16;
    case CV_16S: return GDT_Int16;
    case CV_32S: return GDT_Int32;
    case CV_32F: return GDT_Float32;
    case CV_64F: return GDT_Float64;
    default: break;
    }

    LOGTHROW(err2, FormatError)
        << "Unsupported pixel depth <" << cvDepth << ">.";
    throw;
}

math::Extents2 extents(const GeoTransform &t, const math::Size2 &size)
{
    math::Extents2 e(math::InvalidExtents{});
    for (const auto &corner : { math::Point2(0, 0)
                , math::Point2(size.width, 0)
                , math::Point2(0, size.height)
                , math::Point2(size.width, size.height) })
    {
        math::update(e, math::Point2
                     (t[0] + corner(0) * t[1] + corner(1) * t[2]
                      , t[3] + corner(0) * t[4] + corner(1) * t[5]));
    }
    return e;
}

RasterTile::RasterTile(::GDALDataset *ds, const std::string &name)
    : ds_(ds), name_(name)
    , size_(ds->GetRasterXSize(), ds->GetRasterYSize())
    , bands_(ds->GetRasterCount())
    , transform_{{ 0.0, 1.0, 0.0, 0.0, 0.0, 1.0 }}
{
    if (bands_ < 1) {
        LOGTHROW(err2, FormatError)
            << "Raster <" << name_ << "> has no band.";
    }

    if (ds_->GetGeoTransform(transform_.data()) != CE_None) {
        // GDAL's default, pixel space
        transform_ = {{ 0.0, 1.0, 0.0, 0.0, 0.0, 1.0 }};
    }

    const char *projection(ds_->GetProjectionRef());
    if (projection && *projection) {
        srs_ = geo::SrsDefinition(projection, geo::SrsDefinition::Type::wkt);
    }

    auto *band(ds_->GetRasterBand(1));
    depth_ = cvDepth(band->GetRasterDataType());
    for (int i(2); i <= bands_; ++i) {
        if (ds_->GetRasterBand(i)->GetRasterDataType()
            != band->GetRasterDataType())
        {
            LOGTHROW(err2, FormatError)
                << "Raster <" << name_ << "> mixes band data types.";
        }
    }

    int hasNodata(false);
    const auto nodata(band->GetNoDataValue(&hasNodata));
    if (hasNodata) { nodata_ = nodata; }
}

RasterTile RasterTile::open(const fs::path &path)
{
    auto ds(static_cast< ::GDALDataset*>
            (::GDALOpenEx(path.c_str(), (GDAL_OF_RASTER | GDAL_OF_READONLY)
                          , nullptr, nullptr, nullptr)));
    if (!ds) {
        LOGTHROW(err2, IOError)
            << "Failed to open raster " << path << ".";
    }

    return RasterTile(ds, path.string());
}

int RasterTile::type() const
{
    return CV_MAKETYPE(depth_, bands_);
}

math::Extents2 RasterTile::extents() const
{
    return ancillary::extents(transform_, size_);
}

bool RasterTile::rotated() const
{
    return transform_[2] || transform_[4];
}

cv::Mat RasterTile::read(const cv::Rect &window) const
{
    cv::Mat out(window.height, window.width, type());
    if (out.empty()) { return out; }

    const auto err
        (ds_->RasterIO(GF_Read, window.x, window.y
                       , window.width, window.height
                       , out.data, window.width, window.height
                       , gdalType(depth_), bands_, nullptr
                       , out.elemSize(), out.step[0], out.elemSize1()
                       , nullptr));

    if (err != CE_None) {
        LOGTHROW(err2, IOError)
            << "Failed to read window [" << window.x << ", " << window.y
            << ", " << window.width << ", " << window.height
            << "] from raster <" << name_ << ">.";
    }

    return out;
}

cv::Mat RasterTile::read() const
{
    return read(cv::Rect(0, 0, size_.width, size_.height));
}

RasterTile writeRaster(const std::string &driverName
                       , const fs::path &path
                       , const cv::Mat &pixels
                       , const GeoTransform &transform
                       , const boost::optional<geo::SrsDefinition> &srs
                       , const boost::optional<double> &nodata
                       , const std::vector<std::string> &options)
{
    auto *driver(::GetGDALDriverManager()->GetDriverByName
                 (driverName.c_str()));
    if (!driver) {
        LOGTHROW(err2, IOError)
            << "Unknown GDAL driver <" << driverName << ">.";
    }

    StringList co(options);
    auto *ds(driver->Create(path.c_str(), pixels.cols, pixels.rows
                            , pixels.channels(), gdalType(pixels.depth())
                            , co.list));
    if (!ds) {
        LOGTHROW(err2, IOError)
            << "Failed to create raster " << path << " (driver <"
            << driverName << ">).";
    }

    std::unique_ptr< ::GDALDataset, void(*)(::GDALDataset*)>
        guard(ds, [](::GDALDataset *ds) { ::GDALClose(ds); });

    auto t(transform);
    ds->SetGeoTransform(t.data());
    if (srs) {
        ds->SetProjection(asWkt(*srs).c_str());
    }

    if (nodata) {
        for (int i(1); i <= pixels.channels(); ++i) {
            ds->GetRasterBand(i)->SetNoDataValue(*nodata);
        }
    }

    if (!pixels.empty()) {
        const auto err
            (ds->RasterIO(GF_Write, 0, 0, pixels.cols, pixels.rows
                          , const_cast<uchar*>(pixels.data)
                          , pixels.cols, pixels.rows
                          , gdalType(pixels.depth()), pixels.channels()
                          , nullptr, pixels.elemSize(), pixels.step[0]
                          , pixels.elemSize1(), nullptr));
        if (err != CE_None) {
            LOGTHROW(err2, IOError)
                << "Failed to write pixels to raster " << path << ".";
        }
    }

    ds->FlushCache();

    return RasterTile(guard.release(), path.string());
}

} // namespace ancillary
