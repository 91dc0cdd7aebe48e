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
#include <cstdint>
#include <algorithm>
#include <type_traits>
#include <vector>

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./srs.hpp"
#include "./mosaic.hpp"

namespace ancillary {

namespace {

/** Grid size tolerance: clip size that is an integer multiple of pixel size
 *  up to floating point noise yields no extra column/row.
 */
constexpr double GridEpsilon(1e-6);

bool sameResolution(double a, double b)
{
    return std::abs(a - b) <= 1e-9 * std::max(std::abs(a), 1.0);
}

template <typename T>
typename std::enable_if<std::is_floating_point<T>::value, bool>::type
isNodata(T value, const boost::optional<double> &nodata)
{
    if (!nodata) { return false; }
    if (std::isnan(*nodata)) { return std::isnan(value); }
    return value == static_cast<T>(*nodata);
}

template <typename T>
typename std::enable_if<!std::is_floating_point<T>::value, bool>::type
isNodata(T value, const boost::optional<double> &nodata)
{
    return nodata && (static_cast<double>(value) == *nodata);
}

/** Copies valid samples of src into not-yet-written samples of out at given
 *  position.
 */
template <typename T>
void paste(cv::Mat &out, cv::Mat &written, const cv::Mat &src
           , const cv::Point &at, const boost::optional<double> &nodata)
{
    const auto samples(src.cols * src.channels());
    const auto offset(at.x * out.channels());

    for (int j(0); j < src.rows; ++j) {
        const auto *s(src.ptr<T>(j));
        auto *d(out.ptr<T>(at.y + j) + offset);
        auto *w(written.ptr<std::uint8_t>(at.y + j) + offset);

        for (int i(0); i < samples; ++i, ++s, ++d, ++w) {
            if (*w || isNodata(*s, nodata)) { continue; }
            *d = *s;
            *w = 1;
        }
    }
}

void paste(cv::Mat &out, cv::Mat &written, const cv::Mat &src
           , const cv::Point &at, const boost::optional<double> &nodata)
{
    switch (out.depth()) {
    case CV_8U: return paste<std::uint8_t>(out, written, src, at, nodata);
    case CV_16U: return paste<std::uint16_t>(out, written, src, at, nodata);
    case CV_16S: return paste<std::int16_t>(out, written, src, at, nodata);
    case CV_32S: return paste<std::int32_t>(out, written, src, at, nodata);
    case CV_32F: return paste<float>(out, written, src, at, nodata);
    case CV_64F: return paste<double>(out, written, src, at, nodata);
    default: break;
    }

    LOGTHROW(err2, FormatError)
        << "Unsupported pixel depth <" << out.depth() << ">.";
}

/** Checks that all tiles share the same CRS or that none has any.
 */
boost::optional<geo::SrsDefinition>
commonSrs(const RasterTile::list &tiles)
{
    const auto &first(tiles.front());
    for (const auto &tile : tiles) {
        if (bool(tile.srs()) != bool(first.srs())) {
            LOGTHROW(err2, CrsResolutionError)
                << "Cannot merge tiles with and without CRS (<"
                << first.name() << "> vs <" << tile.name() << ">).";
        }

        if (tile.srs() && !sameSrs(*tile.srs(), *first.srs())) {
            LOGTHROW(err2, CrsResolutionError)
                << "Cannot merge tiles in different CRS (<"
                << first.name() << "> vs <" << tile.name() << ">).";
        }
    }
    return first.srs();
}

math::Extents2 intersection(const math::Extents2 &a, const math::Extents2 &b)
{
    return math::Extents2(std::max(a.ll(0), b.ll(0))
                          , std::max(a.ll(1), b.ll(1))
                          , std::min(a.ur(0), b.ur(0))
                          , std::min(a.ur(1), b.ur(1)));
}

int gridSize(double length, double pixel)
{
    return int(std::ceil(length / std::abs(pixel) - GridEpsilon));
}

} // namespace

math::Extents2 RasterMosaic::extents() const
{
    return ancillary::extents(transform, size());
}

RasterMosaic mergeAndClip(const RasterTile::list &tiles
                          , const AreaOfInterest &aoi)
{
    if (tiles.empty()) {
        LOGTHROW(err2, NoDataAvailableError) << "No tiles to merge.";
    }

    const auto srs(commonSrs(tiles));

    const auto &first(tiles.front());
    if (first.rotated()) {
        LOGTHROW(err2, FormatError)
            << "Cannot merge rotated raster <" << first.name() << ">.";
    }

    const auto px(first.transform()[1]);
    const auto py(first.transform()[5]);

    // filter out tiles that would need resampling
    std::vector<const RasterTile*> accepted;
    math::Extents2 coverage(math::InvalidExtents{});
    for (const auto &tile : tiles) {
        if (tile.rotated()
            || !sameResolution(tile.transform()[1], px)
            || !sameResolution(tile.transform()[5], py)
            || (tile.bands() != first.bands()))
        {
            LOG(warn2)
                << "Skipping tile <" << tile.name() << ">: its grid or "
                "band count does not match <" << first.name() << ">.";
            continue;
        }

        accepted.push_back(&tile);
        const auto e(tile.extents());
        math::update(coverage, e.ll);
        math::update(coverage, e.ur);
    }

    auto clip(coverage);
    if (srs) {
        clip = intersection
            (reproject(aoi, *srs).extents(), coverage);
        if ((clip.ll(0) >= clip.ur(0)) || (clip.ll(1) >= clip.ur(1))) {
            LOGTHROW(err2, NoDataAvailableError)
                << "Area of interest does not overlap any of "
                << tiles.size() << " tiles.";
        }
    } else {
        LOG(warn2) << "Tiles have no CRS, merging without clipping.";
    }

    const auto cs(math::size(clip));
    const math::Size2 size(gridSize(cs.width, px), gridSize(cs.height, py));
    if (!size.width || !size.height) {
        LOGTHROW(err2, NoDataAvailableError)
            << std::fixed << "Clipped area " << clip
            << " is smaller than a pixel.";
    }

    RasterMosaic mosaic;
    mosaic.srs = srs;
    mosaic.nodata = first.nodata();
    mosaic.transform = {{ clip.ll(0), px, 0.0
                          , ((py < 0) ? clip.ur(1) : clip.ll(1)), 0.0, py }};

    mosaic.array.create(size.height, size.width, first.type());
    mosaic.array = cv::Scalar::all(mosaic.nodata ? *mosaic.nodata : 0.0);
    cv::Mat written(size.height, size.width
                    , CV_MAKETYPE(CV_8U, first.bands()), cv::Scalar::all(0));

    const auto &mt(mosaic.transform);
    for (const auto *tile : accepted) {
        const auto &tt(tile->transform());
        const auto col(int(std::floor((tt[0] - mt[0]) / px + 0.5)));
        const auto row(int(std::floor((tt[3] - mt[3]) / py + 0.5)));

        // destination window clamped to mosaic
        const cv::Rect dst(cv::Rect(col, row, tile->size().width
                                    , tile->size().height)
                           & cv::Rect(0, 0, size.width, size.height));
        if (dst.area() <= 0) { continue; }

        auto data(tile->read(cv::Rect(dst.x - col, dst.y - row
                                      , dst.width, dst.height)));
        if (data.depth() != mosaic.array.depth()) {
            cv::Mat converted;
            data.convertTo(converted, mosaic.array.depth());
            data = converted;
        }

        paste(mosaic.array, written, data, dst.tl(), tile->nodata());
    }

    LOG(info2) << std::fixed << "Merged " << accepted.size() << "/"
               << tiles.size() << " tiles into " << size.width << "x"
               << size.height << " raster at " << mosaic.extents() << ".";

    return mosaic;
}

RasterMosaic mergeAndClip(const Paths &paths, const AreaOfInterest &aoi)
{
    RasterTile::list tiles;
    for (const auto &path : paths) {
        try {
            tiles.push_back(RasterTile::open(path));
        } catch (const Error &e) {
            LOG(warn2) << "Skipping unreadable tile " << path << ": <"
                       << e.what() << ">.";
        }
    }
    return mergeAndClip(tiles, aoi);
}

} // namespace ancillary
