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

#ifndef ancillary_mosaic_hpp_included_
#define ancillary_mosaic_hpp_included_

#include <boost/optional.hpp>

#include <opencv2/core/core.hpp>

#include "geo/srsdef.hpp"

#include "./types.hpp"
#include "./footprint.hpp"
#include "./raster.hpp"

namespace ancillary {

/** Merged raster. Pixel size equals pixel size of source tiles.
 */
struct RasterMosaic {
    cv::Mat array;
    GeoTransform transform;
    boost::optional<geo::SrsDefinition> srs;
    boost::optional<double> nodata;

    math::Size2 size() const { return math::Size2(array.cols, array.rows); }
    math::Extents2 extents() const;
};

/** Merges tiles into one raster clipped to the bounding rectangle of the
 *  AOI (reprojected into the tiles' CRS). Tiles without CRS are stitched
 *  without clipping.
 *
 *  First valid sample wins, nodata never overwrites valid data. Tiles with
 *  pixel size, rotation or band count different from the first tile are
 *  skipped.
 *
 *  Throws NoDataAvailableError when there is nothing to merge and
 *  CrsResolutionError when tiles disagree on CRS.
 */
RasterMosaic mergeAndClip(const RasterTile::list &tiles
                          , const AreaOfInterest &aoi);

/** Opens given raster files and merges them. Files that cannot be opened
 *  are skipped.
 */
RasterMosaic mergeAndClip(const Paths &tiles, const AreaOfInterest &aoi);

} // namespace ancillary

#endif // ancillary_mosaic_hpp_included_
