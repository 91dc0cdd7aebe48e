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

#ifndef ancillary_gdalsupport_rasterops_hpp_included_
#define ancillary_gdalsupport_rasterops_hpp_included_

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "utility/enum-io.hpp"

#include "geo/srsdef.hpp"

#include "../types.hpp"

namespace ancillary {

/** What a grid point denotes.
 */
UTILITY_GENERATE_ENUM(GridAnchor,
    ((lowerLeft))   // lower-left corner of the cell
    ((center))      // cell center
)

struct GridConversion {
    geo::SrsDefinition srs;
    GridAnchor anchor;

    /** Added to x coordinates (e.g. to strip UTM zone prefix).
     */
    double xOffset;

    /** Value of cells without grid point.
     */
    double nodata;

    GridConversion(const geo::SrsDefinition &srs
                   , GridAnchor anchor = GridAnchor::lowerLeft
                   , double xOffset = 0.0)
        : srs(srs), anchor(anchor), xOffset(xOffset), nodata(-9999.0) {}
};

/** Converts ASCII XYZ grid (whitespace, ',' or ';' separated) into
 *  single-band Float32 north-up GeoTIFF. Point order is irrelevant.
 *
 *  Throws FormatError on unparseable or irregular input.
 */
void convertGrid(const boost::filesystem::path &xyz
                 , const boost::filesystem::path &tif
                 , const GridConversion &conversion);

/** Converts all files with given extension in a directory, output is
 *  placed beside input with .tif extension. Failed conversions are logged
 *  and recorded in status.
 */
Paths convertGrids(const boost::filesystem::path &dir
                   , const std::string &extension
                   , const GridConversion &conversion
                   , StatusLines &status);

/** Interpolates nodata holes of every raster in directory (search distance
 *  500 pixels, one smoothing pass); samples still missing are set to 0.
 *  Results are written to <dir>_fill which is returned.
 */
boost::filesystem::path fillNodata(const boost::filesystem::path &dir);

/** Assigns CRS to every raster in directory that has none.
 *
 *  Returns number of updated rasters.
 */
int assignSrs(const boost::filesystem::path &dir
              , const geo::SrsDefinition &srs);

} // namespace ancillary

#endif // ancillary_gdalsupport_rasterops_hpp_included_
