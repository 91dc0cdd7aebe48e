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

#ifndef ancillary_output_hpp_included_
#define ancillary_output_hpp_included_

#include <iosfwd>
#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include <opencv2/core/core.hpp>

#include "jsoncpp/json.hpp"

#include "./types.hpp"
#include "./mosaic.hpp"

namespace ancillary {

/** Mosaics produced by one pipeline run.
 */
struct AcquisitionResult {
    Region region;
    StatusLines status;
    RasterMosaic primary;
    boost::optional<RasterMosaic> secondary;

    AcquisitionResult(Region region, const RasterMosaic &primary
                      , const StatusLines &status = StatusLines())
        : region(region), status(status), primary(primary)
    {}
};

/** CRS as structured parameters.
 */
struct CrsParameters {
    boost::optional<int> epsg;
    std::string proj4;
};

/** Mosaic flattened into array and its affine-derived fields.
 */
struct RasterProduct {
    cv::Mat array;

    /** Origin (top-left corner).
     */
    double xMin;
    double yMax;

    /** Pixel size; ySize is negative for north-up rasters.
     */
    double xSize;
    double ySize;

    int width;
    int height;

    /** Empty when mosaic carries no CRS.
     */
    CrsParameters crs;
    std::string crsWkt;

    boost::optional<double> nodata;

    RasterProduct()
        : xMin(), yMax(), xSize(), ySize(), width(), height() {}
};

struct Output {
    Region region;
    StatusLines status;
    RasterProduct primary;

    /** Absent when intensity could not be derived.
     */
    boost::optional<RasterProduct> secondary;

    Output(Region region) : region(region) {}
};

RasterProduct product(const RasterMosaic &mosaic);

Output assemble(const AcquisitionResult &result);

/** Writes product as GeoTIFF. Throws IOError.
 */
void writeGeoTiff(const RasterProduct &product
                  , const boost::filesystem::path &path);

/** Metadata of output, arrays excluded.
 */
Json::Value asJson(const Output &output);

void saveMetadata(std::ostream &out, const Output &output);

/** Saves metadata to file. Throws IOError.
 */
void saveMetadata(const boost::filesystem::path &path, const Output &output);

/** Writes dtm.tif, intensity.tif (when available) and metadata.json into
 *  given directory.
 */
void save(const boost::filesystem::path &dir, const Output &output);

} // namespace ancillary

#endif // ancillary_output_hpp_included_
