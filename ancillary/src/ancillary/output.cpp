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

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "jsoncpp/io.hpp"

#include "./error.hpp"
#include "./srs.hpp"
#include "./raster.hpp"
#include "./output.hpp"

namespace fs = boost::filesystem;

namespace ancillary {

namespace {

Json::Value asJson(const RasterProduct &product)
{
    Json::Value value(Json::objectValue);
    value["xMin"] = product.xMin;
    value["yMax"] = product.yMax;
    value["xSize"] = product.xSize;
    value["ySize"] = product.ySize;
    value["width"] = product.width;
    value["height"] = product.height;
    value["bands"] = product.array.channels();

    auto &crs(value["crs"] = Json::objectValue);
    if (product.crs.epsg) {
        crs["epsg"] = *product.crs.epsg;
    } else {
        crs["epsg"] = Json::nullValue;
    }
    crs["proj4"] = product.crs.proj4;
    value["crsWkt"] = product.crsWkt;

    if (product.nodata) {
        value["nodata"] = *product.nodata;
    } else {
        value["nodata"] = Json::nullValue;
    }

    return value;
}

} // namespace

RasterProduct product(const RasterMosaic &mosaic)
{
    const auto &t(mosaic.transform);

    RasterProduct p;
    p.array = mosaic.array;
    p.xMin = t[0];
    p.xSize = t[1];
    p.yMax = t[3];
    p.ySize = t[5];
    p.width = mosaic.array.cols;
    p.height = mosaic.array.rows;
    p.nodata = mosaic.nodata;

    if (mosaic.srs) {
        p.crs.epsg = epsgCode(*mosaic.srs);
        p.crs.proj4 = asProj4(*mosaic.srs);
        p.crsWkt = asWkt(*mosaic.srs);
    }

    return p;
}

Output assemble(const AcquisitionResult &result)
{
    Output output(result.region);
    output.status = result.status;
    output.primary = product(result.primary);
    if (result.secondary) {
        output.secondary = product(*result.secondary);
    }
    return output;
}

void writeGeoTiff(const RasterProduct &product, const fs::path &path)
{
    LOG(info3) << "Writing " << product.width << "x" << product.height
               << " raster to " << path << ".";

    const GeoTransform transform{{ product.xMin, product.xSize, 0.0
                                   , product.yMax, 0.0, product.ySize }};

    boost::optional<geo::SrsDefinition> srs;
    if (!product.crsWkt.empty()) { srs = parseSrs(product.crsWkt); }

    writeRaster("GTiff", path, product.array, transform, srs
                , product.nodata, { "COMPRESS=LZW", "TILED=YES" });
}

Json::Value asJson(const Output &output)
{
    Json::Value value(Json::objectValue);
    value["region"] = boost::lexical_cast<std::string>(output.region);

    auto &status(value["status"] = Json::arrayValue);
    for (const auto &line : output.status) { status.append(line); }

    value["primary"] = asJson(output.primary);
    if (output.secondary) {
        value["secondary"] = asJson(*output.secondary);
    } else {
        value["secondary"] = Json::nullValue;
    }

    return value;
}

void saveMetadata(std::ostream &out, const Output &output)
{
    out.precision(15);
    Json::write(out, asJson(output));
}

void saveMetadata(const fs::path &path, const Output &output)
{
    std::ofstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);

    try {
        f.open(path.string(), std::ios_base::out | std::ios_base::trunc);
        saveMetadata(f, output);
        f.close();
    } catch (const std::exception &e) {
        LOGTHROW(err1, IOError)
            << "Unable to save metadata " << path
            << ": <" << e.what() << ">.";
    }
}

void save(const fs::path &dir, const Output &output)
{
    boost::system::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        LOGTHROW(err2, IOError)
            << "Unable to create directory " << dir << ": <"
            << ec.message() << ">.";
    }

    writeGeoTiff(output.primary, dir / "dtm.tif");
    if (output.secondary) {
        writeGeoTiff(*output.secondary, dir / "intensity.tif");
    }
    saveMetadata(dir / "metadata.json", output);
}

} // namespace ancillary
