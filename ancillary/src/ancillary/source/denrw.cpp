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

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"
#include "../srs.hpp"
#include "../gdalsupport/archive.hpp"
#include "../gdalsupport/rasterops.hpp"

#include "./sources.hpp"

namespace fs = boost::filesystem;

namespace ancillary { namespace source {

namespace {

const int NrwEpsg(25832);

/** XYZ grids carry UTM zone number in front of easting.
 */
const double NrwZoneOffset(-32000000.0);

/** North Rhine-Westphalia open geodata: gzipped 1 km XYZ grids (DGM1) and
 *  1 km LAZ tiles. Tiles are found in bundled fishnet.
 *
 *  Point-cloud tiles right, above and above-right of each matched tile are
 *  fetched as well since intensity rasters need the overlap.
 */
class NorthRhineWestphalia : public Source {
public:
    NorthRhineWestphalia(const SourceConfig &config
                         , const Services &services)
        : Source(Region::deNrw, config, services, properties())
    {}

private:
    static Properties properties() {
        Properties p(DataType::dtm);
        p.support(DataType::laz);
        p.pointCloudSrs = epsg(NrwEpsg);
        return p;
    }

    std::string idField_impl(DataType type) const override {
        return (type == DataType::laz) ? "laz_name" : "file_name";
    }

    MatchOptions matchOptions_impl(DataType type) const override;

    void fetchTile_impl(const AcquisitionRequest &request
                        , const TileRecord &tile
                        , const fs::path &dir) const override;

    void finish_impl(const AcquisitionRequest &request
                     , const fs::path &dir
                     , StatusLines &status) const override;
};

MatchOptions NorthRhineWestphalia::matchOptions_impl(DataType type) const
{
    MatchOptions options(Predicate::intersects);
    if (type != DataType::laz) { return options; }

    GridNeighbours n;
    n.leftField = "left";
    n.bottomField = "bottom";
    n.cellSize = 1000.0;
    n.nameField = "laz_name";
    n.namer = [](long x, long y) -> std::string {
        return str(boost::format("3dm_32_%d_%d_1_nw.laz") % x % y);
    };
    options.neighbours = n;

    return options;
}

void NorthRhineWestphalia::fetchTile_impl(const AcquisitionRequest &request
                                          , const TileRecord &tile
                                          , const fs::path &dir) const
{
    switch (request.type) {
    case DataType::dtm: {
        const auto gz(download(Request(config().dtmUrl
                                       + tile.attribute("file_name"))
                               , dir));
        // foo.xyz.gz -> foo.xyz
        gunzip(gz, dir / gz.stem());
        discard(gz);
        return;
    }

    case DataType::laz:
        download(Request(config().lazUrl + tile.attribute("laz_name"))
                 , dir);
        return;
    }
}

void NorthRhineWestphalia::finish_impl(const AcquisitionRequest &request
                                       , const fs::path &dir
                                       , StatusLines &status) const
{
    if (request.type != DataType::dtm) { return; }

    convertGrids(dir, ".xyz"
                 , GridConversion(epsg(NrwEpsg), GridAnchor::lowerLeft
                                  , NrwZoneOffset)
                 , status);
}

} // namespace

Source::pointer northRhineWestphalia(const SourceConfig &config
                                     , const Services &services)
{
    return std::make_shared<NorthRhineWestphalia>(config, services);
}

} } // namespace ancillary::source
