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

#include "dbglog/dbglog.hpp"

#include "../error.hpp"
#include "../srs.hpp"
#include "../gdalsupport/rasterops.hpp"

#include "./sources.hpp"

namespace fs = boost::filesystem;

namespace ancillary { namespace source {

namespace {

const int SiEpsg(3794);

/** ARSO lidar: 1 km DMR1 tiles as ';' separated XYZ grids, point clouds as
 *  LAZ. Tiles are organized into blocks (BLOK attribute).
 *
 *  With local repository configured, already converted GeoTIFFs named after
 *  the download (TM1_<NAME>.tif) are copied from there instead.
 */
class Slovenia : public Source {
public:
    Slovenia(const SourceConfig &config, const Services &services)
        : Source(Region::si, config, services, properties())
    {
        if (!config.localRepository.empty()) {
            repository_ = std::make_shared<LocalMirrorFetcher>
                (config.localRepository);
        }
    }

private:
    static Properties properties() {
        Properties p(DataType::dtm);
        p.support(DataType::laz);
        p.pointCloudSrs = epsg(SiEpsg);
        p.assignIntensitySrs = true;
        return p;
    }

    std::string idField_impl(DataType) const override {
        return "NAME";
    }

    void fetchTile_impl(const AcquisitionRequest &request
                        , const TileRecord &tile
                        , const fs::path &dir) const override;

    void finish_impl(const AcquisitionRequest &request
                     , const fs::path &dir
                     , StatusLines &status) const override;

    std::shared_ptr<LocalMirrorFetcher> repository_;
};

void Slovenia::fetchTile_impl(const AcquisitionRequest &request
                              , const TileRecord &tile
                              , const fs::path &dir) const
{
    const auto &name(tile.attribute("NAME"));
    const auto &block(tile.attribute("BLOK"));

    switch (request.type) {
    case DataType::dtm:
        if (repository_) {
            const auto file("TM1_" + name + ".tif");
            repository_->fetch(Request(file), dir / file);
            return;
        }
        download(Request(config().dtmUrl + block + "/D96TM/TM1_" + name
                         + ".asc"), dir);
        return;

    case DataType::laz:
        download(Request(config().lazUrl + block + "/D96TM/TM_" + name
                         + ".laz"), dir);
        return;
    }
}

void Slovenia::finish_impl(const AcquisitionRequest &request
                           , const fs::path &dir
                           , StatusLines &status) const
{
    if (request.type != DataType::dtm) { return; }

    if (repository_) {
        // repository rasters may come without CRS
        const auto assigned(assignSrs(dir, epsg(SiEpsg)));
        if (assigned) {
            LOG(info2) << "Assigned CRS to " << assigned
                       << " tiles copied from local repository.";
        }
        return;
    }

    convertGrids(dir, ".asc", GridConversion(epsg(SiEpsg)), status);
}

} // namespace

Source::pointer slovenia(const SourceConfig &config
                         , const Services &services)
{
    return std::make_shared<Slovenia>(config, services);
}

} } // namespace ancillary::source
