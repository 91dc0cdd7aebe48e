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

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./pipeline.hpp"
#include "./mosaic.hpp"
#include "./regioncatalog.hpp"
#include "./support/glob.hpp"
#include "./support/workdir.hpp"
#include "./gdalsupport/rasterops.hpp"

namespace fs = boost::filesystem;

namespace ancillary {

namespace {

void append(StatusLines &status, const StatusLines &lines)
{
    status.insert(status.end(), lines.begin(), lines.end());
}

} // namespace

Pipeline::Pipeline(const Config &config, const Services &services)
    : config_(config), services_(services), stage_(Stage::idle)
{}

Services Pipeline::services(const Config &config)
{
    Services services;
    if (config.mirror) {
        services.fetcher = std::make_shared<LocalMirrorFetcher>
            (*config.mirror);
    } else {
        services.fetcher = std::make_shared<HttpFetcher>
            (boost::none, config.timeout);
    }
    services.pointCloud = std::make_shared<LasTools>(config.lasTools);
    return services;
}

void Pipeline::enter(Stage stage)
{
    stage_ = stage;
    LOG(info3) << "Entering stage <" << stage << ">.";
}

Region Pipeline::select(const AreaOfInterest &aoi)
{
    enter(Stage::selectSource);

    const auto catalog(loadRegionCatalog(config_.regionCatalog));
    const auto region(selectSource(aoi, catalog));

    LOG(info4) << "Using <" << region << "> elevation data.";
    return region;
}

Output Pipeline::run(const AreaOfInterest &aoi)
{
    LOG(info4) << "Acquiring ancillary data for AOI " << aoi << ".";

    WorkDir workdir(config_.workRoot, config_.runId);

    struct Cleanup {
        Cleanup(Pipeline &p) : p(p) {}
        ~Cleanup() { p.enter(Stage::cleanup); }
        Pipeline &p;
    } cleanup(*this);

    const auto source(Source::create(select(aoi), config_, services_));

    StatusLines status;
    AcquisitionResult result
        (source->region(), primary(*source, aoi, workdir, status));

    if (!config_.intensity) {
        LOG(info3) << "Intensity disabled by configuration.";
    } else if (!source->supports(DataType::laz)) {
        LOG(info3) << "Source <" << source->region()
                   << "> provides no point clouds; no intensity.";
    } else if (!services_.pointCloud) {
        LOG(warn2) << "No point-cloud processor available; no intensity.";
    } else {
        try {
            result.secondary = secondary(*source, aoi, workdir, status);
        } catch (const CrsResolutionError&) {
            throw;
        } catch (const Error &e) {
            LOG(warn3) << "Intensity not available: <" << e.what() << ">.";
            status.push_back(std::string("Intensity not available: ")
                             + e.what());
        }
    }

    enter(Stage::assembleOutput);
    result.status = status;
    return assemble(result);
}

RasterMosaic Pipeline::primary(const Source &source
                               , const AreaOfInterest &aoi
                               , const WorkDir &workdir
                               , StatusLines &status)
{
    enter(Stage::acquirePrimary);

    const auto tiles(source.tiles(DataType::dtm, aoi, workdir.path()));
    if (tiles.empty()) {
        LOGTHROW(err2, NoDataAvailableError)
            << "No DTM tile of <" << source.region() << "> covers AOI.";
    }

    const auto acquired(source.acquire
                        (AcquisitionRequest(DataType::dtm, aoi, tiles
                                            , workdir.path())));
    append(status, acquired.status);

    auto files(acquired.tiles);
    if (source.properties().fillNodata) {
        enter(Stage::fillNodata);
        files = globFiles(fillNodata(acquired.dir), ".tif");
    }

    enter(Stage::mosaicPrimary);
    auto mosaic(mergeAndClip(files, aoi));
    status.push_back("DTM mosaic prepared.");
    return mosaic;
}

RasterMosaic Pipeline::secondary(const Source &source
                                 , const AreaOfInterest &aoi
                                 , const WorkDir &workdir
                                 , StatusLines &status)
{
    enter(Stage::acquireSecondary);

    const auto &properties(source.properties());
    if (!properties.pointCloudSrs) {
        LOGTHROW(err2, InvalidConfiguration)
            << "Source <" << source.region()
            << "> does not define point-cloud CRS.";
    }
    const auto &srs(*properties.pointCloudSrs);

    const auto tiles(source.tiles(DataType::laz, aoi, workdir.path()));
    if (tiles.empty()) {
        LOGTHROW(err2, NoDataAvailableError)
            << "No point-cloud tile of <" << source.region()
            << "> covers AOI.";
    }

    const auto acquired(source.acquire
                        (AcquisitionRequest(DataType::laz, aoi, tiles
                                            , workdir.path())));
    append(status, acquired.status);
    if (acquired.tiles.empty()) {
        LOGTHROW(err2, NoDataAvailableError)
            << "No point cloud acquired from <" << source.region() << ">.";
    }

    auto &pc(*services_.pointCloud);

    enter(Stage::index);
    pc.index(acquired.dir);

    enter(Stage::deriveSecondary);
    const auto dir(pc.intensity(acquired.dir, reproject(aoi, srs).extents()));
    if (properties.assignIntensitySrs) {
        assignSrs(dir, srs);
    }

    enter(Stage::mosaicSecondary);
    auto mosaic(mergeAndClip(globFiles(dir, ".tif"), aoi));
    status.push_back("Intensity mosaic prepared.");
    return mosaic;
}

} // namespace ancillary
