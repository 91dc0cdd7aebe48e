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

#include <algorithm>

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./source.hpp"
#include "./raster.hpp"
#include "./support/glob.hpp"
#include "./source/sources.hpp"

namespace fs = boost::filesystem;

namespace ancillary {

namespace {

std::string extension(DataType type)
{
    switch (type) {
    case DataType::dtm: return ".tif";
    case DataType::laz: return ".laz";
    }
    return {};
}

} // namespace

Source::pointer Source::create(Region region, const Config &config
                               , const Services &services)
{
    const auto &sc(config.source(region));

    switch (region) {
    case Region::nl: return source::netherlands(sc, services);
    case Region::dk: return source::denmark(sc, services);
    case Region::si: return source::slovenia(sc, services);
    case Region::deNrw: return source::northRhineWestphalia(sc, services);
    case Region::mx: return source::mexico(sc, services);
    case Region::srtm: return source::srtm(sc, services);
    }

    LOGTHROW(err2, InvalidConfiguration)
        << "No source available for region <" << region << ">.";
    throw;
}

Source::Source(Region region, const SourceConfig &config
               , const Services &services, const Properties &properties)
    : region_(region), config_(config), services_(services)
    , properties_(properties)
{
    if (!services_.fetcher) {
        LOGTHROW(err2, InvalidConfiguration)
            << "Source <" << region_ << "> created without fetcher.";
    }
}

bool Source::supports(DataType type) const
{
    const auto &types(properties_.types);
    return std::find(types.begin(), types.end(), type) != types.end();
}

void Source::checkType(DataType type) const
{
    if (!supports(type)) {
        LOGTHROW(err2, UnsupportedDataTypeError)
            << "Source <" << region_ << "> does not provide " << type
            << " data.";
    }
}

MatchOptions Source::matchOptions_impl(DataType) const
{
    return MatchOptions(Predicate::intersects);
}

void Source::begin_impl(const AcquisitionRequest&, const fs::path&) const
{}

void Source::finish_impl(const AcquisitionRequest&, const fs::path&
                         , StatusLines&) const
{}

TileRecord::list Source::tiles(DataType type, const AreaOfInterest &aoi
                               , const fs::path &workdir) const
{
    checkType(type);

    const auto catalog(loadCatalog(config_.catalogFor(type)
                                   , idField_impl(type), fetcher()
                                   , workdir));

    auto tiles(match(aoi, catalog, matchOptions_impl(type)));
    LOG(info3) << "Source <" << region_ << ">: found " << tiles.size()
               << " " << type << " products.";
    return tiles;
}

AcquiredTiles Source::acquire(const AcquisitionRequest &request) const
{
    checkType(request.type);

    AcquiredTiles result;
    result.dir = request.workdir
        / boost::lexical_cast<std::string>(request.type);

    boost::system::error_code ec;
    fs::create_directories(result.dir, ec);
    if (ec) {
        LOGTHROW(err2, IOError)
            << "Unable to create directory " << result.dir << ": <"
            << ec.message() << ">.";
    }

    auto &status(result.status);
    LOG(info3) << "Downloading " << request.tiles.size() << " "
               << request.type << " tiles from <" << region_ << ">.";

    begin_impl(request, result.dir);

    std::size_t index(0);
    for (const auto &tile : request.tiles) {
        LOG(info2) << ++index << " of " << request.tiles.size()
                   << ": tile <" << tile.id << ">.";
        try {
            fetchTile_impl(request, tile, result.dir);
            status.push_back("Tile " + tile.id + " acquired.");
        } catch (const CrsResolutionError&) {
            throw;
        } catch (const Error &e) {
            LOG(warn2) << "Tile <" << tile.id << "> skipped: <"
                       << e.what() << ">.";
            status.push_back("Tile " + tile.id + " skipped: "
                             + e.what());
        }
    }

    finish_impl(request, result.dir, status);

    result.tiles = globFiles(result.dir, extension(request.type));
    if (request.type == DataType::dtm) {
        // downloads may be error pages served with success status
        Paths readable;
        for (const auto &path : result.tiles) {
            try {
                RasterTile::open(path);
                readable.push_back(path);
            } catch (const Error &e) {
                LOG(warn2) << "File " << path << " is not a raster: <"
                           << e.what() << ">.";
                status.push_back("File " + path.filename().string()
                                 + " skipped: not a readable raster.");
                discard(path);
            }
        }
        result.tiles.swap(readable);
    }

    status.push_back("Finished downloading "
                     + boost::lexical_cast<std::string>(request.type)
                     + " files: "
                     + boost::lexical_cast<std::string>(result.tiles.size())
                     + " files from " + boost::lexical_cast<std::string>
                     (request.tiles.size()) + " tiles.");
    LOG(info3) << status.back();

    return result;
}

fs::path Source::download(const Request &request, const fs::path &dir) const
{
    const auto dst(dir / urlFilename(request.url));
    downloadAs(request, dst);
    return dst;
}

void Source::downloadAs(const Request &request, const fs::path &dst) const
{
    fetcher().fetch(request, dst);
    LOG(info2) << dst.filename() << " successfully downloaded.";
}

void Source::discard(const fs::path &path)
{
    boost::system::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG(warn1) << "Unable to remove " << path << ": <"
                   << ec.message() << ">.";
    }
}

} // namespace ancillary
