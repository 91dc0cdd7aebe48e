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
#include <initializer_list>
#include <utility>

#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./srs.hpp"
#include "./tilecatalog.hpp"

namespace fs = boost::filesystem;

namespace ancillary {

namespace {

double numericAttribute(const TileRecord &record, const std::string &name)
{
    const auto &value(record.attribute(name));
    try {
        return boost::lexical_cast<double>(value);
    } catch (const boost::bad_lexical_cast&) {
        LOGTHROW(err2, FormatError)
            << "Attribute <" << name << "> of tile <" << record.id
            << "> is not a number (" << value << ").";
    }
    throw;
}

TileCatalog fetchCatalog(const CatalogLocation &location
                         , const std::string &idField
                         , Fetcher &fetcher, const fs::path &workdir)
{
    try {
        const auto local(workdir / urlFilename(location.remote));
        fetcher.fetch(Request(location.remote, location.options), local);

        auto path(local);
        if (!location.member.empty()) {
            path = "/vsizip/" + local.string() + "/" + location.member;
        } else if (local.extension() == ".zip") {
            // let GDAL find the only dataset inside
            path = "/vsizip/" + local.string();
        }
        return loadCatalog(path, idField, location.srs);
    } catch (const IOError &e) {
        LOGTHROW(warn2, CatalogUnavailableError)
            << "Catalog <" << location.remote << "> unavailable: <"
            << e.what() << ">.";
    } catch (const FormatError &e) {
        LOGTHROW(warn2, CatalogUnavailableError)
            << "Catalog <" << location.remote << "> unusable: <"
            << e.what() << ">.";
    }
    throw;
}

} // namespace

const std::string& TileRecord::attribute(const std::string &name) const
{
    auto fattributes(attributes.find(name));
    if (fattributes == attributes.end()) {
        LOGTHROW(err2, FormatError)
            << "Tile <" << id << "> has no attribute <" << name << ">.";
    }
    return fattributes->second;
}

TileCatalog loadCatalog(const fs::path &path, const std::string &idField
                        , const boost::optional<geo::SrsDefinition> &srs)
{
    LOG(info2) << "Loading tile catalog from " << path << ".";

    auto ds(ogr::openVectorDataset(path));
    auto layer(ogr::layer(ds));

    auto catalog([&]() -> TileCatalog
    {
        if (const auto *ref = layer->GetSpatialRef()) {
            return TileCatalog(fromReference(*ref));
        }
        if (srs) { return TileCatalog(*srs); }
        LOGTHROW(err2, CrsResolutionError)
            << "Tile catalog " << path << " has no CRS.";
        throw;
    }());

    auto *defn(layer->GetLayerDefn());
    if (defn->GetFieldIndex(idField.c_str()) < 0) {
        LOGTHROW(err2, FormatError)
            << "Tile catalog " << path << " has no field <" << idField
            << ">.";
    }

    layer->ResetReading();
    while (auto f = ogr::feature(layer->GetNextFeature())) {
        auto *g(f->GetGeometryRef());
        if (!g) {
            LOG(warn1) << "Skipping feature " << f->GetFID()
                       << " without geometry in " << path << ".";
            continue;
        }

        TileRecord::Attributes attributes;
        for (int i(0), e(defn->GetFieldCount()); i != e; ++i) {
            attributes[defn->GetFieldDefn(i)->GetNameRef()]
                = f->GetFieldAsString(i);
        }

        const auto id(attributes[idField]);
        catalog.records.emplace_back
            (id, Footprint(ogr::geometry(g, true), catalog.srs)
             , attributes);
    }

    LOG(info2) << "Loaded " << catalog.records.size()
               << " tiles from " << path << ".";

    return catalog;
}

TileCatalog loadCatalog(const CatalogLocation &location
                        , const std::string &idField
                        , Fetcher &fetcher, const fs::path &workdir)
{
    if (!location.remote.empty()) {
        try {
            return fetchCatalog(location, idField, fetcher, workdir);
        } catch (const CatalogUnavailableError &e) {
            if (location.bundled.empty()) { throw; }
            LOG(warn3)
                << "Falling back to bundled catalog " << location.bundled
                << ": <" << e.what() << ">.";
        }
    }

    if (location.bundled.empty()) {
        LOGTHROW(err2, CatalogUnavailableError)
            << "No catalog location configured.";
    }

    return loadCatalog(location.bundled, idField, location.srs);
}

TileRecord::list match(const AreaOfInterest &aoi
                       , const TileCatalog &catalog
                       , const MatchOptions &options)
{
    const auto area(reproject(aoi, catalog.srs).envelope());

    LOG(info1) << std::fixed << "Matching tiles against " << area.extents()
               << " (" << options.predicate << ").";

    TileRecord::list out;
    for (const auto &record : catalog.records) {
        const bool hit((options.predicate == Predicate::within)
                       ? area.within(record.footprint)
                       : area.intersects(record.footprint));
        if (!hit) { continue; }

        out.push_back(record);

        if (!options.neighbours) { continue; }

        const auto &n(*options.neighbours);
        const long ax(std::lround(numericAttribute(record, n.leftField)
                                  / n.cellSize));
        const long ay(std::lround(numericAttribute(record, n.bottomField)
                                  / n.cellSize));

        // right, above, above-right
        for (const auto &d : { std::make_pair(1, 0), std::make_pair(0, 1)
                    , std::make_pair(1, 1) })
        {
            const auto x(ax + d.first);
            const auto y(ay + d.second);
            const auto name(n.namer(x, y));

            TileRecord::Attributes attributes;
            attributes[n.nameField] = name;
            attributes[n.leftField]
                = boost::lexical_cast<std::string>(x * n.cellSize);
            attributes[n.bottomField]
                = boost::lexical_cast<std::string>(y * n.cellSize);

            const math::Extents2 cell(x * n.cellSize, y * n.cellSize
                                      , (x + 1) * n.cellSize
                                      , (y + 1) * n.cellSize);
            out.emplace_back(name, Footprint::fromExtents(cell, catalog.srs)
                             , attributes);
        }
    }

    LOG(info2) << "Matched " << out.size() << " tiles.";
    return out;
}

std::vector<std::string> ids(const TileRecord::list &tiles)
{
    std::vector<std::string> out;
    for (const auto &tile : tiles) { out.push_back(tile.id); }
    return out;
}

} // namespace ancillary
