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
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/classification.hpp>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"
#include "../srs.hpp"
#include "../gdalsupport/archive.hpp"

#include "./sources.hpp"

namespace fs = boost::filesystem;
namespace ba = boost::algorithm;

namespace ancillary { namespace source {

namespace {

const int DkEpsg(25832);

/** Kilometre grid cells covered by the AOI, upper bounds exclusive.
 */
struct KmRange {
    long xMin, xMax, yMin, yMax;

    KmRange(const math::Extents2 &e)
        : xMin(long(std::floor(e.ll(0) / 1000.0)))
        , xMax(long(std::ceil(e.ur(0) / 1000.0)))
        , yMin(long(std::floor(e.ll(1) / 1000.0)))
        , yMax(long(std::ceil(e.ur(1) / 1000.0)))
    {}

    /** Member names look like DTM_1km_<y>_<x>.tif.
     */
    bool covers(const std::string &member) const {
        const auto stem(fs::path(member).stem().string());
        std::vector<std::string> parts;
        ba::split(parts, stem, ba::is_any_of("_"));
        if (parts.size() < 4) { return false; }

        long y, x;
        try {
            y = boost::lexical_cast<long>(parts[2]);
            x = boost::lexical_cast<long>(parts[3]);
        } catch (const boost::bad_lexical_cast&) {
            LOG(warn1) << "Unexpected archive member <" << member
                       << ">; ignored.";
            return false;
        }

        return ((yMin <= y) && (y < yMax) && (xMin <= x) && (x < xMax));
    }
};

/** Danish elevation model: FTP server with zipped 10 km blocks of 1 km
 *  tiles; only tiles inside the AOI are extracted.
 */
class Denmark : public Source {
public:
    Denmark(const SourceConfig &config, const Services &services)
        : Source(Region::dk, prepare(config), services, properties())
    {}

private:
    static SourceConfig prepare(SourceConfig config) {
        if (config.credentials) {
            const auto option(authOption(*config.credentials));
            config.catalog.options.push_back(option);
            if (config.pointCloudCatalog) {
                config.pointCloudCatalog->options.push_back(option);
            }
        }
        return config;
    }

    static Properties properties() {
        Properties p(DataType::dtm);
        p.support(DataType::laz);
        p.pointCloudSrs = epsg(DkEpsg);
        return p;
    }

    std::string idField_impl(DataType) const override {
        return "filename";
    }

    void fetchTile_impl(const AcquisitionRequest &request
                        , const TileRecord &tile
                        , const fs::path &dir) const override;

    Request request(const std::string &url) const;
};

Request Denmark::request(const std::string &url) const
{
    Request r(url);
    if (config().credentials) {
        r.options.push_back(authOption(*config().credentials));
    }
    return r;
}

void Denmark::fetchTile_impl(const AcquisitionRequest &request
                             , const TileRecord &tile
                             , const fs::path &dir) const
{
    const KmRange range(reproject(request.aoi, epsg(DkEpsg)).extents());

    std::string name(tile.id);
    std::string base(config().dtmUrl);
    std::string extension(".tif");
    if (request.type == DataType::laz) {
        // fishnet names differ from names on the server
        ba::replace_all(name, "punktsky", "PUNKTSKY");
        ba::replace_all(name, "LAZ", "TIF");
        base = config().lazUrl;
        extension = ".laz";
    }

    const auto zip(download(this->request(base + name), dir));

    const auto files(extractZip(zip, dir, [&](const std::string &member)
    {
        return ba::ends_with(member, extension) && range.covers(member);
    }));
    discard(zip);

    LOG(info2) << "Extracted " << files.size() << " tiles covering AOI from "
               << name << ".";
}

} // namespace

Source::pointer denmark(const SourceConfig &config
                        , const Services &services)
{
    return std::make_shared<Denmark>(config, services);
}

} } // namespace ancillary::source
