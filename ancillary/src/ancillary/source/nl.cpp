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
#include <boost/algorithm/string/case_conv.hpp>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"
#include "../srs.hpp"
#include "../gdalsupport/archive.hpp"

#include "./sources.hpp"

namespace fs = boost::filesystem;
namespace ba = boost::algorithm;

namespace ancillary { namespace source {

namespace {

/** AHN3: one zipped GeoTIFF per map sheet (0.5 m DTM), one LAZ per map
 *  sheet. Download URLs are attributes of the catalog.
 */
class Netherlands : public Source {
public:
    Netherlands(const SourceConfig &config, const Services &services)
        : Source(Region::nl, config, services, properties())
    {}

private:
    static Properties properties() {
        Properties p(DataType::dtm);
        p.support(DataType::laz);
        p.fillNodata = true;
        p.pointCloudSrs = epsg(28992);
        p.assignIntensitySrs = true;
        return p;
    }

    std::string idField_impl(DataType) const override {
        return "Kaartblad";
    }

    void fetchTile_impl(const AcquisitionRequest &request
                        , const TileRecord &tile
                        , const fs::path &dir) const override;
};

void Netherlands::fetchTile_impl(const AcquisitionRequest &request
                                 , const TileRecord &tile
                                 , const fs::path &dir) const
{
    switch (request.type) {
    case DataType::dtm: {
        const auto zip(download(Request(tile.attribute("AHN3_05m_DTM"))
                                , dir));
        const auto files(extractZip(zip, dir, extensionFilter(".tif")));
        discard(zip);
        if (files.empty()) {
            LOGTHROW(err1, FormatError)
                << "No GeoTIFF found in " << zip << ".";
        }
        break;
    }

    case DataType::laz: {
        const Request r(tile.attribute("AHN3_LAZ"));
        downloadAs(r, dir / ba::to_lower_copy(urlFilename(r.url)));
        break;
    }
    }
}

} // namespace

Source::pointer netherlands(const SourceConfig &config
                            , const Services &services)
{
    return std::make_shared<Netherlands>(config, services);
}

} } // namespace ancillary::source
