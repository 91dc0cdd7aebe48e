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
#include <iterator>

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"
#include "../srs.hpp"
#include "../support/glob.hpp"
#include "../gdalsupport/archive.hpp"
#include "../gdalsupport/rasterops.hpp"

#include "./sources.hpp"

namespace fs = boost::filesystem;

namespace ancillary { namespace source {

namespace {

/** EPSG code of Mexican ITRF92 UTM zone 0; zone N is this + N.
 */
const int MxUtmBase(4473);

/** Reads UTM zone from metadata page shipped with each grid:
 *      <dt><em>UTM_Zone_Number:</em>  14</dt>
 */
int utmZone(const fs::path &html)
{
    std::ifstream f(html.string(), std::ios_base::in | std::ios_base::binary);
    if (!f) {
        LOGTHROW(err1, IOError) << "Unable to open metadata " << html << ".";
    }
    const std::string content((std::istreambuf_iterator<char>(f))
                              , std::istreambuf_iterator<char>());

    static const boost::regex re
        ("UTM_Zone_Number:\\s*</em>\\s*([0-9]+)");
    boost::smatch m;
    if (!boost::regex_search(content, m, re)) {
        LOGTHROW(err1, FormatError)
            << "No UTM zone found in metadata " << html << ".";
    }

    return boost::lexical_cast<int>(m[1].str());
}

/** INEGI lidar terrain models: zipped XYZ grid (cell centres) plus HTML
 *  metadata page telling the UTM zone.
 */
class Mexico : public Source {
public:
    Mexico(const SourceConfig &config, const Services &services)
        : Source(Region::mx, config, services, Properties(DataType::dtm))
    {}

private:
    std::string idField_impl(DataType) const override { return "upc"; }

    void fetchTile_impl(const AcquisitionRequest &request
                        , const TileRecord &tile
                        , const fs::path &dir) const override;

    void finish_impl(const AcquisitionRequest &request
                     , const fs::path &dir
                     , StatusLines &status) const override;
};

void Mexico::fetchTile_impl(const AcquisitionRequest&
                            , const TileRecord &tile
                            , const fs::path &dir) const
{
    const auto zip(download(Request(config().dtmUrl + tile.id + "_as.zip")
                            , dir));

    const auto files(extractZip(zip, dir, [](const std::string &member)
    {
        return (extensionFilter(".xyz")(member)
                || extensionFilter(".html")(member));
    }));
    discard(zip);

    if (files.empty()) {
        LOGTHROW(err1, FormatError) << "No grid found in " << zip << ".";
    }
}

void Mexico::finish_impl(const AcquisitionRequest&, const fs::path &dir
                         , StatusLines &status) const
{
    for (const auto &xyz : globFiles(dir, ".xyz")) {
        auto html(xyz);
        html.replace_extension(".html");
        auto tif(xyz);
        tif.replace_extension(".tif");

        try {
            const auto srs(epsg(MxUtmBase + utmZone(html)));
            convertGrid(xyz, tif, GridConversion(srs, GridAnchor::center));
        } catch (const CrsResolutionError&) {
            throw;
        } catch (const Error &e) {
            LOG(warn2) << "Grid " << xyz << " not converted: <"
                       << e.what() << ">.";
            status.push_back("Grid " + xyz.filename().string()
                             + " not converted: " + e.what());
        }
    }
}

} // namespace

Source::pointer mexico(const SourceConfig &config
                       , const Services &services)
{
    return std::make_shared<Mexico>(config, services);
}

} } // namespace ancillary::source
