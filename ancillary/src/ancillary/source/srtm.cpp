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

#include <vector>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/regex.hpp>

#include <cpl_string.h>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"

#include "./sources.hpp"

namespace fs = boost::filesystem;

namespace ancillary { namespace source {

namespace {

const std::string ErsUrl("https://ers.cr.usgs.gov");
const std::string ErsLoginUrl("https://ers.cr.usgs.gov/login/");

std::string urlEscape(const std::string &value)
{
    auto *escaped(::CPLEscapeString(value.c_str(), int(value.size())
                                    , CPLES_URL));
    std::string out(escaped);
    ::CPLFree(escaped);
    return out;
}

/** Extracts value of hidden csrf input from login page.
 */
std::string csrfToken(const std::string &page)
{
    static const boost::regex input("<input[^>]*name=\"csrf\"[^>]*>");
    static const boost::regex value("value=\"([^\"]*)\"");

    boost::smatch m;
    if (boost::regex_search(page, m, input)) {
        const auto tag(m[0].str());
        boost::smatch v;
        if (boost::regex_search(tag, v, value)) { return v[1].str(); }
    }

    LOGTHROW(err1, FormatError) << "No csrf token found on login page.";
    throw;
}

/** SRTM 1 arc-second tiles from USGS EarthExplorer; needs ERS session.
 */
class Srtm : public Source {
public:
    Srtm(const SourceConfig &config, const Services &services)
        : Source(Region::srtm, config, services, Properties(DataType::dtm))
    {
        // validate template
        try {
            url("N00E000");
        } catch (const boost::io::format_error &e) {
            LOGTHROW(err2, InvalidConfiguration)
                << "Invalid SRTM URL template <" << config.dtmUrl
                << ">: <" << e.what() << ">.";
        }
    }

private:
    std::string idField_impl(DataType) const override {
        return "tile_name";
    }

    void begin_impl(const AcquisitionRequest &request
                    , const fs::path &dir) const override;

    void fetchTile_impl(const AcquisitionRequest &request
                        , const TileRecord &tile
                        , const fs::path &dir) const override;

    std::string url(const std::string &tile) const {
        return str(boost::format(config().dtmUrl) % tile);
    }

    std::vector<std::string> session(const fs::path &dir) const {
        const auto jar((dir / "ers.cookies").string());
        return { "COOKIEFILE=" + jar, "COOKIEJAR=" + jar };
    }
};

void Srtm::begin_impl(const AcquisitionRequest&, const fs::path &dir) const
{
    const auto &credentials(config().credentials);
    if (!credentials || !credentials->valid()) {
        LOG(warn2) << "No EarthExplorer credentials configured; "
            "downloading without login.";
        return;
    }

    try {
        const auto csrf(csrfToken(fetcher().get(Request(ErsUrl
                                                        , session(dir)))));

        auto options(session(dir));
        options.push_back("POSTFIELDS=username="
                          + urlEscape(credentials->user)
                          + "&password=" + urlEscape(credentials->password)
                          + "&csrf=" + urlEscape(csrf));
        fetcher().get(Request(ErsLoginUrl, options));
        LOG(info2) << "Logged in to EarthExplorer as <"
                   << credentials->user << ">.";
    } catch (const Error &e) {
        // tile downloads report their own failures
        LOG(warn2) << "EarthExplorer login failed: <" << e.what() << ">.";
    }
}

void Srtm::fetchTile_impl(const AcquisitionRequest&, const TileRecord &tile
                          , const fs::path &dir) const
{
    const auto name("SRTM1" + tile.id + "V3");
    downloadAs(Request(url(tile.id), session(dir)), dir / (name + ".tif"));
}

} // namespace

Source::pointer srtm(const SourceConfig &config, const Services &services)
{
    return std::make_shared<Srtm>(config, services);
}

} } // namespace ancillary::source
