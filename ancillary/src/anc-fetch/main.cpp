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

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include <gdal_priv.h>
#include <ogrsf_frmts.h>

#include "dbglog/dbglog.hpp"

#include "utility/streams.hpp"
#include "utility/buildsys.hpp"

#include "service/cmdline.hpp"

#include "math/geometry_core.hpp"

#include "ancillary/error.hpp"
#include "ancillary/srs.hpp"
#include "ancillary/config.hpp"
#include "ancillary/footprint.hpp"
#include "ancillary/pipeline.hpp"
#include "ancillary/output.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;
namespace ba = boost::algorithm;

namespace anc = ancillary;

/** AOI rectangle given as minx,miny,maxx,maxy.
 */
struct ExtentsOption {
    math::Extents2 value;
};

void validate(boost::any &v, const std::vector<std::string> &values
              , ExtentsOption*, int)
{
    po::validators::check_first_occurrence(v);
    const auto &s(po::validators::get_single_string(values));

    std::vector<std::string> parts;
    ba::split(parts, s, ba::is_any_of(","));
    if (parts.size() != 4) {
        throw po::validation_error
            (po::validation_error::invalid_option_value);
    }

    ExtentsOption e;
    try {
        e.value = math::Extents2(boost::lexical_cast<double>(parts[0])
                                 , boost::lexical_cast<double>(parts[1])
                                 , boost::lexical_cast<double>(parts[2])
                                 , boost::lexical_cast<double>(parts[3]));
    } catch (const boost::bad_lexical_cast&) {
        throw po::validation_error
            (po::validation_error::invalid_option_value);
    }
    v = e;
}

class AncFetch : public service::Cmdline {
public:
    AncFetch()
        : service::Cmdline("anc-fetch", BUILD_TARGET_VERSION)
        , noexcept_(false)
    {}

private:
    void configuration(po::options_description &cmdline
                       , po::options_description &config
                       , po::positional_options_description &pd);

    void configure(const po::variables_map &vars);

    bool help(std::ostream &out, const std::string &what) const;

    int run();

    int runImpl();

    anc::Config config_;
    boost::optional<math::Extents2> extents_;
    std::string aoiWkt_;
    std::string srs_;
    fs::path output_;

    bool noexcept_;
};

void AncFetch::configuration(po::options_description &cmdline
                             , po::options_description &config
                             , po::positional_options_description &pd)
{
    cmdline.add_options()
        ("runId", po::value(&config_.runId)->required()
         , "Run identifier; names the working directory.")
        ("extents", po::value<ExtentsOption>()
         , "AOI rectangle as minx,miny,maxx,maxy (in --srs).")
        ("aoi", po::value(&aoiWkt_)
         , "AOI polygon as WKT (in --srs). Alternative to --extents.")
        ("srs", po::value(&srs_)->required()
         , "CRS of AOI: EPSG:nnnn, proj4 string or WKT.")
        ("output", po::value(&output_)->required()
         , "Output directory; receives dtm.tif, intensity.tif (if "
         "available) and metadata.json.")

        ("noexcept", "Do not catch exceptions, let the program crash.")
        ;

    config_.configuration(config);

    pd.add("output", 1);
}

void AncFetch::configure(const po::variables_map &vars)
{
    if (vars.count("extents")) {
        extents_ = vars["extents"].as<ExtentsOption>().value;
    }

    if (bool(extents_) == !aoiWkt_.empty()) {
        throw po::error("Exactly one of --extents and --aoi must be given.");
    }

    try {
        config_.configure(vars);
    } catch (const anc::InvalidConfiguration &e) {
        throw po::error(e.what());
    }

    output_ = fs::absolute(output_);
    noexcept_ = vars.count("noexcept");

    LOG(info3, log_)
        << "Config:"
        << "\n\tsrs = " << srs_
        << "\n\toutput = " << output_
        << "\n"
        << utility::LManip([&](std::ostream &os) {
                config_.printConfig(os, "\t");
            })
        ;
}

bool AncFetch::help(std::ostream &out, const std::string &what) const
{
    if (what.empty()) {
        // program help
        out << ("anc-fetch output --runId ID --srs SRS "
                "(--extents minx,miny,maxx,maxy | --aoi WKT) [options]\n"
                "    Acquires ancillary elevation data for area of "
                "interest.\n"
                "\n"
                "    Source is selected by region the AOI lies in (NL, DK,\n"
                "    SI, DE_NRW, MX), SRTM is used elsewhere. DTM tiles are\n"
                "    downloaded, merged and clipped to AOI bounding box.\n"
                "    Where the source offers point clouds an intensity\n"
                "    raster is derived from them by LAStools.\n"
                "\n"
                "    Output:\n"
                "        dtm.tif        DTM mosaic\n"
                "        intensity.tif  intensity mosaic (optional)\n"
                "        metadata.json  grids, CRS and status of both\n"
                "\n"
                );

        return true;
    }

    return false;
}

int AncFetch::runImpl()
{
    const auto srs(anc::parseSrs(srs_));
    const auto aoi(extents_
                   ? anc::Footprint::fromExtents(*extents_, srs)
                   : anc::Footprint::fromWkt(aoiWkt_, srs));

    anc::Pipeline pipeline(config_, anc::Pipeline::services(config_));
    const auto output(pipeline.run(aoi));

    anc::save(output_, output);

    for (const auto &line : output.status) {
        std::cout << line << '\n';
    }
    std::cout << "source: " << output.region << '\n'
              << "intensity: " << (output.secondary ? "yes" : "no") << '\n'
              << std::flush;

    return EXIT_SUCCESS;
}

int AncFetch::run()
{
    if (noexcept_) {
        return runImpl();
    }

    try {
        return runImpl();
    } catch (const std::exception &e) {
        std::cerr << "anc-fetch: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
}

int main(int argc, char *argv[])
{
    ::GDALAllRegister();
    ::OGRRegisterAll();
    return AncFetch()(argc, argv);
}
