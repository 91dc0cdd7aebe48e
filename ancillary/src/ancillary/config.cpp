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
#include <sstream>
#include <ostream>

#include <boost/filesystem.hpp>

#include "dbglog/dbglog.hpp"

#include "utility/buildsys.hpp"

#include "./error.hpp"
#include "./srs.hpp"
#include "./config.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace ancillary {

namespace {

const std::string DkFtp("ftp://ftp.kortforsyningen.dk/"
                        "dhm_danmarks_hoejdemodel/");

const std::string ArsoUrl("http://gis.arso.gov.si/");

const std::string NrwUrl("https://www.opengeodata.nrw.de/produkte/geobasis/"
                         "hm/");

const std::string InegiUrl
("http://internet.contenidos.inegi.org.mx/contenidos/Productos/prod_serv/"
 "contenidos/espanol/bvinegi/productos/geografia/imagen_cartografica/"
 "1_10_000/lidar//Terreno_ASCII/");

fs::path resolve(const fs::path &root, const fs::path &path)
{
    if (path.empty() || path.is_absolute()) { return path; }
    return fs::absolute(path, root);
}

void resolve(const fs::path &root, CatalogLocation &location)
{
    location.bundled = resolve(root, location.bundled);
}

void resolve(const fs::path &root, SourceConfig &config)
{
    resolve(root, config.catalog);
    if (config.pointCloudCatalog) {
        resolve(root, *config.pointCloudCatalog);
    }
    config.credentialsFile = resolve(root, config.credentialsFile);
}

void loadCredentials(SourceConfig &config, const std::string &option
                     , const po::variables_map &vars)
{
    if (config.credentialsFile.empty()) { return; }

    boost::system::error_code ec;
    if (!fs::exists(config.credentialsFile, ec)) {
        if (vars.count(option) && !vars[option].defaulted()) {
            LOGTHROW(err2, InvalidConfiguration)
                << "Credentials file " << config.credentialsFile
                << " does not exist.";
        }
        LOG(warn2) << "No credentials found at " << config.credentialsFile
                   << "; anonymous access used.";
        return;
    }

    config.credentials = loadCredentials(config.credentialsFile);
}

void printSource(std::ostream &os, const std::string &prefix
                 , const SourceConfig &config)
{
    const auto &catalog(config.catalog);
    os << prefix << "catalog.url = " << catalog.remote << "\n"
       << prefix << "catalog.bundled = " << catalog.bundled << "\n";
    if (config.pointCloudCatalog) {
        os << prefix << "pointCloudCatalog.url = "
           << config.pointCloudCatalog->remote << "\n";
    }
    if (!config.dtmUrl.empty()) {
        os << prefix << "dtmUrl = " << config.dtmUrl << "\n";
    }
    if (!config.lazUrl.empty()) {
        os << prefix << "lazUrl = " << config.lazUrl << "\n";
    }
    if (!config.credentialsFile.empty()) {
        os << prefix << "credentials = " << config.credentialsFile
           << (config.credentials ? "" : " (not loaded)") << "\n";
    }
    if (!config.localRepository.empty()) {
        os << prefix << "localRepository = " << config.localRepository
           << "\n";
    }
}

} // namespace

const CatalogLocation& SourceConfig::catalogFor(DataType type) const
{
    if ((type == DataType::laz) && pointCloudCatalog) {
        return *pointCloudCatalog;
    }
    return catalog;
}

Config::Config()
    : workRoot(".")
    , catalogRoot(utility::buildsys::installPath("share/ancillary/catalogs"))
    , regionCatalog("dtm_open_data/dtm_open_data.shp")
    , intensity(true)
    , timeout(0)
{
    nl.catalog = CatalogLocation
        ("https://opendata.arcgis.com/datasets/"
         "9039d4ec38ed444587c46f8689f0435e_0.geojson"
         , "ahn3.geojson");

    dk.catalog = CatalogLocation
        (DkFtp + "DTM/GRID/GRID_2014_DTM_SHP_UTM32-ETRS89.zip"
         , fs::path(), "2014_dtm.shp");
    dk.catalog.srs = epsg(25832);
    dk.pointCloudCatalog = CatalogLocation
        (DkFtp + "PUNKTSKY/GRID/GRID_2014_punktsky_SHP_UTM32-ETRS89.zip"
         , fs::path(), "2014_punktsky.shp");
    dk.pointCloudCatalog->srs = epsg(25832);
    dk.dtmUrl = DkFtp + "DTM/";
    dk.lazUrl = DkFtp + "PUNKTSKY/";
    dk.credentialsFile = "dk_credentials.txt";

    si.catalog = CatalogLocation
        (ArsoUrl + "related/lidar_porocila/lidar_fishnet_D96TM.zip"
         , "SI/LIDAR_FISHNET_D96.shp");
    si.catalog.srs = epsg(3794);
    si.dtmUrl = ArsoUrl + "lidar/dmr1/";
    si.lazUrl = ArsoUrl + "lidar/gkot/laz/";

    deNrw.catalog = CatalogLocation(std::string(), "DE/fishnet_DE.shp");
    deNrw.catalog.srs = epsg(25832);
    deNrw.dtmUrl = NrwUrl + "dgm1_xyz/dgm1_xyz/";
    deNrw.lazUrl = NrwUrl + "3dm_l_las/3dm_l_las/";

    mx.catalog = CatalogLocation(std::string(), "MX/MX_lidar_fishnet.shp");
    mx.dtmUrl = InegiUrl;

    srtm.catalog = CatalogLocation
        (std::string(), "srtm30m_bounding_boxes.json");
    srtm.catalog.srs = epsg(4326);
    srtm.dtmUrl = "https://earthexplorer.usgs.gov/download/8360/"
        "SRTM1%sV3/GEOTIFF/EE";
    srtm.credentialsFile = "srtm_credentials.txt";
}

const SourceConfig& Config::source(Region region) const
{
    switch (region) {
    case Region::nl: return nl;
    case Region::dk: return dk;
    case Region::si: return si;
    case Region::deNrw: return deNrw;
    case Region::mx: return mx;
    case Region::srtm: return srtm;
    }

    LOGTHROW(err2, InvalidConfiguration)
        << "No configuration for region <" << region << ">.";
    throw;
}

SourceConfig& Config::source(Region region)
{
    return const_cast<SourceConfig&>
        (static_cast<const Config&>(*this).source(region));
}

void Config::configuration(po::options_description &od)
{
    od.add_options()
        ("workRoot", po::value(&workRoot)
         ->default_value(workRoot)->required()
         , "Root of per-run working directories.")
        ("catalog.root", po::value(&catalogRoot)
         ->default_value(catalogRoot)->required()
         , "Directory with bundled tile catalogs and credentials.")
        ("catalog.regions", po::value(&regionCatalog)
         ->default_value(regionCatalog)->required()
         , "Region coverage catalog (relative to catalog.root).")
        ("intensity", po::value(&intensity)
         ->default_value(intensity)->required()
         , "Derive intensity raster from point clouds when the source "
         "provides them.")

        ("lastools.binDir", po::value(&lasTools.binDir)
         , "Directory with LAStools binaries; PATH is searched if unset.")
        ("lastools.cores", po::value(&lasTools.cores)
         ->default_value(lasTools.cores)->required()
         , "Number of cores LAStools may use.")

        ("fetch.mirror", po::value<fs::path>()
         , "Take all remote files from this directory instead of network "
         "(matched by file name).")
        ("fetch.timeout", po::value(&timeout)
         ->default_value(timeout)->required()
         , "Network timeout in seconds, 0 means no timeout.")

        ("nl.catalog.url", po::value(&nl.catalog.remote)
         ->default_value(nl.catalog.remote)
         , "AHN3 tile catalog (GeoJSON).")

        ("dk.credentials", po::value(&dk.credentialsFile)
         ->default_value(dk.credentialsFile)
         , "File with \"user password\" for Danish FTP server.")
        ("dk.url", po::value(&dk.dtmUrl)
         ->default_value(dk.dtmUrl)
         , "Base URL of Danish DTM tiles.")
        ("dk.pointCloudUrl", po::value(&dk.lazUrl)
         ->default_value(dk.lazUrl)
         , "Base URL of Danish point-cloud tiles.")

        ("si.catalog.url", po::value(&si.catalog.remote)
         ->default_value(si.catalog.remote)
         , "ARSO lidar fishnet (zipped shapefile).")
        ("si.url", po::value(&si.dtmUrl)
         ->default_value(si.dtmUrl)
         , "Base URL of Slovenian DTM tiles.")
        ("si.pointCloudUrl", po::value(&si.lazUrl)
         ->default_value(si.lazUrl)
         , "Base URL of Slovenian point-cloud tiles.")
        ("si.localRepository"
         , po::value(&si.localRepository)
         , "Directory with Slovenian DTM GeoTIFFs to copy instead of "
         "downloading.")

        ("de-nrw.url", po::value(&deNrw.dtmUrl)
         ->default_value(deNrw.dtmUrl)
         , "Base URL of NRW DTM tiles.")
        ("de-nrw.pointCloudUrl", po::value(&deNrw.lazUrl)
         ->default_value(deNrw.lazUrl)
         , "Base URL of NRW point-cloud tiles.")

        ("mx.url", po::value(&mx.dtmUrl)
         ->default_value(mx.dtmUrl)
         , "Base URL of Mexican DTM tiles.")

        ("srtm.credentials", po::value(&srtm.credentialsFile)
         ->default_value(srtm.credentialsFile)
         , "File with \"user password\" for USGS EarthExplorer.")
        ("srtm.url", po::value(&srtm.dtmUrl)
         ->default_value(srtm.dtmUrl)
         , "URL template of SRTM tiles, %s is replaced by tile name.")
        ;
}

void Config::configure(const po::variables_map &vars)
{
    if (vars.count("fetch.mirror")) {
        mirror = fs::absolute(vars["fetch.mirror"].as<fs::path>());
    }

    if (lasTools.cores < 1) {
        LOGTHROW(err2, InvalidConfiguration)
            << "Invalid number of LAStools cores: " << lasTools.cores
            << ".";
    }

    workRoot = fs::absolute(workRoot);
    catalogRoot = fs::absolute(catalogRoot);
    regionCatalog = resolve(catalogRoot, regionCatalog);

    for (auto region : enumerationValues(Region())) {
        resolve(catalogRoot, source(region));
    }

    loadCredentials(dk, "dk.credentials", vars);
    loadCredentials(srtm, "srtm.credentials", vars);
}

void Config::printConfig(std::ostream &os, const std::string &prefix) const
{
    os << prefix << "workRoot = " << workRoot << "\n"
       << prefix << "runId = " << runId << "\n"
       << prefix << "catalog.root = " << catalogRoot << "\n"
       << prefix << "catalog.regions = " << regionCatalog << "\n"
       << prefix << "intensity = " << std::boolalpha << intensity << "\n"
       << prefix << "lastools.binDir = " << lasTools.binDir << "\n"
       << prefix << "lastools.cores = " << lasTools.cores << "\n"
       << prefix << "fetch.timeout = " << timeout << "\n";
    if (mirror) {
        os << prefix << "fetch.mirror = " << *mirror << "\n";
    }

    for (auto region : enumerationValues(Region())) {
        std::ostringstream name;
        name << prefix << region << ".";
        printSource(os, name.str(), source(region));
    }
}

Credentials loadCredentials(const fs::path &file)
{
    std::ifstream f(file.string());
    if (!f) {
        LOGTHROW(err2, InvalidConfiguration)
            << "Unable to open credentials file " << file << ".";
    }

    Credentials credentials;
    std::string line;
    std::getline(f, line);
    std::istringstream is(line);
    if (!(is >> credentials.user >> credentials.password)) {
        LOGTHROW(err2, InvalidConfiguration)
            << "Credentials file " << file
            << " must contain \"user password\" on its first line.";
    }

    return credentials;
}

} // namespace ancillary
