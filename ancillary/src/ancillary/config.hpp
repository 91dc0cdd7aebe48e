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

#ifndef ancillary_config_hpp_included_
#define ancillary_config_hpp_included_

#include <iosfwd>
#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/program_options.hpp>

#include "./types.hpp"
#include "./tilecatalog.hpp"
#include "./gdalsupport/fetch.hpp"
#include "./pointcloud/pointcloud.hpp"

namespace ancillary {

/** Per-region source configuration.
 */
struct SourceConfig {
    /** DTM tile catalog.
     */
    CatalogLocation catalog;

    /** Point-cloud tile catalog; when unset the DTM catalog is used.
     */
    boost::optional<CatalogLocation> pointCloudCatalog;

    /** Base URLs of tile products.
     */
    std::string dtmUrl;
    std::string lazUrl;

    boost::optional<Credentials> credentials;

    /** File with "user password" line, loaded into credentials.
     */
    boost::filesystem::path credentialsFile;

    /** Local repository of already converted DTM tiles (optional).
     */
    boost::filesystem::path localRepository;

    const CatalogLocation& catalogFor(DataType type) const;
};

struct Config {
    /** Root of per-run working directories.
     */
    boost::filesystem::path workRoot;

    /** Caller-supplied run identifier.
     */
    std::string runId;

    /** Root of bundled catalog copies.
     */
    boost::filesystem::path catalogRoot;

    /** Region coverage catalog; relative to catalogRoot unless absolute.
     */
    boost::filesystem::path regionCatalog;

    /** Derive intensity raster from point clouds where possible.
     */
    bool intensity;

    LasTools::Config lasTools;

    /** Fetch everything from local directory instead of network.
     */
    boost::optional<boost::filesystem::path> mirror;

    /** Network timeout in seconds, 0 = none.
     */
    int timeout;

    SourceConfig nl;
    SourceConfig dk;
    SourceConfig si;
    SourceConfig deNrw;
    SourceConfig mx;
    SourceConfig srtm;

    /** Fills in defaults of all sources.
     */
    Config();

    const SourceConfig& source(Region region) const;
    SourceConfig& source(Region region);

    void configuration(boost::program_options::options_description &od);

    /** Resolves relative paths and loads credentials files. Throws
     *  InvalidConfiguration.
     */
    void configure(const boost::program_options::variables_map &vars);

    void printConfig(std::ostream &os, const std::string &prefix) const;
};

/** Reads "user password" from the first line of given file. Throws
 *  InvalidConfiguration.
 */
Credentials loadCredentials(const boost::filesystem::path &file);

} // namespace ancillary

#endif // ancillary_config_hpp_included_
