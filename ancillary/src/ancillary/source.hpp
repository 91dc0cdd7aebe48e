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

#ifndef ancillary_source_hpp_included_
#define ancillary_source_hpp_included_

#include <memory>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "geo/srsdef.hpp"

#include "./types.hpp"
#include "./footprint.hpp"
#include "./tilecatalog.hpp"
#include "./config.hpp"
#include "./gdalsupport/fetch.hpp"
#include "./pointcloud/pointcloud.hpp"

namespace ancillary {

struct AcquisitionRequest {
    DataType type;
    AreaOfInterest aoi;
    TileRecord::list tiles;
    boost::filesystem::path workdir;

    AcquisitionRequest(DataType type, const AreaOfInterest &aoi
                       , const TileRecord::list &tiles
                       , const boost::filesystem::path &workdir)
        : type(type), aoi(aoi), tiles(tiles), workdir(workdir)
    {}
};

struct AcquiredTiles {
    /** Acquired tiles (GeoTIFF for DTM, LAZ for point clouds).
     */
    Paths tiles;

    /** Directory the tiles live in.
     */
    boost::filesystem::path dir;

    StatusLines status;
};

/** Collaborators shared by all sources.
 */
struct Services {
    Fetcher::pointer fetcher;
    PointCloudProcessor::pointer pointCloud;

    Services() = default;
    Services(const Fetcher::pointer &fetcher
             , const PointCloudProcessor::pointer &pointCloud)
        : fetcher(fetcher), pointCloud(pointCloud) {}
};

/** Regional elevation data source.
 *
 *  Knows its tile catalogs and how to turn matched tiles into local
 *  GeoTIFF (DTM) or LAZ (point cloud) files.
 */
class Source : boost::noncopyable {
public:
    typedef std::shared_ptr<Source> pointer;

    struct Properties {
        std::vector<DataType> types;

        /** DTM tiles have nodata holes to be interpolated.
         */
        bool fillNodata;

        /** CRS of point clouds and rasters derived from them.
         */
        boost::optional<geo::SrsDefinition> pointCloudSrs;

        /** Intensity rasters come out without CRS.
         */
        bool assignIntensitySrs;

        Properties(DataType type = DataType::dtm)
            : types{type}, fillNodata(false), assignIntensitySrs(false)
        {}

        Properties& support(DataType type) {
            types.push_back(type); return *this;
        }
    };

    virtual ~Source() {}

    static pointer create(Region region, const Config &config
                          , const Services &services);

    Region region() const { return region_; }
    const Properties& properties() const { return properties_; }

    bool supports(DataType type) const;

    /** Loads catalog for given product and matches AOI against it.
     *  Throws UnsupportedDataTypeError.
     */
    TileRecord::list tiles(DataType type, const AreaOfInterest &aoi
                           , const boost::filesystem::path &workdir) const;

    /** Fetches matched tiles into <workdir>/<type>. Failure of single tile
     *  is a warning recorded in the result status.
     *
     *  Throws UnsupportedDataTypeError.
     */
    AcquiredTiles acquire(const AcquisitionRequest &request) const;

protected:
    Source(Region region, const SourceConfig &config
           , const Services &services, const Properties &properties);

    const SourceConfig& config() const { return config_; }
    Fetcher& fetcher() const { return *services_.fetcher; }

    /** Fetches given URL into directory under the URL's file name.
     */
    boost::filesystem::path
    download(const Request &request, const boost::filesystem::path &dir)
        const;

    /** Fetches given URL into given file.
     */
    void downloadAs(const Request &request
                    , const boost::filesystem::path &dst) const;

    /** Removes downloaded archive; failure is only logged.
     */
    static void discard(const boost::filesystem::path &path);

private:
    void checkType(DataType type) const;

    virtual std::string idField_impl(DataType type) const = 0;

    virtual MatchOptions matchOptions_impl(DataType type) const;

    /** Fetches single tile into given directory.
     */
    virtual void fetchTile_impl(const AcquisitionRequest &request
                                , const TileRecord &tile
                                , const boost::filesystem::path &dir)
        const = 0;

    /** Post-processes all fetched tiles (format conversion).
     */
    virtual void finish_impl(const AcquisitionRequest &request
                             , const boost::filesystem::path &dir
                             , StatusLines &status) const;

    /** Prepares per-acquisition state (e.g. session login).
     */
    virtual void begin_impl(const AcquisitionRequest &request
                            , const boost::filesystem::path &dir) const;

    Region region_;
    SourceConfig config_;
    Services services_;
    Properties properties_;
};

} // namespace ancillary

#endif // ancillary_source_hpp_included_
