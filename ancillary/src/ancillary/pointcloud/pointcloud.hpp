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

#ifndef ancillary_pointcloud_pointcloud_hpp_included_
#define ancillary_pointcloud_pointcloud_hpp_included_

#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "math/geometry_core.hpp"

namespace ancillary {

/** Point-cloud processing toolchain.
 */
class PointCloudProcessor {
public:
    typedef std::shared_ptr<PointCloudProcessor> pointer;

    virtual ~PointCloudProcessor() {}

    /** Builds spatial index of all point clouds in directory.
     */
    virtual void index(const boost::filesystem::path &dir) = 0;

    /** Derives intensity rasters (ground and water returns) of all point
     *  clouds in directory, restricted to given bounds (point-cloud CRS).
     *
     *  Returns directory containing the rasters.
     */
    virtual boost::filesystem::path
    intensity(const boost::filesystem::path &dir
              , const math::Extents2 &bounds) = 0;
};

/** LAStools (lasindex, blast2dem) run as child processes.
 */
class LasTools : public PointCloudProcessor {
public:
    struct Config {
        /** Directory with binaries, empty to use PATH.
         */
        boost::filesystem::path binDir;

        int cores;

        Config();
    };

    LasTools(const Config &config);

    void index(const boost::filesystem::path &dir) override;

    boost::filesystem::path intensity(const boost::filesystem::path &dir
                                      , const math::Extents2 &bounds)
        override;

private:
    void run(const std::string &tool, const std::vector<std::string> &args)
        const;

    Config config_;
};

} // namespace ancillary

#endif // ancillary_pointcloud_pointcloud_hpp_included_
