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

#ifndef ancillary_pipeline_hpp_included_
#define ancillary_pipeline_hpp_included_

#include <boost/optional.hpp>

#include "utility/enum-io.hpp"

#include "./config.hpp"
#include "./source.hpp"
#include "./output.hpp"
#include "./footprint.hpp"

namespace ancillary {

class WorkDir;

UTILITY_GENERATE_ENUM(Stage,
    ((idle))
    ((selectSource))
    ((acquirePrimary))
    ((fillNodata))
    ((mosaicPrimary))
    ((acquireSecondary))
    ((index))
    ((deriveSecondary))
    ((mosaicSecondary))
    ((assembleOutput))
    ((cleanup))
)

/** Ancillary elevation data acquisition for one AOI.
 *
 *  Selects the regional source covering the AOI, builds the DTM mosaic and,
 *  when the source provides point clouds, the intensity mosaic. Working
 *  directory <workRoot>/<runId>_anc_temp is removed on every exit path.
 *
 *  Failure of the intensity product is logged and leaves it absent;
 *  CrsResolutionError is always fatal.
 */
class Pipeline {
public:
    Pipeline(const Config &config, const Services &services);

    /** Runs whole pipeline.
     */
    Output run(const AreaOfInterest &aoi);

    /** Last entered stage.
     */
    Stage stage() const { return stage_; }

    /** Creates default services for given configuration: network or mirror
     *  fetcher and LAStools.
     */
    static Services services(const Config &config);

private:
    void enter(Stage stage);

    Region select(const AreaOfInterest &aoi);

    RasterMosaic primary(const Source &source, const AreaOfInterest &aoi
                         , const WorkDir &workdir, StatusLines &status);

    RasterMosaic secondary(const Source &source, const AreaOfInterest &aoi
                           , const WorkDir &workdir, StatusLines &status);

    const Config &config_;
    Services services_;
    Stage stage_;
};

} // namespace ancillary

#endif // ancillary_pipeline_hpp_included_
