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

#ifndef ancillary_gdalsupport_ogrsupport_hpp_included_
#define ancillary_gdalsupport_ogrsupport_hpp_included_

#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include <ogr_api.h>
#include <ogrsf_frmts.h>

namespace ancillary { namespace ogr {

typedef std::shared_ptr< ::GDALDataset> VectorDataset;
typedef std::shared_ptr< ::OGRFeature> Feature;
typedef std::shared_ptr< ::OGRGeometry> Geometry;
typedef std::vector<Geometry> Geometries;

/** Opens vector dataset read-only. Path can point into GDAL virtual
 *  filesystem (e.g. /vsizip/).
 *
 *  Throws IOError when dataset cannot be opened.
 */
VectorDataset openVectorDataset(const boost::filesystem::path &path);

/** Returns the only layer of the dataset or the one named by layer.
 */
::OGRLayer* layer(const VectorDataset &ds, const std::string &name
                  = std::string());

Feature feature(::OGRFeature *f);
Geometry geometry(::OGRGeometry *g, bool clone = false);

} } // namespace ancillary::ogr

#endif // ancillary_gdalsupport_ogrsupport_hpp_included_
