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

#include "dbglog/dbglog.hpp"

#include "../error.hpp"

#include "./ogrsupport.hpp"

namespace ancillary { namespace ogr {

VectorDataset openVectorDataset(const boost::filesystem::path &path)
{
    auto ds(::GDALOpenEx(path.c_str(), (GDAL_OF_VECTOR | GDAL_OF_READONLY)
                         , nullptr, nullptr, nullptr));

    if (!ds) {
        LOGTHROW(err2, IOError)
            << "Failed to open vector dataset " << path << ".";
    }

    return VectorDataset(static_cast< ::GDALDataset*>(ds)
                         , [](::GDALDataset *ds) { ::GDALClose(ds); });
}

::OGRLayer* layer(const VectorDataset &ds, const std::string &name)
{
    if (!ds->GetLayerCount()) {
        LOGTHROW(err2, FormatError)
            << "Dataset <" << ds->GetDescription() << "> has no layer.";
    }

    auto l(name.empty() ? ds->GetLayer(0)
           : ds->GetLayerByName(name.c_str()));

    if (!l) {
        LOGTHROW(err2, FormatError)
            << "Cannot get layer <" << name << "> from dataset <"
            << ds->GetDescription() << ">.";
    }
    return l;
}

Feature feature(::OGRFeature *f)
{
    return Feature(f, [](::OGRFeature *f)
                   { if (f) ::OGRFeature::DestroyFeature(f); });
}

Geometry geometry(::OGRGeometry *g, bool clone)
{
    if (!g) { return {}; }
    if (clone) { g = g->clone(); }
    return Geometry(g, [](::OGRGeometry *g)
                    { if (g) OGRGeometryFactory::destroyGeometry(g); });
}

} } // namespace ancillary::ogr
