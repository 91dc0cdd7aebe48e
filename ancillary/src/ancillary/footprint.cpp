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

#include <memory>
#include <ostream>
#include <vector>

#include <cpl_conv.h>
#include <gdal.h>
#include <ogr_geometry.h>

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./srs.hpp"
#include "./footprint.hpp"

namespace ancillary {

namespace {

inline ::OGRRawPoint rawPoint(double x, double y)
{
    ::OGRRawPoint p;
    p.x = x;
    p.y = y;
    return p;
}

ogr::Geometry rectangle(const math::Extents2 &extents)
{
    ::OGRRawPoint points[5] = {
        rawPoint(extents.ll(0), extents.ll(1))
        , rawPoint(extents.ll(0), extents.ur(1))
        , rawPoint(extents.ur(0), extents.ur(1))
        , rawPoint(extents.ur(0), extents.ll(1))
        , rawPoint(extents.ll(0), extents.ll(1))
    };

    std::unique_ptr< ::OGRLinearRing> ring(new ::OGRLinearRing());
    ring->setPoints(5, points);

    std::unique_ptr< ::OGRPolygon> polygon(new ::OGRPolygon());
    polygon->addRingDirectly(ring.release());
    return ogr::geometry(polygon.release());
}

bool polygonal(const ::OGRGeometry &g)
{
    switch (wkbFlatten(g.getGeometryType())) {
    case wkbPolygon: case wkbMultiPolygon: return true;
    default: return false;
    }
}

} // namespace

Footprint::Footprint(const Shape &shape
                     , const geo::SrsDefinition &srs)
    : shape_(shape), srs_(srs)
{
    if (!shape_) {
        LOGTHROW(err2, FormatError) << "Footprint without geometry.";
    }
}

Footprint Footprint::fromExtents(const math::Extents2 &extents
                                 , const geo::SrsDefinition &srs)
{
    if (!math::valid(extents) || (extents.ll(0) >= extents.ur(0))
        || (extents.ll(1) >= extents.ur(1)))
    {
        LOGTHROW(err2, FormatError)
            << std::fixed << "Degenerate extents " << extents << ".";
    }

    return Footprint(rectangle(extents), srs);
}

Footprint Footprint::fromWkt(const std::string &wkt
                             , const geo::SrsDefinition &srs)
{
    ::OGRGeometry *g(nullptr);
#if GDAL_VERSION_NUM >= 2030000
    const auto err(::OGRGeometryFactory::createFromWkt
                   (wkt.c_str(), nullptr, &g));
#else
    std::vector<char> buf(wkt.begin(), wkt.end());
    buf.push_back('\0');
    char *data(buf.data());
    const auto err(::OGRGeometryFactory::createFromWkt(&data, nullptr, &g));
#endif

    auto geometry(ogr::geometry(g));
    if ((err != OGRERR_NONE) || !geometry) {
        LOGTHROW(err2, FormatError)
            << "Unable to parse geometry from WKT <" << wkt << ">.";
    }

    if (!polygonal(*geometry)) {
        LOGTHROW(err2, FormatError)
            << "Geometry <" << wkt << "> is not a polygon.";
    }

    return Footprint(geometry, srs);
}

math::Extents2 extents(const ::OGRGeometry &geometry)
{
    ::OGREnvelope e;
    geometry.getEnvelope(&e);
    return math::Extents2(e.MinX, e.MinY, e.MaxX, e.MaxY);
}

math::Extents2 Footprint::extents() const
{
    return ancillary::extents(*shape_);
}

Footprint Footprint::envelope() const
{
    return Footprint(rectangle(extents()), srs_);
}

void Footprint::checkSrs(const Footprint &other, const char *op) const
{
    if (!sameSrs(srs_, other.srs_)) {
        LOGTHROW(err2, CrsResolutionError)
            << "Cannot evaluate <" << op << "> on footprints in different "
            "CRS (<" << srs_.srs << "> vs <" << other.srs_.srs << ">).";
    }
}

bool Footprint::intersects(const Footprint &other) const
{
    checkSrs(other, "intersects");
    return shape_->Intersects(other.shape_.get());
}

bool Footprint::within(const Footprint &other) const
{
    checkSrs(other, "within");
    return shape_->Within(other.shape_.get());
}

std::string Footprint::wkt() const
{
    char *out(nullptr);
    shape_->exportToWkt(&out);
    std::string wkt(out ? out : "");
    ::CPLFree(out);
    return wkt;
}

Footprint reproject(const Footprint &footprint
                    , const geo::SrsDefinition &srs)
{
    if (sameSrs(footprint.srs(), srs)) {
        return Footprint(footprint.shapePtr(), srs);
    }

    auto src(reference(footprint.srs()));
    auto dst(reference(srs));

    std::unique_ptr< ::OGRCoordinateTransformation
                     , void(*)(::OGRCoordinateTransformation*)>
        ct(::OGRCreateCoordinateTransformation(&src, &dst)
           , &::OGRCoordinateTransformation::DestroyCT);
    if (!ct) {
        LOGTHROW(err2, CrsResolutionError)
            << "No transformation from <" << footprint.srs().srs
            << "> to <" << srs.srs << ">.";
    }

    auto shape(ogr::geometry(footprint.shape().clone()));
    if (shape->transform(ct.get()) != OGRERR_NONE) {
        LOGTHROW(err2, CrsResolutionError)
            << "Failed to transform footprint from <" << footprint.srs().srs
            << "> to <" << srs.srs << ">.";
    }

    return Footprint(shape, srs);
}

std::ostream& operator<<(std::ostream &os, const Footprint &footprint)
{
    return os << footprint.wkt() << " [" << footprint.srs().srs << "]";
}

} // namespace ancillary
