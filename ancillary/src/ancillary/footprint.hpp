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

#ifndef ancillary_footprint_hpp_included_
#define ancillary_footprint_hpp_included_

#include <iosfwd>
#include <memory>
#include <string>

#include "math/geometry_core.hpp"

#include "geo/srsdef.hpp"

#include "./gdalsupport/ogrsupport.hpp"

namespace ancillary {

/** Planar polygon with its CRS. Immutable; reprojection and envelope yield
 *  new footprints.
 */
class Footprint {
public:
    typedef std::shared_ptr<const ::OGRGeometry> Shape;

    Footprint(const Shape &shape, const geo::SrsDefinition &srs);

    /** Axis-aligned rectangle.
     */
    static Footprint fromExtents(const math::Extents2 &extents
                                 , const geo::SrsDefinition &srs);

    /** Polygon from WKT. Throws FormatError on invalid WKT or when the
     *  geometry is not polygonal.
     */
    static Footprint fromWkt(const std::string &wkt
                             , const geo::SrsDefinition &srs);

    const ::OGRGeometry& shape() const { return *shape_; }
    const Shape& shapePtr() const { return shape_; }
    const geo::SrsDefinition& srs() const { return srs_; }

    /** Bounding rectangle of the shape.
     */
    math::Extents2 extents() const;

    /** Footprint of the bounding rectangle in the same CRS.
     */
    Footprint envelope() const;

    /** Both predicates require both footprints in the same CRS, otherwise
     *  CrsResolutionError is thrown.
     */
    bool intersects(const Footprint &other) const;

    /** This footprint lies inside the other one.
     */
    bool within(const Footprint &other) const;

    std::string wkt() const;

private:
    void checkSrs(const Footprint &other, const char *op) const;

    Shape shape_;
    geo::SrsDefinition srs_;
};

/** Area of interest, built once per run from caller input.
 */
typedef Footprint AreaOfInterest;

/** Reprojects footprint into given CRS. Geometry of footprint already in
 *  that CRS is returned unchanged (labeled with the target definition).
 *
 *  Throws CrsResolutionError on unresolvable CRS or failed transformation.
 */
Footprint reproject(const Footprint &footprint
                    , const geo::SrsDefinition &srs);

math::Extents2 extents(const ::OGRGeometry &geometry);

std::ostream& operator<<(std::ostream &os, const Footprint &footprint);

} // namespace ancillary

#endif // ancillary_footprint_hpp_included_
