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

#ifndef ancillary_srs_hpp_included_
#define ancillary_srs_hpp_included_

#include <string>

#include <boost/optional.hpp>

#include <ogr_spatialref.h>

#include "geo/srsdef.hpp"

namespace ancillary {

/** Parses CRS definition given as "EPSG:nnnn", proj4 string or WKT.
 *
 *  Throws CrsResolutionError if the definition cannot be resolved.
 */
geo::SrsDefinition parseSrs(const std::string &def);

/** CRS given by EPSG code.
 */
geo::SrsDefinition epsg(int code);

/** Builds OGR spatial reference with traditional GIS axis order (x is
 *  easting/longitude).
 *
 *  Throws CrsResolutionError if the definition is not resolvable.
 */
::OGRSpatialReference reference(const geo::SrsDefinition &srs);

/** Captures OGR spatial reference as WKT definition.
 */
geo::SrsDefinition fromReference(const ::OGRSpatialReference &ref);

/** Equal definitions or definitions resolving to the same CRS.
 */
bool sameSrs(const geo::SrsDefinition &a, const geo::SrsDefinition &b);

/** EPSG code of CRS (if it has any).
 */
boost::optional<int> epsgCode(const geo::SrsDefinition &srs);

std::string asWkt(const geo::SrsDefinition &srs);
std::string asProj4(const geo::SrsDefinition &srs);

} // namespace ancillary

#endif // ancillary_srs_hpp_included_
