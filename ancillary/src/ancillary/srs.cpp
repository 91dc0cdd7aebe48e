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

#include <cstdlib>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include <cpl_conv.h>
#include <gdal.h>

#include "dbglog/dbglog.hpp"

#include "./error.hpp"
#include "./srs.hpp"

namespace ba = boost::algorithm;

namespace ancillary {

namespace {

typedef geo::SrsDefinition::Type SrsType;

std::string takeString(char *value)
{
    std::string out(value ? value : "");
    ::CPLFree(value);
    return out;
}

} // namespace

geo::SrsDefinition epsg(int code)
{
    return geo::SrsDefinition(boost::lexical_cast<std::string>(code)
                              , SrsType::epsg);
}

geo::SrsDefinition parseSrs(const std::string &def)
{
    const auto d(ba::trim_copy(def));

    geo::SrsDefinition srs;
    if (ba::istarts_with(d, "epsg:")) {
        const auto code(d.substr(5));
        try {
            srs = epsg(boost::lexical_cast<int>(code));
        } catch (const boost::bad_lexical_cast&) {
            LOGTHROW(err2, CrsResolutionError)
                << "Invalid EPSG code in CRS definition <" << def << ">.";
        }
    } else if (ba::starts_with(d, "+")) {
        srs = geo::SrsDefinition(d, SrsType::proj4);
    } else {
        srs = geo::SrsDefinition(d, SrsType::wkt);
    }

    // validate
    reference(srs);
    return srs;
}

::OGRSpatialReference reference(const geo::SrsDefinition &srs)
{
    ::OGRSpatialReference ref;

    OGRErr err(OGRERR_NONE);
    switch (srs.type) {
    case SrsType::epsg: {
        char *end(nullptr);
        const auto code(std::strtol(srs.srs.c_str(), &end, 10));
        if (srs.srs.empty() || *end) {
            err = OGRERR_CORRUPT_DATA;
        } else {
            err = ref.importFromEPSG(int(code));
        }
        break;
    }

    case SrsType::proj4:
        err = ref.importFromProj4(srs.srs.c_str());
        break;

    case SrsType::wkt: {
#if GDAL_VERSION_NUM >= 2030000
        err = ref.importFromWkt(srs.srs.c_str());
#else
        std::vector<char> buf(srs.srs.begin(), srs.srs.end());
        buf.push_back('\0');
        char *data(buf.data());
        err = ref.importFromWkt(&data);
#endif
        break;
    }

    default:
        err = OGRERR_UNSUPPORTED_SRS;
        break;
    }

    if (err != OGRERR_NONE) {
        LOGTHROW(err2, CrsResolutionError)
            << "Unable to resolve CRS <" << srs.srs << "> (OGR error "
            << err << ").";
    }

#if GDAL_VERSION_NUM >= 3000000
    ref.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
#endif

    return ref;
}

geo::SrsDefinition fromReference(const ::OGRSpatialReference &ref)
{
    char *wkt(nullptr);
    if (ref.exportToWkt(&wkt) != OGRERR_NONE) {
        ::CPLFree(wkt);
        LOGTHROW(err2, CrsResolutionError)
            << "Unable to export spatial reference as WKT.";
    }
    return geo::SrsDefinition(takeString(wkt), SrsType::wkt);
}

bool sameSrs(const geo::SrsDefinition &a, const geo::SrsDefinition &b)
{
    if ((a.type == b.type) && (a.srs == b.srs)) { return true; }

    const auto ra(reference(a));
    const auto rb(reference(b));
    return ra.IsSame(&rb);
}

boost::optional<int> epsgCode(const geo::SrsDefinition &srs)
{
    if (srs.type == SrsType::epsg) {
        return boost::lexical_cast<int>(srs.srs);
    }

    auto ref(reference(srs));
    // identification failure is not an error, CRS just stays anonymous
    ref.AutoIdentifyEPSG();

    const char *authority(ref.GetAuthorityName(nullptr));
    const char *code(ref.GetAuthorityCode(nullptr));
    if (!authority || !code || !ba::iequals(authority, "EPSG")) {
        return boost::none;
    }

    try {
        return boost::lexical_cast<int>(code);
    } catch (const boost::bad_lexical_cast&) {
        return boost::none;
    }
}

std::string asWkt(const geo::SrsDefinition &srs)
{
    if (srs.type == SrsType::wkt) { return srs.srs; }
    return fromReference(reference(srs)).srs;
}

std::string asProj4(const geo::SrsDefinition &srs)
{
    if (srs.type == SrsType::proj4) { return srs.srs; }

    const auto ref(reference(srs));
    char *proj(nullptr);
    if (ref.exportToProj4(&proj) != OGRERR_NONE) {
        ::CPLFree(proj);
        LOGTHROW(err2, CrsResolutionError)
            << "Unable to export CRS <" << srs.srs << "> as proj4.";
    }
    return ba::trim_copy(takeString(proj));
}

} // namespace ancillary
