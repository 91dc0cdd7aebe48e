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

#ifndef ancillary_types_hpp_included_
#define ancillary_types_hpp_included_

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "utility/enum-io.hpp"

namespace ancillary {

/** Backing data source. SRTM is the global fallback.
 */
UTILITY_GENERATE_ENUM_CI(Region,
    ((nl)("NL"))
    ((dk)("DK"))
    ((si)("SI"))
    ((deNrw)("DE_NRW"))
    ((mx)("MX"))
    ((srtm)("SRTM"))
)

/** Acquired product: terrain model raster or point cloud.
 */
UTILITY_GENERATE_ENUM_CI(DataType,
    ((dtm)("DTM"))
    ((laz)("LAZ"))
)

constexpr Region FallbackRegion = Region::srtm;

typedef std::vector<boost::filesystem::path> Paths;
typedef std::vector<std::string> StatusLines;

} // namespace ancillary

#endif // ancillary_types_hpp_included_
