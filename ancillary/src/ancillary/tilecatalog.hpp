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

#ifndef ancillary_tilecatalog_hpp_included_
#define ancillary_tilecatalog_hpp_included_

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "utility/enum-io.hpp"

#include "geo/srsdef.hpp"

#include "./footprint.hpp"
#include "./gdalsupport/fetch.hpp"

namespace ancillary {

/** One fishnet cell.
 */
struct TileRecord {
    typedef std::map<std::string, std::string> Attributes;
    typedef std::vector<TileRecord> list;

    std::string id;
    Footprint footprint;
    Attributes attributes;

    TileRecord(const std::string &id, const Footprint &footprint
               , const Attributes &attributes = Attributes())
        : id(id), footprint(footprint), attributes(attributes) {}

    /** Attribute value; throws FormatError when missing.
     */
    const std::string& attribute(const std::string &name) const;
};

/** Read-only tile catalog, records are kept in dataset order.
 */
struct TileCatalog {
    geo::SrsDefinition srs;
    TileRecord::list records;

    TileCatalog(const geo::SrsDefinition &srs) : srs(srs) {}
};

/** Where the catalog lives.
 */
struct CatalogLocation {
    /** Remote dataset URL, optional.
     */
    std::string remote;

    /** Local copy shipped with the tool, used when remote fetch fails.
     */
    boost::filesystem::path bundled;

    /** Member inside a zipped remote dataset.
     */
    std::string member;

    /** Extra transport options (e.g. credentials).
     */
    std::vector<std::string> options;

    /** CRS to assume when dataset carries none.
     */
    boost::optional<geo::SrsDefinition> srs;

    CatalogLocation() = default;
    CatalogLocation(const std::string &remote
                    , const boost::filesystem::path &bundled
                    , const std::string &member = std::string())
        : remote(remote), bundled(bundled), member(member) {}
};

/** Loads catalog from vector dataset. Identifier is taken from idField.
 *
 *  Throws IOError/FormatError on unreadable dataset, CrsResolutionError
 *  when CRS is unknown.
 */
TileCatalog loadCatalog(const boost::filesystem::path &path
                        , const std::string &idField
                        , const boost::optional<geo::SrsDefinition> &srs
                        = boost::none);

/** Loads catalog from remote location, falls back to bundled copy with a
 *  warning when remote is unavailable.
 */
TileCatalog loadCatalog(const CatalogLocation &location
                        , const std::string &idField
                        , Fetcher &fetcher
                        , const boost::filesystem::path &workdir);

UTILITY_GENERATE_ENUM(Predicate,
    ((intersects))
    ((within))
)

/** Synthesizes neighbouring grid cells of every matched tile: right,
 *  above and above-right, in this order. Grid position is derived from
 *  the lower-left corner attributes divided by cell size.
 */
struct GridNeighbours {
    typedef std::function<std::string(long x, long y)> Namer;

    std::string leftField;
    std::string bottomField;
    double cellSize;

    /** Attribute the synthesized name is stored to (besides id).
     */
    std::string nameField;
    Namer namer;

    GridNeighbours() : cellSize(1000.0) {}
};

struct MatchOptions {
    Predicate predicate;
    boost::optional<GridNeighbours> neighbours;

    MatchOptions(Predicate predicate = Predicate::intersects)
        : predicate(predicate) {}
};

/** Tiles matching the envelope of the AOI reprojected into catalog CRS.
 *  Catalog order and duplicates are preserved; result may be empty.
 */
TileRecord::list match(const AreaOfInterest &aoi
                       , const TileCatalog &catalog
                       , const MatchOptions &options = MatchOptions());

/** Identifiers of given tiles.
 */
std::vector<std::string> ids(const TileRecord::list &tiles);

} // namespace ancillary

#endif // ancillary_tilecatalog_hpp_included_
