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

#ifndef ancillary_source_sources_hpp_included_
#define ancillary_source_sources_hpp_included_

#include "../source.hpp"

namespace ancillary { namespace source {

// Netherlands, AHN3
Source::pointer netherlands(const SourceConfig &config
                            , const Services &services);

// Denmark, DHM 2014
Source::pointer denmark(const SourceConfig &config
                        , const Services &services);

// Slovenia, ARSO lidar
Source::pointer slovenia(const SourceConfig &config
                         , const Services &services);

// Germany, North Rhine-Westphalia open geodata
Source::pointer northRhineWestphalia(const SourceConfig &config
                                     , const Services &services);

// Mexico, INEGI lidar terrain
Source::pointer mexico(const SourceConfig &config
                       , const Services &services);

// global SRTM 1 arc-second fallback
Source::pointer srtm(const SourceConfig &config
                     , const Services &services);

} } // namespace ancillary::source

#endif // ancillary_source_sources_hpp_included_
