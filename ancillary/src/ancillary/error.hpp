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

#ifndef ancillary_error_hpp_included_
#define ancillary_error_hpp_included_

#include <stdexcept>
#include <string>

namespace ancillary {

struct Error : std::runtime_error {
    Error(const std::string &message) : std::runtime_error(message) {}
};

/** Unparseable CRS or geometric operation on footprints in different CRS.
 */
struct CrsResolutionError : Error {
    CrsResolutionError(const std::string &message) : Error(message) {}
};

/** Remote tile catalog cannot be obtained.
 */
struct CatalogUnavailableError : Error {
    CatalogUnavailableError(const std::string &message) : Error(message) {}
};

/** No tile matched or nothing to merge.
 */
struct NoDataAvailableError : Error {
    NoDataAvailableError(const std::string &message) : Error(message) {}
};

struct UnsupportedDataTypeError : Error {
    UnsupportedDataTypeError(const std::string &message) : Error(message) {}
};

struct IOError : Error {
    IOError(const std::string &message) : Error(message) {}
};

struct FormatError : Error {
    FormatError(const std::string &message) : Error(message) {}
};

struct ExternalToolError : Error {
    ExternalToolError(const std::string &message) : Error(message) {}
};

struct InvalidConfiguration : Error {
    InvalidConfiguration(const std::string &message) : Error(message) {}
};

} // namespace ancillary

#endif // ancillary_error_hpp_included_
