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

#ifndef ancillary_gdalsupport_archive_hpp_included_
#define ancillary_gdalsupport_archive_hpp_included_

#include <functional>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "../types.hpp"

namespace ancillary {

/** File members of zip archive (directories excluded), relative paths.
 */
std::vector<std::string> zipMembers(const boost::filesystem::path &archive);

typedef std::function<bool(const std::string &member)> MemberFilter;

/** Accepts members with given extension (case insensitive).
 */
MemberFilter extensionFilter(const std::string &extension);

/** Extracts file members accepted by filter (all if no filter) into
 *  directory. Archive structure is flattened.
 *
 *  Returns paths to extracted files. Throws IOError.
 */
Paths extractZip(const boost::filesystem::path &archive
                 , const boost::filesystem::path &dir
                 , const MemberFilter &filter = MemberFilter());

/** Decompresses gzip file. Throws IOError.
 */
void gunzip(const boost::filesystem::path &archive
            , const boost::filesystem::path &dst);

} // namespace ancillary

#endif // ancillary_gdalsupport_archive_hpp_included_
