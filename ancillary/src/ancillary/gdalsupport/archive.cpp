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

#include <boost/filesystem.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <cpl_conv.h>
#include <cpl_string.h>
#include <cpl_vsi.h>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"
#include "./archive.hpp"

namespace fs = boost::filesystem;
namespace ba = boost::algorithm;

namespace ancillary {

namespace {

std::string vsiZip(const fs::path &archive)
{
    return "/vsizip/" + fs::absolute(archive).string();
}

void copy(const std::string &src, const fs::path &dst)
{
    if (::CPLCopyFile(dst.c_str(), src.c_str())) {
        LOGTHROW(err2, IOError)
            << "Unable to extract <" << src << "> to " << dst << ".";
    }
}

} // namespace

std::vector<std::string> zipMembers(const fs::path &archive)
{
    auto list(::VSIReadDirRecursive(vsiZip(archive).c_str()));
    if (!list) {
        LOGTHROW(err2, IOError)
            << "Unable to read zip archive " << archive << ".";
    }

    std::vector<std::string> members;
    for (auto i(list); *i; ++i) {
        std::string member(*i);
        if (ba::ends_with(member, "/")) { continue; }
        members.push_back(member);
    }
    ::CSLDestroy(list);

    return members;
}

MemberFilter extensionFilter(const std::string &extension)
{
    return [extension](const std::string &member) {
        return ba::iends_with(member, extension);
    };
}

Paths extractZip(const fs::path &archive, const fs::path &dir
                 , const MemberFilter &filter)
{
    const auto root(vsiZip(archive));

    Paths extracted;
    for (const auto &member : zipMembers(archive)) {
        if (filter && !filter(member)) { continue; }

        const auto dst(dir / fs::path(member).filename());
        copy(root + "/" + member, dst);
        extracted.push_back(dst);
    }

    LOG(info1) << "Extracted " << extracted.size() << " files from "
               << archive << ".";
    return extracted;
}

void gunzip(const fs::path &archive, const fs::path &dst)
{
    copy("/vsigzip/" + fs::absolute(archive).string(), dst);
}

} // namespace ancillary
