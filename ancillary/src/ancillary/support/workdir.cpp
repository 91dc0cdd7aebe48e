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

#include "dbglog/dbglog.hpp"

#include "../error.hpp"
#include "./workdir.hpp"

namespace fs = boost::filesystem;

namespace ancillary {

namespace {

void createDirectories(const fs::path &path)
{
    boost::system::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        LOGTHROW(err2, IOError)
            << "Unable to create directory " << path << ": <"
            << ec.message() << ">.";
    }
}

} // namespace

std::string WorkDir::dirname(const std::string &runId)
{
    return runId + "_anc_temp";
}

WorkDir::WorkDir(const fs::path &root, const std::string &runId)
    : path_(fs::absolute(root / dirname(runId)))
{
    if (runId.empty()) {
        LOGTHROW(err2, InvalidConfiguration) << "Empty run identifier.";
    }

    createDirectories(path_);
    LOG(info2) << "Using working directory " << path_ << ".";
}

WorkDir::~WorkDir()
{
    boost::system::error_code ec;
    try {
        fs::remove_all(path_, ec);
    } catch (const std::exception &e) {
        LOG(warn3) << "Unable to remove working directory " << path_
                   << ": <" << e.what() << ">.";
        return;
    }

    if (ec) {
        LOG(warn3) << "Unable to remove working directory " << path_
                   << ": <" << ec.message() << ">.";
    } else {
        LOG(info2) << "Removed working directory " << path_ << ".";
    }
}

} // namespace ancillary
