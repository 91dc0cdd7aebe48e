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

#include <algorithm>
#include <thread>

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"
#include "../support/glob.hpp"
#include "./process.hpp"
#include "./pointcloud.hpp"

namespace fs = boost::filesystem;

namespace ancillary {

namespace {

std::string str(double value)
{
    return boost::lexical_cast<std::string>(value);
}

std::string str(int value)
{
    return boost::lexical_cast<std::string>(value);
}

Paths pointClouds(const fs::path &dir)
{
    auto files(globFiles(dir, ".laz"));
    if (files.empty()) {
        LOGTHROW(err2, NoDataAvailableError)
            << "No point cloud found in " << dir << ".";
    }
    return files;
}

} // namespace

LasTools::Config::Config()
    : cores(std::max(1u, std::thread::hardware_concurrency()))
{}

LasTools::LasTools(const Config &config)
    : config_(config)
{}

void LasTools::run(const std::string &tool
                   , const std::vector<std::string> &args) const
{
    const auto program(config_.binDir.empty()
                       ? tool : (config_.binDir / tool).string());

    const auto code(Process::exec(program, args));
    if (code) {
        LOGTHROW(err2, ExternalToolError)
            << tool << " failed with exit code " << code << ".";
    }
}

void LasTools::index(const fs::path &dir)
{
    LOG(info3) << "Indexing point clouds in " << dir << ".";

    std::vector<std::string> args{ "-i" };
    for (const auto &file : pointClouds(dir)) {
        args.push_back(file.string());
    }

    // leave one core free
    args.push_back("-cores");
    args.push_back(str(std::max(1, config_.cores - 1)));

    run("lasindex", args);
}

fs::path LasTools::intensity(const fs::path &dir
                             , const math::Extents2 &bounds)
{
    const fs::path out(dir.string() + "_toIntensity");
    boost::system::error_code ec;
    fs::create_directories(out, ec);
    if (ec) {
        LOGTHROW(err2, IOError)
            << "Unable to create directory " << out << ": <"
            << ec.message() << ">.";
    }

    LOG(info3) << std::fixed << "Deriving intensity rasters from " << dir
               << " within " << bounds << ".";

    std::vector<std::string> args{ "-i" };
    for (const auto &file : pointClouds(dir)) {
        args.push_back(file.string());
    }

    const std::vector<std::string> options{
        "-kill", "1000"
        , "-buffered", "20"
        , "-step", "0.5"
        , "-otif"
        , "-odir", out.string()
        , "-odix", "_intensity"
        , "-intensity"
        , "-keep_class", "2", "8"
        , "-keep_xy", str(bounds.ll(0)), str(bounds.ll(1))
        , str(bounds.ur(0)), str(bounds.ur(1))
        , "-cores", str(config_.cores)
    };
    args.insert(args.end(), options.begin(), options.end());

    run("blast2dem", args);

    return out;
}

} // namespace ancillary
