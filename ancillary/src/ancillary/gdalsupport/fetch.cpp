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

#include <fstream>
#include <iterator>

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

#include <cpl_http.h>
#include <cpl_string.h>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"
#include "./fetch.hpp"

namespace fs = boost::filesystem;

namespace ancillary {

namespace {

struct HttpResult {
    HttpResult(::CPLHTTPResult *result) : result(result) {}
    ~HttpResult() { if (result) { ::CPLHTTPDestroyResult(result); } }

    HttpResult(const HttpResult&) = delete;
    HttpResult& operator=(const HttpResult&) = delete;

    ::CPLHTTPResult *result;
};

struct StringList {
    StringList() : list() {}
    ~StringList() { ::CSLDestroy(list); }

    StringList(const StringList&) = delete;
    StringList& operator=(const StringList&) = delete;

    void add(const std::string &value) {
        list = ::CSLAddString(list, value.c_str());
    }

    char **list;
};

void write(const fs::path &dst, const std::string &content)
{
    std::ofstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);
    try {
        f.open(dst.string(), std::ios_base::out | std::ios_base::trunc
               | std::ios_base::binary);
        f.write(content.data(), content.size());
        f.close();
    } catch (const std::exception &e) {
        LOGTHROW(err2, IOError)
            << "Unable to write " << dst << ": <" << e.what() << ">.";
    }
}

} // namespace

std::string authOption(const Credentials &credentials)
{
    return "USERPWD=" + credentials.user + ":" + credentials.password;
}

std::string urlFilename(const std::string &url)
{
    // strip query and trailing slashes
    auto path(url.substr(0, url.find('?')));
    while (!path.empty() && (path.back() == '/')) { path.pop_back(); }

    const auto slash(path.rfind('/'));
    return ((slash == std::string::npos) ? path : path.substr(slash + 1));
}

HttpFetcher::HttpFetcher(const boost::optional<Credentials> &credentials
                         , int timeout)
    : credentials_(credentials), timeout_(timeout)
{}

std::string HttpFetcher::fetchContent(const Request &request) const
{
    StringList options;
    if (credentials_ && credentials_->valid()) {
        options.add(authOption(*credentials_));
    }
    if (timeout_ > 0) {
        options.add("TIMEOUT=" + boost::lexical_cast<std::string>(timeout_));
    }
    for (const auto &option : request.options) { options.add(option); }

    LOG(info1) << "Fetching <" << request.url << ">.";

    HttpResult r(::CPLHTTPFetch(request.url.c_str(), options.list));
    if (!r.result) {
        LOGTHROW(err2, IOError)
            << "Unable to fetch <" << request.url << ">.";
    }

    if (r.result->nStatus || r.result->pszErrBuf) {
        LOGTHROW(err2, IOError)
            << "Unable to fetch <" << request.url << ">: <"
            << (r.result->pszErrBuf ? r.result->pszErrBuf : "unknown error")
            << "> (status " << r.result->nStatus << ").";
    }

    return std::string(reinterpret_cast<const char*>(r.result->pabyData)
                       , r.result->nDataLen);
}

void HttpFetcher::fetch(const Request &request, const fs::path &dst)
{
    write(dst, fetchContent(request));
}

std::string HttpFetcher::get(const Request &request)
{
    return fetchContent(request);
}

LocalMirrorFetcher::LocalMirrorFetcher(const fs::path &root)
    : root_(root)
{}

fs::path LocalMirrorFetcher::resolve(const std::string &url) const
{
    return root_ / urlFilename(url);
}

void LocalMirrorFetcher::fetch(const Request &request, const fs::path &dst)
{
    const auto src(resolve(request.url));
    LOG(info1) << "Copying <" << request.url << "> from mirror " << src
               << ".";

    boost::system::error_code ec;
    if (!fs::exists(src, ec)) {
        LOGTHROW(err2, IOError)
            << "Resource <" << request.url << "> not found in mirror "
            << root_ << ".";
    }

    fs::copy_file(src, dst, fs::copy_option::overwrite_if_exists, ec);
    if (ec) {
        LOGTHROW(err2, IOError)
            << "Unable to copy " << src << " to " << dst << ": <"
            << ec.message() << ">.";
    }
}

std::string LocalMirrorFetcher::get(const Request &request)
{
    const auto src(resolve(request.url));

    std::ifstream f(src.string(), std::ios_base::in | std::ios_base::binary);
    if (!f) {
        LOGTHROW(err2, IOError)
            << "Resource <" << request.url << "> not found in mirror "
            << root_ << ".";
    }
    return std::string(std::istreambuf_iterator<char>(f)
                       , std::istreambuf_iterator<char>());
}

} // namespace ancillary
