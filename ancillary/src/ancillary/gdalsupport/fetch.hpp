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

#ifndef ancillary_gdalsupport_fetch_hpp_included_
#define ancillary_gdalsupport_fetch_hpp_included_

#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

namespace ancillary {

/** Single transfer. Options are passed to the transport as KEY=VALUE pairs
 *  (e.g. POSTFIELDS, COOKIEFILE).
 */
struct Request {
    std::string url;
    std::vector<std::string> options;

    Request(const std::string &url
            , const std::vector<std::string> &options
            = std::vector<std::string>())
        : url(url), options(options) {}
};

struct Credentials {
    std::string user;
    std::string password;

    Credentials() = default;
    Credentials(const std::string &user, const std::string &password)
        : user(user), password(password) {}

    bool valid() const { return !user.empty(); }
};

/** Transport option carrying credentials.
 */
std::string authOption(const Credentials &credentials);

/** Last path component of URL (without query).
 */
std::string urlFilename(const std::string &url);

/** Transport abstraction. All failures are reported as IOError.
 */
class Fetcher {
public:
    typedef std::shared_ptr<Fetcher> pointer;

    virtual ~Fetcher() {}

    /** Stores fetched content into destination file.
     */
    virtual void fetch(const Request &request
                       , const boost::filesystem::path &dst) = 0;

    /** Returns fetched content.
     */
    virtual std::string get(const Request &request) = 0;
};

/** HTTP(S)/FTP transport via GDAL's CPLHTTPFetch.
 */
class HttpFetcher : public Fetcher {
public:
    HttpFetcher(const boost::optional<Credentials> &credentials
                = boost::none, int timeout = 0);

    void fetch(const Request &request, const boost::filesystem::path &dst)
        override;

    std::string get(const Request &request) override;

private:
    std::string fetchContent(const Request &request) const;

    boost::optional<Credentials> credentials_;
    int timeout_;
};

/** Serves files from local directory; URL is mapped to its last path
 *  component.
 */
class LocalMirrorFetcher : public Fetcher {
public:
    LocalMirrorFetcher(const boost::filesystem::path &root);

    void fetch(const Request &request, const boost::filesystem::path &dst)
        override;

    std::string get(const Request &request) override;

    boost::filesystem::path resolve(const std::string &url) const;

private:
    boost::filesystem::path root_;
};

} // namespace ancillary

#endif // ancillary_gdalsupport_fetch_hpp_included_
