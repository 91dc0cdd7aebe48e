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

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <system_error>

#include "dbglog/dbglog.hpp"

#include "utility/process.hpp"

#include "../error.hpp"
#include "./process.hpp"

namespace ancillary {

Process::ExitCode Process::join()
{
    if (!joinable()) {
        std::system_error e(EINVAL, std::system_category());
        LOG(err3) << "Cannot join non-joinable process.";
        throw e;
    }

    LOG(debug) << "Joining process " << id_ << ".";

    int status;
    for (;;) {
        auto res(::waitpid(id_, &status, 0));
        if (res < 0) {
            if (EINTR == errno) { continue; }

            std::system_error e(errno, std::system_category());
            LOG(warn1) << "waitpid(" << id_ << ") failed: <" << e.code()
                       << ", " << e.what() << ">";
            // child cannot be waited for anymore
            id_ = 0;
            throw e;
        }
        break;
    }

    LOG(info1) << "Joined process " << id_ << ", status: " << status << ".";

    id_ = 0;

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        LOG(warn2) << "Process terminated by signal " << WTERMSIG(status)
                   << ".";
    }
    return EXIT_FAILURE;
}

Process::Id Process::run(const std::function<void()> &func)
{
    return utility::spawn([=]() -> int { func(); return EXIT_SUCCESS; }
                          , utility::SpawnFlag::none);
}

Process::ExitCode Process::exec(const std::string &program
                                , const std::vector<std::string> &args)
{
    LOG(info2) << "Running " << program << " with " << args.size()
               << " arguments.";

    // prepare argv before fork
    std::vector<std::string> argvData;
    argvData.push_back(program);
    argvData.insert(argvData.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto &arg : argvData) { argv.push_back(&arg[0]); }
    argv.push_back(nullptr);

    try {
        Process process([&argv]() {
                ::execvp(argv.front(), argv.data());
                // exec failed
                ::_exit(127);
            });

        return process.join();
    } catch (const std::system_error &e) {
        LOGTHROW(err2, ExternalToolError)
            << "Running " << program << " failed: <" << e.code()
            << ", " << e.what() << ">.";
    }
    throw;
}

} // namespace ancillary
