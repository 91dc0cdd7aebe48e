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

#include <cstdlib>
#include <system_error>

#include <gtest/gtest.h>

#include "ancillary/error.hpp"
#include "ancillary/pointcloud/process.hpp"

using namespace ancillary;

namespace {

/** Lets the kernel reap children while in scope.
 */
struct AutoReap {
    AutoReap() { old = ::signal(SIGCHLD, SIG_IGN); }
    ~AutoReap() { ::signal(SIGCHLD, old); }
    void (*old)(int);
};

} // namespace

TEST(Process, ExitCode)
{
    EXPECT_EQ(0, Process::exec("true", {}));
    EXPECT_EQ(3, Process::exec("sh", { "-c", "exit 3" }));

    // exec failure is reported by the child
    EXPECT_EQ(127, Process::exec("/nonexistent/program", {}));
}

TEST(Process, FailedJoinLeavesProcessDetached)
{
    Process process([]() {});
    ASSERT_TRUE(process.joinable());

    // reaped behind the wrapper's back
    int status;
    ASSERT_EQ(process.id(), ::waitpid(process.id(), &status, 0));

    EXPECT_THROW(process.join(), std::system_error);
    EXPECT_FALSE(process.joinable());
}

TEST(Process, WaitFailureIsToolError)
{
    AutoReap reap;
    EXPECT_THROW(Process::exec("true", {}), ExternalToolError);
}
