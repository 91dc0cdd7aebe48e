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

#ifndef ancillary_pointcloud_process_hpp_included_
#define ancillary_pointcloud_process_hpp_included_

#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace ancillary {

/** Child process running given function.
 */
class Process {
public:
    typedef int Id;
    typedef int ExitCode;

    Process() : id_() {}
    Process(Process &&other);

    template<typename Function, typename ...Args>
    explicit Process(Function &&f, Args &&...args);

    Process(const Process&) = delete;
    ~Process();

    Process& operator=(Process &&other);
    Process& operator=(Process &other) = delete;

    Id id() const { return id_; }

    inline bool joinable() const { return id_ > 0; }

    /** Waits for process exit. Can throw system_error; the process is not
     *  joinable afterwards either way.
     *
     *  Returns exit code; killed process yields EXIT_FAILURE.
     */
    ExitCode join();

    /** Runs external program and waits for its termination.
     *  Spawn or wait failure is reported as ExternalToolError.
     */
    static ExitCode exec(const std::string &program
                         , const std::vector<std::string> &args);

private:
    static Id run(const std::function<void()> &func);

    Id id_;
};

// inlines

inline Process::Process(Process &&other)
    : id_(other.id_)
{
    other.id_ = 0;
}

inline Process& Process::operator=(Process &&other)
{
    if (joinable()) { std::terminate(); }
    id_ = other.id_;
    other.id_ = 0;
    return *this;
}

template<class Function, typename ...Args>
inline Process::Process(Function &&f, Args &&...args)
{
    id_ = run(std::bind<void>(std::forward<Function>(f)
                              , std::forward<Args>(args)...));
}

inline Process::~Process()
{
    if (joinable()) { std::terminate(); }
}

} // namespace ancillary

#endif // ancillary_pointcloud_process_hpp_included_
