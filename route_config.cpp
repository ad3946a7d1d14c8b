/* route_config.cpp - run the external route configuration action
 *
 * (c) 2026 The ularoute authors
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * - Redistributions of source code must retain the above copyright notice,
 *   this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright notice,
 *   this list of conditions and the following disclaimer in the documentation
 *   and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#include <utility>

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <fmt/format.h>

#include "route_config.hpp"

extern char **environ;

CommandRouteConfigurator::CommandRouteConfigurator(std::vector<std::string> argv)
    : argv_(std::move(argv))
{}

static bool is_action_param(const char *e)
{
    return !strncmp(e, "PREFIX=", 7) || !strncmp(e, "ROUTER=", 7)
        || !strncmp(e, "IFACE=", 6);
}

// Our parameters replace any inherited ones of the same name.
static std::vector<std::string> action_environment(const route_key &key,
                                                   const std::string &ifname)
{
    std::vector<std::string> env;
    for (char **e = environ; e && *e; ++e) {
        if (!is_action_param(*e))
            env.emplace_back(*e);
    }
    env.emplace_back("PREFIX=" + key.prefix_string());
    env.emplace_back("ROUTER=" + key.router.to_string());
    env.emplace_back("IFACE=" + ifname);
    return env;
}

static std::vector<char *> c_strings(const std::vector<std::string> &v)
{
    std::vector<char *> r;
    r.reserve(v.size() + 1);
    for (const auto &i: v)
        r.push_back(const_cast<char *>(i.c_str()));
    r.push_back(nullptr);
    return r;
}

route_config_result CommandRouteConfigurator::configure(const route_key &key,
                                                        const std::string &ifname)
{
    route_config_result r;
    r.exit_status = -1;
    r.success = false;
    if (argv_.empty()) {
        r.output = "no configuration command is set";
        return r;
    }

    auto env = action_environment(key, ifname);
    auto envp = c_strings(env);
    auto args = c_strings(argv_);

    int pfd[2];
    if (pipe2(pfd, O_CLOEXEC) < 0) {
        r.output = fmt::format("{}: pipe: {}", argv_[0], strerror(errno));
        return r;
    }

    auto child = fork();
    if (child == -1) {
        r.output = fmt::format("{}: fork: {}", argv_[0], strerror(errno));
        close(pfd[0]);
        close(pfd[1]);
        return r;
    } else if (child == 0) {
        // The daemon blocks some signals; the action should not inherit that.
        sigset_t mask;
        sigemptyset(&mask);
        sigprocmask(SIG_SETMASK, &mask, nullptr);
        dup2(pfd[1], 1);
        dup2(pfd[1], 2);

        execve(args[0], args.data(), envp.data());
        dprintf(2, "%s: %s\n", args[0], strerror(errno));
        _exit(127);
    }

    close(pfd[1]);
    char buf[4096];
    for (;;) {
        auto n = read(pfd[0], buf, sizeof buf);
        if (n == 0)
            break;
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            r.output += fmt::format("{}: read: {}\n", argv_[0], strerror(errno));
            break;
        }
        r.output.append(buf, static_cast<std::size_t>(n));
    }
    close(pfd[0]);

    int status;
    pid_t w;
    while ((w = waitpid(child, &status, 0)) < 0 && errno == EINTR)
        ;
    if (w < 0) {
        r.output += fmt::format("{}: waitpid: {}\n", argv_[0], strerror(errno));
        return r;
    }
    if (WIFEXITED(status)) {
        r.exit_status = WEXITSTATUS(status);
        r.success = r.exit_status == 0;
    } else if (WIFSIGNALED(status)) {
        r.output += fmt::format("{}: terminated by signal {}\n", argv_[0],
                                WTERMSIG(status));
    }
    return r;
}
