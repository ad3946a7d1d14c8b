/* ularouted.cpp - ipv6 ULA route listener for Matter/Thread networks
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

#define ULAROUTE_VERSION "0.1"

#ifndef ULAROUTE_CONFIGURE_PATH
#define ULAROUTE_CONFIGURE_PATH "/usr/local/libexec/ularoute-configure"
#endif

#include <memory>
#include <string>
#include <vector>
#include <fstream>
#include <sstream>

#include <unistd.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <signal.h>
#include <sys/stat.h>

#include <boost/asio.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/program_options.hpp>

#include <fmt/format.h>
#include "nlsocket.hpp"
#include "radv6.hpp"
#include "ra_handler.hpp"
#include "route_config.hpp"
#include "route_store.hpp"
#include "log.hpp"

namespace po = boost::program_options;

boost::asio::io_service io_service;
static boost::asio::signal_set asio_signal_set(io_service);

static std::unique_ptr<RouteStore> route_store;
static std::unique_ptr<RouteConfigurator> route_configurator;
static std::unique_ptr<RouteHandler> route_handler;
static std::unique_ptr<RA6Listener> listener;

static void process_signals()
{
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGPIPE);
    sigaddset(&mask, SIGUSR1);
    sigaddset(&mask, SIGUSR2);
    sigaddset(&mask, SIGTSTP);
    sigaddset(&mask, SIGTTIN);
    sigaddset(&mask, SIGHUP);
    if (sigprocmask(SIG_BLOCK, &mask, NULL) < 0)
        suicide("sigprocmask failed");
    asio_signal_set.add(SIGINT);
    asio_signal_set.add(SIGTERM);
    asio_signal_set.async_wait(
        [](const boost::system::error_code &, int signum) {
            log_line("Received signal {}, shutting down", signum);
            if (listener)
                listener->stop();
            io_service.stop();
        });
}

static void print_version()
{
    fmt::print("ularouted " ULAROUTE_VERSION ", ipv6 ULA route listener.\n"
               "Copyright (c) 2026 The ularoute authors\n"
               "All rights reserved.\n\n"
               "Redistribution and use in source and binary forms, with or without\n"
               "modification, are permitted provided that the following conditions are met:\n\n"
               "- Redistributions of source code must retain the above copyright notice,\n"
               "  this list of conditions and the following disclaimer.\n"
               "- Redistributions in binary form must reproduce the above copyright notice,\n"
               "  this list of conditions and the following disclaimer in the documentation\n"
               "  and/or other materials provided with the distribution.\n\n"
               "THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS \"AS IS\"\n"
               "AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE\n"
               "IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE\n"
               "ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE\n"
               "LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR\n"
               "CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF\n"
               "SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS\n"
               "INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN\n"
               "CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)\n"
               "ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE\n"
               "POSSIBILITY OF SUCH DAMAGE.\n");
}

static po::variables_map fetch_options(int ac, char *av[])
{
    std::string config_file;

    po::options_description cli_opts("Command-line-exclusive options");
    cli_opts.add_options()
        ("config,c", po::value<std::string>(&config_file),
         "path to configuration file")
        ("verbose,V", "print details of normal operation")
        ("help,h", "print help message")
        ("version,v", "print version information")
        ;

    po::options_description gopts("Options");
    gopts.add_options()
        ("interface,i", po::value<std::string>()->default_value("eth0"),
         "interface on which to listen for router advertisements")
        ("log-ignored", po::bool_switch(),
         "log prefixes that are ignored because they are not ULA")
        ("configure-command", po::value<std::string>()->default_value(ULAROUTE_CONFIGURE_PATH),
         "program that installs a route; gets PREFIX, ROUTER and IFACE in its environment")
        ("solicit-interval", po::value<unsigned int>()->default_value(0),
         "seconds between router solicitations (0 disables them)")
        ;

    po::options_description cmdline_options;
    cmdline_options.add(cli_opts).add(gopts);
    po::options_description cfgfile_options;
    cfgfile_options.add(gopts);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(ac, av).
                  options(cmdline_options).run(), vm);
        po::notify(vm);

        if (config_file.size()) {
            std::ifstream ifs(config_file.c_str());
            if (!ifs) {
                fmt::print(stderr, "Could not open config file: {}\n", config_file);
                std::exit(EXIT_FAILURE);
            }
            po::store(po::parse_config_file(ifs, cfgfile_options), vm);
            po::notify(vm);
        }
    } catch (const po::error &e) {
        fmt::print(stderr, "{}\n", e.what());
        std::exit(EXIT_FAILURE);
    }

    if (vm.count("help")) {
        std::ostringstream ss;
        ss << cmdline_options;
        fmt::print("ularouted " ULAROUTE_VERSION ", ipv6 ULA route listener.\n"
                   "Copyright (c) 2026 The ularoute authors\n"
                   "{} [options]\n{}\n", av[0], ss.str());
        std::exit(EXIT_SUCCESS);
    }
    if (vm.count("version")) {
        print_version();
        std::exit(EXIT_SUCCESS);
    }
    return vm;
}

static void process_options(int ac, char *av[])
{
    auto vm(fetch_options(ac, av));

    if (vm.count("verbose"))
        g_verbose_logs = true;
    auto ifname = vm["interface"].as<std::string>();
    auto log_ignored = vm["log-ignored"].as<bool>();
    auto configure_command = vm["configure-command"].as<std::string>();
    auto solicit_interval = vm["solicit-interval"].as<unsigned int>();

    log_line("ularouted " ULAROUTE_VERSION " starting");
    log_line("  Interface: {}", ifname);
    log_line("  Configuration command: {}", configure_command);
    log_line("  Log ignored routes: {}", log_ignored ? "yes" : "no");
    log_line("  Router solicitation interval: {}",
             solicit_interval ? fmt::format("{}s", solicit_interval) : std::string("off"));
    log_line("  Debug logging: {}", g_verbose_logs ? "yes" : "no");

    int ifindex(0);
    try {
        NLSocket nl_socket(io_service);
        std::vector<std::string> names;
        for (const auto &i: nl_socket.interfaces)
            names.push_back(i.second.name);
        log_line("  Available interfaces: {}", boost::algorithm::join(names, ", "));
        ifindex = require_ifindex(nl_socket, ifname);
    } catch (const boost::system::system_error &e) {
        suicide("netlink: {}", e.what());
    }

    if (access(configure_command.c_str(), X_OK))
        log_warning("Configuration command {} is not executable: {}",
                    configure_command, strerror(errno));

    route_store = std::make_unique<RouteStore>();
    route_configurator = std::make_unique<CommandRouteConfigurator>
        (std::vector<std::string>{ configure_command });
    route_handler = std::make_unique<RouteHandler>
        (*route_store, *route_configurator, ifname, log_ignored);
    try {
        listener = std::make_unique<RA6Listener>(io_service, ifname, ifindex,
                                                 *route_handler);
    } catch (const boost::system::system_error &e) {
        suicide("Can't listen for router advertisements on {}: {}", ifname, e.what());
    }
    listener->set_solicit_interval(solicit_interval);

    umask(077);
    process_signals();
}

int main(int ac, char *av[])
{
    process_options(ac, av);

    listener->start();
    io_service.run();

    log_line("ularouted exiting ({} routes seen)", route_store->size());
    std::exit(EXIT_SUCCESS);
}
