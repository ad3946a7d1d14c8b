#ifndef ULAROUTE_ROUTE_CONFIG_HPP_
#define ULAROUTE_ROUTE_CONFIG_HPP_

#include <string>
#include <vector>
#include "route_store.hpp"

struct route_config_result {
    std::string output;
    int exit_status; // -1 if the action never ran to completion
    bool success;
};

class RouteConfigurator
{
public:
    virtual ~RouteConfigurator() {}
    // Blocks until the route is installed or the attempt has failed.
    virtual route_config_result configure(const route_key &key,
                                          const std::string &ifname) = 0;
};

// Runs an external command with PREFIX, ROUTER and IFACE in its environment.
// argv[0] must be a path; no shell is involved.
class CommandRouteConfigurator : public RouteConfigurator
{
public:
    explicit CommandRouteConfigurator(std::vector<std::string> argv);
    route_config_result configure(const route_key &key,
                                  const std::string &ifname) override;
private:
    std::vector<std::string> argv_;
};

#endif

