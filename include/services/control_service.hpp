#ifndef WIFIAP_SERVICES_CONTROL_SERVICE_HPP
#define WIFIAP_SERVICES_CONTROL_SERVICE_HPP

#include "core/types.hpp"
#include "services/connection_manager.hpp"

#include <chrono>
#include <memory>
#include <ostream>
#include <string>

namespace wifiap
{
    namespace core
    {
        class Logger;
    }
    namespace infrastructure
    {
        class NetworkConfigService;
    }
    namespace services
    {
        class CapabilityProber;
    }
}

namespace wifiap
{
    namespace services
    {

        /**
         * Lifecycle and inspection commands on existing AP profiles
         *
         * An empty name selects the lexicographically first AP-pattern profile
         * for start and restart, and every active AP profile for stop.
         */
        class ControlService
        {
        public:
            ControlService(infrastructure::NetworkConfigService &network,
                           CapabilityProber &prober,
                           std::chrono::seconds restart_delay,
                           std::ostream &out);

            Outcome start(const std::string &name, const std::string &interface);
            Outcome stop(const std::string &name);
            Outcome restart(const std::string &name, const std::string &interface);
            Outcome status(const std::string &name);
            Outcome list();
            Outcome remove(const std::string &name);
            Outcome interfaces();

            /**
             * Dispatches a control sub-command by name; unknown commands are
             * usage errors
             */
            Outcome run(const std::string &command, const std::string &name, const std::string &interface);

        private:
            std::string resolve_name(const std::string &name, const core::SystemSnapshot &snapshot) const;
            void print_device_table(const core::SystemSnapshot &snapshot);
            void print_details(const std::string &name);

            infrastructure::NetworkConfigService &network_;
            CapabilityProber &prober_;
            std::chrono::seconds restart_delay_;
            std::ostream &out_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace wifiap

#endif // WIFIAP_SERVICES_CONTROL_SERVICE_HPP
