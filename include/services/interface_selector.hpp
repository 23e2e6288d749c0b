#ifndef WIFIAP_SERVICES_INTERFACE_SELECTOR_HPP
#define WIFIAP_SERVICES_INTERFACE_SELECTOR_HPP

#include "core/types.hpp"

#include <string>

namespace wifiap
{
    namespace services
    {

        /**
         * How an interface was chosen, for the operator report
         */
        enum class InterfaceChoice
        {
            EXPLICIT,
            EXISTING_AP,
            ONLY_CANDIDATE
        };

        struct InterfaceSelection
        {
            std::string interface;
            InterfaceChoice reason = InterfaceChoice::EXPLICIT;
        };

        /**
         * Auto-detection when no interface is given:
         *  1. an interface already carrying (or bound to) an AP profile
         *  2. the only managed non-P2P WiFi interface
         *  3. several candidates: ApError(PRECONDITION) listing them
         *  4. none: ApError(PRECONDITION)
         */
        InterfaceSelection select_interface(const core::SystemSnapshot &snapshot);

        /**
         * An explicit interface must exist, be WiFi and not P2P; throws
         * ApError(PRECONDITION) otherwise
         */
        InterfaceSelection check_interface(const core::SystemSnapshot &snapshot, const std::string &interface);

    } // namespace services
} // namespace wifiap

#endif // WIFIAP_SERVICES_INTERFACE_SELECTOR_HPP
