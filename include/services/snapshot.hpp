#ifndef WIFIAP_SERVICES_SNAPSHOT_HPP
#define WIFIAP_SERVICES_SNAPSHOT_HPP

#include "core/types.hpp"

namespace wifiap
{
    namespace infrastructure
    {
        class NetworkConfigService;
    }

    namespace services
    {

        /**
         * Reads devices, profiles and the interface binding of every AP profile
         * in one pass. Commands take one snapshot and decide from it.
         */
        core::SystemSnapshot take_snapshot(infrastructure::NetworkConfigService &network);

    } // namespace services
} // namespace wifiap

#endif // WIFIAP_SERVICES_SNAPSHOT_HPP
