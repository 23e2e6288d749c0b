#include "services/snapshot.hpp"
#include "infrastructure/network_config_service.hpp"

namespace wifiap
{
    namespace services
    {

        core::SystemSnapshot take_snapshot(infrastructure::NetworkConfigService &network)
        {
            core::SystemSnapshot snapshot;
            snapshot.interfaces = network.list_devices();
            snapshot.profiles = network.list_profiles();

            for (const auto &profile : snapshot.ap_profiles())
            {
                auto settings = network.show_profile(profile.name);
                if (settings && !settings->interface.empty())
                {
                    snapshot.ap_bindings[profile.name] = settings->interface;
                }
            }
            return snapshot;
        }

    } // namespace services
} // namespace wifiap
