#include "core/types.hpp"
#include "core/wifi.hpp"

#include <algorithm>
#include <iterator>

namespace wifiap
{
    namespace core
    {

        const InterfaceDescriptor *SystemSnapshot::find_interface(const std::string &name) const
        {
            for (const auto &iface : interfaces)
            {
                if (iface.name == name)
                {
                    return &iface;
                }
            }
            return nullptr;
        }

        const ConnectionProfile *SystemSnapshot::find_profile(const std::string &name) const
        {
            for (const auto &profile : profiles)
            {
                if (profile.name == name)
                {
                    return &profile;
                }
            }
            return nullptr;
        }

        std::vector<ConnectionProfile> SystemSnapshot::ap_profiles() const
        {
            std::vector<ConnectionProfile> result;
            for (const auto &profile : profiles)
            {
                if (profile.is_wireless() && is_ap_profile_name(profile.name))
                {
                    result.push_back(profile);
                }
            }

            // nmcli lists profiles in no particular order; callers that pick
            // "the first AP" get the lexicographically smallest name
            std::sort(result.begin(), result.end(),
                      [](const ConnectionProfile &a, const ConnectionProfile &b)
                      { return a.name < b.name; });
            return result;
        }

        std::vector<InterfaceDescriptor> SystemSnapshot::wifi_interfaces() const
        {
            std::vector<InterfaceDescriptor> result;
            std::copy_if(interfaces.begin(), interfaces.end(), std::back_inserter(result),
                         [](const InterfaceDescriptor &iface)
                         { return iface.is_wifi(); });
            return result;
        }

    } // namespace core
} // namespace wifiap
