#include "device_directory.hpp"

#include "logging.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <mutex>

namespace oftee {

DeviceDirectory::DeviceDirectory(boost::asio::any_io_executor executor)
    : strand_(boost::asio::make_strand(executor)) {}

void DeviceDirectory::publish(DeviceMapping mapping) {
    boost::asio::post(strand_, [self = shared_from_this(), mapping = std::move(mapping)]() {
        self->apply(mapping);
    });
}

void DeviceDirectory::apply(const DeviceMapping& mapping) {
    switch (mapping.action) {
        case MappingAction::Add: {
            log_debug("directory") << "Adding device mapping " << format_dpid(mapping.dpid);
            std::unique_lock lock(lock_);
            injectors_[mapping.dpid] = mapping.injector;
            break;
        }
        case MappingAction::Delete: {
            log_debug("directory") << "Deleting device mapping " << format_dpid(mapping.dpid);
            std::unique_lock lock(lock_);
            auto it = injectors_.find(mapping.dpid);
            // A device that reconnected has already replaced the old injector.
            if (it != injectors_.end() && (!mapping.injector || it->second == mapping.injector)) {
                injectors_.erase(it);
            }
            break;
        }
        default:
            log_warn("directory") << "Received unknown device mapping action "
                                  << static_cast<int>(mapping.action) << " for " << format_dpid(mapping.dpid);
            break;
    }
}

std::shared_ptr<Injector> DeviceDirectory::find(std::uint64_t dpid) const {
    std::shared_lock lock(lock_);
    auto it = injectors_.find(dpid);
    if (it == injectors_.end()) return nullptr;
    return it->second;
}

std::vector<std::uint64_t> DeviceDirectory::devices() const {
    std::vector<std::uint64_t> list;
    {
        std::shared_lock lock(lock_);
        list.reserve(injectors_.size());
        for (const auto& kv : injectors_) list.push_back(kv.first);
    }
    std::sort(list.begin(), list.end());
    return list;
}

std::string format_dpid(std::uint64_t dpid) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "of:0x%016" PRIx64, dpid);
    return buf;
}

} // namespace oftee
