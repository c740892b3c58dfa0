#pragma once

#include "openflow.hpp"

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

namespace oftee {

// Writes a message to one device.
class Injector {
public:
    virtual ~Injector() = default;
    virtual void inject(SharedBytes message) = 0;
};

enum class MappingAction : std::uint8_t {
    None = 0x0,
    Add = 1 << 0,
    Delete = 1 << 1
};

struct DeviceMapping {
    MappingAction action = MappingAction::None;
    std::uint64_t dpid = 0;
    std::shared_ptr<Injector> injector;
};

// DPID -> injector map. Updates are applied one at a time on a strand in the
// order they were published; lookups may come from any thread.
class DeviceDirectory : public std::enable_shared_from_this<DeviceDirectory> {
public:
    explicit DeviceDirectory(boost::asio::any_io_executor executor);

    void publish(DeviceMapping mapping);

    std::shared_ptr<Injector> find(std::uint64_t dpid) const;
    std::vector<std::uint64_t> devices() const;

private:
    void apply(const DeviceMapping& mapping);

    boost::asio::strand<boost::asio::any_io_executor> strand_;
    mutable std::shared_mutex lock_;
    std::unordered_map<std::uint64_t, std::shared_ptr<Injector>> injectors_;
};

std::string format_dpid(std::uint64_t dpid);

} // namespace oftee
