#pragma once

#include "ServerStatus.hpp"
#include "RoundSnapshot.hpp"
#include "ServerDescriptor.hpp"

#include <mutex>
#include <memory>
#include <vector>

// Per-server health history for the process lifetime.
// One writer applies whole rounds; readers get immutable views and never block the writer for longer than a pointer swap.
class StatusStore {
public:
    explicit StatusStore(std::vector<ServerDescriptor> servers);

    // applies every outcome of the round at once, throws std::out_of_range for an unconfigured id
    std::shared_ptr<const StatusView> apply(const RoundSnapshot& round);

    std::shared_ptr<const StatusView> snapshot() const;

    const std::vector<ServerDescriptor>& servers() const { return _servers; }

private:
    const ServerDescriptor& descriptor_for(const std::string& id) const;

    std::vector<ServerDescriptor> _servers;

    std::mutex _apply_mutex;            // serializes writers
    mutable std::mutex _view_mutex;     // guards only the pointer
    std::shared_ptr<const StatusView> _current;
};
