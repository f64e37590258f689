#include "StatusStore.hpp"

#include <format>
#include <iterator>
#include <algorithm>
#include <stdexcept>

StatusStore::StatusStore(std::vector<ServerDescriptor> servers):
    _servers(std::move(servers)),
    _current(std::make_shared<const StatusView>())
    {}

const ServerDescriptor& StatusStore::descriptor_for(const std::string& id) const {
    for (const auto& sd: _servers) if (sd.id == id) return sd;
    throw std::out_of_range(std::format("no configured server '{}'", id));
}

std::shared_ptr<const StatusView> StatusStore::apply(const RoundSnapshot& round) {
    std::scoped_lock writer(_apply_mutex);

    // built off to the side, readers keep the old view until the swap below
    auto next = std::make_shared<StatusView>(*snapshot());

    for (const auto& outcome: round.outcomes) {
        auto it = std::ranges::find_if(next->servers, [&outcome](const auto& s) { return s.descriptor.id == outcome.server_id; });

        if (it == next->servers.end()) {
            ServerStatus fresh;
            fresh.descriptor = descriptor_for(outcome.server_id);
            next->servers.push_back(std::move(fresh));
            it = std::prev(next->servers.end());
        }

        it->last_outcome = outcome;
        ++it->total_rounds;

        it->recent.push_back(outcome);
        if (it->recent.size() > ServerStatus::HISTORY_LIMIT) {
            it->recent.erase(it->recent.begin(), it->recent.end() - ServerStatus::HISTORY_LIMIT);
        }

        if (outcome.ok()) {
            ++it->total_successes;
            it->consecutive_failures = 0;
        }
        else {
            ++it->consecutive_failures;
        }
    }

    // first-seen order can differ from config order when a round skips servers
    std::ranges::stable_sort(next->servers, {}, [this](const ServerStatus& s) {
        return std::ranges::distance(_servers.begin(), std::ranges::find_if(_servers, [&s](const auto& sd) { return sd.id == s.descriptor.id; }));
    });

    ++next->rounds_applied;

    std::shared_ptr<const StatusView> published = std::move(next);

    {
        std::scoped_lock lock(_view_mutex);
        _current = published;
    }

    return published;
}

std::shared_ptr<const StatusView> StatusStore::snapshot() const {
    std::scoped_lock lock(_view_mutex);
    return _current;
}
