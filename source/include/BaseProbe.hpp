#pragma once

#include "ServerDescriptor.hpp"
#include "ProbeOutcome.hpp"

#include <chrono>

#include <boost/asio.hpp>

// one test call against one server; every failure comes back as a classified outcome, never as an exception
class BaseProbe {
public:
    virtual ~BaseProbe() = default;

    virtual boost::asio::awaitable<ProbeOutcome> async_probe(const ServerDescriptor& server, std::chrono::milliseconds deadline) = 0;
};
