#pragma once

#include <string>

#include "lcr/optional.hpp"


namespace shardwire::core::gateway::schema {

// Session fields of the READY dispatch. Everything else stays in the raw
// payload handed to the consumer.
struct Ready {
    std::string session_id;
    lcr::optional<std::string> resume_gateway_url;
};

} // namespace shardwire::core::gateway::schema
