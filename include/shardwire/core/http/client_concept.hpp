/*
===============================================================================
 HttpClientConcept
===============================================================================

The HTTP exchange itself (connection pooling, TLS, redirects) is supplied by
the application. The Dispatcher only needs a blocking perform() that fills a
Response and reports whether the exchange took place.

perform() may be called concurrently from several threads.
===============================================================================
*/
#pragma once

#include <concepts>

#include "shardwire/core/http/message.hpp"
#include "shardwire/core/transport/error.hpp"


namespace shardwire::core::http {

template<class C>
concept HttpClientConcept =
    requires(C c, const Request& req, Response& resp)
{
    { c.perform(req, resp) } -> std::same_as<transport::Error>;
};

} // namespace shardwire::core::http
