#pragma once

// Umbrella header for outcomes:
//   oc::try_result<T, X>, oc::try_void<X>, oc::try_catch_all<T>, oc::try_catch_all_void
//   their optional projections oc::try_optional<T, X>, oc::try_catch_all_optional<T>
//   oc::checked_stream<T, X>
//
// Usage:
//   auto const r = oc::try_result<int, std::system_error>::get([&] { return read_port(config); })
//                      .and_apply([](int port) { return port + 1; });
//   auto const port = r.or_map_cause([](std::system_error const&) { return 8080; });

#include <outcome-core/basic_try.hh>
#include <outcome-core/basic_try_void.hh>
#include <outcome-core/checked_stream.hh>
#include <outcome-core/fwd.hh>
#include <outcome-core/try_optional.hh>
