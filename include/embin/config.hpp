#pragma once

// Per-call codec options and their text configuration.
//
// Example configuration file:
//
//   # frames from the flight computer
//   byte_order = little
//
// Options are read once and passed to encode()/decode(); nothing here is
// written to the wire.

#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

#include "format.hpp"

namespace embin {

struct options_t {
    byte_order order = byte_order::big;
    std::ostream* log = nullptr;  // trace output, disabled when null
};

// =============================================================================
// byte_order <-> string (ADL)
// =============================================================================

auto to_string(byte_order order) -> const char*;

// Accepts "big", "little", "network" and "native"; throws std::runtime_error
auto from_string(std::type_identity<byte_order>, std::string_view s) -> byte_order;

auto operator<<(std::ostream& os, byte_order order) -> std::ostream&;

// =============================================================================
// Option setters
// =============================================================================

/**
 * Set an option by key.
 *
 * Example:
 *   set(options, "byte_order", "little");
 *
 * Throws std::runtime_error for an unknown key or an unparseable value.
 */
void set(options_t& options, const std::string& key, const std::string& value);

// Parse "key = value" lines ('#' starts a comment) on top of the defaults
auto read_options(std::istream& is) -> options_t;

} // namespace embin
