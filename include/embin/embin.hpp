#pragma once

// ============================================================================
// embin - C++20 zero-copy binary encoding
// ============================================================================
//
// A compact, non-self-describing binary format with:
// - Fixed-width integers and floats in a chosen byte order
// - u16 length prefixes for strings, byte strings and sequences
// - Zero-copy decoding: strings and byte strings borrow the input buffer
// - Fixed-capacity decode targets (inline_vec_t, inline_map_t), no heap
// - Automatic encoding for types with an ADL fields() function
//
// Basic usage:
//
//   #include "embin/embin.hpp"
//
//   struct reading_t {
//       std::uint16_t channel = 0;
//       float value = 0.0f;
//       std::string_view unit;
//   };
//
//   auto fields(const reading_t& r) {
//       return std::make_tuple(
//           embin::field("channel", r.channel),
//           embin::field("value", r.value),
//           embin::field("unit", r.unit)
//       );
//   }
//   auto fields(reading_t& r) {
//       return std::make_tuple(
//           embin::field("channel", r.channel),
//           embin::field("value", r.value),
//           embin::field("unit", r.unit)
//       );
//   }
//
//   // Encode into a caller-owned buffer
//   std::uint8_t buf[64];
//   auto sink = embin::buffer_writer_t(buf);
//   embin::encode(reading_t{3, 21.5f, "degC"}, sink);
//
//   // Decode; r->unit points into buf
//   auto source = embin::slice_source_t(sink.written());
//   auto r = embin::decode<reading_t>(source);
//
// The byte order is not on the wire; both sides must agree on it (big-endian
// unless options say otherwise).
//
// ============================================================================

#include "config.hpp"
#include "containers.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "format.hpp"
#include "protocol.hpp"
#include "result.hpp"
#include "sink.hpp"
#include "source.hpp"
#include "utf8.hpp"
