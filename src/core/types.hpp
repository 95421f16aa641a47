#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace matchcore {

// Prices and amounts are plain doubles; the venue trades in decimal units
using Price = double;
using Amount = double;

// Order identifier, unique within a (side, product)
using OrderId = std::uint64_t;

// Key into the per-product collections
using ProductId = std::int64_t;

// Carried on every order, never consulted by matching
using Priority = int;

// Wall clock time for order creation and trade execution
using WallTime = std::chrono::system_clock::time_point;

// Encoded form handed to and received from the codec
using Bytes = std::vector<std::uint8_t>;

}  // namespace matchcore
