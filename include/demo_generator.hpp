#pragma once

#include "types.hpp"

struct DemoData {
  ComparisonData comparison;
  StatsBundle stats;
};

// Fixed synthetic comparison and statistics shown on initial load and whenever a
// recording yields no usable samples. Consults no input.
DemoData generate_demo_data();
