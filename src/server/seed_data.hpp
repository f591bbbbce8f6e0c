#pragma once

#include "thread_store.hpp"

#include <cstdint>

// Populate the store with the demo threads, turn histories and loaded set.
void seed_demo_data(ThreadStore& store, int64_t now);
