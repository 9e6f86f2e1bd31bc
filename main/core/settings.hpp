#pragma once

#include <cstddef>
#include <string>

#include "core/slot.hpp"

namespace core {

// Parse the watcher YAML (a small line-based subset: sections, scalars,
// "- item" lists and [a, b] flow lists). Unknown keys are ignored.
// Values not present keep the defaults already in `cfg`.
bool parse_settings(const char *text, std::size_t len, PollConfig &cfg, std::string &error);

// Check that everything the loop needs is present.
bool validate_settings(const PollConfig &cfg, std::string &error);

} // namespace core
