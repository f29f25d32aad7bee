#pragma once

#include "model/Command.hpp"

#include <filesystem>
#include <string>

namespace hl::model {

// Builds a command tree from a YAML manifest:
//
//   name: mycmd
//   description: Does things
//   subcommand_required: false
//   args:     [{ name: FILE, required: true, multiple: false, description: ... }]
//   options:  [{ name: time, short: t, long: time, takes_value: true, value_name: SECS,
//                multiple: false, values: [a, b], description: ... }]
//   commands: [ <manifest>, ... ]
//
// @throws std::runtime_error on malformed manifests, std::invalid_argument on clashing names
Command loadManifest(const std::filesystem::path& path);
Command parseManifest(const std::string& yaml);

}
