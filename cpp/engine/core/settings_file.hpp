#pragma once
/*
================================================================================
Fragment 1.8 — Core: Settings File Loader
FILE: cpp/engine/core/settings_file.hpp

Purpose:
  - Let a deployment override DesignSettings without a rebuild (jurisdiction
    minimums, local soil presets, practical footing limits).

Format:
  - INI-style text, one "key = value" per line.
  - "[section]" headers prefix the following keys ("[safety]" + "min_sliding"
    becomes "safety.min_sliding"). Fully dotted keys work without a header.
  - '#' and ';' start comments. Blank lines are ignored.

Hardening:
  - Unknown keys and malformed numbers are errors (kParseError), never
    silently dropped: a typo in a safety minimum must not fall back to the
    default.
  - The merged result is validate_or_throw()'d before it is returned.
================================================================================
*/

#include "engine/core/settings.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rwall {

// Apply one override. Throws Error(kParseError) on unknown key or bad value.
void apply_setting(DesignSettings& s, std::string_view key, std::string_view value);

// Parse settings text on top of `base`. `origin` names the source in messages.
DesignSettings parse_settings_text(std::string_view text,
                                   const DesignSettings& base,
                                   const std::string& origin = "<text>");

// Read a settings file on top of `base`. Throws IOError if unreadable.
DesignSettings load_settings_file(const std::string& path,
                                  const DesignSettings& base = DesignSettings::defaults());

// Every key apply_setting() accepts, in a stable order.
std::vector<std::string> known_setting_keys();

}  // namespace rwall
