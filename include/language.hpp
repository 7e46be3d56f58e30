//
//  language.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cytubegen {

// English display name for a probe language code; the raw code when unknown.
std::string language_name(std::string_view code);

// Two-letter code the manifest expects for `language`; the raw code when unknown.
std::string manifest_language_code(std::string_view code);

/**
 * @brief Human-readable track label.
 *
 * `"<Name>"`, or `"<Name> (<title>)"` when the track carries a title.
 */
std::string build_language_label(std::string_view code,
                                 const std::optional<std::string> &title);

}  // namespace cytubegen
