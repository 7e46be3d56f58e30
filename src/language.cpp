//
//  language.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include "language.hpp"

#include <algorithm>
#include <array>

namespace cytubegen {

namespace {

struct LanguageEntry {
    std::string_view code;       // ISO 639-2 as tagged in the source file
    std::string_view manifest;   // ISO 639-1
    std::string_view name;
};

// Sorted by code. Bibliographic and terminology variants are both listed where they differ.
constexpr std::array<LanguageEntry, 62> kLanguages = {{
    {"ara", "ar", "Arabic"},
    {"bel", "be", "Belarusian"},
    {"ben", "bn", "Bengali"},
    {"bul", "bg", "Bulgarian"},
    {"cat", "ca", "Catalan"},
    {"ces", "cs", "Czech"},
    {"chi", "zh", "Chinese"},
    {"cze", "cs", "Czech"},
    {"dan", "da", "Danish"},
    {"deu", "de", "German"},
    {"dut", "nl", "Dutch"},
    {"ell", "el", "Greek"},
    {"eng", "en", "English"},
    {"est", "et", "Estonian"},
    {"eus", "eu", "Basque"},
    {"fas", "fa", "Persian"},
    {"fil", "tl", "Filipino"},
    {"fin", "fi", "Finnish"},
    {"fra", "fr", "French"},
    {"fre", "fr", "French"},
    {"ger", "de", "German"},
    {"gle", "ga", "Irish"},
    {"glg", "gl", "Galician"},
    {"gre", "el", "Greek"},
    {"heb", "he", "Hebrew"},
    {"hin", "hi", "Hindi"},
    {"hrv", "hr", "Croatian"},
    {"hun", "hu", "Hungarian"},
    {"ice", "is", "Icelandic"},
    {"ind", "id", "Indonesian"},
    {"isl", "is", "Icelandic"},
    {"ita", "it", "Italian"},
    {"jpn", "ja", "Japanese"},
    {"kat", "ka", "Georgian"},
    {"kor", "ko", "Korean"},
    {"lat", "la", "Latin"},
    {"lav", "lv", "Latvian"},
    {"lit", "lt", "Lithuanian"},
    {"may", "ms", "Malay"},
    {"msa", "ms", "Malay"},
    {"nld", "nl", "Dutch"},
    {"nob", "nb", "Norwegian Bokmål"},
    {"nor", "no", "Norwegian"},
    {"per", "fa", "Persian"},
    {"pol", "pl", "Polish"},
    {"por", "pt", "Portuguese"},
    {"ron", "ro", "Romanian"},
    {"rum", "ro", "Romanian"},
    {"rus", "ru", "Russian"},
    {"slk", "sk", "Slovak"},
    {"slo", "sk", "Slovak"},
    {"slv", "sl", "Slovenian"},
    {"spa", "es", "Spanish"},
    {"srp", "sr", "Serbian"},
    {"swe", "sv", "Swedish"},
    {"tam", "ta", "Tamil"},
    {"tha", "th", "Thai"},
    {"tur", "tr", "Turkish"},
    {"ukr", "uk", "Ukrainian"},
    {"und", "und", "Undetermined"},
    {"vie", "vi", "Vietnamese"},
    {"zho", "zh", "Chinese"},
}};

const LanguageEntry *find_language(std::string_view code) {
    auto it = std::lower_bound(
        kLanguages.begin(), kLanguages.end(), code,
        [](const LanguageEntry &e, std::string_view c) { return e.code < c; });
    if (it == kLanguages.end() || it->code != code) {
        return nullptr;
    }
    return &*it;
}

}  // namespace

std::string language_name(std::string_view code) {
    if (const auto *entry = find_language(code)) {
        return std::string(entry->name);
    }
    return std::string(code);
}

std::string manifest_language_code(std::string_view code) {
    if (const auto *entry = find_language(code)) {
        return std::string(entry->manifest);
    }
    return std::string(code);
}

std::string build_language_label(std::string_view code,
                                 const std::optional<std::string> &title) {
    std::string s = language_name(code);
    if (title) {
        s += " (";
        s += *title;
        s += ')';
    }
    return s;
}

}  // namespace cytubegen
