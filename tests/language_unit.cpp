// Language display names, manifest codes and track labels.
#include <optional>
#include <string>

#include "language.hpp"
#include "test_support.hpp"

using namespace cytubegen;
using test_support::check;

int main() {
    bool ok = true;
    ok &= check(language_name("eng") == "English", "eng name");
    ok &= check(language_name("fre") == "French" && language_name("fra") == "French",
                "bibliographic and terminology codes");
    ok &= check(language_name("qaa") == "qaa", "unknown code resolves to itself");
    ok &= check(language_name("") == "", "empty code");
    ok &= check(manifest_language_code("jpn") == "ja", "jpn -> ja");
    ok &= check(manifest_language_code("ger") == "de", "ger -> de");
    ok &= check(manifest_language_code("unknown") == "unknown", "raw fallback");

    ok &= check(build_language_label("eng", std::nullopt) == "English", "name alone");
    ok &= check(build_language_label("eng", std::string("Director's Cut")) ==
                    "English (Director's Cut)",
                "name with title");
    ok &= check(build_language_label("zzz", std::string("Dub")) == "zzz (Dub)",
                "unknown code with title");
    ok &= check(build_language_label("spa", std::string("")) == "Spanish ()",
                "empty title still appended");
    return ok ? 0 : 1;
}
