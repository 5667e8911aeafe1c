#pragma once

#include <optional>
#include <string>
#include <vector>

namespace contestrun {

// Closed set of languages a worker can run. Adding one means adding a case
// to every switch in language.cpp.
enum class Language {
    CPP,
    JAVA,
    PYTHON,
    JAVASCRIPT,
    GO,
    RUST
};

// Static per-language sandbox configuration
struct LanguageProfile {
    std::string image;                  // Runner image reference
    std::string file_name;              // Name the source is injected under
    std::vector<std::string> command;   // Compile phase then run phase
    std::string diagnostic_signature;   // Marker a compiler failure leaves on stderr
};

// Parse wire name ("cpp", "python", ...); nullopt means unsupported
std::optional<Language> parse_language(const std::string& name);

// Wire name of a language
std::string language_name(Language language);

const LanguageProfile& language_profile(Language language);

// Every supported language, in declaration order
const std::vector<Language>& supported_languages();

// Compile-vs-run discrimination. True only when the compile phase reported
// failure through the reserved exit status and stderr carries the
// compiler's diagnostic signature for that language.
bool is_compilation_error(Language language, int exit_code, const std::string& stderr_output);

} // namespace contestrun
