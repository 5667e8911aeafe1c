#include "language.h"
#include "constants.h"
#include <stdexcept>

namespace contestrun {

namespace {

// Wrap a compile phase and a run phase into one shell invocation. The
// compile phase exits with the reserved status so the coordinator can tell
// a build failure from a crash of the user's program.
std::vector<std::string> compile_then_run(const std::string& compile, const std::string& run) {
    return {
        "/bin/sh", "-c",
        compile + " || exit " + std::to_string(COMPILE_FAILED_EXIT_CODE) + "; exec " + run
    };
}

LanguageProfile build_profile(Language language) {
    switch (language) {
        case Language::CPP:
            return {"codecontest/cpp-runner:latest", "main.cpp",
                    compile_then_run("g++ -O2 -std=c++17 -o /workspace/main main.cpp", "/workspace/main"),
                    "error"};
        case Language::JAVA:
            return {"codecontest/java-runner:latest", "Main.java",
                    compile_then_run("javac Main.java", "java -cp /workspace Main"),
                    "error"};
        case Language::PYTHON:
            return {"codecontest/python-runner:latest", "main.py",
                    compile_then_run("python3 -m py_compile main.py", "python3 main.py"),
                    "Error"};
        case Language::JAVASCRIPT:
            return {"codecontest/nodejs-runner:latest", "main.js",
                    compile_then_run("node --check main.js", "node main.js"),
                    "SyntaxError"};
        case Language::GO:
            return {"codecontest/go-runner:latest", "main.go",
                    compile_then_run("go build -o /workspace/main main.go", "/workspace/main"),
                    "error"};
        case Language::RUST:
            return {"codecontest/rust-runner:latest", "main.rs",
                    compile_then_run("rustc -O -o /workspace/main main.rs", "/workspace/main"),
                    "error"};
    }
    throw std::invalid_argument("Unsupported language");
}

} // namespace

std::optional<Language> parse_language(const std::string& name) {
    for (Language language : supported_languages()) {
        if (language_name(language) == name) {
            return language;
        }
    }
    return std::nullopt;
}

std::string language_name(Language language) {
    switch (language) {
        case Language::CPP: return "cpp";
        case Language::JAVA: return "java";
        case Language::PYTHON: return "python";
        case Language::JAVASCRIPT: return "javascript";
        case Language::GO: return "go";
        case Language::RUST: return "rust";
    }
    return "unknown";
}

const LanguageProfile& language_profile(Language language) {
    static const LanguageProfile cpp = build_profile(Language::CPP);
    static const LanguageProfile java = build_profile(Language::JAVA);
    static const LanguageProfile python = build_profile(Language::PYTHON);
    static const LanguageProfile javascript = build_profile(Language::JAVASCRIPT);
    static const LanguageProfile go = build_profile(Language::GO);
    static const LanguageProfile rust = build_profile(Language::RUST);

    switch (language) {
        case Language::CPP: return cpp;
        case Language::JAVA: return java;
        case Language::PYTHON: return python;
        case Language::JAVASCRIPT: return javascript;
        case Language::GO: return go;
        case Language::RUST: return rust;
    }
    throw std::invalid_argument("Unsupported language");
}

const std::vector<Language>& supported_languages() {
    static const std::vector<Language> languages = {
        Language::CPP, Language::JAVA, Language::PYTHON,
        Language::JAVASCRIPT, Language::GO, Language::RUST
    };
    return languages;
}

bool is_compilation_error(Language language, int exit_code, const std::string& stderr_output) {
    if (exit_code != COMPILE_FAILED_EXIT_CODE) {
        return false;
    }
    const std::string& signature = language_profile(language).diagnostic_signature;
    return stderr_output.find(signature) != std::string::npos;
}

} // namespace contestrun
