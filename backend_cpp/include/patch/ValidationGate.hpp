#pragma once
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace patchwork {

struct ValidationResult {
    bool ok = true;
    std::string message;
    int line = 0;   // 1-based, 0 when unknown
    int column = 0;

    static ValidationResult pass() { return {}; }
    static ValidationResult invalid(std::string msg, int line = 0, int column = 0) {
        return {false, std::move(msg), line, column};
    }
};

class SyntaxValidator {
public:
    virtual ~SyntaxValidator() = default;
    // extension includes the dot, lower-cased (".py")
    virtual ValidationResult validate(const std::string& text, const std::string& extension) = 0;
};

class ValidationGate {
public:
    void register_validator(const std::string& extension, std::shared_ptr<SyntaxValidator> validator);
    void register_validators(const std::vector<std::string>& extensions, std::shared_ptr<SyntaxValidator> validator);

    bool has_validator(const std::string& extension) const;

    // Files without a registered validator pass.
    ValidationResult validate(const std::string& candidate, const std::string& file_path) const;

    // tree-sitter grammars for C++, Python, TypeScript/JavaScript; bracket balance for JSON, Java, C#, Go, Rust
    static std::shared_ptr<ValidationGate> with_defaults();

    static std::string extension_of(const std::string& file_path);

private:
    std::map<std::string, std::shared_ptr<SyntaxValidator>> validators_;
};

} // namespace patchwork
