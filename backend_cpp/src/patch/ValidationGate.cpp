#include "patch/ValidationGate.hpp"
#include "parser_elite.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace patchwork {

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}
}

std::string ValidationGate::extension_of(const std::string& file_path) {
    return lower(std::filesystem::path(file_path).extension().string());
}

void ValidationGate::register_validator(const std::string& extension, std::shared_ptr<SyntaxValidator> validator) {
    validators_[lower(extension)] = std::move(validator);
}

void ValidationGate::register_validators(const std::vector<std::string>& extensions,
                                        std::shared_ptr<SyntaxValidator> validator) {
    for (const auto& ext : extensions) register_validator(ext, validator);
}

bool ValidationGate::has_validator(const std::string& extension) const {
    return validators_.count(lower(extension)) > 0;
}

ValidationResult ValidationGate::validate(const std::string& candidate, const std::string& file_path) const {
    std::string ext = extension_of(file_path);
    auto it = validators_.find(ext);
    if (it == validators_.end()) return ValidationResult::pass();

    ValidationResult result = it->second->validate(candidate, ext);
    if (!result.ok) {
        spdlog::warn("🛡️ Syntax gate rejected {} ({}:{}): {}", file_path, result.line, result.column, result.message);
    }
    return result;
}

std::shared_ptr<ValidationGate> ValidationGate::with_defaults() {
    auto gate = std::make_shared<ValidationGate>();
    auto ast = std::make_shared<elite::ASTBooster>();
    gate->register_validators(elite::ASTBooster::supported_extensions(), ast);
    // JSX element text is free prose; neither checker can follow it, so .jsx/.tsx stay unchecked
    gate->register_validators({".json", ".java", ".cs", ".go", ".rs"},
                             std::make_shared<elite::BracketBalancer>());
    return gate;
}

} // namespace patchwork
