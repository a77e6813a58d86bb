#pragma once
#include <tree_sitter/api.h>
#include <mutex>
#include <string>
#include <vector>
#include "patch/ValidationGate.hpp"

// Grammars are linked from the installed tree-sitter grammar libraries
extern "C" {
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_typescript();
}

namespace patchwork {
    namespace elite {

// 🛡️ The Eyes of the Journal: rejects candidate text whose parse tree has ERROR or MISSING nodes
class ASTBooster : public SyntaxValidator {
public:
    ASTBooster();
    ~ASTBooster() override;

    ASTBooster(const ASTBooster&) = delete;
    ASTBooster& operator=(const ASTBooster&) = delete;

    ValidationResult validate(const std::string& content, const std::string& extension) override;

    static std::vector<std::string> supported_extensions();

private:
    TSParser* parser_;
    std::mutex mtx_; // one TSParser, shared by every transaction using the gate
    const TSLanguage* get_lang(const std::string& ext);
};

// Delimiter balance for languages without a grammar. Skips string literals and comments.
class BracketBalancer : public SyntaxValidator {
public:
    ValidationResult validate(const std::string& content, const std::string& extension) override;
};

    }
}
