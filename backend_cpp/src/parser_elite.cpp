#include "parser_elite.hpp"
#include <tree_sitter/api.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stack>

namespace patchwork::elite {

namespace {

std::string source_line(const std::string& content, int line) {
    std::istringstream stream(content);
    std::string text;
    for (int i = 0; i < line && std::getline(stream, text); ++i) {}
    if (!text.empty() && text.back() == '\r') text.pop_back();
    return text;
}

// "Syntax error at line L, column C: msg" plus the offending line and a caret
std::string describe(const std::string& content, int line, int column, const std::string& msg) {
    std::string out = "Syntax error at line " + std::to_string(line) + ", column " +
                      std::to_string(column) + ": " + msg;
    std::string text = source_line(content, line);
    if (!text.empty()) {
        out += "\n  " + text;
        if (column > 0) out += "\n  " + std::string(column - 1, ' ') + "^";
    }
    return out;
}

struct Position {
    int line;
    int column;
};

// 1-based line and byte column of an offset
Position position_of(const std::string& content, size_t offset) {
    Position p{1, 1};
    for (size_t i = 0; i < offset && i < content.size(); ++i) {
        if (content[i] == '\n') {
            ++p.line;
            p.column = 1;
        } else {
            ++p.column;
        }
    }
    return p;
}

bool is_ident(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

size_t utf8_length(unsigned char lead) {
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

// Past the closing quote of a backslash-escaped literal; end of text when unterminated
size_t skip_escaped(const std::string& s, size_t open, char quote) {
    for (size_t i = open + 1; i < s.size(); ++i) {
        if (s[i] == '\\') {
            ++i;
            continue;
        }
        if (s[i] == quote) return i + 1;
    }
    return s.size();
}

size_t skip_past(const std::string& s, const std::string& closer, size_t from) {
    size_t at = s.find(closer, from);
    return at == std::string::npos ? s.size() : at + closer.size();
}

/*
 * Offset just past the comment or literal that starts at i, or i when none does.
 *   all:   // line, block comments (nested in Rust), "..." with escapes
 *   .go:   `raw` without escapes, 'r' runes
 *   .rs:   r"..", r#".."#, b'x', 'x' char literals; 'a lifetimes are left alone
 *   .cs:   @"verbatim" ("" escapes a quote), """raw"""
 *   .java: """text blocks"""
 */
size_t skip_literal(const std::string& s, size_t i, const std::string& ext) {
    const size_t end = s.size();
    const char c = s[i];
    const char next = (i + 1 < end) ? s[i + 1] : '\0';

    if (c == '/' && next == '/') {
        size_t nl = s.find('\n', i);
        return nl == std::string::npos ? end : nl;
    }
    if (c == '/' && next == '*') {
        if (ext != ".rs") return skip_past(s, "*/", i + 2);
        int depth = 0;
        for (size_t k = i; k + 1 < end; ++k) {
            if (s[k] == '/' && s[k + 1] == '*') {
                ++depth;
                ++k;
            } else if (s[k] == '*' && s[k + 1] == '/') {
                ++k;
                if (--depth == 0) return k + 1;
            }
        }
        return end;
    }

    if (ext == ".rs" && (c == 'r' || (c == 'b' && next == 'r')) && (i == 0 || !is_ident(s[i - 1]))) {
        size_t k = i + (c == 'b' ? 2 : 1);
        size_t hashes = 0;
        while (k < end && s[k] == '#') {
            ++hashes;
            ++k;
        }
        if (k < end && s[k] == '"') return skip_past(s, "\"" + std::string(hashes, '#'), k + 1);
    }

    if (ext == ".cs" && (c == '@' || c == '$')) {
        size_t k = i;
        bool verbatim = false;
        while (k < end && (s[k] == '@' || s[k] == '$')) {
            verbatim = verbatim || s[k] == '@';
            ++k;
        }
        if (verbatim && k < end && s[k] == '"') {
            for (size_t q = k + 1; q < end; ++q) {
                if (s[q] != '"') continue;
                if (q + 1 < end && s[q + 1] == '"') {
                    ++q;
                    continue;
                }
                return q + 1;
            }
            return end;
        }
    }

    if (c == '"') {
        if ((ext == ".cs" || ext == ".java") && s.compare(i, 3, "\"\"\"") == 0) {
            size_t quotes = 0;
            while (i + quotes < end && s[i + quotes] == '"') ++quotes;
            return skip_past(s, std::string(quotes, '"'), i + quotes);
        }
        return skip_escaped(s, i, '"');
    }
    if (c == '`') return skip_past(s, "`", i + 1);

    if (c == '\'') {
        if (ext != ".rs") return skip_escaped(s, i, '\'');
        if (next == '\\') return skip_escaped(s, i, '\'');
        size_t len = utf8_length(static_cast<unsigned char>(next));
        if (i + 1 + len < end && s[i + 1 + len] == '\'') return i + 2 + len;
        return i + 1; // lifetime or loop label
    }
    return i;
}

}

ASTBooster::ASTBooster() {
    parser_ = ts_parser_new();
}

ASTBooster::~ASTBooster() {
    if (parser_) ts_parser_delete(parser_);
}

std::vector<std::string> ASTBooster::supported_extensions() {
    return {".cc", ".cpp", ".cxx", ".h", ".hpp", ".py", ".pyw", ".ts", ".js"};
}

const TSLanguage* ASTBooster::get_lang(const std::string& ext) {
    if (ext == ".cpp" || ext == ".hpp" || ext == ".h" || ext == ".cc" || ext == ".cxx") return tree_sitter_cpp();
    if (ext == ".py" || ext == ".pyw") return tree_sitter_python();
    if (ext == ".ts" || ext == ".js") return tree_sitter_typescript();
    return nullptr;
}

ValidationResult ASTBooster::validate(const std::string& content, const std::string& extension) {
    std::lock_guard<std::mutex> lock(mtx_);
    const TSLanguage* lang = get_lang(extension);
    if (!lang) return ValidationResult::pass();

    ts_parser_set_language(parser_, lang);
    TSTree* tree = ts_parser_parse_string(parser_, nullptr, content.c_str(), (uint32_t)content.length());
    if (!tree) {
        return ValidationResult::invalid("Parser produced no tree for " + extension + " content");
    }

    TSNode root = ts_tree_root_node(tree);
    if (!ts_node_has_error(root)) {
        spdlog::debug("🛰️  AST X-Ray clean: {} bytes of {}", content.size(), extension);
        ts_tree_delete(tree);
        return ValidationResult::pass();
    }

    // Non-recursive descent toward the first ERROR / MISSING node in document order
    TSNode culprit = root;
    std::stack<TSNode> stack;
    stack.push(root);
    while (!stack.empty()) {
        TSNode node = stack.top();
        stack.pop();
        if (ts_node_is_error(node) || ts_node_is_missing(node)) {
            culprit = node;
            break;
        }
        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = count; i > 0; --i) {
            TSNode child = ts_node_child(node, i - 1);
            if (ts_node_has_error(child)) stack.push(child);
        }
    }

    TSPoint at = ts_node_start_point(culprit);
    int line = static_cast<int>(at.row) + 1;
    int column = static_cast<int>(at.column) + 1;

    std::string msg;
    if (ts_node_is_missing(culprit)) {
        msg = std::string("missing '") + ts_node_type(culprit) + "'";
    } else {
        uint32_t start = ts_node_start_byte(culprit);
        uint32_t end = ts_node_end_byte(culprit);
        std::string token = content.substr(start, std::min<uint32_t>(end - start, 40));
        msg = token.empty() ? "invalid syntax" : "unexpected '" + token + "'";
    }

    ts_tree_delete(tree);
    return ValidationResult::invalid(describe(content, line, column, msg), line, column);
}

ValidationResult BracketBalancer::validate(const std::string& content, const std::string& extension) {
    struct Open { char ch; size_t offset; };
    std::stack<Open> opens;

    size_t i = 0;
    while (i < content.size()) {
        size_t after = skip_literal(content, i, extension);
        if (after != i) {
            i = after;
            continue;
        }

        char c = content[i];
        if (c == '(' || c == '[' || c == '{') {
            opens.push({c, i});
        } else if (c == ')' || c == ']' || c == '}') {
            char want = (c == ')') ? '(' : (c == ']') ? '[' : '{';
            if (opens.empty() || opens.top().ch != want) {
                Position at = position_of(content, i);
                std::string msg = "unmatched '" + std::string(1, c) + "'";
                if (!opens.empty()) {
                    msg += " (open '" + std::string(1, opens.top().ch) + "' from line " +
                           std::to_string(position_of(content, opens.top().offset).line) + ")";
                }
                return ValidationResult::invalid(describe(content, at.line, at.column, msg), at.line, at.column);
            }
            opens.pop();
        }
        ++i;
    }

    if (!opens.empty()) {
        Open o = opens.top();
        Position at = position_of(content, o.offset);
        return ValidationResult::invalid(
            describe(content, at.line, at.column, "'" + std::string(1, o.ch) + "' is never closed"),
            at.line, at.column);
    }
    return ValidationResult::pass();
}

} // namespace patchwork::elite
