#include <cassert>
#include <iostream>
#include <string>

#include "patch/DiffParser.hpp"
#include "patch/HunkApplier.hpp"

using namespace patchwork;

namespace {

const std::string kNine = "l1\nl2\nl3\nl4\nl5\nl6\nl7\nl8\nl9\n";

std::string patch(const std::string& doc, const std::string& diff, ApplyOptions opts = {}) {
    return HunkApplier(opts).apply(doc, DiffParser::parse(diff));
}

ErrorKind patch_failure(const std::string& doc, const std::string& diff, ApplyOptions opts = {}) {
    try {
        patch(doc, diff, opts);
    } catch (const PatchError& e) {
        return e.kind();
    }
    assert(false && "expected PatchError");
    return ErrorKind::NoMatch;
}

}

void test_line_buffer() {
    std::cout << "Testing line buffer helpers..." << std::endl;

    LineBuffer lines = split_lines("a\nb\r\nc");
    assert(lines.size() == 3);
    assert(lines[0] == "a\n");
    assert(lines[1] == "b\r\n");
    assert(lines[2] == "c");
    assert(join_lines(lines) == "a\nb\r\nc");

    assert(split_lines("").empty());
    assert(detect_eol(split_lines("x\r\ny\r\n")) == "\r\n");
    assert(detect_eol(split_lines("x\ny\r\n")) == "\n");
    assert(detect_eol(split_lines("no terminator")) == "\n");

    std::cout << "  ✓ Line buffer tests passed" << std::endl;
}

void test_three_single_line_hunks() {
    std::cout << "Testing three one-for-one hunks..." << std::endl;

    std::string diff =
        "@@ -1 +1 @@\n-l1\n+L1\n"
        "@@ -4 +4 @@\n-l4\n+L4\n"
        "@@ -7 +7 @@\n-l7\n+L7\n";
    std::string out = patch(kNine, diff);
    assert(out == "L1\nl2\nl3\nL4\nl5\nl6\nL7\nl8\nl9\n");

    std::cout << "  ✓ One-for-one hunk tests passed" << std::endl;
}

void test_offset_after_deletion() {
    std::cout << "Testing offset tracking after a 3-line deletion..." << std::endl;

    // Hunk 2 declares line 7 but applies at buffer line 4 after three lines are gone
    std::string diff =
        "@@ -1,3 +0,0 @@\n-l1\n-l2\n-l3\n"
        "@@ -7 +4 @@\n-l7\n+SEVEN\n";
    std::string out = patch(kNine, diff);
    assert(out == "l4\nl5\nl6\nSEVEN\nl8\nl9\n");

    // Growth shifts later hunks forward
    std::string grow =
        "@@ -2 +2,3 @@\n-l2\n+a\n+b\n+c\n"
        "@@ -5 +7 @@\n-l5\n+FIVE\n";
    assert(patch(kNine, grow) == "l1\na\nb\nc\nl3\nl4\nFIVE\nl6\nl7\nl8\nl9\n");

    std::cout << "  ✓ Offset tracking tests passed" << std::endl;
}

void test_context_only_is_noop() {
    std::cout << "Testing context-only diff..." << std::endl;

    std::string diff = "@@ -2,3 +2,3 @@\n l2\n l3\n l4\n";
    assert(patch(kNine, diff) == kNine);

    ApplyOptions strict;
    strict.verify_context = true;
    assert(patch(kNine, diff, strict) == kNine);

    std::cout << "  ✓ Context-only tests passed" << std::endl;
}

void test_context_positions_edits() {
    std::cout << "Testing hunks with surrounding context..." << std::endl;

    std::string diff = "@@ -2,3 +2,3 @@\n l2\n-l3\n+THREE\n l4\n";
    assert(patch(kNine, diff) == "l1\nl2\nTHREE\nl4\nl5\nl6\nl7\nl8\nl9\n");

    std::cout << "  ✓ Context positioning tests passed" << std::endl;
}

void test_context_verification() {
    std::cout << "Testing opt-in context verification..." << std::endl;

    // Context text is wrong but only checked when asked
    std::string diff = "@@ -2,2 +2,2 @@\n WRONG\n-l3\n+X\n";
    assert(patch(kNine, diff) == "l1\nl2\nX\nl4\nl5\nl6\nl7\nl8\nl9\n");

    ApplyOptions strict;
    strict.verify_context = true;
    assert(patch_failure(kNine, diff, strict) == ErrorKind::HunkMismatch);

    std::cout << "  ✓ Context verification tests passed" << std::endl;
}

void test_not_idempotent() {
    std::cout << "Testing repeated application of a deleting diff..." << std::endl;

    std::string diff = "@@ -3,2 +3 @@\n-l3\n-l4\n+merged\n";
    std::string once = patch(kNine, diff);
    assert(once == "l1\nl2\nmerged\nl5\nl6\nl7\nl8\nl9\n");
    assert(patch_failure(once, diff) == ErrorKind::HunkMismatch);

    std::cout << "  ✓ Non-idempotence tests passed" << std::endl;
}

void test_out_of_range_and_order() {
    std::cout << "Testing out-of-range and out-of-order hunks..." << std::endl;

    assert(patch_failure("a\nb\n", "@@ -20 +20 @@\n-x\n+y\n") == ErrorKind::HunkOutOfRange);
    assert(patch_failure("a\nb\n", "@@ -2,2 +2 @@\n-b\n-c\n+d\n") == ErrorKind::HunkOutOfRange);

    std::string reversed = "@@ -7 +7 @@\n-l7\n+L7\n@@ -2 +2 @@\n-l2\n+L2\n";
    ApplyOptions ordered;
    ordered.check_order = true;
    assert(patch_failure(kNine, reversed, ordered) == ErrorKind::HunksOutOfOrder);

    std::cout << "  ✓ Range and order tests passed" << std::endl;
}

void test_insertions() {
    std::cout << "Testing pure insertions..." << std::endl;

    // -N,0 inserts after line N; -0,0 inserts at the top
    assert(patch("a\nb\nc\n", "@@ -2,0 +3 @@\n+new\n") == "a\nb\nnew\nc\n");
    assert(patch("a\nb\n", "@@ -0,0 +1 @@\n+top\n") == "top\na\nb\n");
    assert(patch("", "@@ -0,0 +1,2 @@\n+x\n+y\n") == "x\ny\n");

    // File without a trailing newline keeps its last line intact
    assert(patch("a\nb", "@@ -2,0 +3 @@\n+c\n") == "a\nb\nc\n");

    std::cout << "  ✓ Insertion tests passed" << std::endl;
}

void test_crlf_buffer() {
    std::cout << "Testing CRLF buffers..." << std::endl;

    std::string doc = "one\r\ntwo\r\nthree\r\n";
    std::string out = patch(doc, "@@ -2 +2,2 @@\n-two\n+TWO\n+2.5\n");
    assert(out == "one\r\nTWO\r\n2.5\r\nthree\r\n");

    std::cout << "  ✓ CRLF tests passed" << std::endl;
}

void test_missing_newline_marker() {
    std::cout << "Testing \"No newline at end of file\" markers..." << std::endl;

    // Append after an unterminated last line; the new last line stays unterminated
    std::string append =
        "@@ -2 +2,2 @@\n-b\n\\ No newline at end of file\n+b\n+c\n\\ No newline at end of file\n";
    assert(patch("a\nb", append) == "a\nb\nc");

    // Dropping and adding the final newline
    assert(patch("a\nb\n", "@@ -2 +2 @@\n-b\n+b\n\\ No newline at end of file\n") == "a\nb");
    assert(patch("a\nb", "@@ -2 +2 @@\n-b\n\\ No newline at end of file\n+b\n") == "a\nb\n");

    std::cout << "  ✓ Newline marker tests passed" << std::endl;
}

int main() {
    std::cout << "Running HunkApplier tests...\n" << std::endl;

    test_line_buffer();
    test_three_single_line_hunks();
    test_offset_after_deletion();
    test_context_only_is_noop();
    test_context_positions_edits();
    test_context_verification();
    test_not_idempotent();
    test_out_of_range_and_order();
    test_insertions();
    test_crlf_buffer();
    test_missing_newline_marker();

    std::cout << "\n✓ All HunkApplier tests passed!" << std::endl;
    return 0;
}
