#pragma once
#include <string>
#include "patch/PatchTypes.hpp"

namespace patchwork {

class ReplaceEngine {
public:
    // Strict mode requires exactly one match. Permissive mode replaces every
    // occurrence on the tab-normalized text, without re-indenting the replacement.
    // Throws PatchError (EmptyBlock, NoMatch, AmbiguousMatch).
    static ReplaceResult replace(const std::string& document,
                                 const std::string& search,
                                 const std::string& replacement,
                                 bool strict = true);

    // Post-condition on a replacement result: content changed, search block gone,
    // replacement block present (all compared tab-normalized). Throws StructuralCheckFailed.
    static void verify(const std::string& original,
                       const std::string& updated,
                       const std::string& search,
                       const std::string& replacement);

private:
    static std::string reindent(const std::string& block, const std::string& indent);
    static std::string replace_all(std::string text, const std::string& from, const std::string& to);
};

} // namespace patchwork
