#include "sandbox/compile_patch.hpp"

namespace sandpool::sandbox {

const char* const kCopySourcesCommand =
    "COPY_SOURCES_CMD=\"cp -rL --parents $SRC $WORK /usr/include /usr/local/include "
    "$GOPATH $OSSFUZZ_RUSTPATH /rustc $OUT\"";
const char* const kCopySourcesCommandWithoutSrc =
    "COPY_SOURCES_CMD=\"cp -rL --parents $WORK /usr/include /usr/local/include "
    "$GOPATH $OSSFUZZ_RUSTPATH /rustc $OUT\"";

CompilePatch PatchCompileScript(const std::string& contents) {
    CompilePatch patch{contents, false};
    const std::string original(kCopySourcesCommand);
    const std::string replacement(kCopySourcesCommandWithoutSrc);
    std::string::size_type pos = 0;
    while ((pos = patch.contents.find(original, pos)) != std::string::npos) {
        patch.contents.replace(pos, original.size(), replacement);
        pos += replacement.size();
        patch.applied = true;
    }
    return patch;
}

}  // namespace sandpool::sandbox
