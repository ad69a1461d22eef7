#pragma once

#include <string>

namespace sandpool::sandbox {

// Artifact-copy command of the build toolchain's compile script, before and
// after dropping the $SRC term.
extern const char* const kCopySourcesCommand;
extern const char* const kCopySourcesCommandWithoutSrc;

struct CompilePatch {
    std::string contents;
    bool applied = false;
};

// Rewrites the compile script so a rebuild no longer copies the source tree
// into $OUT. Text that does not contain kCopySourcesCommand is returned
// unchanged with applied == false.
CompilePatch PatchCompileScript(const std::string& contents);

}  // namespace sandpool::sandbox
