#pragma once

#include <filesystem>
#include <string>

namespace sandpool::sandbox {

extern const char* const kCacheTagMarker;

// True when the image reference carries the build-cache tag.
bool IsCachedImage(const std::string& image);

// Basename of |image| with the cache tag and everything after it removed.
std::string GeneratedProjectName(const std::string& image);

// Host directories bound into a sandbox, derived from the generated name.
struct ProjectLayout {
    std::filesystem::path project_dir;
    std::filesystem::path out_dir;
    std::filesystem::path work_dir;
    std::filesystem::path ccache_dir;
};

ProjectLayout MakeProjectLayout(const std::filesystem::path& oss_fuzz_dir,
                                const std::string& generated_name);

// Creates out/work/ccache. Throws std::filesystem::filesystem_error.
void CreateLayoutDirectories(const ProjectLayout& layout);

}  // namespace sandpool::sandbox
