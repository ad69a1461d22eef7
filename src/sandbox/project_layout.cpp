#include "sandbox/project_layout.hpp"

namespace sandpool::sandbox {

const char* const kCacheTagMarker = "-ofg-cached-";

bool IsCachedImage(const std::string& image) {
    return image.find(kCacheTagMarker) != std::string::npos;
}

std::string GeneratedProjectName(const std::string& image) {
    auto name = image;
    const auto slash = name.find_last_of('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    const auto tag = name.find(kCacheTagMarker);
    if (tag != std::string::npos) {
        name.erase(tag);
    }
    return name;
}

ProjectLayout MakeProjectLayout(const std::filesystem::path& oss_fuzz_dir,
                                const std::string& generated_name) {
    ProjectLayout layout{};
    layout.project_dir = oss_fuzz_dir / "projects" / generated_name;
    layout.out_dir = oss_fuzz_dir / "build" / "out" / generated_name;
    layout.work_dir = oss_fuzz_dir / "build" / "work" / generated_name;
    layout.ccache_dir = oss_fuzz_dir / "ccaches" / generated_name / "ccache";
    return layout;
}

void CreateLayoutDirectories(const ProjectLayout& layout) {
    std::filesystem::create_directories(layout.out_dir);
    std::filesystem::create_directories(layout.work_dir);
    std::filesystem::create_directories(layout.ccache_dir);
}

}  // namespace sandpool::sandbox
