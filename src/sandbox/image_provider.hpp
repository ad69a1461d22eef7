#pragma once

#include <optional>
#include <string>

#include "process/command_runner.hpp"
#include "sandbox/sanitizer.hpp"

namespace sandpool::sandbox {

class ImageProvider {
public:
    virtual ~ImageProvider() = default;
    // Returns a runnable image reference, or nullopt if none could be
    // produced. A reference carrying kCacheTagMarker is fully built.
    virtual std::optional<std::string> PrepareImage(const std::string& project,
                                                    Sanitizer sanitizer,
                                                    bool use_build_cache) = 0;
};

struct OssFuzzImageOptions {
    std::string oss_fuzz_dir;
    std::string docker_binary = "docker";
    std::string python_binary = "python3";
    std::string cache_registry;
};

// Uses a prebuilt cache image when allowed and reachable, and falls back to
// building the project's base image with the OSS-Fuzz helper.
class OssFuzzImageProvider : public ImageProvider {
public:
    OssFuzzImageProvider(process::CommandRunner& runner, OssFuzzImageOptions options);

    std::optional<std::string> PrepareImage(const std::string& project,
                                            Sanitizer sanitizer,
                                            bool use_build_cache) override;

    std::string CachedImageName(const std::string& project, Sanitizer sanitizer) const;

private:
    std::optional<std::string> TryCachedImage(const std::string& project, Sanitizer sanitizer);
    std::optional<std::string> BuildBaseImage(const std::string& project);

    process::CommandRunner& runner_;
    OssFuzzImageOptions options_;
};

}  // namespace sandpool::sandbox
