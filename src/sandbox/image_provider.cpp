#include "sandbox/image_provider.hpp"

#include <utility>

#include "utils/logging.hpp"

namespace sandpool::sandbox {

OssFuzzImageProvider::OssFuzzImageProvider(process::CommandRunner& runner,
                                           OssFuzzImageOptions options)
    : runner_(runner), options_(std::move(options)) {}

std::string OssFuzzImageProvider::CachedImageName(const std::string& project,
                                                  Sanitizer sanitizer) const {
    auto name = project + "-ofg-cached-" + ToString(sanitizer);
    if (options_.cache_registry.empty()) {
        return name;
    }
    return options_.cache_registry + "/" + name;
}

std::optional<std::string> OssFuzzImageProvider::PrepareImage(const std::string& project,
                                                              Sanitizer sanitizer,
                                                              bool use_build_cache) {
    if (use_build_cache) {
        if (auto cached = TryCachedImage(project, sanitizer)) {
            return cached;
        }
        utils::LogInfo("image") << "no cached image for " << project
                                << " (" << ToString(sanitizer) << "), building from scratch";
    }
    return BuildBaseImage(project);
}

std::optional<std::string> OssFuzzImageProvider::TryCachedImage(const std::string& project,
                                                                Sanitizer sanitizer) {
    const auto image = CachedImageName(project, sanitizer);
    process::CommandRequest inspect{};
    inspect.argv = {options_.docker_binary, "image", "inspect", image};
    if (runner_.Run(inspect).Succeeded()) {
        return image;
    }
    process::CommandRequest pull{};
    pull.argv = {options_.docker_binary, "pull", image};
    if (runner_.Run(pull).Succeeded()) {
        return image;
    }
    return std::nullopt;
}

std::optional<std::string> OssFuzzImageProvider::BuildBaseImage(const std::string& project) {
    process::CommandRequest build{};
    build.argv = {options_.python_binary, "infra/helper.py", "build_image", "--no-pull", project};
    build.working_dir = options_.oss_fuzz_dir;
    const auto result = runner_.Run(build);
    if (!result.Succeeded()) {
        utils::LogError("image") << "failed to build image for " << project
                                 << " exit=" << result.exit_code << "\n" << result.error;
        return std::nullopt;
    }
    return "gcr.io/oss-fuzz/" + project;
}

}  // namespace sandpool::sandbox
