#pragma once

#include <string>
#include <vector>

#include "sandbox/project_layout.hpp"

namespace sandpool::sandbox {

struct ContainerSpec {
    std::string docker_binary = "docker";
    std::string image;
    std::string platform = "linux/amd64";
    std::string shm_size = "2g";
    int cpus = 1;
    std::string project_name;
    std::string language;
    ProjectLayout layout;
};

std::vector<std::string> DockerRunCommand(const ContainerSpec& spec);

std::vector<std::string> DockerExecCommand(const std::string& docker_binary,
                                           const std::string& container_id,
                                           const std::string& command);

std::vector<std::string> DockerCopyCommand(const std::string& docker_binary,
                                           const std::string& host_path,
                                           const std::string& container_id,
                                           const std::string& container_path);

std::vector<std::string> DockerRemoveCommand(const std::string& docker_binary,
                                             const std::string& container_id);

std::vector<std::string> LibFuzzerArgs(int run_timeout_s);

std::vector<std::string> RunFuzzerCommand(const std::string& python_binary,
                                          const std::string& generated_name,
                                          const std::string& target_name,
                                          const std::string& corpus_dir,
                                          int run_timeout_s);

std::vector<std::string> CoverageCommand(const std::string& python_binary,
                                         const std::string& generated_name,
                                         const std::string& target_name,
                                         const std::string& corpus_dir);

}  // namespace sandpool::sandbox
