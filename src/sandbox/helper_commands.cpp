#include "sandbox/helper_commands.hpp"

namespace sandpool::sandbox {

std::vector<std::string> DockerRunCommand(const ContainerSpec& spec) {
    return {
        spec.docker_binary,
        "run",
        "-d",
        "--privileged",
        "--shm-size=" + spec.shm_size,
        "--platform",
        spec.platform,
        "--cpus=" + std::to_string(spec.cpus),
        "-t",
        "-e", "FUZZING_ENGINE=libfuzzer",
        "-e", "ARCHITECTURE=x86_64",
        "-e", "PROJECT_NAME=" + spec.project_name,
        "-e", "FUZZING_LANGUAGE=" + spec.language,
        "-e", "CCACHE_DIR=/workspace/ccache",
        "-v", spec.layout.out_dir.string() + ":/out",
        "-v", spec.layout.work_dir.string() + ":/work",
        "-v", spec.layout.ccache_dir.string() + ":/workspace/ccache",
        "--entrypoint=/bin/bash",
        spec.image
    };
}

std::vector<std::string> DockerExecCommand(const std::string& docker_binary,
                                           const std::string& container_id,
                                           const std::string& command) {
    return {docker_binary, "exec", container_id, "/bin/bash", "-c", command};
}

std::vector<std::string> DockerCopyCommand(const std::string& docker_binary,
                                           const std::string& host_path,
                                           const std::string& container_id,
                                           const std::string& container_path) {
    return {docker_binary, "cp", host_path, container_id + ":" + container_path};
}

std::vector<std::string> DockerRemoveCommand(const std::string& docker_binary,
                                             const std::string& container_id) {
    return {docker_binary, "rm", "-f", container_id};
}

std::vector<std::string> LibFuzzerArgs(int run_timeout_s) {
    return {
        "-print_final_stats=1",
        "-max_total_time=" + std::to_string(run_timeout_s),
        // Otherwise libFuzzer favours short inputs in short runs.
        "-len_control=0",
        // Per testcase.
        "-timeout=30",
        "-detect_leaks=0"
    };
}

std::vector<std::string> RunFuzzerCommand(const std::string& python_binary,
                                          const std::string& generated_name,
                                          const std::string& target_name,
                                          const std::string& corpus_dir,
                                          int run_timeout_s) {
    std::vector<std::string> command = {
        python_binary,
        "infra/helper.py",
        "run_fuzzer",
        "-e",
        "ASAN_OPTIONS=detect_leaks=0",
        "--corpus-dir",
        corpus_dir,
        generated_name,
        target_name,
        "--"
    };
    const auto engine_args = LibFuzzerArgs(run_timeout_s);
    command.insert(command.end(), engine_args.begin(), engine_args.end());
    return command;
}

std::vector<std::string> CoverageCommand(const std::string& python_binary,
                                         const std::string& generated_name,
                                         const std::string& target_name,
                                         const std::string& corpus_dir) {
    return {
        python_binary,
        "infra/helper.py",
        "coverage",
        "--corpus-dir",
        corpus_dir,
        "--fuzz-target",
        target_name,
        "--port",
        "",
        "--no-serve",
        generated_name
    };
}

}  // namespace sandpool::sandbox
