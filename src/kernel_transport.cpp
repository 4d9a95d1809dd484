// src/kernel_transport.cpp
// Kernel binary resolution, command encoding and result decoding.

#include "kernel_transport.hpp"
#include "huefy/error_registry.hpp"
#include "process.hpp"

#include <sys/stat.h>
#include <sys/utsname.h>
#include <unistd.h>

#ifndef HUEFY_KERNEL_DIR
#define HUEFY_KERNEL_DIR "bin"
#endif

namespace huefy {

using json = nlohmann::json;

namespace {

constexpr const char* DEFAULT_KERNEL_ERROR_CODE = "KERNEL_ERROR";
constexpr const char* DEFAULT_KERNEL_ERROR_MESSAGE = "Unknown kernel error";

std::string trimmed(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

} // namespace

std::string kernel_binary_name(const std::string& os_family, const std::string& machine) {
    const bool arm64 = machine == "arm64" || machine.find("aarch64") != std::string::npos;
    if (os_family == "Darwin") {
        return arm64 ? "kernel-cli-darwin-arm64" : "kernel-cli-darwin-amd64";
    }
    if (os_family == "Linux") {
        return machine.find("aarch64") != std::string::npos ? "kernel-cli-linux-arm64"
                                                            : "kernel-cli-linux-amd64";
    }
    if (os_family == "Windows") {
        return "kernel-cli-windows-amd64.exe";
    }
    throw ConfigurationError("unsupported platform for kernel binary: " + os_family + "/" +
                             machine);
}

const char* host_os_family() noexcept {
#if defined(__APPLE__)
    return "Darwin";
#elif defined(_WIN32)
    return "Windows";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

std::string host_machine() {
    struct utsname info;
    if (::uname(&info) != 0) return std::string();
    return info.machine;
}

std::string resolve_kernel_binary(const HuefyConfig& config) {
    if (!config.kernel_binary().empty()) return config.kernel_binary();
    const std::string dir =
        config.kernel_directory().empty() ? std::string(HUEFY_KERNEL_DIR) : config.kernel_directory();
    return join_path(dir, kernel_binary_name(host_os_family(), host_machine()));
}

KernelTransport::KernelTransport(const std::string& api_key, const HuefyConfig& config)
    : api_key_(api_key), config_(config), endpoint_(config.grpc_endpoint()),
      binary_path_(resolve_kernel_binary(config)) {
    struct stat st;
    if (::stat(binary_path_.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        throw ConfigurationError("kernel binary not found: " + binary_path_);
    }
    if (::access(binary_path_.c_str(), X_OK) != 0) {
        throw ConfigurationError("kernel binary is not executable: " + binary_path_);
    }
    config_.log(LogLevel::Debug, "kernel binary: " + binary_path_);
}

json KernelTransport::send_email(const json& request) {
    return execute("sendEmail", &request);
}

json KernelTransport::send_bulk_emails(const json& requests) {
    return execute("sendBulkEmails", &requests);
}

json KernelTransport::health_check() {
    return execute("healthCheck", nullptr);
}

json KernelTransport::execute(const char* command, const json* data) {
    json doc = {
        {"command", command},
        {"config",
         {{"apiKey", api_key_}, {"endpoint", endpoint_}, {"timeout", config_.timeout().count()}}},
    };
    if (data) doc["data"] = *data;

    config_.log(LogLevel::Debug, std::string("spawning kernel for ") + command);

    ProcessResult result;
    {
        Process proc(binary_path_, {});
        result = proc.communicate(doc.dump(), config_.timeout());
    }

    if (result.exit_code != 0) {
        std::string msg = "kernel exited with code " + std::to_string(result.exit_code);
        auto err = trimmed(result.err);
        if (!err.empty()) msg += ": " + err;
        config_.log(LogLevel::Error, msg);
        throw NetworkError(msg, result.exit_code);
    }

    const std::string out = trimmed(result.out);
    if (out.empty()) {
        config_.log(LogLevel::Error, "empty response from kernel");
        throw HuefyError::protocol("empty response from kernel");
    }

    json parsed;
    try {
        parsed = json::parse(out);
    } catch (const json::parse_error& e) {
        config_.log(LogLevel::Error, std::string("undecodable kernel response: ") + e.what());
        throw HuefyError::protocol(std::string("failed to decode kernel response: ") + e.what());
    }

    auto success = parsed.is_object() ? parsed.find("success") : parsed.end();
    if (!parsed.is_object() || success == parsed.end() || *success != true) {
        std::string code = DEFAULT_KERNEL_ERROR_CODE;
        std::string message = DEFAULT_KERNEL_ERROR_MESSAGE;
        if (parsed.is_object()) {
            auto err = parsed.find("error");
            if (err != parsed.end() && err->is_object()) {
                auto c = err->find("code");
                auto m = err->find("message");
                if (c != err->end() && c->is_string() && !c->get<std::string>().empty()) {
                    code = c->get<std::string>();
                }
                if (m != err->end() && m->is_string() && !m->get<std::string>().empty()) {
                    message = m->get<std::string>();
                }
            }
        }
        config_.log(LogLevel::Error, "kernel reported " + code + ": " + message);
        ErrorRegistry::instance().raise(code, "Kernel error: " + message);
    }

    auto payload = parsed.find("data");
    if (payload == parsed.end() || payload->is_null()) return json::object();
    return *payload;
}

} // namespace huefy
