#include "src/server/isolation.h"
#include "src/server/logger.h"

namespace evalbox {

const char* IsolationErrorName(IsolationError error) {
    switch (error) {
        case IsolationError::kNone: return "none";
        case IsolationError::kUnavailable: return "unavailable";
        case IsolationError::kTimeout: return "timeout";
        case IsolationError::kRuntimeFault: return "runtime fault";
        case IsolationError::kDestroyFailed: return "destroy failed";
    }
    return "unknown";
}

IsolationClient::IsolationClient(std::unique_ptr<IsolationBackend> backend)
    : backend_(std::move(backend)) {}

bool IsolationClient::Connect() {
    std::string error;
    if (!backend_->Ping(&error)) {
        Disable(error);
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        disabled_reason_.clear();
    }
    disabled_.store(false);
    Logger::Info("Isolation backend '", backend_->Name(), "' is available");
    return true;
}

void IsolationClient::Disable(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        disabled_reason_ = reason;
    }
    disabled_.store(true);
    Logger::Warn("Isolation backend '", backend_->Name(), "' disabled: ", reason,
                 ". Code execution features will be unavailable.");
}

std::string IsolationClient::DisabledReason() const {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    return disabled_reason_;
}

ProvisionResult IsolationClient::Provision(const ResourceLimits& limits, const ProgramMount& program) {
    if (IsDisabled()) {
        ProvisionResult result;
        result.error = IsolationError::kUnavailable;
        result.error_message = "execution unavailable";
        return result;
    }
    return backend_->Provision(limits, program);
}

RunResult IsolationClient::Run(const std::string& handle,
                               const std::optional<std::string>& input,
                               std::chrono::milliseconds timeout) {
    return backend_->Run(handle, input, timeout);
}

std::optional<std::string> IsolationClient::FetchOutput(const std::string& handle) {
    return backend_->FetchOutput(handle);
}

DestroyResult IsolationClient::Destroy(const std::string& handle) {
    return backend_->Destroy(handle);
}

} // namespace evalbox
